#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "hintc/hintc.hpp"

using namespace hintc;

TEST(Cache, RepeatedCompilesShareOneChecker){
    CheckerCache cache;
    auto raw = parse("(list-of (union int string))");
    CheckerPtr first = compile(cache, raw);
    for(int i=0;i<9;++i) EXPECT_EQ(compile(cache, raw).get(), first.get());
    CacheStats st = cache.stats();
    EXPECT_EQ(st.compilations, 1u);
    EXPECT_EQ(st.hits, 9u);
    EXPECT_EQ(st.entries, 1u);
}

TEST(Cache, KeyIsIdentityScopeAndStrategy){
    CheckerCache cache;
    auto a = parse("(vector-of int)");
    auto b = parse("(vector-of int)"); // equal text, different object
    EXPECT_NE(compile(cache, a).get(), compile(cache, b).get());

    CheckConf strict;
    strict.strategy = Strategy::On;
    EXPECT_NE(compile(cache, a).get(), compile(cache, a, nullptr, strict).get());

    auto scope = std::make_shared<HintScope>();
    CheckerPtr scoped = compile(cache, a, scope);
    EXPECT_NE(scoped.get(), compile(cache, a).get());
    EXPECT_EQ(&scoped->scope(), scope.get());
    EXPECT_EQ(cache.stats().compilations, 4u);
}

TEST(Cache, ConcurrentMissesCompileOnce){
    CheckerCache cache;
    auto scope = std::make_shared<HintScope>();
    scope->define("Tree", "(union int (vector-of Tree))");
    auto raw = parse("(map-of keyword Tree)");

    std::vector<const CompiledChecker*> seen(8, nullptr);
    std::vector<std::thread> threads;
    for(size_t t=0;t<seen.size();++t){
        threads.emplace_back([&, t]{
            for(int i=0;i<100;++i){
                CheckerPtr c = compile(cache, raw, scope);
                if(!c->check(parse("{:a [1 [2]]}"))) return;
                seen[t] = c.get();
            }
        });
    }
    for(auto& th : threads) th.join();
    for(auto* p : seen) EXPECT_EQ(p, seen[0]);
    EXPECT_NE(seen[0], nullptr);
    EXPECT_EQ(cache.stats().compilations, 1u);
    EXPECT_EQ(cache.stats().hits, 799u);
}

TEST(Cache, ErrorsAreNotCached){
    CheckerCache cache;
    auto raw = parse("(list-of Missing)");
    EXPECT_THROW(compile(cache, raw), unresolved_forward_reference);
    EXPECT_THROW(compile(cache, raw), unresolved_forward_reference);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.stats().compilations, 0u);
    EXPECT_THROW(compile(cache, nullptr), unsupported_specification);
}

TEST(Cache, FindOnlySeesCompiledKeys){
    CheckerCache cache;
    auto raw = parse("int");
    EXPECT_EQ(cache.find(raw, nullptr, Strategy::O1), nullptr);
    CheckerPtr c = compile(cache, raw);
    EXPECT_EQ(cache.find(raw, nullptr, Strategy::O1).get(), c.get());
    EXPECT_EQ(cache.find(raw, builtin_scope(), Strategy::O1).get(), c.get());
    EXPECT_EQ(cache.find(raw, nullptr, Strategy::On), nullptr);
}

TEST(Cache, CheckerKeepsItsSpecificationAlive){
    CheckerCache cache;
    CheckerPtr c;
    const node* key = nullptr;
    {
        auto raw = parse("(tuple int string)");
        key = raw.get();
        c = compile(cache, raw);
    }
    EXPECT_EQ(c->spec().get(), key);
    EXPECT_EQ(c->key().spec, key);
    EXPECT_EQ(c->key().scope, builtin_scope().get());
    EXPECT_TRUE(c->check(parse("[1 \"x\"]")));
}
