#include <gtest/gtest.h>
#include <stdexcept>
#include "hintc/hintc.hpp"

using namespace hintc;

namespace {

bool is_even(const node_ptr& v){
    auto i = std::get_if<int64_t>(&v->data);
    return i && *i % 2 == 0;
}

class SynthTest : public ::testing::Test {
protected:
    void SetUp() override {
        scope_ = std::make_shared<HintScope>();
        scope_->define_class("shape");
        scope_->define_class("circle", {"shape"});
        scope_->define_class("point");
        scope_->define_predicate("even?", is_even);
        scope_->define_predicate("counted", [this](const node_ptr&){ ++calls_; return true; });
        scope_->define_predicate("boom", [](const node_ptr&)->bool{ throw std::runtime_error("host failure"); });
        scope_->define("Tree", "(union int (vector-of Tree))");
        scope_->define("Nest", "(vector-of Nest)");
    }

    CheckerPtr compile_str(const char* src, Strategy s = Strategy::O1){
        CheckConf conf;
        conf.strategy = s;
        return compile(cache_, parse(src), scope_, conf);
    }

    std::vector<node_ptr> sample_values() const {
        std::vector<node_ptr> out;
        for(const char* src : {"nil", "true", "3", "4", "3.0", "\"x\"", ":k", "sym", "(1 2)", "[1 2]", "[]",
                               "#{1}", "{:a 1}", "#circle {}", "#point {}", "#square {}"})
            out.push_back(parse(src));
        out.push_back(n_fn("f", is_even));
        return out;
    }

    CheckerCache cache_;
    std::shared_ptr<HintScope> scope_;
    int calls_ = 0;
};

node_ptr ints(size_t n, int64_t start = 0){
    auto v = node_vec();
    for(size_t i=0;i<n;++i) v << n_i64(start + (int64_t)i);
    return v;
}

} // namespace

TEST_F(SynthTest, AtomicMatchesInstanceOf){
    const ClassTable& ct = scope_->classes();
    for(const char* name : {"int", "float", "number", "string", "keyword", "symbol", "bool", "nil", "list",
                            "vector", "set", "map", "seq", "coll", "tagged", "callable", "shape", "circle",
                            "point", "nothing"}){
        auto checker = compile_str(name);
        ClassId cls = *ct.lookup(name);
        for(auto& v : sample_values())
            EXPECT_EQ(checker->check(v), ct.is_instance(*v, cls)) << name << " vs " << to_string(v);
    }
}

TEST_F(SynthTest, UnionIsDisjunctionOfAlternatives){
    const char* specs[] = {"int", "string", "#{3 :k}", "even?", "(list-of int)", "shape", "nil"};
    for(const char* a : specs){
        for(const char* b : specs){
            auto ca = compile_str(a);
            auto cb = compile_str(b);
            std::string both = std::string("(union ") + a + " " + b + ")";
            auto cu = compile_str(both.c_str());
            for(auto& v : sample_values())
                EXPECT_EQ(cu->check(v), ca->check(v) || cb->check(v)) << both << " vs " << to_string(v);
        }
    }
}

TEST_F(SynthTest, LiteralsUseStrictEquality){
    auto small = compile_str("#{1 2 3}");
    EXPECT_TRUE(small->check(parse("2")));
    EXPECT_FALSE(small->check(parse("4")));
    EXPECT_FALSE(small->check(parse("2.0")));
    auto large = compile_str("(literal 0 1 2 3 4 5 6 7 8 9 :x [1 2])");
    EXPECT_TRUE(large->check(parse("9")));
    EXPECT_TRUE(large->check(parse(":x")));
    EXPECT_TRUE(large->check(parse("[1 2]")));
    EXPECT_FALSE(large->check(parse("10")));
    EXPECT_FALSE(large->check(parse("(1 2)")));
}

TEST_F(SynthTest, LargeLiteralSetsNeverWalkTheValue){
    auto c = compile_str("(literal 0 1 2 3 4 5 6 7 8 [[0]] :k)");
    EXPECT_TRUE(c->check(parse("[[0]]")));
    EXPECT_TRUE(c->check(parse(":k")));

    // a vector holding itself has no finite hash or printed form
    auto loop = node_vec();
    loop << loop;
    EXPECT_FALSE(c->check(loop));
    auto wide = ints(100000);
    EXPECT_FALSE(c->check(wide));
    auto in_list = compile_str("(list-of (literal 0 1 2 3 4 5 6 7 8))", Strategy::On);
    auto holder = node_list({loop});
    EXPECT_FALSE(in_list->check(holder));
    std::get<vector_t>(loop->data).elems.clear(); // break the cycle
}

TEST_F(SynthTest, PredicatesAreCalledDirectly){
    auto named = compile_str("(satisfies even?)");
    EXPECT_TRUE(named->check(parse("4")));
    EXPECT_FALSE(named->check(parse("3")));
    EXPECT_FALSE(named->check(parse("\"4\"")));

    auto host = compile(cache_, n_fn("odd?", [](const node_ptr& v){ return !is_even(v); }), scope_);
    EXPECT_TRUE(host->check(parse("3")));

    auto boom = compile_str("(union int boom)");
    EXPECT_TRUE(boom->check(parse("1")));
    EXPECT_THROW(boom->check(parse("\"x\"")), std::runtime_error);
}

TEST_F(SynthTest, IgnorableCompilesToNothing){
    auto c = compile_str("(union int any)");
    EXPECT_TRUE(c->accepts_everything());
    for(auto& v : sample_values()) EXPECT_TRUE(c->check(v));
    EXPECT_FALSE(compile_str("int")->accepts_everything());
}

TEST_F(SynthTest, ShallowStageRejectsNonContainers){
    auto c = compile_str("(list-of counted)");
    for(int i=0;i<50;++i){
        EXPECT_FALSE(c->check(parse("3")));
        EXPECT_FALSE(c->check(parse("[1 2]")));
        EXPECT_FALSE(c->check(parse("{}")));
    }
    EXPECT_EQ(calls_, 0);
    auto t = compile_str("(tuple counted counted)");
    EXPECT_FALSE(t->check(parse("[1]")));
    EXPECT_FALSE(t->check(parse("[1 2 3]")));
    EXPECT_FALSE(t->check(parse("(1 2)")));
    EXPECT_EQ(calls_, 0);
}

TEST_F(SynthTest, OneSamplePerContainerLevel){
    auto flat = compile_str("(vector-of counted)");
    auto big = ints(1000);
    for(int i=1;i<=20;++i){
        EXPECT_TRUE(flat->check(big));
        EXPECT_EQ(calls_, i);
    }
    calls_ = 0;
    auto nested = compile_str("(vector-of (vector-of counted))");
    auto grid = node_vec();
    for(int i=0;i<30;++i) grid << ints(30);
    EXPECT_TRUE(nested->check(grid));
    EXPECT_EQ(calls_, 1);

    calls_ = 0;
    auto m = compile_str("(map-of keyword counted)");
    auto entries = node_map();
    for(int i=0;i<50;++i) entries << kvp(n_kw("k" + std::to_string(i)), n_i64(i));
    EXPECT_TRUE(m->check(entries));
    EXPECT_EQ(calls_, 1);
}

TEST_F(SynthTest, SamplingConvergesOnTheBadElement){
    auto c = compile_str("(vector-of int)");
    int rejected = 0;
    const int rounds = 500;
    for(int i=0;i<rounds;++i){
        auto v = ints(9);
        v << n_str("bad"); // one invalid element among ten, rebuilt every call
        if(!c->check(v)) ++rejected;
    }
    // expected ~50; missing it in all 500 calls has probability 0.9^500
    EXPECT_GT(rejected, 0);
    EXPECT_LT(rejected, rounds);
}

TEST_F(SynthTest, RecursiveSpecificationsTerminate){
    auto tree = compile_str("Tree");
    EXPECT_TRUE(tree->check(parse("[1 [2 [3 []]] 4]")));
    EXPECT_TRUE(tree->check(parse("7")));
    EXPECT_FALSE(tree->check(parse("\"x\"")));
    auto strict = compile_str("Tree", Strategy::On);
    EXPECT_TRUE(strict->check(parse("[1 [2 [3 []]] 4]")));
    EXPECT_FALSE(strict->check(parse("[1 [2 [\"x\"]]]")));

    auto nest = compile_str("Nest");
    EXPECT_TRUE(nest->check(parse("[[[]] []]")));
    EXPECT_FALSE(nest->check(parse("[1]")));
}

TEST_F(SynthTest, EmptyContainersPassVacuously){
    EXPECT_TRUE(compile_str("(list-of nothing)")->check(parse("()")));
    EXPECT_TRUE(compile_str("(vector-of nothing)")->check(parse("[]")));
    EXPECT_TRUE(compile_str("(set-of nothing)")->check(parse("#{}")));
    EXPECT_TRUE(compile_str("(map-of int nothing)")->check(parse("{}")));
    EXPECT_FALSE(compile_str("(list-of nothing)")->check(parse("(1)")));
}

TEST_F(SynthTest, UnionScenario){
    auto c = compile_str("(union int string)");
    EXPECT_TRUE(c->check(parse("3")));
    EXPECT_TRUE(c->check(parse("\"x\"")));
    EXPECT_FALSE(c->check(parse("3.0")));
}

TEST_F(SynthTest, ListScenario){
    auto c = compile_str("(list-of int)");
    EXPECT_TRUE(c->check(parse("(1 2 3)")));
    (void)c->check(parse("(1 \"x\" 3)")); // either outcome, depending on the sampled index
    Diagnostic d = explain_violation(*c, parse("(1 \"x\" 3)"));
    EXPECT_FALSE(d.ok());
    EXPECT_EQ(d.path, "[1]");
}

TEST_F(SynthTest, LiteralScenario){
    auto c = compile_str("#{1 2 3}");
    EXPECT_TRUE(c->check(parse("2")));
    EXPECT_FALSE(c->check(parse("4")));
}

TEST_F(SynthTest, FixedArityContainers){
    auto t = compile_str("(tuple int string)");
    for(int i=0;i<20;++i){
        EXPECT_TRUE(t->check(parse("[1 \"x\"]")));
        EXPECT_FALSE(t->check(parse("[\"x\" 1]"))); // every position is wrong
    }
    EXPECT_TRUE(compile_str("(tuple)")->check(parse("[]")));
    EXPECT_FALSE(compile_str("(tuple)")->check(parse("[1]")));
    EXPECT_TRUE(compile_str("(tuple any any)")->check(parse("[1 :x]")));
    EXPECT_FALSE(compile_str("(tuple any any)")->check(parse("[1]")));

    auto p = compile_str("(tagged point (map-of keyword int))");
    EXPECT_TRUE(p->check(parse("#point {:x 1}")));
    EXPECT_FALSE(p->check(parse("#point {:x \"a\"}")));
    EXPECT_FALSE(p->check(parse("#circle {:x 1}")));
    EXPECT_FALSE(p->check(parse("{:x 1}")));
}

TEST_F(SynthTest, StrictStrategyChecksEverything){
    auto c = compile_str("(vector-of int)", Strategy::On);
    for(int i=0;i<50;++i) EXPECT_FALSE(c->check(parse("[1 \"x\" 3]")));
    auto counted = compile_str("(vector-of counted)", Strategy::On);
    EXPECT_TRUE(counted->check(ints(100)));
    EXPECT_EQ(calls_, 100);
}

TEST_F(SynthTest, DisabledStrategyAcceptsEverything){
    auto c = compile_str("(list-of int)", Strategy::O0);
    EXPECT_TRUE(c->accepts_everything());
    EXPECT_TRUE(c->check(parse("3")));
    EXPECT_EQ(c->strategy(), Strategy::O0);
    EXPECT_THROW(compile_str("(list-of Missing)", Strategy::O0), unresolved_forward_reference);
}
