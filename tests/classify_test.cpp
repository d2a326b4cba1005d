#include <gtest/gtest.h>
#include "hintc/classify.hpp"
#include "hintc/desugar.hpp"
#include "hintc/errors.hpp"
#include <type_traits>
#include <utility>

using namespace hintc;

namespace {

HintScope make_scope(){
    HintScope s;
    s.define_class("point");
    s.define_predicate("even?", [](const node_ptr& v){ auto i = std::get_if<int64_t>(&v->data); return i && *i % 2 == 0; });
    s.define("Tree", "(union int (vector-of Tree))");
    return s;
}

Classification cls(const char* src, const HintScope& s){ return classify(parse(src), s); }

} // namespace

TEST(Classify, Sentinels){
    HintScope s;
    EXPECT_EQ(cls("any", s).sign, Sign::Ignorable);
    EXPECT_EQ(cls("object", s).sign, Sign::Ignorable);
    auto nothing = cls("nothing", s);
    EXPECT_EQ(nothing.sign, Sign::Atomic);
    EXPECT_EQ(nothing.cls, class_id(Builtin::Nothing));
    auto nil = cls("nil", s);
    EXPECT_EQ(nil.sign, Sign::Atomic);
    EXPECT_EQ(nil.cls, class_id(Builtin::Nil));
}

TEST(Classify, OriginForms){
    HintScope s = make_scope();
    auto l = cls("(list-of int)", s);
    EXPECT_EQ(l.sign, Sign::Container);
    EXPECT_EQ(l.arity, Arity::Variadic);
    EXPECT_EQ(l.cls, class_id(Builtin::List));
    ASSERT_EQ(l.args.size(), 1u);

    auto m = cls("(map-of keyword int)", s);
    EXPECT_EQ(m.arity, Arity::Mapping);
    EXPECT_EQ(m.args.size(), 2u);

    auto t = cls("(tuple int string)", s);
    EXPECT_EQ(t.arity, Arity::Fixed);
    EXPECT_EQ(t.cls, class_id(Builtin::Vector));
    EXPECT_EQ(t.args.size(), 2u);
    EXPECT_EQ(cls("(tuple)", s).args.size(), 0u);

    auto tg = cls("(tagged point (map-of keyword int))", s);
    EXPECT_EQ(tg.sign, Sign::Container);
    EXPECT_EQ(tg.arity, Arity::Fixed);
    EXPECT_EQ(tg.cls, *s.classes().lookup("point"));
    EXPECT_EQ(tg.args.size(), 1u);

    EXPECT_EQ(cls("(union int string)", s).sign, Sign::Union);
    auto opt = cls("(optional int)", s);
    EXPECT_EQ(opt.sign, Sign::Union);
    ASSERT_EQ(opt.args.size(), 2u);
    EXPECT_TRUE(is_nil(*opt.args[1]));

    auto lit = cls("(literal 1 :a \"x\")", s);
    EXPECT_EQ(lit.sign, Sign::Literal);
    EXPECT_EQ(lit.args.size(), 3u);
    EXPECT_EQ(cls("#{1 2}", s).sign, Sign::Literal);

    auto sat = cls("(satisfies even?)", s);
    EXPECT_EQ(sat.sign, Sign::Predicate);
    EXPECT_EQ(sat.name, "even?");
    ASSERT_TRUE(sat.predicate);

    auto ref = cls("(ref Tree)", s);
    EXPECT_EQ(ref.sign, Sign::Forward);
    EXPECT_EQ(ref.name, "Tree");
}

TEST(Classify, ClassesPredicatesAndForwards){
    HintScope s = make_scope();
    auto i = cls("int", s);
    EXPECT_EQ(i.sign, Sign::Atomic);
    EXPECT_EQ(i.cls, class_id(Builtin::Int));
    EXPECT_EQ(cls("point", s).sign, Sign::Atomic);
    EXPECT_EQ(cls("even?", s).sign, Sign::Predicate);

    auto host = classify(n_fn("positive?", [](const node_ptr&){ return true; }), s);
    EXPECT_EQ(host.sign, Sign::Predicate);
    EXPECT_EQ(host.name, "positive?");

    auto str = cls("\"list[int]\"", s);
    EXPECT_EQ(str.sign, Sign::Forward);
    EXPECT_EQ(str.name, "list[int]");
    EXPECT_EQ(cls("#ref Tree", s).name, "Tree");
    EXPECT_EQ(cls("Tree", s).sign, Sign::Forward);
    EXPECT_EQ(cls("NotYetDefined", s).sign, Sign::Forward);
}

TEST(Classify, RejectsUnknownShapes){
    HintScope s = make_scope();
    for(const char* bad : {"42", "1.5", ":kw", "true", "[int]", "{int int}", "()", "(1 2)",
                           "(frobnicate int)", "(list-of)", "(list-of int string)", "(map-of int)",
                           "(union)", "(literal)", "(satisfies nope?)", "(satisfies 3)",
                           "(tagged int string)", "(tagged nowhere int)", "#point {:x 1}", "#{}"}){
        EXPECT_THROW(cls(bad, s), unsupported_specification) << bad;
    }
}

TEST(Scope, NamesAreUniqueAcrossKinds){
    static_assert(std::is_const<std::remove_reference_t<decltype(std::declval<HintScope&>().classes())>>::value,
                  "classes are registered through HintScope::define_class only");
    HintScope s = make_scope();
    for(const char* taken : {"point", "even?", "Tree", "int", "object"}){
        try {
            s.define_class(taken);
            FAIL() << "expected a name clash for " << taken;
        } catch(const hint_error& e){
            EXPECT_EQ(e.code(), "E2010") << taken;
        }
    }
    EXPECT_THROW(s.define_predicate("point", [](const node_ptr&){ return true; }), hint_error);
    EXPECT_THROW(s.define("even?", "int"), hint_error);
}

TEST(Classify, ErrorsNameTheOffendingForm){
    HintScope s;
    try {
        cls("\n (frobnicate int)", s);
        FAIL() << "expected unsupported_specification";
    } catch(const unsupported_specification& e){
        EXPECT_EQ(e.code(), "E2001");
        EXPECT_EQ(e.line(), 2);
        EXPECT_NE(std::string(e.what()).find("(frobnicate int)"), std::string::npos);
    }
}

TEST(Classify, OriginTableIsClosed){
    for(auto& e : origin_table()) EXPECT_EQ(find_origin(e.head), &e);
    EXPECT_EQ(find_origin("list"), nullptr);    // sugar, expanded before classification
    EXPECT_EQ(find_origin("nullable"), nullptr);
}

TEST(Desugar, StandardMacros){
    const Desugarer& d = Desugarer::standard();
    EXPECT_EQ(to_string(d.expand(parse("(nullable int)"))), "(optional int)");
    EXPECT_EQ(to_string(d.expand(parse("(one-of 1 (list int))"))), "(literal 1 (list int))");
    EXPECT_EQ(to_string(d.expand(parse("(list int)"))), "(list-of int)");
    EXPECT_EQ(to_string(d.expand(parse("(map keyword (vector (set int)))"))),
              "(map-of keyword (vector-of (set-of int)))");
    EXPECT_EQ(to_string(d.expand(parse("(union (nullable int) string)"))), "(union (optional int) string)");
}

TEST(Desugar, QuotedFormsAndUntouchedInput){
    const Desugarer& d = Desugarer::standard();
    auto lit = parse("(literal (list int))");
    EXPECT_EQ(d.expand(lit).get(), lit.get());

    auto raw = parse("(tuple (nullable int) (list string))");
    std::string before = to_string(raw);
    auto out = d.expand(raw);
    EXPECT_NE(out.get(), raw.get());
    EXPECT_EQ(to_string(raw), before);
    EXPECT_EQ(to_string(out), "(tuple (optional int) (list-of string))");

    auto plain = parse("(tuple int string)");
    EXPECT_EQ(d.expand(plain).get(), plain.get());
}

TEST(Desugar, CustomMacros){
    Desugarer d;
    d.add_macro("pair", [](const list& form)->std::optional<node_ptr>{
        if(form.elems.size()!=2) return std::nullopt;
        return build_form("tuple", {form.elems[1], form.elems[1]});
    });
    EXPECT_TRUE(d.has_macro("pair"));
    EXPECT_EQ(to_string(d.expand(parse("(pair int)"))), "(tuple int int)");
    EXPECT_EQ(to_string(d.expand(parse("(pair int string)"))), "(pair int string)");

    d.add_macro("forever", [](const list& form)->std::optional<node_ptr>{
        return build_form("forever", std::vector<node_ptr>(form.elems.begin()+1, form.elems.end()));
    });
    EXPECT_THROW(d.expand(parse("(forever int)")), parse_error);
}
