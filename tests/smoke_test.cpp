#include <cassert>
#include <iostream>
#include "hintc/hintc.hpp"

using namespace hintc;

// End-to-end walk through the public entry points: scope, compile, check, explain.
void run_smoke_tests(){
    CheckerCache cache;
    auto scope = std::make_shared<HintScope>();
    scope->define_class("point");
    scope->define("Tree", "(union int (vector-of Tree))");
    scope->define("Point", "\"point[map[keyword, float]]\"");

    auto tree = compile(cache, parse("Tree"), scope);
    assert(tree->check(parse("[1 [2 3] [[4]]]")));
    assert(!tree->check(parse(":leaf")));
    assert(compile(cache, tree->spec(), scope).get() == tree.get());

    auto pts = compile(cache, parse("(list-of Point)"), scope);
    assert(pts->check(parse("(#point {:x 1.0 :y 2.0})")));
    Diagnostic d = explain_violation(*pts, parse("(#point {:x 1.0 :y 2})"));
    assert(!d.ok());
    assert(d.path == "[0]#point[:y]");

    bool raised = false;
    try {
        die_if_unbearable(cache, parse("\"x\""), parse("(union int nil)"), "return", scope);
    } catch(const hint_violation& e){
        raised = e.label() == "return";
    }
    assert(raised);
    (void)raised;
    std::cout << "[smoke] hintc end-to-end ok (" << cache.size() << " checkers cached)" << std::endl;
}
