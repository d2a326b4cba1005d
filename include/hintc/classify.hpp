// Sign classification of raw specifications (one level; children are left raw)
#pragma once
#include <string>
#include <vector>
#include "hintc/value.hpp"
#include "hintc/scope.hpp"
#include "hintc/spec.hpp"

namespace hintc {

// Result of classifying one raw specification. Children stay raw; the reducer classifies them.
struct Classification {
    Sign sign{Sign::Ignorable};
    ClassId cls{0};                 // Atomic class, Container base
    Arity arity{Arity::Variadic};   // Container
    std::vector<node_ptr> args;     // Container element specs, Union alternatives, Literal values
    node_ptr predicate;             // Predicate: native_fn node
    std::string name;               // Predicate name, Forward reference text
};

// One row of the static origin table: `(head args...)` forms the classifier recognizes.
struct OriginEntry {
    const char* head;
    Sign sign;
    Builtin base;     // Container base class (Tagged: taken from the first argument)
    Arity arity;
    int min_args;
    int max_args;     // -1: unbounded
};

const std::vector<OriginEntry>& origin_table();
const OriginEntry* find_origin(const std::string& head);

// Ordered rules (sentinels, origin forms, classes, predicates, forward references).
// Throws unsupported_specification naming the offending sub-specification.
Classification classify(const node_ptr& raw, const HintScope& scope);

} // namespace hintc
