// Violation reporter: exhaustive failure-path diagnosis against a compiled checker's tree
#pragma once
#include <string>
#include <vector>
#include "hintc/value.hpp"
#include "hintc/synth.hpp"

namespace hintc {

struct DiagNote { std::string message; };

// One violation. `path` is built from steps: [1] index, {:k} map key, [:k] map value,
// #point tagged inner. An empty `code` means the value conforms.
struct Diagnostic {
    std::string code;
    std::string message;    // "at [1] violates ...", subject left to the caller
    std::string hint;       // the failing sub-specification
    std::string path;
    std::string expected;
    std::string found;
    std::vector<DiagNote> notes;

    bool ok() const { return code.empty(); }
    std::string to_string() const;
};

// Re-derives the failure with a full (unsampled) traversal and stops at the first failing node.
// Returns an ok() diagnostic for a conforming value. `value` must not be null.
Diagnostic explain_violation(const CompiledChecker& checker, const node_ptr& value);

// Full traversal of the reduced tree, independent of the checker's strategy.
bool conforms(const CompiledChecker& checker, const node_ptr& value);

} // namespace hintc
