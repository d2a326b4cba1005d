// hintc: compiled O(1) runtime checks for declarative value specifications
#pragma once
#include <string>
#include "hintc/value.hpp"
#include "hintc/errors.hpp"
#include "hintc/classes.hpp"
#include "hintc/scope.hpp"
#include "hintc/spec.hpp"
#include "hintc/conf.hpp"
#include "hintc/synth.hpp"
#include "hintc/cache.hpp"
#include "hintc/report.hpp"

namespace hintc {

// Raised by die_if_unbearable. what() reads "<label> violates ...".
struct hint_violation : hint_error {
    hint_violation(std::string label, Diagnostic d)
        : hint_error(codes::violation, label + " " + d.message), label_(std::move(label)), diag_(std::move(d)) {}
    const std::string& label() const { return label_; }
    const Diagnostic& diagnostic() const { return diag_; }
private:
    std::string label_;
    Diagnostic diag_;
};

// Idempotent: the same (raw, scope, strategy) always yields the same checker instance.
CheckerPtr compile(CheckerCache& cache, const node_ptr& raw, ScopePtr scope = nullptr, const CheckConf& conf = {});

// compile + check.
bool is_bearable(CheckerCache& cache, const node_ptr& value, const node_ptr& raw,
                 ScopePtr scope = nullptr, const CheckConf& conf = {});

// compile + check; on failure explains the violation and throws hint_violation
// labelled e.g. "parameter 'x'" or "return".
void die_if_unbearable(CheckerCache& cache, const node_ptr& value, const node_ptr& raw,
                       const std::string& label = "value", ScopePtr scope = nullptr, const CheckConf& conf = {});

} // namespace hintc
