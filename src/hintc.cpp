#include "hintc/hintc.hpp"
#include "hintc/diagnostics_json.hpp"

namespace hintc {

CheckerPtr compile(CheckerCache& cache, const node_ptr& raw, ScopePtr scope, const CheckConf& conf){
    return cache.get_or_compile(raw, std::move(scope), conf);
}

bool is_bearable(CheckerCache& cache, const node_ptr& value, const node_ptr& raw, ScopePtr scope, const CheckConf& conf){
    return compile(cache, raw, std::move(scope), conf)->check(value);
}

void die_if_unbearable(CheckerCache& cache, const node_ptr& value, const node_ptr& raw,
                       const std::string& label, ScopePtr scope, const CheckConf& conf){
    CheckerPtr checker = compile(cache, raw, std::move(scope), conf);
    if(checker->check(value)) return;
    Diagnostic d = explain_violation(*checker, value);
    // a nondeterministic predicate may accept on the second walk
    if(d.ok()) return;
    maybe_print_json(d, conf);
    throw hint_violation(label, std::move(d));
}

} // namespace hintc
