// Resolution scope for raw specifications: classes, named predicates and named definitions
#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>
#include <memory>
#include <functional>
#include "hintc/value.hpp"
#include "hintc/classes.hpp"

namespace hintc {

using PredicateFn = std::function<bool(const node_ptr&)>;

// A scope is built up front and then shared read-only with the compiler:
//   auto scope = std::make_shared<HintScope>();
//   scope->define_class("point");
//   scope->define("Tree", "(union int (vector-of Tree))");
//   compile(cache, parse("Tree"), scope);
// Changing a scope after a checker compiled against it is undefined behaviour.
class HintScope {
public:
    HintScope() = default;

    const ClassTable& classes() const { return classes_; }

    ClassId define_class(const std::string& name, const std::vector<std::string>& parents = {});
    void define_predicate(const std::string& name, PredicateFn fn);
    // Named raw specification, the target of forward references to `name`.
    void define(const std::string& name, node_ptr raw);
    void define(const std::string& name, std::string_view edn_text);

    const node_ptr* find_predicate(const std::string& name) const;
    const node_ptr* find_definition(const std::string& name) const;
    bool has_name(const std::string& name) const;

    // Names of every class, predicate and definition (used for "did you mean" notes).
    std::vector<std::string> all_names() const;

private:
    void ensure_fresh(const std::string& name) const;
    ClassTable classes_;
    std::unordered_map<std::string, node_ptr> predicates_;
    std::unordered_map<std::string, node_ptr> definitions_;
};

using ScopePtr = std::shared_ptr<const HintScope>;

// Scope holding only the builtin classes, shared by callers that need nothing else.
ScopePtr builtin_scope();

} // namespace hintc
