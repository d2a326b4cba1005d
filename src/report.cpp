#include "hintc/report.hpp"
#include "hintc/errors.hpp"
#include <optional>

namespace hintc {

namespace {

std::string clip(std::string s, size_t max = 80){
    if(s.size() > max){ s.resize(max-3); s += "..."; }
    return s;
}

std::string describe(const node_ptr& v){
    return kind_name(*v) + " " + clip(to_string(v));
}

class Reporter {
public:
    Reporter(const CompiledChecker& c) : tree_(c.tree()), classes_(c.scope().classes()) {}

    bool matches(NodeId id, const node_ptr& v) const {
        const SpecNode& n = tree_.at(id);
        switch(n.sign){
            case Sign::Ignorable: return true;
            case Sign::Atomic: return classes_.is_instance(*v, n.cls);
            case Sign::Literal:
                for(auto& x : n.values) if(equal(x, v)) return true;
                return false;
            case Sign::Predicate: return as_native_fn(*n.predicate)->fn(v);
            case Sign::Union:
                for(NodeId c : n.children) if(matches(c, v)) return true;
                return false;
            case Sign::Container: return shallow(id, v) && !first_bad_child(id, v);
            case Sign::Forward: return false;
        }
        return false;
    }

    void locate(NodeId id, const node_ptr& v, Diagnostic& out){
        const SpecNode& n = tree_.at(id);
        switch(n.sign){
            case Sign::Atomic:
                return fail(id, v, "an instance of " + classes_.name(n.cls), out);
            case Sign::Literal: {
                std::string want = "one of ";
                for(size_t i=0;i<n.values.size();++i) want += (i ? ", " : "") + hintc::to_string(n.values[i]);
                return fail(id, v, want, out);
            }
            case Sign::Predicate:
                return fail(id, v, "a value satisfying " + (n.name.empty() ? std::string("<fn>") : n.name), out);
            case Sign::Union: {
                std::vector<NodeId> near;
                for(NodeId c : n.children) if(shallow(c, v)) near.push_back(c);
                if(near.size()==1) return locate(near.front(), v, out);
                fail(id, v, "any of " + std::to_string(n.children.size()) + " alternatives", out);
                for(NodeId c : n.children)
                    out.notes.push_back(DiagNote{"alternative: " + tree_.to_string(c, classes_)});
                return;
            }
            case Sign::Container: {
                if(!classes_.is_instance(*v, n.cls))
                    return fail(id, v, "an instance of " + classes_.name(n.cls), out);
                if(fixed_vector(n)){
                    size_t have = std::get<vector_t>(v->data).elems.size();
                    if(have!=n.children.size())
                        return fail(id, v, "a vector of length " + std::to_string(n.children.size()), out,
                            "a vector of length " + std::to_string(have));
                }
                std::optional<Step> bad = first_bad_child(id, v);
                if(!bad) return fail(id, v, tree_.to_string(id, classes_), out);
                path_.push_back(bad->label);
                locate(bad->spec, bad->value, out);
                path_.pop_back();
                return;
            }
            case Sign::Ignorable:
            case Sign::Forward:
                return fail(id, v, tree_.to_string(id, classes_), out);
        }
    }

private:
    struct Step { std::string label; NodeId spec; node_ptr value; };

    bool fixed_vector(const SpecNode& n) const {
        return n.arity==Arity::Fixed && n.cls==class_id(Builtin::Vector);
    }

    // Base class and length only; never recurses into elements.
    bool shallow(NodeId id, const node_ptr& v) const {
        const SpecNode& n = tree_.at(id);
        if(n.sign==Sign::Union){
            for(NodeId c : n.children) if(shallow(c, v)) return true;
            return false;
        }
        if(n.sign!=Sign::Container) return matches(id, v);
        if(!classes_.is_instance(*v, n.cls)) return false;
        if(fixed_vector(n)) return std::get<vector_t>(v->data).elems.size()==n.children.size();
        return true;
    }

    // First element, entry or position that does not conform, in value order.
    std::optional<Step> first_bad_child(NodeId id, const node_ptr& v) const {
        const SpecNode& n = tree_.at(id);
        if(n.arity==Arity::Mapping){
            auto m = std::get_if<map>(&v->data);
            if(!m) return std::nullopt;
            for(auto& e : m->entries){
                if(!matches(n.children[0], e.first))
                    return Step{"{" + clip(to_string(e.first), 40) + "}", n.children[0], e.first};
                if(!matches(n.children[1], e.second))
                    return Step{"[" + clip(to_string(e.first), 40) + "]", n.children[1], e.second};
            }
            return std::nullopt;
        }
        if(n.arity==Arity::Fixed && !fixed_vector(n)){
            auto tv = as_tagged(*v);
            if(!tv || n.children.empty() || matches(n.children[0], tv->inner)) return std::nullopt;
            return Step{"#" + classes_.name(n.cls), n.children[0], tv->inner};
        }
        auto xs = elements_of(*v);
        if(!xs) return std::nullopt;
        for(size_t i=0;i<xs->size();++i){
            NodeId child = n.arity==Arity::Fixed ? n.children[i] : n.children[0];
            if(!matches(child, (*xs)[i])) return Step{"[" + std::to_string(i) + "]", child, (*xs)[i]};
        }
        return std::nullopt;
    }

    void fail(NodeId id, const node_ptr& v, std::string expected, Diagnostic& out, std::string found = {}) const {
        out.code = codes::violation;
        out.path.clear();
        for(auto& s : path_) out.path += s;
        out.hint = tree_.to_string(id, classes_);
        out.expected = std::move(expected);
        out.found = found.empty() ? describe(v) : std::move(found);
        out.message = (out.path.empty() ? std::string("") : "at " + out.path + " ")
            + "violates " + out.hint + ": expected " + out.expected + ", found " + out.found;
    }

    const SpecTree& tree_;
    const ClassTable& classes_;
    std::vector<std::string> path_;
};

} // namespace

bool conforms(const CompiledChecker& checker, const node_ptr& value){
    Reporter r(checker);
    return r.matches(checker.tree().root(), value);
}

Diagnostic explain_violation(const CompiledChecker& checker, const node_ptr& value){
    Reporter r(checker);
    Diagnostic d;
    NodeId root = checker.tree().root();
    if(r.matches(root, value)) return d;
    r.locate(root, value, d);
    return d;
}

std::string Diagnostic::to_string() const {
    if(ok()) return "ok";
    std::string out = code + ": value " + message;
    for(auto& n : notes) out += "\n  note: " + n.message;
    return out;
}

} // namespace hintc
