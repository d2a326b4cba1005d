#include "hintc/spec.hpp"
#include <functional>
#include <unordered_set>

namespace hintc {

const char* sign_name(Sign s){
    switch(s){
        case Sign::Atomic: return "atomic";
        case Sign::Union: return "union";
        case Sign::Container: return "container";
        case Sign::Literal: return "literal";
        case Sign::Predicate: return "predicate";
        case Sign::Forward: return "forward";
        case Sign::Ignorable: return "ignorable";
    }
    return "<bad-sign>";
}

const char* arity_name(Arity a){
    switch(a){
        case Arity::Fixed: return "fixed";
        case Arity::Variadic: return "variadic";
        case Arity::Mapping: return "mapping";
    }
    return "<bad-arity>";
}

void SpecTree::validate_arity(NodeId id) const {
    const SpecNode& n = at(id);
    if(n.sign!=Sign::Container) return;
    size_t want = 0;
    switch(n.arity){
        case Arity::Fixed: return; // any N, the length check uses children.size()
        case Arity::Variadic: want = 1; break;
        case Arity::Mapping: want = 2; break;
    }
    if(n.children.size()!=want)
        throw malformed_container_arity(std::string(arity_name(n.arity)) + " container over node " + std::to_string(id)
            + " has " + std::to_string(n.children.size()) + " children, expected " + std::to_string(want));
}

std::string SpecTree::to_string(NodeId top, const ClassTable& classes) const {
    std::unordered_set<NodeId> active;
    std::function<std::string(NodeId, bool)> render = [&](NodeId id, bool is_top) -> std::string {
        const SpecNode& n = at(id);
        if(!is_top && !n.def_name.empty()) return n.def_name;
        if(active.count(id)) return n.def_name.empty() ? std::string("...") : n.def_name;
        active.insert(id);
        auto join_children = [&](std::string head){
            for(NodeId c : n.children){ head += ' '; head += render(c, false); }
            return head + ')';
        };
        std::string out;
        switch(n.sign){
            case Sign::Ignorable: out = "any"; break;
            case Sign::Atomic: out = classes.name(n.cls); break;
            case Sign::Union: out = join_children("(union"); break;
            case Sign::Literal: {
                out = "(literal";
                for(auto& v : n.values){ out += ' '; out += hintc::to_string(v); }
                out += ')';
                break;
            }
            case Sign::Predicate: out = "(satisfies " + (n.name.empty() ? std::string("<fn>") : n.name) + ")"; break;
            case Sign::Forward: out = "(ref " + n.name + ")"; break;
            case Sign::Container: {
                const std::string& base = classes.name(n.cls);
                if(n.arity!=Arity::Fixed) out = join_children("(" + base + "-of");
                else if(n.cls==class_id(Builtin::Vector)) out = join_children("(tuple");
                else out = join_children("(tagged " + base);
                break;
            }
        }
        active.erase(id);
        return out;
    };
    return render(top, true);
}

} // namespace hintc
