#pragma once
#include <string>
#include <vector>
#include "hintc/value.hpp"

namespace hintc::hint_front {

// Value stack shared by the grammar actions. A null entry marks where an enclosing
// hint or subscript started; every completed hint leaves exactly one node above its mark.
struct build_state {
    std::vector<node_ptr> stack;
    void mark(){ stack.push_back(nullptr); }
    std::vector<node_ptr> pop_to_mark(){
        std::vector<node_ptr> out;
        while(!stack.empty() && stack.back()) { out.push_back(stack.back()); stack.pop_back(); }
        if(!stack.empty()) stack.pop_back(); // the mark itself
        return std::vector<node_ptr>(out.rbegin(), out.rend());
    }
};

inline bool is_ellipsis(const node_ptr& n){
    auto s = as_symbol(*n);
    return s && s->name == "...";
}

// Map `name[args...]` onto the raw specification form it stands for.
node_ptr make_subscripted(const std::string& name, std::vector<node_ptr> args);

// Map a bare name onto its raw form (`None` -> nil, `Any` -> any, aliases -> canonical names).
node_ptr make_bare(const std::string& name);

} // namespace hintc::hint_front
