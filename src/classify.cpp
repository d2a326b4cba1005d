#include "hintc/classify.hpp"
#include "hintc/errors.hpp"

namespace hintc {

const std::vector<OriginEntry>& origin_table(){
    static const std::vector<OriginEntry> table{
        {"list-of",   Sign::Container, Builtin::List,   Arity::Variadic, 1, 1},
        {"vector-of", Sign::Container, Builtin::Vector, Arity::Variadic, 1, 1},
        {"set-of",    Sign::Container, Builtin::Set,    Arity::Variadic, 1, 1},
        {"seq-of",    Sign::Container, Builtin::Seq,    Arity::Variadic, 1, 1},
        {"coll-of",   Sign::Container, Builtin::Coll,   Arity::Variadic, 1, 1},
        {"map-of",    Sign::Container, Builtin::Map,    Arity::Mapping,  2, 2},
        {"tuple",     Sign::Container, Builtin::Vector, Arity::Fixed,    0, -1},
        {"tagged",    Sign::Container, Builtin::Tagged, Arity::Fixed,    2, 2},
        {"union",     Sign::Union,     Builtin::Any,    Arity::Variadic, 1, -1},
        {"optional",  Sign::Union,     Builtin::Any,    Arity::Variadic, 1, 1},
        {"literal",   Sign::Literal,   Builtin::Any,    Arity::Variadic, 1, -1},
        {"satisfies", Sign::Predicate, Builtin::Any,    Arity::Variadic, 1, 1},
        {"ref",       Sign::Forward,   Builtin::Any,    Arity::Variadic, 1, 1},
    };
    return table;
}

const OriginEntry* find_origin(const std::string& head){
    for(auto& e : origin_table()) if(head==e.head) return &e;
    return nullptr;
}

namespace {

[[noreturn]] void unsupported(const node_ptr& raw, const std::string& why){
    throw unsupported_specification(why + ": " + to_string(raw), line(*raw), col(*raw));
}

std::string reference_name(const node_ptr& raw, const node_ptr& target){
    if(auto s = as_symbol(*target)) return s->name;
    if(is_string(*target)) return std::get<std::string>(target->data);
    unsupported(raw, "reference target must be a symbol or a string");
}

Classification classify_origin(const node_ptr& raw, const list& form, const HintScope& scope){
    if(form.elems.empty()) unsupported(raw, "empty list is not a specification");
    auto head = as_symbol(*form.elems[0]);
    if(!head) unsupported(raw, "specification form must start with a symbol");
    const OriginEntry* e = find_origin(head->name);
    if(!e) unsupported(raw, "unknown specification form '" + head->name + "'");
    int argc = static_cast<int>(form.elems.size()) - 1;
    if(argc < e->min_args || (e->max_args>=0 && argc > e->max_args)){
        std::string want = e->max_args<0 ? "at least " + std::to_string(e->min_args)
            : e->min_args==e->max_args ? std::to_string(e->min_args)
            : std::to_string(e->min_args) + ".." + std::to_string(e->max_args);
        unsupported(raw, "'" + head->name + "' takes " + want + " argument(s), got " + std::to_string(argc));
    }
    Classification c;
    c.sign = e->sign;
    c.arity = e->arity;
    c.cls = class_id(e->base);
    c.args.assign(form.elems.begin()+1, form.elems.end());
    switch(e->sign){
        case Sign::Container:
            if(e->base==Builtin::Tagged){
                auto cname = as_symbol(*c.args[0]);
                if(!cname) unsupported(raw, "tagged class must be named by a symbol");
                auto id = scope.classes().lookup(cname->name);
                if(!id || !scope.classes().is_subclass(*id, class_id(Builtin::Tagged)))
                    unsupported(raw, "'" + cname->name + "' is not a tagged class");
                c.cls = *id;
                c.args.erase(c.args.begin());
            }
            break;
        case Sign::Union:
            if(head->name=="optional") c.args.push_back(n_nil());
            break;
        case Sign::Predicate: {
            const node_ptr& target = c.args[0];
            if(as_native_fn(*target)){
                c.predicate = target;
                c.name = as_native_fn(*target)->name;
            } else if(auto s = as_symbol(*target)){
                const node_ptr* p = scope.find_predicate(s->name);
                if(!p) unsupported(raw, "unknown predicate '" + s->name + "'");
                c.predicate = *p;
                c.name = s->name;
            } else unsupported(raw, "satisfies expects a predicate name or a host function");
            c.args.clear();
            break;
        }
        case Sign::Forward:
            c.name = reference_name(raw, c.args[0]);
            c.args.clear();
            break;
        default:
            break;
    }
    return c;
}

} // namespace

Classification classify(const node_ptr& raw, const HintScope& scope){
    if(!raw) throw unsupported_specification("null specification");
    Classification c;
    const node& n = *raw;
    // 1. sentinels
    if(auto s = as_symbol(n)){
        if(s->name=="any" || s->name=="object"){ c.sign = Sign::Ignorable; return c; }
        if(s->name=="nothing"){ c.sign = Sign::Atomic; c.cls = class_id(Builtin::Nothing); return c; }
    }
    if(is_nil(n)){ c.sign = Sign::Atomic; c.cls = class_id(Builtin::Nil); return c; }
    // 2. origin + arguments
    if(auto l = as_list(n)) return classify_origin(raw, *l, scope);
    if(auto st = std::get_if<set>(&n.data)){
        if(st->elems.empty()) unsupported(raw, "empty literal set");
        c.sign = Sign::Literal;
        c.args = st->elems;
        return c;
    }
    if(auto s = as_symbol(n)){
        // 3. classes
        if(auto id = scope.classes().lookup(s->name)){ c.sign = Sign::Atomic; c.cls = *id; return c; }
        // 4. named predicates
        if(const node_ptr* p = scope.find_predicate(s->name)){
            c.sign = Sign::Predicate; c.predicate = *p; c.name = s->name; return c;
        }
        // 5. definitions and deferred names
        c.sign = Sign::Forward; c.name = s->name; return c;
    }
    if(auto f = as_native_fn(n)){
        if(!f->fn) unsupported(raw, "host function is empty");
        c.sign = Sign::Predicate; c.predicate = raw; c.name = f->name; return c;
    }
    if(is_string(n)){ c.sign = Sign::Forward; c.name = std::get<std::string>(n.data); return c; }
    if(auto tv = as_tagged(n)){
        if(tv->tag.name=="ref"){ c.sign = Sign::Forward; c.name = reference_name(raw, tv->inner); return c; }
        unsupported(raw, "tagged value #" + tv->tag.name + " is not a specification");
    }
    unsupported(raw, "value of kind " + kind_name(n) + " is not a specification");
}

} // namespace hintc
