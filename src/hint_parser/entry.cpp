#include "hintc/hint_parser.hpp"
#include "hintc/desugar.hpp"
#include "hintc/errors.hpp"
#include "prelude.hpp"
#include "grammar.hpp"
#include "actions.hpp"
#include <tao/pegtl.hpp>
#include <unordered_map>
#include <cctype>

namespace hintc {
namespace hint_front {

namespace {

// Host-language spellings accepted in hint strings, mapped onto canonical class names.
const std::unordered_map<std::string, std::string>& aliases(){
    static const std::unordered_map<std::string, std::string> table{
        {"Any", "any"}, {"object", "any"}, {"str", "string"}, {"String", "string"},
        {"Int", "int"}, {"Float", "float"}, {"Bool", "bool"}, {"Number", "number"},
        {"List", "list"}, {"Vector", "vector"}, {"Set", "set"}, {"frozenset", "set"},
        {"Seq", "seq"}, {"Sequence", "seq"}, {"Coll", "coll"}, {"Collection", "coll"},
        {"dict", "map"}, {"Dict", "map"}, {"Map", "map"}, {"Mapping", "map"},
        {"tuple", "vector"}, {"Tuple", "vector"}, {"Callable", "callable"},
    };
    return table;
}

std::string canonical(const std::string& name){
    auto it = aliases().find(name);
    return it==aliases().end() ? name : it->second;
}

void reject_ellipsis(const std::string& name, const std::vector<node_ptr>& args){
    for(auto& a : args)
        if(is_ellipsis(a)) throw unsupported_specification("'...' is only allowed as the last argument of tuple[T, ...], not in " + name + "[...]");
}

void want_args(const std::string& name, const std::vector<node_ptr>& args, size_t n){
    if(args.size()!=n)
        throw unsupported_specification(name + "[...] takes " + std::to_string(n) + " argument" + (n==1 ? "" : "s")
            + ", got " + std::to_string(args.size()));
}

} // namespace

node_ptr make_subscripted(const std::string& name, std::vector<node_ptr> args){
    if(name=="Literal"){
        reject_ellipsis(name, args);
        if(args.empty()) throw unsupported_specification("Literal[...] needs at least one value");
        return build_form("literal", std::move(args));
    }
    if(name=="Optional"){
        reject_ellipsis(name, args);
        want_args(name, args, 1);
        return build_form("optional", std::move(args));
    }
    if(name=="Union"){
        reject_ellipsis(name, args);
        if(args.empty()) throw unsupported_specification("Union[...] needs at least one alternative");
        return build_form("union", std::move(args));
    }
    const std::string base = canonical(name);
    if(name=="tuple" || name=="Tuple"){
        if(args.size()==2 && is_ellipsis(args[1]) && !is_ellipsis(args[0]))
            return build_form("vector-of", {args[0]});
        reject_ellipsis(name, args);
        return build_form("tuple", std::move(args));
    }
    reject_ellipsis(name, args);
    if(base=="list" || base=="vector" || base=="set" || base=="seq" || base=="coll"){
        want_args(name, args, 1);
        return build_form(base + "-of", std::move(args));
    }
    if(base=="map"){
        want_args(name, args, 2);
        return build_form("map-of", std::move(args));
    }
    // point[S]: a user tagged class whose inner form conforms to S
    want_args(name, args, 1);
    return build_form("tagged", {n_sym(base), args[0]});
}

node_ptr make_bare(const std::string& name){
    if(name=="None" || name=="NoneType") return n_nil();
    if(name=="True") return n_bool(true);
    if(name=="False") return n_bool(false);
    return n_sym(canonical(name));
}

} // namespace hint_front

using namespace hint_front;

node_ptr parse_hint(std::string_view text, std::string_view source){
    tao::pegtl::memory_input in(text.data(), text.size(), std::string(source));
    build_state st;
    try {
        tao::pegtl::parse< grammar::grammar, actions::action >(in, st);
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        throw unsupported_specification("malformed hint string \"" + std::string(text) + "\": " + e.what(),
            static_cast<int>(p.line), static_cast<int>(p.column));
    }
    if(st.stack.size()!=1 || !st.stack.back())
        throw unsupported_specification("malformed hint string \"" + std::string(text) + "\"");
    return st.stack.back();
}

bool is_bare_name(std::string_view text){
    if(text.empty()) return false;
    auto first = static_cast<unsigned char>(text[0]);
    if(!std::isalpha(first) && first!='_') return false;
    for(char c : text){
        auto u = static_cast<unsigned char>(c);
        if(!std::isalnum(u) && c!='_' && c!='-' && c!='?' && c!='!' && c!='*' && c!='.') return false;
    }
    return text!="nil" && text!="true" && text!="false";
}

} // namespace hintc
