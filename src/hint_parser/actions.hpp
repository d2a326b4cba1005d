#pragma once
#include "prelude.hpp"
#include "grammar.hpp"
#include <tao/pegtl.hpp>
#include <string>
#include <stdexcept>

namespace hintc::hint_front::actions {
using namespace tao::pegtl;
using hintc::hint_front::build_state;

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< grammar::hint_begin > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.mark(); }
};

template<> struct action< grammar::hint > {
    template<typename Input>
    static void apply(const Input&, build_state& st){
        auto alts = st.pop_to_mark();
        if(alts.size()==1){ st.stack.push_back(alts.front()); return; }
        st.stack.push_back(make_subscripted("Union", std::move(alts)));
    }
};

template<> struct action< grammar::name > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.stack.push_back(n_sym(in.string())); }
};

template<> struct action< grammar::open_bracket > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.mark(); }
};

template<> struct action< grammar::subscript > {
    template<typename Input>
    static void apply(const Input&, build_state& st){
        auto args = st.pop_to_mark();
        auto head = st.stack.back(); st.stack.pop_back();
        st.stack.push_back(make_subscripted(std::get<symbol>(head->data).name, std::move(args)));
    }
};

// A named atom without a subscript is still the raw symbol pushed by `name`.
template<> struct action< grammar::named > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        if(in.string().find('[')!=std::string::npos) return;
        auto head = st.stack.back(); st.stack.pop_back();
        st.stack.push_back(make_bare(std::get<symbol>(head->data).name));
    }
};

template<> struct action< grammar::ellipsis > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.stack.push_back(n_sym("...")); }
};

template<> struct action< grammar::int_lit > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        try { st.stack.push_back(n_i64(std::stoll(in.string()))); }
        catch(const std::out_of_range&){ throw tao::pegtl::parse_error("integer literal out of range", in); }
    }
};

template<> struct action< grammar::float_lit > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        try { st.stack.push_back(n_f64(std::stod(in.string()))); }
        catch(const std::out_of_range&){ throw tao::pegtl::parse_error("float literal out of range", in); }
    }
};

template<> struct action< grammar::string_lit > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        std::string raw = in.string();
        std::string out;
        for(size_t i=1;i+1<raw.size();++i){
            char c = raw[i];
            if(c!='\\'){ out += c; continue; }
            char e = raw[++i];
            switch(e){ case 'n': out += '\n'; break; case 't': out += '\t'; break; case 'r': out += '\r'; break; default: out += e; break; }
        }
        st.stack.push_back(n_str(std::move(out)));
    }
};

template<> struct action< grammar::keyword_lit > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.stack.push_back(n_kw(in.string().substr(1))); }
};

template<> struct action< grammar::nil_lit > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.stack.push_back(n_nil()); }
};

template<> struct action< grammar::true_lit > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.stack.push_back(n_bool(true)); }
};

template<> struct action< grammar::false_lit > {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.stack.push_back(n_bool(false)); }
};

} // namespace hintc::hint_front::actions
