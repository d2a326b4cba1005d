#pragma once
#include <tao/pegtl.hpp>

namespace hintc::hint_front::grammar {
using namespace tao::pegtl;

struct ws : star< space > {};

// Names: int, even?, my-class, Tree
struct name_first : sor< alpha, one< '_' > > {};
struct name_other : sor< alnum, one< '_', '-', '?', '!', '*', '.' > > {};
struct name : seq< name_first, star< name_other > > {};

// Literals (each is one token; actions fire only once the whole token matched)
struct sign : one< '+', '-' > {};
struct exponent : seq< one< 'e', 'E' >, opt< sign >, plus< digit > > {};
struct float_lit : seq< opt< sign >, plus< digit >, sor< seq< one< '.' >, plus< digit >, opt< exponent > >, exponent > > {};
struct int_lit : seq< opt< sign >, plus< digit >, not_at< name_other > > {};
struct escaped : seq< one< '\\' >, any > {};
struct string_body : star< sor< escaped, not_one< '"', '\\' > > > {};
struct string_lit : seq< one< '"' >, string_body, one< '"' > > {};
struct keyword_lit : seq< one< ':' >, plus< name_other > > {};
struct nil_lit : seq< string< 'n', 'i', 'l' >, not_at< name_other > > {};
struct true_lit : seq< string< 't', 'r', 'u', 'e' >, not_at< name_other > > {};
struct false_lit : seq< string< 'f', 'a', 'l', 's', 'e' >, not_at< name_other > > {};
struct literal : sor< float_lit, int_lit, string_lit, keyword_lit, nil_lit, true_lit, false_lit > {};

struct hint;

struct ellipsis : string< '.', '.', '.' > {};
struct comma : seq< ws, one< ',' >, ws > {};
struct open_bracket : one< '[' > {};
struct close_bracket : one< ']' > {};
struct arg : sor< ellipsis, hint > {};
struct arg_list : seq< arg, star< if_must< comma, arg > > > {};
struct subscript : if_must< open_bracket, ws, opt< arg_list >, ws, close_bracket > {};
struct named : seq< name, opt< ws, at< one< '[' > >, subscript > > {};
struct atom : sor< literal, named > {};

// Pushes the mark that `hint` collapses back to one node. The mark is only pushed once the
// next character can start an atom; from there on the atom is mandatory, so a mark is never
// left behind by backtracking.
struct atom_start : sor< one< '"', ':', '+', '-' >, digit, name_first > {};
struct hint_begin : success {};
struct bar : seq< ws, one< '|' > > {};
struct hint : seq< at< atom_start >, hint_begin, must< atom >, star< if_must< bar, ws, atom > > > {};

struct grammar : must< ws, hint, ws, eof > {};

} // namespace hintc::hint_front::grammar
