#pragma once
#include <string_view>
#include "hintc/value.hpp"

namespace hintc {

// Parse hint-string notation into the equivalent raw EDN specification.
//
//   "list[int | string]"      -> (list-of (union int string))
//   "map[keyword, int]"       -> (map-of keyword int)
//   "tuple[int, ...]"         -> (vector-of int)
//   "Literal[1, :a, \"x\"]"   -> (literal 1 :a "x")
//   "Optional[Tree]"          -> (optional Tree)
//
// Throws unsupported_specification (with line/column) on malformed input.
node_ptr parse_hint(std::string_view text, std::string_view source = "<hint>");

// True when `text` is a plain name (no brackets, bars or literals): such forward references
// are looked up directly instead of being parsed.
bool is_bare_name(std::string_view text);

} // namespace hintc
