// Compile-time error kinds raised while turning a raw specification into a checker
#pragma once
#include <stdexcept>
#include <string>

namespace hintc {

// Base of every specification error. `code` follows the diagnostic code scheme (E20xx).
struct hint_error : std::runtime_error {
    hint_error(std::string code, const std::string& msg, int line=-1, int col=-1)
        : std::runtime_error(format(code, msg, line, col)), code_(std::move(code)), line_(line), col_(col) {}
    const std::string& code() const { return code_; }
    int line() const { return line_; }
    int col() const { return col_; }
private:
    static std::string format(const std::string& code, const std::string& msg, int line, int col){
        std::string out = code + ": " + msg;
        if(line>=0) out += " (at " + std::to_string(line) + ":" + std::to_string(col) + ")";
        return out;
    }
    std::string code_;
    int line_;
    int col_;
};

// The raw specification (or a sub-specification of it) has no known shape.
struct unsupported_specification : hint_error {
    unsupported_specification(const std::string& msg, int line=-1, int col=-1) : hint_error("E2001", msg, line, col) {}
};

// A forward reference names nothing in its scope, or only ever refers back to itself.
struct unresolved_forward_reference : hint_error {
    unresolved_forward_reference(std::string name, const std::string& msg)
        : hint_error("E2002", msg), name_(std::move(name)) {}
    const std::string& name() const { return name_; }
private:
    std::string name_;
};

// Internal inconsistency: a container's child count disagrees with its arity tag.
struct malformed_container_arity : hint_error {
    explicit malformed_container_arity(const std::string& msg) : hint_error("E2003", msg) {}
};

namespace codes {
inline constexpr const char* unsupported = "E2001";
inline constexpr const char* unresolved = "E2002";
inline constexpr const char* malformed_arity = "E2003";
inline constexpr const char* name_clash = "E2010";
inline constexpr const char* bad_parent = "E2011";
inline constexpr const char* violation = "E2100";
} // namespace codes

} // namespace hintc
