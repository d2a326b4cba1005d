#pragma once
#include <string>

namespace hintc {

// Checking mode a specification is compiled under.
enum class Strategy {
    O0,   // checking disabled, every value accepted
    O1,   // one sampled element per container level per call
    On    // every element, entry and position
};

const char* strategy_name(Strategy s);
// Case-insensitive "O0" / "O1" / "On"; false leaves `out` untouched.
bool parse_strategy(const std::string& text, Strategy& out);

struct CheckConf {
    Strategy strategy = Strategy::O1;
    bool debug = false;      // [dbg] tracing on stderr
    bool diag_json = false;  // violation diagnostics echoed as JSON on stderr
};

// Reads HINTC_STRATEGY, HINTC_DEBUG and HINTC_DIAG_JSON from the process environment.
CheckConf detect_conf();

} // namespace hintc
