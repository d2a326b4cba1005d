#include "hintc/conf.hpp"
#include <cstdlib>
#include <cstdio>
#include <algorithm>
#include <cctype>

namespace hintc {

const char* strategy_name(Strategy s){
    switch(s){
        case Strategy::O0: return "O0";
        case Strategy::O1: return "O1";
        case Strategy::On: return "On";
    }
    return "<bad-strategy>";
}

bool parse_strategy(const std::string& text, Strategy& out){
    std::string t = text;
    std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if(t=="o0"){ out = Strategy::O0; return true; }
    if(t=="o1"){ out = Strategy::O1; return true; }
    if(t=="on"){ out = Strategy::On; return true; }
    return false;
}

// Reads process env vars and constructs a CheckConf. Unset or empty variables keep the defaults.
CheckConf detect_conf(){
    CheckConf c{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("HINTC_STRATEGY")) {
        if (!parse_strategy(v, c.strategy))
            std::fprintf(stderr, "[hintc] ignoring HINTC_STRATEGY=%s (expected O0, O1 or On)\n", v);
    }
    if (const char* v = get("HINTC_DEBUG")) c.debug = (std::string(v) == "1");
    if (const char* v = get("HINTC_DIAG_JSON")) c.diag_json = (std::string(v) == "1");
    return c;
}

} // namespace hintc
