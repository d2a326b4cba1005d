#include "hintc/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>

namespace hintc {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_diagnostic_json(std::ostringstream& os, const Diagnostic& d){
    os<<"{"
        "\"code\":"<<json_escape(d.code)
        <<",\"message\":"<<json_escape(d.message)
        <<",\"hint\":"<<json_escape(d.hint)
        <<",\"path\":"<<json_escape(d.path)
        <<",\"expected\":"<<json_escape(d.expected)
        <<",\"found\":"<<json_escape(d.found)
        <<",\"notes\":[";
    for(size_t i=0;i<d.notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(d.notes[i].message)<<"}";
    }
    os<<"]}";
}

std::string diagnostics_to_json(const Diagnostic& d){
    return diagnostics_to_json(std::vector<Diagnostic>{d});
}

std::string diagnostics_to_json(const std::vector<Diagnostic>& ds){
    std::ostringstream os;
    bool success = true;
    for(auto& d : ds) if(!d.ok()) success = false;
    os<<"{\"success\":"<<(success?"true":"false")<<",\"violations\":[";
    bool first = true;
    for(auto& d : ds){
        if(d.ok()) continue;
        if(!first) os<<",";
        first = false;
        append_diagnostic_json(os, d);
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const Diagnostic& d, const CheckConf& conf){
    if(!conf.diag_json) return;
    auto js=diagnostics_to_json(d);
    std::fprintf(stderr, "%s\n", js.c_str());
}

void maybe_print_json(const Diagnostic& d){
    maybe_print_json(d, detect_conf());
}

} // namespace hintc
