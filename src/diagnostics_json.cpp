#include "eqgen/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>

namespace eqgen {

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

static void append_entry_json(std::ostringstream& os, const Diagnostic& d){
    os<<"{\"code\":"<<json_escape(d.code)
      <<",\"message\":"<<json_escape(d.message)
      <<",\"hint\":"<<json_escape(d.hint)
      <<",\"line\":"<<d.line
      <<",\"col\":"<<d.col
      <<",\"declaration\":"<<json_escape(d.declaration)
      <<",\"notes\":[";
    for(size_t i=0;i<d.notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(d.notes[i].message)<<",\"line\":"<<d.notes[i].line<<",\"col\":"<<d.notes[i].col<<"}";
    }
    os<<"],\"fixes\":[";
    for(size_t i=0;i<d.fixes.size(); ++i){
        if(i) os<<",";
        os<<"{\"key\":"<<json_escape(d.fixes[i].key)<<",\"title\":"<<json_escape(d.fixes[i].title)<<"}";
    }
    os<<"]}";
}

std::string diagnostics_to_json(const CheckResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":[";
    for(size_t i=0;i<r.errors.size(); ++i){ if(i) os<<","; append_entry_json(os, r.errors[i]); }
    os<<"],\"warnings\":[";
    for(size_t i=0;i<r.warnings.size(); ++i){ if(i) os<<","; append_entry_json(os, r.warnings[i]); }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const CheckResult& r, const Options& o){
    if(!o.diag_json) return;
    auto js=diagnostics_to_json(r);
    std::fprintf(stderr, "[eqgen][diag] %s\n", js.c_str());
}

} // namespace eqgen
