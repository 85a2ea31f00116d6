#include "eqgen/options.hpp"
#include <cstdio>
#include <cstdlib>

namespace eqgen {

bool env_flag_enabled(const char* name){
    const char* v = std::getenv(name);
    return v && (v[0]=='1' || v[0]=='t' || v[0]=='T' || v[0]=='y' || v[0]=='Y');
}

Options detect_options(){
    Options o;
    o.diag_json = env_flag_enabled("EQGEN_DIAG_JSON");
    o.trace = env_flag_enabled("EQGEN_TRACE");
    o.cache = !env_flag_enabled("EQGEN_NO_CACHE");
    // Default on; explicit 0 disables.
    if(const char* env = std::getenv("EQGEN_FIX_HINTS")){ if(env[0]=='0') o.fix_hints=false; }
    if(const char* jobs = std::getenv("EQGEN_JOBS")){
        char* end=nullptr; unsigned long n = std::strtoul(jobs, &end, 10);
        if(end!=jobs && n>0 && n<=256) o.jobs = static_cast<unsigned>(n);
    }
    return o;
}

void trace(const Options& o, const std::string& msg){
    if(o.trace) std::fprintf(stderr, "[eqgen][trace] %s\n", msg.c_str());
}

} // namespace eqgen
