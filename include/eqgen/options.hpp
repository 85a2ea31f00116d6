// Process options sourced from EQGEN_* environment variables
#pragma once
#include <string>

namespace eqgen {

struct Options {
    bool diag_json=false;   // EQGEN_DIAG_JSON
    bool trace=false;       // EQGEN_TRACE
    unsigned jobs=1;        // EQGEN_JOBS
    bool cache=true;        // EQGEN_NO_CACHE disables
    bool fix_hints=true;    // EQGEN_FIX_HINTS=0 disables
};

// Values starting with 1/t/T/y/Y enable a flag.
bool env_flag_enabled(const char* name);

Options detect_options();

// [eqgen][trace] line on stderr when tracing is on.
void trace(const Options& o, const std::string& msg);

} // namespace eqgen
