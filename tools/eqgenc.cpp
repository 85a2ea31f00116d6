#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include "eqgen/compiler.hpp"
#include "eqgen/diagnostics_json.hpp"

using namespace eqgen;

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path);
    if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str();
    return true;
}

int main(int argc, char** argv){
    std::string input, output; bool json=false;
    for(int i=1;i<argc; ++i){
        std::string a = argv[i];
        if(a=="-o" && i+1<argc) output = argv[++i];
        else if(a=="--json") json = true;
        else if(!a.empty() && a[0]=='-'){ std::cerr << "unknown option: " << a << "\n"; input.clear(); break; }
        else if(input.empty()) input = a;
        else { std::cerr << "unexpected argument: " << a << "\n"; input.clear(); break; }
    }
    if(input.empty()){ std::cerr << "usage: eqgenc <file.edn> [-o out.hpp] [--json]\n"; return 1; }
    std::string src;
    if(!read_file(input, src)){ std::cerr << "failed to read " << input << "\n"; return 1; }
    Compiler compiler;
    CompileResult res;
    try { res = compiler.compile_source(src); }
    catch(const parse_error& e){ std::cerr << input << ": parse error: " << e.what() << "\n"; return 1; }
    if(json) std::cout << diagnostics_to_json(res) << "\n";
    else if(!res.errors.empty() || !res.warnings.empty()){
        if(!res.success) std::cerr << "Contract check failed:\n";
        std::cerr << format_diagnostics(res);
    }
    std::string generated = res.source();
    if(!output.empty()){
        std::ofstream ofs(output, std::ios::binary);
        if(!ofs){ std::cerr << "failed to write " << output << "\n"; return 1; }
        ofs << generated;
    } else if(!json) std::cout << generated;
    return res.success ? 0 : 2;
}
