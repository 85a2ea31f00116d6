// In-process example: compile a declaration, bind companions, compare two instances.
#include <cctype>
#include <iostream>
#include <string>
#include "eqgen/compiler.hpp"
#include "eqgen/synthesize.hpp"

using namespace eqgen;

static std::string lower(std::string s){ for(auto &c : s) c = (char)std::tolower((unsigned char)c); return s; }

int main(){
    const char* src = R"EDN(
        (module
          (class :name Person :namespace demo :partial true :attrs [value-object] :base value-object
                 :members [ (field :name city :type string :readonly true :equality (include))
                            (field :name lastName :type string :readonly true :equality (custom))
                            (field :name visits :type (seq i32) :readonly true :equality (sequence :order-matters false)) ]
                 :functions [ (fn :name Equals_LastName) (fn :name GetHashCode_LastName) ]))
    )EDN";

    Compiler compiler;
    auto res = compiler.compile_source(src);
    if(!res.success){ std::cerr << format_diagnostics(res); return 1; }
    const auto& contract = *res.declarations.at(0).contract;

    CompanionTable companions;
    companions.define_equals("Equals_LastName", [](const node_ptr& a, const node_ptr& b){ return lower(name_of(a))==lower(name_of(b)); })
              .define_hash("GetHashCode_LastName", [](const node_ptr& v){ return (int64_t)std::hash<std::string>{}(lower(name_of(v))); });
    auto fns = synthesize(contract, companions);

    instance x{"demo::Person", {{"city", n_str("Gaza")}, {"lastName", n_str("Jaber")}, {"visits", parse("[3 1 2]")}}};
    instance y{"demo::Person", {{"city", n_str("Gaza")}, {"lastName", n_str("JABER")}, {"visits", parse("[1 2 3]")}}};
    bool same = fns.equals(x, y);
    std::cout << "equals: " << (same ? "true" : "false") << "\n";
    std::cout << "hashes match: " << (fns.hash(x)==fns.hash(y) ? "true" : "false") << "\n";
    std::cout << res.source();
    return same ? 0 : 2;
}
