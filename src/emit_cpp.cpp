#include "eqgen/emit_cpp.hpp"
#include "eqgen/runtime/equality.hpp"
#include <cstdio>
#include <map>
#include <sstream>

namespace eqgen {

std::string cpp_namespace(const std::string& ns){
    std::string out;
    for(char c : ns){ if(c=='.') out += "::"; else out += c; }
    return out;
}

static std::string hex64(uint64_t v){
    char buf[32]; std::snprintf(buf, sizeof(buf), "0x%016llxull", static_cast<unsigned long long>(v));
    return buf;
}

static const char* bool_lit(bool b){ return b ? "true" : "false"; }

static void open_ns(std::ostringstream& os, const std::string& ns){ if(!ns.empty()) os << "namespace " << ns << " {\n\n"; }
static void close_ns(std::ostringstream& os, const std::string& ns){ if(!ns.empty()) os << "} // namespace " << ns << "\n"; }

std::string emit_prelude(){
    return "// Generated by eqgenc. Do not edit.\n"
           "#pragma once\n"
           "#include <cstddef>\n"
           "#include <cstdint>\n"
           "#include <functional>\n"
           "#include <stdexcept>\n"
           "#include <string>\n"
           "#include <string_view>\n"
           "#include <typeinfo>\n"
           "#include <unordered_map>\n"
           "#include <vector>\n"
           "#include \"eqgen/runtime/equality.hpp\"\n"
           "#include \"eqgen/runtime/hooks.hpp\"\n";
}

static std::string describe(const ContractEntry& e){
    std::string s = e.member.name + " (" + strategy_name(e.strategy);
    if(auto* q = std::get_if<SequenceStrategy>(&e.strategy)){
        s += q->order_matters ? ", ordered" : ", unordered";
        s += q->deep ? ", deep" : ", identity";
    }
    return s + ")";
}

std::string emit_equality(const EqualityContract& c){
    const std::string ns = cpp_namespace(c.ns);
    const std::string full = ns.empty() ? c.type_name : ns + "::" + c.type_name;
    const std::string qual = ns.empty() ? "::" + full : full;
    const std::string& T = c.type_name;
    std::ostringstream os;
    os << "\n// ---- " << full << (c.wrapper ? " (wrapper)" : "") << " ----\n";
    os << "// Evaluation order:\n";
    std::map<int,std::vector<const ContractEntry*>> groups;
    for(auto &e : c.entries) groups[strategy_order(e.strategy)].push_back(&e);
    if(groups.empty()) os << "//   (no members; equality is type identity)\n";
    for(auto &g : groups){
        os << "//   order " << g.first << ":";
        for(size_t i=0;i<g.second.size(); ++i) os << (i ? ", " : " ") << describe(*g.second[i]);
        os << "\n";
    }
    open_ns(os, ns);

    os << "inline bool equals_core(const " << T << "& a, const " << T << "& b)\n{\n";
    os << "    if (typeid(a) != typeid(b)) return false;\n";
    for(auto &e : c.entries){
        const std::string& m = e.member.name;
        if(auto* q = std::get_if<SequenceStrategy>(&e.strategy)){
            os << "    if (!::eqgen::rt::sequence_equal(a." << m << ", b." << m << ", " << bool_lit(q->order_matters) << ", " << bool_lit(q->deep) << ")) return false;\n";
        } else if(std::holds_alternative<CustomStrategy>(e.strategy)){
            os << "    if (!" << T << "::" << companion_equals_name(m) << "(a." << m << ", b." << m << ")) return false;\n";
        } else {
            os << "    if (!(a." << m << " == b." << m << ")) return false;\n";
        }
    }
    os << "    return true;\n}\n\n";

    os << "inline std::uint64_t hash_core(const " << T << "& v)\n{\n";
    os << "    ::eqgen::rt::hash_builder h(" << hex64(rt::fnv1a(full)) << ");\n";
    for(auto &e : c.entries){
        const std::string& m = e.member.name;
        if(auto* q = std::get_if<SequenceStrategy>(&e.strategy)){
            os << "    ::eqgen::rt::add_sequence_hash(h, v." << m << ", " << bool_lit(q->order_matters) << ", " << bool_lit(q->deep) << ");\n";
        } else if(std::holds_alternative<CustomStrategy>(e.strategy)){
            os << "    h.add(static_cast<std::uint64_t>(" << T << "::" << companion_hash_name(m) << "(v." << m << ")));\n";
        } else if(e.member.type.iterable()){
            // included containers compare with ==, so hash them in order
            os << "    ::eqgen::rt::add_sequence_hash(h, v." << m << ", true, true);\n";
        } else {
            os << "    h.add(::eqgen::rt::hash_value(v." << m << "));\n";
        }
    }
    os << "    return h.finish();\n}\n\n";

    os << "inline bool operator==(const " << T << "& a, const " << T << "& b) { return equals_core(a, b); }\n";
    os << "inline bool operator!=(const " << T << "& a, const " << T << "& b) { return !equals_core(a, b); }\n\n";
    close_ns(os, ns);

    os << "\nnamespace std {\n";
    os << "template <>\nstruct hash<" << qual << ">\n{\n";
    os << "    std::size_t operator()(const " << qual << "& v) const { return static_cast<std::size_t>(" << (ns.empty() ? std::string("::") : ns + "::") << "hash_core(v)); }\n";
    os << "};\n} // namespace std\n";
    return os.str();
}

std::string emit_enumeration(const EnumerationTable& t){
    const std::string ns = cpp_namespace(t.ns());
    const std::string& T = t.type_name();
    const std::string qual = ns.empty() ? T : ns + "::" + T;
    std::ostringstream os;
    os << "\n// ---- " << qual << " (enumeration) ----\n";
    os << "// Constants in declaration order:";
    if(t.constants().empty()) os << " (none)";
    for(auto &c : t.constants()) os << " " << c;
    os << "\n";
    open_ns(os, ns);
    os << "struct " << T << "Enumeration\n{\n";
    os << "    static const std::vector<const " << T << "*>& get_all() { return tables().all; }\n\n";
    os << "    static const " << T << "& from_value(std::int64_t value)\n    {\n";
    os << "        if (const " << T << "* c = try_from_value(value)) return *c;\n";
    os << "        throw ::eqgen::lookup_error(\"no " << qual << " constant with value \" + std::to_string(value));\n    }\n\n";
    os << "    static const " << T << "& from_name(std::string_view name)\n    {\n";
    os << "        if (const " << T << "* c = try_from_name(name)) return *c;\n";
    os << "        throw ::eqgen::lookup_error(\"no " << qual << " constant named '\" + std::string(name) + \"'\");\n    }\n\n";
    os << "    static const " << T << "* try_from_value(std::int64_t value)\n    {\n";
    os << "        auto it = tables().by_value.find(value);\n";
    os << "        return it == tables().by_value.end() ? nullptr : it->second;\n    }\n\n";
    os << "    static const " << T << "* try_from_name(std::string_view name)\n    {\n";
    os << "        auto it = tables().by_name.find(std::string(name));\n";
    os << "        return it == tables().by_name.end() ? nullptr : it->second;\n    }\n\n";
    os << "private:\n";
    os << "    struct table_set\n    {\n";
    os << "        std::vector<const " << T << "*> all;\n";
    os << "        std::unordered_map<std::int64_t, const " << T << "*> by_value;\n";
    os << "        std::unordered_map<std::string, const " << T << "*> by_name;\n";
    os << "    };\n\n";
    os << "    // Built once; keys are re-checked here because constants may be computed.\n";
    os << "    static const table_set& tables()\n    {\n";
    os << "        static const table_set built = [] {\n";
    os << "            table_set s;\n";
    if(!t.constants().empty()){
        os << "            for (const " << T << "* c : {";
        for(size_t i=0;i<t.constants().size(); ++i) os << (i ? ", " : "") << "&" << T << "::" << t.constants()[i];
        os << "}) {\n";
        os << "                if (!s.by_value.emplace(static_cast<std::int64_t>(c->Value), c).second)\n";
        os << "                    throw std::logic_error(\"duplicate value in enumeration " << qual << "\");\n";
        os << "                if (!s.by_name.emplace(std::string(c->Name), c).second)\n";
        os << "                    throw std::logic_error(\"duplicate name in enumeration " << qual << "\");\n";
        os << "                s.all.push_back(c);\n";
        os << "            }\n";
    }
    os << "            return s;\n";
    os << "        }();\n";
    os << "        return built;\n    }\n";
    os << "};\n\n";
    close_ns(os, ns);
    return os.str();
}

} // namespace eqgen
