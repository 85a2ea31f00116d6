#include "eqgen/diagnostics.hpp"
#include <sstream>

namespace eqgen {

const std::vector<CodeInfo>& all_codes(){
    static const std::vector<CodeInfo> table = {
        {codes::NotExtensible, "not-extensible", Severity::Error},
        {codes::MissingStrategy, "missing-strategy", Severity::Warning},
        {codes::MissingCompanionEquals, "missing-companion-equals", Severity::Error},
        {codes::MissingCompanionHash, "missing-companion-hash", Severity::Error},
        {codes::MultipleStrategies, "multiple-strategies", Severity::Error},
        {codes::SequenceOnNonSequence, "sequence-on-non-sequence", Severity::Error},
        {codes::StrategyOutsideContract, "strategy-outside-contract", Severity::Error},
        {codes::ContractWithoutBaseShape, "contract-without-base-shape", Severity::Error},
        {codes::DuplicateCompanionNames, "duplicate-companion-names", Severity::Error},
        {codes::MutableProperty, "mutable-property", Severity::Warning},
        {codes::MutableField, "mutable-field", Severity::Warning},
        {codes::ExtraMemberInWrapper, "extra-member-in-wrapper", Severity::Warning},
        {codes::DuplicateOrder, "duplicate-order", Severity::Warning},
        {codes::UnnecessaryContractMarker, "unnecessary-contract-marker", Severity::Warning},
        {codes::StrategyOnUnsupportedMember, "strategy-on-unsupported-member", Severity::Error},
        {codes::DuplicateEnumValue, "duplicate-value", Severity::Error},
        {codes::DuplicateEnumName, "duplicate-name", Severity::Error},
        {codes::EnumNotExtensible, "not-extensible", Severity::Error},
        {codes::MalformedDeclaration, "malformed-declaration", Severity::Error},
    };
    return table;
}

const CodeInfo* lookup_code(std::string_view code){
    for(auto &c : all_codes()) if(code == c.code) return &c;
    return nullptr;
}

Diagnostic& Reporter::emit(const char* code, std::string message, std::string hint, int line, int col){
    const CodeInfo* info = lookup_code(code);
    Severity sev = info ? info->severity : Severity::Error;
    Diagnostic d{code, sev, std::move(message), std::move(hint), line, col, {}, {}, declaration};
    auto &bucket = sev==Severity::Error ? sink->errors : sink->warnings;
    if(sev==Severity::Error) sink->success=false;
    bucket.push_back(std::move(d));
    return bucket.back();
}

std::string format_diagnostic(const Diagnostic& d){
    std::ostringstream os;
    os << (d.severity==Severity::Error ? "error" : "warning");
    if(!d.code.empty()) os << "[" << d.code << "]";
    os << ": " << d.message;
    if(d.line>=0) os << " (line " << d.line << ":" << d.col << ")";
    os << "\n";
    if(!d.hint.empty()) os << "  hint: " << d.hint << "\n";
    for(auto &n : d.notes){
        os << "  note: " << n.message;
        if(n.line>=0) os << " (line " << n.line << ":" << n.col << ")";
        os << "\n";
    }
    for(auto &f : d.fixes) os << "  fix: " << f.key << " - " << f.title << "\n";
    return os.str();
}

std::string format_diagnostics(const CheckResult& r){
    std::string out;
    for(auto &e : r.errors) out += format_diagnostic(e);
    for(auto &w : r.warnings) out += format_diagnostic(w);
    return out;
}

void merge_into(CheckResult& a, const CheckResult& b){
    a.success = a.success && b.success;
    a.errors.insert(a.errors.end(), b.errors.begin(), b.errors.end());
    a.warnings.insert(a.warnings.end(), b.warnings.begin(), b.warnings.end());
}

} // namespace eqgen
