// Diagnostics shared by the classifier, the contract checker and the enumeration checker
#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace eqgen {

enum class Severity { Error, Warning };

struct Note { std::string message; int line=-1; int col=-1; };
// Machine-readable repair hint; `key` is stable (add-include, make-partial, ...).
struct Fix { std::string key; std::string title; };

struct Diagnostic {
    std::string code; Severity severity=Severity::Error; std::string message; std::string hint;
    int line=-1; int col=-1; std::vector<Note> notes; std::vector<Fix> fixes; std::string declaration;
};

struct CheckResult { bool success=true; std::vector<Diagnostic> errors; std::vector<Diagnostic> warnings; };

namespace codes {
inline constexpr const char* NotExtensible = "EQ001";
inline constexpr const char* MissingStrategy = "EQ002";
inline constexpr const char* MissingCompanionEquals = "EQ003";
inline constexpr const char* MissingCompanionHash = "EQ004";
inline constexpr const char* MultipleStrategies = "EQ005";
inline constexpr const char* SequenceOnNonSequence = "EQ006";
inline constexpr const char* StrategyOutsideContract = "EQ007";
inline constexpr const char* ContractWithoutBaseShape = "EQ008";
inline constexpr const char* DuplicateCompanionNames = "EQ009";
inline constexpr const char* MutableProperty = "EQ010";
inline constexpr const char* MutableField = "EQ011";
inline constexpr const char* ExtraMemberInWrapper = "EQ012";
inline constexpr const char* DuplicateOrder = "EQ013";
inline constexpr const char* UnnecessaryContractMarker = "EQ014";
inline constexpr const char* StrategyOnUnsupportedMember = "EQ015";
inline constexpr const char* DuplicateEnumValue = "EN001";
inline constexpr const char* DuplicateEnumName = "EN002";
inline constexpr const char* EnumNotExtensible = "EN003";
inline constexpr const char* MalformedDeclaration = "ED001";
} // namespace codes

struct CodeInfo { const char* code; const char* name; Severity severity; };
// nullptr for unknown codes
const CodeInfo* lookup_code(std::string_view code);
const std::vector<CodeInfo>& all_codes();

// Central reporter: severity comes from the code table, fixes are dropped when hints are off.
struct Reporter {
    CheckResult* sink=nullptr;
    std::string declaration;
    bool fix_hints=true;
    Diagnostic& emit(const char* code, std::string message, std::string hint, int line, int col);
    void fix(Diagnostic& d, std::string key, std::string title) const { if(fix_hints) d.fixes.push_back(Fix{std::move(key),std::move(title)}); }
};

// Text rendering: error[EQ003]: message (line L:C) followed by hint/note lines.
std::string format_diagnostic(const Diagnostic& d);
std::string format_diagnostics(const CheckResult& r);

// Append b's diagnostics to a (success is the conjunction).
void merge_into(CheckResult& a, const CheckResult& b);

} // namespace eqgen
