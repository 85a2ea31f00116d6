// Equality contracts: validation of host declarations into ordered (member, strategy) plans
#pragma once
#include "eqgen/declaration.hpp"
#include "eqgen/diagnostics.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eqgen {

// Companion suffix for a member name: strips one leading "m_" or "_", uppercases the
// first character. Falls back to the name unchanged when the rest is empty or starts
// with a digit.
std::string clean_name(std::string_view name);
inline std::string companion_equals_name(std::string_view member) { return "Equals_" + clean_name(member); }
inline std::string companion_hash_name(std::string_view member) { return "GetHashCode_" + clean_name(member); }

struct ContractEntry { Member member; Strategy strategy; };

struct EqualityContract {
    std::string type_name;
    std::string ns;
    bool wrapper = false;
    std::vector<ContractEntry> entries;   // sorted by (order, declaration position)
    std::string qualified_name() const { return ns.empty() ? type_name : ns + "::" + type_name; }
};

struct ContractResult : CheckResult { std::optional<EqualityContract> contract; };

class ContractChecker {
public:
    explicit ContractChecker(bool fix_hints=true): fix_hints_(fix_hints) {}
    // Reports every rule violation in one pass. The contract is set only when no errors
    // were found and the declaration opts into equality (marker or wrapper shape).
    ContractResult check(const HostDecl& d) const;
private:
    bool fix_hints_;
    void check_wrapper(const HostDecl& d, Reporter& rep, ContractResult& r) const;
    void check_members(const HostDecl& d, Reporter& rep, ContractResult& r) const;
    void check_unmarked(const HostDecl& d, Reporter& rep) const;
};

} // namespace eqgen
