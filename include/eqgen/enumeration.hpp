// Enumeration tables: duplicate-free lookups over closed sets of named constants
#pragma once
#include "eqgen/declaration.hpp"
#include "eqgen/diagnostics.hpp"
#include "eqgen/runtime/hooks.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace eqgen {

struct EnumerationEntry {
    std::string owner;      // qualified enumeration type name
    std::string constant;   // declared constant identifier
    int64_t value = 0;
    std::string name;
    size_t position = 0;
};

class EnumerationTable {
public:
    EnumerationTable() = default;
    EnumerationTable(std::string type_name, std::string ns, std::vector<EnumerationEntry> entries,
                     std::vector<std::string> constants);

    const std::string& type_name() const { return type_name_; }
    const std::string& ns() const { return ns_; }
    std::string qualified_name() const { return ns_.empty() ? type_name_ : ns_ + "::" + type_name_; }

    // Literal constants in declaration order.
    const std::vector<EnumerationEntry>& get_all() const { return entries_; }
    // Every declared constant identifier in declaration order, literal or not.
    const std::vector<std::string>& constants() const { return constants_; }

    const EnumerationEntry& from_value(int64_t value) const;          // throws lookup_error
    const EnumerationEntry& from_name(const std::string& name) const; // throws lookup_error
    std::optional<EnumerationEntry> try_from_value(int64_t value) const;
    std::optional<EnumerationEntry> try_from_name(const std::string& name) const;

private:
    std::string type_name_;
    std::string ns_;
    std::vector<EnumerationEntry> entries_;
    std::vector<std::string> constants_;
    std::unordered_map<int64_t, size_t> by_value_;
    std::unordered_map<std::string, size_t> by_name_;
};

struct EnumerationResult : CheckResult { std::optional<EnumerationTable> table; };

class EnumerationChecker {
public:
    explicit EnumerationChecker(bool fix_hints=true): fix_hints_(fix_hints) {}
    // Duplicate values/names among literal constants are errors (one per later duplicate);
    // constants with non-literal arguments are left to the run-time check of generated code.
    EnumerationResult check(const EnumDecl& d) const;
private:
    bool fix_hints_;
};

} // namespace eqgen
