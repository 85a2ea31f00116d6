// Executable evaluation plan: equality and hash functions built once from a contract
#pragma once
#include "eqgen/contract.hpp"
#include "eqgen/edn.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>

namespace eqgen {

// A value of a contract type: its concrete type name plus member values.
// Missing members read as nil.
struct instance {
    std::string type;
    std::map<std::string, node_ptr> members;
    node_ptr get(const std::string& name) const {
        auto it = members.find(name);
        return it == members.end() ? nullptr : it->second;
    }
};

using CompanionEquals = std::function<bool(const node_ptr&, const node_ptr&)>;
using CompanionHash = std::function<int64_t(const node_ptr&)>;

// Companion callables keyed by companion name (Equals_X / GetHashCode_X).
struct CompanionTable {
    std::map<std::string, CompanionEquals> equals;
    std::map<std::string, CompanionHash> hashes;
    CompanionTable& define_equals(const std::string& name, CompanionEquals fn) { equals[name] = std::move(fn); return *this; }
    CompanionTable& define_hash(const std::string& name, CompanionHash fn) { hashes[name] = std::move(fn); return *this; }
};

struct link_error : std::runtime_error {
    explicit link_error(const std::string& msg) : std::runtime_error(msg) {}
};

struct EqualityFunctions {
    std::function<bool(const instance&, const instance&)> equals;
    std::function<uint64_t(const instance&)> hash;
};

// Throws link_error when a custom member's companion is not in `companions`.
EqualityFunctions synthesize(const EqualityContract& contract, const CompanionTable& companions = {});

} // namespace eqgen
