// Module driver: classify, check and emit every declaration, with memo cache and workers
#pragma once
#include "eqgen/contract.hpp"
#include "eqgen/diagnostics.hpp"
#include "eqgen/edn.hpp"
#include "eqgen/enumeration.hpp"
#include "eqgen/options.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace eqgen {

struct DeclarationOutput {
    std::string name;                         // qualified name; empty when the form had none
    CheckResult diagnostics;                  // classifier + checker diagnostics for this form
    std::optional<EqualityContract> contract;
    std::optional<EnumerationTable> table;
    std::string generated;                    // emitted C++ section; empty unless valid
};

struct CompileResult : CheckResult {
    std::vector<DeclarationOutput> declarations;   // declaration order
    // Prelude plus every generated section, in declaration order.
    std::string source() const;
};

// Structural hash of a form including line/col of every node.
uint64_t fingerprint(const node_ptr& form);

class ContractCache {
public:
    std::shared_ptr<const DeclarationOutput> find(uint64_t key) const;
    void store(uint64_t key, std::shared_ptr<const DeclarationOutput> out);
    size_t size() const;
    size_t hits() const { return hits_.load(); }
    size_t misses() const { return misses_.load(); }
    void clear();
private:
    mutable std::mutex mu_;
    std::unordered_map<uint64_t, std::shared_ptr<const DeclarationOutput>> entries_;
    mutable std::atomic<size_t> hits_{0};
    mutable std::atomic<size_t> misses_{0};
};

class Compiler {
public:
    explicit Compiler(Options opts = detect_options()): opts_(opts) {}
    CompileResult compile(const node_ptr& module);
    // Parses then compiles; parse_error propagates.
    CompileResult compile_source(std::string_view text);
    const Options& options() const { return opts_; }
    ContractCache& cache() { return cache_; }
private:
    Options opts_;
    ContractCache cache_;
    std::shared_ptr<const DeclarationOutput> compile_one(const node_ptr& form);
};

} // namespace eqgen
