#pragma once
// Test-only helpers: scoped environment variables and declaration readers.

#include <optional>
#include <string>
#include <vector>
#include "eqgen/classify.hpp"
#include "eqgen/diagnostics.hpp"

// Sets NAME=VALUE (or unsets it when value is nullptr) and restores the previous state on exit.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
private:
    std::string name_;
    std::optional<std::string> previous_;
};

size_t count_code(const std::vector<eqgen::Diagnostic>& ds, const std::string& code);
const eqgen::Diagnostic* find_code(const std::vector<eqgen::Diagnostic>& ds, const std::string& code);
bool has_fix(const eqgen::Diagnostic& d, const std::string& key);

// Parse and classify a single (class ...) / (enumeration ...) form; fails the test if it does not classify.
eqgen::HostDecl read_host(const std::string& src);
eqgen::EnumDecl read_enum(const std::string& src);
