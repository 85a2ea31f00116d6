// In-class opt-in for generated equality and enumeration code.
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace eqgen {

// Raised by from_value/from_name when no constant matches.
struct lookup_error : std::out_of_range {
    explicit lookup_error(const std::string& msg) : std::out_of_range(msg) {}
};

} // namespace eqgen

// Grants the generated equals_core/hash_core access to private members and companions.
// Place inside the class body of every partial value object.
#define EQGEN_CONTRACT_HOOKS(Type)                            \
    friend bool equals_core(const Type& a, const Type& b);    \
    friend std::uint64_t hash_core(const Type& v)

// Grants the generated <Type>Enumeration table access to the constants.
#define EQGEN_ENUMERATION_HOOKS(Type) friend struct Type##Enumeration
