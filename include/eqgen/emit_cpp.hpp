// C++ source emission for equality contracts and enumeration tables
#pragma once
#include "eqgen/contract.hpp"
#include "eqgen/enumeration.hpp"
#include <string>

namespace eqgen {

// Includes needed by generated sections; emitted once at the top of an output file.
std::string emit_prelude();

// equals_core/hash_core, operator==/!= and a std::hash specialization for the contract type.
// Identical contracts produce byte-identical text.
std::string emit_equality(const EqualityContract& c);

// <Name>Enumeration with get_all/from_value/from_name/try_from_value/try_from_name.
std::string emit_enumeration(const EnumerationTable& t);

// "app.domain" and "app::domain" both spell app::domain.
std::string cpp_namespace(const std::string& ns);

} // namespace eqgen
