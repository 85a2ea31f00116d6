// Member classifier: reads declaration forms into the declaration model
#pragma once
#include "eqgen/declaration.hpp"
#include "eqgen/diagnostics.hpp"
#include "eqgen/edn.hpp"
#include <optional>
#include <vector>

namespace eqgen {

// Top-level forms of a (module ...) list. A module of the wrong shape is reported as ED001.
std::vector<node_ptr> module_forms(const node_ptr& module, Reporter& rep);

// Reads one (class ...) or (enumeration ...) form. Parts that cannot be read are
// reported as ED001; nullopt when nothing usable remains (unknown head, no :name).
std::optional<Declaration> classify_declaration(const node_ptr& form, Reporter& rep);

// Type forms: scalar symbols, string, (seq T) and friends, (ref Name), any other symbol.
std::optional<TypeDesc> parse_type_desc(const node_ptr& n);

// Strategy forms: (include :order n), (ignore), (sequence ...), (custom :order n).
std::optional<Strategy> parse_strategy(const node_ptr& n, std::string& err);

} // namespace eqgen
