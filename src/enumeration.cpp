#include "eqgen/enumeration.hpp"

namespace eqgen {

EnumerationTable::EnumerationTable(std::string type_name, std::string ns, std::vector<EnumerationEntry> entries,
                                   std::vector<std::string> constants)
    : type_name_(std::move(type_name)), ns_(std::move(ns)), entries_(std::move(entries)), constants_(std::move(constants)) {
    for(size_t i=0;i<entries_.size(); ++i){
        by_value_.emplace(entries_[i].value, i);
        by_name_.emplace(entries_[i].name, i);
    }
}

const EnumerationEntry& EnumerationTable::from_value(int64_t value) const {
    auto it = by_value_.find(value);
    if(it==by_value_.end()) throw lookup_error("no " + qualified_name() + " constant with value " + std::to_string(value));
    return entries_[it->second];
}

const EnumerationEntry& EnumerationTable::from_name(const std::string& name) const {
    auto it = by_name_.find(name);
    if(it==by_name_.end()) throw lookup_error("no " + qualified_name() + " constant named '" + name + "'");
    return entries_[it->second];
}

std::optional<EnumerationEntry> EnumerationTable::try_from_value(int64_t value) const {
    auto it = by_value_.find(value);
    if(it==by_value_.end()) return std::nullopt;
    return entries_[it->second];
}

std::optional<EnumerationEntry> EnumerationTable::try_from_name(const std::string& name) const {
    auto it = by_name_.find(name);
    if(it==by_name_.end()) return std::nullopt;
    return entries_[it->second];
}

EnumerationResult EnumerationChecker::check(const EnumDecl& d) const {
    EnumerationResult r;
    Reporter rep{&r, d.qualified_name(), fix_hints_};
    if(!d.partial){
        auto &e = rep.emit(codes::EnumNotExtensible, "enumeration '"+d.name+"' must be declared partial to enable generation", "add :partial true", d.line, d.col);
        rep.fix(e, "make-partial", "Make '"+d.name+"' partial");
    }
    std::unordered_map<int64_t,const EnumConstant*> values;
    std::unordered_map<std::string,const EnumConstant*> names;
    std::vector<EnumerationEntry> entries;
    std::vector<std::string> constants;
    for(auto &c : d.constants){
        constants.push_back(c.constant);
        if(!c.literal()) continue;
        auto [vit, vnew] = values.emplace(*c.value, &c);
        if(!vnew){
            auto &e = rep.emit(codes::DuplicateEnumValue,
                "enumeration '"+d.name+"' has duplicate value "+std::to_string(*c.value)+" on '"+c.constant+"' and '"+vit->second->constant+"'",
                "give each constant a unique value", c.line, c.col);
            e.notes.push_back(Note{"'"+vit->second->constant+"' first uses value "+std::to_string(*c.value), vit->second->line, vit->second->col});
        }
        auto [nit, nnew] = names.emplace(*c.name, &c);
        if(!nnew){
            auto &e = rep.emit(codes::DuplicateEnumName,
                "enumeration '"+d.name+"' has duplicate name \""+*c.name+"\" on '"+c.constant+"' and '"+nit->second->constant+"'",
                "give each constant a unique name", c.line, c.col);
            e.notes.push_back(Note{"'"+nit->second->constant+"' first uses name \""+*c.name+"\"", nit->second->line, nit->second->col});
        }
        if(vnew && nnew) entries.push_back(EnumerationEntry{d.qualified_name(), c.constant, *c.value, *c.name, c.position});
    }
    if(r.success) r.table = EnumerationTable(d.name, d.ns, std::move(entries), std::move(constants));
    return r;
}

} // namespace eqgen
