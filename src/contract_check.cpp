#include "eqgen/contract.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <unordered_map>

namespace eqgen {

std::string clean_name(std::string_view name){
    std::string_view rest = name;
    if(!rest.empty() && rest[0]=='_') rest.remove_prefix(1);
    else if(rest.substr(0,2)=="m_") rest.remove_prefix(2);
    if(rest.empty() || std::isdigit(static_cast<unsigned char>(rest[0]))) return std::string(name);
    std::string out(rest);
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

static bool has_static_fn(const HostDecl& d, const std::string& name){
    return std::any_of(d.functions.begin(), d.functions.end(), [&](const CompanionFn& f){ return f.is_static && f.name==name; });
}
static const CompanionFn* find_fn(const HostDecl& d, const std::string& name){
    for(auto &f : d.functions) if(f.name==name) return &f;
    return nullptr;
}

static int ann_line(const Member& m){ return m.strategies.empty() ? m.line : m.strategies.front().line; }
static int ann_col(const Member& m){ return m.strategies.empty() ? m.col : m.strategies.front().col; }

ContractResult ContractChecker::check(const HostDecl& d) const {
    ContractResult r;
    Reporter rep{&r, d.qualified_name(), fix_hints_};
    if(d.base==BaseShape::Wrapper){ check_wrapper(d, rep, r); return r; }
    if(!d.contract_marker){ check_unmarked(d, rep); return r; }
    if(d.base!=BaseShape::ValueObject){
        auto &e = rep.emit(codes::ContractWithoutBaseShape,
            "class '"+d.name+"' is marked value-object but does not derive from value-object",
            "add :base value-object", d.marker_line>=0?d.marker_line:d.line, d.marker_line>=0?d.marker_col:d.col);
        rep.fix(e, "add-base", "Derive '"+d.name+"' from value-object");
        return r;
    }
    check_members(d, rep, r);
    return r;
}

void ContractChecker::check_wrapper(const HostDecl& d, Reporter& rep, ContractResult& r) const {
    if(d.contract_marker){
        auto &w = rep.emit(codes::UnnecessaryContractMarker,
            "class '"+d.name+"' is a single-value wrapper; the value-object marker is unnecessary and ignored",
            "remove value-object from :attrs", d.marker_line, d.marker_col);
        rep.fix(w, "remove-marker", "Remove the value-object marker");
    }
    for(auto &m : d.members){
        if(m.kind==MemberKind::Method || m.is_static) continue;
        auto &w = rep.emit(codes::ExtraMemberInWrapper,
            "wrapper '"+d.name+"' should not declare additional "+kind_name(m.kind)+" '"+m.name+"'; only 'Value' is allowed",
            "remove the member or derive from value-object", m.line, m.col);
        rep.fix(w, "remove-member", "Remove '"+m.name+"'");
    }
    if(!r.success) return;
    Member value; value.name="Value"; value.kind=MemberKind::Property; value.type=d.wrapped; value.setter=Setter::None;
    EqualityContract c; c.type_name=d.name; c.ns=d.ns; c.wrapper=true;
    c.entries.push_back(ContractEntry{std::move(value), IncludeStrategy{}});
    r.contract = std::move(c);
}

void ContractChecker::check_unmarked(const HostDecl& d, Reporter& rep) const {
    for(auto &m : d.members){
        if(m.kind==MemberKind::Method) continue;
        for(auto &a : m.strategies){
            auto &e = rep.emit(codes::StrategyOutsideContract,
                std::string("the ")+kind_name(m.kind)+" '"+m.name+"' has equality strategy '"+strategy_name(a.strategy)+"' but class '"+d.name+"' is not marked value-object",
                "add :attrs [value-object] or remove the strategy", a.line, a.col);
            rep.fix(e, "add-marker", "Mark '"+d.name+"' as value-object");
            rep.fix(e, "remove-strategy", "Remove the equality strategy");
        }
    }
}

void ContractChecker::check_members(const HostDecl& d, Reporter& rep, ContractResult& r) const {
    if(!d.partial){
        auto &e = rep.emit(codes::NotExtensible, "value object '"+d.name+"' must be declared partial to enable generation", "add :partial true", d.line, d.col);
        rep.fix(e, "make-partial", "Make '"+d.name+"' partial");
    }
    std::vector<ContractEntry> entries;
    std::unordered_map<std::string,const Member*> suffixes;   // cleaned companion suffix -> first custom member
    std::map<int,std::vector<const Member*>> explicit_orders;
    for(auto &m : d.members){
        if(m.is_static) continue;
        const std::string kind = kind_name(m.kind);
        if(!m.eligible()){
            if(m.strategies.empty()) continue;
            auto &e = rep.emit(codes::StrategyOnUnsupportedMember,
                "the equality strategy on '"+m.name+"' is invalid; only fields and auto properties are supported",
                m.kind==MemberKind::Method ? "remove the strategy from the method" : "remove the strategy or make the property an auto property",
                ann_line(m), ann_col(m));
            rep.fix(e, "remove-strategy", "Remove the equality strategy");
            continue;
        }
        bool ignored = m.strategies.size()==1 && std::holds_alternative<IgnoreStrategy>(m.strategies[0].strategy);
        if(m.strategies.empty()){
            auto &w = rep.emit(codes::MissingStrategy,
                "the "+kind+" '"+m.name+"' in value object '"+d.name+"' should have an equality strategy",
                "annotate with (include), (ignore), (sequence) or (custom)", m.line, m.col);
            rep.fix(w, "add-include", "Add (include) to '"+m.name+"'");
            rep.fix(w, "add-ignore", "Add (ignore) to '"+m.name+"'");
            if(m.type.iterable()) rep.fix(w, "add-sequence", "Add (sequence) to '"+m.name+"'");
        } else if(m.strategies.size()>1){
            auto &e = rep.emit(codes::MultipleStrategies,
                "the "+kind+" '"+m.name+"' in value object '"+d.name+"' has multiple equality strategies; only one is allowed",
                "keep exactly one of (include), (ignore), (sequence), (custom)", ann_line(m), ann_col(m));
            std::vector<std::string> kinds;
            for(auto &a : m.strategies){
                std::string k = strategy_name(a.strategy);
                e.notes.push_back(Note{"("+k+") declared here", a.line, a.col});
                if(std::find(kinds.begin(), kinds.end(), k)==kinds.end()) kinds.push_back(k);
            }
            for(auto &k : kinds) rep.fix(e, "keep-only-"+k, "Keep only ("+k+")");
        } else if(!ignored){
            const auto &a = m.strategies[0];
            bool usable = true;
            if(std::holds_alternative<CustomStrategy>(a.strategy)){
                std::string suffix = clean_name(m.name);
                std::string eqName = "Equals_"+suffix, hashName = "GetHashCode_"+suffix;
                std::string T = cpp_spelling(m.type);
                std::string eqSig = "static bool "+eqName+"(const "+T+"& value, const "+T+"& other)";
                std::string hashSig = "static int "+hashName+"(const "+T+"& value)";
                bool haveEq = has_static_fn(d, eqName), haveHash = has_static_fn(d, hashName);
                if(!haveEq){
                    auto &e = rep.emit(codes::MissingCompanionEquals,
                        "the "+kind+" '"+m.name+"' has (custom) but the required static function '"+eqName+"' is missing",
                        "declare "+eqSig, m.line, m.col);
                    if(auto* f = find_fn(d, eqName)) e.notes.push_back(Note{"'"+eqName+"' is declared but not static", f->line, f->col});
                    e.notes.push_back(Note{"expected: "+eqSig, -1, -1});
                    rep.fix(e, "generate-companions", "Generate companion stubs for '"+m.name+"'");
                    usable = false;
                }
                if(!haveHash){
                    auto &e = rep.emit(codes::MissingCompanionHash,
                        "the "+kind+" '"+m.name+"' has (custom) but the required static function '"+hashName+"' is missing",
                        "declare "+hashSig, m.line, m.col);
                    if(auto* f = find_fn(d, hashName)) e.notes.push_back(Note{"'"+hashName+"' is declared but not static", f->line, f->col});
                    e.notes.push_back(Note{"expected: "+hashSig, -1, -1});
                    rep.fix(e, "generate-companions", "Generate companion stubs for '"+m.name+"'");
                    usable = false;
                }
                auto it = suffixes.find(suffix);
                if(it!=suffixes.end()){
                    auto &e = rep.emit(codes::DuplicateCompanionNames,
                        "the members '"+it->second->name+"' and '"+m.name+"' would generate the same companion names '"+eqName+"' and '"+hashName+"'",
                        "rename one of them", m.line, m.col);
                    e.notes.push_back(Note{"'"+it->second->name+"' declared here", it->second->line, it->second->col});
                    usable = false;
                } else suffixes.emplace(suffix, &m);
            } else if(std::holds_alternative<SequenceStrategy>(a.strategy) && !m.type.iterable()){
                auto &e = rep.emit(codes::SequenceOnNonSequence,
                    "the "+kind+" '"+m.name+"' has (sequence) but its type '"+to_string(m.type)+"' is not a sequence",
                    "use (include) instead", a.line, a.col);
                rep.fix(e, "replace-with-include", "Replace (sequence) with (include)");
                usable = false;
            }
            if(has_explicit_order(a.strategy)) explicit_orders[strategy_order(a.strategy)].push_back(&m);
            if(usable) entries.push_back(ContractEntry{m, a.strategy});
        }
        if(ignored) continue;
        if(m.kind==MemberKind::Field && !m.readonly){
            auto &w = rep.emit(codes::MutableField,
                "the field '"+m.name+"' in value object '"+d.name+"' must be declared readonly to enforce immutability",
                "add :readonly true", m.line, m.col);
            rep.fix(w, "make-readonly", "Make '"+m.name+"' readonly");
        } else if(m.kind==MemberKind::Property && m.setter==Setter::Set){
            auto &w = rep.emit(codes::MutableProperty,
                "the property '"+m.name+"' in value object '"+d.name+"' must be get-only or init-only to enforce immutability",
                "use :setter init or :setter none", m.line, m.col);
            rep.fix(w, "make-init-only", "Make '"+m.name+"' init-only");
        }
    }
    for(auto &kv : explicit_orders){
        auto &ms = kv.second;
        if(ms.size()<2) continue;
        std::string names;
        for(size_t i=0;i<ms.size(); ++i){ if(i) names += ", "; names += "'"+ms[i]->name+"'"; }
        auto &w = rep.emit(codes::DuplicateOrder,
            "members "+names+" in value object '"+d.name+"' share order "+std::to_string(kv.first)+"; evaluation falls back to declaration order",
            "give each member a distinct :order", ann_line(*ms[0]), ann_col(*ms[0]));
        for(size_t i=1;i<ms.size(); ++i) w.notes.push_back(Note{"'"+ms[i]->name+"' also uses order "+std::to_string(kv.first), ann_line(*ms[i]), ann_col(*ms[i])});
    }
    if(!r.success) return;
    std::stable_sort(entries.begin(), entries.end(), [](const ContractEntry& a, const ContractEntry& b){
        int oa = strategy_order(a.strategy), ob = strategy_order(b.strategy);
        return oa != ob ? oa < ob : a.member.position < b.member.position;
    });
    EqualityContract c; c.type_name=d.name; c.ns=d.ns; c.entries=std::move(entries);
    r.contract = std::move(c);
}

} // namespace eqgen
