#include "eqgen/synthesize.hpp"
#include "eqgen/runtime/equality.hpp"
#include <memory>
#include <vector>

namespace eqgen {

namespace {

struct Step {
    enum class Op { Include, Custom, Sequence } op = Op::Include;
    std::string member;
    bool order_matters = true;
    bool deep = true;
    CompanionEquals eq;
    CompanionHash hash;
};

using ElemEq = bool (*)(const node_ptr&, const node_ptr&);
using ElemHash = uint64_t (*)(const node_ptr&);

bool identity_equal(const node_ptr& a, const node_ptr& b) { return a.get() == b.get(); }
uint64_t identity_hash(const node_ptr& a) { return static_cast<uint64_t>(std::hash<const void*>{}(a.get())); }
bool deep_equal(const node_ptr& a, const node_ptr& b) { return equal(a, b); }
uint64_t deep_hash(const node_ptr& a) { return value_hash(a); }

// nil is an absent sequence; a value that is not a collection compares structurally.
bool sequence_step_equal(const Step& s, const node_ptr& a, const node_ptr& b) {
    const auto* ea = is_nil(a) ? nullptr : elements(a);
    const auto* eb = is_nil(b) ? nullptr : elements(b);
    if ((!is_nil(a) && !ea) || (!is_nil(b) && !eb)) return equal(a, b);
    ElemEq eq = s.deep ? &deep_equal : &identity_equal;
    ElemHash h = s.deep ? &deep_hash : &identity_hash;
    return rt::sequence_equal(ea, eb, s.order_matters, eq, h);
}

void sequence_step_hash(const Step& s, rt::hash_builder& hb, const node_ptr& v) {
    const auto* ev = is_nil(v) ? nullptr : elements(v);
    if (!is_nil(v) && !ev) { hb.add(value_hash(v)); return; }
    ElemEq eq = s.deep ? &deep_equal : &identity_equal;
    ElemHash h = s.deep ? &deep_hash : &identity_hash;
    rt::add_sequence_hash(hb, ev, s.order_matters, eq, h);
}

struct Plan {
    std::vector<Step> steps;

    bool equals(const instance& a, const instance& b) const {
        if (a.type != b.type) return false;
        for (const auto& s : steps) {
            node_ptr va = a.get(s.member), vb = b.get(s.member);
            bool same = true;
            switch (s.op) {
            case Step::Op::Include: same = equal(va, vb); break;
            case Step::Op::Custom: same = s.eq(va, vb); break;
            case Step::Op::Sequence: same = sequence_step_equal(s, va, vb); break;
            }
            if (!same) return false;
        }
        return true;
    }

    uint64_t hash(const instance& x) const {
        rt::hash_builder hb(rt::fnv1a(x.type));
        for (const auto& s : steps) {
            node_ptr v = x.get(s.member);
            switch (s.op) {
            case Step::Op::Include: hb.add(value_hash(v)); break;
            case Step::Op::Custom: hb.add(static_cast<uint64_t>(s.hash(v))); break;
            case Step::Op::Sequence: sequence_step_hash(s, hb, v); break;
            }
        }
        return hb.finish();
    }
};

} // namespace

EqualityFunctions synthesize(const EqualityContract& contract, const CompanionTable& companions) {
    auto plan = std::make_shared<Plan>();
    for (const auto& e : contract.entries) {
        Step s;
        s.member = e.member.name;
        if (auto* seq = std::get_if<SequenceStrategy>(&e.strategy)) {
            s.op = Step::Op::Sequence;
            s.order_matters = seq->order_matters;
            s.deep = seq->deep;
        } else if (std::holds_alternative<CustomStrategy>(e.strategy)) {
            s.op = Step::Op::Custom;
            std::string eqName = companion_equals_name(e.member.name);
            std::string hashName = companion_hash_name(e.member.name);
            auto ie = companions.equals.find(eqName);
            if (ie == companions.equals.end() || !ie->second)
                throw link_error("no callable bound for '" + eqName + "' (member '" + e.member.name + "' of " + contract.qualified_name() + ")");
            auto ih = companions.hashes.find(hashName);
            if (ih == companions.hashes.end() || !ih->second)
                throw link_error("no callable bound for '" + hashName + "' (member '" + e.member.name + "' of " + contract.qualified_name() + ")");
            s.eq = ie->second;
            s.hash = ih->second;
        } else if (std::holds_alternative<IgnoreStrategy>(e.strategy)) {
            continue;
        }
        plan->steps.push_back(std::move(s));
    }
    std::shared_ptr<const Plan> p = plan;
    return EqualityFunctions{
        [p](const instance& a, const instance& b) { return p->equals(a, b); },
        [p](const instance& x) { return p->hash(x); }};
}

} // namespace eqgen
