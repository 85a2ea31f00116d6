// Structural equality + hash over EDN values. Lists/vectors compare positionally,
// sets/maps as unordered collections; metadata (positions) never participates.
#include "eqgen/edn.hpp"
#include "eqgen/runtime/equality.hpp"
#include <cstring>
#include <vector>

namespace eqgen {

static bool equal_impl(const node_ptr& a, const node_ptr& b) {
	if (a.get() == b.get()) return true;
	if (!a || !b) return is_nil(a) && is_nil(b);
	if (a->data.index() != b->data.index()) return false;

	struct Visitor {
		const node_ptr& a; const node_ptr& b;
		static bool same_seq(const std::vector<node_ptr>& le, const std::vector<node_ptr>& re) {
			if (le.size() != re.size()) return false;
			for (size_t i = 0; i < le.size(); ++i) if (!equal_impl(le[i], re[i])) return false;
			return true;
		}
		bool operator()(std::monostate) const { return true; }
		bool operator()(bool) const { return std::get<bool>(a->data) == std::get<bool>(b->data); }
		bool operator()(int64_t) const { return std::get<int64_t>(a->data) == std::get<int64_t>(b->data); }
		bool operator()(double) const { return std::get<double>(a->data) == std::get<double>(b->data); }
		bool operator()(const std::string&) const { return std::get<std::string>(a->data) == std::get<std::string>(b->data); }
		bool operator()(const keyword&) const { return std::get<keyword>(a->data).name == std::get<keyword>(b->data).name; }
		bool operator()(const symbol&) const { return std::get<symbol>(a->data).name == std::get<symbol>(b->data).name; }
		bool operator()(const list&) const { return same_seq(std::get<list>(a->data).elems, std::get<list>(b->data).elems); }
		bool operator()(const vector_t&) const { return same_seq(std::get<vector_t>(a->data).elems, std::get<vector_t>(b->data).elems); }
		bool operator()(const set&) const {
			const auto& le = std::get<set>(a->data).elems;
			const auto& re = std::get<set>(b->data).elems;
			if (le.size() != re.size()) return false;
			std::vector<bool> used(re.size());
			for (const auto& e : le) {
				bool found = false;
				for (size_t j = 0; j < re.size(); ++j) {
					if (!used[j] && equal_impl(e, re[j])) { used[j] = true; found = true; break; }
				}
				if (!found) return false;
			}
			return true;
		}
		bool operator()(const map&) const {
			const auto& lm = std::get<map>(a->data).entries;
			const auto& rm = std::get<map>(b->data).entries;
			if (lm.size() != rm.size()) return false;
			std::vector<bool> used(rm.size());
			for (const auto& kv : lm) {
				bool found = false;
				for (size_t j = 0; j < rm.size(); ++j) {
					if (!used[j] && equal_impl(kv.first, rm[j].first) && equal_impl(kv.second, rm[j].second)) { used[j] = true; found = true; break; }
				}
				if (!found) return false;
			}
			return true;
		}
	};

	return std::visit(Visitor{a, b}, a->data);
}

bool equal(const node_ptr& a, const node_ptr& b) { return equal_impl(a, b); }

// Unordered collections fold element hashes with a commutative sum so that
// any permutation of equal contents hashes identically.
uint64_t value_hash(const node_ptr& n) {
	using rt::fnv1a;
	if (is_nil(n)) return 0x6e696cull;
	rt::hash_builder h(static_cast<uint64_t>(n->data.index()) + 1);
	struct Visitor {
		rt::hash_builder& h;
		void operator()(std::monostate) const {}
		void operator()(bool b) const { h.add(b ? 1u : 0u); }
		void operator()(int64_t i) const { h.add(static_cast<uint64_t>(i)); }
		void operator()(double d) const {
			if (d == 0.0) d = 0.0; // -0.0 == 0.0
			uint64_t bits = 0; std::memcpy(&bits, &d, sizeof(bits)); h.add(bits);
		}
		void operator()(const std::string& s) const { h.add(fnv1a(s)); }
		void operator()(const keyword& k) const { h.add(fnv1a(k.name)); }
		void operator()(const symbol& s) const { h.add(fnv1a(s.name)); }
		void operator()(const list& l) const { for (auto& e : l.elems) h.add(value_hash(e)); }
		void operator()(const vector_t& v) const { for (auto& e : v.elems) h.add(value_hash(e)); }
		void operator()(const set& s) const {
			uint64_t sum = 0; for (auto& e : s.elems) sum += rt::mix(value_hash(e));
			h.add(s.elems.size()); h.add(sum);
		}
		void operator()(const map& m) const {
			uint64_t sum = 0;
			for (auto& kv : m.entries) { rt::hash_builder p(value_hash(kv.first)); p.add(value_hash(kv.second)); sum += rt::mix(p.finish()); }
			h.add(m.entries.size()); h.add(sum);
		}
	};
	std::visit(Visitor{h}, n->data);
	return h.finish();
}

} // namespace eqgen
