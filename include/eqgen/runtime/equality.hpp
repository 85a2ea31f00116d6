// Runtime support shared by generated equality code and the in-process evaluator.
// Header-only: generated sources include this and nothing else from eqgen.
#pragma once
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace eqgen {
namespace rt {

constexpr uint64_t fnv1a(std::string_view s) noexcept {
    uint64_t h = 0xcbf29ce484222325ull;
    for (char c : s) { h ^= static_cast<unsigned char>(c); h *= 0x100000001b3ull; }
    return h;
}

// splitmix64 finalizer
constexpr uint64_t mix(uint64_t x) noexcept {
    x ^= x >> 30; x *= 0xbf58476d1ce4e5b9ull;
    x ^= x >> 27; x *= 0x94d049bb133111ebull;
    x ^= x >> 31;
    return x;
}

class hash_builder {
public:
    explicit hash_builder(uint64_t seed) : h_(mix(seed)) {}
    void add(uint64_t v) { h_ ^= mix(v) + 0x9e3779b97f4a7c15ull + (h_ << 6) + (h_ >> 2); }
    uint64_t finish() const { return mix(h_); }
private:
    uint64_t h_;
};

template <class T> struct is_pointer_like : std::false_type {};
template <class T> struct is_pointer_like<T*> : std::true_type {};
template <class T> struct is_pointer_like<std::shared_ptr<T>> : std::true_type {};
template <class T, class D> struct is_pointer_like<std::unique_ptr<T, D>> : std::true_type {};

template <class P>
const void* raw_address(const P& p) {
    if constexpr (std::is_pointer_v<P>) return static_cast<const void*>(p);
    else return static_cast<const void*>(p.get());
}

// Default hash for a member value. Strings, integers and floats hash the same
// on every platform; everything else defers to std::hash<T>.
template <class T>
uint64_t hash_value(const T& v) {
    if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        return fnv1a(std::string_view(v));
    } else if constexpr (std::is_integral_v<T> || std::is_enum_v<T>) {
        return static_cast<uint64_t>(v);
    } else if constexpr (std::is_floating_point_v<T>) {
        double d = v == T(0) ? 0.0 : static_cast<double>(v);
        uint64_t bits = 0; std::memcpy(&bits, &d, sizeof(bits));
        return bits;
    } else if constexpr (is_pointer_like<T>::value) {
        return static_cast<uint64_t>(std::hash<const void*>{}(raw_address(v)));
    } else {
        return static_cast<uint64_t>(std::hash<T>{}(v));
    }
}

// Element comparison for sequence members. Pointer-like elements compare their
// pointees when deep, their addresses otherwise; other elements always compare
// by value.
template <class T>
struct element_ops {
    bool deep = true;
    bool equal(const T& a, const T& b) const {
        if constexpr (is_pointer_like<T>::value) {
            if (!deep || !a || !b) return a == b;
            return *a == *b;
        } else {
            return a == b;
        }
    }
    uint64_t hash(const T& v) const {
        if constexpr (is_pointer_like<T>::value) {
            if (!v) return 0;
            if (!deep) return static_cast<uint64_t>(std::hash<const void*>{}(raw_address(v)));
            return hash_value(*v);
        } else {
            return hash_value(v);
        }
    }
};

template <class Elem>
struct equivalence_class {
    const Elem* representative;
    uint64_t hash;
    size_t count;
};

// Partition a sequence into classes of mutually equal elements (first
// occurrence is the representative). Eq and Hash must be consistent.
template <class Seq, class Eq, class Hash>
auto group_classes(const Seq& seq, const Eq& eq, const Hash& hash) {
    using Elem = std::decay_t<decltype(*std::begin(seq))>;
    std::vector<equivalence_class<Elem>> classes;
    std::unordered_multimap<uint64_t, size_t> by_hash;
    for (const auto& e : seq) {
        uint64_t h = hash(e);
        bool found = false;
        auto range = by_hash.equal_range(h);
        for (auto it = range.first; it != range.second; ++it) {
            auto& c = classes[it->second];
            if (eq(*c.representative, e)) { ++c.count; found = true; break; }
        }
        if (!found) {
            by_hash.emplace(h, classes.size());
            classes.push_back({&e, h, 1});
        }
    }
    return classes;
}

template <class Seq, class Eq, class Hash>
bool sequence_equal(const Seq* first, const Seq* second, bool order_matters, const Eq& eq, const Hash& hash) {
    if (first == second) return true;
    if (!first || !second) return false;
    if (order_matters) {
        auto a = std::begin(*first), ae = std::end(*first);
        auto b = std::begin(*second), be = std::end(*second);
        for (; a != ae && b != be; ++a, ++b)
            if (!eq(*a, *b)) return false;
        return a == ae && b == be;
    }
    auto lhs = group_classes(*first, eq, hash);
    auto rhs = group_classes(*second, eq, hash);
    if (lhs.size() != rhs.size()) return false;
    for (const auto& c : lhs) {
        auto it = std::find_if(rhs.begin(), rhs.end(), [&](const auto& o) {
            return o.hash == c.hash && eq(*o.representative, *c.representative);
        });
        if (it == rhs.end() || it->count != c.count) return false;
    }
    return true;
}

// Absent sequences contribute nothing. Ordered sequences fold their length, then
// each element. Unordered sequences fold (representative hash, cardinality) per
// class, sorted by representative hash.
template <class Seq, class Eq, class Hash>
void add_sequence_hash(hash_builder& h, const Seq* source, bool order_matters, const Eq& eq, const Hash& hash) {
    if (!source) return;
    if (order_matters) {
        h.add(static_cast<uint64_t>(std::distance(std::begin(*source), std::end(*source))));
        for (const auto& e : *source) h.add(hash(e));
        return;
    }
    auto classes = group_classes(*source, eq, hash);
    std::sort(classes.begin(), classes.end(), [](const auto& a, const auto& b) {
        return a.hash != b.hash ? a.hash < b.hash : a.count < b.count;
    });
    for (const auto& c : classes) {
        h.add(c.hash);
        h.add(c.count);
    }
}

template <class Seq>
using element_of = std::decay_t<decltype(*std::begin(std::declval<const Seq&>()))>;

template <class Seq>
bool sequence_equal(const Seq* a, const Seq* b, bool order_matters, bool deep) {
    element_ops<element_of<Seq>> ops{deep};
    return sequence_equal(a, b, order_matters,
                          [&](const auto& x, const auto& y) { return ops.equal(x, y); },
                          [&](const auto& x) { return ops.hash(x); });
}
template <class Seq>
void add_sequence_hash(hash_builder& h, const Seq* s, bool order_matters, bool deep) {
    element_ops<element_of<Seq>> ops{deep};
    add_sequence_hash(h, s, order_matters,
                      [&](const auto& x, const auto& y) { return ops.equal(x, y); },
                      [&](const auto& x) { return ops.hash(x); });
}

// Overloads used by generated code: plain containers, nullable shared_ptr and
// optional containers.
template <class Seq>
bool sequence_equal(const Seq& a, const Seq& b, bool order_matters, bool deep) { return sequence_equal(&a, &b, order_matters, deep); }
template <class Seq>
bool sequence_equal(const std::shared_ptr<Seq>& a, const std::shared_ptr<Seq>& b, bool order_matters, bool deep) {
    return sequence_equal(static_cast<const Seq*>(a.get()), static_cast<const Seq*>(b.get()), order_matters, deep);
}
template <class Seq>
bool sequence_equal(const std::optional<Seq>& a, const std::optional<Seq>& b, bool order_matters, bool deep) {
    if (!a && !b) return true;
    return sequence_equal(a ? &*a : nullptr, b ? &*b : nullptr, order_matters, deep);
}

template <class Seq>
void add_sequence_hash(hash_builder& h, const Seq& s, bool order_matters, bool deep) { add_sequence_hash(h, &s, order_matters, deep); }
template <class Seq>
void add_sequence_hash(hash_builder& h, const std::shared_ptr<Seq>& s, bool order_matters, bool deep) {
    add_sequence_hash(h, static_cast<const Seq*>(s.get()), order_matters, deep);
}
template <class Seq>
void add_sequence_hash(hash_builder& h, const std::optional<Seq>& s, bool order_matters, bool deep) {
    add_sequence_hash(h, s ? &*s : nullptr, order_matters, deep);
}

} // namespace rt
} // namespace eqgen
