// Declaration model: what the classifier extracts from (class ...) and (enumeration ...) forms.
#pragma once
#include "eqgen/edn.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace eqgen {

struct TypeDesc {
    enum class Kind { Scalar, Text, Sequence, Opaque };
    Kind kind = Kind::Opaque;
    std::string name;                    // scalar/opaque name, or the container head for sequences
    std::shared_ptr<TypeDesc> element;   // sequences only
    bool iterable() const { return kind == Kind::Sequence; }
};
std::string to_string(const TypeDesc& t);
// C++ spelling used in generated code and companion stubs (i32 -> std::int32_t, (seq T) -> std::vector<T>).
std::string cpp_spelling(const TypeDesc& t);

// Equality strategies. `explicit_order` records whether :order was written.
struct IncludeStrategy { int order = 0; bool explicit_order = false; };
struct IgnoreStrategy {};
struct SequenceStrategy { int order = 0; bool explicit_order = false; bool order_matters = true; bool deep = true; };
struct CustomStrategy { int order = 0; bool explicit_order = false; };
using Strategy = std::variant<IncludeStrategy, IgnoreStrategy, SequenceStrategy, CustomStrategy>;

const char* strategy_name(const Strategy& s);
int strategy_order(const Strategy& s);
bool has_explicit_order(const Strategy& s);

struct StrategyAnnotation { Strategy strategy; int line = -1; int col = -1; };

enum class MemberKind { Field, Property, Method };
enum class Setter { None, Init, Set };

const char* kind_name(MemberKind k);

struct Member {
    std::string name;
    MemberKind kind = MemberKind::Field;
    TypeDesc type;
    size_t position = 0;
    bool readonly = false;   // fields
    Setter setter = Setter::None; // properties
    bool computed = false;   // property with accessor logic
    bool is_static = false;
    std::vector<StrategyAnnotation> strategies;
    int line = -1;
    int col = -1;
    // Fields and auto properties can carry a strategy; methods and computed properties cannot.
    bool eligible() const { return kind != MemberKind::Method && !computed; }
};

struct CompanionFn { std::string name; bool is_static = true; int line = -1; int col = -1; };

enum class BaseShape { None, ValueObject, Wrapper };

struct HostDecl {
    std::string name;
    std::string ns;
    bool partial = false;
    bool contract_marker = false;
    int marker_line = -1, marker_col = -1;
    BaseShape base = BaseShape::None;
    TypeDesc wrapped;        // wrapper value type
    std::vector<Member> members;
    std::vector<CompanionFn> functions;
    int line = -1;
    int col = -1;
    std::string qualified_name() const { return ns.empty() ? name : ns + "::" + name; }
};

struct EnumConstant {
    std::string constant;
    std::optional<int64_t> value;     // set only for literal arguments
    std::optional<std::string> name;
    size_t position = 0;
    int line = -1;
    int col = -1;
    bool literal() const { return value.has_value() && name.has_value(); }
};

struct EnumDecl {
    std::string name;
    std::string ns;
    bool partial = false;
    std::vector<EnumConstant> constants;
    int line = -1;
    int col = -1;
    std::string qualified_name() const { return ns.empty() ? name : ns + "::" + name; }
};

using Declaration = std::variant<HostDecl, EnumDecl>;

inline const std::string& declaration_name(const Declaration& d) {
    return std::visit([](const auto& x) -> const std::string& { return x.name; }, d);
}

} // namespace eqgen
