#include "eqgen/declaration.hpp"
#include <utility>

namespace eqgen {

std::string to_string(const TypeDesc& t){
    switch(t.kind){
        case TypeDesc::Kind::Scalar: case TypeDesc::Kind::Opaque: return t.name;
        case TypeDesc::Kind::Text: return "string";
        case TypeDesc::Kind::Sequence: return "(" + t.name + " " + (t.element ? to_string(*t.element) : std::string("?")) + ")";
    }
    return t.name;
}

std::string cpp_spelling(const TypeDesc& t){
    static const std::pair<const char*,const char*> scalars[] = {
        {"bool","bool"},{"char","char"},{"i8","std::int8_t"},{"i16","std::int16_t"},{"i32","std::int32_t"},{"i64","std::int64_t"},
        {"u8","std::uint8_t"},{"u16","std::uint16_t"},{"u32","std::uint32_t"},{"u64","std::uint64_t"},{"f32","float"},{"f64","double"}};
    switch(t.kind){
        case TypeDesc::Kind::Scalar:
            for(auto &s : scalars) if(t.name==s.first) return s.second;
            return t.name;
        case TypeDesc::Kind::Text: return "std::string";
        case TypeDesc::Kind::Opaque: return t.name;
        case TypeDesc::Kind::Sequence: {
            std::string elem = t.element ? cpp_spelling(*t.element) : std::string("void");
            if(t.name=="list") return "std::list<" + elem + ">";
            if(t.name=="set") return "std::set<" + elem + ">";
            return "std::vector<" + elem + ">";
        }
    }
    return t.name;
}

const char* strategy_name(const Strategy& s){
    struct V {
        const char* operator()(const IncludeStrategy&) const { return "include"; }
        const char* operator()(const IgnoreStrategy&) const { return "ignore"; }
        const char* operator()(const SequenceStrategy&) const { return "sequence"; }
        const char* operator()(const CustomStrategy&) const { return "custom"; }
    };
    return std::visit(V{}, s);
}

int strategy_order(const Strategy& s){
    struct V {
        int operator()(const IgnoreStrategy&) const { return 0; }
        int operator()(const IncludeStrategy& x) const { return x.order; }
        int operator()(const SequenceStrategy& x) const { return x.order; }
        int operator()(const CustomStrategy& x) const { return x.order; }
    };
    return std::visit(V{}, s);
}

bool has_explicit_order(const Strategy& s){
    struct V {
        bool operator()(const IgnoreStrategy&) const { return false; }
        bool operator()(const IncludeStrategy& x) const { return x.explicit_order; }
        bool operator()(const SequenceStrategy& x) const { return x.explicit_order; }
        bool operator()(const CustomStrategy& x) const { return x.explicit_order; }
    };
    return std::visit(V{}, s);
}

const char* kind_name(MemberKind k){
    switch(k){
        case MemberKind::Field: return "field";
        case MemberKind::Property: return "property";
        case MemberKind::Method: return "method";
    }
    return "member";
}

} // namespace eqgen
