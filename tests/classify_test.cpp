#include <gtest/gtest.h>
#include "eqgen/classify.hpp"
#include "test_env.hpp"

using namespace eqgen;

TEST(Classify, ReadsClassMembersAndStrategies){
    auto d = read_host(R"EDN(
        (class :name Address :namespace app :partial true :attrs [value-object] :base value-object
          :members [ (field :name city :type string :readonly true :equality (include :order 2))
                     (property :name tags :type (seq string) :setter init
                               :equality (sequence :order-matters false :deep false))
                     (property :name full :type string :computed true)
                     (method :name describe :equality (include)) ]
          :functions [ (fn :name Equals_City) (fn :name Helper :static false) ]))EDN");
    EXPECT_EQ(d.name, "Address");
    EXPECT_EQ(d.ns, "app");
    EXPECT_EQ(d.qualified_name(), "app::Address");
    EXPECT_TRUE(d.partial);
    EXPECT_TRUE(d.contract_marker);
    EXPECT_EQ(d.base, BaseShape::ValueObject);
    ASSERT_EQ(d.members.size(), 4u);

    const Member& city = d.members[0];
    EXPECT_EQ(city.kind, MemberKind::Field);
    EXPECT_EQ(city.type.kind, TypeDesc::Kind::Text);
    EXPECT_TRUE(city.readonly);
    ASSERT_EQ(city.strategies.size(), 1u);
    auto* inc = std::get_if<IncludeStrategy>(&city.strategies[0].strategy);
    ASSERT_TRUE(inc);
    EXPECT_EQ(inc->order, 2);
    EXPECT_TRUE(inc->explicit_order);

    const Member& tags = d.members[1];
    EXPECT_EQ(tags.kind, MemberKind::Property);
    EXPECT_TRUE(tags.type.iterable());
    ASSERT_TRUE(tags.type.element);
    EXPECT_EQ(tags.type.element->kind, TypeDesc::Kind::Text);
    EXPECT_EQ(tags.setter, Setter::Init);
    auto* seq = std::get_if<SequenceStrategy>(&tags.strategies.at(0).strategy);
    ASSERT_TRUE(seq);
    EXPECT_FALSE(seq->order_matters);
    EXPECT_FALSE(seq->deep);
    EXPECT_FALSE(seq->explicit_order);
    EXPECT_EQ(tags.position, 1u);

    EXPECT_FALSE(d.members[2].eligible());
    EXPECT_EQ(d.members[3].kind, MemberKind::Method);
    EXPECT_FALSE(d.members[3].eligible());

    ASSERT_EQ(d.functions.size(), 2u);
    EXPECT_TRUE(d.functions[0].is_static);
    EXPECT_FALSE(d.functions[1].is_static);
}

TEST(Classify, TypeForms){
    auto scalar = parse_type_desc(parse("i32"));
    ASSERT_TRUE(scalar);
    EXPECT_EQ(scalar->kind, TypeDesc::Kind::Scalar);
    EXPECT_EQ(cpp_spelling(*scalar), "std::int32_t");

    auto ref = parse_type_desc(parse("(ref Money)"));
    ASSERT_TRUE(ref);
    EXPECT_EQ(ref->kind, TypeDesc::Kind::Opaque);
    EXPECT_EQ(ref->name, "Money");

    auto nested = parse_type_desc(parse("(vector (seq i64))"));
    ASSERT_TRUE(nested);
    EXPECT_TRUE(nested->iterable());
    EXPECT_TRUE(nested->element->iterable());
    EXPECT_EQ(to_string(*nested), "(vector (seq i64))");
    EXPECT_EQ(cpp_spelling(*nested), "std::vector<std::vector<std::int64_t>>");

    EXPECT_EQ(parse_type_desc(parse("Money"))->kind, TypeDesc::Kind::Opaque);
    EXPECT_FALSE(parse_type_desc(parse("(map a b)")));
    EXPECT_FALSE(parse_type_desc(parse("(seq)")));
    EXPECT_FALSE(parse_type_desc(parse("7")));
}

TEST(Classify, WrapperBase){
    auto d = read_host("(class :name Email :partial true :base (wrapper string))");
    EXPECT_EQ(d.base, BaseShape::Wrapper);
    EXPECT_EQ(d.wrapped.kind, TypeDesc::Kind::Text);
    EXPECT_FALSE(d.contract_marker);
}

TEST(Classify, MultipleStrategiesAreKept){
    auto d = read_host("(class :name A :members [ (field :name x :type i32 :equality [(include) (ignore)]) ])");
    ASSERT_EQ(d.members.size(), 1u);
    EXPECT_EQ(d.members[0].strategies.size(), 2u);
}

TEST(Classify, MalformedFormsReportED001){
    CheckResult r; Reporter rep{&r, "", true};
    EXPECT_FALSE(classify_declaration(parse("(class :partial true)"), rep));
    EXPECT_EQ(count_code(r.errors, codes::MalformedDeclaration), 1u);
    EXPECT_FALSE(r.success);

    CheckResult r2; Reporter rep2{&r2, "", true};
    auto d = classify_declaration(parse(
        "(class :name A :members [ (field :name x :type i32 :equality (compare)) (field :name y) (slot :name z) ])"), rep2);
    ASSERT_TRUE(d);
    auto &host = std::get<HostDecl>(*d);
    ASSERT_EQ(host.members.size(), 1u);   // y has no :type, z is not a member form
    EXPECT_TRUE(host.members[0].strategies.empty());
    EXPECT_EQ(count_code(r2.errors, codes::MalformedDeclaration), 3u);
    for(auto &e : r2.errors) EXPECT_EQ(e.declaration, "A");

    CheckResult r3; Reporter rep3{&r3, "", true};
    EXPECT_FALSE(classify_declaration(parse("(struct :name S)"), rep3));
    EXPECT_EQ(count_code(r3.errors, codes::MalformedDeclaration), 1u);
}

TEST(Classify, DuplicateMemberNames){
    CheckResult r; Reporter rep{&r, "", true};
    auto d = classify_declaration(parse("(class :name A :members [ (field :name x :type i32)\n (field :name x :type i64) ])"), rep);
    ASSERT_TRUE(d);
    EXPECT_EQ(std::get<HostDecl>(*d).members.size(), 1u);
    const Diagnostic* e = find_code(r.errors, codes::MalformedDeclaration);
    ASSERT_TRUE(e);
    EXPECT_EQ(e->line, 2);
    ASSERT_EQ(e->notes.size(), 1u);
    EXPECT_EQ(e->notes[0].line, 1);
}

TEST(Classify, StaticMembersAreFlagged){
    auto d = read_host("(class :name A :members [ (field :name Empty :type A :static true) ])");
    ASSERT_EQ(d.members.size(), 1u);
    EXPECT_TRUE(d.members[0].is_static);
}

TEST(Classify, EnumerationConstants){
    auto e = read_enum(R"EDN(
        (enumeration :name Color :namespace app :partial true
          :constants [ (constant :name Red :args [1 "Red"])
                       (constant :name Computed :args [(next-id) "Computed"]) ]))EDN");
    EXPECT_EQ(e.qualified_name(), "app::Color");
    ASSERT_EQ(e.constants.size(), 2u);
    EXPECT_TRUE(e.constants[0].literal());
    EXPECT_EQ(*e.constants[0].value, 1);
    EXPECT_EQ(*e.constants[0].name, "Red");
    EXPECT_FALSE(e.constants[1].literal());
    EXPECT_EQ(e.constants[1].position, 1u);
}

TEST(Classify, ModuleShape){
    CheckResult r; Reporter rep{&r, "", true};
    auto forms = module_forms(parse("(module (class :name A) (enumeration :name E))"), rep);
    EXPECT_EQ(forms.size(), 2u);
    EXPECT_TRUE(r.success);

    CheckResult bad; Reporter rep2{&bad, "", true};
    EXPECT_TRUE(module_forms(parse("[1 2]"), rep2).empty());
    EXPECT_EQ(count_code(bad.errors, codes::MalformedDeclaration), 1u);
}

TEST(Classify, OrderOutsideIntRangeIsRejected){
    CheckResult r; Reporter rep{&r, "", true};
    auto d = classify_declaration(parse(R"EDN(
        (class :name A :attrs [value-object] :base value-object
          :members [ (field :name big :type i32 :equality (include :order 4294967297))
                     (field :name one :type i32 :equality (include :order 1))
                     (field :name neg :type i32 :equality (include :order 2147483648))
                     (field :name low :type i32 :equality (include :order -2147483648)) ]))EDN"), rep);
    ASSERT_TRUE(d);
    auto &host = std::get<HostDecl>(*d);
    ASSERT_EQ(host.members.size(), 4u);
    EXPECT_TRUE(host.members[0].strategies.empty());
    EXPECT_TRUE(host.members[2].strategies.empty());
    ASSERT_EQ(host.members[1].strategies.size(), 1u);
    EXPECT_EQ(strategy_order(host.members[1].strategies[0].strategy), 1);
    ASSERT_EQ(host.members[3].strategies.size(), 1u);
    EXPECT_EQ(strategy_order(host.members[3].strategies[0].strategy), -2147483647 - 1);
    ASSERT_EQ(count_code(r.errors, codes::MalformedDeclaration), 2u);
    for(auto &e : r.errors) EXPECT_EQ(e.message, ":order out of range");
}
