#include <gtest/gtest.h>
#include "eqgen/runtime/equality.hpp"
#include <algorithm>
#include <list>
#include <set>

using namespace eqgen::rt;

namespace {

template <class Seq>
uint64_t seq_hash(const Seq& s, bool order_matters, bool deep = true){
    hash_builder h(7);
    add_sequence_hash(h, s, order_matters, deep);
    return h.finish();
}

} // namespace

TEST(Runtime, Fnv1aReferenceValues){
    static_assert(fnv1a("") == 0xcbf29ce484222325ull, "offset basis");
    EXPECT_EQ(fnv1a("a"), 0xaf63dc4c8601ec8cull);
    EXPECT_EQ(hash_value(std::string("Gaza")), hash_value(std::string_view("Gaza")));
    EXPECT_EQ(hash_value("Gaza"), fnv1a("Gaza"));
}

TEST(Runtime, HashBuilderIsDeterministicAndOrderSensitive){
    hash_builder a(1), b(1), c(1);
    a.add(1); a.add(2);
    b.add(1); b.add(2);
    c.add(2); c.add(1);
    EXPECT_EQ(a.finish(), b.finish());
    EXPECT_NE(a.finish(), c.finish());
    EXPECT_NE(hash_builder(1).finish(), hash_builder(2).finish());
}

TEST(Runtime, SignedZeroHashesEqual){
    EXPECT_EQ(hash_value(0.0), hash_value(-0.0));
    EXPECT_EQ(hash_value(0.0f), hash_value(-0.0f));
    EXPECT_NE(hash_value(1.0), hash_value(-1.0));
}

TEST(Runtime, UnorderedVectorsAreMultisets){
    std::vector<std::string> a{"x", "y", "y", "z"};
    std::vector<std::string> b{"y", "z", "x", "y"};
    std::vector<std::string> c{"x", "y", "z", "z"};
    EXPECT_TRUE(sequence_equal(a, b, false, true));
    EXPECT_EQ(seq_hash(a, false), seq_hash(b, false));
    EXPECT_FALSE(sequence_equal(a, c, false, true));
    EXPECT_FALSE(sequence_equal(a, b, true, true));
    EXPECT_TRUE(sequence_equal(a, a, true, true));
    EXPECT_NE(seq_hash(a, true), seq_hash(b, true));
}

TEST(Runtime, OrderedListsCompareLengths){
    std::list<int> a{1, 2, 3};
    std::list<int> b{1, 2};
    EXPECT_FALSE(sequence_equal(a, b, true, true));
    EXPECT_FALSE(sequence_equal(b, a, true, true));
    b.push_back(3);
    EXPECT_TRUE(sequence_equal(a, b, true, true));
}

TEST(Runtime, NullSequenceDiffersFromEmpty){
    std::shared_ptr<std::vector<int>> none;
    auto empty = std::make_shared<std::vector<int>>();
    EXPECT_TRUE(sequence_equal(none, std::shared_ptr<std::vector<int>>(), false, true));
    EXPECT_FALSE(sequence_equal(none, empty, false, true));
    EXPECT_FALSE(sequence_equal(empty, none, true, true));
    EXPECT_TRUE(sequence_equal(empty, std::make_shared<std::vector<int>>(), true, true));

    std::optional<std::vector<int>> absent, present(std::vector<int>{});
    EXPECT_TRUE(sequence_equal(absent, std::optional<std::vector<int>>(), true, true));
    EXPECT_FALSE(sequence_equal(absent, present, true, true));

    hash_builder h(3), untouched(3);
    add_sequence_hash(h, none, true, true);
    EXPECT_EQ(h.finish(), untouched.finish());
}

TEST(Runtime, PointerElementsDeepOrIdentity){
    auto one = std::make_shared<int>(1);
    auto another_one = std::make_shared<int>(1);
    std::vector<std::shared_ptr<int>> a{one};
    std::vector<std::shared_ptr<int>> b{another_one};
    EXPECT_TRUE(sequence_equal(a, b, true, true));
    EXPECT_EQ(seq_hash(a, true, true), seq_hash(b, true, true));
    EXPECT_FALSE(sequence_equal(a, b, true, false));
    EXPECT_TRUE(sequence_equal(a, std::vector<std::shared_ptr<int>>{one}, true, false));

    std::vector<std::shared_ptr<int>> nulls{nullptr}, other_nulls{nullptr};
    EXPECT_TRUE(sequence_equal(nulls, other_nulls, true, true));
    EXPECT_FALSE(sequence_equal(nulls, a, true, true));
}

TEST(Runtime, SetsCompareUnordered){
    std::set<int> a{3, 1, 2};
    std::set<int> b{1, 2, 3};
    EXPECT_TRUE(sequence_equal(a, b, false, true));
    EXPECT_EQ(seq_hash(a, false), seq_hash(b, false));
}

TEST(Runtime, GroupClassesCountsOccurrences){
    std::vector<int> xs{4, 5, 4, 4};
    auto classes = group_classes(xs, [](int a, int b){ return a == b; }, [](int v){ return static_cast<uint64_t>(v); });
    ASSERT_EQ(classes.size(), 2u);
    EXPECT_EQ(*classes[0].representative, 4);
    EXPECT_EQ(classes[0].count, 3u);
    EXPECT_EQ(classes[1].count, 1u);
}

TEST(Runtime, UnorderedHashIsInvariantUnderEveryPermutation){
    for(bool deep : {true, false}){
        std::vector<int> original{1, 2, 2, 3, 3, 3};
        std::vector<int> perm = original;
        uint64_t expected = seq_hash(original, false, deep);
        size_t seen = 0;
        do {
            EXPECT_TRUE(sequence_equal(original, perm, false, deep));
            EXPECT_EQ(seq_hash(perm, false, deep), expected);
            ++seen;
        } while(std::next_permutation(perm.begin(), perm.end()));
        EXPECT_EQ(seen, 60u);   // 6! / (2! * 3!)
    }
}

TEST(Runtime, OrderedComparisonRejectsEveryOtherPermutation){
    std::vector<int> original{1, 2, 3, 4};
    std::vector<int> perm = original;
    while(std::next_permutation(perm.begin(), perm.end())){
        EXPECT_FALSE(sequence_equal(original, perm, true, true));
        EXPECT_TRUE(sequence_equal(original, perm, false, true));
    }
}

TEST(Runtime, OrderedHashFoldsLength){
    std::vector<int> one{1}, none;
    hash_builder a(9), b(9);
    add_sequence_hash(a, one, true, true);
    add_sequence_hash(a, none, true, true);
    add_sequence_hash(b, none, true, true);
    add_sequence_hash(b, one, true, true);
    EXPECT_NE(a.finish(), b.finish());

    hash_builder expected(9);
    expected.add(1);
    expected.add(hash_value(1));
    hash_builder actual(9);
    add_sequence_hash(actual, one, true, true);
    EXPECT_EQ(actual.finish(), expected.finish());
}

TEST(Runtime, UnorderedHashFoldsRepresentativeThenCount){
    std::vector<int> xs{5, 5, 7};
    hash_builder expected(4);
    expected.add(hash_value(5)); expected.add(2);
    expected.add(hash_value(7)); expected.add(1);
    hash_builder actual(4);
    add_sequence_hash(actual, xs, false, true);
    EXPECT_EQ(actual.finish(), expected.finish());
}

TEST(Runtime, IdentityHashIsInvariantUnderEveryPermutation){
    auto a = std::make_shared<int>(1), b = std::make_shared<int>(2);
    std::vector<std::shared_ptr<int>> original{a, a, b};
    std::sort(original.begin(), original.end());
    std::vector<std::shared_ptr<int>> perm = original;
    uint64_t expected = seq_hash(original, false, false);
    size_t seen = 0;
    do {
        EXPECT_TRUE(sequence_equal(original, perm, false, false));
        EXPECT_EQ(seq_hash(perm, false, false), expected);
        ++seen;
    } while(std::next_permutation(perm.begin(), perm.end()));
    EXPECT_EQ(seen, 3u);

    std::vector<std::shared_ptr<int>> copies{std::make_shared<int>(1), a, b};
    EXPECT_FALSE(sequence_equal(original, copies, false, false));
    EXPECT_TRUE(sequence_equal(original, copies, false, true));
}
