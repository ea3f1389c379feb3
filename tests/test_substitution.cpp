#include <gtest/gtest.h>
#include <reasoner/substitution.hpp>
#include "test_helpers.hpp"

using namespace reasoner;

class SubstitutionTest : public ::testing::Test {
protected:
    Substitution alice_bob{{"x", "Alice"}, {"y", "Bob"}};
    Substitution carol{{"z", "Carol"}};
};

// === BASIC ACCESS ===

TEST_F(SubstitutionTest, EmptySubstitution) {
    Substitution empty;
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.size(), 0);
    EXPECT_FALSE(empty.get("x").has_value());
    EXPECT_EQ(empty.to_string(), "{}");
}

TEST_F(SubstitutionTest, Lookup) {
    EXPECT_TRUE(alice_bob.contains("x"));
    EXPECT_FALSE(alice_bob.contains("z"));
    EXPECT_EQ(alice_bob.get("y").value(), "Bob");
    EXPECT_EQ(alice_bob.variables(), (VariableSet{"x", "y"}));
    EXPECT_EQ(alice_bob.to_string(), "{$x=Alice, $y=Bob}");
}

// === MERGE LAWS ===

TEST_F(SubstitutionTest, MergeIdentity) {
    EXPECT_EQ(merge(alice_bob, Substitution()), alice_bob);
    EXPECT_EQ(merge(Substitution(), alice_bob), alice_bob);
}

TEST_F(SubstitutionTest, MergeIdempotent) {
    EXPECT_EQ(merge(alice_bob, alice_bob), alice_bob);
}

TEST_F(SubstitutionTest, MergeCommutativeOnDisjointDomains) {
    Substitution ab = merge(alice_bob, carol);
    Substitution ba = merge(carol, alice_bob);
    EXPECT_EQ(ab, ba);
    EXPECT_EQ(ab.size(), 3);
}

TEST_F(SubstitutionTest, MergeAgreeingOverlap) {
    Substitution other{{"y", "Bob"}, {"z", "Carol"}};
    Substitution merged = merge(alice_bob, other);
    EXPECT_EQ(merged, (Substitution{{"x", "Alice"}, {"y", "Bob"}, {"z", "Carol"}}));
}

TEST_F(SubstitutionTest, MergeConflictFails) {
    Substitution conflicting{{"x", "Dave"}};
    EXPECT_TRUE(merge(alice_bob, conflicting).empty());
    EXPECT_TRUE(merge(conflicting, alice_bob).empty());
}

TEST_F(SubstitutionTest, ProjectionLaw) {
    Substitution a{{"x", "Alice"}, {"y", "Bob"}};
    Substitution b{{"y", "Bob"}, {"z", "Carol"}};
    VariableSet vars{"x", "z"};

    EXPECT_EQ(merge(a, b).project(vars), merge(a.project(vars), b.project(vars)));
}

TEST_F(SubstitutionTest, ProjectDropsOutsideVariables) {
    Substitution projected = alice_bob.project({"x", "w"});
    EXPECT_EQ(projected, (Substitution{{"x", "Alice"}}));
    EXPECT_TRUE(alice_bob.project({}).empty());
}

// === EXPLANATIONS ===

TEST_F(SubstitutionTest, ExplanationIgnoredByEquality) {
    Substitution explained = alice_bob.explain(Explanation::rule("pattern", "r1"));
    EXPECT_EQ(explained, alice_bob);
    EXPECT_EQ(explained.hash(), alice_bob.hash());
    ASSERT_TRUE(explained.explanation().has_value());
    EXPECT_TRUE(explained.explanation()->is_rule_explanation());
    EXPECT_EQ(explained.explanation()->rule_id, "r1");
}

TEST_F(SubstitutionTest, ExplanationSurvivesProjectAndMerge) {
    Substitution explained = alice_bob.explain(Explanation::lookup("p"));
    EXPECT_EQ(explained.project({"x"}).explanation(), explained.explanation());

    // Left operand wins, the right one fills in when the left has none
    Substitution other = carol.explain(Explanation::rule("q", "r2"));
    EXPECT_EQ(merge(explained, other).explanation()->kind, Explanation::LOOKUP);
    EXPECT_EQ(merge(alice_bob, other).explanation()->rule_id, "r2");
}

TEST_F(SubstitutionTest, Subsumption) {
    Substitution x_only{{"x", "Alice"}};
    EXPECT_TRUE(alice_bob.subsumes(x_only));
    EXPECT_FALSE(x_only.subsumes(alice_bob));
    EXPECT_TRUE(alice_bob.subsumes(Substitution()));
    EXPECT_FALSE(alice_bob.subsumes(Substitution{{"x", "Dave"}}));
}
