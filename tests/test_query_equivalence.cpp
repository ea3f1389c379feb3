#include <gtest/gtest.h>
#include <reasoner/canonicalization.hpp>
#include <reasoner/query.hpp>
#include "test_helpers.hpp"

using namespace reasoner;
using test_utils::binary;

class QueryEquivalenceTest : public ::testing::Test {
protected:
    Canonicalizer canonicalizer;

    AtomicQuery employment(const std::string& a, const std::string& b,
                           const Substitution& sub = Substitution(), const std::string& rel = "") {
        return AtomicQuery(binary("employment", "employer", a, "employee", b, rel), sub);
    }
};

// === CANONICAL FORMS ===

TEST_F(QueryEquivalenceTest, RenamingPreservesCanonicalForm) {
    auto first = canonicalizer.canonicalize(binary("employment", "employer", "x", "employee", "y"), {});
    auto second = canonicalizer.canonicalize(binary("employment", "employee", "q", "employer", "p"), {});
    EXPECT_TRUE(CanonicalizationResult::are_equivalent(first, second))
        << first.canonical_form.to_string() << " vs " << second.canonical_form.to_string();
    EXPECT_EQ(first.canonical_form.variable_count, 2);
}

TEST_F(QueryEquivalenceTest, CanonicalMappingCoversUnboundVariables) {
    Atom atom = binary("employment", "employer", "x", "employee", "y", "r");
    auto result = canonicalizer.canonicalize(atom, Substitution{{"x", "Alice"}});
    EXPECT_EQ(result.canonical_form.variable_count, 2);
    EXPECT_TRUE(result.variable_mapping.contains("r"));
    EXPECT_TRUE(result.variable_mapping.contains("y"));
    EXPECT_FALSE(result.variable_mapping.contains("x"));
    // The relation variable is numbered first
    EXPECT_EQ(result.variable_mapping.original_to_canonical.at("r"), 0);
}

TEST_F(QueryEquivalenceTest, RepeatedVariableDiffersFromDistinctVariables) {
    EXPECT_FALSE(canonicalizer.are_equivalent(
        binary("friendship", "friend", "x", "friend", "x"), {},
        binary("friendship", "friend", "x", "friend", "y"), {}));
}

// === QUERY EQUIVALENCE ===

TEST_F(QueryEquivalenceTest, EquivalenceIsRenamingInvariant) {
    EXPECT_TRUE(employment("x", "y").is_equivalent(employment("a", "b")));
    EXPECT_EQ(employment("x", "y").equivalence_key(), employment("a", "b").equivalence_key());
}

TEST_F(QueryEquivalenceTest, BoundConstantsTakePartInEquivalence) {
    auto alice = employment("x", "y", Substitution{{"x", "Alice"}});
    auto alice_renamed = employment("p", "q", Substitution{{"p", "Alice"}});
    auto bob = employment("x", "y", Substitution{{"x", "Bob"}});
    auto employee_alice = employment("x", "y", Substitution{{"y", "Alice"}});

    EXPECT_TRUE(alice.is_equivalent(alice_renamed));
    EXPECT_FALSE(alice.is_equivalent(bob));
    EXPECT_FALSE(alice.is_equivalent(employee_alice));
    EXPECT_FALSE(alice.is_equivalent(employment("x", "y")));
}

TEST_F(QueryEquivalenceTest, RelationVariablePresenceMatters) {
    EXPECT_FALSE(employment("x", "y", {}, "r").is_equivalent(employment("x", "y")));
    EXPECT_TRUE(employment("x", "y", {}, "r").is_equivalent(employment("a", "b", {}, "s")));
}

TEST_F(QueryEquivalenceTest, DifferentPredicatesAreNotEquivalent) {
    AtomicQuery management(binary("management", "employer", "x", "employee", "y"));
    EXPECT_FALSE(management.is_equivalent(employment("x", "y")));
}

// === CONSTRUCTION ===

TEST_F(QueryEquivalenceTest, SubstitutionIsProjectedOntoAtom) {
    auto query = employment("x", "y", Substitution{{"x", "Alice"}, {"z", "Zed"}});
    EXPECT_EQ(query.substitution(), (Substitution{{"x", "Alice"}}));
}

TEST_F(QueryEquivalenceTest, AtomicKeepsOwnBindings) {
    auto query = employment("x", "y", Substitution{{"x", "Alice"}});
    auto subbed = AtomicQuery::atomic(query, Substitution{{"x", "Bob"}, {"y", "Carol"}, {"w", "Dave"}});
    EXPECT_EQ(subbed.substitution(), (Substitution{{"x", "Alice"}, {"y", "Carol"}}));
    EXPECT_EQ(subbed.general(), employment("x", "y"));
}

TEST_F(QueryEquivalenceTest, RoleExpansionVariables) {
    AtomicQuery query(Atom("parenthood", {RolePlayer("", "p", "role"), RolePlayer("child", "c", "crole")}));
    EXPECT_TRUE(query.requires_role_expansion());
    EXPECT_EQ(query.role_expansion_variables(), (VariableSet{"role"}));

    auto bound = AtomicQuery::atomic(query, Substitution{{"role", "mother"}});
    EXPECT_FALSE(bound.requires_role_expansion());

    EXPECT_FALSE(employment("x", "y").requires_role_expansion());
}

// === EXACT UNIFIERS ===

TEST_F(QueryEquivalenceTest, ExactUnifierRenamesVariables) {
    auto from = employment("x", "y", {}, "r");
    auto to = employment("a", "b", {}, "s");
    MultiUnifier unifiers = from.exact_unifiers(to);
    ASSERT_EQ(unifiers.size(), 1);
    EXPECT_EQ(unifiers.unifier(), (Unifier{{"r", "s"}, {"x", "a"}, {"y", "b"}}));
}

TEST_F(QueryEquivalenceTest, SymmetricRelationHasTwoUnifiers) {
    AtomicQuery from(binary("friendship", "friend", "x", "friend", "y"));
    AtomicQuery to(binary("friendship", "friend", "a", "friend", "b"));
    MultiUnifier unifiers = from.exact_unifiers(to);
    EXPECT_EQ(unifiers.size(), 2);

    auto translated = unifiers.apply(Substitution{{"x", "Alice"}, {"y", "Bob"}});
    EXPECT_EQ(translated.size(), 2);
    test_utils::expect_contains(translated, Substitution{{"a", "Bob"}, {"b", "Alice"}});
}

TEST_F(QueryEquivalenceTest, ExactUnifierRespectsConstants) {
    AtomicQuery from(binary("friendship", "friend", "x", "friend", "y"), Substitution{{"x", "Alice"}});
    AtomicQuery to(binary("friendship", "friend", "a", "friend", "b"), Substitution{{"b", "Alice"}});
    MultiUnifier unifiers = from.exact_unifiers(to);
    ASSERT_EQ(unifiers.size(), 1);
    EXPECT_EQ(unifiers.unifier(), (Unifier{{"x", "b"}, {"y", "a"}}));
}

TEST_F(QueryEquivalenceTest, NoUnifierBetweenInequivalentQueries) {
    EXPECT_TRUE(employment("x", "y").exact_unifiers(employment("x", "y", {}, "r")).empty());
}
