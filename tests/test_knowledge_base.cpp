#include <gtest/gtest.h>
#include <reasoner/errors.hpp>
#include <reasoner/knowledge_base.hpp>
#include "test_helpers.hpp"

using namespace reasoner;
using test_utils::binary;

class KnowledgeBaseTest : public ::testing::Test {
protected:
    KnowledgeBase kb;

    void SetUp() override {
        kb.schema().add_role("parent");
        kb.schema().add_role("mother", "parent");
        kb.schema().add_role("father", "parent");
        kb.schema().add_role("child");
    }
};

// === SCHEMA ===

TEST_F(KnowledgeBaseTest, RoleHierarchy) {
    const Schema& schema = kb.schema();
    EXPECT_EQ(schema.sups("mother"), (std::vector<std::string>{"mother", "parent"}));
    EXPECT_TRUE(schema.is_subrole("mother", "parent"));
    EXPECT_TRUE(schema.is_subrole("parent", "parent"));
    EXPECT_FALSE(schema.is_subrole("parent", "mother"));
    EXPECT_EQ(schema.sups("unknown"), (std::vector<std::string>{"unknown"}));
}

TEST_F(KnowledgeBaseTest, RoleHierarchyCycleRejected) {
    EXPECT_THROW(kb.schema().add_role("parent", "mother"), std::invalid_argument);
    EXPECT_THROW(kb.schema().add_role("parent", "parent"), std::invalid_argument);
}

// === INSERTION ===

TEST_F(KnowledgeBaseTest, InsertAssignsIds) {
    ConceptId first = kb.insert("parenthood", {{"mother", "Mary"}, {"child", "Tom"}});
    ConceptId second = kb.insert("parenthood", {{"father", "John"}, {"child", "Tom"}});
    EXPECT_NE(first, second);
    EXPECT_EQ(kb.size(), 2);
    EXPECT_EQ(kb.num_inferred(), 0);

    auto fact = kb.get_fact(first);
    ASSERT_TRUE(fact.has_value());
    EXPECT_EQ(fact->predicate, "parenthood");
    EXPECT_FALSE(fact->inferred);
    EXPECT_FALSE(kb.get_fact("missing").has_value());
}

TEST_F(KnowledgeBaseTest, DuplicateInferredFactIsAnError) {
    kb.insert("parenthood", {{"mother", "Mary"}, {"child", "Tom"}});
    // Player order does not matter
    EXPECT_THROW(kb.insert_inferred("parenthood", {{"child", "Tom"}, {"mother", "Mary"}}),
                 DuplicateMaterialisationError);
    EXPECT_EQ(kb.num_inferred(), 0);

    kb.insert_inferred("parenthood", {{"mother", "Ann"}, {"child", "Tom"}});
    EXPECT_EQ(kb.num_inferred(), 1);
}

// === MATCHING ===

TEST_F(KnowledgeBaseTest, MatchBindsPlayersAndRelation) {
    ConceptId id = kb.insert("parenthood", {{"mother", "Mary"}, {"child", "Tom"}});
    AtomicQuery query(binary("parenthood", "mother", "m", "child", "c", "rel"));

    auto answers = kb.match(query);
    ASSERT_EQ(answers.size(), 1);
    EXPECT_EQ(answers.front(), (Substitution{{"m", "Mary"}, {"c", "Tom"}, {"rel", id}}));
}

TEST_F(KnowledgeBaseTest, MatchHonoursSubRoles) {
    kb.insert("parenthood", {{"mother", "Mary"}, {"child", "Tom"}});
    kb.insert("parenthood", {{"father", "John"}, {"child", "Tom"}});

    auto parents = kb.match(AtomicQuery(binary("parenthood", "parent", "p", "child", "c")));
    EXPECT_EQ(parents.size(), 2);

    auto mothers = kb.match(AtomicQuery(binary("parenthood", "mother", "p", "child", "c")));
    ASSERT_EQ(mothers.size(), 1);
    EXPECT_EQ(mothers.front().get("p").value(), "Mary");
}

TEST_F(KnowledgeBaseTest, MatchRespectsQueryBindings) {
    kb.insert("parenthood", {{"mother", "Mary"}, {"child", "Tom"}});
    kb.insert("parenthood", {{"mother", "Mary"}, {"child", "Sue"}});

    AtomicQuery query(binary("parenthood", "mother", "m", "child", "c"), Substitution{{"c", "Sue"}});
    auto answers = kb.match(query);
    ASSERT_EQ(answers.size(), 1);
    EXPECT_EQ(answers.front(), (Substitution{{"m", "Mary"}, {"c", "Sue"}}));
}

TEST_F(KnowledgeBaseTest, UnlabelledRoleVariableRangesOverSuperRoles) {
    kb.insert("parenthood", {{"mother", "Mary"}, {"child", "Tom"}});
    AtomicQuery query(Atom("parenthood", {RolePlayer("", "p", "role"), RolePlayer("child", "c")}));

    auto answers = kb.match(query);
    EXPECT_EQ(answers.size(), 2);
    test_utils::expect_contains(answers, Substitution{{"p", "Mary"}, {"role", "mother"}});
    test_utils::expect_contains(answers, Substitution{{"p", "Mary"}, {"role", "parent"}});
}

TEST_F(KnowledgeBaseTest, PartialPlayerCoverage) {
    kb.insert("parenthood", {{"mother", "Mary"}, {"child", "Tom"}});
    AtomicQuery query(Atom("parenthood", {RolePlayer("child", "c")}));
    auto answers = kb.match(query);
    ASSERT_EQ(answers.size(), 1);
    EXPECT_EQ(answers.front(), (Substitution{{"c", "Tom"}}));
}

// === MATERIALISATION ===

TEST_F(KnowledgeBaseTest, MaterialiseWritesOneFact) {
    AtomicQuery head(Atom("parenthood", {RolePlayer("mother", "m", "mrole"), RolePlayer("child", "c")}, "rel"));
    auto result = kb.materialise(head, Substitution{{"m", "Ann"}, {"c", "Bob"}, {"unrelated", "X"}});

    ASSERT_EQ(result.size(), 1);
    const Substitution& fact = result.front();
    EXPECT_EQ(fact.get("m").value(), "Ann");
    EXPECT_EQ(fact.get("mrole").value(), "mother");
    ASSERT_TRUE(fact.get("rel").has_value());
    EXPECT_FALSE(fact.contains("unrelated"));

    EXPECT_EQ(kb.num_inferred(), 1);
    auto stored = kb.get_fact(fact.get("rel").value());
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->inferred);
}

TEST_F(KnowledgeBaseTest, MaterialiseBindsEveryRoleVariable) {
    AtomicQuery head(Atom("supervision",
                          {RolePlayer("supervisor", "s", "srole"), RolePlayer("supervisee", "t", "trole")},
                          "rel"));
    auto result = kb.materialise(head, Substitution{{"s", "Ann"}, {"t", "Bob"}});

    ASSERT_EQ(result.size(), 1);
    const Substitution& fact = result.front();
    EXPECT_EQ(fact.get("srole").value(), "supervisor");
    EXPECT_EQ(fact.get("trole").value(), "supervisee");
    EXPECT_EQ(fact.get("s").value(), "Ann");
    EXPECT_EQ(fact.get("t").value(), "Bob");
    EXPECT_EQ(fact.size(), 5);
    EXPECT_EQ(kb.num_inferred(), 1);
}

TEST_F(KnowledgeBaseTest, MaterialiseWithUnboundPlayerFails) {
    AtomicQuery head(binary("parenthood", "mother", "m", "child", "c"));
    EXPECT_TRUE(kb.materialise(head, Substitution{{"m", "Ann"}}).empty());
    EXPECT_EQ(kb.size(), 0);
}
