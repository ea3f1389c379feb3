/**
 * Family Reasoning Example
 *
 * Demonstrates rule-based resolution over a small family store:
 * - Role hierarchies (mother and father are parents)
 * - Recursive rules (ancestry)
 * - Materialising rules and the shared answer cache
 */

#include <reasoner/reasoner.hpp>
#include <iostream>

using namespace reasoner;

namespace {

Atom relation(const std::string& predicate,
              const std::string& role_a, const std::string& a,
              const std::string& role_b, const std::string& b) {
    return Atom(predicate, {RolePlayer(role_a, a), RolePlayer(role_b, b)});
}

void print_answers(const std::string& title, const std::vector<Substitution>& answers) {
    std::cout << title << " (" << answers.size() << " answers)\n";
    for (const auto& answer : answers) {
        std::cout << "  " << answer.to_string();
        if (answer.explanation()) {
            std::cout << "  <- " << answer.explanation()->to_string();
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

} // namespace

int main() {
    std::cout << "=== Family Reasoning Example ===\n\n";

    KnowledgeBase kb;
    Schema& schema = kb.schema();
    schema.add_role("parent");
    schema.add_role("mother", "parent");
    schema.add_role("father", "parent");
    schema.add_role("child");
    schema.add_role("ancestor");
    schema.add_role("descendant");

    kb.insert("parenthood", {{"mother", "Ada"}, {"child", "Ben"}});
    kb.insert("parenthood", {{"father", "Ben"}, {"child", "Cal"}});
    kb.insert("parenthood", {{"mother", "Cal"}, {"child", "Dee"}});
    kb.insert("parenthood", {{"father", "Eli"}, {"child", "Dee"}});
    std::cout << "Store holds " << kb.size() << " parenthood facts\n\n";

    Reasoner reasoner(kb);

    // Ancestry is the transitive closure of parenthood
    reasoner.add_rule(InferenceRule(
        "ancestry-base",
        {relation("parenthood", "parent", "p", "child", "c")},
        relation("ancestry", "ancestor", "p", "descendant", "c")));
    reasoner.add_rule(InferenceRule(
        "ancestry-step",
        {relation("parenthood", "parent", "p", "child", "m"),
         relation("ancestry", "ancestor", "m", "descendant", "c")},
        relation("ancestry", "ancestor", "p", "descendant", "c")));

    // Grandparenthood is written back to the store
    reasoner.add_rule(InferenceRule(
        "grandparenthood",
        {relation("parenthood", "parent", "g", "child", "p"),
         relation("parenthood", "parent", "p", "child", "c")},
        relation("grandparenthood", "grandparent", "g", "grandchild", "c"),
        true));

    for (const auto& rule : reasoner.rules()) {
        std::cout << "Rule " << rule.to_string() << "\n";
    }
    std::cout << "\n";

    print_answers("Mothers", reasoner.resolve(AtomicQuery(relation("parenthood", "mother", "m", "child", "c"))));

    print_answers("Parents of Dee", reasoner.resolve(AtomicQuery(
        relation("parenthood", "parent", "p", "child", "c"), Substitution{{"c", "Dee"}})));

    print_answers("Ancestors of Dee", reasoner.resolve(AtomicQuery(
        relation("ancestry", "ancestor", "a", "descendant", "d"), Substitution{{"d", "Dee"}})));

    AtomicQuery grandparents(relation("grandparenthood", "grandparent", "g", "grandchild", "c"));
    print_answers("Grandparents", reasoner.resolve(grandparents));
    std::cout << "Inferred facts written: " << kb.num_inferred() << "\n";

    // Second resolution is served by the cache, nothing new is written
    reasoner.resolve(grandparents);
    std::cout << "After resolving again: " << kb.num_inferred() << "\n";
    std::cout << "Cache classes: " << reasoner.cache().size()
              << ", cached answers: " << reasoner.cache().total_answers() << "\n\n";

    // Conjunction: grandparents of someone whose parent is a mother
    std::vector<Atom> goal{relation("grandparenthood", "grandparent", "g", "grandchild", "c"),
                           relation("parenthood", "mother", "m", "child", "c")};
    print_answers("Grandparents with a mother in between", reasoner.resolve(goal));

    return 0;
}
