#pragma once
#include <gtest/gtest.h>
#include <reasoner/atom.hpp>
#include <reasoner/inference_rule.hpp>
#include <reasoner/knowledge_base.hpp>
#include <reasoner/query.hpp>
#include <reasoner/substitution.hpp>
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace test_utils {

/**
 * Binary relation "(role_a: $a, role_b: $b) isa predicate"
 */
inline reasoner::Atom binary(const std::string& predicate,
                             const std::string& role_a, const std::string& a,
                             const std::string& role_b, const std::string& b,
                             const std::string& relation_var = "") {
    return reasoner::Atom(predicate, {reasoner::RolePlayer(role_a, a), reasoner::RolePlayer(role_b, b)},
                          relation_var);
}

/**
 * Directed edge chain nodes[0] -> nodes[1] -> ... as (from, to) facts
 */
inline void insert_chain(reasoner::KnowledgeBase& kb, const std::string& predicate,
                         const std::vector<std::string>& nodes) {
    for (std::size_t i = 0; i + 1 < nodes.size(); ++i) {
        kb.insert(predicate, {{"from", nodes[i]}, {"to", nodes[i + 1]}});
    }
}

inline std::vector<reasoner::Substitution> sorted(std::vector<reasoner::Substitution> answers) {
    std::sort(answers.begin(), answers.end());
    return answers;
}

inline bool contains_answer(const std::vector<reasoner::Substitution>& answers,
                            const reasoner::Substitution& expected) {
    return std::any_of(answers.begin(), answers.end(), [&expected](const reasoner::Substitution& answer) {
        return answer.subsumes(expected);
    });
}

inline void expect_contains(const std::vector<reasoner::Substitution>& answers,
                            const reasoner::Substitution& expected) {
    EXPECT_TRUE(contains_answer(answers, expected))
        << "Missing answer " << expected.to_string() << " among " << answers.size() << " answers";
}

} // namespace test_utils
