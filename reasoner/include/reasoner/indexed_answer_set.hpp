#ifndef REASONER_INDEXED_ANSWER_SET_HPP
#define REASONER_INDEXED_ANSWER_SET_HPP

#include <reasoner/substitution.hpp>
#include <reasoner/types.hpp>
#include <map>
#include <vector>

namespace reasoner {

/**
 * Answers of one equivalence class with an inverted index
 * variable -> concept -> answer positions.
 *
 * Posting lists are kept sorted (answers are append-only), so lookups are
 * intersections of sorted lists. Not thread-safe; the owning cache entry
 * serialises access.
 */
class IndexedAnswerSet {
private:
    std::vector<Substitution> answers_;
    std::map<Variable, std::map<ConceptId, std::vector<std::size_t>>> index_;

    // Positions of answers containing every binding of partial
    std::vector<std::size_t> candidates(const Substitution& partial) const;

public:
    /**
     * Insert unless an equal or subsuming answer is already present.
     * Returns true if the answer was inserted.
     */
    bool add(const Substitution& answer);

    // Answers consistent with the partial binding; all answers for an empty one
    std::vector<Substitution> get(const Substitution& partial) const;

    bool contains(const Substitution& answer) const {
        return !answer.empty() && !candidates(answer).empty();
    }

    std::size_t size() const { return answers_.size(); }
    bool empty() const { return answers_.empty(); }
    const std::vector<Substitution>& answers() const { return answers_; }
};

} // namespace reasoner

#endif // REASONER_INDEXED_ANSWER_SET_HPP
