#ifndef REASONER_RESOLUTION_ITERATOR_HPP
#define REASONER_RESOLUTION_ITERATOR_HPP

#include <reasoner/query.hpp>
#include <reasoner/resolution_tree.hpp>
#include <reasoner/substitution.hpp>
#include <reasoner/types.hpp>
#include <memory>
#include <optional>
#include <set>
#include <vector>

namespace reasoner {

/**
 * Pull-based driver of a resolution.
 *
 * Walks a resolution tree with an explicit stack. When a tree is exhausted
 * and the cache or the store grew while walking it, a fresh tree is started
 * so that answers derived late (recursive rules) feed earlier subgoals.
 * Each distinct answer is returned once. Dropping the iterator at any point
 * leaves cache and store consistent.
 */
class ResolutionIterator {
private:
    ResolutionContext context_;
    std::vector<AtomicQuery> goal_;
    std::size_t max_iterations_;

    std::unique_ptr<ResolutionTree> tree_;
    std::vector<StateIndex> stack_;
    std::set<Substitution> answers_;
    std::size_t iteration_ = 0;
    std::size_t footprint_ = 0;
    bool done_ = false;

    void start_iteration();
    std::size_t footprint() const;
    void finish(bool converged);

public:
    ResolutionIterator(ResolutionContext context, AtomicQuery goal,
                       std::size_t max_iterations = DEFAULT_MAX_ITERATIONS);

    /**
     * Conjunctive goal, resolved left to right.
     */
    ResolutionIterator(ResolutionContext context, std::vector<AtomicQuery> goal,
                       std::size_t max_iterations = DEFAULT_MAX_ITERATIONS);

    ResolutionIterator(ResolutionIterator&&) = default;

    /**
     * Next new answer, nullopt once resolution is exhausted.
     * Internal faults surface as ResolutionError.
     */
    std::optional<Substitution> next();

    // Remaining answers
    std::vector<Substitution> collect();

    std::size_t iterations() const { return iteration_; }
    bool done() const { return done_; }
};

} // namespace reasoner

#endif // REASONER_RESOLUTION_ITERATOR_HPP
