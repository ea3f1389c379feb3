#include <reasoner/resolution_iterator.hpp>
#include <reasoner/debug_log.hpp>
#include <stdexcept>

namespace reasoner {

ResolutionIterator::ResolutionIterator(ResolutionContext context, AtomicQuery goal, std::size_t max_iterations)
    : ResolutionIterator(context, std::vector<AtomicQuery>{std::move(goal)}, max_iterations) {}

ResolutionIterator::ResolutionIterator(ResolutionContext context, std::vector<AtomicQuery> goal,
                                       std::size_t max_iterations)
    : context_(context)
    , goal_(std::move(goal))
    , max_iterations_(max_iterations == 0 ? 1 : max_iterations) {
    if (goal_.empty()) {
        throw std::invalid_argument("Resolution goal must have at least one atom");
    }
    start_iteration();
}

std::size_t ResolutionIterator::footprint() const {
    return context_.cache.total_answers() + context_.kb.size();
}

void ResolutionIterator::start_iteration() {
    ++iteration_;
    footprint_ = footprint();
    tree_ = std::make_unique<ResolutionTree>(context_);
    stack_.clear();

    StateIndex root = goal_.size() == 1
        ? tree_->add_atomic_state(goal_.front(), Substitution(), Unifier(), NO_STATE)
        : tree_->add_cumulative_state(goal_, Substitution(), Unifier(), NO_STATE);
    stack_.push_back(root);

    DEBUG_LOG("iteration %zu: %s", iteration_, tree_->state(root).to_string().c_str());
}

void ResolutionIterator::finish(bool converged) {
    done_ = true;
    stack_.clear();
    tree_.reset();

    // The root class now holds every answer of a single-atom goal
    if (converged && context_.infer && goal_.size() == 1) {
        context_.cache.ack_completeness(goal_.front());
    }
    DEBUG_LOG("resolution done after %zu iterations, %zu answers%s",
              iteration_, answers_.size(), converged ? "" : " (not converged)");
}

std::optional<Substitution> ResolutionIterator::next() {
    while (!done_) {
        debug::IterationScope scope(iteration_);
        while (!stack_.empty()) {
            StateIndex index = stack_.back();
            stack_.pop_back();

            const ResolutionState& current = tree_->state(index);
            if (current.is_answer_state() && current.is_top_state()) {
                Substitution answer = current.substitution();
                if (answers_.insert(answer).second) {
                    return answer;
                }
                continue;
            }

            StateIndex child = tree_->generate_child(index);
            if (child != NO_STATE) {
                if (!tree_->state(index).is_answer_state()) {
                    stack_.push_back(index);
                }
                stack_.push_back(child);
            }
        }

        const bool grew = footprint() != footprint_;
        if (!context_.infer) {
            finish(false);
        } else if (!grew) {
            finish(true);
        } else if (iteration_ >= max_iterations_) {
            finish(false);
        } else {
            start_iteration();
        }
    }
    return std::nullopt;
}

std::vector<Substitution> ResolutionIterator::collect() {
    std::vector<Substitution> results;
    while (auto answer = next()) {
        results.push_back(std::move(*answer));
    }
    return results;
}

} // namespace reasoner
