#include <reasoner/indexed_answer_set.hpp>
#include <algorithm>
#include <iterator>

namespace reasoner {

std::vector<std::size_t> IndexedAnswerSet::candidates(const Substitution& partial) const {
    std::vector<std::size_t> result;
    bool first = true;

    for (const auto& [var, value] : partial.bindings()) {
        auto var_it = index_.find(var);
        if (var_it == index_.end()) return {};
        auto value_it = var_it->second.find(value);
        if (value_it == var_it->second.end()) return {};

        const auto& postings = value_it->second;
        if (first) {
            result = postings;
            first = false;
        } else {
            std::vector<std::size_t> intersection;
            std::set_intersection(result.begin(), result.end(),
                                  postings.begin(), postings.end(),
                                  std::back_inserter(intersection));
            result = std::move(intersection);
        }
        if (result.empty()) break;
    }
    return result;
}

bool IndexedAnswerSet::add(const Substitution& answer) {
    if (answer.empty() || !candidates(answer).empty()) {
        return false;
    }

    std::size_t position = answers_.size();
    answers_.push_back(answer);
    for (const auto& [var, value] : answer.bindings()) {
        index_[var][value].push_back(position);
    }
    return true;
}

std::vector<Substitution> IndexedAnswerSet::get(const Substitution& partial) const {
    if (partial.empty()) {
        return answers_;
    }

    std::vector<Substitution> result;
    for (std::size_t position : candidates(partial)) {
        result.push_back(answers_[position]);
    }
    return result;
}

} // namespace reasoner
