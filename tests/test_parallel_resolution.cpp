#include <gtest/gtest.h>
#include <reasoner/reasoner.hpp>
#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include "test_helpers.hpp"

using namespace reasoner;
using test_utils::binary;

class ParallelResolutionTest : public ::testing::Test {
protected:
    static constexpr std::size_t NUM_THREADS = 8;

    KnowledgeBase kb;

    // Resolve the same goal from every thread, returning each thread's answer count
    std::vector<std::size_t> resolve_concurrently(Reasoner& reasoner, const AtomicQuery& goal) {
        std::vector<std::size_t> counts(NUM_THREADS, 0);
        std::vector<std::string> errors(NUM_THREADS);
        std::vector<std::thread> threads;

        for (std::size_t i = 0; i < NUM_THREADS; ++i) {
            threads.emplace_back([&, i]() {
                try {
                    counts[i] = reasoner.resolve(goal).size();
                } catch (const std::exception& e) {
                    errors[i] = e.what();
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        for (std::size_t i = 0; i < NUM_THREADS; ++i) {
            EXPECT_TRUE(errors[i].empty()) << "Thread " << i << " failed: " << errors[i];
        }
        return counts;
    }
};

TEST_F(ParallelResolutionTest, EachDerivedFactIsWrittenOnce) {
    const std::size_t num_contracts = 20;
    for (std::size_t i = 0; i < num_contracts; ++i) {
        kb.insert("contract", {{"company", "company" + std::to_string(i % 4)},
                               {"worker", "worker" + std::to_string(i)}});
    }
    Reasoner reasoner(kb);
    reasoner.add_rule(InferenceRule("hire",
                                    {binary("contract", "company", "x", "worker", "y")},
                                    binary("employment", "employer", "x", "employee", "y"),
                                    true));

    auto counts = resolve_concurrently(reasoner, AtomicQuery(binary("employment", "employer", "x", "employee", "y")));
    for (std::size_t count : counts) {
        EXPECT_EQ(count, num_contracts);
    }
    EXPECT_EQ(kb.num_inferred(), num_contracts);
    EXPECT_EQ(kb.size(), 2 * num_contracts);
}

TEST_F(ParallelResolutionTest, RecursiveRulesAgreeAcrossThreads) {
    test_utils::insert_chain(kb, "edge", {"A", "B", "C", "D", "E", "F"});
    Reasoner reasoner(kb);
    reasoner.add_rule(InferenceRule("path-base",
                                    {binary("edge", "from", "x", "to", "y")},
                                    binary("path", "from", "x", "to", "y")));
    reasoner.add_rule(InferenceRule("path-step",
                                    {binary("edge", "from", "x", "to", "z"),
                                     binary("path", "from", "z", "to", "y")},
                                    binary("path", "from", "x", "to", "y")));

    AtomicQuery path(binary("path", "from", "x", "to", "y"));
    auto counts = resolve_concurrently(reasoner, path);
    for (std::size_t count : counts) {
        EXPECT_EQ(count, 15);
    }
    EXPECT_EQ(kb.num_inferred(), 0);
    EXPECT_TRUE(reasoner.cache().is_complete(path));
}

TEST_F(ParallelResolutionTest, DistinctGoalsShareOneCache) {
    test_utils::insert_chain(kb, "edge", {"A", "B", "C", "D"});
    Reasoner reasoner(kb);
    reasoner.add_rule(InferenceRule("path-base",
                                    {binary("edge", "from", "x", "to", "y")},
                                    binary("path", "from", "x", "to", "y"),
                                    true));
    reasoner.add_rule(InferenceRule("path-step",
                                    {binary("edge", "from", "x", "to", "z"),
                                     binary("path", "from", "z", "to", "y")},
                                    binary("path", "from", "x", "to", "y"),
                                    true));

    const std::vector<std::string> starts{"A", "B", "C", "D"};
    std::vector<std::size_t> counts(starts.size(), 0);
    std::vector<std::string> errors(starts.size());
    std::vector<std::thread> threads;

    for (std::size_t i = 0; i < starts.size(); ++i) {
        threads.emplace_back([&, i]() {
            try {
                AtomicQuery goal(binary("path", "from", "x", "to", "y"), Substitution{{"x", starts[i]}});
                counts[i] = reasoner.resolve(goal).size();
            } catch (const std::exception& e) {
                errors[i] = e.what();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (std::size_t i = 0; i < starts.size(); ++i) {
        EXPECT_TRUE(errors[i].empty()) << errors[i];
        EXPECT_EQ(counts[i], starts.size() - 1 - i) << "from " << starts[i];
    }
    // Every reachable pair materialised exactly once
    EXPECT_EQ(kb.num_inferred(), 6);
}
