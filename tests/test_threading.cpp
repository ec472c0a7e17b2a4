/**
 * Canopy Threading Tests
 */

#include <gtest/gtest.h>
#include "canopy/threading.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace canopy;

TEST(ThreadingTest, RunsEveryUnit) {
    std::vector<int> hits(100, 0);
    threading::parallel_for(0, hits.size(), [&](size_t i) { hits[i] += 1; });

    for (int h : hits) {
        EXPECT_EQ(h, 1);
    }
}

TEST(ThreadingTest, EmptyRange) {
    bool called = false;
    threading::parallel_for(5, 5, [&](size_t) { called = true; });
    EXPECT_FALSE(called);
}

TEST(ThreadingTest, PropagatesLowestIndexFailure) {
    std::atomic<int> completed{0};

    try {
        threading::parallel_for(0, 20, [&](size_t i) {
            if (i == 7 || i == 13) {
                throw std::runtime_error("unit " + std::to_string(i));
            }
            ++completed;
        }, 4);
        FAIL() << "expected an exception";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "unit 7");
    }

    // Peers of the failed units still ran
    EXPECT_EQ(completed.load(), 18);
}

TEST(ThreadingTest, NestedCallsComplete) {
    std::vector<int> hits(16, 0);
    threading::parallel_for(0, 4, [&](size_t outer) {
        threading::parallel_for(0, 4, [&](size_t inner) {
            hits[outer * 4 + inner] += 1;
        });
    });

    for (int h : hits) {
        EXPECT_EQ(h, 1);
    }
}

TEST(ThreadingTest, ThreadCountCapsConcurrency) {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    threading::parallel_for(0, 32, [&](size_t) {
        int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --active;
    }, 2);

    EXPECT_GE(peak.load(), 1);
    EXPECT_LE(peak.load(), 2);
}

TEST(ThreadingTest, ResizeWhileRunning) {
    std::vector<int> hits(64, 0);
    std::thread runner([&] {
        threading::parallel_for(0, hits.size(), [&](size_t i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            hits[i] += 1;
        });
    });

    threading::set_num_threads(2);
    threading::set_num_threads(0);
    runner.join();

    for (int h : hits) {
        EXPECT_EQ(h, 1);
    }
}

TEST(ThreadingTest, MaxThreadsPositive) {
    EXPECT_GE(threading::get_max_threads(), 1);
}
