/**
 * Copyright © 2025 IBM Corporation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "poll.hpp"
#include "types.hpp"

#include <chrono>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

using namespace pdu_cycle;
using namespace std::chrono_literals;

TEST(PollTests, PollWithTimeout)
{
    // Test where works: Probe returns target value on first evaluation
    {
        int evaluations{0};
        std::vector<std::chrono::seconds> sleeps{};
        bool result = pollWithTimeout(
            [&evaluations]() {
                ++evaluations;
                return OutletState::off;
            },
            OutletState::off, 5s, 40s,
            [&sleeps](std::chrono::seconds d) { sleeps.emplace_back(d); });
        EXPECT_TRUE(result);
        EXPECT_EQ(evaluations, 1);
        EXPECT_TRUE(sleeps.empty());
    }

    // Test where works: Probe returns target value on third evaluation
    {
        int evaluations{0};
        std::vector<std::chrono::seconds> sleeps{};
        bool result = pollWithTimeout(
            [&evaluations]() { return (++evaluations >= 3); }, true, 2s, 300s,
            [&sleeps](std::chrono::seconds d) { sleeps.emplace_back(d); });
        EXPECT_TRUE(result);
        EXPECT_EQ(evaluations, 3);
        std::vector<std::chrono::seconds> expected{2s, 2s};
        EXPECT_EQ(sleeps, expected);
    }

    // Test where works: Probe returns target value on last evaluation before
    // the budget is exhausted
    {
        int evaluations{0};
        std::vector<std::chrono::seconds> sleeps{};
        bool result = pollWithTimeout(
            [&evaluations]() { return (++evaluations == 3); }, true, 5s, 10s,
            [&sleeps](std::chrono::seconds d) { sleeps.emplace_back(d); });
        EXPECT_TRUE(result);
        EXPECT_EQ(evaluations, 3);
        EXPECT_EQ(sleeps.size(), 2);
    }

    // Test where fails: timeout=10, interval=5, value never changes.  Budget
    // goes 10 -> 5 -> 0 -> -5, so the probe is evaluated 3 times and the
    // third sleep never happens.
    {
        int evaluations{0};
        std::vector<std::chrono::seconds> sleeps{};
        bool result = pollWithTimeout(
            [&evaluations]() {
                ++evaluations;
                return OutletState::on;
            },
            OutletState::off, 5s, 10s,
            [&sleeps](std::chrono::seconds d) { sleeps.emplace_back(d); });
        EXPECT_FALSE(result);
        EXPECT_EQ(evaluations, 3);
        std::vector<std::chrono::seconds> expected{5s, 5s};
        EXPECT_EQ(sleeps, expected);
    }

    // Test where fails: Timeout is not a multiple of the interval
    {
        int evaluations{0};
        int sleepCount{0};
        bool result = pollWithTimeout(
            [&evaluations]() {
                ++evaluations;
                return false;
            },
            true, 5s, 12s, [&sleepCount](std::chrono::seconds) {
                ++sleepCount;
            });
        EXPECT_FALSE(result);
        EXPECT_EQ(evaluations, 3);
        EXPECT_EQ(sleepCount, 2);
    }

    // Test where fails: Zero timeout allows exactly one evaluation
    {
        int evaluations{0};
        int sleepCount{0};
        bool result = pollWithTimeout(
            [&evaluations]() {
                ++evaluations;
                return false;
            },
            true, 2s, 0s, [&sleepCount](std::chrono::seconds) {
                ++sleepCount;
            });
        EXPECT_FALSE(result);
        EXPECT_EQ(evaluations, 1);
        EXPECT_EQ(sleepCount, 0);
    }

    // Test where fails: Probe throws an exception
    try
    {
        int sleepCount{0};
        pollWithTimeout(
            []() -> bool { throw std::runtime_error{"Probe failed"}; }, true,
            2s, 10s, [&sleepCount](std::chrono::seconds) { ++sleepCount; });
        ADD_FAILURE() << "Should not have reached this line.";
    }
    catch (const std::runtime_error& e)
    {
        EXPECT_STREQ(e.what(), "Probe failed");
    }
}
