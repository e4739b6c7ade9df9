// vim: set sts=4 ts=8 sw=4 tw=99 et:
//
// Copyright (C) 2016-2020 David Anderson
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#include <math.h>
#include <stdlib.h>

#include <gtest/gtest.h>

#include "resources.h"
#include "test_util.h"

using namespace wardcast;
using namespace wardcast::testing;

TEST(ResourcesTest, HoursSumToBudget) {
    std::vector<RankedWard> ranked = {
        MakeRanked("Abbey", WARD_BATTLEGROUND, 72, 0.48, 6000),
        MakeRanked("Brook", WARD_TARGET, 65, 0.35, 4000),
        MakeRanked("Cross", WARD_SAFE, 40, 0.95, 5000),
        MakeRanked("Dale", WARD_STRETCH, 38, 0.15, 8000),
        MakeRanked("Elm", WARD_WRITE_OFF, 20, 0.02, 3000),
        MakeRanked("Fen", WARD_MARGINAL_HOLD, 70, 0.55, 5500),
    };
    auto allocations = AllocateResources(ranked, 1000);
    ASSERT_EQ(allocations.size(), ranked.size());

    int64_t total = 0;
    for (const auto& a : allocations)
        total += a.hours();
    // Each ward rounds to the nearest hour.
    EXPECT_LE(llabs(total - 1000), (long long)ranked.size());

    for (size_t i = 1; i < allocations.size(); i++)
        EXPECT_GE(allocations[i - 1].hours(), allocations[i].hours());
}

TEST(ResourcesTest, BattlegroundOutweighsComparableSafeSeat) {
    std::vector<RankedWard> ranked = {
        MakeRanked("Safe", WARD_SAFE, 60, 0.5, 5000),
        MakeRanked("Battle", WARD_BATTLEGROUND, 60, 0.5, 5000),
    };
    auto allocations = AllocateResources(ranked, 500);
    ASSERT_EQ(allocations.size(), 2u);
    EXPECT_EQ(allocations[0].ward(), "Battle");
    EXPECT_GT(allocations[0].hours(), allocations[1].hours());
}

TEST(ResourcesTest, SingleWriteOffTakesWholeBudget) {
    auto allocations = AllocateResources({MakeRanked("Lost", WARD_WRITE_OFF, 25, 0.01)}, 1000);
    ASSERT_EQ(allocations.size(), 1u);
    EXPECT_EQ(allocations[0].hours(), 1000);
    EXPECT_DOUBLE_EQ(allocations[0].pct_of_total(), 100.0);
    EXPECT_EQ(allocations[0].incremental_votes(), 1200);
    EXPECT_EQ(allocations[0].roi(), ROI_LOW);
}

TEST(ResourcesTest, NoWeightMeansNoAllocation) {
    EXPECT_TRUE(AllocateResources({}, 1000).empty());
    EXPECT_TRUE(AllocateResources({MakeRanked("Zero", WARD_TARGET, 0, 0.5)}, 1000).empty());
}

TEST(ResourcesTest, UrgencyAndRoiBands) {
    EXPECT_DOUBLE_EQ(UrgencyFactor(0.8), 0.6);
    EXPECT_DOUBLE_EQ(UrgencyFactor(0.6), 0.8);
    EXPECT_DOUBLE_EQ(UrgencyFactor(0.4), 1.0);
    EXPECT_DOUBLE_EQ(UrgencyFactor(0.2), 0.7);
    EXPECT_DOUBLE_EQ(UrgencyFactor(0.05), 0.3);

    EXPECT_EQ(RateRoi(0.5, 0.8), ROI_HIGH);
    EXPECT_EQ(RateRoi(0.8, 0.8), ROI_MEDIUM);
    EXPECT_EQ(RateRoi(0.5, 3.0), ROI_MEDIUM);
    EXPECT_EQ(RateRoi(0.1, 0.8), ROI_LOW);
    EXPECT_EQ(RateRoi(0.5, INFINITY), ROI_LOW);

    EXPECT_DOUBLE_EQ(ClassMultiplier(WARD_BATTLEGROUND), 1.5);
    EXPECT_DOUBLE_EQ(ClassMultiplier(WARD_UNKNOWN), 0.5);
}
