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

#include <set>

#include <gtest/gtest.h>

#include "canvass.h"
#include "mathlib.h"
#include "test_util.h"

using namespace wardcast;
using namespace wardcast::testing;

class CanvassTest : public ::testing::Test
{
  protected:
    void SetUp() override {
        // Two tight groups roughly 30km apart.
        const double west[][2] = {{52.40, -1.50}, {52.41, -1.51}, {52.42, -1.49},
                                  {52.40, -1.48}, {52.43, -1.50}};
        const double east[][2] = {{52.40, -1.05}, {52.41, -1.06}, {52.42, -1.04},
                                  {52.43, -1.05}};
        int n = 0;
        for (const auto& p : west) {
            std::string name = "W" + std::to_string(n++);
            centroids_[name] = MakeCentroid(p[0], p[1]);
            wards_.emplace_back(name);
        }
        n = 0;
        for (const auto& p : east) {
            std::string name = "E" + std::to_string(n++);
            centroids_[name] = MakeCentroid(p[0], p[1]);
            wards_.emplace_back(name);
        }
        wards_.emplace_back("NoCentroid");
    }

    CentroidMap centroids_;
    std::vector<std::string> wards_;
};

TEST(HaversineTest, KnownDistance) {
    // London to Paris, about 344km.
    double d = Haversine(MakeCentroid(51.5074, -0.1278), MakeCentroid(48.8566, 2.3522));
    EXPECT_NEAR(d, 343.5, 1.0);
    EXPECT_DOUBLE_EQ(Haversine(MakeCentroid(52, -1), MakeCentroid(52, -1)), 0.0);
}

TEST_F(CanvassTest, SmallInputIsOneCluster) {
    auto clusters = ClusterWards(centroids_, wards_, 20);
    ASSERT_EQ(clusters.size(), 1u);
    EXPECT_EQ(clusters[0].wards_size(), 9);
    EXPECT_NEAR(clusters[0].centroid().lat(), (52.40 + 52.41 + 52.42 + 52.40 + 52.43 +
                                               52.40 + 52.41 + 52.42 + 52.43) / 9, 1e-9);
}

TEST_F(CanvassTest, ClustersCoverInputAndSplitByDistance) {
    auto clusters = ClusterWards(centroids_, wards_, 5);
    ASSERT_EQ(clusters.size(), 2u);

    std::set<std::string> seen;
    for (const auto& cluster : clusters) {
        char group = cluster.wards(0)[0];
        for (const auto& ward : cluster.wards()) {
            EXPECT_TRUE(seen.insert(ward).second) << ward;
            EXPECT_EQ(ward[0], group) << ward;
        }
    }
    EXPECT_EQ(seen.size(), 9u);
    EXPECT_EQ(seen.count("NoCentroid"), 0u);

    // Same input, same answer.
    auto again = ClusterWards(centroids_, wards_, 5);
    ASSERT_EQ(again.size(), clusters.size());
    for (size_t i = 0; i < clusters.size(); i++)
        EXPECT_EQ(again[i].SerializeAsString(), clusters[i].SerializeAsString());
}

TEST_F(CanvassTest, EmptyInputGivesNoClusters) {
    EXPECT_TRUE(ClusterWards(centroids_, {}, 5).empty());
    EXPECT_TRUE(ClusterWards(centroids_, {"NoCentroid"}, 5).empty());
}

TEST_F(CanvassTest, RouteVisitsEveryWardOnce) {
    std::vector<ResourceAllocation> allocations;
    for (const auto& name : {"W0", "W1", "E2"}) {
        ResourceAllocation a;
        a.set_ward(name);
        a.set_hours(10);
        a.set_roi(ROI_HIGH);
        allocations.emplace_back(a);
    }

    auto clusters = ClusterWards(centroids_, wards_, 5);
    CanvassPlan plan = OptimiseCanvassingRoute(clusters, centroids_, allocations);
    ASSERT_EQ(plan.sessions_size(), 2);

    std::set<std::string> seen;
    int visits = 0;
    for (int s = 0; s < plan.sessions_size(); s++) {
        const auto& session = plan.sessions(s);
        EXPECT_EQ(session.session_number(), s + 1);

        double hours = 0.0;
        for (int v = 0; v < session.visits_size(); v++) {
            const auto& visit = session.visits(v);
            EXPECT_EQ(visit.visit_order(), v + 1);
            EXPECT_TRUE(seen.insert(visit.ward()).second) << visit.ward();
            hours += visit.hours();
            visits++;
        }
        EXPECT_DOUBLE_EQ(session.total_hours(), hours);
        EXPECT_EQ(session.blocks(), (int)ceil(hours / kHoursPerBlock));
    }
    EXPECT_EQ(visits, 9);
    // One segment between every consecutive pair of visits, sessions included.
    EXPECT_EQ(plan.route_size(), visits - 1);

    for (const auto& session : plan.sessions()) {
        for (const auto& visit : session.visits()) {
            if (visit.ward() == "W0") {
                EXPECT_DOUBLE_EQ(visit.hours(), 10.0);
                EXPECT_EQ(visit.roi(), "high");
            } else if (visit.ward() == "W2") {
                EXPECT_DOUBLE_EQ(visit.hours(), kHoursPerBlock);
                EXPECT_TRUE(visit.roi().empty());
            }
        }
    }
}

TEST_F(CanvassTest, RouteStartsFromFirstClusterAndFirstWard) {
    auto clusters = ClusterWards(centroids_, wards_, 5);
    CanvassPlan plan = OptimiseCanvassingRoute(clusters, centroids_, {});
    ASSERT_GT(plan.sessions_size(), 0);
    EXPECT_EQ(plan.sessions(0).visits(0).ward(), clusters[0].wards(0));
}
