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
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "export.h"
#include "test_util.h"

using namespace wardcast;
using namespace wardcast::testing;

static std::vector<std::string>
Lines(const std::string& text)
{
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.emplace_back(line);
    }
    return lines;
}

TEST(ExportTest, ResourceHeaderAndQuoting) {
    ResourceAllocation a;
    a.set_ward("St. Mary's, \"Old\" Town");
    a.set_ward_class(WARD_BATTLEGROUND);
    a.set_score(71);
    a.set_hours(250);
    a.set_pct_of_total(25.0);
    a.set_electorate(6200);
    a.set_win_probability(0.48);
    a.set_incremental_votes(300);
    a.set_cost_per_vote(0.8);
    a.set_roi(ROI_HIGH);

    std::ostringstream out;
    WriteResourceCsv(out, "Testshire", "Green", {a});
    auto lines = Lines(out.str());
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0][0], '#');
    EXPECT_EQ(lines[1][0], '#');
    EXPECT_EQ(lines[2], "Ward,Classification,Priority Score,Allocated Hours,% of Total,"
                        "Electorate,Win Probability (%),Incremental Votes,Cost per Vote,ROI");
    EXPECT_EQ(lines[3], "\"St. Mary's, \"\"Old\"\" Town\",Battleground,71,250,25.0,6200,48,"
                        "300,0.8,high");
}

TEST(ExportTest, CanvassHeaderAndBlocks) {
    CanvassPlan plan;
    auto session = plan.add_sessions();
    session->set_session_number(1);
    auto visit = session->add_visits();
    visit->set_ward("Castle");
    visit->set_visit_order(1);
    *visit->mutable_centroid() = MakeCentroid(52.5, -1.25);
    visit->set_hours(9);
    visit->set_roi("medium");
    visit = session->add_visits();
    visit->set_ward("Abbey");
    visit->set_visit_order(2);
    *visit->mutable_centroid() = MakeCentroid(52.51, -1.3);
    visit->set_hours(4);

    std::ostringstream out;
    WriteCanvassCsv(out, "Testshire", "Green", plan);
    auto lines = Lines(out.str());
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_NE(lines[0].find("Testshire"), std::string::npos);
    EXPECT_NE(lines[0].find("Green"), std::string::npos);
    EXPECT_EQ(lines[1], "# 1 sessions");
    EXPECT_EQ(lines[2], "Session,Visit Order,Ward,Latitude,Longitude,Hours,ROI,"
                        "Estimated 4hr Blocks");
    EXPECT_EQ(lines[3], "1,1,Castle,52.500000,-1.250000,9,medium,3");
    EXPECT_EQ(lines[4], "1,2,Abbey,52.510000,-1.300000,4,,1");
}

TEST(ExportTest, StrategyRowsJoinAllocations) {
    RankedWard w = MakeRanked("Castle", WARD_TARGET, 64, 0.42, 5100);
    w.set_winner("Labour");
    w.set_our_share(0.361);
    w.set_swing_required(0.021);
    w.set_turnout(0.31);
    w.set_defender("Labour");
    w.set_confidence(CONFIDENCE_MEDIUM);
    for (int i = 0; i < 4; i++) {
        auto tp = w.add_talking_points();
        tp->set_category("GOTV");
        tp->set_text("Point " + std::to_string(i));
    }
    RankedWard other = MakeRanked("Abbey", WARD_WRITE_OFF, 12, 0.01, 4000);
    other.set_winner("Labour");

    ResourceAllocation a;
    a.set_ward("Castle");
    a.set_hours(120);
    a.set_roi(ROI_MEDIUM);

    std::ostringstream out;
    WriteStrategyCsv(out, "Testshire", "Green", MakeDate(2026, 5, 7), {w, other}, {a});
    auto lines = Lines(out.str());
    ASSERT_EQ(lines.size(), 6u);
    EXPECT_EQ(lines[1], "# Generated: 2026-05-07");
    EXPECT_EQ(lines[2], "# Wards: 2");
    EXPECT_EQ(lines[3], "Rank,Ward,Classification,Predicted Winner,Our Vote Share (%),"
                        "Swing Required (pp),Win Probability (%),Turnout (%),Electorate,"
                        "Priority Score,Defender,Confidence,Allocated Hours,ROI,"
                        "Top Talking Points");
    EXPECT_EQ(lines[4], "1,Castle,Target,Labour,36.1,2.1,42,31,5100,64,Labour,medium,120,"
                        "medium,GOTV: Point 0 | GOTV: Point 1 | GOTV: Point 2");
    EXPECT_EQ(lines[5], "2,Abbey,Write-off,Labour,0.0,0.0,1,0,4000,12,N/A,none,0,N/A,");
}
