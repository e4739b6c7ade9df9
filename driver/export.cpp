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
#include "export.h"

#include <math.h>

#include <map>

#include <amtl/am-string.h>
#include <csv.hpp>

#include "canvass.h"
#include "predict.h"
#include "resources.h"
#include "strategy.h"

namespace wardcast {

using Row = std::vector<std::string>;

static std::string
Percent(double fraction, int places)
{
    return ke::StringPrintf("%.*f", places, fraction * 100);
}

static std::string
FormatDate(const Date& date)
{
    return ke::StringPrintf("%04d-%02u-%02u", date.year(), date.month(), date.day());
}

void
WriteStrategyCsv(std::ostream& out, const std::string& council, const std::string& our_party,
                 const Date& generated, const std::vector<RankedWard>& ranked,
                 const std::vector<ResourceAllocation>& allocations)
{
    std::map<std::string, const ResourceAllocation*> by_ward;
    for (const auto& a : allocations)
        by_ward.emplace(a.ward(), &a);

    out << "# " << council << " strategy export for " << our_party << "\n";
    out << "# Generated: " << FormatDate(generated) << "\n";
    out << "# Wards: " << ranked.size() << "\n";

    auto writer = csv::make_csv_writer(out);
    writer << Row{"Rank", "Ward", "Classification", "Predicted Winner", "Our Vote Share (%)",
                  "Swing Required (pp)", "Win Probability (%)", "Turnout (%)", "Electorate",
                  "Priority Score", "Defender", "Confidence", "Allocated Hours", "ROI",
                  "Top Talking Points"};

    int rank = 1;
    for (const auto& w : ranked) {
        std::string points;
        for (int i = 0; i < w.talking_points_size() && i < kExportTalkingPoints; i++) {
            const auto& tp = w.talking_points(i);
            if (!points.empty())
                points += " | ";
            points += tp.category() + ": " + tp.text();
        }

        std::string hours = "0";
        std::string roi = "N/A";
        if (auto iter = by_ward.find(w.ward()); iter != by_ward.end()) {
            hours = std::to_string(iter->second->hours());
            roi = RoiName(iter->second->roi());
        }

        writer << Row{
            std::to_string(rank++),
            w.ward(),
            WardClassLabel(w.classification().ward_class()),
            w.winner(),
            Percent(w.our_share(), 1),
            Percent(w.swing_required(), 1),
            Percent(w.win_probability(), 0),
            Percent(w.turnout(), 0),
            std::to_string(w.electorate()),
            std::to_string(w.score()),
            w.defender().empty() ? "N/A" : w.defender(),
            ConfidenceName(w.confidence()),
            hours,
            roi,
            points,
        };
    }
}

void
WriteResourceCsv(std::ostream& out, const std::string& council, const std::string& our_party,
                 const std::vector<ResourceAllocation>& allocations)
{
    int64_t total = 0;
    for (const auto& a : allocations)
        total += a.hours();

    out << "# " << council << " resource allocation for " << our_party << "\n";
    out << "# Total hours: " << total << "\n";

    auto writer = csv::make_csv_writer(out);
    writer << Row{"Ward", "Classification", "Priority Score", "Allocated Hours", "% of Total",
                  "Electorate", "Win Probability (%)", "Incremental Votes", "Cost per Vote",
                  "ROI"};
    for (const auto& a : allocations) {
        std::string cost = std::isinf(a.cost_per_vote())
                           ? "N/A"
                           : ke::StringPrintf("%.1f", a.cost_per_vote());
        writer << Row{
            a.ward(),
            WardClassLabel(a.ward_class()),
            std::to_string(a.score()),
            std::to_string(a.hours()),
            ke::StringPrintf("%.1f", a.pct_of_total()),
            std::to_string(a.electorate()),
            Percent(a.win_probability(), 0),
            std::to_string(a.incremental_votes()),
            cost,
            RoiName(a.roi()),
        };
    }
}

void
WriteCanvassCsv(std::ostream& out, const std::string& council, const std::string& our_party,
                const CanvassPlan& plan)
{
    out << "# " << council << " canvassing plan for " << our_party << "\n";
    out << "# " << plan.sessions_size() << " sessions\n";

    auto writer = csv::make_csv_writer(out);
    writer << Row{"Session", "Visit Order", "Ward", "Latitude", "Longitude", "Hours", "ROI",
                  "Estimated 4hr Blocks"};
    for (const auto& session : plan.sessions()) {
        for (const auto& visit : session.visits()) {
            writer << Row{
                std::to_string(session.session_number()),
                std::to_string(visit.visit_order()),
                visit.ward(),
                ke::StringPrintf("%.6f", visit.centroid().lat()),
                ke::StringPrintf("%.6f", visit.centroid().lng()),
                ke::StringPrintf("%g", visit.hours()),
                visit.roi(),
                std::to_string((int)ceil(visit.hours() / kHoursPerBlock)),
            };
        }
    }
}

} // namespace wardcast
