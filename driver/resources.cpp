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
#include "resources.h"

#include <math.h>

#include <algorithm>
#include <limits>

#include "mathlib.h"
#include "strategy.h"

namespace wardcast {

double
ClassMultiplier(WardClass c)
{
    switch (c) {
      case WARD_SAFE:
        return 0.2;
      case WARD_HOLD:
        return 0.6;
      case WARD_MARGINAL_HOLD:
        return 1.2;
      case WARD_BATTLEGROUND:
        return 1.5;
      case WARD_TARGET:
        return 1.3;
      case WARD_STRETCH:
        return 0.4;
      case WARD_WRITE_OFF:
        return 0.05;
      default:
        return 0.5;
    }
}

// Diminishing returns at both ends: near-certain wins and hopeless seats
// both get less than the true marginals.
double
UrgencyFactor(double win_probability)
{
    if (win_probability > 0.7)
        return 0.6;
    if (win_probability > 0.5)
        return 0.8;
    if (win_probability > 0.3)
        return 1.0;
    if (win_probability > 0.1)
        return 0.7;
    return 0.3;
}

RoiTier
RateRoi(double win_probability, double cost_per_vote)
{
    if (win_probability > 0.3 && win_probability < 0.7 && cost_per_vote < 2)
        return ROI_HIGH;
    if (win_probability > 0.2 && cost_per_vote < 4)
        return ROI_MEDIUM;
    return ROI_LOW;
}

const char*
RoiName(RoiTier tier)
{
    switch (tier) {
      case ROI_HIGH:
        return "high";
      case ROI_MEDIUM:
        return "medium";
      default:
        return "low";
    }
}

std::vector<ResourceAllocation>
AllocateResources(const std::vector<RankedWard>& ranked, int64_t total_hours)
{
    std::vector<double> weights;
    double total_weight = 0.0;
    for (const auto& w : ranked) {
        double size_scale = sqrt(double(w.electorate()) / double(kDefaultElectorate));
        double weight = double(w.score()) *
                        ClassMultiplier(w.classification().ward_class()) *
                        UrgencyFactor(w.win_probability()) *
                        size_scale;
        weights.emplace_back(weight);
        total_weight += weight;
    }
    if (total_weight <= 0.0)
        return {};

    std::vector<ResourceAllocation> out;
    for (size_t i = 0; i < ranked.size(); i++) {
        const auto& w = ranked[i];
        double pct = weights[i] / total_weight;
        int64_t hours = (int64_t)round(double(total_hours) * pct);
        double incremental = double(hours) * kContactsPerHour * kPersuasionRate;
        double cost_per_vote = incremental > 0
                               ? double(hours) / incremental
                               : std::numeric_limits<double>::infinity();

        ResourceAllocation a;
        a.set_ward(w.ward());
        a.set_ward_class(w.classification().ward_class());
        a.set_score(w.score());
        a.set_hours(hours);
        a.set_pct_of_total(round(pct * 1000) / 10);
        a.set_electorate(w.electorate());
        a.set_win_probability(w.win_probability());
        a.set_incremental_votes((int64_t)round(incremental));
        a.set_cost_per_vote(std::isinf(cost_per_vote) ? cost_per_vote
                                                      : RoundTo(cost_per_vote, 1));
        a.set_roi(RateRoi(w.win_probability(), cost_per_vote));
        out.emplace_back(std::move(a));
    }

    auto cmp = [](const ResourceAllocation& a, const ResourceAllocation& b) -> bool {
        if (a.hours() != b.hours())
            return a.hours() > b.hours();
        return a.ward() < b.ward();
    };
    std::sort(out.begin(), out.end(), cmp);
    return out;
}

} // namespace wardcast
