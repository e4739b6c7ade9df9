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
#include "baseline.h"

#include <algorithm>
#include <vector>

#include <amtl/am-string.h>

namespace wardcast {

static const ElectionRecord*
FindBaselineElection(const Ward& ward, const std::string& election_type)
{
    std::vector<const ElectionRecord*> records;
    for (const auto& record : ward.history())
        records.emplace_back(&record);

    auto newest_first = [](const ElectionRecord* a, const ElectionRecord* b) -> bool {
        return a->date() > b->date();
    };
    std::stable_sort(records.begin(), records.end(), newest_first);

    for (const auto* record : records) {
        if (record->type().find(election_type) != std::string::npos)
            return record;
    }
    if (records.empty())
        return nullptr;
    return records.front();
}

std::optional<Baseline>
GetBaseline(const Ward& ward, const std::string& election_type, int current_year)
{
    const ElectionRecord* record = FindBaselineElection(ward, election_type);
    if (!record || record->candidates().empty())
        return {};

    Baseline baseline;
    int64_t valid_votes = std::max<int64_t>(1, record->turnout_votes());
    for (const auto& candidate : record->candidates()) {
        double share = candidate.share();
        if (share <= 0.0)
            share = double(candidate.votes()) / double(valid_votes);

        // Several candidates from one party: keep the best.
        auto iter = baseline.parties.find(candidate.party());
        if (iter == baseline.parties.end() || share > iter->second)
            baseline.parties[candidate.party()] = share;
    }

    baseline.date = record->date();
    baseline.type = record->type();
    baseline.year = ElectionYear(*record);
    if (baseline.year > 0)
        baseline.staleness = std::max(0, current_year - baseline.year);
    baseline.turnout = record->turnout();
    baseline.turnout_votes = record->turnout_votes();
    baseline.electorate = record->electorate();
    return {std::move(baseline)};
}

MethodologyStep
DescribeBaseline(const Baseline& baseline)
{
    MethodologyStep step;
    step.set_step(1);
    step.set_name("Baseline");

    auto text = ke::StringPrintf("Most recent %s result (%d-%02d-%02d)", baseline.type.c_str(),
                                 (int)baseline.date.year(), (int)baseline.date.month(),
                                 (int)baseline.date.day());
    if (baseline.staleness > kStaleBaselineYears)
        text += ke::StringPrintf(", %d years old", baseline.staleness);
    step.set_description(text);
    CopyShareMap(baseline.parties, step.mutable_data());
    return step;
}

double
HistoricalWeight(int staleness)
{
    double decay = 1.0 - (staleness - kStaleBaselineYears) * kStaleDecayPerYear;
    return std::clamp(decay, kMinHistoricalWeight, 1.0);
}

bool
BlendStaleBaseline(const Baseline& baseline, const ShareMap& fresh, ShareMap* shares,
                   MethodologyStep* step)
{
    if (baseline.staleness <= kStaleBaselineYears || fresh.empty())
        return false;

    double decay = HistoricalWeight(baseline.staleness);
    double fresh_weight = 1.0 - decay;

    ShareMap blended;
    for (const auto& [party, share] : *shares)
        blended[party] = share * decay;
    for (const auto& [party, share] : fresh)
        blended[party] += share * fresh_weight;
    *shares = std::move(blended);

    step->set_step(1);
    step->set_name("Stale Baseline Decay");
    step->set_description(ke::StringPrintf(
        "Baseline is %d years old, blending %.0f%% historical with %.0f%% constituency result",
        baseline.staleness, decay * 100, fresh_weight * 100));
    auto& data = *step->mutable_data();
    data["decay_factor"] = decay;
    data["fresh_weight"] = fresh_weight;
    data["staleness_years"] = baseline.staleness;
    return true;
}

} // namespace wardcast
