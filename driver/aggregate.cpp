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
#include "aggregate.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "adjustments.h"
#include "logging.h"
#include "predict.h"
#include "progress-bar.h"
#include "threadpool.h"

namespace wardcast {

static const char* kUnknownParty = "Unknown";

static inline void
Credit(SeatTotals* totals, const std::string& party)
{
    (*totals)[party.empty() ? kUnknownParty : party]++;
}

std::vector<const Ward*>
CouncilAggregator::ContestedWards() const
{
    std::vector<const Ward*> wards;
    std::unordered_set<std::string> seen;
    for (const auto& name : data_.wards_up()) {
        if (!seen.emplace(name).second)
            continue;
        const Ward* ward = FindWard(data_, name);
        if (!ward) {
            Err() << "Contested ward " << name << " is not in the dataset, skipping";
            continue;
        }
        wards.emplace_back(ward);
    }
    return wards;
}

SeatTotals
CouncilAggregator::RetainedSeats() const
{
    std::unordered_set<std::string> contested(data_.wards_up().begin(), data_.wards_up().end());
    bool thirds = data_.election_cycle() == "thirds";

    SeatTotals totals;
    for (const auto& ward : data_.wards()) {
        if (!contested.count(ward.name())) {
            for (const auto& holder : ward.current_holders())
                Credit(&totals, holder.party());
            continue;
        }
        if (!thirds || ward.current_holders_size() <= 1)
            continue;

        const Holder* defending = FindDefendingHolder(ward);
        for (const auto& holder : ward.current_holders()) {
            if (&holder != defending)
                Credit(&totals, holder.party());
        }
    }
    return totals;
}

bool
CouncilAggregator::Run(ThreadPool* pool, CouncilPrediction* out, WardProgress* progress)
{
    auto wards = ContestedWards();
    std::vector<WardPrediction> predictions(wards.size());

    if (pool) {
        for (size_t i = 0; i < wards.size(); i++) {
            auto work = [this, &wards, &predictions, i]() -> void {
                predictions[i] = predictor_.Predict(*wards[i]);
            };
            auto done = [progress, &wards, i]() -> void {
                if (progress)
                    progress->Tick(wards[i]->name());
            };
            pool->Do(std::move(work), std::move(done));
        }
        pool->RunCompletionTasks();

        if (pool->cancelled()) {
            pool->Reset();
            Err() << "Council prediction cancelled";
            return false;
        }
    } else {
        for (size_t i = 0; i < wards.size(); i++) {
            predictions[i] = predictor_.Predict(*wards[i]);
            if (progress)
                progress->Tick(wards[i]->name());
        }
    }

    SeatTotals totals = RetainedSeats();

    CouncilPrediction result;
    result.set_council(data_.name());
    for (auto& prediction : predictions) {
        if (prediction.valid() && !prediction.winner().empty())
            Credit(&totals, prediction.winner());
        auto name = prediction.ward();
        (*result.mutable_wards())[name] = std::move(prediction);
    }
    for (const auto& [party, seats] : totals)
        (*result.mutable_seat_totals())[party] = seats;
    result.set_total_seats(TotalSeats(totals));

    *out = std::move(result);
    return true;
}

SeatTotals
CurrentHoldings(const CouncilData& data)
{
    SeatTotals totals;
    for (const auto& ward : data.wards()) {
        for (const auto& holder : ward.current_holders())
            Credit(&totals, holder.party());
    }
    return totals;
}

SeatTotals
GetSeatTotals(const CouncilPrediction& prediction)
{
    return SeatTotals(prediction.seat_totals().begin(), prediction.seat_totals().end());
}

int
TotalSeats(const SeatTotals& totals)
{
    int total = 0;
    for (const auto& [party, seats] : totals)
        total += seats;
    return total;
}

SeatTotals
ApplyOverrides(const CouncilPrediction& prediction,
               const std::map<std::string, std::string>& overrides)
{
    SeatTotals totals = GetSeatTotals(prediction);
    for (const auto& [ward, party] : overrides) {
        auto iter = prediction.wards().find(ward);
        if (iter == prediction.wards().end())
            continue;

        // A saved prediction may already carry an override for this ward.
        std::string old_winner = iter->second.winner();
        auto forced = prediction.overrides().find(ward);
        if (forced != prediction.overrides().end())
            old_winner = forced->second;
        auto seats = totals.find(old_winner);
        if (!old_winner.empty() && seats != totals.end()) {
            if (--seats->second <= 0)
                totals.erase(seats);
        }
        totals[party]++;
    }
    return totals;
}

static Coalition
MakeCoalition(std::vector<std::string> parties, int seats, int threshold, CoalitionType type)
{
    Coalition c;
    for (auto& party : parties)
        c.add_parties(std::move(party));
    c.set_total_seats(seats);
    c.set_majority(seats - threshold + 1);
    c.set_type(type);
    return c;
}

std::vector<Coalition>
FindCoalitions(const SeatTotals& totals, int majority_threshold)
{
    std::vector<std::pair<std::string, int>> parties;
    for (const auto& [party, seats] : totals) {
        if (seats > 0)
            parties.emplace_back(party, seats);
    }
    auto by_seats = [](const std::pair<std::string, int>& a,
                       const std::pair<std::string, int>& b) -> bool {
        return a.second > b.second;
    };
    std::stable_sort(parties.begin(), parties.end(), by_seats);

    std::vector<Coalition> out;
    size_t n = parties.size();
    for (size_t i = 0; i < n; i++) {
        if (parties[i].second >= majority_threshold) {
            out.emplace_back(MakeCoalition({parties[i].first}, parties[i].second,
                                           majority_threshold, COALITION_MAJORITY));
        }
    }
    for (size_t i = 0; i < n; i++) {
        for (size_t j = i + 1; j < n; j++) {
            int seats = parties[i].second + parties[j].second;
            if (seats >= majority_threshold) {
                out.emplace_back(MakeCoalition({parties[i].first, parties[j].first}, seats,
                                               majority_threshold, COALITION_MULTI_PARTY));
            }
        }
    }
    if (out.empty()) {
        for (size_t i = 0; i < n; i++) {
            for (size_t j = i + 1; j < n; j++) {
                for (size_t k = j + 1; k < n; k++) {
                    int seats = parties[i].second + parties[j].second + parties[k].second;
                    if (seats < majority_threshold)
                        continue;
                    out.emplace_back(MakeCoalition(
                        {parties[i].first, parties[j].first, parties[k].first}, seats,
                        majority_threshold, COALITION_MULTI_PARTY));
                }
            }
        }
    }

    auto by_total = [](const Coalition& a, const Coalition& b) -> bool {
        return a.total_seats() > b.total_seats();
    };
    std::stable_sort(out.begin(), out.end(), by_total);
    return out;
}

} // namespace wardcast
