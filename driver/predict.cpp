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
#include "predict.h"

#include <math.h>

#include <algorithm>

#include <amtl/am-string.h>

#include "logging.h"
#include "mathlib.h"

namespace wardcast {

ShareMap
NormalizeShares(const ShareMap& shares)
{
    double total = 0.0;
    for (const auto& [party, share] : shares)
        total += std::max(0.0, share);
    if (total <= 0.0)
        return shares;

    ShareMap result;
    for (const auto& [party, share] : shares)
        result[party] = std::max(0.0, share) / total;
    return result;
}

void
EstimateVotes(const ShareMap& shares, const Baseline& baseline, const Assumptions& assumptions,
              WardPrediction* out)
{
    double base_turnout = baseline.turnout > 0.0 ? baseline.turnout : kDefaultTurnout;
    double adjustment = std::clamp(assumptions.turnout_adjustment(), -0.05, 0.05);
    double turnout = std::clamp(base_turnout + adjustment, kMinTurnout, kMaxTurnout);

    int64_t electorate = baseline.electorate;
    if (electorate <= 0)
        electorate = llround(double(baseline.turnout_votes) / base_turnout);
    int64_t total_votes = llround(double(electorate) * turnout);

    std::vector<PartyResult> results;
    for (const auto& [party, share] : shares) {
        PartyResult r;
        r.set_party(party);
        r.set_share(share);
        r.set_votes(llround(share * double(total_votes)));
        results.emplace_back(std::move(r));
    }

    auto cmp = [](const PartyResult& a, const PartyResult& b) -> bool {
        if (a.votes() != b.votes())
            return a.votes() > b.votes();
        if (a.share() != b.share())
            return a.share() > b.share();
        return a.party() < b.party();
    };
    std::sort(results.begin(), results.end(), cmp);

    out->set_turnout(turnout);
    out->set_electorate(electorate);
    out->set_total_votes(total_votes);
    out->clear_results();
    for (auto& r : results)
        *out->add_results() = std::move(r);

    int64_t majority = 0;
    if (out->results_size() >= 1)
        out->set_winner(out->results(0).party());
    if (out->results_size() >= 2) {
        out->set_runner_up(out->results(1).party());
        majority = out->results(0).votes() - out->results(1).votes();
    }
    out->set_majority(majority);

    double majority_pct = total_votes > 0 ? double(majority) / double(total_votes) : 0.0;
    out->set_majority_pct(RoundTo(majority_pct, 3));
}

Confidence
RateConfidence(double majority_pct, int staleness, const std::string& winner,
               const ModelCoefficients* coefficients, double* interval)
{
    static constexpr int kStaleYears = 10;

    double high, medium, stale_medium;
    if (coefficients) {
        double mae = GetShare(coefficients->validation_mae(), winner);
        if (mae <= 0.0)
            mae = kDefaultWinnerMae;
        high = mae * 2;
        medium = mae;
        stale_medium = mae * 3;
        if (interval)
            *interval = mae;
    } else {
        high = 0.15;
        medium = 0.05;
        stale_medium = 0.20;
    }

    // Old baselines never earn high confidence.
    if (staleness > kStaleYears)
        return majority_pct > stale_medium ? CONFIDENCE_MEDIUM : CONFIDENCE_LOW;
    if (majority_pct > high)
        return CONFIDENCE_HIGH;
    if (majority_pct > medium)
        return CONFIDENCE_MEDIUM;
    return CONFIDENCE_LOW;
}

const char*
ConfidenceName(Confidence confidence)
{
    switch (confidence) {
        case CONFIDENCE_HIGH:
            return "high";
        case CONFIDENCE_MEDIUM:
            return "medium";
        case CONFIDENCE_LOW:
            return "low";
        default:
            return "none";
    }
}

WardPredictor::WardPredictor(const CouncilData& data, const Assumptions& assumptions,
                             const DemographicRules& rules, const std::string& election_type,
                             int current_year)
  : data_(data),
    assumptions_(ClampAssumptions(assumptions)),
    election_type_(election_type),
    current_year_(current_year)
{
    if (data_.has_coefficients() && !data_.coefficients().coefficients().empty())
        coefficients_ = &data_.coefficients();

    // Per-party dampening applies even without regression coefficients.
    const ModelCoefficients* swing_coefficients = coefficients_;
    if (data_.has_coefficients() && !data_.coefficients().dampening_by_party().empty())
        swing_coefficients = &data_.coefficients();

    // Order matters: the entrant proxy must see post-swing shares.
    stages_.emplace_back(std::make_unique<SwingStage>(swing_coefficients));
    stages_.emplace_back(MakeDemographicModel(coefficients_, rules));
    stages_.emplace_back(std::make_unique<IncumbencyStage>());
    stages_.emplace_back(std::make_unique<EntrantProxyStage>(swing_coefficients));
}

WardPrediction
WardPredictor::Predict(const Ward& ward) const
{
    WardPrediction out;
    out.set_ward(ward.name());

    auto baseline = GetBaseline(ward, election_type_, current_year_);
    if (!baseline) {
        auto step = out.add_methodology();
        step->set_step(1);
        step->set_name("Baseline");
        step->set_description("No historical election data for this ward");
        out.set_valid(false);
        out.set_confidence(CONFIDENCE_NONE);
        Debug() << ward.name() << ": no baseline, skipped";
        return out;
    }

    out.set_staleness(baseline->staleness);
    *out.add_methodology() = DescribeBaseline(*baseline);

    ShareMap shares = baseline->parties;

    MethodologyStep blend;
    if (BlendStaleBaseline(*baseline, ToShareMap(ward.constituency_result()), &shares, &blend))
        *out.add_methodology() = std::move(blend);

    for (const auto& stage : stages_) {
        StageInput input{ward, *baseline, shares, assumptions_, data_.reference()};
        StageResult result = stage->Propose(input);
        for (const auto& [party, delta] : result.delta)
            shares[party] += delta;
        *out.add_methodology() = std::move(result.step);
    }

    ShareMap normalised = NormalizeShares(shares);

    auto step = out.add_methodology();
    step->set_step(6);
    step->set_name("Normalise");
    step->set_description("All shares scaled to sum to 100%");
    for (const auto& [party, share] : normalised)
        (*step->mutable_data())[party] = RoundTo(share, 3);

    EstimateVotes(normalised, *baseline, assumptions_, &out);
    out.set_valid(!out.winner().empty());

    double majority_pct = out.total_votes() > 0
                          ? double(out.majority()) / double(out.total_votes())
                          : 0.0;
    double interval = 0.0;
    out.set_confidence(RateConfidence(majority_pct, baseline->staleness, out.winner(),
                                      coefficients_, &interval));
    if (coefficients_)
        out.set_confidence_interval(interval);

    Debug() << ward.name() << ": " << out.winner() << " by " << out.majority() << " ("
            << ConfidenceName(out.confidence()) << ")";
    return out;
}

const Ward*
FindWard(const CouncilData& data, const std::string& name)
{
    for (const auto& ward : data.wards()) {
        if (ward.name() == name)
            return &ward;
    }
    return nullptr;
}

std::optional<WardPrediction>
PredictNamedWard(const WardPredictor& predictor, const CouncilData& data,
                 const std::string& name)
{
    const Ward* ward = FindWard(data, name);
    if (!ward)
        return {};
    return {predictor.Predict(*ward)};
}

} // namespace wardcast
