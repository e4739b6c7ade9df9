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
#include "adjustments.h"

#include <math.h>

#include <algorithm>
#include <map>
#include <utility>

#include <amtl/am-string.h>

namespace wardcast {

static constexpr int kIncumbencyStaleYears = 10;
static constexpr double kEntrantExistingShare = 0.01;
static constexpr double kEntrantMinimumEstimate = 0.01;
static constexpr double kMaxRegressionAdjustment = 0.10;
static constexpr double kImdScoreScale = 80.0;
static constexpr double kDefaultImdNorm = 0.5;
static const char* kDefaultEntrant = "Reform UK";

Assumptions
DefaultAssumptions()
{
    Assumptions a;
    a.set_national_to_local_dampening(0.65);
    a.set_incumbency_bonus(0.05);
    a.set_retirement_penalty(-0.02);
    a.set_entrant_primary_weight(0.25);
    a.set_entrant_secondary_weight(0.75);
    a.set_entrant_local_dampening(0.95);
    a.set_turnout_adjustment(0.0);
    a.set_swing_multiplier(1.0);
    a.set_entrant_stands_everywhere(true);
    a.set_entrant_party(kDefaultEntrant);
    return a;
}

Assumptions
ClampAssumptions(const Assumptions& in)
{
    Assumptions a = in;
    a.set_national_to_local_dampening(std::clamp(a.national_to_local_dampening(), 0.0, 1.0));
    a.set_turnout_adjustment(std::clamp(a.turnout_adjustment(), -0.05, 0.05));
    a.set_swing_multiplier(std::clamp(a.swing_multiplier(), 0.5, 1.5));
    a.set_entrant_primary_weight(std::max(0.0, a.entrant_primary_weight()));
    a.set_entrant_secondary_weight(std::max(0.0, a.entrant_secondary_weight()));
    a.set_entrant_local_dampening(std::clamp(a.entrant_local_dampening(), 0.0, 1.0));
    if (a.entrant_party().empty())
        a.set_entrant_party(kDefaultEntrant);
    return a;
}

static inline double
Fraction(int64_t part, int64_t whole)
{
    if (whole <= 0)
        return 0.0;
    return double(part) / double(whole);
}

DemographicRatios
ComputeDemographicRatios(const DemographicProfile& p)
{
    DemographicRatios r;
    if (p.population() <= 0)
        return r;

    int64_t ethnic_total = p.ethnicity_total() > 0 ? p.ethnicity_total() : p.population();

    r.over65 = Fraction(p.age_65_to_74() + p.age_75_to_84() + p.age_85_plus(), p.population());
    r.age_15_to_29 = Fraction(p.age_15_to_19() + p.age_20_to_24() + p.age_25_to_29(),
                              p.population());
    r.young_adults = Fraction(p.age_20_to_24() + p.age_25_to_29() + p.age_30_to_34(),
                              p.population());
    r.white_british = Fraction(p.white_british(), ethnic_total);
    r.asian = Fraction(p.asian(), ethnic_total);
    r.unemployment = Fraction(p.unemployed(), p.economic_total());

    std::pair<const char*, int64_t> groups[] = {
        {"White other", p.white_other()},
        {"Asian", p.asian()},
        {"Black", p.black()},
        {"Mixed", p.mixed()},
        {"Other", p.other_ethnicity()},
    };
    for (const auto& [label, count] : groups) {
        double share = Fraction(count, ethnic_total);
        if (share > r.largest_minority) {
            r.largest_minority = share;
            r.largest_minority_group = label;
        }
    }
    return r;
}

static void
AddDelta(ShareMap* delta, const std::string& party, double amount)
{
    (*delta)[party] += amount;
}

double
SwingStage::Dampening(const std::string& party, const Assumptions& assumptions) const
{
    if (coefficients_) {
        double d = GetShare(coefficients_->dampening_by_party(), party);
        if (d > 0.0)
            return d;
    }
    return std::clamp(assumptions.national_to_local_dampening(), 0.0, 1.0);
}

StageResult
SwingStage::Propose(const StageInput& input) const
{
    const auto& polling = input.reference.national_polling();
    const auto& prior = input.reference.prior_national();
    double multiplier = std::clamp(input.assumptions.swing_multiplier(), 0.5, 1.5);

    StageResult result;
    for (const auto& [party, share] : input.baseline.parties) {
        double national = GetShare(polling, party) - GetShare(prior, party);
        double dampening = Dampening(party, input.assumptions);
        double local = national * dampening * multiplier;
        result.delta[party] = local;

        if (national != 0.0) {
            result.step.add_factors(ke::StringPrintf("%s: %+.1fpp national x %.2f = %+.1fpp",
                                                     party.c_str(), national * 100, dampening,
                                                     local * 100));
        }
    }

    result.step.set_step(2);
    result.step.set_name("National Swing");
    std::string text;
    if (coefficients_ && !coefficients_->dampening_by_party().empty()) {
        text = "Polling change since the last general election, party-specific dampening";
    } else {
        text = ke::StringPrintf("Polling change since the last general election, dampened by %.2f",
                                input.assumptions.national_to_local_dampening());
    }
    if (multiplier != 1.0)
        text += ke::StringPrintf(" (x%.2f user adjustment)", multiplier);
    result.step.set_description(text);
    CopyShareMap(result.delta, result.step.mutable_data());
    return result;
}

StageResult
RuleBasedDemographics::Propose(const StageInput& input) const
{
    const auto& ward = input.ward;
    const auto& entrant = input.assumptions.entrant_party().empty()
                          ? std::string(kDefaultEntrant)
                          : input.assumptions.entrant_party();

    DemographicRatios ratios;
    if (ward.has_demographics())
        ratios = ComputeDemographicRatios(ward.demographics());

    StageResult result;
    auto& delta = result.delta;
    auto& step = result.step;

    int decile = ward.has_deprivation() ? ward.deprivation().imd_decile() : 0;
    if (decile > 0 && decile <= rules_.high_deprivation_decile) {
        AddDelta(&delta, rules_.left_party, rules_.high_deprivation_left_bonus);
        AddDelta(&delta, rules_.right_party, rules_.high_deprivation_right_penalty);
        AddDelta(&delta, entrant, rules_.high_deprivation_entrant_bonus);
        step.add_factors(ke::StringPrintf(
            "High deprivation (decile %d): %s %+.1fpp, %s %+.1fpp, %s %+.1fpp", decile,
            rules_.left_party.c_str(), rules_.high_deprivation_left_bonus * 100,
            rules_.right_party.c_str(), rules_.high_deprivation_right_penalty * 100,
            entrant.c_str(), rules_.high_deprivation_entrant_bonus * 100));
    }

    if (ratios.over65 > rules_.over65_threshold) {
        AddDelta(&delta, rules_.right_party, rules_.over65_right_bonus);
        AddDelta(&delta, entrant, rules_.over65_entrant_bonus);
        step.add_factors(ke::StringPrintf("High over-65 (%.0f%%): %s %+.1fpp, %s %+.1fpp",
                                          ratios.over65 * 100, rules_.right_party.c_str(),
                                          rules_.over65_right_bonus * 100, entrant.c_str(),
                                          rules_.over65_entrant_bonus * 100));
    }

    if (ratios.white_british > rules_.white_british_threshold) {
        AddDelta(&delta, entrant, rules_.white_british_entrant_bonus);
        step.add_factors(ke::StringPrintf("High White British (%.0f%%): %s %+.1fpp",
                                          ratios.white_british * 100, entrant.c_str(),
                                          rules_.white_british_entrant_bonus * 100));
    }

    if (ratios.asian > rules_.asian_heritage_threshold) {
        // Stronger effect as concentration rises.
        double entrant_penalty, independent_bonus, left_bonus;
        if (ratios.asian > 0.60) {
            entrant_penalty = -0.20;
            independent_bonus = 0.12;
            left_bonus = 0.05;
        } else if (ratios.asian > 0.40) {
            entrant_penalty = -0.15;
            independent_bonus = 0.06;
            left_bonus = 0.03;
        } else {
            entrant_penalty = rules_.asian_heritage_entrant_penalty;
            independent_bonus = rules_.asian_heritage_independent_bonus;
            left_bonus = 0.0;
        }

        AddDelta(&delta, rules_.independent_party, independent_bonus);
        AddDelta(&delta, entrant, entrant_penalty);
        auto text = ke::StringPrintf("High Asian heritage (%.0f%%): %s %+.1fpp, %s %+.1fpp",
                                     ratios.asian * 100, rules_.independent_party.c_str(),
                                     independent_bonus * 100, entrant.c_str(),
                                     entrant_penalty * 100);
        if (left_bonus > 0.0) {
            AddDelta(&delta, rules_.left_party, left_bonus);
            text += ke::StringPrintf(", %s %+.1fpp", rules_.left_party.c_str(), left_bonus * 100);
        }
        step.add_factors(text);
    }

    step.set_step(3);
    step.set_name("Demographics");
    if (step.factors_size() > 0) {
        step.set_description(ke::StringPrintf("%d demographic factor(s) applied",
                                              step.factors_size()));
    } else {
        step.set_description("No significant demographic adjustments for this ward");
    }
    CopyShareMap(delta, step.mutable_data());
    return result;
}

ShareMap
ComputeWardFeatures(const Ward& ward)
{
    DemographicRatios ratios = ComputeDemographicRatios(ward.demographics());

    double imd_norm = kDefaultImdNorm;
    if (ward.has_deprivation() && ward.deprivation().imd_score() > 0.0)
        imd_norm = ward.deprivation().imd_score() / kImdScoreScale;

    return ShareMap{
        {"imd_norm", imd_norm},
        {"pct_over65", ratios.over65},
        {"pct_young_adults", ratios.young_adults},
        {"pct_asian", ratios.asian},
        {"pct_white_british", ratios.white_british},
        {"pct_unemployed", ratios.unemployment},
        // Not in the census extract yet.
        {"pct_no_quals", 0.0},
        {"pct_degree", 0.0},
        {"pct_owned", 0.0},
        {"pct_social_rented", 0.0},
    };
}

StageResult
RegressionDemographics::Propose(const StageInput& input) const
{
    const auto& ward = input.ward;

    StageResult result;
    result.step.set_step(3);
    result.step.set_name("Demographics (regression)");

    if (!ward.has_demographics() || ward.demographics().population() <= 0) {
        result.step.set_description("No population data, no demographic adjustment");
        return result;
    }

    ShareMap features = ComputeWardFeatures(ward);

    // Sorted copies so every run sums in the same order.
    std::map<std::string, const FeatureCoefficients*> parties;
    for (const auto& [party, coeffs] : coefficients_.coefficients())
        parties.emplace(party, &coeffs);

    double max_adjustment = 0.0;
    for (const auto& [party, coeffs] : parties) {
        std::map<std::string, double> terms(coeffs->features().begin(),
                                            coeffs->features().end());
        double sum = 0.0;
        int used = 0;
        for (const auto& [feature, coeff] : terms) {
            if (feature == "intercept" || coeff == 0.0)
                continue;
            auto iter = features.find(feature);
            if (iter == features.end())
                continue;
            sum += coeff * iter->second;
            used++;
        }
        if (!used)
            continue;

        double adj = round(sum * 100.0) / 10000.0;
        adj = std::clamp(adj, -kMaxRegressionAdjustment, kMaxRegressionAdjustment);
        result.delta[party] = adj;
        max_adjustment = std::max(max_adjustment, fabs(adj));
    }

    result.step.set_description(ke::StringPrintf("Regression with %zu features",
                                                  features.size()));
    result.step.add_factors(ke::StringPrintf("%zu parties adjusted, largest %.1fpp",
                                             result.delta.size(), max_adjustment * 100));
    if (ward.has_deprivation() && !ward.deprivation().level().empty()) {
        result.step.add_factors(ke::StringPrintf("Deprivation: %s (IMD %.1f)",
                                                 ward.deprivation().level().c_str(),
                                                 ward.deprivation().imd_score()));
    }
    CopyShareMap(result.delta, result.step.mutable_data());
    return result;
}

std::unique_ptr<DemographicModel>
MakeDemographicModel(const ModelCoefficients* coefficients, const DemographicRules& rules)
{
    if (coefficients && !coefficients->coefficients().empty())
        return std::make_unique<RegressionDemographics>(*coefficients);
    return std::make_unique<RuleBasedDemographics>(rules);
}

const Holder*
FindDefendingHolder(const Ward& ward)
{
    if (ward.current_holders().empty())
        return nullptr;
    if (!ward.defender().empty()) {
        for (const auto& holder : ward.current_holders()) {
            if (holder.name() == ward.defender())
                return &holder;
        }
    }
    return &ward.current_holders(0);
}

std::string
DefendingParty(const Ward& ward)
{
    if (const Holder* holder = FindDefendingHolder(ward))
        return holder->party();
    return {};
}

StageResult
IncumbencyStage::Propose(const StageInput& input) const
{
    StageResult result;
    result.step.set_step(4);
    result.step.set_name("Incumbency");

    const Holder* holder = FindDefendingHolder(input.ward);
    if (!holder) {
        result.step.set_description("No current holder data available");
        return result;
    }
    if (holder->party().empty()) {
        result.step.set_description("No incumbency adjustment");
        return result;
    }

    const auto& party = holder->party();
    int staleness = input.baseline.staleness;
    std::string text;
    double amount;
    if (holder->standing_down()) {
        amount = input.assumptions.retirement_penalty();
        text = ke::StringPrintf("Defending %s councillor standing down: %+.1fpp", party.c_str(),
                                amount * 100);
    } else if (staleness > kIncumbencyStaleYears) {
        amount = input.assumptions.incumbency_bonus() * 0.5;
        text = ke::StringPrintf("Incumbent party (%s): %+.1fpp (halved, baseline %d years old)",
                                party.c_str(), amount * 100, staleness);
    } else {
        amount = input.assumptions.incumbency_bonus();
        text = ke::StringPrintf("Incumbent party (%s): %+.1fpp incumbency bonus", party.c_str(),
                                amount * 100);
    }

    result.delta[party] = amount;
    result.step.add_factors(text);
    result.step.set_description(text);
    CopyShareMap(result.delta, result.step.mutable_data());
    return result;
}

StageResult
EntrantProxyStage::Propose(const StageInput& input) const
{
    const auto& a = input.assumptions;
    const std::string entrant = a.entrant_party().empty() ? kDefaultEntrant : a.entrant_party();

    StageResult result;
    auto& step = result.step;
    step.set_step(5);
    step.set_name("New Party Entry");

    double existing = GetShare(input.baseline.parties, entrant);
    if (existing > kEntrantExistingShare) {
        step.set_description(entrant + " has an existing baseline, no proxy needed");
        return result;
    }
    if (!a.entrant_stands_everywhere()) {
        step.set_description(entrant + " not standing in this ward (user setting)");
        return result;
    }

    double primary = GetShare(input.ward.constituency_result(), entrant);
    double secondary = GetShare(input.reference.comparable_local(), entrant);
    double local_dampening = std::clamp(a.entrant_local_dampening(), 0.0, 1.0);
    double proxy = primary * a.entrant_primary_weight() * local_dampening +
                   secondary * a.entrant_secondary_weight() * local_dampening;

    double national = GetShare(input.reference.national_polling(), entrant) -
                      GetShare(input.reference.prior_national(), entrant);
    double swing = national * swing_.Dampening(entrant, a) *
                   std::clamp(a.swing_multiplier(), 0.5, 1.5);

    double estimate = proxy + swing;
    (*step.mutable_data())["estimate"] = estimate;
    if (estimate <= kEntrantMinimumEstimate) {
        step.set_description("No new party entry adjustment");
        return result;
    }

    // Swing may already have handed the entrant some share; only the
    // remainder is added.
    double already = GetShare(input.current, entrant) - existing;
    double additional = std::max(0.0, estimate - std::max(0.0, already));
    result.delta[entrant] = additional;

    double total_other = 0.0;
    for (const auto& [party, share] : input.current) {
        if (party != entrant)
            total_other += std::max(0.0, share);
    }
    if (total_other > 0.0) {
        for (const auto& [party, share] : input.current) {
            if (party == entrant)
                continue;
            result.delta[party] -= additional * std::max(0.0, share) / total_other;
        }
    }

    step.add_factors(ke::StringPrintf(
        "Proxy: constituency %.1f%% x %.2f + local %.1f%% x %.2f, dampened %.2f = %.1f%%",
        primary * 100, a.entrant_primary_weight(), secondary * 100,
        a.entrant_secondary_weight(), local_dampening, proxy * 100));
    if (swing != 0.0) {
        step.add_factors(ke::StringPrintf("National swing %+.1fpp, total %.1f%%", swing * 100,
                                          estimate * 100));
    }
    if (already > 0.001) {
        step.add_factors(ke::StringPrintf("Already assigned by swing: %.1fpp, additional %+.1fpp",
                                          already * 100, additional * 100));
    }
    if (input.baseline.staleness > kStaleBaselineYears) {
        step.add_factors(ke::StringPrintf("Stale baseline (%d years), proxy weighted heavily",
                                          input.baseline.staleness));
    }
    step.set_description(ke::StringPrintf("%s estimated at %.1f%% from proxy plus swing",
                                          entrant.c_str(), estimate * 100));
    for (const auto& [party, amount] : result.delta)
        (*step.mutable_data())[party] = amount;
    return result;
}

} // namespace wardcast
