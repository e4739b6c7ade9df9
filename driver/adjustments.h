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
#pragma once

#include <memory>
#include <string>

#include <proto/history.pb.h>
#include <proto/model.pb.h>
#include "baseline.h"
#include "utility.h"

namespace wardcast {

// Defaults applied before the council's [assumptions] section is read.
Assumptions DefaultAssumptions();

// Brings user-tunable values back inside their documented ranges.
Assumptions ClampAssumptions(const Assumptions& in);

// Threshold bonuses used when no calibrated coefficients are available.
// Values are vote-share fractions; every one can be overridden from the
// [demographic_rules] section of the council file.
struct DemographicRules {
    std::string left_party = "Labour";
    std::string right_party = "Conservative";
    std::string independent_party = "Independent";

    int high_deprivation_decile = 2;
    double high_deprivation_left_bonus = 0.02;
    double high_deprivation_right_penalty = -0.02;
    double high_deprivation_entrant_bonus = 0.03;

    double over65_threshold = 0.25;
    double over65_right_bonus = 0.015;
    double over65_entrant_bonus = 0.02;

    double white_british_threshold = 0.85;
    double white_british_entrant_bonus = 0.03;

    double asian_heritage_threshold = 0.20;
    double asian_heritage_independent_bonus = 0.02;
    double asian_heritage_entrant_penalty = -0.08;
};

// Population fractions derived from a ward's census counts. All zero when the
// profile has no population.
struct DemographicRatios {
    double over65 = 0.0;
    double age_15_to_29 = 0.0;
    double young_adults = 0.0;
    double white_british = 0.0;
    double asian = 0.0;
    double unemployment = 0.0;
    // Largest ethnic group other than White British, and its label.
    double largest_minority = 0.0;
    std::string largest_minority_group;
};

DemographicRatios ComputeDemographicRatios(const DemographicProfile& profile);

// Everything a stage may look at for one ward. |current| is the running
// vector with every earlier stage already folded in.
struct StageInput {
    const Ward& ward;
    const Baseline& baseline;
    const ShareMap& current;
    const Assumptions& assumptions;
    const ReferenceResults& reference;
};

struct StageResult {
    ShareMap delta;
    MethodologyStep step;
};

class AdjustmentStage
{
  public:
    virtual ~AdjustmentStage() {}
    virtual StageResult Propose(const StageInput& input) const = 0;
};

// (polling - prior national) x dampening x multiplier, for each baseline party.
class SwingStage final : public AdjustmentStage
{
  public:
    // |coefficients| may be null; when set, its per-party dampening wins over
    // the global factor.
    explicit SwingStage(const ModelCoefficients* coefficients)
      : coefficients_(coefficients)
    {}

    StageResult Propose(const StageInput& input) const override;

    double Dampening(const std::string& party, const Assumptions& assumptions) const;

  private:
    const ModelCoefficients* coefficients_;
};

class DemographicModel : public AdjustmentStage
{
};

class RuleBasedDemographics final : public DemographicModel
{
  public:
    explicit RuleBasedDemographics(const DemographicRules& rules)
      : rules_(rules)
    {}

    StageResult Propose(const StageInput& input) const override;

  private:
    DemographicRules rules_;
};

class RegressionDemographics final : public DemographicModel
{
  public:
    explicit RegressionDemographics(const ModelCoefficients& coefficients)
      : coefficients_(coefficients)
    {}

    StageResult Propose(const StageInput& input) const override;

  private:
    const ModelCoefficients& coefficients_;
};

// Chooses the regression model when calibration data is present.
std::unique_ptr<DemographicModel> MakeDemographicModel(const ModelCoefficients* coefficients,
                                                       const DemographicRules& rules);

// Features fed to the regression model. Missing data reads as zero, except
// the deprivation score which defaults to the middle of its range.
ShareMap ComputeWardFeatures(const Ward& ward);

class IncumbencyStage final : public AdjustmentStage
{
  public:
    StageResult Propose(const StageInput& input) const override;
};

// Gives a party with no ward baseline a share estimated from the
// constituency and comparable local results.
class EntrantProxyStage final : public AdjustmentStage
{
  public:
    explicit EntrantProxyStage(const ModelCoefficients* coefficients)
      : swing_(coefficients)
    {}

    StageResult Propose(const StageInput& input) const override;

  private:
    SwingStage swing_;
};

// The holder whose seat is up: the named defender, else the first holder.
const Holder* FindDefendingHolder(const Ward& ward);
std::string DefendingParty(const Ward& ward);

} // namespace wardcast
