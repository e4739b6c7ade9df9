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
#include <optional>
#include <string>
#include <vector>

#include <proto/history.pb.h>
#include <proto/model.pb.h>
#include "adjustments.h"
#include "baseline.h"
#include "utility.h"

namespace wardcast {

static constexpr double kDefaultTurnout = 0.30;
static constexpr double kMinTurnout = 0.15;
static constexpr double kMaxTurnout = 0.65;
static constexpr double kDefaultWinnerMae = 0.10;

// Clamps each share at zero and rescales to sum to one. A vector with no
// positive entry comes back unchanged.
ShareMap NormalizeShares(const ShareMap& shares);

// Turnout, total and per-party votes, winner, runner-up and majority for a
// normalised share vector.
void EstimateVotes(const ShareMap& shares, const Baseline& baseline,
                   const Assumptions& assumptions, WardPrediction* out);

// Confidence tier from the winning margin. With calibration data the
// thresholds scale with the winner's validation error, which is also
// written to |interval|.
Confidence RateConfidence(double majority_pct, int staleness, const std::string& winner,
                          const ModelCoefficients* coefficients, double* interval = nullptr);

const char* ConfidenceName(Confidence confidence);

// Runs baseline, the adjustment stages in order, and normalisation for one
// ward. Immutable once built; Predict() may run on many threads at once.
class WardPredictor
{
  public:
    WardPredictor(const CouncilData& data, const Assumptions& assumptions,
                  const DemographicRules& rules, const std::string& election_type,
                  int current_year);

    WardPrediction Predict(const Ward& ward) const;

    const Assumptions& assumptions() const { return assumptions_; }
    int current_year() const { return current_year_; }

  private:
    const CouncilData& data_;
    Assumptions assumptions_;
    std::string election_type_;
    int current_year_;
    const ModelCoefficients* coefficients_ = nullptr;
    std::vector<std::unique_ptr<AdjustmentStage>> stages_;
};

const Ward* FindWard(const CouncilData& data, const std::string& name);

std::optional<WardPrediction> PredictNamedWard(const WardPredictor& predictor,
                                               const CouncilData& data,
                                               const std::string& name);

} // namespace wardcast
