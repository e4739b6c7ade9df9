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

#include <map>
#include <string>
#include <vector>

#include <proto/history.pb.h>
#include <proto/model.pb.h>

namespace wardcast {

class ThreadPool;
class WardPredictor;
class WardProgress;

typedef std::map<std::string, int> SeatTotals;

// Rolls ward predictions and retained seats into council seat totals.
class CouncilAggregator
{
  public:
    CouncilAggregator(const CouncilData& data, const WardPredictor& predictor)
      : data_(data),
        predictor_(predictor)
    {}

    // Predicts every contested ward, on |pool| when given. Returns false if
    // the pool was cancelled before all wards finished; |out| is then left
    // untouched and the pool is reset for the next caller.
    bool Run(ThreadPool* pool, CouncilPrediction* out, WardProgress* progress = nullptr);

    // Seats not up for election: every holder of an uncontested ward, plus
    // the non-defending holders of a contested ward elected by thirds.
    SeatTotals RetainedSeats() const;

  private:
    std::vector<const Ward*> ContestedWards() const;

  private:
    const CouncilData& data_;
    const WardPredictor& predictor_;
};

// Sitting councillors across every ward, contested or not.
SeatTotals CurrentHoldings(const CouncilData& data);

SeatTotals GetSeatTotals(const CouncilPrediction& prediction);
int TotalSeats(const SeatTotals& totals);

// Moves each overridden ward's seat from its current winner to the forced
// party. The current winner is the prediction's own override for the ward if
// it has one, else the predicted winner. Wards without a prediction are
// ignored.
SeatTotals ApplyOverrides(const CouncilPrediction& prediction,
                          const std::map<std::string, std::string>& overrides);

// Single parties at or over the threshold, then every pair, then, only when
// neither found anything, every triple. Sorted by seats, largest first.
std::vector<Coalition> FindCoalitions(const SeatTotals& totals, int majority_threshold);

} // namespace wardcast
