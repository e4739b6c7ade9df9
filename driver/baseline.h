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

#include <stdint.h>

#include <optional>
#include <string>

#include <proto/history.pb.h>
#include <proto/model.pb.h>
#include "utility.h"

namespace wardcast {

// Past this many years a baseline is blended with fresher evidence.
static constexpr int kStaleBaselineYears = 8;
static constexpr double kStaleDecayPerYear = 0.05;
static constexpr double kMinHistoricalWeight = 0.3;

struct Baseline {
    ShareMap parties;
    Date date;
    std::string type;
    int year = 0;
    int staleness = 0;
    double turnout = 0.0;
    int64_t turnout_votes = 0;
    int64_t electorate = 0;
};

// Picks the most recent election whose type contains |election_type|, else
// the most recent of any type. Returns nullopt when there is no usable
// history.
std::optional<Baseline> GetBaseline(const Ward& ward, const std::string& election_type,
                                    int current_year);

MethodologyStep DescribeBaseline(const Baseline& baseline);

// Weight given to the historical result for a given staleness, in
// [kMinHistoricalWeight, 1].
double HistoricalWeight(int staleness);

// Blends |shares| towards |fresh| when the baseline is stale and fresh data
// exists. Parties missing from either side count as zero. Returns false and
// leaves |shares| alone when no blend applies.
bool BlendStaleBaseline(const Baseline& baseline, const ShareMap& fresh, ShareMap* shares,
                        MethodologyStep* step);

} // namespace wardcast
