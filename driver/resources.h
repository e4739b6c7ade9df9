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

#include <vector>

#include <proto/strategy.pb.h>

namespace wardcast {

// Doors knocked per volunteer hour, and the fraction of contacts that turn
// into a vote.
static constexpr double kContactsPerHour = 8.0;
static constexpr double kPersuasionRate = 0.15;

double ClassMultiplier(WardClass c);
double UrgencyFactor(double win_probability);
RoiTier RateRoi(double win_probability, double cost_per_vote);
const char* RoiName(RoiTier tier);

// Splits |total_hours| across the ranked wards in proportion to score,
// classification, urgency and size. Largest allocation first. Empty when no
// ward carries any weight.
std::vector<ResourceAllocation> AllocateResources(const std::vector<RankedWard>& ranked,
                                                  int64_t total_hours);

} // namespace wardcast
