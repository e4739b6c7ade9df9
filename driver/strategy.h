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

#include <string>
#include <vector>

#include <proto/history.pb.h>
#include <proto/model.pb.h>
#include <proto/strategy.pb.h>
#include "aggregate.h"

namespace wardcast {

// Logistic steepness: one extra point of swing needed costs a lot of
// probability.
static constexpr double kWinProbabilitySteepness = 15.0;
static constexpr int64_t kDefaultElectorate = 5000;
static constexpr int64_t kEfficiencyElectorate = 15000;
static constexpr size_t kMaxScenarioWards = 20;
static constexpr size_t kMaxTopTargets = 10;

const char* WardClassName(WardClass c);
const char* WardClassLabel(WardClass c);
int WardClassPriority(WardClass c);

// Strategic tier of a ward for |our_party|. |defender| is the party
// defending the seat, or empty.
Classification ClassifyWard(const WardPrediction& prediction, const std::string& our_party,
                            const std::string& defender);

// Butler swing needed for |our_party| to take the ward. Negative is a lead.
// Infinite when there is no prediction.
double CalculateSwingRequired(const WardPrediction& prediction, const std::string& our_party);

double WinProbability(double swing_required);
double Efficiency(int64_t electorate);
int CompositeScore(double win_probability, int64_t electorate, double turnout, bool defending);

std::vector<TalkingPoint> GenerateTalkingPoints(const Ward& ward,
                                                const WardPrediction* prediction);
Archetype ClassifyArchetype(const Ward& ward);

// Every contested ward with a valid prediction, best score first.
std::vector<RankedWard> RankBattlegrounds(const CouncilData& data,
                                          const CouncilPrediction& prediction,
                                          const std::string& our_party);

PathToControl CalculatePathToControl(const std::vector<RankedWard>& ranked,
                                     const SeatTotals& seats, int total_seats,
                                     const std::string& our_party);

StrategySummary GenerateStrategySummary(const std::vector<RankedWard>& ranked,
                                        const std::string& our_party);

// Butler swing from |b| to |a| between two elections.
double CalculateSwingBetween(const ElectionRecord& earlier, const ElectionRecord& later,
                             const std::string& a, const std::string& b);
SwingHistory CalculateSwingHistory(const Ward& ward, const std::string& our_party);

// Most recent election by date, or null.
const ElectionRecord* LatestElection(const Ward& ward);

} // namespace wardcast
