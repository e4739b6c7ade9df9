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

#include <ostream>
#include <string>
#include <vector>

#include <proto/history.pb.h>
#include <proto/strategy.pb.h>

namespace wardcast {

// How many talking points the strategy export folds into its last column.
static constexpr int kExportTalkingPoints = 3;

// Each writer emits "#" comment lines, then one header row and one row per
// entry. Fields with a comma, quote or newline are quoted and embedded quotes
// doubled.
void WriteStrategyCsv(std::ostream& out, const std::string& council,
                      const std::string& our_party, const Date& generated,
                      const std::vector<RankedWard>& ranked,
                      const std::vector<ResourceAllocation>& allocations);

void WriteResourceCsv(std::ostream& out, const std::string& council,
                      const std::string& our_party,
                      const std::vector<ResourceAllocation>& allocations);

void WriteCanvassCsv(std::ostream& out, const std::string& council,
                     const std::string& our_party, const CanvassPlan& plan);

} // namespace wardcast
