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
#include <proto/strategy.pb.h>

namespace wardcast {

typedef std::map<std::string, Centroid> CentroidMap;

static constexpr int kMaxClusterIterations = 20;
static constexpr int kDefaultSessionCap = 6;
static constexpr double kHoursPerBlock = 4.0;

// Centroids of every ward in |data| that has one.
CentroidMap GetCentroids(const CouncilData& data);

// Groups |wards| into canvassing areas of roughly |session_cap| wards. Wards
// without a centroid are dropped. Deterministic for a given ward order.
std::vector<GeoCluster> ClusterWards(const CentroidMap& centroids,
                                     const std::vector<std::string>& wards,
                                     int session_cap);

// Orders clusters, and the wards within each, by nearest-neighbour walk.
CanvassPlan OptimiseCanvassingRoute(const std::vector<GeoCluster>& clusters,
                                    const CentroidMap& centroids,
                                    const std::vector<ResourceAllocation>& allocations);

} // namespace wardcast
