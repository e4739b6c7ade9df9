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

#include <math.h>

#include <vector>

#include <proto/history.pb.h>

namespace wardcast {

double Sum(const std::vector<double>& values);
double Average(const std::vector<double>& values);
// Population standard deviation.
double StandardDeviation(const std::vector<double>& values);

// Round to a fixed number of decimal places.
double RoundTo(double value, int places);

// Logistic curve 1 / (1 + e^(x * steepness)); falls as x grows.
double Logistic(double x, double steepness);

// Great-circle distance in kilometres.
double Haversine(const Centroid& a, const Centroid& b);

static inline int
MajorityThreshold(int total_seats)
{
    return (total_seats / 2) + 1;
}

} // namespace wardcast
