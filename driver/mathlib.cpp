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
#include <numeric>

#include "mathlib.h"

namespace wardcast {

static constexpr double kEarthRadiusKm = 6371.0;
static const double kPi = 4.0 * atan(1.0);

double
Sum(const std::vector<double>& values)
{
    return std::accumulate(values.begin(), values.end(), 0.0);
}

double
Average(const std::vector<double>& values)
{
    if (values.empty())
        return 0.0;
    return Sum(values) / double(values.size());
}

double
StandardDeviation(const std::vector<double>& values)
{
    if (values.empty())
        return 0.0;

    double mean = Average(values);
    double sigma = 0.0;
    for (const auto& val : values) {
        double x = val - mean;
        sigma += x * x;
    }
    return sqrt(sigma / double(values.size()));
}

double
RoundTo(double value, int places)
{
    double scale = pow(10.0, places);
    return round(value * scale) / scale;
}

double
Logistic(double x, double steepness)
{
    return 1.0 / (1.0 + exp(x * steepness));
}

static inline double
ToRadians(double degrees)
{
    return degrees * kPi / 180.0;
}

double
Haversine(const Centroid& a, const Centroid& b)
{
    double dlat = ToRadians(b.lat() - a.lat());
    double dlng = ToRadians(b.lng() - a.lng());
    double h = sin(dlat / 2) * sin(dlat / 2) +
               cos(ToRadians(a.lat())) * cos(ToRadians(b.lat())) *
               sin(dlng / 2) * sin(dlng / 2);
    return kEarthRadiusKm * 2.0 * atan2(sqrt(h), sqrt(1.0 - h));
}

} // namespace wardcast
