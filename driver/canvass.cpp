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
#include "canvass.h"

#include <math.h>

#include <algorithm>
#include <limits>
#include <optional>

#include "logging.h"
#include "mathlib.h"
#include "resources.h"

namespace wardcast {

CentroidMap
GetCentroids(const CouncilData& data)
{
    CentroidMap out;
    for (const auto& ward : data.wards()) {
        if (ward.has_centroid())
            out[ward.name()] = ward.centroid();
    }
    return out;
}

static Centroid
MeanOf(const std::vector<const Centroid*>& points)
{
    Centroid c;
    if (points.empty())
        return c;
    double lat = 0, lng = 0;
    for (const auto* p : points) {
        lat += p->lat();
        lng += p->lng();
    }
    c.set_lat(lat / points.size());
    c.set_lng(lng / points.size());
    return c;
}

static size_t
NearestCentre(const Centroid& point, const std::vector<Centroid>& centres)
{
    size_t best = 0;
    double best_distance = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < centres.size(); i++) {
        double d = Haversine(point, centres[i]);
        if (d < best_distance) {
            best = i;
            best_distance = d;
        }
    }
    return best;
}

std::vector<GeoCluster>
ClusterWards(const CentroidMap& centroids, const std::vector<std::string>& wards,
             int session_cap)
{
    std::vector<std::string> names;
    std::vector<const Centroid*> points;
    for (const auto& name : wards) {
        auto iter = centroids.find(name);
        if (iter == centroids.end()) {
            Debug() << "Ward " << name << " has no centroid, not clustered";
            continue;
        }
        names.emplace_back(name);
        points.emplace_back(&iter->second);
    }
    if (names.empty())
        return {};

    size_t n = names.size();
    size_t cap = std::max(session_cap, 1);
    if (n <= cap) {
        GeoCluster cluster;
        for (const auto& name : names)
            cluster.add_wards(name);
        *cluster.mutable_centroid() = MeanOf(points);
        return {cluster};
    }

    size_t k = (n + cap - 1) / cap;
    std::vector<Centroid> centres;
    for (size_t i = 0; i < k; i++)
        centres.emplace_back(*points[(i * n) / k]);

    std::vector<size_t> assignment(n, k);
    for (int iteration = 0; iteration < kMaxClusterIterations; iteration++) {
        bool changed = false;
        for (size_t i = 0; i < n; i++) {
            size_t nearest = NearestCentre(*points[i], centres);
            if (nearest != assignment[i]) {
                assignment[i] = nearest;
                changed = true;
            }
        }
        if (!changed)
            break;

        for (size_t c = 0; c < k; c++) {
            std::vector<const Centroid*> members;
            for (size_t i = 0; i < n; i++) {
                if (assignment[i] == c)
                    members.emplace_back(points[i]);
            }
            // An emptied cluster keeps its old centre.
            if (!members.empty())
                centres[c] = MeanOf(members);
        }
    }

    std::vector<GeoCluster> out;
    for (size_t c = 0; c < k; c++) {
        GeoCluster cluster;
        for (size_t i = 0; i < n; i++) {
            if (assignment[i] == c)
                cluster.add_wards(names[i]);
        }
        if (cluster.wards().empty())
            continue;
        *cluster.mutable_centroid() = centres[c];
        out.emplace_back(std::move(cluster));
    }
    return out;
}

// Greedy walk from |points[0]|; returns indices in visiting order.
static std::vector<size_t>
NearestNeighbourOrder(const std::vector<Centroid>& points)
{
    std::vector<size_t> order;
    if (points.empty())
        return order;

    std::vector<bool> visited(points.size(), false);
    size_t current = 0;
    visited[0] = true;
    order.emplace_back(0);
    while (order.size() < points.size()) {
        size_t next = points.size();
        double best = std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < points.size(); i++) {
            if (visited[i])
                continue;
            double d = Haversine(points[current], points[i]);
            if (next == points.size() || d < best) {
                next = i;
                best = d;
            }
        }
        visited[next] = true;
        order.emplace_back(next);
        current = next;
    }
    return order;
}

static RouteSegment
MakeSegment(const Centroid& from, const Centroid& to)
{
    RouteSegment segment;
    *segment.mutable_from() = from;
    *segment.mutable_to() = to;
    return segment;
}

CanvassPlan
OptimiseCanvassingRoute(const std::vector<GeoCluster>& clusters, const CentroidMap& centroids,
                        const std::vector<ResourceAllocation>& allocations)
{
    CanvassPlan plan;

    std::map<std::string, const ResourceAllocation*> by_ward;
    for (const auto& a : allocations)
        by_ward.emplace(a.ward(), &a);

    std::vector<Centroid> cluster_centres;
    for (const auto& cluster : clusters)
        cluster_centres.emplace_back(cluster.centroid());

    std::optional<Centroid> last_visit;
    for (size_t cluster_index : NearestNeighbourOrder(cluster_centres)) {
        const GeoCluster& cluster = clusters[cluster_index];

        std::vector<std::string> names;
        std::vector<Centroid> points;
        for (const auto& name : cluster.wards()) {
            auto iter = centroids.find(name);
            if (iter == centroids.end())
                continue;
            names.emplace_back(name);
            points.emplace_back(iter->second);
        }
        if (names.empty())
            continue;

        CanvassSession* session = plan.add_sessions();
        session->set_session_number(plan.sessions_size());
        *session->mutable_centroid() = cluster.centroid();

        double total_hours = 0.0;
        for (size_t i : NearestNeighbourOrder(points)) {
            CanvassVisit* visit = session->add_visits();
            visit->set_ward(names[i]);
            visit->set_visit_order(session->visits_size());
            *visit->mutable_centroid() = points[i];

            auto iter = by_ward.find(names[i]);
            if (iter != by_ward.end()) {
                visit->set_hours(double(iter->second->hours()));
                visit->set_roi(RoiName(iter->second->roi()));
            } else {
                visit->set_hours(kHoursPerBlock);
            }
            total_hours += visit->hours();

            if (last_visit)
                *plan.add_route() = MakeSegment(*last_visit, visit->centroid());
            last_visit = visit->centroid();
        }
        session->set_total_hours(total_hours);
        session->set_blocks((int)ceil(total_hours / kHoursPerBlock));
    }
    return plan;
}

} // namespace wardcast
