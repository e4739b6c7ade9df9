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
#include "test_util.h"

#include <math.h>

#include <algorithm>

namespace wardcast {
namespace testing {

Date
MakeDate(int year, unsigned month, unsigned day)
{
    Date d;
    d.set_year(year);
    d.set_month(month);
    d.set_day(day);
    return d;
}

ElectionRecord
MakeRecord(int year, const std::string& type, int64_t electorate, double turnout,
           const PartyShares& shares)
{
    ElectionRecord r;
    *r.mutable_date() = MakeDate(year, 5, 4);
    r.set_type(type);
    r.set_year(year);
    r.set_electorate(electorate);
    r.set_turnout(turnout);
    int64_t valid = llround(double(electorate) * turnout);
    r.set_turnout_votes(valid);
    for (const auto& [party, share] : shares) {
        auto c = r.add_candidates();
        c->set_name(party + " candidate");
        c->set_party(party);
        c->set_share(share);
        c->set_votes(llround(share * double(valid)));
    }
    return r;
}

Ward
MakeWard(const std::string& name, const std::vector<ElectionRecord>& history,
         const std::vector<std::string>& holder_parties)
{
    Ward w;
    w.set_name(name);
    for (const auto& r : history)
        *w.add_history() = r;
    int n = 1;
    for (const auto& party : holder_parties) {
        auto h = w.add_current_holders();
        h->set_name("Councillor " + std::to_string(n++));
        h->set_party(party);
    }
    return w;
}

Centroid
MakeCentroid(double lat, double lng)
{
    Centroid c;
    c.set_lat(lat);
    c.set_lng(lng);
    return c;
}

WardPrediction
MakePrediction(const std::string& ward, const PartyShares& shares)
{
    PartyShares sorted = shares;
    auto cmp = [](const std::pair<std::string, double>& a,
                  const std::pair<std::string, double>& b) -> bool {
        return a.second > b.second;
    };
    std::stable_sort(sorted.begin(), sorted.end(), cmp);

    WardPrediction p;
    p.set_ward(ward);
    p.set_valid(!sorted.empty());
    p.set_total_votes(1000);
    for (const auto& [party, share] : sorted) {
        auto r = p.add_results();
        r->set_party(party);
        r->set_share(share);
        r->set_votes(llround(share * 1000));
    }
    if (!sorted.empty())
        p.set_winner(sorted[0].first);
    if (sorted.size() > 1) {
        p.set_runner_up(sorted[1].first);
        p.set_majority_pct(sorted[0].second - sorted[1].second);
    }
    return p;
}

RankedWard
MakeRanked(const std::string& ward, WardClass c, int score, double win_probability,
           int64_t electorate)
{
    RankedWard r;
    r.set_ward(ward);
    r.mutable_classification()->set_ward_class(c);
    r.set_score(score);
    r.set_win_probability(win_probability);
    r.set_electorate(electorate);
    return r;
}

} // namespace testing
} // namespace wardcast
