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
#include "strategy.h"

#include <math.h>

#include <algorithm>
#include <limits>
#include <unordered_set>

#include <amtl/am-string.h>

#include "adjustments.h"
#include "mathlib.h"
#include "predict.h"
#include "utility.h"

namespace wardcast {

struct WardClassInfo {
    WardClass id;
    const char* name;
    const char* label;
    int priority;
};

static const WardClassInfo kWardClasses[] = {
    {WARD_UNKNOWN, "unknown", "Unknown", 99},
    {WARD_SAFE, "safe", "Safe", 6},
    {WARD_HOLD, "hold", "Hold", 5},
    {WARD_MARGINAL_HOLD, "marginal_hold", "Marginal Hold", 3},
    {WARD_BATTLEGROUND, "battleground", "Battleground", 1},
    {WARD_TARGET, "target", "Target", 2},
    {WARD_STRETCH, "stretch", "Stretch", 4},
    {WARD_WRITE_OFF, "write_off", "Write-off", 7},
};

static const WardClassInfo&
GetClassInfo(WardClass c)
{
    for (const auto& info : kWardClasses) {
        if (info.id == c)
            return info;
    }
    return kWardClasses[0];
}

const char*
WardClassName(WardClass c)
{
    return GetClassInfo(c).name;
}

const char*
WardClassLabel(WardClass c)
{
    return GetClassInfo(c).label;
}

int
WardClassPriority(WardClass c)
{
    return GetClassInfo(c).priority;
}

static Classification
MakeClassification(WardClass c, double majority_pct)
{
    Classification out;
    out.set_ward_class(c);
    out.set_majority_pct(majority_pct);
    out.set_priority(WardClassPriority(c));
    return out;
}

Classification
ClassifyWard(const WardPrediction& prediction, const std::string& our_party,
             const std::string& defender)
{
    if (!prediction.valid() || prediction.winner().empty())
        return MakeClassification(WARD_UNKNOWN, 0.0);

    double margin = fabs(prediction.majority_pct());
    bool we_win = prediction.winner() == our_party;
    bool we_defend = !defender.empty() && defender == our_party;

    if (we_win && we_defend) {
        if (margin > 0.15)
            return MakeClassification(WARD_SAFE, margin);
        if (margin > 0.05)
            return MakeClassification(WARD_HOLD, margin);
        return MakeClassification(WARD_MARGINAL_HOLD, margin);
    }
    if (we_win) {
        if (margin > 0.05)
            return MakeClassification(WARD_TARGET, margin);
        return MakeClassification(WARD_BATTLEGROUND, margin);
    }
    if (we_defend) {
        if (margin < 0.02)
            return MakeClassification(WARD_BATTLEGROUND, -margin);
        if (margin < 0.05)
            return MakeClassification(WARD_MARGINAL_HOLD, -margin);
        return MakeClassification(WARD_TARGET, -margin);
    }
    if (margin < 0.02)
        return MakeClassification(WARD_BATTLEGROUND, -margin);
    if (margin < 0.10)
        return MakeClassification(WARD_TARGET, -margin);
    if (margin < 0.20)
        return MakeClassification(WARD_STRETCH, -margin);
    return MakeClassification(WARD_WRITE_OFF, -margin);
}

static double
ResultShare(const WardPrediction& prediction, const std::string& party)
{
    for (const auto& r : prediction.results()) {
        if (r.party() == party)
            return r.share();
    }
    return 0.0;
}

double
CalculateSwingRequired(const WardPrediction& prediction, const std::string& our_party)
{
    if (!prediction.valid() || prediction.results().empty())
        return std::numeric_limits<double>::infinity();

    double ours = ResultShare(prediction, our_party);
    const auto& winner = prediction.results(0);
    if (winner.party() == our_party) {
        double next = prediction.results_size() > 1 ? prediction.results(1).share() : 0.0;
        return -(ours - next) / 2;
    }
    return (winner.share() - ours) / 2;
}

double
WinProbability(double swing_required)
{
    return Logistic(swing_required, kWinProbabilitySteepness);
}

double
Efficiency(int64_t electorate)
{
    return std::max(0.0, 1.0 - double(electorate) / double(kEfficiencyElectorate));
}

int
CompositeScore(double win_probability, int64_t electorate, double turnout, bool defending)
{
    double turnout_opportunity = std::max(0.0, 1.0 - turnout);
    double score = win_probability * 40 +
                   Efficiency(electorate) * 25 +
                   turnout_opportunity * 20 +
                   (defending ? 15 : 0);
    return std::clamp((int)round(score), 0, 100);
}

static TalkingPoint
MakePoint(const char* category, const char* icon, int priority, std::string text)
{
    TalkingPoint point;
    point.set_category(category);
    point.set_icon(icon);
    point.set_priority(priority);
    point.set_text(std::move(text));
    return point;
}

static std::string
WithThousands(int64_t value)
{
    std::string digits = std::to_string(value);
    std::string out;
    int count = 0;
    for (auto iter = digits.rbegin(); iter != digits.rend(); iter++) {
        if (count && count % 3 == 0 && *iter != '-')
            out.insert(out.begin(), ',');
        out.insert(out.begin(), *iter);
        count++;
    }
    return out;
}

const ElectionRecord*
LatestElection(const Ward& ward)
{
    const ElectionRecord* latest = nullptr;
    for (const auto& record : ward.history()) {
        if (!latest || record.date() > latest->date())
            latest = &record;
    }
    return latest;
}

std::vector<TalkingPoint>
GenerateTalkingPoints(const Ward& ward, const WardPrediction* prediction)
{
    std::vector<TalkingPoint> points;

    if (ward.has_demographics() && ward.demographics().population() > 0) {
        DemographicRatios r = ComputeDemographicRatios(ward.demographics());

        if (r.over65 > 0.25) {
            points.emplace_back(MakePoint("Demographics", "Users", 1, ke::StringPrintf(
                "%.0f%% over-65. Highlight: NHS waiting times, social care, pensions, "
                "council tax discounts.", r.over65 * 100)));
        } else if (r.over65 > 0.18) {
            points.emplace_back(MakePoint("Demographics", "Users", 3, ke::StringPrintf(
                "%.0f%% over-65. Consider: pension issues, local health services, bus routes.",
                r.over65 * 100)));
        }

        if (r.age_15_to_29 > 0.20) {
            points.emplace_back(MakePoint("Demographics", "GraduationCap", 3, ke::StringPrintf(
                "%.0f%% aged 15-29. Highlight: housing affordability, jobs, apprenticeships.",
                r.age_15_to_29 * 100)));
        }

        double diversity = 1.0 - r.white_british;
        if (diversity > 0.30) {
            std::string group = r.largest_minority_group.empty() ? "diverse"
                                                                 : r.largest_minority_group;
            points.emplace_back(MakePoint("Demographics", "Globe", 2, ke::StringPrintf(
                "%.0f%% ethnic minority (largest: %s). Community engagement essential.",
                diversity * 100, group.c_str())));
        } else if (r.white_british > 0.95) {
            points.emplace_back(MakePoint("Demographics", "Globe", 4, ke::StringPrintf(
                "%.0f%% White British. Immigration and border security may resonate strongly.",
                r.white_british * 100)));
        }

        if (r.unemployment > 0.06) {
            points.emplace_back(MakePoint("Economy", "Briefcase", 1, ke::StringPrintf(
                "%.1f%% unemployment. Highlight: local jobs, business support, skills training.",
                r.unemployment * 100)));
        }
    }

    if (ward.has_deprivation() && ward.deprivation().imd_decile() > 0) {
        int decile = ward.deprivation().imd_decile();
        if (decile <= 2) {
            points.emplace_back(MakePoint("Deprivation", "TrendingDown", 1, ke::StringPrintf(
                "Top 20%% most deprived (IMD decile %d). Key: cost of living, food banks, "
                "anti-social behaviour, fly-tipping.", decile)));
        } else if (decile >= 9) {
            points.emplace_back(MakePoint("Deprivation", "TrendingUp", 3, ke::StringPrintf(
                "Affluent ward (IMD decile %d). Key: council tax value for money, green spaces, "
                "planning decisions.", decile)));
        }
    }

    if (const ElectionRecord* latest = LatestElection(ward)) {
        double turnout = latest->turnout();
        if (turnout > 0.0 && turnout < 0.25) {
            points.emplace_back(MakePoint("GOTV", "Target", 1, ke::StringPrintf(
                "Very low turnout (%.0f%%). GOTV is critical: door-knock, postal vote forms.",
                turnout * 100)));
        } else if (turnout > 0.0 && turnout < 0.35) {
            points.emplace_back(MakePoint("GOTV", "Target", 2, ke::StringPrintf(
                "Below-average turnout (%.0f%%). Postal vote push and morning knock-up could "
                "swing this.", turnout * 100)));
        } else if (turnout > 0.50) {
            points.emplace_back(MakePoint("GOTV", "CheckCircle", 4, ke::StringPrintf(
                "High turnout ward (%.0f%%). Focus on persuasion over mobilisation.",
                turnout * 100)));
        }

        if (latest->electorate() > 8000) {
            points.emplace_back(MakePoint("Resources", "MapPin", 3,
                "Large ward (" + WithThousands(latest->electorate()) +
                " electors). Needs more leaflets and canvassers."));
        }
    }

    if (prediction && prediction->results_size() >= 3) {
        double second = prediction->results(1).share();
        double third = prediction->results(2).share();
        if (fabs(second - third) < 0.03) {
            points.emplace_back(MakePoint("Competition", "Swords", 2,
                "Three-way marginal: 2nd and 3rd place within 3pp. Vote splitting could "
                "decide the outcome."));
        }
    }

    auto by_priority = [](const TalkingPoint& a, const TalkingPoint& b) -> bool {
        return a.priority() < b.priority();
    };
    std::stable_sort(points.begin(), points.end(), by_priority);
    return points;
}

static Archetype
MakeArchetype(const char* id, const char* label, const char* description)
{
    Archetype a;
    a.set_archetype(id);
    a.set_label(label);
    a.set_description(description);
    return a;
}

Archetype
ClassifyArchetype(const Ward& ward)
{
    if (!ward.has_demographics() && !ward.has_deprivation())
        return MakeArchetype("unknown", "Unknown", "No data available");

    int decile = 5;
    if (ward.has_deprivation() && ward.deprivation().imd_decile() > 0)
        decile = ward.deprivation().imd_decile();

    DemographicRatios r = ComputeDemographicRatios(ward.demographics());

    if (decile <= 2 && r.white_british > 0.80) {
        return MakeArchetype("left_behind", "Left Behind",
                             "High deprivation, predominantly White British. Cost of living, "
                             "immigration and local services are top concerns.");
    }
    if (decile <= 2) {
        return MakeArchetype("urban_diverse", "Urban Diverse",
                             "High deprivation, ethnically diverse. Community cohesion, "
                             "employment and housing are key.");
    }
    if (decile >= 8 && r.over65 > 0.22) {
        return MakeArchetype("affluent_retired", "Affluent Retired",
                             "Low deprivation, older population. Council tax value, green spaces "
                             "and heritage matter most.");
    }
    if (decile >= 8) {
        return MakeArchetype("affluent_family", "Affluent Families",
                             "Low deprivation, working-age. Schools, planning, roads and property "
                             "values are priorities.");
    }
    if (r.over65 > 0.28) {
        return MakeArchetype("retirement", "Retirement Ward",
                             "Very high over-65 population. Health, social care and transport "
                             "links are concerns.");
    }
    if (r.unemployment > 0.08) {
        return MakeArchetype("struggling", "Struggling",
                             "High unemployment. Jobs, skills and anti-social behaviour are "
                             "priorities.");
    }
    if (decile >= 4 && decile <= 7) {
        return MakeArchetype("middle_ground", "Middle Ground",
                             "Average deprivation. Broad appeal needed: bins, roads, council tax.");
    }
    return MakeArchetype("mixed", "Mixed",
                         "No dominant demographic pattern. Standard broad-appeal messaging.");
}

std::vector<RankedWard>
RankBattlegrounds(const CouncilData& data, const CouncilPrediction& prediction,
                  const std::string& our_party)
{
    std::vector<RankedWard> out;
    std::unordered_set<std::string> seen;

    for (const auto& name : data.wards_up()) {
        if (!seen.emplace(name).second)
            continue;
        auto iter = prediction.wards().find(name);
        if (iter == prediction.wards().end())
            continue;
        const WardPrediction& pred = iter->second;
        const Ward* ward = FindWard(data, name);
        if (!ward || !pred.valid())
            continue;

        std::string defender = DefendingParty(*ward);
        double swing = CalculateSwingRequired(pred, our_party);
        double win_probability = WinProbability(swing);

        int64_t electorate = kDefaultElectorate;
        double turnout = kDefaultTurnout;
        if (const ElectionRecord* latest = LatestElection(*ward)) {
            if (latest->electorate() > 0)
                electorate = latest->electorate();
            if (latest->turnout() > 0.0)
                turnout = latest->turnout();
        }

        RankedWard r;
        r.set_ward(name);
        *r.mutable_classification() = ClassifyWard(pred, our_party, defender);
        r.set_winner(pred.winner());
        r.set_our_share(ResultShare(pred, our_party));
        r.set_winner_share(pred.results(0).share());
        r.set_swing_required(RoundTo(swing, 3));
        r.set_win_probability(RoundTo(win_probability, 2));
        r.set_electorate(electorate);
        r.set_turnout(turnout);
        r.set_defender(defender);
        r.set_confidence(pred.confidence());
        r.set_score(CompositeScore(win_probability, electorate, turnout,
                                   !defender.empty() && defender == our_party));
        for (auto& point : GenerateTalkingPoints(*ward, &pred))
            *r.add_talking_points() = std::move(point);
        *r.mutable_archetype() = ClassifyArchetype(*ward);
        out.emplace_back(std::move(r));
    }

    auto by_score = [](const RankedWard& a, const RankedWard& b) -> bool {
        if (a.score() != b.score())
            return a.score() > b.score();
        return a.ward() < b.ward();
    };
    std::sort(out.begin(), out.end(), by_score);
    return out;
}

static inline bool
Defends(const RankedWard& w, const std::string& our_party)
{
    return !w.defender().empty() && w.defender() == our_party;
}

PathToControl
CalculatePathToControl(const std::vector<RankedWard>& ranked, const SeatTotals& seats,
                       int total_seats, const std::string& our_party)
{
    PathToControl path;
    int threshold = MajorityThreshold(total_seats);
    int current = 0;
    if (auto iter = seats.find(our_party); iter != seats.end())
        current = iter->second;

    path.set_majority_threshold(threshold);
    path.set_total_seats(total_seats);
    path.set_current_seats(current);
    path.set_seats_needed(std::max(0, threshold - current));

    int defending = 0;
    for (const auto& w : ranked) {
        if (Defends(w, our_party))
            defending++;
    }
    path.set_defending_count(defending);

    // Seats up for election are re-won or lost, so start without them.
    std::vector<const RankedWard*> by_probability;
    for (const auto& w : ranked)
        by_probability.emplace_back(&w);
    auto cmp = [](const RankedWard* a, const RankedWard* b) -> bool {
        return a->win_probability() > b->win_probability();
    };
    std::stable_sort(by_probability.begin(), by_probability.end(), cmp);

    int running_seats = current - defending;
    double running_prob = 1.0;
    size_t limit = std::min(by_probability.size(), kMaxScenarioWards);
    for (size_t i = 0; i < limit; i++) {
        const RankedWard* w = by_probability[i];
        if (w->winner() == our_party || w->swing_required() <= 0) {
            running_seats++;
            running_prob *= w->win_probability();
        }

        bool enough = running_seats >= threshold;
        if ((i + 1) % 3 == 0 || i + 1 == limit || enough) {
            auto scenario = path.add_scenarios();
            scenario->set_wards_walked((int)i + 1);
            scenario->set_probability(RoundTo(running_prob, 2));
            scenario->set_seats(running_seats);
            scenario->set_enough(enough);
            if (enough)
                break;
        }
    }

    for (const auto& w : ranked) {
        if (path.top_targets_size() >= (int)kMaxTopTargets)
            break;
        if (!Defends(w, our_party) && w.classification().ward_class() != WARD_WRITE_OFF)
            *path.add_top_targets() = w;
    }

    std::vector<const RankedWard*> vulnerable;
    for (const auto& w : ranked) {
        if (Defends(w, our_party) && w.winner() != our_party)
            vulnerable.emplace_back(&w);
    }
    auto ascending = [](const RankedWard* a, const RankedWard* b) -> bool {
        return a->win_probability() < b->win_probability();
    };
    std::stable_sort(vulnerable.begin(), vulnerable.end(), ascending);
    for (const auto* w : vulnerable)
        *path.add_vulnerable() = *w;
    return path;
}

StrategySummary
GenerateStrategySummary(const std::vector<RankedWard>& ranked, const std::string& our_party)
{
    StrategySummary summary;
    int total_score = 0;
    int opportunities = 0;
    int vulnerable = 0;
    for (const auto& w : ranked) {
        (*summary.mutable_by_classification())[WardClassName(w.classification().ward_class())]++;
        total_score += w.score();
        if (!Defends(w, our_party) && w.win_probability() > 0.40)
            opportunities++;
        if (Defends(w, our_party) && w.winner() != our_party)
            vulnerable++;
    }
    if (!ranked.empty())
        summary.set_average_score((int)round(double(total_score) / double(ranked.size())));
    summary.set_top_opportunities(opportunities);
    summary.set_vulnerable_seats(vulnerable);
    summary.set_total_wards((int)ranked.size());
    return summary;
}

static double
CandidateShare(const ElectionRecord& record, const Candidate& c)
{
    if (c.share() > 0.0)
        return c.share();
    if (record.turnout_votes() > 0)
        return double(c.votes()) / double(record.turnout_votes());
    return 0.0;
}

static double
PartyShare(const ElectionRecord& record, const std::string& party)
{
    double best = 0.0;
    for (const auto& c : record.candidates()) {
        if (c.party() == party)
            best = std::max(best, CandidateShare(record, c));
    }
    return best;
}

double
CalculateSwingBetween(const ElectionRecord& earlier, const ElectionRecord& later,
                      const std::string& a, const std::string& b)
{
    if (earlier.candidates().empty() || later.candidates().empty())
        return 0.0;
    double a_gain = PartyShare(later, a) - PartyShare(earlier, a);
    double b_loss = PartyShare(earlier, b) - PartyShare(later, b);
    return (a_gain + b_loss) / 2;
}

SwingHistory
CalculateSwingHistory(const Ward& ward, const std::string& our_party)
{
    SwingHistory history;
    if (ward.history().empty()) {
        history.set_trend("unknown");
        return history;
    }

    std::vector<const ElectionRecord*> records;
    for (const auto& record : ward.history()) {
        if (!record.candidates().empty())
            records.emplace_back(&record);
    }
    auto oldest_first = [](const ElectionRecord* a, const ElectionRecord* b) -> bool {
        return a->date() < b->date();
    };
    std::stable_sort(records.begin(), records.end(), oldest_first);

    std::vector<double> our_shares;
    for (const auto* record : records) {
        const Candidate* winner = &record->candidates(0);
        for (const auto& c : record->candidates()) {
            if (CandidateShare(*record, c) > CandidateShare(*record, *winner))
                winner = &c;
        }
        double ours = PartyShare(*record, our_party);
        double winner_share = CandidateShare(*record, *winner);

        double margin;
        if (winner->party() == our_party) {
            double best_other = 0.0;
            for (const auto& c : record->candidates()) {
                if (c.party() != our_party)
                    best_other = std::max(best_other, CandidateShare(*record, c));
            }
            margin = ours - best_other;
        } else {
            margin = ours - winner_share;
        }

        auto point = history.add_points();
        point->set_year(ElectionYear(*record));
        *point->mutable_date() = record->date();
        point->set_our_share(ours);
        point->set_winner(winner->party().empty() ? "Unknown" : winner->party());
        point->set_winner_share(winner_share);
        point->set_margin(margin);
        point->set_turnout(record->turnout());
        point->set_electorate(record->electorate());
        our_shares.emplace_back(ours);
    }

    if (our_shares.size() < 2) {
        history.set_trend("insufficient");
        return history;
    }

    std::vector<double> changes;
    for (size_t i = 1; i < our_shares.size(); i++)
        changes.emplace_back(our_shares[i] - our_shares[i - 1]);

    double average = Average(changes);
    double volatility = StandardDeviation(changes);

    std::string trend = "stable";
    if (changes.size() >= 2) {
        size_t recent_count = std::min<size_t>(3, changes.size());
        std::vector<double> recent(changes.end() - recent_count, changes.end());
        double recent_average = Average(recent);
        if (recent_average > 0.02)
            trend = "improving";
        else if (recent_average < -0.02)
            trend = "declining";
        else if (volatility > 0.08)
            trend = "volatile";
    }

    history.set_trend(trend);
    history.set_average_swing(RoundTo(average, 3));
    history.set_volatility(RoundTo(volatility, 3));
    return history;
}

} // namespace wardcast
