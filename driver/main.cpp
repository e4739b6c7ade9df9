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
#include <stdio.h>
#include <sysexits.h>

#include <memory>
#include <sstream>

#include <amtl/experimental/am-argparser.h>
#include <google/protobuf/text_format.h>
#include <proto/model.pb.h>
#include <proto/strategy.pb.h>
#include "aggregate.h"
#include "canvass.h"
#include "context.h"
#include "council.h"
#include "export.h"
#include "logging.h"
#include "mathlib.h"
#include "predict.h"
#include "progress-bar.h"
#include "resources.h"
#include "strategy.h"
#include "utility.h"

using namespace ke;

args::StringOption settings_file("settings_file", "Settings file");
args::EnableOption skip_export(nullptr, "--skip-export", false, "Do not write CSV exports");
args::IntOption num_threads(nullptr, "--num-threads", ke::Some(-1), "Number of threads");
args::EnableOption verbose(nullptr, "--verbose", false, "Log per-ward predictions");

namespace wardcast {

class Driver final
{
  public:
    Driver(Context* cx, Council* council);

    bool Run();

  private:
    bool Predict();
    void Plan();
    bool Export();

  private:
    Context* cx_;
    Council* council_;
    CouncilPrediction prediction_;
    std::vector<RankedWard> ranked_;
    std::vector<ResourceAllocation> allocations_;
    CanvassPlan canvass_;
};

Driver::Driver(Context* cx, Council* council)
  : cx_(cx),
    council_(council)
{
}

bool
Driver::Run()
{
    if (!Predict())
        return false;
    Plan();
    return Export();
}

bool
Driver::Predict()
{
    const CouncilData& data = council_->data();
    WardPredictor predictor(data, council_->assumptions(), council_->rules(),
                            council_->election_type(), cx_->current_year());
    CouncilAggregator aggregator(data, predictor);

    {
        WardProgress progress(council_->name(), data.wards_up_size());
        if (!aggregator.Run(&cx_->workers(), &prediction_, &progress))
            return false;
    }

    for (const auto& [ward, prediction] : prediction_.wards()) {
        if (!prediction.valid())
            Err() << "No usable history for " << ward << ", not predicted";
    }

    SeatTotals totals = ApplyOverrides(prediction_, council_->overrides());
    prediction_.clear_seat_totals();
    for (const auto& [party, seats] : totals)
        (*prediction_.mutable_seat_totals())[party] = seats;
    for (const auto& [ward, party] : council_->overrides())
        (*prediction_.mutable_overrides())[ward] = party;

    int total_seats = TotalSeats(totals);
    prediction_.set_total_seats(total_seats);
    for (auto& coalition : FindCoalitions(totals, MajorityThreshold(total_seats)))
        *prediction_.add_coalitions() = std::move(coalition);

    Out() << council_->name() << ": " << total_seats << " seats, "
          << MajorityThreshold(total_seats) << " for a majority";
    for (const auto& [party, seats] : totals)
        Out() << "  " << party << ": " << seats;
    return true;
}

void
Driver::Plan()
{
    const auto& our_party = council_->our_party();
    SeatTotals holdings = CurrentHoldings(council_->data());

    ranked_ = RankBattlegrounds(council_->data(), prediction_, our_party);

    PathToControl path = CalculatePathToControl(ranked_, holdings, TotalSeats(holdings),
                                                our_party);
    Out() << our_party << " holds " << path.current_seats() << " of "
          << path.total_seats() << " seats and needs " << path.seats_needed() << " more";
    for (const auto& scenario : path.scenarios()) {
        Debug() << "  top " << scenario.wards_walked() << " wards: " << scenario.seats()
                << " seats, p=" << scenario.probability()
                << (scenario.enough() ? " (majority)" : "");
    }

    StrategySummary summary = GenerateStrategySummary(ranked_, our_party);
    Out() << summary.total_wards() << " wards ranked, average score "
          << summary.average_score() << ", " << summary.top_opportunities()
          << " opportunities, " << summary.vulnerable_seats() << " vulnerable";

    allocations_ = AllocateResources(ranked_, council_->total_hours());

    CentroidMap centroids = GetCentroids(council_->data());
    std::vector<std::string> wards;
    for (const auto& w : ranked_)
        wards.emplace_back(w.ward());
    auto clusters = ClusterWards(centroids, wards, council_->session_cap());
    canvass_ = OptimiseCanvassingRoute(clusters, centroids, allocations_);
    Debug() << canvass_.sessions_size() << " canvassing sessions planned";
}

bool
Driver::Export()
{
    std::string str;
    google::protobuf::TextFormat::PrintToString(prediction_, &str);
    if (!cx_->Save(str, "prediction.text"))
        return false;

    if (skip_export.value())
        return true;

    const auto& name = council_->name();
    const auto& party = council_->our_party();
    {
        std::ostringstream out;
        WriteStrategyCsv(out, name, party, Today(), ranked_, allocations_);
        if (!cx_->Save(out.str(), "strategy.csv"))
            return false;
    }
    {
        std::ostringstream out;
        WriteResourceCsv(out, name, party, allocations_);
        if (!cx_->Save(out.str(), "resources.csv"))
            return false;
    }
    {
        std::ostringstream out;
        WriteCanvassCsv(out, name, party, canvass_);
        if (!cx_->Save(out.str(), "canvassing.csv"))
            return false;
    }
    return true;
}

} // namespace wardcast

using namespace wardcast;

static int
Run(int argc, char** argv)
{
    args::Parser parser(nullptr);
    if (!parser.parse(argc, argv)) {
        parser.usage(stderr, argc, argv);
        return EX_USAGE;
    }
    if (verbose.value())
        SetLogLevel(LogLevel::Verbose);

    auto cx = std::make_unique<Context>();
    if (!cx->Init(settings_file.value(), num_threads.value()))
        return EX_USAGE;

    auto council = std::make_unique<Council>();
    if (!council->Init(cx.get())) {
        Err() << "Could not load council " << cx->GetProp("council");
        return EX_DATAERR;
    }

    Driver driver(cx.get(), council.get());
    if (!driver.Run())
        return EX_SOFTWARE;

    return 0;
}

int main(int argc, char** argv)
{
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    int rv = Run(argc, argv);
    google::protobuf::ShutdownProtobufLibrary();
    return rv;
}
