// vim: set sts=4 ts=8 sw=4 tw=99 et:
#include <stdio.h>

#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>

#include <amtl/am-string.h>
#include <google/protobuf/text_format.h>
#include <proto/model.pb.h>
#include "aggregate.h"
#include "mathlib.h"

using namespace wardcast;

static void
PrintTotals(const SeatTotals& totals)
{
    int total = TotalSeats(totals);
    std::cout << total << " seats, " << MajorityThreshold(total) << " for a majority\n";
    for (const auto& [party, seats] : totals)
        std::cout << "  " << party << ": " << seats << "\n";
}

int main(int argc, char** argv)
{
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    if (argc < 2) {
        std::cerr << "Usage: <prediction.text> [ward=party ...]\n";
        return 1;
    }

    std::ifstream input(argv[1]);
    if (!input) {
        std::cerr << "error opening: " << argv[1] << "\n";
        return 1;
    }
    std::stringstream buffer;
    buffer << input.rdbuf();

    CouncilPrediction prediction;
    if (!google::protobuf::TextFormat::ParseFromString(buffer.str(), &prediction)) {
        std::cerr << "error parsing: " << argv[1] << "\n";
        return 1;
    }

    std::map<std::string, std::string> overrides;
    for (int i = 2; i < argc; i++) {
        auto parts = ke::Split(argv[i], "=");
        if (parts.size() != 2 || parts[0].empty() || parts[1].empty()) {
            std::cerr << "bad override (expected ward=party): " << argv[i] << "\n";
            return 1;
        }
        if (!prediction.wards().count(parts[0]))
            std::cerr << "warning: no prediction for ward " << parts[0] << "\n";
        overrides[parts[0]] = parts[1];
    }

    SeatTotals totals = ApplyOverrides(prediction, overrides);
    std::cout << prediction.council() << ": ";
    PrintTotals(totals);

    auto coalitions = FindCoalitions(totals, MajorityThreshold(TotalSeats(totals)));
    if (coalitions.empty()) {
        std::cout << "No combination of up to three parties reaches a majority\n";
        return 0;
    }
    for (const auto& c : coalitions) {
        std::string parties;
        for (const auto& party : c.parties()) {
            if (!parties.empty())
                parties += " + ";
            parties += party;
        }
        printf("%-48s %3d seats (majority %d)\n", parties.c_str(), c.total_seats(),
               c.majority());
    }
    return 0;
}
