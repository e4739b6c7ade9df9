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
#include <gtest/gtest.h>

#include "adjustments.h"
#include "predict.h"
#include "test_util.h"

using namespace wardcast;
using namespace wardcast::testing;

TEST(NormalizeSharesTest, SumsToOneAndClampsNegatives) {
    ShareMap shares = {{"Labour", 0.45}, {"Conservative", 0.40}, {"Green", -0.03},
                       {"Reform UK", 0.30}};
    ShareMap out = NormalizeShares(shares);

    double total = 0.0;
    for (const auto& [party, share] : out) {
        EXPECT_GE(share, 0.0) << party;
        total += share;
    }
    EXPECT_NEAR(total, 1.0, 1e-9);
    EXPECT_DOUBLE_EQ(GetShare(out, "Green"), 0.0);
    EXPECT_NEAR(GetShare(out, "Labour"), 0.45 / 1.15, 1e-9);
}

TEST(NormalizeSharesTest, NoPositiveShareIsUnchanged) {
    ShareMap shares = {{"Labour", 0.0}, {"Green", -0.1}};
    EXPECT_EQ(NormalizeShares(shares), shares);
}

TEST(ConfidenceTest, UncalibratedThresholds) {
    EXPECT_EQ(RateConfidence(0.20, 0, "Labour", nullptr), CONFIDENCE_HIGH);
    EXPECT_EQ(RateConfidence(0.10, 0, "Labour", nullptr), CONFIDENCE_MEDIUM);
    EXPECT_EQ(RateConfidence(0.03, 0, "Labour", nullptr), CONFIDENCE_LOW);
}

TEST(ConfidenceTest, StaleBaselineCappedAtMedium) {
    EXPECT_EQ(RateConfidence(0.30, 12, "Labour", nullptr), CONFIDENCE_MEDIUM);
    EXPECT_EQ(RateConfidence(0.10, 12, "Labour", nullptr), CONFIDENCE_LOW);
}

TEST(ConfidenceTest, CalibratedThresholdsFollowWinnerError) {
    ModelCoefficients coeffs;
    (*coeffs.mutable_validation_mae())["Labour"] = 0.04;

    double interval = 0.0;
    EXPECT_EQ(RateConfidence(0.09, 0, "Labour", &coeffs, &interval), CONFIDENCE_HIGH);
    EXPECT_DOUBLE_EQ(interval, 0.04);
    EXPECT_EQ(RateConfidence(0.05, 0, "Labour", &coeffs), CONFIDENCE_MEDIUM);

    // Unknown winner uses the default error of 0.10.
    EXPECT_EQ(RateConfidence(0.15, 0, "Green", &coeffs, &interval), CONFIDENCE_MEDIUM);
    EXPECT_DOUBLE_EQ(interval, kDefaultWinnerMae);
}

class WardPredictorTest : public ::testing::Test
{
  protected:
    void SetUp() override {
        data_.set_name("Testshire");
        Ward ward = MakeWard("Castle", {
            MakeRecord(2022, "borough", 5000, 0.30,
                       {{"Labour", 0.5}, {"Conservative", 0.3}, {"Liberal Democrat", 0.2}}),
        }, {"Labour"});
        *data_.add_wards() = ward;
        *data_.add_wards() = MakeWard("Empty", {}, {"Green"});
        data_.add_wards_up("Castle");
        data_.add_wards_up("Empty");
    }

    CouncilData data_;
};

TEST_F(WardPredictorTest, RunsEveryStageInOrder) {
    WardPredictor predictor(data_, DefaultAssumptions(), DemographicRules(), "borough", 2024);
    auto prediction = PredictNamedWard(predictor, data_, "Castle");
    ASSERT_TRUE(prediction.has_value());
    ASSERT_TRUE(prediction->valid());

    ASSERT_EQ(prediction->methodology_size(), 6);
    const char* names[] = {"Baseline", "National Swing", "Demographics", "Incumbency",
                           "New Party Entry", "Normalise"};
    for (int i = 0; i < 6; i++) {
        EXPECT_EQ(prediction->methodology(i).step(), i + 1);
        EXPECT_EQ(prediction->methodology(i).name(), names[i]);
    }

    // Only incumbency moves anything: Labour 0.55 of 1.05.
    EXPECT_EQ(prediction->winner(), "Labour");
    EXPECT_EQ(prediction->runner_up(), "Conservative");
    EXPECT_NEAR(prediction->results(0).share(), 0.55 / 1.05, 1e-9);
    EXPECT_EQ(prediction->staleness(), 2);
    EXPECT_DOUBLE_EQ(prediction->turnout(), 0.30);
    EXPECT_EQ(prediction->total_votes(), 1500);
    EXPECT_EQ(prediction->confidence(), CONFIDENCE_HIGH);

    double total = 0.0;
    for (const auto& r : prediction->results())
        total += r.share();
    EXPECT_NEAR(total, 1.0, 1e-9);
}

TEST_F(WardPredictorTest, NoHistoryIsInvalid) {
    WardPredictor predictor(data_, DefaultAssumptions(), DemographicRules(), "borough", 2024);
    auto prediction = PredictNamedWard(predictor, data_, "Empty");
    ASSERT_TRUE(prediction.has_value());
    EXPECT_FALSE(prediction->valid());
    EXPECT_EQ(prediction->confidence(), CONFIDENCE_NONE);
    EXPECT_TRUE(prediction->winner().empty());
}

TEST_F(WardPredictorTest, UnknownWardIsAbsent) {
    WardPredictor predictor(data_, DefaultAssumptions(), DemographicRules(), "borough", 2024);
    EXPECT_FALSE(PredictNamedWard(predictor, data_, "Nowhere").has_value());
}

TEST_F(WardPredictorTest, TurnoutAdjustmentIsClamped) {
    Assumptions a = DefaultAssumptions();
    a.set_turnout_adjustment(0.5);
    WardPredictor predictor(data_, a, DemographicRules(), "borough", 2024);
    auto prediction = PredictNamedWard(predictor, data_, "Castle");
    ASSERT_TRUE(prediction.has_value());
    EXPECT_NEAR(prediction->turnout(), 0.35, 1e-9);
}

TEST_F(WardPredictorTest, PartyDampeningWithoutRegression) {
    (*data_.mutable_reference()->mutable_national_polling())["Labour"] = 0.30;
    (*data_.mutable_reference()->mutable_prior_national())["Labour"] = 0.40;
    (*data_.mutable_coefficients()->mutable_dampening_by_party())["Labour"] = 0.5;

    WardPredictor predictor(data_, DefaultAssumptions(), DemographicRules(), "borough", 2024);
    auto prediction = PredictNamedWard(predictor, data_, "Castle");
    ASSERT_TRUE(prediction.has_value());

    const auto& swing = prediction->methodology(1);
    ASSERT_EQ(swing.name(), "National Swing");
    EXPECT_NEAR(swing.data().at("Labour"), -0.05, 1e-9);
    EXPECT_NE(swing.description().find("party-specific"), std::string::npos);
}

TEST(SwingStageTest, DampenedNationalChange) {
    Ward ward = MakeWard("Swing", {});
    Baseline baseline;
    baseline.parties = {{"Labour", 0.4}, {"Conservative", 0.4}};
    ReferenceResults reference;
    (*reference.mutable_national_polling())["Labour"] = 0.30;
    (*reference.mutable_prior_national())["Labour"] = 0.40;
    (*reference.mutable_national_polling())["Conservative"] = 0.25;
    (*reference.mutable_prior_national())["Conservative"] = 0.25;
    Assumptions a = DefaultAssumptions();

    SwingStage stage(nullptr);
    StageResult result = stage.Propose({ward, baseline, baseline.parties, a, reference});
    EXPECT_NEAR(GetShare(result.delta, "Labour"), -0.10 * 0.65, 1e-9);
    EXPECT_DOUBLE_EQ(GetShare(result.delta, "Conservative"), 0.0);
    EXPECT_EQ(result.step.step(), 2);

    ModelCoefficients coeffs;
    (*coeffs.mutable_dampening_by_party())["Labour"] = 0.5;
    SwingStage calibrated(&coeffs);
    EXPECT_DOUBLE_EQ(calibrated.Dampening("Labour", a), 0.5);
    EXPECT_DOUBLE_EQ(calibrated.Dampening("Conservative", a), 0.65);
}

TEST(DemographicsTest, RuleBasedDeprivationAndAge) {
    Ward ward = MakeWard("Docks", {});
    ward.mutable_deprivation()->set_imd_decile(1);
    auto* d = ward.mutable_demographics();
    d->set_population(1000);
    d->set_age_65_to_74(200);
    d->set_age_75_to_84(100);
    d->set_white_british(500);
    d->set_asian(100);

    Baseline baseline;
    baseline.parties = {{"Labour", 0.5}, {"Conservative", 0.5}};
    Assumptions a = DefaultAssumptions();
    ReferenceResults reference;

    RuleBasedDemographics rules{DemographicRules()};
    StageResult result = rules.Propose({ward, baseline, baseline.parties, a, reference});
    EXPECT_NEAR(GetShare(result.delta, "Labour"), 0.02, 1e-9);
    EXPECT_NEAR(GetShare(result.delta, "Conservative"), -0.02 + 0.015, 1e-9);
    EXPECT_NEAR(GetShare(result.delta, "Reform UK"), 0.03 + 0.02, 1e-9);
    EXPECT_EQ(result.step.factors_size(), 2);
}

TEST(DemographicsTest, AsianHeritageBands) {
    Ward ward = MakeWard("Mill", {});
    auto* d = ward.mutable_demographics();
    d->set_population(1000);
    d->set_asian(650);
    d->set_white_british(300);

    Baseline baseline;
    Assumptions a = DefaultAssumptions();
    ReferenceResults reference;
    RuleBasedDemographics rules{DemographicRules()};
    StageResult result = rules.Propose({ward, baseline, baseline.parties, a, reference});
    EXPECT_NEAR(GetShare(result.delta, "Reform UK"), -0.20, 1e-9);
    EXPECT_NEAR(GetShare(result.delta, "Independent"), 0.12, 1e-9);
    EXPECT_NEAR(GetShare(result.delta, "Labour"), 0.05, 1e-9);
}

TEST(DemographicsTest, RegressionChosenWhenCalibrated) {
    ModelCoefficients coeffs;
    auto& labour = (*coeffs.mutable_coefficients())["Labour"];
    (*labour.mutable_features())["imd_norm"] = 10.0;
    (*labour.mutable_features())["intercept"] = 50.0;

    auto model = MakeDemographicModel(&coeffs, DemographicRules());
    auto empty = MakeDemographicModel(nullptr, DemographicRules());
    EXPECT_NE(dynamic_cast<RegressionDemographics*>(model.get()), nullptr);
    EXPECT_NE(dynamic_cast<RuleBasedDemographics*>(empty.get()), nullptr);

    Ward ward = MakeWard("Reg", {});
    ward.mutable_demographics()->set_population(1000);
    ward.mutable_deprivation()->set_imd_score(40.0);

    Baseline baseline;
    Assumptions a = DefaultAssumptions();
    ReferenceResults reference;
    StageResult result = model->Propose({ward, baseline, baseline.parties, a, reference});
    // 10 x 0.5 = 5, as round(500) / 10000.
    EXPECT_NEAR(GetShare(result.delta, "Labour"), 0.05, 1e-9);
    EXPECT_EQ(result.step.name(), "Demographics (regression)");
}

TEST(IncumbencyTest, BonusPenaltyAndStaleHalving) {
    Ward ward = MakeWard("Hold", {}, {"Green", "Labour"});
    ward.set_defender("Councillor 2");
    Baseline baseline;
    Assumptions a = DefaultAssumptions();
    ReferenceResults reference;
    IncumbencyStage stage;

    StageResult fresh = stage.Propose({ward, baseline, baseline.parties, a, reference});
    EXPECT_DOUBLE_EQ(GetShare(fresh.delta, "Labour"), 0.05);
    EXPECT_DOUBLE_EQ(GetShare(fresh.delta, "Green"), 0.0);

    baseline.staleness = 11;
    StageResult stale = stage.Propose({ward, baseline, baseline.parties, a, reference});
    EXPECT_DOUBLE_EQ(GetShare(stale.delta, "Labour"), 0.025);

    ward.mutable_current_holders(1)->set_standing_down(true);
    StageResult retiring = stage.Propose({ward, baseline, baseline.parties, a, reference});
    EXPECT_DOUBLE_EQ(GetShare(retiring.delta, "Labour"), -0.02);
}

TEST(EntrantProxyTest, AddsEstimateAndTakesProportionally) {
    Ward ward = MakeWard("New", {});
    (*ward.mutable_constituency_result())["Reform UK"] = 0.30;
    ReferenceResults reference;
    (*reference.mutable_comparable_local())["Reform UK"] = 0.20;
    (*reference.mutable_national_polling())["Reform UK"] = 0.25;
    (*reference.mutable_prior_national())["Reform UK"] = 0.15;

    Baseline baseline;
    baseline.parties = {{"Labour", 0.6}, {"Conservative", 0.4}};
    Assumptions a = DefaultAssumptions();

    EntrantProxyStage stage(nullptr);
    StageResult result = stage.Propose({ward, baseline, baseline.parties, a, reference});

    double estimate = 0.30 * 0.25 * 0.95 + 0.20 * 0.75 * 0.95 + 0.10 * 0.65;
    EXPECT_NEAR(GetShare(result.delta, "Reform UK"), estimate, 1e-9);
    EXPECT_NEAR(GetShare(result.delta, "Labour"), -estimate * 0.6, 1e-9);
    EXPECT_NEAR(GetShare(result.delta, "Conservative"), -estimate * 0.4, 1e-9);
    EXPECT_EQ(result.step.step(), 5);
}

TEST(EntrantProxyTest, CountsShareGainedFromEarlierStages) {
    Ward ward = MakeWard("New", {});
    (*ward.mutable_constituency_result())["Reform UK"] = 0.30;
    ReferenceResults reference;
    (*reference.mutable_comparable_local())["Reform UK"] = 0.20;

    Baseline baseline;
    baseline.parties = {{"Labour", 0.6}, {"Conservative", 0.4}};
    ShareMap current = {{"Labour", 0.5}, {"Conservative", 0.45}, {"Reform UK", 0.05}};
    Assumptions a = DefaultAssumptions();

    EntrantProxyStage stage(nullptr);
    StageResult result = stage.Propose({ward, baseline, current, a, reference});

    double estimate = 0.30 * 0.25 * 0.95 + 0.20 * 0.75 * 0.95;
    double additional = estimate - 0.05;
    EXPECT_NEAR(GetShare(result.delta, "Reform UK"), additional, 1e-9);

    // Taken from the adjusted shares, not the baseline ones.
    EXPECT_NEAR(GetShare(result.delta, "Labour"), -additional * 0.5 / 0.95, 1e-9);
    EXPECT_NEAR(GetShare(result.delta, "Conservative"), -additional * 0.45 / 0.95, 1e-9);
}

TEST(EntrantProxyTest, SkippedWhenAlreadyStandingOrDisabled) {
    Ward ward = MakeWard("Old", {});
    (*ward.mutable_constituency_result())["Reform UK"] = 0.30;
    ReferenceResults reference;
    Assumptions a = DefaultAssumptions();
    EntrantProxyStage stage(nullptr);

    Baseline existing;
    existing.parties = {{"Labour", 0.6}, {"Reform UK", 0.2}};
    EXPECT_TRUE(stage.Propose({ward, existing, existing.parties, a, reference}).delta.empty());

    Baseline fresh;
    fresh.parties = {{"Labour", 0.6}};
    a.set_entrant_stands_everywhere(false);
    EXPECT_TRUE(stage.Propose({ward, fresh, fresh.parties, a, reference}).delta.empty());
}

TEST(AssumptionsTest, ClampedToDocumentedRanges) {
    Assumptions a = DefaultAssumptions();
    a.set_national_to_local_dampening(1.7);
    a.set_turnout_adjustment(-0.2);
    a.set_swing_multiplier(3.0);
    a.set_entrant_party("");

    Assumptions c = ClampAssumptions(a);
    EXPECT_DOUBLE_EQ(c.national_to_local_dampening(), 1.0);
    EXPECT_DOUBLE_EQ(c.turnout_adjustment(), -0.05);
    EXPECT_DOUBLE_EQ(c.swing_multiplier(), 1.5);
    EXPECT_EQ(c.entrant_party(), "Reform UK");
}
