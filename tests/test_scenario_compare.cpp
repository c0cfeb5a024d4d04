#include "ScenarioCompare.h"
#include "Sweeps.h"
#include "HarmonicModel.h"
#include "PccSizing.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace pq_test {

using namespace pq;

namespace {
    const char* AFE_NO_FILTER = "AFE (low low-order harmonics) (no filter)";
    const char* SIX_NO_FILTER = "6-pulse (typical) (no filter)";

    HarmonicLimitCheck violation(int h, double ih, double limit) {
        HarmonicLimitCheck check{};
        check.h = h;
        check.ih_percent_of_il = ih;
        check.limit_percent_of_il = limit;
        check.pass_limit = false;
        return check;
    }

    bool passes_both(const ScenarioResult& s) {
        return s.voltage && s.voltage->pass_limit && s.practical_pass;
    }

    // Hand-built result carrying only the fields the rank orderings read
    ScenarioResult ranked(const std::string& name, bool v_pass, bool tdd_pass, size_t majors,
                          double severity, double thdv, double heating, double tdd = 5.0) {
        ScenarioResult s{};
        s.name = name;
        s.current.tdd_pass = tdd_pass;
        s.current.tdd_percent = tdd;
        s.major_violations.assign(majors, violation(5, 9.0, 7.0));
        s.severity_score = severity;
        s.practical_pass = tdd_pass && majors == 0;
        s.heating_proxy = heating;
        VoltageDistortionResult voltage{};
        voltage.pass_limit = v_pass;
        voltage.thdv_percent = thdv;
        s.voltage = voltage;
        return s;
    }

    std::vector<std::string> names_of(const std::vector<ScenarioResult>& scenarios) {
        std::vector<std::string> names;
        for (const auto& s : scenarios) {
            names.push_back(s.name);
        }
        return names;
    }
}

// 1 MW UPS output on 415 V, 50 MVA service
class ScenarioCompareTest : public ::testing::Test {
protected:
    void SetUp() override {
        PCCInputs pcc{415.0, 1000.0, 0.99, 0.96};
        request.load_pu = 0.6;
        request.il_a = compute_il(pcc);
        request.vll_v = 415.0;
        request.sc_mva = 50.0;
        request.per_topology_filters = {{Topology::AFE, {Mitigation::NONE}}};
    }

    ScenarioRequest request;
};

// ============================================================================
// Violation classification
// ============================================================================

TEST(ViolationClassTest, MinorRules) {
    EXPECT_TRUE(is_minor_violation(25, 1.0));
    EXPECT_FALSE(is_minor_violation(25, 1.1));
    EXPECT_TRUE(is_minor_violation(19, 0.5));
    EXPECT_FALSE(is_minor_violation(19, 0.6));
    EXPECT_FALSE(is_minor_violation(13, 0.1));
    EXPECT_FALSE(is_minor_violation(5, 0.01));
}

TEST(ViolationClassTest, SplitAndSeverity) {
    IEEE519CurrentReport report{};
    report.worst_violations = {
        violation(5, 9.0, 7.0),     // major, 5 x 2.0
        violation(19, 2.9, 2.5),    // minor, 2 x 0.2 x 0.4
        violation(25, 1.5, 1.0),    // minor, 1 x 0.2 x 0.5
        violation(29, 2.5, 1.0),    // major, 1 x 1.5
    };

    auto [major, minor] = split_major_minor(report);
    ASSERT_EQ(major.size(), 2u);
    ASSERT_EQ(minor.size(), 2u);
    EXPECT_EQ(major[0].h, 5);
    EXPECT_EQ(major[1].h, 29);
    EXPECT_EQ(minor[0].h, 19);

    EXPECT_NEAR(severity_score(report), 10.0 + 0.16 + 0.1 + 1.5, 1e-9);
}

TEST(ViolationClassTest, NoViolationsNoSeverity) {
    IEEE519CurrentReport report{};
    EXPECT_DOUBLE_EQ(severity_score(report), 0.0);
}

TEST(RunScenarioTest, AfeStrictPass) {
    const auto& afe = get_preset(Topology::AFE);
    ScenarioResult r = run_scenario("afe", Topology::AFE, Mitigation::NONE, afe.spectrum, 100.0, 5000.0);

    EXPECT_TRUE(r.strict_pass);
    EXPECT_TRUE(r.practical_pass);
    EXPECT_FALSE(r.worst_harmonic.has_value());
    EXPECT_DOUBLE_EQ(r.severity_score, 0.0);
    EXPECT_NEAR(r.thd_i_percent, std::sqrt(8.5), 1e-9);
    EXPECT_NEAR(r.irms_over_i1, std::sqrt(1.0 + 8.5e-4), 1e-12);
    EXPECT_FALSE(r.voltage.has_value());
}

TEST(RunScenarioTest, PracticalPassWithMinorOnly) {
    // 23rd just above its 1.0% limit at Isc/IL = 35
    ScenarioResult r = run_scenario("minor", std::nullopt, Mitigation::NONE,
                                    {{5, 2.0}, {23, 1.5}}, 100.0, 3500.0);
    EXPECT_FALSE(r.strict_pass);
    EXPECT_TRUE(r.practical_pass);
    EXPECT_EQ(r.minor_violations.size(), 1u);
    ASSERT_TRUE(r.worst_harmonic.has_value());
    EXPECT_EQ(*r.worst_harmonic, 23);
}

// ============================================================================
// Comparator
// ============================================================================

TEST_F(ScenarioCompareTest, ScenarioCountAndNames) {
    auto results = ScenarioComparator(request).compare();
    EXPECT_EQ(results.size(), 13u);

    std::vector<std::string> names;
    for (const auto& r : results) {
        names.push_back(r.name);
    }
    for (const char* expected : {SIX_NO_FILTER, "6-pulse (typical) + tuned_5_7",
                                 "12-pulse (typical) + active_filter_like", AFE_NO_FILTER}) {
        EXPECT_NE(std::find(names.begin(), names.end(), expected), names.end()) << expected;
    }
    EXPECT_EQ(std::find(names.begin(), names.end(), "AFE (low low-order harmonics) + tuned_5_7"),
              names.end());
}

TEST_F(ScenarioCompareTest, WithoutOverrideEveryFilterIsTried) {
    request.per_topology_filters.clear();
    EXPECT_EQ(ScenarioComparator(request).compare().size(), 16u);
}

TEST_F(ScenarioCompareTest, RatioDerivedFromStrength) {
    ScenarioComparator comparator(request);
    double expected = isc_from_sc_mva(415.0, 50.0) / request.il_a;
    EXPECT_NEAR(comparator.get_isc_over_il(), expected, 1e-9);
    EXPECT_NEAR(comparator.get_source().z1_ohm, zth_from_sc_mva(415.0, 50.0), 1e-15);

    auto results = comparator.compare();
    for (const auto& r : results) {
        EXPECT_EQ(r.current.category_label, "20-50");
        ASSERT_TRUE(r.voltage.has_value());
    }
}

TEST_F(ScenarioCompareTest, RatioOverride) {
    request.isc_over_il = 10.0;
    ScenarioComparator comparator(request);
    EXPECT_DOUBLE_EQ(comparator.get_isc_over_il(), 10.0);
    auto results = comparator.compare();
    EXPECT_EQ(results.front().current.category_label, "<=20");
}

TEST_F(ScenarioCompareTest, PassingScenariosRankFirst) {
    auto results = ScenarioComparator(request).compare();
    ASSERT_TRUE(passes_both(results.front()));
    bool seen_failure = false;
    for (const auto& r : results) {
        if (!passes_both(r)) {
            seen_failure = true;
        } else {
            EXPECT_FALSE(seen_failure) << r.name << " ranked after a failing scenario";
        }
    }
    EXPECT_TRUE(seen_failure);
}

TEST(RankOrderTest, VoltageBeforeCurrent) {
    ScenarioResult v_ok = ranked("v_ok", true, false, 3, 20.0, 4.0, 5.0);
    ScenarioResult tdd_ok = ranked("tdd_ok", false, true, 0, 0.0, 1.0, 0.1);
    EXPECT_TRUE(ScenarioComparator::ranks_before(v_ok, tdd_ok));
    EXPECT_FALSE(ScenarioComparator::ranks_before(tdd_ok, v_ok));
}

TEST(RankOrderTest, TddPassBeforeFail) {
    ScenarioResult pass = ranked("pass", true, true, 2, 15.0, 4.0, 5.0);
    ScenarioResult fail = ranked("fail", true, false, 0, 0.0, 1.0, 0.1);
    EXPECT_TRUE(ScenarioComparator::ranks_before(pass, fail));
    EXPECT_FALSE(ScenarioComparator::ranks_before(fail, pass));
}

TEST(RankOrderTest, MajorCountBeforeSeverity) {
    ScenarioResult no_major = ranked("no_major", true, true, 0, 9.0, 4.0, 5.0);
    ScenarioResult one_major = ranked("one_major", true, true, 1, 1.0, 1.0, 0.1);
    EXPECT_TRUE(ScenarioComparator::ranks_before(no_major, one_major));
    EXPECT_FALSE(ScenarioComparator::ranks_before(one_major, no_major));
}

TEST(RankOrderTest, SeverityBeforeThdv) {
    ScenarioResult mild = ranked("mild", true, true, 1, 1.0, 4.0, 5.0);
    ScenarioResult harsh = ranked("harsh", true, true, 1, 2.0, 1.0, 0.1);
    EXPECT_TRUE(ScenarioComparator::ranks_before(mild, harsh));
    EXPECT_FALSE(ScenarioComparator::ranks_before(harsh, mild));
}

TEST(RankOrderTest, ThdvBeforeHeating) {
    ScenarioResult low_v = ranked("low_v", true, true, 0, 0.0, 1.0, 5.0);
    ScenarioResult high_v = ranked("high_v", true, true, 0, 0.0, 2.0, 0.1);
    EXPECT_TRUE(ScenarioComparator::ranks_before(low_v, high_v));
    EXPECT_FALSE(ScenarioComparator::ranks_before(high_v, low_v));
}

TEST(RankOrderTest, HeatingBreaksRemainingTies) {
    ScenarioResult cool = ranked("cool", true, true, 0, 0.0, 1.0, 0.5);
    ScenarioResult warm = ranked("warm", true, true, 0, 0.0, 1.0, 0.9);
    EXPECT_TRUE(ScenarioComparator::ranks_before(cool, warm));
    EXPECT_FALSE(ScenarioComparator::ranks_before(warm, cool));
}

TEST(RankOrderTest, PracticalPassOutranksTddPassWithMajors) {
    // Minor-only result against a TDD pass that still carries a major violation
    ScenarioResult practical = ranked("practical", true, true, 0, 0.4, 3.0, 2.0);
    ScenarioResult with_major = ranked("with_major", true, true, 1, 0.2, 1.0, 0.1);
    ASSERT_TRUE(practical.practical_pass);
    ASSERT_FALSE(with_major.practical_pass);
    ASSERT_TRUE(with_major.current.tdd_pass);

    std::vector<ScenarioResult> scenarios = {with_major, practical};
    ScenarioComparator::rank(scenarios);
    EXPECT_EQ(scenarios.front().name, "practical");
}

TEST(RankOrderTest, FullOrderFromReversedInput) {
    std::vector<ScenarioResult> scenarios = {
        ranked("s7", false, true, 0, 0.0, 0.1, 0.1),
        ranked("s6", true, false, 0, 0.0, 0.1, 0.1),
        ranked("s5", true, true, 1, 2.0, 0.5, 0.1),
        ranked("s4", true, true, 0, 0.3, 0.5, 0.1),
        ranked("s3", true, true, 0, 0.0, 2.0, 0.1),
        ranked("s2", true, true, 0, 0.0, 1.0, 0.9),
        ranked("s1", true, true, 0, 0.0, 1.0, 0.5),
    };
    ScenarioComparator::rank(scenarios);
    std::vector<std::string> expected = {"s1", "s2", "s3", "s4", "s5", "s6", "s7"};
    EXPECT_EQ(names_of(scenarios), expected);
}

TEST_F(ScenarioCompareTest, AfeRecommendedOnModeratePcc) {
    auto results = ScenarioComparator(request).compare();
    const ScenarioResult& best = results.front();
    EXPECT_EQ(best.name, AFE_NO_FILTER);
    EXPECT_TRUE(best.strict_pass);
    ASSERT_TRUE(best.voltage.has_value());
    EXPECT_TRUE(best.voltage->pass_limit);
    EXPECT_LT(best.voltage->thdv_percent, 1.0);
}

TEST_F(ScenarioCompareTest, StableRankForTies) {
    ScenarioResult a{};
    a.name = "a";
    a.severity_score = 0.0;
    a.heating_proxy = 0.1;
    a.current.tdd_pass = true;
    ScenarioResult b = a;
    b.name = "b";

    std::vector<ScenarioResult> scenarios = {a, b};
    ScenarioComparator::rank(scenarios);
    EXPECT_EQ(scenarios[0].name, "a");
    EXPECT_EQ(scenarios[1].name, "b");
}

TEST_F(ScenarioCompareTest, InvalidRequestsThrow) {
    ScenarioRequest bad = request;
    bad.load_pu = 0.0;
    EXPECT_THROW(ScenarioComparator{bad}, ValidationError);

    bad = request;
    bad.load_pu = 1.6;
    EXPECT_THROW(ScenarioComparator{bad}, ValidationError);

    bad = request;
    bad.topologies.clear();
    EXPECT_THROW(ScenarioComparator{bad}, ValidationError);

    bad = request;
    bad.il_a = 0.0;
    EXPECT_THROW(ScenarioComparator{bad}, ValidationError);

    bad = request;
    bad.z_freq_exp = -0.5;
    EXPECT_THROW(ScenarioComparator{bad}, ValidationError);
}

TEST_F(ScenarioCompareTest, KeyBasedEntryPoint) {
    auto results = compare_scenarios(0.6, request.il_a, 415.0, 50.0,
                                     {"6pulse_typical", "afe_low_harm"},
                                     {"none", "active_filter_like"},
                                     {{"afe_low_harm", {"none"}}});
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results.front().name, AFE_NO_FILTER);
}

TEST_F(ScenarioCompareTest, UnknownKeysThrow) {
    EXPECT_THROW(compare_scenarios(0.6, request.il_a, 415.0, 50.0, {"9pulse"}, {"none"}),
                 UnknownKeyError);
    EXPECT_THROW(compare_scenarios(0.6, request.il_a, 415.0, 50.0, {"6pulse_typical"}, {"magic"}),
                 UnknownKeyError);
    try {
        compare_scenarios(0.6, request.il_a, 415.0, 50.0, {"9pulse"}, {"none"});
    } catch (const UnknownKeyError& e) {
        EXPECT_EQ(e.key(), "9pulse");
    }
}

TEST(MitigationOptionsTest, ActiveFilterBestForSixPulse) {
    auto results = compare_mitigation_options(get_preset(Topology::SIX_PULSE).spectrum, 100.0, 35.0);
    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results.front().name, "baseline + active_filter_like");
    EXPECT_TRUE(results.front().practical_pass);
    EXPECT_EQ(results.back().name, "baseline");
    EXPECT_FALSE(results.back().current.tdd_pass);
}

TEST(MitigationOptionsTest, InvalidRatioThrows) {
    EXPECT_THROW(compare_mitigation_options({{5, 10.0}}, 100.0, 0.0), ValidationError);
    EXPECT_THROW(compare_mitigation_options({{5, 10.0}}, 100.0, std::nan("")), ValidationError);
}

TEST(MitigationOptionsTest, TddPassBeforeFail) {
    ScenarioResult pass = ranked("pass", true, true, 2, 10.0, 0.0, 5.0, 7.9);
    ScenarioResult fail = ranked("fail", true, false, 0, 0.0, 0.0, 0.1, 9.0);
    EXPECT_TRUE(mitigation_option_ranks_before(pass, fail));
    EXPECT_FALSE(mitigation_option_ranks_before(fail, pass));
}

TEST(MitigationOptionsTest, MajorCountBeforeSeverity) {
    ScenarioResult no_major = ranked("no_major", true, true, 0, 9.0, 0.0, 5.0, 7.0);
    ScenarioResult one_major = ranked("one_major", true, true, 1, 1.0, 0.0, 0.1, 2.0);
    EXPECT_TRUE(mitigation_option_ranks_before(no_major, one_major));
    EXPECT_FALSE(mitigation_option_ranks_before(one_major, no_major));
}

TEST(MitigationOptionsTest, SeverityBeforeTdd) {
    ScenarioResult mild = ranked("mild", true, true, 1, 1.0, 0.0, 5.0, 7.0);
    ScenarioResult harsh = ranked("harsh", true, true, 1, 2.0, 0.0, 0.1, 2.0);
    EXPECT_TRUE(mitigation_option_ranks_before(mild, harsh));
    EXPECT_FALSE(mitigation_option_ranks_before(harsh, mild));
}

TEST(MitigationOptionsTest, TddBeforeHeating) {
    ScenarioResult low_tdd = ranked("low_tdd", true, true, 0, 0.0, 0.0, 5.0, 2.0);
    ScenarioResult high_tdd = ranked("high_tdd", true, true, 0, 0.0, 0.0, 0.1, 3.0);
    EXPECT_TRUE(mitigation_option_ranks_before(low_tdd, high_tdd));
    EXPECT_FALSE(mitigation_option_ranks_before(high_tdd, low_tdd));

    ScenarioResult cool = ranked("cool", true, true, 0, 0.0, 0.0, 0.5, 2.0);
    ScenarioResult warm = ranked("warm", true, true, 0, 0.0, 0.0, 0.9, 2.0);
    EXPECT_TRUE(mitigation_option_ranks_before(cool, warm));
    EXPECT_FALSE(mitigation_option_ranks_before(warm, cool));
}

TEST(MitigationOptionsTest, VoltageIgnored) {
    ScenarioResult v_fail = ranked("v_fail", false, true, 0, 0.0, 9.0, 0.1, 2.0);
    ScenarioResult v_pass = ranked("v_pass", true, true, 0, 0.0, 1.0, 0.1, 3.0);
    EXPECT_TRUE(mitigation_option_ranks_before(v_fail, v_pass));
    EXPECT_FALSE(ScenarioComparator::ranks_before(v_fail, v_pass));
}

TEST(MitigationOptionsTest, ResultsFollowOrdering) {
    auto results = compare_mitigation_options(get_preset(Topology::SIX_PULSE).spectrum, 100.0, 35.0);
    for (size_t i = 1; i < results.size(); ++i) {
        EXPECT_FALSE(mitigation_option_ranks_before(results[i], results[i - 1]))
            << results[i].name << " vs " << results[i - 1].name;
    }
    std::vector<std::string> names = names_of(results);
    auto tuned = std::find(names.begin(), names.end(), "baseline + tuned_5_7");
    auto baseline = std::find(names.begin(), names.end(), "baseline");
    ASSERT_NE(tuned, names.end());
    EXPECT_LT(tuned, baseline);
}

// ============================================================================
// Sweeps and tipping points
// ============================================================================

TEST_F(ScenarioCompareTest, FindScenarioExactThenPrefix) {
    auto results = ScenarioComparator(request).compare();
    const ScenarioResult* exact = find_scenario(results, SIX_NO_FILTER);
    ASSERT_NE(exact, nullptr);
    EXPECT_EQ(exact->name, SIX_NO_FILTER);

    const ScenarioResult* prefix = find_scenario(results, "12-pulse (typical) + ");
    ASSERT_NE(prefix, nullptr);
    EXPECT_EQ(prefix->name.rfind("12-pulse (typical) + ", 0), 0u);

    EXPECT_EQ(find_scenario(results, "9-pulse"), nullptr);
}

TEST_F(ScenarioCompareTest, ThdvFallsWithStrength) {
    auto sweep = sweep_thdv_vs_sc_mva(request, AFE_NO_FILTER, {20.0, 40.0, 80.0});
    ASSERT_EQ(sweep.size(), 3u);
    EXPECT_DOUBLE_EQ(sweep[0].sc_mva, 20.0);
    EXPECT_NEAR(sweep[0].thdv_percent / sweep[1].thdv_percent, 2.0, 1e-9);
    EXPECT_NEAR(sweep[1].thdv_percent / sweep[2].thdv_percent, 2.0, 1e-9);
}

TEST_F(ScenarioCompareTest, SweepSkipsMissingOption) {
    auto sweep = sweep_thdv_vs_sc_mva(request, "9-pulse", {20.0, 40.0});
    EXPECT_TRUE(sweep.empty());
}

TEST_F(ScenarioCompareTest, TippingPoints) {
    std::vector<double> grid = {10, 15, 20, 25, 30, 35, 40, 50, 60, 75, 100, 150, 250, 500};

    TippingPoint afe = find_tipping_point(request, AFE_NO_FILTER, grid);
    ASSERT_TRUE(afe.min_sc_mva_voltage.has_value());
    ASSERT_TRUE(afe.min_sc_mva_current.has_value());
    EXPECT_DOUBLE_EQ(*afe.min_sc_mva_voltage, 10.0);
    EXPECT_DOUBLE_EQ(*afe.min_sc_mva_current, 10.0);

    TippingPoint six = find_tipping_point(request, SIX_NO_FILTER, grid);
    EXPECT_FALSE(six.min_sc_mva_current.has_value());

    EXPECT_THROW(find_tipping_point(request, "9-pulse", grid), UnknownKeyError);

    auto tips = find_tipping_points(request, {AFE_NO_FILTER, SIX_NO_FILTER}, grid);
    ASSERT_EQ(tips.size(), 2u);
    EXPECT_EQ(tips[1].option, SIX_NO_FILTER);
}

TEST(FormatBoundTest, Bounds) {
    std::vector<double> grid = {10, 20, 500};
    EXPECT_EQ(format_bound(std::nullopt, grid), "> 500 MVA");
    EXPECT_EQ(format_bound(10.0, grid), "<= 10 MVA");
    EXPECT_EQ(format_bound(20.0, grid), "20.0 MVA");
    EXPECT_EQ(format_bound(20.0, {}), "n/a");
}

} // namespace pq_test
