#include "Study.h"
#include "ConfigLoader.h"
#include "OutputWriter.h"
#include "PccSizing.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace pq_test {

using namespace pq;
using json = nlohmann::json;
namespace fs = std::filesystem;

class StudyTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        AnalysisConfig config = ConfigLoader::defaults();
        config.waveform_check.cycles = 10;
        config.waveform_check.samples_per_cycle = 1024;
        results_ = run_study(config);
    }

    static void TearDownTestSuite() {
        results_.reset();
    }

    static std::optional<StudyResults> results_;
};

std::optional<StudyResults> StudyTest::results_;

TEST_F(StudyTest, SizingAndStrength) {
    PCCInputs pcc{415.0, 1000.0, 0.99, 0.96};
    EXPECT_NEAR(results_->il_a, compute_il(pcc), 1e-9);
    EXPECT_NEAR(results_->operating_i1_a, 0.6 * results_->il_a, 1e-9);
    EXPECT_NEAR(results_->isc_over_il, isc_from_sc_mva(415.0, 50.0) / results_->il_a, 1e-9);
}

TEST_F(StudyTest, RecommendsAfe) {
    ASSERT_EQ(results_->scenarios.size(), 13u);
    EXPECT_EQ(results_->best().name, "AFE (low low-order harmonics) (no filter)");
    ASSERT_FALSE(results_->key_takeaways.empty());
    EXPECT_EQ(results_->key_takeaways.front().rfind("Recommended option AFE", 0), 0u);
}

TEST_F(StudyTest, ThdvSweepDecreasing) {
    ASSERT_EQ(results_->thdv_sweep.size(), 8u);
    for (size_t i = 1; i < results_->thdv_sweep.size(); ++i) {
        EXPECT_LT(results_->thdv_sweep[i].thdv_percent, results_->thdv_sweep[i - 1].thdv_percent);
    }
}

TEST_F(StudyTest, TippingPointsForEveryOption) {
    ASSERT_EQ(results_->tipping_points.size(), 7u);
    EXPECT_EQ(results_->tipping_points[0].option, "AFE (low low-order harmonics) (no filter)");
    ASSERT_TRUE(results_->tipping_points[0].min_sc_mva_current.has_value());
    EXPECT_FALSE(results_->tipping_points[3].min_sc_mva_current.has_value());
}

TEST_F(StudyTest, WaveformCheckAgreesWithSpectrum) {
    ASSERT_TRUE(results_->waveform_check.has_value());
    const WaveformCheckResult& check = *results_->waveform_check;
    EXPECT_EQ(check.n_samples, 10240u);
    EXPECT_NEAR(check.thd_i_fft_percent, check.thd_i_spectrum_percent, 0.05);
    EXPECT_NEAR(check.i1_rms_measured, check.i1_rms_expected, 0.01 * check.i1_rms_expected);
    ASSERT_EQ(check.harmonics.size(), results_->best().spectrum.size());
    for (const auto& h : check.harmonics) {
        EXPECT_NEAR(h.measured_percent, h.expected_percent, 0.05) << "h=" << h.h;
    }
}

TEST_F(StudyTest, InputsBlockOrdered) {
    ASSERT_FALSE(results_->inputs_block.empty());
    EXPECT_EQ(results_->inputs_block.front().first, "VLL");
    EXPECT_EQ(results_->inputs_block.front().second, "415.0 V");
}

// ============================================================================
// Output
// ============================================================================

TEST_F(StudyTest, ReportPacketShape) {
    json packet = json::parse(OutputWriter::render_report(*results_));

    EXPECT_EQ(packet["schema_version"].get<std::string>(), SCHEMA_VERSION);
    EXPECT_EQ(packet["executive_summary"]["recommended_option"].get<std::string>(), results_->best().name);
    EXPECT_TRUE(packet["executive_summary"]["voltage_pass"].get<bool>());
    EXPECT_EQ(packet["scenarios"].size(), 13u);
    EXPECT_EQ(packet["tables"]["top_scenarios_ranked"]["rows"].size(), 12u);
    EXPECT_EQ(packet["tables"]["top_scenarios_ranked"]["columns"].size(), 9u);
    EXPECT_EQ(packet["tables"]["tipping_points_min_ssc_required"]["rows"].size(), 7u);
    EXPECT_EQ(packet["series"]["thdv_vs_sc_mva"]["points"].size(), 8u);
    EXPECT_FALSE(packet["waveform_check"].is_null());
    EXPECT_TRUE(packet["inputs_assumptions"].is_array());

    const json& first = packet["scenarios"][0];
    EXPECT_TRUE(first["worst_harmonic"].is_null());
    EXPECT_EQ(first["topology"].get<std::string>(), "afe_low_harm");
    EXPECT_EQ(first["spectrum_pct_of_fund"].size(), 6u);
}

TEST_F(StudyTest, CsvHasRowPerScenario) {
    fs::path path = fs::temp_directory_path() / "pq_study_scenarios.csv";
    OutputWriter::write_csv(path.string(), results_->scenarios);

    std::ifstream in(path);
    std::string line;
    size_t lines = 0;
    std::getline(in, line);
    EXPECT_EQ(line.rfind("rank,name,", 0), 0u);
    while (std::getline(in, line)) {
        ++lines;
    }
    EXPECT_EQ(lines, results_->scenarios.size());
    fs::remove(path);
}

TEST_F(StudyTest, UnwritablePathThrows) {
    EXPECT_THROW(OutputWriter::write_csv("/nonexistent/dir/out.csv", results_->scenarios), IOError);
    EXPECT_THROW(OutputWriter::write_report("/nonexistent/dir/out.json", *results_), IOError);
}

TEST(CheckWaveformTest, RectangularZeroPhase) {
    WaveformCheckConfig options{true, 10, 1024, WindowType::RECTANGULAR, PhaseMode::ZERO, 1};
    WaveformCheckResult check = check_waveform("six", {{5, 20.0}, {7, 14.0}}, 60.0, 100.0, options);

    EXPECT_NEAR(check.thd_i_spectrum_percent, std::sqrt(400.0 + 196.0), 1e-9);
    EXPECT_NEAR(check.thd_i_fft_percent, check.thd_i_spectrum_percent, 1e-4);
    EXPECT_NEAR(check.i1_rms_measured, 100.0, 1e-6);
    EXPECT_NEAR(check.i_rms_total, 100.0 * std::sqrt(1.0 + 0.0596), 1e-6);
    ASSERT_EQ(check.harmonics.size(), 2u);
    EXPECT_EQ(check.scenario, "six");
}

} // namespace pq_test
