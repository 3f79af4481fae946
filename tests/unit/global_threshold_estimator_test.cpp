#include <gtest/gtest.h>

#include "services/threshold/global_threshold_estimator.hpp"

#include "../test_utils/threshold_image_generator.hpp"

#include <cmath>
#include <random>
#include <vector>

using namespace cell_threshold::services;
namespace test_utils = cell_threshold::test_utils;

class GlobalThresholdEstimatorTest : public ::testing::Test {
protected:
    /// n samples at @p low followed by n samples at @p high
    static std::vector<float> twoLevels(size_t n, float low, float high) {
        std::vector<float> values(n, low);
        values.insert(values.end(), n, high);
        return values;
    }

    /// Two well separated noisy populations
    static std::vector<float> bimodal(unsigned int seed = 7) {
        std::mt19937 rng(seed);
        std::uniform_real_distribution<float> dim(0.10f, 0.20f);
        std::uniform_real_distribution<float> bright(0.60f, 0.70f);
        std::vector<float> values;
        for (int i = 0; i < 400; ++i) values.push_back(dim(rng));
        for (int i = 0; i < 200; ++i) values.push_back(bright(rng));
        return values;
    }

    /// 0.01, 0.02, ..., 1.00
    static std::vector<float> percentRamp() {
        std::vector<float> values;
        for (int i = 1; i <= 100; ++i) {
            values.push_back(static_cast<float>(i) / 100.0f);
        }
        return values;
    }
};

// =============================================================================
// Minimum cross-entropy (Li)
// =============================================================================

TEST_F(GlobalThresholdEstimatorTest, LiSeparatesBimodalPopulations) {
    const auto values = bimodal();
    auto threshold = GlobalThresholdEstimator::minimumCrossEntropy(values);

    ASSERT_TRUE(threshold.has_value());
    EXPECT_GT(threshold.value(), 0.20);
    EXPECT_LT(threshold.value(), 0.60);
}

TEST_F(GlobalThresholdEstimatorTest, LiOnTwoLevelsLiesBetweenThem) {
    const auto values = twoLevels(50, 0.2f, 0.8f);
    auto threshold = GlobalThresholdEstimator::minimumCrossEntropy(values);

    ASSERT_TRUE(threshold.has_value());
    EXPECT_GT(threshold.value(), 0.2);
    EXPECT_LT(threshold.value(), 0.8);
}

TEST_F(GlobalThresholdEstimatorTest, LiIsShiftInvariant) {
    auto values = bimodal();
    auto base = GlobalThresholdEstimator::minimumCrossEntropy(values);
    for (auto& v : values) v += 0.25f;
    auto shifted = GlobalThresholdEstimator::minimumCrossEntropy(values);

    ASSERT_TRUE(base.has_value());
    ASSERT_TRUE(shifted.has_value());
    EXPECT_NEAR(shifted.value(), base.value() + 0.25, 1e-3);
}

// =============================================================================
// Otsu
// =============================================================================

TEST_F(GlobalThresholdEstimatorTest, OtsuTwoLevelsThresholdsHalfWay) {
    const auto values = twoLevels(50, 0.2f, 0.8f);
    auto threshold = GlobalThresholdEstimator::otsu(values);

    ASSERT_TRUE(threshold.has_value());
    EXPECT_NEAR(threshold.value(), 0.5, 1e-6);
}

TEST_F(GlobalThresholdEstimatorTest, OtsuSeparatesBimodalPopulations) {
    const auto values = bimodal();
    auto threshold = GlobalThresholdEstimator::otsu(values);

    ASSERT_TRUE(threshold.has_value());
    EXPECT_GT(threshold.value(), 0.20);
    EXPECT_LT(threshold.value(), 0.60);
}

TEST_F(GlobalThresholdEstimatorTest, OtsuRejectsSingleBin) {
    const auto values = bimodal();
    auto threshold = GlobalThresholdEstimator::otsu(values, 1);

    ASSERT_FALSE(threshold.has_value());
    EXPECT_EQ(threshold.error().code, ThresholdError::Code::InvalidParameters);
}

TEST_F(GlobalThresholdEstimatorTest, OtsuUnequalLevelsThresholdsHalfWay) {
    std::vector<float> values(60, 0.0f);
    values.insert(values.end(), 20, 1.0f);

    auto threshold = GlobalThresholdEstimator::otsu(values);

    ASSERT_TRUE(threshold.has_value());
    EXPECT_NEAR(threshold.value(), 0.5, 1e-6);
}

TEST_F(GlobalThresholdEstimatorTest, OtsuGapMidpointBetweenClusters) {
    // Three occupied bins over [0, 1]: 0 and 0.25 against 1
    std::vector<float> values(40, 0.0f);
    values.insert(values.end(), 40, 0.25f);
    values.insert(values.end(), 40, 1.0f);

    auto threshold = GlobalThresholdEstimator::otsu(values);

    ASSERT_TRUE(threshold.has_value());
    EXPECT_NEAR(threshold.value(), 0.625, 1e-6);
}

TEST_F(GlobalThresholdEstimatorTest, MultiOtsuCutsAreBinEdges) {
    std::vector<float> values(30, 0.0f);
    values.insert(values.end(), 30, 0.5f);
    values.insert(values.end(), 30, 1.0f);

    auto thresholds = GlobalThresholdEstimator::multiOtsu(values, 256);

    ASSERT_TRUE(thresholds.has_value());
    const double lowerBins = thresholds->lower * 256.0;
    const double upperBins = thresholds->upper * 256.0;
    EXPECT_NEAR(lowerBins, std::round(lowerBins), 1e-6);
    EXPECT_NEAR(upperBins, std::round(upperBins), 1e-6);
    EXPECT_GT(thresholds->lower, 0.0);
    EXPECT_LE(thresholds->lower, 0.5);
    EXPECT_GT(thresholds->upper, 0.5);
    EXPECT_LT(thresholds->upper, 1.0);
}

TEST_F(GlobalThresholdEstimatorTest, MultiOtsuSeparatesThreeLevels) {
    std::vector<float> values(30, 0.1f);
    values.insert(values.end(), 30, 0.5f);
    values.insert(values.end(), 30, 0.9f);

    auto thresholds = GlobalThresholdEstimator::multiOtsu(values);

    ASSERT_TRUE(thresholds.has_value());
    EXPECT_GT(thresholds->lower, 0.1);
    EXPECT_LT(thresholds->lower, 0.5);
    EXPECT_GT(thresholds->upper, 0.49);
    EXPECT_LT(thresholds->upper, 0.9);
    EXPECT_LT(thresholds->lower, thresholds->upper);
}

TEST_F(GlobalThresholdEstimatorTest, MiddleClassAssignmentSelectsBoundary) {
    std::vector<float> values(30, 0.1f);
    values.insert(values.end(), 30, 0.5f);
    values.insert(values.end(), 30, 0.9f);
    auto thresholds = GlobalThresholdEstimator::multiOtsu(values);
    ASSERT_TRUE(thresholds.has_value());

    GlobalThresholdEstimator::Parameters params;
    params.method = GlobalMethod::MultiOtsu;

    params.middleClass = MiddleClassAssignment::Foreground;
    auto foreground = GlobalThresholdEstimator(params).estimate(values);
    ASSERT_TRUE(foreground.has_value());
    EXPECT_DOUBLE_EQ(foreground.value(), thresholds->lower);

    params.middleClass = MiddleClassAssignment::Background;
    auto background = GlobalThresholdEstimator(params).estimate(values);
    ASSERT_TRUE(background.has_value());
    EXPECT_DOUBLE_EQ(background.value(), thresholds->upper);
}

// =============================================================================
// Robust Background
// =============================================================================

TEST_F(GlobalThresholdEstimatorTest, RobustBackgroundMeanOfTrimmedSamples) {
    RobustBackgroundOptions options;
    options.numberOfDeviations = 0.0;

    // 5 samples trimmed at each end leaves 0.06 .. 0.95
    auto threshold = GlobalThresholdEstimator::robustBackground(percentRamp(), options);

    ASSERT_TRUE(threshold.has_value());
    EXPECT_NEAR(threshold.value(), 0.505, 1e-6);
}

TEST_F(GlobalThresholdEstimatorTest, RobustBackgroundTrimRoundsHalfToEven) {
    std::vector<float> values;
    for (int i = 1; i <= 10; ++i) {
        values.push_back(static_cast<float>(i));
    }

    RobustBackgroundOptions options;
    options.lowerOutlierFraction = 0.25;
    options.upperOutlierFraction = 0.0;
    options.numberOfDeviations = 0.0;

    // 2.5 samples round to 2, leaving 3 .. 10
    auto threshold = GlobalThresholdEstimator::robustBackground(values, options);

    ASSERT_TRUE(threshold.has_value());
    EXPECT_NEAR(threshold.value(), 6.5, 1e-9);
}

TEST_F(GlobalThresholdEstimatorTest, RobustBackgroundMedianPlusMad) {
    RobustBackgroundOptions options;
    options.averagingMethod = AveragingMethod::Median;
    options.varianceMethod = VarianceMethod::MedianAbsoluteDeviation;
    options.numberOfDeviations = 1.0;

    auto threshold = GlobalThresholdEstimator::robustBackground(percentRamp(), options);

    ASSERT_TRUE(threshold.has_value());
    EXPECT_NEAR(threshold.value(), 0.505 + 0.225, 1e-6);
}

TEST_F(GlobalThresholdEstimatorTest, RobustBackgroundModeIsCenterOfFullestBin) {
    std::vector<float> values(90, 0.5f);
    for (int i = 0; i < 10; ++i) {
        values.push_back(static_cast<float>(i) / 10.0f);
    }

    RobustBackgroundOptions options;
    options.lowerOutlierFraction = 0.0;
    options.upperOutlierFraction = 0.0;
    options.averagingMethod = AveragingMethod::Mode;
    options.numberOfDeviations = 0.0;

    // 10 bins over [0, 0.9]; 0.5 falls in bin 5 centered at 0.495
    auto threshold = GlobalThresholdEstimator::robustBackground(values, options);

    ASSERT_TRUE(threshold.has_value());
    EXPECT_NEAR(threshold.value(), 0.495, 1e-5);
}

TEST_F(GlobalThresholdEstimatorTest, RobustBackgroundMonotoneInDeviations) {
    const auto values = bimodal();
    RobustBackgroundOptions options;

    double previous = -1.0;
    for (double deviations : {-1.0, 0.0, 1.0, 2.0, 3.0}) {
        options.numberOfDeviations = deviations;
        auto threshold = GlobalThresholdEstimator::robustBackground(values, options);
        ASSERT_TRUE(threshold.has_value());
        EXPECT_GT(threshold.value(), previous) << "deviations=" << deviations;
        previous = threshold.value();
    }
}

TEST_F(GlobalThresholdEstimatorTest, RobustBackgroundRejectsInvalidFractions) {
    RobustBackgroundOptions options;
    options.lowerOutlierFraction = 0.6;
    options.upperOutlierFraction = 0.6;

    auto threshold = GlobalThresholdEstimator::robustBackground(percentRamp(), options);

    ASSERT_FALSE(threshold.has_value());
    EXPECT_EQ(threshold.error().code, ThresholdError::Code::InvalidParameters);
}

// =============================================================================
// Degenerate input
// =============================================================================

TEST_F(GlobalThresholdEstimatorTest, IdenticalValuesReturnThatValue) {
    const std::vector<float> values(25, 0.37f);

    for (auto method : {GlobalMethod::MinimumCrossEntropy, GlobalMethod::Otsu,
                        GlobalMethod::MultiOtsu, GlobalMethod::RobustBackground}) {
        GlobalThresholdEstimator::Parameters params;
        params.method = method;
        auto threshold = GlobalThresholdEstimator(params).estimate(values);
        ASSERT_TRUE(threshold.has_value());
        EXPECT_NEAR(threshold.value(), 0.37, 1e-6);
    }
}

TEST_F(GlobalThresholdEstimatorTest, AllZeroValuesReturnZero) {
    const std::vector<float> values(25, 0.0f);

    for (auto method : {GlobalMethod::MinimumCrossEntropy, GlobalMethod::Otsu,
                        GlobalMethod::MultiOtsu, GlobalMethod::RobustBackground}) {
        GlobalThresholdEstimator::Parameters params;
        params.method = method;
        auto threshold = GlobalThresholdEstimator(params).estimate(values);
        ASSERT_TRUE(threshold.has_value());
        EXPECT_DOUBLE_EQ(threshold.value(), 0.0);
    }
}

TEST_F(GlobalThresholdEstimatorTest, EmptyInputIsInsufficientData) {
    const std::vector<float> empty;

    for (auto method : {GlobalMethod::MinimumCrossEntropy, GlobalMethod::Otsu,
                        GlobalMethod::MultiOtsu, GlobalMethod::RobustBackground}) {
        GlobalThresholdEstimator::Parameters params;
        params.method = method;
        auto threshold = GlobalThresholdEstimator(params).estimate(empty);
        ASSERT_FALSE(threshold.has_value());
        EXPECT_EQ(threshold.error().code, ThresholdError::Code::InsufficientData);
    }
}

// =============================================================================
// Image input
// =============================================================================

TEST_F(GlobalThresholdEstimatorTest, ImageEstimateIgnoresMaskedPixels) {
    auto image = test_utils::createSplitImage(10, 10, 1, 0.2f, 0.8f);
    auto mask = test_utils::createMask(10, 10);
    // Hide a bright outlier column
    for (long y = 0; y < 10; ++y) {
        test_utils::setValue(image, 9, y, 0, 50.0f);
        test_utils::setValue(mask, 9, y, 0, static_cast<unsigned char>(0));
    }

    GlobalThresholdEstimator::Parameters params;
    params.method = GlobalMethod::Otsu;
    auto threshold = GlobalThresholdEstimator(params).estimate(image, mask);

    ASSERT_TRUE(threshold.has_value());
    EXPECT_NEAR(threshold.value(), 0.5, 1e-6);
}

TEST_F(GlobalThresholdEstimatorTest, ImageEstimateFullyMaskedIsInsufficientData) {
    auto image = test_utils::createSplitImage(6, 6, 1, 0.2f, 0.8f);
    auto mask = test_utils::createMask(6, 6, 1, 0);

    auto threshold = GlobalThresholdEstimator().estimate(image, mask);

    ASSERT_FALSE(threshold.has_value());
    EXPECT_EQ(threshold.error().code, ThresholdError::Code::InsufficientData);
}

TEST_F(GlobalThresholdEstimatorTest, RegionOutsideImageRejected) {
    auto image = test_utils::createImage(6, 6);

    ImageType::RegionType region;
    ImageType::IndexType start = {{4, 4, 0}};
    ImageType::SizeType size = {{4, 4, 1}};
    region.SetIndex(start);
    region.SetSize(size);

    auto threshold = GlobalThresholdEstimator().estimate(image, nullptr, region);

    ASSERT_FALSE(threshold.has_value());
    EXPECT_EQ(threshold.error().code, ThresholdError::Code::InvalidParameters);
}

TEST_F(GlobalThresholdEstimatorTest, NullImageRejected) {
    auto threshold = GlobalThresholdEstimator().estimate(nullptr, nullptr);

    ASSERT_FALSE(threshold.has_value());
    EXPECT_EQ(threshold.error().code, ThresholdError::Code::InvalidInput);
}
