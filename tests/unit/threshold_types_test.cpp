#include <gtest/gtest.h>

#include "services/threshold/threshold_types.hpp"

#include "../test_utils/threshold_image_generator.hpp"

using namespace cell_threshold::services;
namespace test_utils = cell_threshold::test_utils;

// =============================================================================
// ThresholdParameters validation
// =============================================================================

TEST(ThresholdParametersTest, DefaultsAreValid) {
    ThresholdParameters params;
    EXPECT_TRUE(params.validate().has_value());
    EXPECT_EQ(params.strategy, ThresholdStrategy::Global);
    EXPECT_TRUE(std::holds_alternative<EstimatedThreshold>(params.source));
    EXPECT_DOUBLE_EQ(params.correctionFactor, 1.0);
    EXPECT_DOUBLE_EQ(params.minimumThreshold, 0.0);
    EXPECT_DOUBLE_EQ(params.maximumThreshold, 1.0);
    EXPECT_EQ(params.windowSize, 50);
}

TEST(ThresholdParametersTest, RejectsInvertedRange) {
    ThresholdParameters params;
    params.minimumThreshold = 0.8;
    params.maximumThreshold = 0.2;

    auto valid = params.validate();
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, ThresholdError::Code::InvalidParameters);
}

TEST(ThresholdParametersTest, RejectsRangeOutsideUnitInterval) {
    ThresholdParameters params;
    params.maximumThreshold = 1.5;
    EXPECT_FALSE(params.validate().has_value());

    params.maximumThreshold = 1.0;
    params.minimumThreshold = -0.1;
    EXPECT_FALSE(params.validate().has_value());
}

TEST(ThresholdParametersTest, RejectsNegativeSmoothingAndWindow) {
    ThresholdParameters params;
    params.smoothingScale = -1.0;
    EXPECT_FALSE(params.validate().has_value());

    params.smoothingScale = 0.0;
    params.windowSize = 0;
    EXPECT_FALSE(params.validate().has_value());
}

TEST(ThresholdParametersTest, RejectsOutlierFractionsSummingToOne) {
    ThresholdParameters params;
    params.robustBackground.lowerOutlierFraction = 0.5;
    params.robustBackground.upperOutlierFraction = 0.5;
    EXPECT_FALSE(params.validate().has_value());
}

TEST(ThresholdParametersTest, RejectsSauvolaWithGlobalStrategy) {
    ThresholdParameters params;
    params.strategy = ThresholdStrategy::Global;
    params.source = EstimatedThreshold{EstimationMethod::Sauvola, OtsuTwoClass{}};

    auto valid = params.validate();
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, ThresholdError::Code::InvalidParameters);

    params.strategy = ThresholdStrategy::Adaptive;
    EXPECT_TRUE(params.validate().has_value());
}

TEST(ThresholdParametersTest, AutomaticOverridesSmoothingAndPostprocessing) {
    ThresholdParameters params;
    params.automatic = true;
    params.smoothingScale = 4.0;
    params.logTransform = true;
    params.correctionFactor = 2.0;
    params.minimumThreshold = 0.2;
    params.maximumThreshold = 0.4;
    params.windowSize = 17;

    const auto effective = params.effective();
    EXPECT_DOUBLE_EQ(effective.smoothingScale, 1.0);
    EXPECT_FALSE(effective.logTransform);
    EXPECT_DOUBLE_EQ(effective.correctionFactor, 1.0);
    EXPECT_DOUBLE_EQ(effective.minimumThreshold, 0.0);
    EXPECT_DOUBLE_EQ(effective.maximumThreshold, 1.0);
    EXPECT_EQ(effective.windowSize, 17);
}

TEST(ThresholdParametersTest, EffectiveWithoutAutomaticIsUnchanged) {
    ThresholdParameters params;
    params.smoothingScale = 3.0;
    params.correctionFactor = 0.9;

    const auto effective = params.effective();
    EXPECT_DOUBLE_EQ(effective.smoothingScale, 3.0);
    EXPECT_DOUBLE_EQ(effective.correctionFactor, 0.9);
}

// =============================================================================
// Value helpers
// =============================================================================

TEST(ThresholdValueTest, MeanOfScalarIsScalar) {
    EXPECT_DOUBLE_EQ(meanThresholdValue(ThresholdValue{0.25}), 0.25);
}

TEST(ThresholdValueTest, MeanOfImageAveragesPixels) {
    auto image = test_utils::createSplitImage(4, 2, 1, 0.2f, 0.6f);
    EXPECT_NEAR(meanThresholdValue(ThresholdValue{image}), 0.4, 1e-6);
}

TEST(ThresholdValueTest, ResultReportsAdaptiveForImageThreshold) {
    ThresholdResult result;
    EXPECT_FALSE(result.isAdaptive());

    result.finalThreshold = test_utils::createImage(3, 3);
    EXPECT_TRUE(result.isAdaptive());
}

// =============================================================================
// Name parsing
// =============================================================================

TEST(SettingNameTest, NormalizesCaseAndSeparators) {
    EXPECT_EQ(normalizeSettingName("Minimum_Cross-Entropy"), "minimum cross entropy");
    EXPECT_EQ(normalizeSettingName("Robust Background"), "robust background");
}

TEST(ThresholdErrorTest, ToStringIncludesMessage) {
    ThresholdError error{ThresholdError::Code::ShapeMismatch, "mask is 3x3x1"};
    EXPECT_FALSE(error.isSuccess());
    EXPECT_EQ(error.toString(), "Shape mismatch: mask is 3x3x1");

    ThresholdError success;
    EXPECT_TRUE(success.isSuccess());
    EXPECT_EQ(success.toString(), "Success");
}
