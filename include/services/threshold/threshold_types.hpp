// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file threshold_types.hpp
 * @brief Image types, error codes, parameter bundle and result structures
 *        shared by the thresholding engines
 * @details Defines ThresholdError (InvalidInput, InvalidParameters,
 *          ShapeMismatch, InsufficientData, ProcessingFailed, InternalError),
 *          the tagged threshold source and Otsu variant, the
 *          ThresholdParameters bundle with validation and ThresholdResult.
 */
#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <itkImage.h>
#include <itkSmartPointer.h>

namespace cell_threshold::services {

/// Intensity image; a 2D image has a third extent of 1
using ImageType = itk::Image<float, 3>;

/// Validity mask, non-zero marks a valid sample
using MaskType = itk::Image<unsigned char, 3>;

/// Binarization output holding 0 (background) or 1 (foreground)
using BinaryImageType = itk::Image<unsigned char, 3>;

/**
 * @brief Error information for thresholding operations
 */
struct ThresholdError {
    enum class Code {
        Success,
        InvalidInput,
        InvalidParameters,
        ShapeMismatch,
        InsufficientData,
        ProcessingFailed,
        InternalError
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::InvalidInput: return "Invalid input: " + message;
            case Code::InvalidParameters: return "Invalid parameters: " + message;
            case Code::ShapeMismatch: return "Shape mismatch: " + message;
            case Code::InsufficientData: return "Insufficient data: " + message;
            case Code::ProcessingFailed: return "Processing failed: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

enum class ThresholdStrategy {
    Global,
    Adaptive
};

/// Statistical methods that estimate a threshold from the data
enum class EstimationMethod {
    MinimumCrossEntropy,
    Otsu,
    RobustBackground,
    Sauvola
};

enum class MiddleClassAssignment {
    Foreground,
    Background
};

struct OtsuTwoClass {};

struct OtsuThreeClass {
    MiddleClassAssignment middleClass = MiddleClassAssignment::Foreground;
};

using OtsuVariant = std::variant<OtsuTwoClass, OtsuThreeClass>;

/// Threshold entered by the user, used exactly as given
struct ManualThreshold {
    double value = 0.0;
};

/// Threshold taken from a prior image measurement
struct MeasurementThreshold {
    double value = 0.0;
};

/// Threshold computed by a statistical method
struct EstimatedThreshold {
    EstimationMethod method = EstimationMethod::MinimumCrossEntropy;
    OtsuVariant otsuVariant = OtsuTwoClass{};
};

using ThresholdSource = std::variant<ManualThreshold, MeasurementThreshold, EstimatedThreshold>;

enum class AveragingMethod {
    Mean,
    Median,
    Mode
};

enum class VarianceMethod {
    StandardDeviation,
    MedianAbsoluteDeviation
};

/**
 * @brief Options of the Robust Background method
 */
struct RobustBackgroundOptions {
    /// Fraction of lowest intensities discarded
    double lowerOutlierFraction = 0.05;

    /// Fraction of highest intensities discarded
    double upperOutlierFraction = 0.05;

    AveragingMethod averagingMethod = AveragingMethod::Mean;

    VarianceMethod varianceMethod = VarianceMethod::StandardDeviation;

    /// Spread multiplier added to the center statistic (may be negative)
    double numberOfDeviations = 2.0;

    [[nodiscard]] bool isValid() const noexcept {
        return lowerOutlierFraction >= 0.0 && lowerOutlierFraction <= 1.0
            && upperOutlierFraction >= 0.0 && upperOutlierFraction <= 1.0
            && lowerOutlierFraction + upperOutlierFraction < 1.0;
    }
};

/**
 * @brief Complete configuration of one thresholding call
 *
 * Defaults reproduce a global minimum cross-entropy threshold without
 * smoothing, correction or range restriction.
 */
struct ThresholdParameters {
    ThresholdStrategy strategy = ThresholdStrategy::Global;

    ThresholdSource source = EstimatedThreshold{};

    /// Smoothing scale in pixels; 0 disables smoothing
    double smoothingScale = 0.0;

    /// Estimate on log(1 + x) intensities
    bool logTransform = false;

    /// Multiplier applied to the estimated threshold
    double correctionFactor = 1.0;

    /// Lower bound of the final threshold
    double minimumThreshold = 0.0;

    /// Upper bound of the final threshold
    double maximumThreshold = 1.0;

    /// Edge length of adaptive windows in pixels
    int windowSize = 50;

    RobustBackgroundOptions robustBackground;

    /// Treat the third axis as a spatial depth axis
    bool volumetric = false;

    /// Replace smoothing, log transform, correction and range with defaults
    bool automatic = false;

    /**
     * @brief Check all invariants of the bundle
     * @return Empty on success, InvalidParameters naming the offending field
     */
    [[nodiscard]] std::expected<void, ThresholdError> validate() const;

    /**
     * @brief Bundle with the automatic overrides applied when requested
     */
    [[nodiscard]] ThresholdParameters effective() const;
};

/// Scalar threshold, or a per-pixel threshold image congruent to the input
using ThresholdValue = std::variant<double, ImageType::Pointer>;

/**
 * @brief Result of a thresholding call
 */
struct ThresholdResult {
    /// Threshold after correction factor and range clamping
    ThresholdValue finalThreshold = 0.0;

    /// Estimator output in linear intensity space
    ThresholdValue origThreshold = 0.0;

    /// Global estimate bounding adaptive thresholds (adaptive strategy only)
    std::optional<double> guideThreshold;

    /// 1 = foreground, 0 = background; always 0 outside the mask
    BinaryImageType::Pointer binaryImage;

    /// Gaussian sigma used for smoothing, 0 when none was applied
    double sigma = 0.0;

    [[nodiscard]] bool isAdaptive() const noexcept {
        return std::holds_alternative<ImageType::Pointer>(finalThreshold);
    }
};

/**
 * @brief Mean of a threshold value; the pixel mean for image values
 */
[[nodiscard]] double meanThresholdValue(const ThresholdValue& value);

/**
 * @brief Lower-case a setting name and turn '_' and '-' into spaces so that
 *        "Minimum Cross-Entropy" and "Minimum_Cross_Entropy" compare equal
 */
[[nodiscard]] std::string normalizeSettingName(std::string_view name);

[[nodiscard]] std::string toString(ThresholdStrategy strategy);
[[nodiscard]] std::string toString(EstimationMethod method);

}  // namespace cell_threshold::services
