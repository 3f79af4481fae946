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
 * @file threshold_engine.hpp
 * @brief Entry point turning an intensity image into a foreground mask
 * @details Resolves the threshold source, runs preprocessing, the global
 *          estimator or one of the adaptive engines, postprocessing and
 *          binarization. Each call is self-contained; the engine holds no
 *          state across calls and may be shared between threads.
 *
 * ## Thread Safety
 * - All member functions are const and reentrant
 */
#pragma once

#include "services/threshold/global_threshold_estimator.hpp"
#include "services/threshold/threshold_quality_metrics.hpp"
#include "services/threshold/threshold_types.hpp"

#include <expected>
#include <optional>
#include <string_view>

namespace cell_threshold::services {

/**
 * @brief Binarization of an image against a known threshold
 */
struct AppliedThreshold {
    BinaryImageType::Pointer binaryImage;
    double sigma = 0.0;
};

/**
 * @brief Threshold dispatcher
 *
 * @example
 * @code
 * ThresholdEngine engine;
 * ThresholdParameters params;
 * params.strategy = ThresholdStrategy::Adaptive;
 * params.source = EstimatedThreshold{EstimationMethod::Otsu, OtsuTwoClass{}};
 * params.windowSize = 64;
 *
 * auto result = engine.threshold(image, mask, params);
 * if (result) {
 *     auto binary = result->binaryImage;
 * } else {
 *     spdlog::error("{}", result.error().toString());
 * }
 * @endcode
 */
class ThresholdEngine {
public:
    ThresholdEngine() = default;

    /**
     * @brief Threshold an image
     *
     * @param image Intensity image (depth 1 unless params.volumetric)
     * @param mask Validity mask of the same size, or nullptr for all valid
     * @param params Threshold settings
     * @return Thresholds and binary image on success
     */
    [[nodiscard]] std::expected<ThresholdResult, ThresholdError>
    threshold(ImageType::Pointer image,
              MaskType::Pointer mask,
              const ThresholdParameters& params) const;

    /**
     * @brief Smooth the image and binarize it against a given threshold
     *
     * No estimation, correction or range clamping is performed.
     */
    [[nodiscard]] std::expected<AppliedThreshold, ThresholdError>
    applyThreshold(ImageType::Pointer image,
                   const ThresholdValue& threshold,
                   MaskType::Pointer mask,
                   double smoothingScale,
                   bool volumetric = false) const;

    /**
     * @brief Summarize a result for per-image measurement tables
     */
    [[nodiscard]] std::expected<ThresholdMeasurements, ThresholdError>
    measure(ImageType::Pointer image,
            MaskType::Pointer mask,
            const ThresholdResult& result) const;

    /**
     * @brief Map a method name to a threshold source
     *
     * Accepts "Minimum Cross-Entropy", "Otsu", "multiotsu",
     * "Robust Background", "Sauvola", "Manual" and "Measurement", case
     * insensitive, with '_' or '-' in place of spaces. @p value is required
     * for Manual and Measurement.
     */
    [[nodiscard]] static std::expected<ThresholdSource, ThresholdError>
    resolveSource(std::string_view methodName,
                  const OtsuVariant& otsuVariant = OtsuTwoClass{},
                  std::optional<double> value = std::nullopt);

    /// Estimator settings for the global or per-block estimate of @p source
    [[nodiscard]] static GlobalThresholdEstimator::Parameters
    estimatorParameters(const EstimatedThreshold& source,
                        const RobustBackgroundOptions& robustBackground);

private:
    std::expected<ThresholdResult, ThresholdError>
    thresholdEstimated(ImageType::Pointer image,
                       MaskType::Pointer mask,
                       const EstimatedThreshold& source,
                       const ThresholdParameters& params) const;

    std::expected<ThresholdResult, ThresholdError>
    thresholdWithValue(ImageType::Pointer image,
                       MaskType::Pointer mask,
                       double value,
                       bool applyCorrection,
                       const ThresholdParameters& params) const;
};

}  // namespace cell_threshold::services
