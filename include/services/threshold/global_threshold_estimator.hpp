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
 * @file global_threshold_estimator.hpp
 * @brief Scalar threshold estimators over the valid samples of a region
 * @details Minimum cross-entropy (Li), two-class Otsu, three-class Otsu and
 *          Robust Background. Every estimator returns the common value of a
 *          flat distribution and reports InsufficientData for an empty one.
 */
#pragma once

#include "services/threshold/threshold_types.hpp"

#include <expected>
#include <span>

namespace cell_threshold::services {

/**
 * @brief Estimator selected for one region
 */
enum class GlobalMethod {
    MinimumCrossEntropy,
    Otsu,
    MultiOtsu,
    RobustBackground
};

/**
 * @brief Boundaries found by the three-class Otsu search (ascending)
 */
struct MultiOtsuThresholds {
    double lower = 0.0;
    double upper = 0.0;
};

/**
 * @brief Reduce a sample distribution to a single threshold
 *
 * Instances are immutable after construction and can be shared between
 * threads.
 *
 * @example
 * @code
 * GlobalThresholdEstimator::Parameters params;
 * params.method = GlobalMethod::RobustBackground;
 * params.robustBackground.numberOfDeviations = 3.0;
 * GlobalThresholdEstimator estimator(params);
 * auto threshold = estimator.estimate(image, mask);
 * @endcode
 */
class GlobalThresholdEstimator {
public:
    /**
     * @brief Parameters for global estimation
     */
    struct Parameters {
        GlobalMethod method = GlobalMethod::MinimumCrossEntropy;

        /// Which boundary the three-class search reports
        MiddleClassAssignment middleClass = MiddleClassAssignment::Foreground;

        RobustBackgroundOptions robustBackground;

        /// Histogram resolution of the Otsu searches
        unsigned int numberOfHistogramBins = 256;
    };

    GlobalThresholdEstimator() = default;
    explicit GlobalThresholdEstimator(const Parameters& params);

    [[nodiscard]] const Parameters& parameters() const noexcept { return params_; }

    /**
     * @brief Estimate from an explicit list of valid samples
     */
    [[nodiscard]] std::expected<double, ThresholdError>
    estimate(std::span<const float> values) const;

    /**
     * @brief Estimate over the valid samples of the whole image
     */
    [[nodiscard]] std::expected<double, ThresholdError>
    estimate(ImageType::Pointer image, MaskType::Pointer mask) const;

    /**
     * @brief Estimate over the valid samples of a sub-region
     */
    [[nodiscard]] std::expected<double, ThresholdError>
    estimate(ImageType::Pointer image,
             MaskType::Pointer mask,
             const ImageType::RegionType& region) const;

    /**
     * @brief Iterative minimum cross-entropy threshold (Li & Tam)
     */
    [[nodiscard]] static std::expected<double, ThresholdError>
    minimumCrossEntropy(std::span<const float> values);

    /**
     * @brief Two-class Otsu threshold maximizing between-class variance
     *
     * When several adjacent histogram boundaries tie, the midpoint of the
     * tied run is returned.
     */
    [[nodiscard]] static std::expected<double, ThresholdError>
    otsu(std::span<const float> values, unsigned int bins = 256);

    /**
     * @brief Both boundaries of the three-class Otsu partition
     */
    [[nodiscard]] static std::expected<MultiOtsuThresholds, ThresholdError>
    multiOtsu(std::span<const float> values, unsigned int bins = 256);

    /**
     * @brief center + numberOfDeviations * spread over the trimmed samples
     */
    [[nodiscard]] static std::expected<double, ThresholdError>
    robustBackground(std::span<const float> values, const RobustBackgroundOptions& options);

private:
    Parameters params_;
};

}  // namespace cell_threshold::services
