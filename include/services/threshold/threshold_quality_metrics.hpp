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
 * @file threshold_quality_metrics.hpp
 * @brief Scalar summaries of a thresholding result recorded by hosts
 * @details Weighted variance and sum of entropies of the foreground and
 *          background intensity distributions, both in log2 space with
 *          intensities clamped below at 1/256 of the brightest valid sample.
 */
#pragma once

#include "services/threshold/threshold_types.hpp"

#include <expected>
#include <optional>

namespace cell_threshold::services {

/**
 * @brief Per-image measurements of one thresholding call
 */
struct ThresholdMeasurements {
    /// Final threshold, averaged over pixels when per-pixel
    double finalThreshold = 0.0;

    /// Original threshold, averaged over pixels when per-pixel
    double origThreshold = 0.0;

    /// Guide threshold (adaptive strategy only)
    std::optional<double> guideThreshold;

    /// Count-weighted variance of log2 foreground and background intensities
    double weightedVariance = 0.0;

    /// Entropy of foreground plus entropy of background (bits)
    double sumOfEntropies = 0.0;
};

class ThresholdQualityMetrics {
public:
    /// Number of histogram bins used by sumOfEntropies()
    static constexpr unsigned int kEntropyBins = 256;

    /**
     * @brief Count-weighted mean of the foreground and background variances
     *
     * @return 0 when the mask holds no valid sample or the brightest valid
     *         sample is not positive
     */
    [[nodiscard]] static std::expected<double, ThresholdError>
    weightedVariance(ImageType::Pointer image,
                     MaskType::Pointer mask,
                     BinaryImageType::Pointer binary);

    /**
     * @brief Sum of the Shannon entropies of the foreground and background
     *        histograms over their common log2 intensity range
     */
    [[nodiscard]] static std::expected<double, ThresholdError>
    sumOfEntropies(ImageType::Pointer image,
                   MaskType::Pointer mask,
                   BinaryImageType::Pointer binary);
};

}  // namespace cell_threshold::services
