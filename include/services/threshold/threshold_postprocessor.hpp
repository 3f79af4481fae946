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

#pragma once

#include "services/threshold/threshold_types.hpp"

#include <expected>

namespace cell_threshold::services {

/**
 * @brief Final stage of thresholding: correction factor, range clamping,
 *        guide clamping of adaptive surfaces and binarization
 */
class ThresholdPostprocessor {
public:
    /// Adaptive thresholds are kept within these multiples of the guide
    static constexpr double kGuideLowerFactor = 0.7;
    static constexpr double kGuideUpperFactor = 1.5;

    /**
     * @brief Correction and range applied to estimated thresholds
     */
    struct Parameters {
        double correctionFactor = 1.0;
        double minimumThreshold = 0.0;
        double maximumThreshold = 1.0;

        [[nodiscard]] bool isValid() const noexcept {
            return minimumThreshold <= maximumThreshold;
        }
    };

    /**
     * @brief clamp(raw * correctionFactor, minimum, maximum)
     */
    [[nodiscard]] static double finalize(double raw, const Parameters& params) noexcept;

    /**
     * @brief Elementwise finalize() into a newly allocated image
     */
    [[nodiscard]] static std::expected<ImageType::Pointer, ThresholdError>
    finalize(ImageType::Pointer raw, const Parameters& params);

    /**
     * @brief Finalize either representation of a threshold value
     */
    [[nodiscard]] static std::expected<ThresholdValue, ThresholdError>
    finalize(const ThresholdValue& raw, const Parameters& params);

    /**
     * @brief Clamp every pixel of @p surface into [0.7 guide, 1.5 guide]
     */
    static void clampToGuide(ImageType* surface, double guide);

    /**
     * @brief foreground = image >= threshold and mask
     *
     * @param image Image compared against the threshold (smoothed input)
     * @param threshold Scalar or per-pixel threshold congruent to @p image
     * @param mask Validity mask, may be null; masked pixels are background
     */
    [[nodiscard]] static std::expected<BinaryImageType::Pointer, ThresholdError>
    binarize(ImageType::Pointer image,
             const ThresholdValue& threshold,
             MaskType::Pointer mask);
};

}  // namespace cell_threshold::services
