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

#include "services/threshold/adaptive_block_thresholder.hpp"
#include "services/threshold/threshold_types.hpp"

#include <expected>

namespace cell_threshold::services {

/**
 * @brief Per-pixel Sauvola threshold m * (1 + k * (s / R - 1))
 *
 * m and s are the mean and standard deviation of the valid samples in a
 * square window (cubic for volumes) centered on each pixel, obtained from
 * summed-area tables. A window without valid samples falls back to the
 * statistics of the whole image. The surface is clamped against a minimum
 * cross-entropy guide in the same way as block-wise adaptive thresholds.
 */
class SauvolaThresholder {
public:
    /**
     * @brief Parameters for Sauvola thresholding
     */
    struct Parameters {
        /// Window edge length; even values are widened by one pixel
        int windowSize = 50;

        /// Sensitivity
        double k = 0.2;

        /// Dynamic range of the standard deviation
        double r = 0.5;

        bool volumetric = false;

        /// Input intensities are log(1 + x); results are mapped back
        bool logTransformed = false;

        [[nodiscard]] bool isValid() const noexcept {
            return windowSize > 0 && r > 0.0;
        }
    };

    SauvolaThresholder() = default;
    explicit SauvolaThresholder(const Parameters& params);

    /**
     * @brief Compute the guide-clamped Sauvola threshold surface
     */
    [[nodiscard]] std::expected<AdaptiveThresholdResult, ThresholdError>
    compute(ImageType::Pointer image, MaskType::Pointer mask) const;

    /// Odd window edge actually used for @p windowSize
    [[nodiscard]] static int effectiveWindow(int windowSize) noexcept {
        return windowSize % 2 == 0 ? windowSize + 1 : windowSize;
    }

private:
    Parameters params_;
};

}  // namespace cell_threshold::services
