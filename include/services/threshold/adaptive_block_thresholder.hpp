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
 * @file adaptive_block_thresholder.hpp
 * @brief Spatially varying threshold estimated per window and blended
 *        across window centers
 */
#pragma once

#include "services/threshold/global_threshold_estimator.hpp"
#include "services/threshold/threshold_types.hpp"

#include <cstddef>
#include <expected>
#include <vector>

namespace cell_threshold::services {

/**
 * @brief Per-pixel threshold surface and the guide bounding it
 */
struct AdaptiveThresholdResult {
    /// Threshold per pixel in linear intensity space, guide-clamped
    ImageType::Pointer thresholdImage;

    /// Global estimate over the whole masked image, linear intensity space
    double guideThreshold = 0.0;
};

/**
 * @brief Half-open pixel range [begin, end) covered by one block on one axis
 */
struct BlockSpan {
    size_t begin = 0;
    size_t end = 0;

    [[nodiscard]] double center() const noexcept {
        return 0.5 * static_cast<double>(begin + end - 1);
    }
};

/**
 * @brief Block-wise adaptive thresholding
 *
 * Each plane is tiled into windows of @c windowSize pixels along x and y
 * (the last window per axis is clipped). One scalar is estimated per window
 * with the block estimator, the scalars are bilinearly interpolated between
 * window centers, and the surface is clamped into
 * [0.7 guide, 1.5 guide] where guide is the guide estimator applied to the
 * whole masked image. Windows with fewer than kMinimumBlockSamples valid
 * samples borrow the value of the nearest estimated window of their plane,
 * or the guide when the plane has none.
 *
 * Planes of a volume are processed independently; there is no blending
 * along depth. Plane results are collected by plane index, so concurrent
 * and sequential processing produce identical surfaces.
 */
class AdaptiveBlockThresholder {
public:
    /// Smallest number of valid samples a window needs to be estimated
    static constexpr size_t kMinimumBlockSamples = 4;

    /**
     * @brief Parameters for adaptive thresholding
     */
    struct Parameters {
        /// Window edge length in pixels
        int windowSize = 50;

        /// Estimator run on every window
        GlobalThresholdEstimator::Parameters blockEstimator;

        /// Estimator run once on the whole image
        GlobalThresholdEstimator::Parameters guideEstimator;

        /// Image has several depth planes
        bool volumetric = false;

        /// Input intensities are log(1 + x); estimates are mapped back
        bool logTransformed = false;

        /// Estimate the planes of a volume concurrently
        bool parallelPlanes = true;

        [[nodiscard]] bool isValid() const noexcept {
            return windowSize > 0;
        }
    };

    AdaptiveBlockThresholder() = default;
    explicit AdaptiveBlockThresholder(const Parameters& params);

    [[nodiscard]] const Parameters& parameters() const noexcept { return params_; }

    /**
     * @brief Compute the clamped per-pixel threshold surface
     *
     * @param image Working image (possibly log-transformed)
     * @param mask Validity mask, may be null
     * @return Threshold surface and guide, both in linear intensity space
     */
    [[nodiscard]] std::expected<AdaptiveThresholdResult, ThresholdError>
    compute(ImageType::Pointer image, MaskType::Pointer mask) const;

    /**
     * @brief Tile an axis of @p extent pixels into windows of @p window pixels
     *
     * A window larger than the extent yields a single span.
     */
    [[nodiscard]] static std::vector<BlockSpan> partitionAxis(size_t extent, size_t window);

private:
    std::expected<std::vector<double>, ThresholdError>
    estimatePlane(const ImageType* image,
                  const MaskType* mask,
                  size_t plane,
                  const std::vector<BlockSpan>& xSpans,
                  const std::vector<BlockSpan>& ySpans,
                  double guide) const;

    Parameters params_;
};

}  // namespace cell_threshold::services
