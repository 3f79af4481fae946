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
#include <functional>
#include <memory>

namespace cell_threshold::services {

/**
 * @brief Output of the preprocessing stage
 */
struct PreprocessedImage {
    /// Smoothed image in linear intensity space, compared against thresholds
    ImageType::Pointer smoothed;

    /// Image handed to the estimators (log-compressed when requested)
    ImageType::Pointer working;

    /// Gaussian sigma in pixels, 0 when smoothing was skipped
    double sigma = 0.0;

    /// True when @c working holds log(1 + x) intensities
    bool logTransformed = false;
};

/**
 * @brief Mask-aware Gaussian smoothing and log compression applied before
 *        any threshold statistic is computed
 *
 * Smoothing divides the blurred masked image by the blurred mask so that
 * masked-out samples never contribute intensity to valid ones. The kernel
 * sigma is derived from the smoothing scale so that about half of the kernel
 * mass lies within one scale of the center.
 *
 * @example
 * @code
 * IntensityPreprocessor preprocessor;
 * IntensityPreprocessor::Parameters params;
 * params.smoothingScale = 2.0;
 * params.logTransform = true;
 * auto result = preprocessor.apply(image, mask, params);
 * if (result) {
 *     double sigma = result->sigma;
 * }
 * @endcode
 */
class IntensityPreprocessor {
public:
    /// Progress callback (0.0 to 1.0)
    using ProgressCallback = std::function<void(double progress)>;

    /// Ratio between smoothing scale and Gaussian sigma
    static constexpr double kScaleToSigma = 0.674;

    /**
     * @brief Parameters for preprocessing
     */
    struct Parameters {
        /// Smoothing scale in pixels, 0 disables smoothing
        double smoothingScale = 0.0;

        /// Compress intensities with log(1 + x)
        bool logTransform = false;

        /// Smooth along the depth axis as well
        bool volumetric = false;

        [[nodiscard]] bool isValid() const noexcept {
            return smoothingScale >= 0.0;
        }
    };

    IntensityPreprocessor();
    ~IntensityPreprocessor();

    // Non-copyable, movable
    IntensityPreprocessor(const IntensityPreprocessor&) = delete;
    IntensityPreprocessor& operator=(const IntensityPreprocessor&) = delete;
    IntensityPreprocessor(IntensityPreprocessor&&) noexcept;
    IntensityPreprocessor& operator=(IntensityPreprocessor&&) noexcept;

    /**
     * @brief Set progress callback for the smoothing filters
     */
    void setProgressCallback(ProgressCallback callback);

    /**
     * @brief Smooth and optionally log-transform an image
     *
     * @param input Input image (not modified)
     * @param mask Validity mask, may be null
     * @param params Preprocessing parameters
     * @return Smoothed and working images on success
     */
    [[nodiscard]] std::expected<PreprocessedImage, ThresholdError>
    apply(ImageType::Pointer input,
          MaskType::Pointer mask,
          const Parameters& params) const;

    /**
     * @brief Mask-aware Gaussian smoothing
     *
     * @param input Input image
     * @param mask Validity mask, may be null
     * @param sigma Standard deviation in pixels, must be positive
     * @param volumetric Smooth along all three axes instead of in-plane only
     */
    [[nodiscard]] std::expected<ImageType::Pointer, ThresholdError>
    smooth(ImageType::Pointer input,
           MaskType::Pointer mask,
           double sigma,
           bool volumetric) const;

    /**
     * @brief Sigma used for a given smoothing scale (0 for scale 0)
     */
    [[nodiscard]] static double sigmaForScale(double smoothingScale) noexcept;

    [[nodiscard]] static double forwardLogTransform(double value) noexcept;

    /// Exact inverse of forwardLogTransform()
    [[nodiscard]] static double inverseLogTransform(double value) noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cell_threshold::services
