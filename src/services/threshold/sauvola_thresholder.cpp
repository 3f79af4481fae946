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

#include "services/threshold/sauvola_thresholder.hpp"
#include "services/threshold/image_utils.hpp"
#include "services/threshold/intensity_preprocessor.hpp"
#include "services/threshold/threshold_postprocessor.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

#include <itkImageRegionConstIterator.h>
#include <itkImageRegionIterator.h>

namespace cell_threshold::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("SauvolaThresholder");
    return logger;
}

/**
 * @brief Inclusive 3D prefix sums of value, squared value and sample count
 *
 * Coordinates are relative to the start index of the image region.
 */
class SummedVolumeTable {
public:
    SummedVolumeTable(const ImageType* image, const MaskType* mask)
        : size_(image->GetLargestPossibleRegion().GetSize()),
          stride0_(1),
          stride1_(size_[0] + 1),
          stride2_((size_[0] + 1) * (size_[1] + 1)) {
        const size_t total = stride2_ * (size_[2] + 1);
        sum_.assign(total, 0.0);
        sumSq_.assign(total, 0.0);
        count_.assign(total, 0.0);

        const auto region = image->GetLargestPossibleRegion();
        const auto start = region.GetIndex();
        itk::ImageRegionConstIterator<ImageType> it(image, region);
        itk::ImageRegionConstIterator<MaskType> maskIt;
        if (mask) {
            maskIt = itk::ImageRegionConstIterator<MaskType>(mask, region);
            maskIt.GoToBegin();
        }

        for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
            const bool valid = !mask || maskIt.Get() != 0;
            if (mask) {
                ++maskIt;
            }
            if (!valid) {
                continue;
            }
            const auto index = it.GetIndex();
            const size_t cell = offset(static_cast<size_t>(index[0] - start[0]) + 1,
                                       static_cast<size_t>(index[1] - start[1]) + 1,
                                       static_cast<size_t>(index[2] - start[2]) + 1);
            const double value = static_cast<double>(it.Get());
            sum_[cell] = value;
            sumSq_[cell] = value * value;
            count_[cell] = 1.0;
        }

        accumulate(sum_);
        accumulate(sumSq_);
        accumulate(count_);
    }

    struct Moments {
        double sum = 0.0;
        double sumSq = 0.0;
        double count = 0.0;
    };

    /// Moments over the inclusive box [x0, x1] x [y0, y1] x [z0, z1]
    [[nodiscard]] Moments box(size_t x0, size_t x1,
                              size_t y0, size_t y1,
                              size_t z0, size_t z1) const {
        return Moments{
            boxSum(sum_, x0, x1, y0, y1, z0, z1),
            boxSum(sumSq_, x0, x1, y0, y1, z0, z1),
            boxSum(count_, x0, x1, y0, y1, z0, z1)
        };
    }

    [[nodiscard]] Moments total() const {
        return box(0, size_[0] - 1, 0, size_[1] - 1, 0, size_[2] - 1);
    }

private:
    [[nodiscard]] size_t offset(size_t x, size_t y, size_t z) const {
        return x * stride0_ + y * stride1_ + z * stride2_;
    }

    void accumulate(std::vector<double>& table) const {
        for (size_t z = 1; z <= size_[2]; ++z) {
            for (size_t y = 1; y <= size_[1]; ++y) {
                for (size_t x = 1; x <= size_[0]; ++x) {
                    table[offset(x, y, z)] += table[offset(x - 1, y, z)];
                }
            }
        }
        for (size_t z = 1; z <= size_[2]; ++z) {
            for (size_t y = 1; y <= size_[1]; ++y) {
                for (size_t x = 1; x <= size_[0]; ++x) {
                    table[offset(x, y, z)] += table[offset(x, y - 1, z)];
                }
            }
        }
        for (size_t z = 1; z <= size_[2]; ++z) {
            for (size_t y = 1; y <= size_[1]; ++y) {
                for (size_t x = 1; x <= size_[0]; ++x) {
                    table[offset(x, y, z)] += table[offset(x, y, z - 1)];
                }
            }
        }
    }

    [[nodiscard]] double boxSum(const std::vector<double>& table,
                                size_t x0, size_t x1,
                                size_t y0, size_t y1,
                                size_t z0, size_t z1) const {
        // Table cell (x + 1, y + 1, z + 1) holds the sum up to pixel (x, y, z)
        const size_t xa = x0, xb = x1 + 1;
        const size_t ya = y0, yb = y1 + 1;
        const size_t za = z0, zb = z1 + 1;
        return table[offset(xb, yb, zb)]
            - table[offset(xa, yb, zb)]
            - table[offset(xb, ya, zb)]
            - table[offset(xb, yb, za)]
            + table[offset(xa, ya, zb)]
            + table[offset(xa, yb, za)]
            + table[offset(xb, ya, za)]
            - table[offset(xa, ya, za)];
    }

    ImageType::SizeType size_;
    size_t stride0_;
    size_t stride1_;
    size_t stride2_;
    std::vector<double> sum_;
    std::vector<double> sumSq_;
    std::vector<double> count_;
};

double standardDeviation(const SummedVolumeTable::Moments& moments, double mean) {
    const double variance = moments.sumSq / moments.count - mean * mean;
    return std::sqrt(std::max(0.0, variance));
}

}  // anonymous namespace

SauvolaThresholder::SauvolaThresholder(const Parameters& params)
    : params_(params) {}

std::expected<AdaptiveThresholdResult, ThresholdError>
SauvolaThresholder::compute(ImageType::Pointer image, MaskType::Pointer mask) const {
    if (auto valid = image_utils::checkInputs(image.GetPointer(), mask.GetPointer(),
                                              "Sauvola thresholding");
        !valid) {
        getLogger()->error("{}", valid.error().toString());
        return std::unexpected(valid.error());
    }
    if (auto valid = image_utils::checkDimensionality(image.GetPointer(), params_.volumetric,
                                                      "Sauvola thresholding");
        !valid) {
        getLogger()->error("{}", valid.error().toString());
        return std::unexpected(valid.error());
    }
    if (!params_.isValid()) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InvalidParameters,
            "Sauvola thresholding: window size and dynamic range must be positive"
        });
    }

    // Sauvola has no global form; minimum cross-entropy guides it
    GlobalThresholdEstimator::Parameters guideParams;
    guideParams.method = GlobalMethod::MinimumCrossEntropy;
    auto guide = GlobalThresholdEstimator(guideParams).estimate(image, mask);
    if (!guide) {
        getLogger()->error("Guide threshold failed: {}", guide.error().toString());
        return std::unexpected(ThresholdError{
            guide.error().code,
            "Sauvola thresholding (guide): " + guide.error().message
        });
    }
    const double guideLinear = params_.logTransformed
        ? IntensityPreprocessor::inverseLogTransform(guide.value())
        : guide.value();

    const SummedVolumeTable table(image.GetPointer(), mask.GetPointer());
    const auto overall = table.total();
    if (overall.count <= 0.0) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InsufficientData,
            "Sauvola thresholding: no valid samples"
        });
    }
    const double globalMean = overall.sum / overall.count;
    const double globalStd = standardDeviation(overall, globalMean);

    const auto size = image->GetLargestPossibleRegion().GetSize();
    const auto start = image->GetLargestPossibleRegion().GetIndex();
    const auto half = static_cast<size_t>(effectiveWindow(params_.windowSize) / 2);

    auto window = [half](size_t center, size_t extent) {
        const size_t low = center > half ? center - half : 0;
        const size_t high = std::min(extent - 1, center + half);
        return std::pair{low, high};
    };

    getLogger()->info("Sauvola threshold: window {}, k {:.3f}, R {:.3f}, guide {:.5f}",
                      effectiveWindow(params_.windowSize), params_.k, params_.r, guideLinear);

    auto surface = image_utils::createImageLike<ImageType>(image.GetPointer());
    itk::ImageRegionIterator<ImageType> it(surface, surface->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        const auto index = it.GetIndex();
        const auto [x0, x1] = window(static_cast<size_t>(index[0] - start[0]), size[0]);
        const auto [y0, y1] = window(static_cast<size_t>(index[1] - start[1]), size[1]);
        const auto z = static_cast<size_t>(index[2] - start[2]);
        const auto [z0, z1] = params_.volumetric ? window(z, size[2]) : std::pair{z, z};

        const auto moments = table.box(x0, x1, y0, y1, z0, z1);

        double mean = globalMean;
        double stdDev = globalStd;
        if (moments.count > 0.0) {
            mean = moments.sum / moments.count;
            stdDev = standardDeviation(moments, mean);
        }

        double threshold = mean * (1.0 + params_.k * (stdDev / params_.r - 1.0));
        if (params_.logTransformed) {
            threshold = IntensityPreprocessor::inverseLogTransform(threshold);
        }
        it.Set(static_cast<float>(threshold));
    }

    ThresholdPostprocessor::clampToGuide(surface.GetPointer(), guideLinear);

    return AdaptiveThresholdResult{surface, guideLinear};
}

}  // namespace cell_threshold::services
