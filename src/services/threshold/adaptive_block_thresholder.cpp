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

#include "services/threshold/adaptive_block_thresholder.hpp"
#include "services/threshold/image_utils.hpp"
#include "services/threshold/intensity_preprocessor.hpp"
#include "services/threshold/threshold_postprocessor.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <limits>
#include <thread>

#include <itkImageRegionIterator.h>

namespace cell_threshold::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("AdaptiveBlockThresholder");
    return logger;
}

/**
 * @brief Interpolation support of one pixel along one axis
 */
struct AxisWeight {
    size_t lower = 0;
    size_t upper = 0;
    double t = 0.0;
};

/// Linear weights between neighbouring block centers, edge value outside.
/// A clipped last block puts the centers on an irregular grid, which rules
/// out resampling over a regular lattice.
std::vector<AxisWeight> axisWeights(const std::vector<BlockSpan>& spans, size_t extent) {
    std::vector<AxisWeight> weights(extent);
    const size_t last = spans.size() - 1;

    size_t block = 0;
    for (size_t x = 0; x < extent; ++x) {
        const auto position = static_cast<double>(x);
        if (last == 0 || position <= spans.front().center()) {
            weights[x] = AxisWeight{0, 0, 0.0};
            continue;
        }
        if (position >= spans[last].center()) {
            weights[x] = AxisWeight{last, last, 0.0};
            continue;
        }
        while (block + 1 < last && spans[block + 1].center() <= position) {
            ++block;
        }
        const double c0 = spans[block].center();
        const double c1 = spans[block + 1].center();
        weights[x] = AxisWeight{block, block + 1, (position - c0) / (c1 - c0)};
    }
    return weights;
}

double mapToLinear(double value, bool logTransformed) {
    return logTransformed ? IntensityPreprocessor::inverseLogTransform(value) : value;
}

}  // anonymous namespace

AdaptiveBlockThresholder::AdaptiveBlockThresholder(const Parameters& params)
    : params_(params) {}

std::vector<BlockSpan> AdaptiveBlockThresholder::partitionAxis(size_t extent, size_t window) {
    std::vector<BlockSpan> spans;
    if (extent == 0) {
        return spans;
    }
    window = std::max<size_t>(window, 1);
    for (size_t begin = 0; begin < extent; begin += window) {
        spans.push_back(BlockSpan{begin, std::min(extent, begin + window)});
    }
    return spans;
}

std::expected<AdaptiveThresholdResult, ThresholdError>
AdaptiveBlockThresholder::compute(ImageType::Pointer image, MaskType::Pointer mask) const {
    if (auto valid = image_utils::checkInputs(image.GetPointer(), mask.GetPointer(),
                                              "adaptive thresholding");
        !valid) {
        getLogger()->error("{}", valid.error().toString());
        return std::unexpected(valid.error());
    }
    if (auto valid = image_utils::checkDimensionality(image.GetPointer(), params_.volumetric,
                                                      "adaptive thresholding");
        !valid) {
        getLogger()->error("{}", valid.error().toString());
        return std::unexpected(valid.error());
    }
    if (!params_.isValid()) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InvalidParameters,
            "adaptive thresholding: window size must be positive"
        });
    }

    const GlobalThresholdEstimator guideEstimator(params_.guideEstimator);
    auto guide = guideEstimator.estimate(image, mask);
    if (!guide) {
        getLogger()->error("Guide threshold failed: {}", guide.error().toString());
        return std::unexpected(ThresholdError{
            guide.error().code,
            "adaptive thresholding (guide): " + guide.error().message
        });
    }
    const double guideLinear = mapToLinear(guide.value(), params_.logTransformed);

    const auto size = image->GetLargestPossibleRegion().GetSize();
    const size_t width = size[0];
    const size_t height = size[1];
    const size_t depth = size[2];
    const auto window = static_cast<size_t>(params_.windowSize);

    const auto xSpans = partitionAxis(width, window);
    const auto ySpans = partitionAxis(height, window);

    getLogger()->info("Adaptive threshold: window {}, {}x{} blocks per plane, {} plane(s), guide {:.5f}",
                      window, xSpans.size(), ySpans.size(), depth, guideLinear);

    std::vector<std::vector<double>> planeBlocks;
    planeBlocks.reserve(depth);

    try {
        if (params_.parallelPlanes && depth > 1) {
            const size_t batch = std::max(1u, std::thread::hardware_concurrency());
            for (size_t first = 0; first < depth; first += batch) {
                const size_t last = std::min(depth, first + batch);

                std::vector<std::future<std::expected<std::vector<double>, ThresholdError>>> futures;
                futures.reserve(last - first);
                for (size_t z = first; z < last; ++z) {
                    futures.push_back(std::async(std::launch::async, [&, z]() {
                        return estimatePlane(image.GetPointer(), mask.GetPointer(), z,
                                             xSpans, ySpans, guideLinear);
                    }));
                }

                // Collected in plane order, not completion order
                for (auto& future : futures) {
                    auto blocks = future.get();
                    if (!blocks) {
                        return std::unexpected(blocks.error());
                    }
                    planeBlocks.push_back(std::move(blocks.value()));
                }
            }
        } else {
            for (size_t z = 0; z < depth; ++z) {
                auto blocks = estimatePlane(image.GetPointer(), mask.GetPointer(), z,
                                            xSpans, ySpans, guideLinear);
                if (!blocks) {
                    return std::unexpected(blocks.error());
                }
                planeBlocks.push_back(std::move(blocks.value()));
            }
        }
    }
    catch (const std::exception& e) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InternalError,
            std::string("adaptive thresholding: ") + e.what()
        });
    }

    const auto start = image->GetLargestPossibleRegion().GetIndex();
    const auto xWeights = axisWeights(xSpans, width);
    const auto yWeights = axisWeights(ySpans, height);
    const size_t blocksPerRow = xSpans.size();

    auto surface = image_utils::createImageLike<ImageType>(image.GetPointer());
    itk::ImageRegionIterator<ImageType> it(surface, surface->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        const auto index = it.GetIndex();
        const auto& blocks = planeBlocks[static_cast<size_t>(index[2] - start[2])];
        const auto& wx = xWeights[static_cast<size_t>(index[0] - start[0])];
        const auto& wy = yWeights[static_cast<size_t>(index[1] - start[1])];

        auto at = [&](size_t by, size_t bx) { return blocks[by * blocksPerRow + bx]; };

        const double top = (1.0 - wx.t) * at(wy.lower, wx.lower) + wx.t * at(wy.lower, wx.upper);
        const double bottom = (1.0 - wx.t) * at(wy.upper, wx.lower) + wx.t * at(wy.upper, wx.upper);
        it.Set(static_cast<float>((1.0 - wy.t) * top + wy.t * bottom));
    }

    ThresholdPostprocessor::clampToGuide(surface.GetPointer(), guideLinear);

    return AdaptiveThresholdResult{surface, guideLinear};
}

std::expected<std::vector<double>, ThresholdError>
AdaptiveBlockThresholder::estimatePlane(const ImageType* image,
                                        const MaskType* mask,
                                        size_t plane,
                                        const std::vector<BlockSpan>& xSpans,
                                        const std::vector<BlockSpan>& ySpans,
                                        double guide) const {
    const GlobalThresholdEstimator estimator(params_.blockEstimator);
    const size_t nx = xSpans.size();
    const size_t ny = ySpans.size();

    std::vector<double> blocks(nx * ny, std::numeric_limits<double>::quiet_NaN());
    std::vector<bool> estimated(nx * ny, false);
    size_t estimatedCount = 0;

    // Spans and plane are relative to the region start
    const auto origin = image->GetLargestPossibleRegion().GetIndex();

    for (size_t by = 0; by < ny; ++by) {
        for (size_t bx = 0; bx < nx; ++bx) {
            ImageType::IndexType start;
            start[0] = origin[0] + static_cast<itk::IndexValueType>(xSpans[bx].begin);
            start[1] = origin[1] + static_cast<itk::IndexValueType>(ySpans[by].begin);
            start[2] = origin[2] + static_cast<itk::IndexValueType>(plane);

            ImageType::SizeType extent;
            extent[0] = xSpans[bx].end - xSpans[bx].begin;
            extent[1] = ySpans[by].end - ySpans[by].begin;
            extent[2] = 1;

            const auto values = image_utils::collectValues(
                image, mask, ImageType::RegionType(start, extent));
            if (values.size() < kMinimumBlockSamples) {
                continue;
            }

            auto threshold = estimator.estimate(values);
            if (!threshold) {
                return std::unexpected(ThresholdError{
                    threshold.error().code,
                    "adaptive thresholding (block " + std::to_string(bx) + ","
                        + std::to_string(by) + " of plane " + std::to_string(plane)
                        + "): " + threshold.error().message
                });
            }

            blocks[by * nx + bx] = mapToLinear(threshold.value(), params_.logTransformed);
            estimated[by * nx + bx] = true;
            ++estimatedCount;
        }
    }

    if (estimatedCount == blocks.size()) {
        return blocks;
    }

    if (estimatedCount == 0) {
        getLogger()->warn("Plane {}: no window has enough valid samples, using guide {:.5f}",
                          plane, guide);
        std::fill(blocks.begin(), blocks.end(), guide);
        return blocks;
    }

    getLogger()->warn("Plane {}: {} of {} windows lack valid samples, borrowing neighbours",
                      plane, blocks.size() - estimatedCount, blocks.size());

    // Nearest estimated window in block coordinates, first in scan order on ties
    std::vector<double> filled = blocks;
    for (size_t by = 0; by < ny; ++by) {
        for (size_t bx = 0; bx < nx; ++bx) {
            if (estimated[by * nx + bx]) {
                continue;
            }
            size_t bestDistance = std::numeric_limits<size_t>::max();
            double bestValue = guide;
            for (size_t sy = 0; sy < ny; ++sy) {
                for (size_t sx = 0; sx < nx; ++sx) {
                    if (!estimated[sy * nx + sx]) {
                        continue;
                    }
                    const size_t dx = sx > bx ? sx - bx : bx - sx;
                    const size_t dy = sy > by ? sy - by : by - sy;
                    const size_t distance = dx * dx + dy * dy;
                    if (distance < bestDistance) {
                        bestDistance = distance;
                        bestValue = blocks[sy * nx + sx];
                    }
                }
            }
            filled[by * nx + bx] = bestValue;
        }
    }
    return filled;
}

}  // namespace cell_threshold::services
