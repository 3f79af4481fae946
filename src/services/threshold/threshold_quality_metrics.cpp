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

#include "services/threshold/threshold_quality_metrics.hpp"
#include "services/threshold/image_utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

#include <itkImageRegionConstIterator.h>

namespace cell_threshold::services {

namespace {

/**
 * @brief log2 intensities of the valid pixels split by class
 */
struct ClassSamples {
    std::vector<double> foreground;
    std::vector<double> background;
};

std::expected<void, ThresholdError> checkBinary(const ImageType* image,
                                                const BinaryImageType* binary) {
    if (!binary) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InvalidInput,
            "quality metrics: binary image is null"
        });
    }
    if (binary->GetLargestPossibleRegion() != image->GetLargestPossibleRegion()) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::ShapeMismatch,
            "quality metrics: binary image region does not match image region"
        });
    }
    return {};
}

/// Empty optional when there is nothing to measure
std::optional<ClassSamples> splitLogSamples(const ImageType* image,
                                            const MaskType* mask,
                                            const BinaryImageType* binary) {
    const auto region = image->GetLargestPossibleRegion();

    std::vector<double> values;
    std::vector<bool> isForeground;
    values.reserve(region.GetNumberOfPixels());
    isForeground.reserve(region.GetNumberOfPixels());

    itk::ImageRegionConstIterator<ImageType> it(image, region);
    itk::ImageRegionConstIterator<BinaryImageType> binaryIt(binary, region);
    itk::ImageRegionConstIterator<MaskType> maskIt;
    if (mask) {
        maskIt = itk::ImageRegionConstIterator<MaskType>(mask, region);
        maskIt.GoToBegin();
    }

    for (it.GoToBegin(), binaryIt.GoToBegin(); !it.IsAtEnd(); ++it, ++binaryIt) {
        const bool valid = !mask || maskIt.Get() != 0;
        if (mask) {
            ++maskIt;
        }
        const double value = static_cast<double>(it.Get());
        if (!valid || std::isnan(value)) {
            continue;
        }
        values.push_back(value);
        isForeground.push_back(binaryIt.Get() != 0);
    }

    if (values.empty()) {
        return std::nullopt;
    }

    const double floor = *std::max_element(values.begin(), values.end()) / 256.0;
    if (!(floor > 0.0)) {
        return std::nullopt;
    }

    ClassSamples samples;
    for (size_t i = 0; i < values.size(); ++i) {
        const double logValue = std::log2(std::max(values[i], floor));
        (isForeground[i] ? samples.foreground : samples.background).push_back(logValue);
    }
    return samples;
}

double variance(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    const auto n = static_cast<double>(values.size());
    double mean = 0.0;
    for (double v : values) mean += v;
    mean /= n;
    double sqSum = 0.0;
    for (double v : values) sqSum += (v - mean) * (v - mean);
    return sqSum / n;
}

double histogramEntropy(const std::vector<double>& values, double lower, double upper) {
    if (values.empty()) {
        return 0.0;
    }

    std::vector<double> counts(ThresholdQualityMetrics::kEntropyBins, 0.0);
    const double scale = static_cast<double>(counts.size()) / (upper - lower);
    for (double v : values) {
        auto bin = static_cast<size_t>((v - lower) * scale);
        counts[std::min(bin, counts.size() - 1)] += 1.0;
    }

    const auto n = static_cast<double>(values.size());
    double entropy = 0.0;
    for (double count : counts) {
        if (count > 0.0) {
            const double p = count / n;
            entropy -= p * std::log2(p);
        }
    }
    return entropy;
}

}  // anonymous namespace

std::expected<double, ThresholdError>
ThresholdQualityMetrics::weightedVariance(ImageType::Pointer image,
                                          MaskType::Pointer mask,
                                          BinaryImageType::Pointer binary) {
    if (auto valid = image_utils::checkInputs(image.GetPointer(), mask.GetPointer(),
                                              "weighted variance");
        !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = checkBinary(image.GetPointer(), binary.GetPointer()); !valid) {
        return std::unexpected(valid.error());
    }

    const auto samples = splitLogSamples(image.GetPointer(), mask.GetPointer(),
                                         binary.GetPointer());
    if (!samples) {
        return 0.0;
    }

    const auto nf = static_cast<double>(samples->foreground.size());
    const auto nb = static_cast<double>(samples->background.size());
    return (variance(samples->foreground) * nf + variance(samples->background) * nb)
        / (nf + nb);
}

std::expected<double, ThresholdError>
ThresholdQualityMetrics::sumOfEntropies(ImageType::Pointer image,
                                        MaskType::Pointer mask,
                                        BinaryImageType::Pointer binary) {
    if (auto valid = image_utils::checkInputs(image.GetPointer(), mask.GetPointer(),
                                              "sum of entropies");
        !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = checkBinary(image.GetPointer(), binary.GetPointer()); !valid) {
        return std::unexpected(valid.error());
    }

    const auto samples = splitLogSamples(image.GetPointer(), mask.GetPointer(),
                                         binary.GetPointer());
    if (!samples) {
        return 0.0;
    }

    double lower = std::numeric_limits<double>::max();
    double upper = std::numeric_limits<double>::lowest();
    for (const auto* values : {&samples->foreground, &samples->background}) {
        for (double v : *values) {
            lower = std::min(lower, v);
            upper = std::max(upper, v);
        }
    }
    if (upper <= lower) {
        return 0.0;
    }

    return histogramEntropy(samples->foreground, lower, upper)
        + histogramEntropy(samples->background, lower, upper);
}

}  // namespace cell_threshold::services
