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

#include "services/threshold/global_threshold_estimator.hpp"
#include "services/threshold/image_utils.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <vector>

#include <itkHistogram.h>
#include <itkOtsuMultipleThresholdsCalculator.h>

namespace cell_threshold::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("GlobalThresholdEstimator");
    return logger;
}

std::unexpected<ThresholdError> noSamples(const char* method) {
    return std::unexpected(ThresholdError{
        ThresholdError::Code::InsufficientData,
        std::string(method) + ": no valid samples to estimate a threshold from"
    });
}

using HistogramType = itk::Statistics::Histogram<double>;
using OtsuCalculatorType = itk::OtsuMultipleThresholdsCalculator<HistogramType>;

/**
 * @brief Fixed-width histogram spanning [minimum, maximum]
 *
 * Bins are not clipped at the ends, so the maximum lands in the last bin.
 */
HistogramType::Pointer buildHistogram(std::span<const float> values,
                                      double minimum,
                                      double maximum,
                                      unsigned int bins) {
    auto histogram = HistogramType::New();
    histogram->SetMeasurementVectorSize(1);
    histogram->SetClipBinsAtEnds(false);

    HistogramType::SizeType size(1);
    size.Fill(bins);
    HistogramType::MeasurementVectorType lowerBound(1);
    HistogramType::MeasurementVectorType upperBound(1);
    lowerBound.Fill(minimum);
    upperBound.Fill(maximum);
    histogram->Initialize(size, lowerBound, upperBound);

    HistogramType::MeasurementVectorType measurement(1);
    HistogramType::IndexType index(1);
    for (float value : values) {
        measurement[0] = static_cast<double>(value);
        if (histogram->GetIndex(measurement, index)) {
            histogram->IncreaseFrequencyOfIndex(index, 1);
        }
    }
    return histogram;
}

/**
 * @brief Run ITK's Otsu search over @p histogram
 * @return Upper bin edges of the cuts, ascending
 */
std::expected<std::vector<double>, ThresholdError>
otsuCuts(const HistogramType* histogram, unsigned int numberOfThresholds, const char* method) {
    try {
        auto calculator = OtsuCalculatorType::New();
        calculator->SetInputHistogram(histogram);
        calculator->SetNumberOfThresholds(numberOfThresholds);
        calculator->Compute();

        const auto& output = calculator->GetOutput();
        std::vector<double> cuts(output.begin(), output.end());
        if (cuts.size() != numberOfThresholds) {
            return std::unexpected(ThresholdError{
                ThresholdError::Code::InternalError,
                std::string(method) + ": unexpected number of thresholds"
            });
        }
        return cuts;
    }
    catch (const itk::ExceptionObject& e) {
        getLogger()->error("{}: ITK exception: {}", method, e.GetDescription());
        return std::unexpected(ThresholdError{
            ThresholdError::Code::ProcessingFailed,
            std::string(method) + ": ITK exception: " + e.GetDescription()
        });
    }
}

/// Bin whose upper edge is @p cut
size_t binEndingAt(const HistogramType* histogram, double cut) {
    const size_t bins = histogram->GetSize(0);
    for (size_t bin = 0; bin < bins; ++bin) {
        if (histogram->GetBinMax(0, bin) == cut) {
            return bin;
        }
    }
    return bins - 1;
}

double medianOfSorted(std::span<const double> sorted) {
    const size_t n = sorted.size();
    if (n % 2 == 1) {
        return sorted[n / 2];
    }
    return 0.5 * (sorted[n / 2 - 1] + sorted[n / 2]);
}

/// Center of the fullest of isqrt(n) bins
double binnedMode(std::span<const double> sorted) {
    const double minimum = sorted.front();
    const double maximum = sorted.back();
    if (minimum == maximum) {
        return minimum;
    }

    const auto bins = std::max<size_t>(
        1, static_cast<size_t>(std::sqrt(static_cast<double>(sorted.size()))));
    std::vector<size_t> counts(bins, 0);
    const double scale = static_cast<double>(bins) / (maximum - minimum);
    for (double value : sorted) {
        auto bin = static_cast<size_t>((value - minimum) * scale);
        ++counts[std::min(bin, bins - 1)];
    }

    const auto fullest = static_cast<size_t>(
        std::distance(counts.begin(), std::max_element(counts.begin(), counts.end())));
    const double binWidth = (maximum - minimum) / static_cast<double>(bins);
    return minimum + (static_cast<double>(fullest) + 0.5) * binWidth;
}

}  // anonymous namespace

GlobalThresholdEstimator::GlobalThresholdEstimator(const Parameters& params)
    : params_(params) {}

std::expected<double, ThresholdError>
GlobalThresholdEstimator::estimate(std::span<const float> values) const {
    switch (params_.method) {
        case GlobalMethod::MinimumCrossEntropy:
            return minimumCrossEntropy(values);
        case GlobalMethod::Otsu:
            return otsu(values, params_.numberOfHistogramBins);
        case GlobalMethod::MultiOtsu: {
            auto thresholds = multiOtsu(values, params_.numberOfHistogramBins);
            if (!thresholds) {
                return std::unexpected(thresholds.error());
            }
            // Middle class in the foreground: cut between background and middle
            return params_.middleClass == MiddleClassAssignment::Foreground
                ? thresholds->lower
                : thresholds->upper;
        }
        case GlobalMethod::RobustBackground:
            return robustBackground(values, params_.robustBackground);
    }
    return std::unexpected(ThresholdError{
        ThresholdError::Code::InternalError,
        "unhandled global threshold method"
    });
}

std::expected<double, ThresholdError>
GlobalThresholdEstimator::estimate(ImageType::Pointer image, MaskType::Pointer mask) const {
    if (!image) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InvalidInput,
            "global estimation: input image is null"
        });
    }
    return estimate(image, mask, image->GetLargestPossibleRegion());
}

std::expected<double, ThresholdError>
GlobalThresholdEstimator::estimate(ImageType::Pointer image,
                                   MaskType::Pointer mask,
                                   const ImageType::RegionType& region) const {
    if (auto valid = image_utils::checkInputs(image.GetPointer(), mask.GetPointer(),
                                              "global estimation");
        !valid) {
        return std::unexpected(valid.error());
    }
    if (!image->GetLargestPossibleRegion().IsInside(region)) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InvalidParameters,
            "global estimation: region lies outside the image"
        });
    }

    const auto values = image_utils::collectValues(image.GetPointer(), mask.GetPointer(), region);
    return estimate(values);
}

std::expected<double, ThresholdError>
GlobalThresholdEstimator::minimumCrossEntropy(std::span<const float> values) {
    if (values.empty()) {
        return noSamples("minimum cross-entropy");
    }

    std::vector<double> sorted(values.begin(), values.end());
    std::sort(sorted.begin(), sorted.end());

    const double minimum = sorted.front();
    if (minimum == sorted.back()) {
        return minimum;
    }

    // Stop once the update moves less than half the smallest intensity gap
    double smallestGap = std::numeric_limits<double>::max();
    for (size_t i = 1; i < sorted.size(); ++i) {
        const double gap = sorted[i] - sorted[i - 1];
        if (gap > 0.0) {
            smallestGap = std::min(smallestGap, gap);
        }
    }
    const double tolerance = smallestGap / 2.0;

    // Work on min-shifted intensities so the logarithms stay defined
    for (auto& value : sorted) {
        value -= minimum;
    }

    const double mean = std::accumulate(sorted.begin(), sorted.end(), 0.0)
        / static_cast<double>(sorted.size());

    constexpr int kMaxIterations = 1000;
    double next = mean;
    double current = -2.0 * tolerance;

    for (int iteration = 0;
         std::abs(next - current) > tolerance && iteration < kMaxIterations;
         ++iteration) {
        current = next;

        double foregroundSum = 0.0;
        double backgroundSum = 0.0;
        size_t foregroundCount = 0;
        size_t backgroundCount = 0;
        for (double value : sorted) {
            if (value > current) {
                foregroundSum += value;
                ++foregroundCount;
            } else {
                backgroundSum += value;
                ++backgroundCount;
            }
        }

        if (foregroundCount == 0 || backgroundCount == 0) {
            break;
        }

        const double foregroundMean = foregroundSum / static_cast<double>(foregroundCount);
        const double backgroundMean = backgroundSum / static_cast<double>(backgroundCount);
        if (backgroundMean == 0.0) {
            break;
        }

        next = (backgroundMean - foregroundMean)
            / (std::log(backgroundMean) - std::log(foregroundMean));
    }

    return next + minimum;
}

std::expected<double, ThresholdError>
GlobalThresholdEstimator::otsu(std::span<const float> values, unsigned int bins) {
    if (values.empty()) {
        return noSamples("Otsu");
    }
    if (bins < 2) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InvalidParameters,
            "Otsu: at least 2 histogram bins are required"
        });
    }

    const auto [minIt, maxIt] = std::minmax_element(values.begin(), values.end());
    const double minimum = *minIt;
    const double maximum = *maxIt;
    if (minimum == maximum) {
        return minimum;
    }

    const auto histogram = buildHistogram(values, minimum, maximum, bins);
    auto cuts = otsuCuts(histogram.GetPointer(), 1, "Otsu");
    if (!cuts) {
        return std::unexpected(cuts.error());
    }

    // Moving the cut across an empty bin leaves both classes unchanged, so
    // the empty bins around the optimum form a plateau of equal variance.
    // Its midpoint is reported.
    const size_t bin = binEndingAt(histogram.GetPointer(), cuts->front());
    size_t runFirst = bin;
    while (runFirst > 0 && histogram->GetFrequency(runFirst) == 0) {
        --runFirst;
    }
    size_t runLast = bin;
    while (runLast + 2 < bins && histogram->GetFrequency(runLast + 1) == 0) {
        ++runLast;
    }

    return 0.5 * (histogram->GetBinMax(0, runFirst) + histogram->GetBinMax(0, runLast));
}

std::expected<MultiOtsuThresholds, ThresholdError>
GlobalThresholdEstimator::multiOtsu(std::span<const float> values, unsigned int bins) {
    if (values.empty()) {
        return noSamples("three-class Otsu");
    }
    if (bins < 3) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InvalidParameters,
            "three-class Otsu: at least 3 histogram bins are required"
        });
    }

    const auto [minIt, maxIt] = std::minmax_element(values.begin(), values.end());
    const double minimum = *minIt;
    const double maximum = *maxIt;
    if (minimum == maximum) {
        return MultiOtsuThresholds{minimum, minimum};
    }

    const auto histogram = buildHistogram(values, minimum, maximum, bins);
    auto cuts = otsuCuts(histogram.GetPointer(), 2, "three-class Otsu");
    if (!cuts) {
        return std::unexpected(cuts.error());
    }

    return MultiOtsuThresholds{(*cuts)[0], (*cuts)[1]};
}

std::expected<double, ThresholdError>
GlobalThresholdEstimator::robustBackground(std::span<const float> values,
                                           const RobustBackgroundOptions& options) {
    if (values.empty()) {
        return noSamples("Robust Background");
    }
    if (!options.isValid()) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InvalidParameters,
            "Robust Background: outlier fractions must each be in [0, 1] and sum to less than 1"
        });
    }

    std::vector<double> sorted(values.begin(), values.end());
    std::sort(sorted.begin(), sorted.end());

    if (sorted.front() == sorted.back()) {
        return sorted.front();
    }

    const auto n = static_cast<double>(sorted.size());
    // Round half to even
    auto lowChop = static_cast<size_t>(std::nearbyint(n * options.lowerOutlierFraction));
    auto highChop = sorted.size()
        - static_cast<size_t>(std::nearbyint(n * options.upperOutlierFraction));
    if (highChop <= lowChop) {
        // Rounding consumed every sample; keep the one at the cut
        lowChop = std::min(lowChop, sorted.size() - 1);
        highChop = lowChop + 1;
    }

    const std::span<const double> retained(sorted.data() + lowChop, highChop - lowChop);
    const auto m = static_cast<double>(retained.size());

    double center = 0.0;
    switch (options.averagingMethod) {
        case AveragingMethod::Mean:
            center = std::accumulate(retained.begin(), retained.end(), 0.0) / m;
            break;
        case AveragingMethod::Median:
            center = medianOfSorted(retained);
            break;
        case AveragingMethod::Mode:
            center = binnedMode(retained);
            break;
    }

    double spread = 0.0;
    switch (options.varianceMethod) {
        case VarianceMethod::StandardDeviation: {
            const double mean = std::accumulate(retained.begin(), retained.end(), 0.0) / m;
            double sqSum = 0.0;
            for (double value : retained) {
                sqSum += (value - mean) * (value - mean);
            }
            spread = std::sqrt(sqSum / m);
            break;
        }
        case VarianceMethod::MedianAbsoluteDeviation: {
            const double median = medianOfSorted(retained);
            std::vector<double> deviations;
            deviations.reserve(retained.size());
            for (double value : retained) {
                deviations.push_back(std::abs(value - median));
            }
            std::sort(deviations.begin(), deviations.end());
            spread = medianOfSorted(deviations);
            break;
        }
    }

    getLogger()->debug("Robust Background: {} of {} samples kept, center {:.5f}, spread {:.5f}",
                       retained.size(), sorted.size(), center, spread);

    return center + options.numberOfDeviations * spread;
}

}  // namespace cell_threshold::services
