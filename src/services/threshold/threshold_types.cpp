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

#include "services/threshold/threshold_types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <itkImageRegionConstIterator.h>

namespace cell_threshold::services {

namespace {

std::unexpected<ThresholdError> invalidParameter(std::string message) {
    return std::unexpected(ThresholdError{
        ThresholdError::Code::InvalidParameters,
        std::move(message)
    });
}

}  // anonymous namespace

std::expected<void, ThresholdError> ThresholdParameters::validate() const {
    if (!std::isfinite(minimumThreshold) || !std::isfinite(maximumThreshold)) {
        return invalidParameter("threshold range bounds must be finite");
    }
    if (minimumThreshold < 0.0 || maximumThreshold > 1.0) {
        return invalidParameter("threshold range must lie within [0, 1]");
    }
    if (minimumThreshold > maximumThreshold) {
        return invalidParameter("minimum threshold must be <= maximum threshold");
    }
    if (!std::isfinite(correctionFactor)) {
        return invalidParameter("correction factor must be finite");
    }
    if (!(smoothingScale >= 0.0) || !std::isfinite(smoothingScale)) {
        return invalidParameter("smoothing scale must be >= 0");
    }
    if (windowSize <= 0) {
        return invalidParameter("adaptive window size must be positive");
    }
    if (!robustBackground.isValid()) {
        return invalidParameter(
            "outlier fractions must each be in [0, 1] and sum to less than 1");
    }
    if (!std::isfinite(robustBackground.numberOfDeviations)) {
        return invalidParameter("number of deviations must be finite");
    }

    if (const auto* estimated = std::get_if<EstimatedThreshold>(&source)) {
        if (estimated->method == EstimationMethod::Sauvola
            && strategy == ThresholdStrategy::Global) {
            return invalidParameter("Sauvola is only available for the adaptive strategy");
        }
    }
    return {};
}

ThresholdParameters ThresholdParameters::effective() const {
    if (!automatic) {
        return *this;
    }
    ThresholdParameters params = *this;
    params.smoothingScale = 1.0;
    params.logTransform = false;
    params.correctionFactor = 1.0;
    params.minimumThreshold = 0.0;
    params.maximumThreshold = 1.0;
    return params;
}

double meanThresholdValue(const ThresholdValue& value) {
    if (const auto* scalar = std::get_if<double>(&value)) {
        return *scalar;
    }

    const auto& image = std::get<ImageType::Pointer>(value);
    if (!image) {
        return 0.0;
    }

    double sum = 0.0;
    size_t count = 0;
    itk::ImageRegionConstIterator<ImageType> it(image, image->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        sum += static_cast<double>(it.Get());
        ++count;
    }
    return count > 0 ? sum / static_cast<double>(count) : 0.0;
}

std::string normalizeSettingName(std::string_view name) {
    std::string normalized(name);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) {
                       if (c == '_' || c == '-') return ' ';
                       return static_cast<char>(std::tolower(c));
                   });
    return normalized;
}

std::string toString(ThresholdStrategy strategy) {
    switch (strategy) {
        case ThresholdStrategy::Global: return "Global";
        case ThresholdStrategy::Adaptive: return "Adaptive";
    }
    return "Global";
}

std::string toString(EstimationMethod method) {
    switch (method) {
        case EstimationMethod::MinimumCrossEntropy: return "Minimum Cross-Entropy";
        case EstimationMethod::Otsu: return "Otsu";
        case EstimationMethod::RobustBackground: return "Robust Background";
        case EstimationMethod::Sauvola: return "Sauvola";
    }
    return "Minimum Cross-Entropy";
}

}  // namespace cell_threshold::services
