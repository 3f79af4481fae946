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

#include "services/threshold/threshold_engine.hpp"
#include "services/threshold/adaptive_block_thresholder.hpp"
#include "services/threshold/image_utils.hpp"
#include "services/threshold/intensity_preprocessor.hpp"
#include "services/threshold/sauvola_thresholder.hpp"
#include "services/threshold/threshold_postprocessor.hpp"
#include "core/logging.hpp"

#include <cmath>
#include <format>
#include <string>
#include <utility>

namespace cell_threshold::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ThresholdEngine");
    return logger;
}

std::unexpected<ThresholdError> logged(ThresholdError error) {
    getLogger()->error("{}", error.toString());
    return std::unexpected(std::move(error));
}

std::string describe(const ThresholdSource& source) {
    if (const auto* manual = std::get_if<ManualThreshold>(&source)) {
        return std::format("Manual {}", manual->value);
    }
    if (const auto* measurement = std::get_if<MeasurementThreshold>(&source)) {
        return std::format("Measurement {}", measurement->value);
    }
    const auto& estimated = std::get<EstimatedThreshold>(source);
    if (estimated.method == EstimationMethod::Otsu
        && std::holds_alternative<OtsuThreeClass>(estimated.otsuVariant)) {
        return "Otsu (three classes)";
    }
    return toString(estimated.method);
}

ThresholdPostprocessor::Parameters postprocessing(const ThresholdParameters& params) {
    ThresholdPostprocessor::Parameters post;
    post.correctionFactor = params.correctionFactor;
    post.minimumThreshold = params.minimumThreshold;
    post.maximumThreshold = params.maximumThreshold;
    return post;
}

}  // anonymous namespace

std::expected<ThresholdResult, ThresholdError>
ThresholdEngine::threshold(ImageType::Pointer image,
                           MaskType::Pointer mask,
                           const ThresholdParameters& requested) const {
    const ThresholdParameters params = requested.effective();

    getLogger()->info("Thresholding: strategy={}, source={}, smoothing={}, log={}, "
                      "correction={}, range=[{}, {}], window={}, volumetric={}",
                      toString(params.strategy), describe(params.source),
                      params.smoothingScale, params.logTransform,
                      params.correctionFactor, params.minimumThreshold,
                      params.maximumThreshold, params.windowSize, params.volumetric);

    if (auto valid = params.validate(); !valid) {
        return logged(valid.error());
    }
    if (auto valid = image_utils::checkInputs(image.GetPointer(), mask.GetPointer(),
                                              "threshold");
        !valid) {
        return logged(valid.error());
    }
    if (auto valid = image_utils::checkDimensionality(image.GetPointer(),
                                                      params.volumetric, "threshold");
        !valid) {
        return logged(valid.error());
    }

    if (const auto* manual = std::get_if<ManualThreshold>(&params.source)) {
        return thresholdWithValue(image, mask, manual->value, false, params);
    }
    if (const auto* measurement = std::get_if<MeasurementThreshold>(&params.source)) {
        return thresholdWithValue(image, mask, measurement->value, true, params);
    }
    return thresholdEstimated(image, mask, std::get<EstimatedThreshold>(params.source), params);
}

std::expected<ThresholdResult, ThresholdError>
ThresholdEngine::thresholdWithValue(ImageType::Pointer image,
                                    MaskType::Pointer mask,
                                    double value,
                                    bool applyCorrection,
                                    const ThresholdParameters& params) const {
    if (!std::isfinite(value)) {
        return logged(ThresholdError{
            ThresholdError::Code::InvalidParameters,
            "threshold: threshold value must be finite"
        });
    }

    ThresholdResult result;
    result.origThreshold = value;
    result.finalThreshold = applyCorrection
        ? ThresholdPostprocessor::finalize(value, postprocessing(params))
        : value;

    auto applied = applyThreshold(image, result.finalThreshold, mask,
                                  params.smoothingScale, params.volumetric);
    if (!applied) {
        return std::unexpected(applied.error());
    }

    result.binaryImage = applied->binaryImage;
    result.sigma = applied->sigma;
    return result;
}

std::expected<ThresholdResult, ThresholdError>
ThresholdEngine::thresholdEstimated(ImageType::Pointer image,
                                    MaskType::Pointer mask,
                                    const EstimatedThreshold& source,
                                    const ThresholdParameters& params) const {
    IntensityPreprocessor preprocessor;
    IntensityPreprocessor::Parameters preParams;
    preParams.smoothingScale = params.smoothingScale;
    preParams.logTransform = params.logTransform;
    preParams.volumetric = params.volumetric;

    auto preprocessed = preprocessor.apply(image, mask, preParams);
    if (!preprocessed) {
        return std::unexpected(preprocessed.error());
    }

    const auto values = image_utils::collectValues(preprocessed->working.GetPointer(),
                                                   mask.GetPointer());
    if (values.empty()) {
        return logged(ThresholdError{
            ThresholdError::Code::InsufficientData,
            "threshold: the mask leaves no valid pixels"
        });
    }

    const auto post = postprocessing(params);
    const auto estimator = estimatorParameters(source, params.robustBackground);

    ThresholdResult result;
    result.sigma = preprocessed->sigma;

    if (params.strategy == ThresholdStrategy::Global) {
        auto estimate = GlobalThresholdEstimator(estimator).estimate(values);
        if (!estimate) {
            return logged(estimate.error());
        }

        const double orig = preprocessed->logTransformed
            ? IntensityPreprocessor::inverseLogTransform(estimate.value())
            : estimate.value();
        getLogger()->debug("Global estimate {} (linear {})", estimate.value(), orig);

        result.origThreshold = orig;
        result.finalThreshold = ThresholdPostprocessor::finalize(orig, post);
    } else {
        std::expected<AdaptiveThresholdResult, ThresholdError> surface;

        if (source.method == EstimationMethod::Sauvola) {
            SauvolaThresholder::Parameters sauvola;
            sauvola.windowSize = params.windowSize;
            sauvola.volumetric = params.volumetric;
            sauvola.logTransformed = preprocessed->logTransformed;
            surface = SauvolaThresholder(sauvola).compute(preprocessed->working, mask);
        } else {
            AdaptiveBlockThresholder::Parameters adaptive;
            adaptive.windowSize = params.windowSize;
            adaptive.blockEstimator = estimator;
            adaptive.guideEstimator = estimator;
            adaptive.volumetric = params.volumetric;
            adaptive.logTransformed = preprocessed->logTransformed;
            surface = AdaptiveBlockThresholder(adaptive).compute(preprocessed->working, mask);
        }

        if (!surface) {
            return logged(surface.error());
        }

        auto finalized = ThresholdPostprocessor::finalize(surface->thresholdImage, post);
        if (!finalized) {
            return logged(finalized.error());
        }

        result.origThreshold = surface->thresholdImage;
        result.finalThreshold = finalized.value();
        result.guideThreshold = surface->guideThreshold;
        getLogger()->debug("Adaptive surface computed, guide {}", surface->guideThreshold);
    }

    auto binary = ThresholdPostprocessor::binarize(preprocessed->smoothed,
                                                   result.finalThreshold, mask);
    if (!binary) {
        return logged(binary.error());
    }
    result.binaryImage = binary.value();

    getLogger()->info("Thresholding complete: final={:.6f}, orig={:.6f}",
                      meanThresholdValue(result.finalThreshold),
                      meanThresholdValue(result.origThreshold));
    return result;
}

std::expected<AppliedThreshold, ThresholdError>
ThresholdEngine::applyThreshold(ImageType::Pointer image,
                                const ThresholdValue& threshold,
                                MaskType::Pointer mask,
                                double smoothingScale,
                                bool volumetric) const {
    if (auto valid = image_utils::checkInputs(image.GetPointer(), mask.GetPointer(),
                                              "apply threshold");
        !valid) {
        return logged(valid.error());
    }
    if (auto valid = image_utils::checkDimensionality(image.GetPointer(), volumetric,
                                                      "apply threshold");
        !valid) {
        return logged(valid.error());
    }

    IntensityPreprocessor preprocessor;
    IntensityPreprocessor::Parameters preParams;
    preParams.smoothingScale = smoothingScale;
    preParams.volumetric = volumetric;

    auto preprocessed = preprocessor.apply(image, mask, preParams);
    if (!preprocessed) {
        return std::unexpected(preprocessed.error());
    }

    auto binary = ThresholdPostprocessor::binarize(preprocessed->smoothed, threshold, mask);
    if (!binary) {
        return logged(binary.error());
    }

    return AppliedThreshold{binary.value(), preprocessed->sigma};
}

std::expected<ThresholdMeasurements, ThresholdError>
ThresholdEngine::measure(ImageType::Pointer image,
                         MaskType::Pointer mask,
                         const ThresholdResult& result) const {
    auto variance = ThresholdQualityMetrics::weightedVariance(image, mask, result.binaryImage);
    if (!variance) {
        return logged(variance.error());
    }
    auto entropies = ThresholdQualityMetrics::sumOfEntropies(image, mask, result.binaryImage);
    if (!entropies) {
        return logged(entropies.error());
    }

    ThresholdMeasurements measurements;
    measurements.finalThreshold = meanThresholdValue(result.finalThreshold);
    measurements.origThreshold = meanThresholdValue(result.origThreshold);
    measurements.guideThreshold = result.guideThreshold;
    measurements.weightedVariance = variance.value();
    measurements.sumOfEntropies = entropies.value();
    return measurements;
}

std::expected<ThresholdSource, ThresholdError>
ThresholdEngine::resolveSource(std::string_view methodName,
                               const OtsuVariant& otsuVariant,
                               std::optional<double> value) {
    const std::string name = normalizeSettingName(methodName);

    auto requireValue = [&](std::string_view kind) -> std::expected<double, ThresholdError> {
        if (!value) {
            return std::unexpected(ThresholdError{
                ThresholdError::Code::InvalidParameters,
                std::format("{} threshold requires a value", kind)
            });
        }
        return *value;
    };

    if (name == "minimum cross entropy") {
        return EstimatedThreshold{EstimationMethod::MinimumCrossEntropy, OtsuTwoClass{}};
    }
    if (name == "otsu") {
        return EstimatedThreshold{EstimationMethod::Otsu, otsuVariant};
    }
    if (name == "multiotsu" || name == "multi otsu") {
        OtsuThreeClass threeClass;
        if (const auto* requested = std::get_if<OtsuThreeClass>(&otsuVariant)) {
            threeClass = *requested;
        }
        return EstimatedThreshold{EstimationMethod::Otsu, threeClass};
    }
    if (name == "robust background") {
        return EstimatedThreshold{EstimationMethod::RobustBackground, OtsuTwoClass{}};
    }
    if (name == "sauvola") {
        return EstimatedThreshold{EstimationMethod::Sauvola, OtsuTwoClass{}};
    }
    if (name == "manual") {
        auto manual = requireValue("Manual");
        if (!manual) {
            return std::unexpected(manual.error());
        }
        return ManualThreshold{manual.value()};
    }
    if (name == "measurement") {
        auto measurement = requireValue("Measurement");
        if (!measurement) {
            return std::unexpected(measurement.error());
        }
        return MeasurementThreshold{measurement.value()};
    }

    return std::unexpected(ThresholdError{
        ThresholdError::Code::InvalidParameters,
        std::format("unknown threshold method '{}'", methodName)
    });
}

GlobalThresholdEstimator::Parameters
ThresholdEngine::estimatorParameters(const EstimatedThreshold& source,
                                     const RobustBackgroundOptions& robustBackground) {
    GlobalThresholdEstimator::Parameters params;
    params.robustBackground = robustBackground;

    switch (source.method) {
        case EstimationMethod::MinimumCrossEntropy:
        case EstimationMethod::Sauvola:
            params.method = GlobalMethod::MinimumCrossEntropy;
            break;
        case EstimationMethod::Otsu:
            if (const auto* threeClass = std::get_if<OtsuThreeClass>(&source.otsuVariant)) {
                params.method = GlobalMethod::MultiOtsu;
                params.middleClass = threeClass->middleClass;
            } else {
                params.method = GlobalMethod::Otsu;
            }
            break;
        case EstimationMethod::RobustBackground:
            params.method = GlobalMethod::RobustBackground;
            break;
    }
    return params;
}

}  // namespace cell_threshold::services
