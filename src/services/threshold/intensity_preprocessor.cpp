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

#include "services/threshold/intensity_preprocessor.hpp"
#include "services/threshold/image_utils.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>

#include <itkCommand.h>
#include <itkDiscreteGaussianImageFilter.h>
#include <itkImageRegionConstIterator.h>
#include <itkImageRegionIterator.h>

namespace cell_threshold::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("IntensityPreprocessor");
    return logger;
}

/**
 * @brief ITK progress observer for callback integration
 */
class ProgressObserver : public itk::Command {
public:
    using Self = ProgressObserver;
    using Superclass = itk::Command;
    using Pointer = itk::SmartPointer<Self>;

    itkNewMacro(Self);

    void setCallback(IntensityPreprocessor::ProgressCallback callback) {
        callback_ = std::move(callback);
    }

    void Execute(itk::Object* caller, const itk::EventObject& event) override {
        Execute(static_cast<const itk::Object*>(caller), event);
    }

    void Execute(const itk::Object* caller, const itk::EventObject& event) override {
        if (!callback_) return;

        if (itk::ProgressEvent().CheckEvent(&event)) {
            const auto* process = dynamic_cast<const itk::ProcessObject*>(caller);
            if (process) {
                callback_(process->GetProgress());
            }
        }
    }

private:
    IntensityPreprocessor::ProgressCallback callback_;
};

/// Kernel wide enough to hold four standard deviations on each side
unsigned int kernelWidthFor(double sigma) {
    const auto halfWidth = static_cast<unsigned int>(std::ceil(4.0 * sigma));
    return std::max(32u, 2u * halfWidth + 1u);
}

}  // anonymous namespace

/**
 * @brief PIMPL implementation for IntensityPreprocessor
 */
class IntensityPreprocessor::Impl {
public:
    ProgressCallback progressCallback;

    ImageType::Pointer blur(ImageType::Pointer input, double sigma, bool volumetric) const {
        using FilterType = itk::DiscreteGaussianImageFilter<ImageType, ImageType>;
        auto filter = FilterType::New();

        filter->SetInput(input);
        filter->SetVariance(sigma * sigma);
        filter->SetUseImageSpacing(false);
        filter->SetMaximumKernelWidth(kernelWidthFor(sigma));
        filter->SetFilterDimensionality(volumetric ? 3 : 2);

        if (progressCallback) {
            auto observer = ProgressObserver::New();
            observer->setCallback(progressCallback);
            filter->AddObserver(itk::ProgressEvent(), observer);
        }

        filter->Update();

        ImageType::Pointer output = filter->GetOutput();
        output->DisconnectPipeline();
        return output;
    }
};

IntensityPreprocessor::IntensityPreprocessor() : impl_(std::make_unique<Impl>()) {}

IntensityPreprocessor::~IntensityPreprocessor() = default;

IntensityPreprocessor::IntensityPreprocessor(IntensityPreprocessor&&) noexcept = default;

IntensityPreprocessor& IntensityPreprocessor::operator=(IntensityPreprocessor&&) noexcept = default;

void IntensityPreprocessor::setProgressCallback(ProgressCallback callback) {
    impl_->progressCallback = std::move(callback);
}

double IntensityPreprocessor::sigmaForScale(double smoothingScale) noexcept {
    return smoothingScale > 0.0 ? smoothingScale / kScaleToSigma : 0.0;
}

double IntensityPreprocessor::forwardLogTransform(double value) noexcept {
    return std::log1p(value);
}

double IntensityPreprocessor::inverseLogTransform(double value) noexcept {
    return std::expm1(value);
}

std::expected<PreprocessedImage, ThresholdError>
IntensityPreprocessor::apply(ImageType::Pointer input,
                             MaskType::Pointer mask,
                             const Parameters& params) const {
    if (auto valid = image_utils::checkInputs(input.GetPointer(), mask.GetPointer(),
                                              "preprocessing");
        !valid) {
        getLogger()->error("{}", valid.error().toString());
        return std::unexpected(valid.error());
    }

    if (!params.isValid()) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InvalidParameters,
            "preprocessing: smoothing scale must be >= 0"
        });
    }

    PreprocessedImage result;
    result.smoothed = input;
    result.sigma = sigmaForScale(params.smoothingScale);

    if (result.sigma > 0.0) {
        auto smoothed = smooth(input, mask, result.sigma, params.volumetric);
        if (!smoothed) {
            return std::unexpected(smoothed.error());
        }
        result.smoothed = smoothed.value();
        getLogger()->debug("Smoothed with sigma {:.3f} (scale {:.3f})",
                           result.sigma, params.smoothingScale);
    }

    result.working = result.smoothed;

    if (params.logTransform) {
        auto transformed = image_utils::createImageLike<ImageType>(result.smoothed.GetPointer());
        itk::ImageRegionConstIterator<ImageType> srcIt(
            result.smoothed, result.smoothed->GetLargestPossibleRegion());
        itk::ImageRegionIterator<ImageType> dstIt(
            transformed, transformed->GetLargestPossibleRegion());

        for (srcIt.GoToBegin(), dstIt.GoToBegin(); !srcIt.IsAtEnd(); ++srcIt, ++dstIt) {
            const double value = static_cast<double>(srcIt.Get());
            if (value <= -1.0) {
                getLogger()->error("Log transform undefined for intensity {}", value);
                return std::unexpected(ThresholdError{
                    ThresholdError::Code::InvalidInput,
                    "preprocessing: log transform requires intensities greater than -1"
                });
            }
            dstIt.Set(static_cast<float>(forwardLogTransform(value)));
        }

        result.working = transformed;
        result.logTransformed = true;
    }

    return result;
}

std::expected<ImageType::Pointer, ThresholdError>
IntensityPreprocessor::smooth(ImageType::Pointer input,
                              MaskType::Pointer mask,
                              double sigma,
                              bool volumetric) const {
    if (auto valid = image_utils::checkInputs(input.GetPointer(), mask.GetPointer(),
                                              "smoothing");
        !valid) {
        return std::unexpected(valid.error());
    }

    if (!(sigma > 0.0)) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InvalidParameters,
            "smoothing: sigma must be positive"
        });
    }

    try {
        const auto region = input->GetLargestPossibleRegion();

        // Weighted image (masked samples zeroed) and the weights themselves
        auto weighted = image_utils::createImageLike<ImageType>(input.GetPointer());
        auto weights = image_utils::createImageLike<ImageType>(input.GetPointer(), 1.0f);

        {
            itk::ImageRegionConstIterator<ImageType> srcIt(input, region);
            itk::ImageRegionIterator<ImageType> weightedIt(weighted, region);
            itk::ImageRegionIterator<ImageType> weightIt(weights, region);

            if (mask) {
                itk::ImageRegionConstIterator<MaskType> maskIt(mask, region);
                for (srcIt.GoToBegin(), weightedIt.GoToBegin(), weightIt.GoToBegin(),
                     maskIt.GoToBegin();
                     !srcIt.IsAtEnd();
                     ++srcIt, ++weightedIt, ++weightIt, ++maskIt) {
                    const bool valid = maskIt.Get() != 0;
                    weightedIt.Set(valid ? srcIt.Get() : 0.0f);
                    weightIt.Set(valid ? 1.0f : 0.0f);
                }
            } else {
                for (srcIt.GoToBegin(), weightedIt.GoToBegin(); !srcIt.IsAtEnd();
                     ++srcIt, ++weightedIt) {
                    weightedIt.Set(srcIt.Get());
                }
            }
        }

        auto blurredValues = impl_->blur(weighted, sigma, volumetric);
        auto blurredWeights = impl_->blur(weights, sigma, volumetric);

        auto output = image_utils::createImageLike<ImageType>(input.GetPointer());

        constexpr double kMinimumWeight = 1e-6;
        itk::ImageRegionConstIterator<ImageType> srcIt(input, region);
        itk::ImageRegionConstIterator<ImageType> valueIt(blurredValues, region);
        itk::ImageRegionConstIterator<ImageType> weightIt(blurredWeights, region);
        itk::ImageRegionIterator<ImageType> outIt(output, region);

        for (srcIt.GoToBegin(), valueIt.GoToBegin(), weightIt.GoToBegin(), outIt.GoToBegin();
             !outIt.IsAtEnd();
             ++srcIt, ++valueIt, ++weightIt, ++outIt) {
            const double weight = static_cast<double>(weightIt.Get());
            if (weight > kMinimumWeight) {
                outIt.Set(static_cast<float>(static_cast<double>(valueIt.Get()) / weight));
            } else {
                outIt.Set(srcIt.Get());
            }
        }

        return output;
    }
    catch (const itk::ExceptionObject& e) {
        getLogger()->error("ITK exception during smoothing: {}", e.GetDescription());
        return std::unexpected(ThresholdError{
            ThresholdError::Code::ProcessingFailed,
            std::string("smoothing: ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::exception& e) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InternalError,
            std::string("smoothing: standard exception: ") + e.what()
        });
    }
}

}  // namespace cell_threshold::services
