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

#include "services/threshold/threshold_postprocessor.hpp"
#include "services/threshold/image_utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <itkBinaryFunctorImageFilter.h>
#include <itkBinaryThresholdImageFilter.h>
#include <itkImageRegionConstIterator.h>
#include <itkImageRegionIterator.h>
#include <itkMaskImageFilter.h>

namespace cell_threshold::services {

namespace {

/**
 * @brief 1 where the pixel reaches its own threshold
 */
class AtLeastThreshold {
public:
    bool operator==(const AtLeastThreshold&) const { return true; }
    bool operator!=(const AtLeastThreshold&) const { return false; }

    unsigned char operator()(float value, float threshold) const {
        return value >= threshold ? 1 : 0;
    }
};

/// Smallest float f with f >= threshold, so float pixels compare as in double
float lowerFloatBound(double threshold) {
    auto bound = static_cast<float>(threshold);
    if (static_cast<double>(bound) < threshold) {
        bound = std::nextafter(bound, std::numeric_limits<float>::infinity());
    }
    return bound;
}

}  // anonymous namespace

double ThresholdPostprocessor::finalize(double raw, const Parameters& params) noexcept {
    return std::clamp(raw * params.correctionFactor,
                      params.minimumThreshold,
                      params.maximumThreshold);
}

std::expected<ImageType::Pointer, ThresholdError>
ThresholdPostprocessor::finalize(ImageType::Pointer raw, const Parameters& params) {
    if (!raw) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InvalidInput,
            "postprocessing: threshold image is null"
        });
    }
    if (!params.isValid()) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InvalidParameters,
            "postprocessing: minimum threshold must be <= maximum threshold"
        });
    }

    auto output = image_utils::createImageLike<ImageType>(raw.GetPointer());
    const auto region = raw->GetLargestPossibleRegion();

    itk::ImageRegionConstIterator<ImageType> inIt(raw, region);
    itk::ImageRegionIterator<ImageType> outIt(output, region);
    for (inIt.GoToBegin(), outIt.GoToBegin(); !inIt.IsAtEnd(); ++inIt, ++outIt) {
        outIt.Set(static_cast<float>(finalize(static_cast<double>(inIt.Get()), params)));
    }
    return output;
}

std::expected<ThresholdValue, ThresholdError>
ThresholdPostprocessor::finalize(const ThresholdValue& raw, const Parameters& params) {
    if (const auto* scalar = std::get_if<double>(&raw)) {
        if (!params.isValid()) {
            return std::unexpected(ThresholdError{
                ThresholdError::Code::InvalidParameters,
                "postprocessing: minimum threshold must be <= maximum threshold"
            });
        }
        return ThresholdValue{finalize(*scalar, params)};
    }

    auto image = finalize(std::get<ImageType::Pointer>(raw), params);
    if (!image) {
        return std::unexpected(image.error());
    }
    return ThresholdValue{image.value()};
}

void ThresholdPostprocessor::clampToGuide(ImageType* surface, double guide) {
    // Written with min/max so a negative guide still yields an ordered band
    const double a = kGuideLowerFactor * guide;
    const double b = kGuideUpperFactor * guide;
    const double lower = std::min(a, b);
    const double upper = std::max(a, b);

    itk::ImageRegionIterator<ImageType> it(surface, surface->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        it.Set(static_cast<float>(std::clamp(static_cast<double>(it.Get()), lower, upper)));
    }
}

std::expected<BinaryImageType::Pointer, ThresholdError>
ThresholdPostprocessor::binarize(ImageType::Pointer image,
                                 const ThresholdValue& threshold,
                                 MaskType::Pointer mask) {
    if (auto valid = image_utils::checkInputs(image.GetPointer(), mask.GetPointer(),
                                              "binarization");
        !valid) {
        return std::unexpected(valid.error());
    }

    const auto* thresholdImage = std::get_if<ImageType::Pointer>(&threshold);
    if (thresholdImage) {
        if (!*thresholdImage) {
            return std::unexpected(ThresholdError{
                ThresholdError::Code::InvalidInput,
                "binarization: threshold image is null"
            });
        }
        if ((*thresholdImage)->GetLargestPossibleRegion() != image->GetLargestPossibleRegion()) {
            return std::unexpected(ThresholdError{
                ThresholdError::Code::ShapeMismatch,
                "binarization: threshold image region does not match image region"
            });
        }
    }

    try {
        BinaryImageType::Pointer binary;

        if (thresholdImage) {
            using FilterType = itk::BinaryFunctorImageFilter<
                ImageType, ImageType, BinaryImageType, AtLeastThreshold>;
            auto filter = FilterType::New();
            filter->SetInput1(image);
            filter->SetInput2(*thresholdImage);
            filter->Update();
            binary = filter->GetOutput();
        } else {
            using FilterType = itk::BinaryThresholdImageFilter<ImageType, BinaryImageType>;
            auto filter = FilterType::New();
            filter->SetInput(image);
            filter->SetLowerThreshold(lowerFloatBound(std::get<double>(threshold)));
            filter->SetUpperThreshold(std::numeric_limits<float>::infinity());
            filter->SetInsideValue(1);
            filter->SetOutsideValue(0);
            filter->Update();
            binary = filter->GetOutput();
        }

        if (!mask) {
            return binary;
        }

        using MaskFilterType = itk::MaskImageFilter<BinaryImageType, MaskType, BinaryImageType>;
        auto maskFilter = MaskFilterType::New();
        maskFilter->SetInput(binary);
        maskFilter->SetMaskImage(mask);
        maskFilter->SetOutsideValue(0);
        maskFilter->Update();
        return BinaryImageType::Pointer(maskFilter->GetOutput());
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::ProcessingFailed,
            std::string("binarization: ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::exception& e) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InternalError,
            std::string("binarization: standard exception: ") + e.what()
        });
    }
}

}  // namespace cell_threshold::services
