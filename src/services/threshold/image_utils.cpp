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

#include "services/threshold/image_utils.hpp"

#include <format>

namespace cell_threshold::services::image_utils {

std::expected<void, ThresholdError>
checkInputs(const ImageType* image, const MaskType* mask, const std::string& stage) {
    if (!image) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InvalidInput,
            stage + ": input image is null"
        });
    }

    const auto imageSize = image->GetLargestPossibleRegion().GetSize();
    if (imageSize[0] == 0 || imageSize[1] == 0 || imageSize[2] == 0) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::InvalidInput,
            stage + ": input image is empty"
        });
    }

    if (mask) {
        const auto maskSize = mask->GetLargestPossibleRegion().GetSize();
        if (maskSize != imageSize) {
            return std::unexpected(ThresholdError{
                ThresholdError::Code::ShapeMismatch,
                std::format("{}: mask size {}x{}x{} does not match image size {}x{}x{}",
                            stage, maskSize[0], maskSize[1], maskSize[2],
                            imageSize[0], imageSize[1], imageSize[2])
            });
        }

        // Iterators address pixels by index, so both regions must start together
        const auto maskStart = mask->GetLargestPossibleRegion().GetIndex();
        const auto imageStart = image->GetLargestPossibleRegion().GetIndex();
        if (maskStart != imageStart) {
            return std::unexpected(ThresholdError{
                ThresholdError::Code::ShapeMismatch,
                std::format("{}: mask region starts at ({}, {}, {}) but image region at ({}, {}, {})",
                            stage, maskStart[0], maskStart[1], maskStart[2],
                            imageStart[0], imageStart[1], imageStart[2])
            });
        }
    }
    return {};
}

std::expected<void, ThresholdError>
checkDimensionality(const ImageType* image, bool volumetric, const std::string& stage) {
    const auto depth = image->GetLargestPossibleRegion().GetSize()[2];
    if (!volumetric && depth != 1) {
        return std::unexpected(ThresholdError{
            ThresholdError::Code::ShapeMismatch,
            std::format("{}: 2D thresholding requires a single plane, got {} planes",
                        stage, depth)
        });
    }
    return {};
}

std::vector<float> collectValues(const ImageType* image,
                                 const MaskType* mask,
                                 const ImageType::RegionType& region) {
    std::vector<float> values;
    values.reserve(region.GetNumberOfPixels());

    itk::ImageRegionConstIterator<ImageType> it(image, region);
    if (!mask) {
        for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
            values.push_back(it.Get());
        }
        return values;
    }

    itk::ImageRegionConstIterator<MaskType> maskIt(mask, region);
    for (it.GoToBegin(), maskIt.GoToBegin(); !it.IsAtEnd(); ++it, ++maskIt) {
        if (maskIt.Get() != 0) {
            values.push_back(it.Get());
        }
    }
    return values;
}

std::vector<float> collectValues(const ImageType* image, const MaskType* mask) {
    return collectValues(image, mask, image->GetLargestPossibleRegion());
}

}  // namespace cell_threshold::services::image_utils
