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

/**
 * @file image_utils.hpp
 * @brief Small helpers shared by the threshold engines: allocation of
 *        congruent images, shape checks and masked sample collection
 */
#pragma once

#include "services/threshold/threshold_types.hpp"

#include <expected>
#include <string>
#include <vector>

#include <itkImageRegionConstIterator.h>

namespace cell_threshold::services::image_utils {

/**
 * @brief Allocate an image with the geometry of @p reference
 */
template <typename TOutput, typename TReference>
typename TOutput::Pointer createImageLike(const TReference* reference,
                                          typename TOutput::PixelType fill = {}) {
    auto image = TOutput::New();
    image->SetRegions(reference->GetLargestPossibleRegion());
    image->SetSpacing(reference->GetSpacing());
    image->SetOrigin(reference->GetOrigin());
    image->SetDirection(reference->GetDirection());
    image->Allocate();
    image->FillBuffer(fill);
    return image;
}

/**
 * @brief Verify that a non-null mask covers exactly the image region
 *
 * Size and start index must both agree; the start index may be non-zero.
 * @param stage Name of the calling stage, used in the error message
 */
[[nodiscard]] std::expected<void, ThresholdError>
checkInputs(const ImageType* image, const MaskType* mask, const std::string& stage);

/**
 * @brief Verify that a 2D request really carries a single plane
 */
[[nodiscard]] std::expected<void, ThresholdError>
checkDimensionality(const ImageType* image, bool volumetric, const std::string& stage);

/**
 * @brief Collect the valid samples of @p region; a null mask accepts all
 */
[[nodiscard]] std::vector<float> collectValues(const ImageType* image,
                                               const MaskType* mask,
                                               const ImageType::RegionType& region);

/**
 * @brief Collect the valid samples of the whole image
 */
[[nodiscard]] std::vector<float> collectValues(const ImageType* image, const MaskType* mask);

}  // namespace cell_threshold::services::image_utils
