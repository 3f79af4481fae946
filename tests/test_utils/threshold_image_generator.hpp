#pragma once

/// @file threshold_image_generator.hpp
/// @brief Synthetic intensity images and masks for thresholding tests
///
/// All generators are deterministic: noise uses a fixed-seed mt19937 so that
/// expected values are reproducible across platforms.

#include <cstddef>
#include <random>

#include <itkImage.h>
#include <itkImageRegionIterator.h>

namespace cell_threshold::test_utils {

using FloatImageType = itk::Image<float, 3>;
using UCharImageType = itk::Image<unsigned char, 3>;

/// Allocate an image of the given extent filled with @p fill
/// @param sizeZ Number of planes; 1 for a 2D image
template <typename TImage = FloatImageType>
typename TImage::Pointer createImage(unsigned int sizeX,
                                     unsigned int sizeY,
                                     unsigned int sizeZ = 1,
                                     typename TImage::PixelType fill = {}) {
    auto image = TImage::New();

    typename TImage::SizeType size;
    size[0] = sizeX;
    size[1] = sizeY;
    size[2] = sizeZ;

    typename TImage::IndexType start;
    start.Fill(0);

    typename TImage::RegionType region;
    region.SetSize(size);
    region.SetIndex(start);

    image->SetRegions(region);
    image->Allocate();
    image->FillBuffer(fill);

    return image;
}

/// Mask of the given extent with every pixel set to @p value
inline UCharImageType::Pointer createMask(unsigned int sizeX,
                                          unsigned int sizeY,
                                          unsigned int sizeZ = 1,
                                          unsigned char value = 1) {
    return createImage<UCharImageType>(sizeX, sizeY, sizeZ, value);
}

/// Left half (x < sizeX / 2) at @p leftValue, right half at @p rightValue
inline FloatImageType::Pointer createSplitImage(unsigned int sizeX,
                                                unsigned int sizeY,
                                                unsigned int sizeZ,
                                                float leftValue,
                                                float rightValue) {
    auto image = createImage(sizeX, sizeY, sizeZ);
    itk::ImageRegionIterator<FloatImageType> it(image, image->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        const auto idx = it.GetIndex();
        it.Set(static_cast<unsigned int>(idx[0]) < sizeX / 2 ? leftValue : rightValue);
    }
    return image;
}

/// Linear ramp along x from @p low (x = 0) to @p high (x = sizeX - 1)
inline FloatImageType::Pointer createRampImage(unsigned int sizeX,
                                               unsigned int sizeY,
                                               unsigned int sizeZ,
                                               float low,
                                               float high) {
    auto image = createImage(sizeX, sizeY, sizeZ);
    const double step = sizeX > 1 ? (high - low) / static_cast<double>(sizeX - 1) : 0.0;
    itk::ImageRegionIterator<FloatImageType> it(image, image->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        it.Set(static_cast<float>(low + step * static_cast<double>(it.GetIndex()[0])));
    }
    return image;
}

/// Square spots of @p spotValue on a background of @p background
/// @param spacing Distance between spot origins along x and y
/// @param spotSize Edge length of each spot
/// @param gradient Added per pixel along x to simulate uneven illumination
inline FloatImageType::Pointer createSpotImage(unsigned int sizeX,
                                               unsigned int sizeY,
                                               unsigned int sizeZ,
                                               unsigned int spacing,
                                               unsigned int spotSize,
                                               float background,
                                               float spotValue,
                                               float gradient = 0.0f) {
    auto image = createImage(sizeX, sizeY, sizeZ);
    itk::ImageRegionIterator<FloatImageType> it(image, image->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        const auto idx = it.GetIndex();
        const bool inSpot = (idx[0] % spacing) < spotSize && (idx[1] % spacing) < spotSize;
        const float base = inSpot ? spotValue : background;
        it.Set(base + gradient * static_cast<float>(idx[0]));
    }
    return image;
}

/// Add zero-mean Gaussian noise in place (fixed seed)
inline void addGaussianNoise(FloatImageType::Pointer image,
                             double stddev,
                             unsigned int seed = 42) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> noise(0.0, stddev);
    itk::ImageRegionIterator<FloatImageType> it(image, image->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        it.Set(static_cast<float>(it.Get() + noise(rng)));
    }
}

/// Move the region start to (x, y, z) without touching the pixel buffer;
/// the pixel formerly at (0, 0, 0) is addressed as (x, y, z) afterwards
template <typename TImage>
void moveRegionStart(const itk::SmartPointer<TImage>& image, long x, long y, long z = 0) {
    auto region = image->GetLargestPossibleRegion();
    typename TImage::IndexType start = {{x, y, z}};
    region.SetIndex(start);
    image->SetRegions(region);
}

/// Pixel value at (x, y, z)
template <typename TImage>
typename TImage::PixelType valueAt(const itk::SmartPointer<TImage>& image,
                                   long x, long y, long z = 0) {
    typename TImage::IndexType idx = {{x, y, z}};
    return image->GetPixel(idx);
}

/// Set pixel (x, y, z) to @p value
template <typename TImage>
void setValue(const itk::SmartPointer<TImage>& image,
              long x, long y, long z,
              typename TImage::PixelType value) {
    typename TImage::IndexType idx = {{x, y, z}};
    image->SetPixel(idx, value);
}

/// Count non-zero pixels
template <typename TImage>
size_t countNonZero(const itk::SmartPointer<TImage>& image) {
    size_t count = 0;
    itk::ImageRegionIterator<TImage> it(image, image->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        if (it.Get() != 0) {
            ++count;
        }
    }
    return count;
}

}  // namespace cell_threshold::test_utils
