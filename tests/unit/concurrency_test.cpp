#include "core/logging.hpp"
#include "services/threshold/threshold_engine.hpp"

#include "../test_utils/threshold_image_generator.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <latch>
#include <string>
#include <thread>
#include <vector>

#include <itkImageRegionConstIterator.h>

namespace cell_threshold::services {
namespace {

using test_utils::addGaussianNoise;
using test_utils::createSpotImage;

bool sameBinary(const BinaryImageType::Pointer& a, const BinaryImageType::Pointer& b) {
    itk::ImageRegionConstIterator<BinaryImageType> itA(a, a->GetLargestPossibleRegion());
    itk::ImageRegionConstIterator<BinaryImageType> itB(b, b->GetLargestPossibleRegion());
    for (itA.GoToBegin(), itB.GoToBegin(); !itA.IsAtEnd(); ++itA, ++itB) {
        if (itA.Get() != itB.Get()) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// Engine Concurrency Tests
// =============================================================================

class EngineConcurrencyTest : public ::testing::Test {
protected:
    static ImageType::Pointer createVolume() {
        auto image = createSpotImage(48, 48, 6, 12, 4, 0.1f, 0.7f, 0.003f);
        addGaussianNoise(image, 0.02);
        return image;
    }

    static ThresholdParameters adaptiveParams() {
        ThresholdParameters params;
        params.strategy = ThresholdStrategy::Adaptive;
        params.source = EstimatedThreshold{EstimationMethod::Otsu, OtsuTwoClass{}};
        params.windowSize = 16;
        params.smoothingScale = 1.0;
        params.volumetric = true;
        return params;
    }
};

TEST_F(EngineConcurrencyTest, SharedEngineSharedInput) {
    constexpr int kThreadCount = 4;

    const ThresholdEngine engine{};
    const auto image = createVolume();
    const auto params = adaptiveParams();

    auto reference = engine.threshold(image, nullptr, params);
    ASSERT_TRUE(reference.has_value());

    std::latch startLatch(kThreadCount);
    std::atomic<int> matchCount{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreadCount; ++i) {
        threads.emplace_back([&] {
            startLatch.arrive_and_wait();

            auto result = engine.threshold(image, nullptr, params);
            if (result.has_value()
                && result->guideThreshold == reference->guideThreshold
                && sameBinary(result->binaryImage, reference->binaryImage)) {
                matchCount.fetch_add(1);
            }
        });
    }

    for (auto& t : threads) t.join();
    EXPECT_EQ(matchCount.load(), kThreadCount);
}

TEST_F(EngineConcurrencyTest, MixedMethodsOnSeparateInputs) {
    constexpr int kThreadCount = 4;
    const EstimationMethod methods[kThreadCount] = {
        EstimationMethod::MinimumCrossEntropy, EstimationMethod::Otsu,
        EstimationMethod::RobustBackground, EstimationMethod::Sauvola};

    std::latch startLatch(kThreadCount);
    std::atomic<int> successCount{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreadCount; ++i) {
        threads.emplace_back([&, i] {
            auto image = createVolume();
            auto params = adaptiveParams();
            params.source = EstimatedThreshold{methods[i], OtsuTwoClass{}};
            ThresholdEngine engine;

            startLatch.arrive_and_wait();

            auto result = engine.threshold(image, nullptr, params);
            if (result.has_value() && result->binaryImage) {
                successCount.fetch_add(1);
            }
        });
    }

    for (auto& t : threads) t.join();
    EXPECT_EQ(successCount.load(), kThreadCount);
}

// =============================================================================
// Logging Concurrency Tests
// =============================================================================

TEST(LoggingConcurrencyTest, ConcurrentLoggerCreation) {
    constexpr int kThreadCount = 8;

    std::latch startLatch(kThreadCount);
    std::vector<std::shared_ptr<spdlog::logger>> loggers(kThreadCount);

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreadCount; ++i) {
        threads.emplace_back([&, i] {
            startLatch.arrive_and_wait();
            loggers[i] = logging::LoggerFactory::create("ConcurrencyTestLogger");
        });
    }

    for (auto& t : threads) t.join();
    for (const auto& logger : loggers) {
        ASSERT_NE(logger, nullptr);
        EXPECT_EQ(logger.get(), loggers.front().get());
    }
}

}  // namespace
}  // namespace cell_threshold::services
