/**
 * @file logger_test.cpp
 * @brief Unit tests for Logger
 */

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "common/logger.hpp"

namespace smither {
namespace {

TEST(LoggerTest, SetLevelTakesEffectWithoutInit) {
    Logger::set_level(spdlog::level::off);
    EXPECT_EQ(Logger::get()->level(), spdlog::level::off);

    Logger::set_level(spdlog::level::warn);
    EXPECT_EQ(Logger::get()->level(), spdlog::level::warn);
}

TEST(LoggerTest, LaterInitKeepsLevel) {
    Logger::set_level(spdlog::level::err);
    Logger::init("smither", spdlog::level::trace);
    EXPECT_EQ(Logger::get()->level(), spdlog::level::err);
}

TEST(LoggerTest, ConcurrentFirstUseSharesOneLogger) {
    std::vector<spdlog::logger*> seen(8, nullptr);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&seen, i] {
            seen[i] = Logger::get().get();
            LOG_DEBUG("thread {} logging", i);
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (auto* logger : seen) {
        ASSERT_NE(logger, nullptr);
        EXPECT_EQ(logger, seen.front());
    }
}

}  // namespace
}  // namespace smither
