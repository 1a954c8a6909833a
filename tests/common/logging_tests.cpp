/**
 * @file logging_tests.cpp
 */
#include <gtest/gtest.h>
#include "gmlio/common/logging.hpp"

#include <thread>

using namespace gmlio;

TEST(LoggingTests, Logger_SameInstanceAcrossThreads)
{
    constexpr size_t thread_count = 8;
    std::vector<std::shared_ptr<spdlog::logger>> seen(thread_count);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < thread_count; ++i)
    {
        threads.emplace_back([&seen, i]() { seen[i] = logger(); });
    }
    for (auto& t : threads)
    {
        t.join();
    }

    ASSERT_NE(seen[0], nullptr);
    for (const auto& l : seen)
    {
        EXPECT_EQ(l, seen[0]);
    }
    EXPECT_EQ(logger(), seen[0]);
}

TEST(LoggingTests, SetLevel_KnownAndUnknownNames)
{
    set_log_level("debug");
    EXPECT_EQ(logger()->level(), spdlog::level::debug);
    set_log_level("off");
    EXPECT_EQ(logger()->level(), spdlog::level::off);
    EXPECT_THROW(set_log_level("loud"), std::invalid_argument);
    set_log_level("warn");
    EXPECT_EQ(logger()->level(), spdlog::level::warn);
}
