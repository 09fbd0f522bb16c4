/**
 * @file test_scope_guard.cpp
 * @brief Unit tests for ScopeGuard / make_scope_guard.
 */
#include "utils/scope_guard.hpp"
#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>

using plushlink::basics::make_scope_guard;

TEST(ScopeGuardTest, RunsOnScopeExit)
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&]() noexcept { ++calls; });
        EXPECT_EQ(calls, 0);
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, DismissPreventsExecution)
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&]() noexcept { ++calls; });
        guard.dismiss();
        EXPECT_FALSE(static_cast<bool>(guard));
    }
    EXPECT_EQ(calls, 0);
}

TEST(ScopeGuardTest, InvokeRunsOnce)
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&]() noexcept { ++calls; });
        guard.invoke();
        guard.invoke();
        EXPECT_EQ(calls, 1);
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, MoveTransfersOwnership)
{
    int calls = 0;
    {
        auto a = make_scope_guard([&]() noexcept { ++calls; });
        auto b = std::move(a);
        EXPECT_FALSE(static_cast<bool>(a));
        EXPECT_TRUE(static_cast<bool>(b));
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, RunsDuringStackUnwinding)
{
    int calls = 0;
    try
    {
        auto guard = make_scope_guard([&]() noexcept { ++calls; });
        throw std::runtime_error("unwind");
    }
    catch (const std::runtime_error &)
    {
    }
    EXPECT_EQ(calls, 1);
}
