// tests/test_framework/test_entrypoint.h
#pragma once

#include "pll_base.hpp"
#include <gtest/gtest.h>
/**
 * @file test_entrypoint.h
 * @brief Shared main() for every test executable.
 *
 * The entry point registers LoggerEnvironment, which owns a LifecycleGuard with the
 * Logger module for the whole run. Tests can therefore log, swap sinks and flush without
 * setting up a lifecycle of their own. Tests that exercise lifecycle ordering build
 * private LifecycleManager instances instead of touching the global one.
 */

namespace plushlink::tests
{

/// Global gtest environment that keeps the Logger module alive across all tests.
class LoggerEnvironment : public ::testing::Environment
{
  public:
    void SetUp() override;
    void TearDown() override;
};

} // namespace plushlink::tests
