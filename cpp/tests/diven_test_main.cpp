// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <cstdlib>
#include <diven/utils/logger.hpp>

using namespace diven::utils;

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  // Keep expected warnings out of the test output unless asked for
  if (std::getenv("DIVEN_LOG_LEVEL") == nullptr) {
    Logger::set_global_level(LogLevel::error);
  }
  return RUN_ALL_TESTS();
}
