#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "logger/logger.hpp"

int main(int argc, char** argv) {
  ::testing::InitGoogleMock(&argc, argv);
  // Keep test output readable; failures still show warnings and errors
  dnsfs::logging::init_console_logging(dnsfs::logging::severity_level::warning);
  return RUN_ALL_TESTS();
}
