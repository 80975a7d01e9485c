#include "observability/logger.hpp"

#include <gtest/gtest.h>

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  ledger::observability::Logger::getInstance().setLogLevel(ledger::observability::LogLevel::FATAL);
  return RUN_ALL_TESTS();
}
