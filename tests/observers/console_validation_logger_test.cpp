#include <gtest/gtest.h>

#include "observers/console_validation_logger.hpp"
#include "validation/appliable_validator.hpp"

#include <ios>
#include <memory>
#include <ostream>
#include <sstream>
#include <streambuf>
#include <string>

namespace fluentcheck::observers {
namespace {

// Rejects every character written to it.
class RejectingStreamBuf : public std::streambuf {
protected:
  int_type overflow(int_type) override { return traits_type::eof(); }
};

class ConsoleValidationLoggerTest : public ::testing::Test {
protected:
  std::ostringstream out_;
  std::ostringstream err_;
  std::unique_ptr<ConsoleValidationLogger> logger_;

  void SetUp() override {
    logger_ = std::make_unique<ConsoleValidationLogger>(
        ConsoleValidationLogger::Config{.tag = "signup", .logSuccess = true},
        out_, err_);
  }
};

// --- onCheckFailed Tests ---

TEST_F(ConsoleValidationLoggerTest, OnCheckFailed_WritesCodeAndMessage) {
  logger_->onCheckFailed(
      {.checkIndex = 2, .code = "E_EMAIL", .message = "email required"});

  EXPECT_EQ(err_.str(), "[signup] check #2 failed: email required (E_EMAIL)\n");
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(ConsoleValidationLoggerTest, OnCheckFailed_OmitsSentinelCode) {
  logger_->onCheckFailed({.checkIndex = 1,
                          .code = std::string(validation::kNoErrorCode),
                          .message = "empty"});

  EXPECT_EQ(err_.str(), "[signup] check #1 failed: empty\n");
}

// --- onValidationCompleted Tests ---

TEST_F(ConsoleValidationLoggerTest, OnValidationCompleted_Failure) {
  logger_->onValidationCompleted(
      {.valid = false,
       .error = validation::ValidationError{"E_NULL", "value is null"}});

  EXPECT_EQ(err_.str(), "[signup] validation failed: value is null (E_NULL)\n");
}

TEST_F(ConsoleValidationLoggerTest, OnValidationCompleted_SuccessLogged) {
  logger_->onValidationCompleted({.valid = true, .error = std::nullopt});

  EXPECT_EQ(out_.str(), "[signup] validation passed\n");
  EXPECT_TRUE(err_.str().empty());
}

TEST_F(ConsoleValidationLoggerTest, OnValidationCompleted_SuccessSilenced) {
  ConsoleValidationLogger quiet(ConsoleValidationLogger::Config{}, out_, err_);

  quiet.onValidationCompleted({.valid = true, .error = std::nullopt});

  EXPECT_TRUE(out_.str().empty());
  EXPECT_TRUE(err_.str().empty());
}

TEST_F(ConsoleValidationLoggerTest, LogsAWholeChain) {
  validation::AppliableValidator<int, int>::create(
      -4, validation::ValidatorOptions{.observer = logger_.get()})
      .on([](int v) { return v < 0; }, "negative", "E_SIGN")
      .on([](int v) { return v % 2 == 0; }, "even")
      .onSuccess([](int v) { return v; })
      .onFailure([](int, const std::string &) { return 0; });

  EXPECT_EQ(err_.str(), "[signup] check #1 failed: negative (E_SIGN)\n"
                        "[signup] check #2 failed: even\n"
                        "[signup] validation failed: even\n");
}

TEST_F(ConsoleValidationLoggerTest, ThrowingStream_DoesNotEscapeLogger) {
  RejectingStreamBuf rejecting;
  std::ostream broken(&rejecting);
  broken.exceptions(std::ios_base::badbit);
  ConsoleValidationLogger logger(
      ConsoleValidationLogger::Config{.logSuccess = true}, broken, broken);

  EXPECT_NO_THROW(logger.onCheckFailed(
      {.checkIndex = 1, .code = "E_SIGN", .message = "negative"}));
  EXPECT_NO_THROW(
      logger.onValidationCompleted({.valid = true, .error = std::nullopt}));
}

TEST_F(ConsoleValidationLoggerTest, ThrowingStream_ChainStillReturnsResult) {
  RejectingStreamBuf rejecting;
  std::ostream broken(&rejecting);
  broken.exceptions(std::ios_base::badbit);
  ConsoleValidationLogger logger(ConsoleValidationLogger::Config{}, broken,
                                 broken);

  const int result =
      validation::AppliableValidator<int, int>::create(
          -1, validation::ValidatorOptions{.observer = &logger})
          .on([](int v) { return v < 0; }, "negative")
          .onSuccess([](int v) { return v; })
          .onFailure([](int, const std::string &) { return 7; });

  EXPECT_EQ(result, 7);
}

} // namespace
} // namespace fluentcheck::observers
