/**
 * @file config_test.cpp
 * @brief Tests for command-line parsing and log level handling
 */

#include <gtest/gtest.h>
#include <vector>
#include "obdsim/config.hpp"
#include "obdsim/logging.hpp"

using namespace obdsim;
using namespace std::chrono_literals;

namespace {

// argv-style view over string literals, program name first
class Args {
public:
  Args(std::initializer_list<const char*> args) : argv_{"prog"} {
    argv_.insert(argv_.end(), args.begin(), args.end());
  }
  int argc() const { return static_cast<int>(argv_.size()); }
  const char* const* argv() const { return argv_.data(); }

private:
  std::vector<const char*> argv_;
};

} // namespace

// ============================================================================
// Defaults
// ============================================================================

TEST(ConfigTest, EcuDefaults) {
  EcuConfig config;
  EXPECT_EQ(config.host, "127.0.0.1");
  EXPECT_EQ(config.port, 55555);
  EXPECT_EQ(config.bus_poll, 10ms);
  EXPECT_TRUE(config.generator.enabled);
  EXPECT_EQ(config.generator.min_period, 5000ms);
  EXPECT_EQ(config.generator.max_period, 10000ms);
  EXPECT_DOUBLE_EQ(config.generator.insert_probability, 0.7);
  EXPECT_DOUBLE_EQ(config.generator.remove_probability, 0.1);
  EXPECT_EQ(config.generator.max_active_codes, 5u);
  EXPECT_FALSE(config.seed.has_value());
}

TEST(ConfigTest, ReaderDefaults) {
  ReaderConfig config;
  EXPECT_EQ(config.timeout, 1000ms);
  EXPECT_EQ(config.poll_interval, 10ms);
  EXPECT_EQ(config.stale_after, 10000ms);
}

// ============================================================================
// ECU Arguments
// ============================================================================

TEST(ConfigTest, ParseEcuArgs) {
  Args args{"-H", "0.0.0.0", "--port", "6000", "-s", "42", "--no-generator", "-v"};
  EcuConfig config;
  auto result = parse_ecu_args(args.argc(), args.argv(), config);

  ASSERT_TRUE(result.ok) << result.error;
  EXPECT_FALSE(result.help);
  EXPECT_EQ(config.host, "0.0.0.0");
  EXPECT_EQ(config.port, 6000);
  ASSERT_TRUE(config.seed.has_value());
  EXPECT_EQ(*config.seed, 42u);
  EXPECT_FALSE(config.generator.enabled);
  EXPECT_EQ(config.log_level, logging::Level::Debug);
}

TEST(ConfigTest, EcuRejectsBadInput) {
  EcuConfig config;

  Args bad_port{"-p", "70000"};
  auto r1 = parse_ecu_args(bad_port.argc(), bad_port.argv(), config);
  EXPECT_FALSE(r1.ok);
  EXPECT_NE(r1.error.find("port"), std::string::npos);

  Args missing{"--seed"};
  EXPECT_FALSE(parse_ecu_args(missing.argc(), missing.argv(), config).ok);

  Args unknown{"--turbo"};
  EXPECT_FALSE(parse_ecu_args(unknown.argc(), unknown.argv(), config).ok);

  Args stray{"dashboard"};
  EXPECT_FALSE(parse_ecu_args(stray.argc(), stray.argv(), config).ok);

  Args bad_level{"-l", "verbose"};
  EXPECT_FALSE(parse_ecu_args(bad_level.argc(), bad_level.argv(), config).ok);
}

TEST(ConfigTest, HelpFlag) {
  Args args{"--help"};
  EcuConfig config;
  auto result = parse_ecu_args(args.argc(), args.argv(), config);
  EXPECT_TRUE(result.ok);
  EXPECT_TRUE(result.help);
  EXPECT_NE(ecu_usage("obd_ecu_simulator").find("--no-generator"), std::string::npos);
}

// ============================================================================
// Reader Arguments
// ============================================================================

TEST(ConfigTest, ParseReaderArgs) {
  Args args{"-p", "6001", "-t", "250", "--loglevel", "error", "pid", "0C"};
  ReaderConfig config;
  auto result = parse_reader_args(args.argc(), args.argv(), config);

  ASSERT_TRUE(result.ok) << result.error;
  EXPECT_EQ(config.port, 6001);
  EXPECT_EQ(config.timeout, 250ms);
  EXPECT_EQ(config.log_level, logging::Level::Error);
  ASSERT_EQ(result.positional.size(), 2u);
  EXPECT_EQ(result.positional[0], "pid");
  EXPECT_EQ(result.positional[1], "0C");
}

TEST(ConfigTest, ReaderRejectsBadTimeout) {
  ReaderConfig config;
  Args zero{"-t", "0"};
  EXPECT_FALSE(parse_reader_args(zero.argc(), zero.argv(), config).ok);
  Args text{"-t", "soon"};
  EXPECT_FALSE(parse_reader_args(text.argc(), text.argv(), config).ok);
  Args negative{"-t", "-5"};
  EXPECT_FALSE(parse_reader_args(negative.argc(), negative.argv(), config).ok);
  EXPECT_EQ(config.timeout, 1000ms);
}

// ============================================================================
// Logging
// ============================================================================

TEST(LoggingTest, ParseLevel) {
  logging::Level level = logging::Level::Info;
  EXPECT_TRUE(logging::parse_level("DEBUG", level));
  EXPECT_EQ(level, logging::Level::Debug);
  EXPECT_TRUE(logging::parse_level("warn", level));
  EXPECT_EQ(level, logging::Level::Warning);
  EXPECT_TRUE(logging::parse_level("Warning", level));
  EXPECT_EQ(level, logging::Level::Warning);
  EXPECT_TRUE(logging::parse_level("off", level));
  EXPECT_EQ(level, logging::Level::Off);

  EXPECT_FALSE(logging::parse_level("loud", level));
  EXPECT_EQ(level, logging::Level::Off);
}

TEST(LoggingTest, ThresholdFilters) {
  logging::Level saved = logging::level();

  logging::set_level(logging::Level::Warning);
  EXPECT_FALSE(logging::enabled(logging::Level::Debug));
  EXPECT_FALSE(logging::enabled(logging::Level::Info));
  EXPECT_TRUE(logging::enabled(logging::Level::Warning));
  EXPECT_TRUE(logging::enabled(logging::Level::Error));

  logging::set_level(logging::Level::Off);
  EXPECT_FALSE(logging::enabled(logging::Level::Error));

  testing::internal::CaptureStderr();
  logging::set_level(logging::Level::Info);
  logging::info("test", "hello");
  logging::debug("test", "hidden");
  std::string out = testing::internal::GetCapturedStderr();
  EXPECT_EQ(out, "INFO:test: hello\n");

  logging::set_level(saved);
}
