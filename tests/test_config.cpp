#include <gtest/gtest.h>
#include <cstdlib>
#include <stdexcept>
#include "poole/config.hpp"

using namespace poole;

TEST (Config, DefaultsAreValid)
{
  Config config;
  EXPECT_EQ (config.base_url, "http://localhost");
  EXPECT_EQ (config.difficulty_bits, 16u);
  EXPECT_EQ (config.recheck_interval, 512u);
  EXPECT_EQ (config.http_timeout_seconds, 5);
  EXPECT_NO_THROW (validate_config (config));
}

TEST (Config, EnvironmentOverridesBaseUrl)
{
  Config config;
  ::setenv (constants::BASE_URL_ENV, "http://ledger.test:8080", 1);
  apply_environment (config);
  EXPECT_EQ (config.base_url, "http://ledger.test:8080");

  Config untouched;
  ::setenv (constants::BASE_URL_ENV, "", 1);
  apply_environment (untouched);
  EXPECT_EQ (untouched.base_url, "http://localhost");
  ::unsetenv (constants::BASE_URL_ENV);
}

TEST (Config, SharedOptions)
{
  Config config;
  EXPECT_TRUE (apply_option (config, "--url", "http://x"));
  EXPECT_TRUE (apply_option (config, "--difficulty", "20"));
  EXPECT_TRUE (apply_option (config, "--interval", "128"));
  EXPECT_TRUE (apply_option (config, "--timeout", "3"));
  EXPECT_FALSE (apply_option (config, "--who", "hacker"));

  EXPECT_EQ (config.base_url, "http://x");
  EXPECT_EQ (config.difficulty_bits, 20u);
  EXPECT_EQ (config.recheck_interval, 128u);
  EXPECT_EQ (config.http_timeout_seconds, 3);
}

TEST (Config, BadNumbersAreRejected)
{
  Config config;
  EXPECT_THROW (apply_option (config, "--difficulty", "abc"),
                std::invalid_argument);
  EXPECT_THROW (apply_option (config, "--interval", "12x"),
                std::invalid_argument);
  EXPECT_THROW (apply_option (config, "--interval", "-4"),
                std::invalid_argument);
}

TEST (Config, ValidationRejectsBadValues)
{
  Config config;
  config.difficulty_bits = 18;
  EXPECT_THROW (validate_config (config), std::invalid_argument);

  config = Config{};
  config.difficulty_bits = 260;
  EXPECT_THROW (validate_config (config), std::invalid_argument);

  config = Config{};
  config.recheck_interval = 0;
  EXPECT_THROW (validate_config (config), std::invalid_argument);

  config = Config{};
  config.base_url.clear ();
  EXPECT_THROW (validate_config (config), std::invalid_argument);

  config = Config{};
  config.difficulty_bits = 0;
  EXPECT_NO_THROW (validate_config (config));
}

TEST (Config, TargetCountIsStrict)
{
  EXPECT_EQ (parse_target_count ("3"), 3u);
  EXPECT_THROW (parse_target_count ("-5"), std::invalid_argument);
  EXPECT_THROW (parse_target_count ("10x"), std::invalid_argument);
  EXPECT_THROW (parse_target_count ("0"), std::invalid_argument);
  EXPECT_THROW (parse_target_count (""), std::invalid_argument);
  EXPECT_THROW (parse_target_count ("99999999999999999999999"),
                std::invalid_argument);
}

TEST (Config, ParseUnsigned)
{
  EXPECT_EQ (parse_unsigned ("--interval", "0"), 0u);
  EXPECT_EQ (parse_unsigned ("--interval", "512"), 512u);
  EXPECT_THROW (parse_unsigned ("--interval", " 5"), std::invalid_argument);
  EXPECT_THROW (parse_unsigned ("--interval", "+5"), std::invalid_argument);
}

TEST (Config, IdentityMustBeUtf8)
{
  EXPECT_NO_THROW (validate_identity ("hacker"));
  EXPECT_NO_THROW (validate_identity ("h\xc3\xa9llo"));
  EXPECT_THROW (validate_identity ("h\xe9llo"), std::invalid_argument);
  EXPECT_THROW (validate_identity (""), std::invalid_argument);
}
