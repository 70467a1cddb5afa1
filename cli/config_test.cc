// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "cli/config.h"
#include <cstdlib>
#include <gtest/gtest.h>

using Mode = natsbasic::Mode;
using RawFlags = natsbasic::RawFlags;
using InvocationConfig = natsbasic::InvocationConfig;

static RawFlags PubFlags() {
  RawFlags flags;
  flags.mode = "pub";
  flags.subject = "greetings";
  flags.msg = "Hello NATS World!";
  return flags;
}

static RawFlags SubFlags() {
  RawFlags flags;
  flags.mode = "sub";
  flags.subject = "events.>";
  return flags;
}

TEST(ConfigTest, ParseMode) {
  absl::StatusOr<Mode> mode = natsbasic::ParseMode("pub");
  ASSERT_TRUE(mode.ok());
  EXPECT_EQ(Mode::kPublish, *mode);
  mode = natsbasic::ParseMode("sub");
  ASSERT_TRUE(mode.ok());
  EXPECT_EQ(Mode::kSubscribe, *mode);
  mode = natsbasic::ParseMode("PUB");
  EXPECT_TRUE(absl::IsInvalidArgument(mode.status()));
}

TEST(ConfigTest, ValidPublish) {
  absl::StatusOr<InvocationConfig> config = natsbasic::ValidateFlags(PubFlags());
  ASSERT_TRUE(config.ok()) << config.status();
  EXPECT_EQ(Mode::kPublish, config->mode);
  EXPECT_EQ("greetings", config->subject);
  EXPECT_EQ("Hello NATS World!", config->payload);
  EXPECT_EQ("nats://127.0.0.1:4222", config->Url());
  EXPECT_EQ("NATS-BASIC", config->connection.Name());
  EXPECT_FALSE(config->connection.HasCredentials());
  EXPECT_EQ(std::chrono::milliseconds(10000), config->flush_timeout);
}

TEST(ConfigTest, ValidSubscribe) {
  RawFlags flags = SubFlags();
  flags.url = "nats://broker.example.com:4222";
  flags.msg = "ignored";
  absl::StatusOr<InvocationConfig> config = natsbasic::ValidateFlags(flags);
  ASSERT_TRUE(config.ok()) << config.status();
  EXPECT_EQ(Mode::kSubscribe, config->mode);
  EXPECT_EQ("events.>", config->subject);
  EXPECT_TRUE(config->payload.empty());
  EXPECT_EQ("nats://broker.example.com:4222", config->Url());
}

TEST(ConfigTest, MissingMode) {
  RawFlags flags = PubFlags();
  flags.mode = "";
  absl::StatusOr<InvocationConfig> config = natsbasic::ValidateFlags(flags);
  ASSERT_TRUE(absl::IsInvalidArgument(config.status()));
  EXPECT_EQ("-mode and -subject flags are required.",
            config.status().message());
}

TEST(ConfigTest, MissingSubject) {
  RawFlags flags = SubFlags();
  flags.subject = "";
  absl::StatusOr<InvocationConfig> config = natsbasic::ValidateFlags(flags);
  ASSERT_TRUE(absl::IsInvalidArgument(config.status()));
  EXPECT_EQ("-mode and -subject flags are required.",
            config.status().message());
}

TEST(ConfigTest, UnknownMode) {
  RawFlags flags = PubFlags();
  flags.mode = "request";
  absl::StatusOr<InvocationConfig> config = natsbasic::ValidateFlags(flags);
  ASSERT_TRUE(absl::IsInvalidArgument(config.status()));
  EXPECT_EQ("-mode must be \"pub\" or \"sub\", got \"request\".",
            config.status().message());
}

TEST(ConfigTest, PublishNeedsMessage) {
  RawFlags flags = PubFlags();
  flags.msg = "";
  absl::StatusOr<InvocationConfig> config = natsbasic::ValidateFlags(flags);
  ASSERT_TRUE(absl::IsInvalidArgument(config.status()));
  EXPECT_EQ("-msg flag is required when using -mode \"pub\".",
            config.status().message());
}

TEST(ConfigTest, PublishToWildcardRejected) {
  RawFlags flags = PubFlags();
  flags.subject = "events.>";
  EXPECT_TRUE(
      absl::IsInvalidArgument(natsbasic::ValidateFlags(flags).status()));
}

TEST(ConfigTest, BadSubjectSyntax) {
  RawFlags flags = SubFlags();
  flags.subject = "events..>";
  EXPECT_TRUE(
      absl::IsInvalidArgument(natsbasic::ValidateFlags(flags).status()));
}

TEST(ConfigTest, EmptyUrl) {
  RawFlags flags = SubFlags();
  flags.url = "";
  EXPECT_TRUE(
      absl::IsInvalidArgument(natsbasic::ValidateFlags(flags).status()));
}

TEST(ConfigTest, PositionalArgumentsRejected) {
  RawFlags flags = SubFlags();
  flags.positional = {"extra"};
  absl::StatusOr<InvocationConfig> config = natsbasic::ValidateFlags(flags);
  ASSERT_TRUE(absl::IsInvalidArgument(config.status()));
  EXPECT_EQ("Unexpected arguments: extra.", config.status().message());
}

TEST(ConfigTest, TimeoutsMustBePositive) {
  RawFlags flags = PubFlags();
  flags.flush_timeout_ms = 0;
  EXPECT_TRUE(
      absl::IsInvalidArgument(natsbasic::ValidateFlags(flags).status()));
  flags = SubFlags();
  flags.drain_timeout_ms = -5;
  EXPECT_TRUE(
      absl::IsInvalidArgument(natsbasic::ValidateFlags(flags).status()));
  flags = SubFlags();
  flags.connect_timeout_ms = 0;
  EXPECT_TRUE(
      absl::IsInvalidArgument(natsbasic::ValidateFlags(flags).status()));
}

TEST(ConfigTest, BadLogLevel) {
  RawFlags flags = SubFlags();
  flags.log_level = "chatty";
  absl::StatusOr<InvocationConfig> config = natsbasic::ValidateFlags(flags);
  ASSERT_TRUE(absl::IsInvalidArgument(config.status()));
  EXPECT_EQ("Unknown log level \"chatty\", must be one of verbose, debug, "
            "info, warning, error.",
            config.status().message());
}

TEST(ConfigTest, LogLevel) {
  RawFlags flags = PubFlags();
  absl::StatusOr<InvocationConfig> config = natsbasic::ValidateFlags(flags);
  ASSERT_TRUE(config.ok());
  EXPECT_EQ("info", config->log_level);
  flags.log_level = "debug";
  config = natsbasic::ValidateFlags(flags);
  ASSERT_TRUE(config.ok());
  EXPECT_EQ("debug", config->log_level);
}

TEST(ConfigTest, Credentials) {
  RawFlags flags = SubFlags();
  flags.user = "alice";
  flags.password = "secret";
  absl::StatusOr<InvocationConfig> config = natsbasic::ValidateFlags(flags);
  ASSERT_TRUE(config.ok());
  EXPECT_TRUE(config->connection.HasCredentials());
  EXPECT_EQ("alice", config->connection.User());
  EXPECT_EQ("secret", config->connection.Password());
}

TEST(ConfigTest, CredentialsFromEnvironment) {
  setenv(natsbasic::kUserEnvVar, "envuser", 1);
  setenv(natsbasic::kPasswordEnvVar, "envpass", 1);

  RawFlags flags = SubFlags();
  natsbasic::ApplyEnvironmentDefaults(flags);
  EXPECT_EQ("envuser", flags.user);
  EXPECT_EQ("envpass", flags.password);

  // Flags take precedence over the environment.
  RawFlags explicit_flags = SubFlags();
  explicit_flags.user = "flaguser";
  explicit_flags.password = "flagpass";
  natsbasic::ApplyEnvironmentDefaults(explicit_flags);
  EXPECT_EQ("flaguser", explicit_flags.user);
  EXPECT_EQ("flagpass", explicit_flags.password);

  unsetenv(natsbasic::kUserEnvVar);
  unsetenv(natsbasic::kPasswordEnvVar);
}
