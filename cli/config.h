// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#ifndef __CLI_CONFIG_H
#define __CLI_CONFIG_H

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "client/options.h"
#include <chrono>
#include <string>
#include <vector>

namespace natsbasic {

enum class Mode {
  kPublish,
  kSubscribe,
};

constexpr char kModePublish[] = "pub";
constexpr char kModeSubscribe[] = "sub";

// Environment variables holding the credentials.  These are the names
// written to the .env file by the password provisioning script.
constexpr char kUserEnvVar[] = "NATS_USER";
constexpr char kPasswordEnvVar[] = "NATS_PASSWORD";

// The names accepted by -log_level.
constexpr const char *kLogLevels[] = {"verbose", "debug", "info", "warning",
                                      "error"};

const char *ModeName(Mode mode);
absl::StatusOr<Mode> ParseMode(const std::string &s);

// The flag values as given on the command line, before any validation.
struct RawFlags {
  std::string mode;
  std::string subject;
  std::string msg;
  std::string url = kDefaultUrl;
  std::string name = kDefaultConnectionName;
  std::string user;
  std::string password;
  int connect_timeout_ms = 2000;
  int flush_timeout_ms = 10000;
  int drain_timeout_ms = 30000;
  std::string log_level = "info";

  // Command line arguments that are not flags.
  std::vector<std::string> positional;
};

// A validated invocation.  Never modified once built.
struct InvocationConfig {
  Mode mode = Mode::kSubscribe;
  std::string subject;
  std::string payload; // Only for Mode::kPublish.
  ConnectionOptions connection;
  std::chrono::milliseconds flush_timeout{10000};
  std::chrono::milliseconds drain_timeout{30000};
  // One of kLogLevels.
  std::string log_level = "info";

  const std::string &Url() const { return connection.Url(); }
};

// Fill in the user and password from the environment if they were not
// given as flags.
void ApplyEnvironmentDefaults(RawFlags &flags);

// Validate the raw flags.  All failures are InvalidArgument errors whose
// message is suitable for showing to the user.
absl::StatusOr<InvocationConfig> ValidateFlags(const RawFlags &flags);

} // namespace natsbasic

#endif // __CLI_CONFIG_H
