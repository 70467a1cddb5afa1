// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "cli/config.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "common/subject.h"
#include <cstdlib>

namespace natsbasic {

const char *ModeName(Mode mode) {
  switch (mode) {
  case Mode::kPublish:
    return kModePublish;
  case Mode::kSubscribe:
    return kModeSubscribe;
  }
  return "unknown";
}

absl::StatusOr<Mode> ParseMode(const std::string &s) {
  if (s == kModePublish) {
    return Mode::kPublish;
  }
  if (s == kModeSubscribe) {
    return Mode::kSubscribe;
  }
  return absl::InvalidArgumentError(
      absl::StrFormat("-mode must be \"%s\" or \"%s\", got \"%s\".",
                      kModePublish, kModeSubscribe, s));
}

void ApplyEnvironmentDefaults(RawFlags &flags) {
  if (flags.user.empty()) {
    if (const char *user = getenv(kUserEnvVar); user != nullptr) {
      flags.user = user;
    }
  }
  if (flags.password.empty()) {
    if (const char *password = getenv(kPasswordEnvVar); password != nullptr) {
      flags.password = password;
    }
  }
}

static absl::Status CheckTimeout(const char *flag, int ms) {
  if (ms <= 0) {
    return absl::InvalidArgumentError(
        absl::StrFormat("-%s must be positive, got %d.", flag, ms));
  }
  return absl::OkStatus();
}

static absl::Status CheckLogLevel(const std::string &level) {
  for (const char *name : kLogLevels) {
    if (level == name) {
      return absl::OkStatus();
    }
  }
  return absl::InvalidArgumentError(
      absl::StrFormat("Unknown log level \"%s\", must be one of %s.", level,
                      absl::StrJoin(kLogLevels, ", ")));
}

absl::StatusOr<InvocationConfig> ValidateFlags(const RawFlags &flags) {
  if (flags.mode.empty() || flags.subject.empty()) {
    return absl::InvalidArgumentError(
        "-mode and -subject flags are required.");
  }
  absl::StatusOr<Mode> mode = ParseMode(flags.mode);
  if (!mode.ok()) {
    return mode.status();
  }
  if (*mode == Mode::kPublish && flags.msg.empty()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "-msg flag is required when using -mode \"%s\".", kModePublish));
  }

  // Wildcards are only meaningful to a subscriber.
  if (absl::Status s =
          ValidateSubject(flags.subject, *mode == Mode::kSubscribe);
      !s.ok()) {
    return absl::InvalidArgumentError(absl::StrFormat("%s.", s.message()));
  }
  if (flags.url.empty()) {
    return absl::InvalidArgumentError("-url must not be empty.");
  }
  if (!flags.positional.empty()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Unexpected arguments: %s.",
                        absl::StrJoin(flags.positional, " ")));
  }
  if (absl::Status s = CheckTimeout("connect_timeout_ms",
                                    flags.connect_timeout_ms);
      !s.ok()) {
    return s;
  }
  if (absl::Status s = CheckTimeout("flush_timeout_ms", flags.flush_timeout_ms);
      !s.ok()) {
    return s;
  }
  if (absl::Status s = CheckTimeout("drain_timeout_ms", flags.drain_timeout_ms);
      !s.ok()) {
    return s;
  }

  if (absl::Status s = CheckLogLevel(flags.log_level); !s.ok()) {
    return s;
  }

  InvocationConfig config;
  config.log_level = flags.log_level;
  config.mode = *mode;
  config.subject = flags.subject;
  if (config.mode == Mode::kPublish) {
    config.payload = flags.msg;
  }
  config.connection.SetUrl(flags.url)
      .SetName(flags.name)
      .SetCredentials(flags.user, flags.password)
      .SetConnectTimeout(std::chrono::milliseconds(flags.connect_timeout_ms));
  config.flush_timeout = std::chrono::milliseconds(flags.flush_timeout_ms);
  config.drain_timeout = std::chrono::milliseconds(flags.drain_timeout_ms);
  return config;
}

} // namespace natsbasic
