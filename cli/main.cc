// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "cli/runner.h"
#include "client/nats_connection.h"
#include "common/shutdown.h"
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

ABSL_FLAG(std::string, mode, "",
          "Operating mode: \"pub\" (publish) or \"sub\" (subscribe), required");
ABSL_FLAG(std::string, subject, "",
          "NATS subject (topic) to publish or subscribe to, required");
ABSL_FLAG(std::string, msg, "",
          "Message payload to publish, required only in \"pub\" mode");
ABSL_FLAG(std::string, url, natsbasic::kDefaultUrl, "NATS server URL");
ABSL_FLAG(std::string, name, natsbasic::kDefaultConnectionName,
          "Connection name shown in the server's monitoring data");
ABSL_FLAG(std::string, user, "",
          "User name for authentication (default $NATS_USER)");
ABSL_FLAG(std::string, password, "",
          "Password for authentication (default $NATS_PASSWORD)");
ABSL_FLAG(int, connect_timeout_ms, 2000, "Connection timeout in milliseconds");
ABSL_FLAG(int, flush_timeout_ms, 10000,
          "How long to wait for the server to acknowledge a publish");
ABSL_FLAG(int, drain_timeout_ms, 30000,
          "How long to wait for in-flight messages when shutting down");
ABSL_FLAG(std::string, log_level, "info",
          "Log level (verbose, debug, info, warning, error)");

int main(int argc, char **argv) {
  absl::SetProgramUsageMessage(
      "Publish or subscribe to a NATS subject.\n"
      "Usage:\n"
      "  nats_basic -mode sub -subject <subject> [-url <url>]\n"
      "  nats_basic -mode pub -subject <subject> -msg <payload> [-url <url>]\n"
      "Subscribe subjects may contain wildcards: '*' matches one token and\n"
      "'>' matches all remaining tokens, e.g. \"events.>\".\n"
      "Try --help for the full list of flags.");
  std::vector<char *> args = absl::ParseCommandLine(argc, argv);
  signal(SIGPIPE, SIG_IGN);

  natsbasic::RawFlags flags = {
      .mode = absl::GetFlag(FLAGS_mode),
      .subject = absl::GetFlag(FLAGS_subject),
      .msg = absl::GetFlag(FLAGS_msg),
      .url = absl::GetFlag(FLAGS_url),
      .name = absl::GetFlag(FLAGS_name),
      .user = absl::GetFlag(FLAGS_user),
      .password = absl::GetFlag(FLAGS_password),
      .connect_timeout_ms = absl::GetFlag(FLAGS_connect_timeout_ms),
      .flush_timeout_ms = absl::GetFlag(FLAGS_flush_timeout_ms),
      .drain_timeout_ms = absl::GetFlag(FLAGS_drain_timeout_ms),
      .log_level = absl::GetFlag(FLAGS_log_level),
  };
  // args[0] is the program name.
  for (size_t i = 1; i < args.size(); i++) {
    flags.positional.push_back(args[i]);
  }
  natsbasic::ApplyEnvironmentDefaults(flags);

  natsbasic::ShutdownSignal shutdown;
  if (absl::Status s = shutdown.Open(); !s.ok()) {
    fprintf(stderr, "Error: %s\n", s.ToString().c_str());
    exit(1);
  }

  int exit_code = natsbasic::RunInvocation(
      flags, natsbasic::NatsConnection::Connect, shutdown);

  // Release the library's global resources.
  nats_Close();
  return exit_code;
}
