// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#ifndef __CLIENT_OPTIONS_H
#define __CLIENT_OPTIONS_H

#include <chrono>
#include <string>

namespace natsbasic {

constexpr char kDefaultUrl[] = "nats://127.0.0.1:4222";
constexpr char kDefaultConnectionName[] = "NATS-BASIC";

// Options when connecting to the broker.  As with the other options in this
// project you can either use the chained setters:
//   ConnectionOptions().SetUrl("nats://host:4222").SetName("me")
// or the designated initializer style:
//   {.url = "nats://host:4222", .name = "me"}
struct ConnectionOptions {
  // The broker URL.  A comma separated list of URLs is allowed, in which
  // case the client library picks one.
  ConnectionOptions &SetUrl(std::string u) {
    url = std::move(u);
    return *this;
  }

  // The connection name appears in the broker's monitoring data.
  ConnectionOptions &SetName(std::string n) {
    name = std::move(n);
    return *this;
  }

  // Credentials.  If the user is empty no credentials are sent.
  ConnectionOptions &SetCredentials(std::string u, std::string p) {
    user = std::move(u);
    password = std::move(p);
    return *this;
  }

  ConnectionOptions &SetConnectTimeout(std::chrono::milliseconds t) {
    connect_timeout = t;
    return *this;
  }

  const std::string &Url() const { return url; }
  const std::string &Name() const { return name; }
  const std::string &User() const { return user; }
  const std::string &Password() const { return password; }
  bool HasCredentials() const { return !user.empty(); }
  std::chrono::milliseconds ConnectTimeout() const { return connect_timeout; }

  std::string url = kDefaultUrl;
  std::string name = kDefaultConnectionName;
  std::string user;
  std::string password;
  std::chrono::milliseconds connect_timeout = std::chrono::seconds(2);
};

} // namespace natsbasic

#endif // __CLIENT_OPTIONS_H
