// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <string>

namespace natsbasic {

// A message delivered to a subscription.  The payload is an opaque byte
// sequence; it may contain NUL bytes and is never reinterpreted.
// The subject is the literal subject the message was published to, not the
// subscription pattern that matched it.  The reply subject is empty
// unless the publisher asked for a reply.
struct Message {
  std::string subject;
  std::string reply;
  std::string payload;
};

} // namespace natsbasic
