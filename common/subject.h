// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#ifndef __COMMON_SUBJECT_H
#define __COMMON_SUBJECT_H

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace natsbasic {

// Subjects are dot separated lists of tokens, e.g. "events.user.login".
// Two tokens are wildcards when they appear on their own:
//   *  matches exactly one token:        "sensor.*.temperature"
//   >  matches one or more tokens, and must be last:  "events.>"
constexpr char kSubjectSeparator = '.';
constexpr absl::string_view kSingleTokenWildcard = "*";
constexpr absl::string_view kTailWildcard = ">";

// Checks the syntax of a subject.  Wildcards are only permitted if
// allow_wildcards is true (they are valid for subscriptions but
// not for publishing).  Returns an InvalidArgument error describing the
// problem.
absl::Status ValidateSubject(absl::string_view subject, bool allow_wildcards);

bool HasWildcard(absl::string_view subject);

// Does the literal subject match the (possibly wildcarded) pattern?
// Both are assumed to be valid.
bool SubjectMatches(absl::string_view pattern, absl::string_view subject);

} // namespace natsbasic

#endif // __COMMON_SUBJECT_H
