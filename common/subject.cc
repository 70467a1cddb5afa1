// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/subject.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include <vector>

namespace natsbasic {

absl::Status ValidateSubject(absl::string_view subject, bool allow_wildcards) {
  if (subject.empty()) {
    return absl::InvalidArgumentError("Subject must not be empty");
  }
  for (char ch : subject) {
    if (absl::ascii_isspace(static_cast<unsigned char>(ch))) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Subject \"%s\" must not contain whitespace", subject));
    }
  }
  std::vector<absl::string_view> tokens =
      absl::StrSplit(subject, kSubjectSeparator);
  for (size_t i = 0; i < tokens.size(); i++) {
    absl::string_view token = tokens[i];
    if (token.empty()) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Subject \"%s\" contains an empty token", subject));
    }
    bool is_wildcard = token == kSingleTokenWildcard || token == kTailWildcard;
    if (is_wildcard && !allow_wildcards) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Subject \"%s\" must not contain wildcards", subject));
    }
    if (token == kTailWildcard && i != tokens.size() - 1) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Subject \"%s\": '>' must be the last token", subject));
    }
    if (!is_wildcard && (token.find('*') != absl::string_view::npos ||
                         token.find('>') != absl::string_view::npos)) {
      // NATS treats these as literal characters but it's almost
      // certainly a mistake.
      return absl::InvalidArgumentError(absl::StrFormat(
          "Subject \"%s\": wildcards must be whole tokens", subject));
    }
  }
  return absl::OkStatus();
}

bool HasWildcard(absl::string_view subject) {
  for (absl::string_view token : absl::StrSplit(subject, kSubjectSeparator)) {
    if (token == kSingleTokenWildcard || token == kTailWildcard) {
      return true;
    }
  }
  return false;
}

bool SubjectMatches(absl::string_view pattern, absl::string_view subject) {
  std::vector<absl::string_view> pattern_tokens =
      absl::StrSplit(pattern, kSubjectSeparator);
  std::vector<absl::string_view> subject_tokens =
      absl::StrSplit(subject, kSubjectSeparator);

  size_t i = 0;
  for (; i < pattern_tokens.size(); i++) {
    if (pattern_tokens[i] == kTailWildcard) {
      // Needs at least one more token in the subject.
      return i < subject_tokens.size();
    }
    if (i >= subject_tokens.size()) {
      return false;
    }
    if (pattern_tokens[i] == kSingleTokenWildcard) {
      continue;
    }
    if (pattern_tokens[i] != subject_tokens[i]) {
      return false;
    }
  }
  return i == subject_tokens.size();
}

} // namespace natsbasic
