// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/subject.h"

#include <gtest/gtest.h>
#include <string>

TEST(SubjectTest, ValidSubjects) {
  EXPECT_TRUE(natsbasic::ValidateSubject("greetings", false).ok());
  EXPECT_TRUE(natsbasic::ValidateSubject("events.user.login", false).ok());
  EXPECT_TRUE(natsbasic::ValidateSubject("events.>", true).ok());
  EXPECT_TRUE(natsbasic::ValidateSubject("sensor.*.temperature", true).ok());
  EXPECT_TRUE(natsbasic::ValidateSubject("*", true).ok());
  EXPECT_TRUE(natsbasic::ValidateSubject(">", true).ok());
  EXPECT_TRUE(natsbasic::ValidateSubject("*.*.>", true).ok());
}

TEST(SubjectTest, InvalidSubjects) {
  EXPECT_TRUE(absl::IsInvalidArgument(natsbasic::ValidateSubject("", true)));
  EXPECT_FALSE(natsbasic::ValidateSubject("events..login", true).ok());
  EXPECT_FALSE(natsbasic::ValidateSubject(".events", true).ok());
  EXPECT_FALSE(natsbasic::ValidateSubject("events.", true).ok());
  EXPECT_FALSE(natsbasic::ValidateSubject("events user", true).ok());
  EXPECT_FALSE(natsbasic::ValidateSubject("events\tuser", true).ok());
  EXPECT_FALSE(natsbasic::ValidateSubject("events.>.login", true).ok());
  EXPECT_FALSE(natsbasic::ValidateSubject("events.us*r", true).ok());
  EXPECT_FALSE(natsbasic::ValidateSubject("events.>>", true).ok());
}

TEST(SubjectTest, WildcardsNotAllowed) {
  absl::Status s = natsbasic::ValidateSubject("events.>", false);
  EXPECT_TRUE(absl::IsInvalidArgument(s));
  EXPECT_FALSE(natsbasic::ValidateSubject("sensor.*.temp", false).ok());
}

TEST(SubjectTest, HasWildcard) {
  EXPECT_FALSE(natsbasic::HasWildcard("events.user.login"));
  EXPECT_TRUE(natsbasic::HasWildcard("events.>"));
  EXPECT_TRUE(natsbasic::HasWildcard("sensor.*.temperature"));
}

TEST(SubjectTest, LiteralMatch) {
  EXPECT_TRUE(natsbasic::SubjectMatches("greetings", "greetings"));
  EXPECT_FALSE(natsbasic::SubjectMatches("greetings", "greeting"));
  EXPECT_FALSE(natsbasic::SubjectMatches("a.b", "a.b.c"));
  EXPECT_FALSE(natsbasic::SubjectMatches("a.b.c", "a.b"));
}

TEST(SubjectTest, SingleTokenWildcard) {
  EXPECT_TRUE(natsbasic::SubjectMatches("sensor.*.temperature",
                                        "sensor.kitchen.temperature"));
  EXPECT_FALSE(natsbasic::SubjectMatches("sensor.*.temperature",
                                         "sensor.kitchen.humidity"));
  EXPECT_FALSE(natsbasic::SubjectMatches("sensor.*.temperature",
                                         "sensor.a.b.temperature"));
  EXPECT_TRUE(natsbasic::SubjectMatches("*", "anything"));
  EXPECT_FALSE(natsbasic::SubjectMatches("*", "two.tokens"));
}

TEST(SubjectTest, TailWildcard) {
  EXPECT_TRUE(natsbasic::SubjectMatches("events.>", "events.user.login"));
  EXPECT_TRUE(natsbasic::SubjectMatches("events.>", "events.order.created"));
  EXPECT_TRUE(natsbasic::SubjectMatches("events.>", "events.x"));
  // '>' needs at least one token.
  EXPECT_FALSE(natsbasic::SubjectMatches("events.>", "events"));
  EXPECT_FALSE(natsbasic::SubjectMatches("events.>", "other.user.login"));
  EXPECT_TRUE(natsbasic::SubjectMatches(">", "a.b.c"));
  EXPECT_TRUE(natsbasic::SubjectMatches("*.b.>", "a.b.c.d"));
  EXPECT_FALSE(natsbasic::SubjectMatches("*.b.>", "a.c.c.d"));
}
