#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "parser/grammar.h"
#include "parser/parser_ops.h"

using namespace grammar;

TEST(Primitives, AnyCharConsumesOne) {
  std::string text = "xy";
  auto r = any_char()(Cursor(text));
  ASSERT_TRUE(r.is_success());
  EXPECT_EQ(r.value(), 'x');
  EXPECT_EQ(r.remainder().start(), 1u);
}

TEST(Primitives, AnyCharFailsAtEnd) {
  std::string text = "";
  EXPECT_TRUE(any_char()(Cursor(text)).is_empty());
}

// a NUL inside the text is still a character
TEST(Primitives, AnyCharReadsEmbeddedNul) {
  std::string text("\0a", 2);
  auto r = any_char()(Cursor(text));
  ASSERT_TRUE(r.is_success());
  EXPECT_EQ(r.value(), '\0');
}

TEST(Primitives, ChMatchesOnlyExpected) {
  std::string text = "ab";
  EXPECT_TRUE(ch('a')(Cursor(text)).is_success());
  EXPECT_TRUE(ch('b')(Cursor(text)).is_empty());
}

TEST(Primitives, ChDoesNotMatchNulPastEnd) {
  std::string text = "";
  EXPECT_TRUE(ch('\0')(Cursor(text)).is_empty());
}

TEST(Repeat, ZeroMatchesSucceedsEmpty) {
  std::string text = "bbb";
  auto r = repeat(ch('a'))(Cursor(text));
  ASSERT_TRUE(r.is_success());
  EXPECT_TRUE(r.value().empty());
  EXPECT_EQ(r.remainder().start(), 0u);
}

TEST(Repeat, StopsAtFirstFailure) {
  std::string text = "aaab";
  auto r = repeat(ch('a'))(Cursor(text));
  ASSERT_TRUE(r.is_success());
  EXPECT_EQ(r.value().size(), 3u);
  EXPECT_EQ(r.remainder().start(), 3u);
}

TEST(Repeat, OneOrMoreFailsOnZero) {
  std::string text = "b";
  EXPECT_TRUE(repeat1(ch('a'))(Cursor(text)).is_empty());
  std::string text2 = "ab";
  auto r = repeat1(ch('a'))(Cursor(text2));
  ASSERT_TRUE(r.is_success());
  EXPECT_EQ(r.value().size(), 1u);
}

// a parser that matches without consuming must not hang repetition
TEST(Repeat, NullableParserTerminates) {
  std::string text = "abc";
  auto r = repeat(repeat(ch('z')))(Cursor(text));
  ASSERT_TRUE(r.is_success());
  EXPECT_TRUE(r.value().empty());
  EXPECT_EQ(r.remainder().start(), 0u);
}

TEST(Then, PairsBothValues) {
  std::string text = "ab!";
  auto r = then(ch('a'), ch('b'))(Cursor(text));
  ASSERT_TRUE(r.is_success());
  EXPECT_EQ(r.value().left, 'a');
  EXPECT_EQ(r.value().down, 'b');
  EXPECT_EQ(r.remainder().start(), 2u);
}

TEST(Then, FailsWhenSecondFails) {
  std::string text = "ac";
  EXPECT_TRUE(then(ch('a'), ch('b'))(Cursor(text)).is_empty());
}

TEST(Either, FirstSuccessWins) {
  std::string text = "ab";
  auto longer = build(then(ch('a'), ch('b')), [](const Chain<char, char>&) { return 2; });
  auto shorter = build(ch('a'), [](const char&) { return 1; });
  auto r = either(shorter, longer)(Cursor(text));
  ASSERT_TRUE(r.is_success());
  EXPECT_EQ(r.value(), 1);
  EXPECT_EQ(r.remainder().start(), 1u);
}

// the second alternative restarts from the original position
TEST(Either, RetriesFromOriginalPosition) {
  std::string text = "ac";
  auto ab = build(then(ch('a'), ch('b')), [](const Chain<char, char>&) { return std::string("ab"); });
  auto ac = build(then(ch('a'), ch('c')), [](const Chain<char, char>&) { return std::string("ac"); });
  auto r = either(ab, ac)(Cursor(text));
  ASSERT_TRUE(r.is_success());
  EXPECT_EQ(r.value(), "ac");
  EXPECT_TRUE(r.remainder().is_end());
}

TEST(Either, BothFail) {
  std::string text = "z";
  EXPECT_TRUE(either(ch('a'), ch('b'))(Cursor(text)).is_empty());
}

TEST(Unless, GuardBlocksParser) {
  std::string text = "%x";
  EXPECT_TRUE(unless(any_char(), ch('%'))(Cursor(text)).is_empty());
}

TEST(Unless, GuardFailureLetsParserRun) {
  std::string text = "x%";
  auto r = unless(any_char(), ch('%'))(Cursor(text));
  ASSERT_TRUE(r.is_success());
  EXPECT_EQ(r.value(), 'x');
  EXPECT_EQ(r.remainder().start(), 1u);
}

// guard consumption is never observable
TEST(Unless, GuardConsumptionIsDiscarded) {
  std::string text = "abc";
  auto guard = then(ch('x'), ch('y'));
  auto r = unless(any_char(), guard)(Cursor(text));
  ASSERT_TRUE(r.is_success());
  EXPECT_EQ(r.remainder().start(), 1u);
}

TEST(LeftDown, ProjectChain) {
  std::string text = "ab";
  auto pair = then(ch('a'), ch('b'));
  auto l = left(pair)(Cursor(text));
  auto d = down(pair)(Cursor(text));
  ASSERT_TRUE(l.is_success());
  ASSERT_TRUE(d.is_success());
  EXPECT_EQ(l.value(), 'a');
  EXPECT_EQ(d.value(), 'b');
  EXPECT_EQ(l.remainder().start(), 2u);
  EXPECT_EQ(d.remainder().start(), 2u);
}

TEST(Build, PropagatesFailure) {
  std::string text = "b";
  bool called = false;
  auto p = build(ch('a'), [&called](const char& c) {
    called = true;
    return static_cast<int>(c);
  });
  EXPECT_TRUE(p(Cursor(text)).is_empty());
  EXPECT_FALSE(called);
}

TEST(CollectToString, FoldsCharsAndStrings) {
  std::string text = "aaab";
  auto chars = collect_to_string(repeat(ch('a')))(Cursor(text));
  ASSERT_TRUE(chars.is_success());
  EXPECT_EQ(chars.value(), "aaa");

  auto word = collect_to_string(repeat1(ch('a')));
  auto words = collect_to_string(repeat(word))(Cursor(text));
  ASSERT_TRUE(words.is_success());
  EXPECT_EQ(words.value(), "aaa");
  EXPECT_EQ(words.remainder().start(), 3u);
}

// a failed sequence leaves nothing consumed for the caller's alternative
TEST(Composition, NoPartialConsumptionAfterFailedSequence) {
  std::string text = "abd";
  auto abc = build(then(then(ch('a'), ch('b')), ch('c')),
                   [](const Chain<Chain<char, char>, char>&) { return std::string("abc"); });
  auto abd = build(then(then(ch('a'), ch('b')), ch('d')),
                   [](const Chain<Chain<char, char>, char>&) { return std::string("abd"); });
  auto r = either(abc, abd)(Cursor(text));
  ASSERT_TRUE(r.is_success());
  EXPECT_EQ(r.value(), "abd");
}
