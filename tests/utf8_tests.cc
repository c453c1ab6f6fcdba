// Tests for the UTF-8 helpers and symbol formatting.
#include <gtest/gtest.h>

#include <string>

#include "basen/errors.hpp"
#include "basen/utf8.hpp"

namespace {

using basen::from_utf8;
using basen::InvalidInput;
using basen::is_scalar_value;
using basen::to_utf8;

std::size_t MalformedOffset(const std::string& text) {
  try {
    from_utf8(text);
  } catch (const InvalidInput& ex) {
    return ex.position();
  }
  ADD_FAILURE() << "from_utf8 accepted malformed input";
  return static_cast<std::size_t>(-1);
}

TEST(Utf8, EncodesEveryLength) {
  const std::u32string text = U"a\u00E9\u20AC\U0001F600";
  const std::string bytes = "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";
  EXPECT_EQ(to_utf8(text), bytes);
  EXPECT_EQ(from_utf8(bytes), text);
}

TEST(Utf8, EmptyText) {
  EXPECT_TRUE(from_utf8("").empty());
  EXPECT_TRUE(to_utf8(U"").empty());
}

TEST(Utf8, RejectsMalformedSequences) {
  EXPECT_EQ(MalformedOffset("\x80"), 0u);
  EXPECT_EQ(MalformedOffset("a\xC3"), 1u);
  EXPECT_EQ(MalformedOffset("ab\xE2\x82"), 2u);
  EXPECT_EQ(MalformedOffset("\xC3\x28"), 0u);
  EXPECT_EQ(MalformedOffset("\xF8\x88\x80\x80\x80"), 0u);
}

TEST(Utf8, RejectsOverlongAndOutOfRange) {
  // Overlong '/'.
  EXPECT_EQ(MalformedOffset("\xC0\xAF"), 0u);
  EXPECT_EQ(MalformedOffset("\xE0\x80\xAF"), 0u);
  // UTF-16 surrogate.
  EXPECT_EQ(MalformedOffset("x\xED\xA0\x80"), 1u);
  // Past U+10FFFF.
  EXPECT_EQ(MalformedOffset("\xF4\x90\x80\x80"), 0u);
}

TEST(Utf8, ScalarValues) {
  EXPECT_TRUE(is_scalar_value(0));
  EXPECT_TRUE(is_scalar_value(0xD7FF));
  EXPECT_FALSE(is_scalar_value(0xD800));
  EXPECT_FALSE(is_scalar_value(0xDFFF));
  EXPECT_TRUE(is_scalar_value(0xE000));
  EXPECT_TRUE(is_scalar_value(0x10FFFF));
  EXPECT_FALSE(is_scalar_value(0x110000));
}

TEST(DescribeSymbol, FormatsCodePoints) {
  EXPECT_EQ(basen::describe_symbol(U'A'), "'A' (U+0041)");
  EXPECT_EQ(basen::describe_symbol(U'\n'), "(U+000A)");
  EXPECT_EQ(basen::describe_symbol(U'\u4E00'), "(U+4E00)");
  EXPECT_EQ(basen::describe_symbol(U'\U0001F600'), "(U+1F600)");
}

}  // namespace
