// Tests for the pre-defined alphabet catalogue.
#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "basen/alphabets.hpp"
#include "basen/codec.hpp"
#include "basen/utf8.hpp"

namespace {

namespace alphabets = basen::alphabets;
using basen::Codec;

TEST(Alphabets, EveryNamedAlphabetBuildsACodec) {
  const std::vector<std::string> names = alphabets::names();
  ASSERT_EQ(names.size(), 10u);
  for (const std::string& name : names) {
    const std::optional<std::u32string> alphabet = alphabets::find(name);
    ASSERT_TRUE(alphabet.has_value()) << name;
    EXPECT_EQ(alphabet->back(), U'=') << name;
    EXPECT_NO_THROW(Codec codec(*alphabet)) << name;
  }
}

TEST(Alphabets, FindReturnsTheConstants) {
  EXPECT_EQ(*alphabets::find("base64"), basen::from_utf8(alphabets::kBase64));
  EXPECT_EQ(*alphabets::find("base32"), basen::from_utf8(alphabets::kBase32));
  EXPECT_EQ(*alphabets::find("base16"), basen::from_utf8(alphabets::kBase16));
  EXPECT_EQ(*alphabets::find("base4096"), alphabets::base4096());
}

TEST(Alphabets, UnknownNameIsNotFound) {
  EXPECT_FALSE(alphabets::find("base58").has_value());
  EXPECT_FALSE(alphabets::find("").has_value());
  EXPECT_FALSE(alphabets::find("BASE64").has_value());
}

TEST(Alphabets, ContiguousRanges) {
  const std::u32string base4096 = alphabets::base4096();
  ASSERT_EQ(base4096.size(), 4097u);
  EXPECT_EQ(base4096.front(), U'\u4E00');
  EXPECT_EQ(base4096[4095], U'\u5DFF');

  const std::u32string base256 = alphabets::base256();
  ASSERT_EQ(base256.size(), 257u);
  EXPECT_EQ(base256.front(), U'\u0100');
  EXPECT_EQ(base256[255], U'\u01FF');

  EXPECT_EQ(alphabets::base1024().size(), 1025u);
  EXPECT_EQ(alphabets::contiguous(U'a', 4, U'#'), U"abcd#");
}

TEST(Alphabets, Base64UrlDiffersOnlyInTheLastTwoDataSymbols) {
  const std::string_view standard = alphabets::kBase64;
  const std::string_view url = alphabets::kBase64Url;
  ASSERT_EQ(standard.size(), url.size());
  EXPECT_EQ(standard.substr(0, 62), url.substr(0, 62));
  EXPECT_EQ(url.substr(62), "-_=");

  const Codec codec(url);
  const std::vector<std::uint8_t> data = {0xFB, 0xFF};
  EXPECT_EQ(codec.encode(data), "-_8=");
}

}  // namespace
