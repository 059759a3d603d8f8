#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <string_view>

#include "urlform/url-decode.hpp"
#include "urlform/url-encode.hpp"

namespace urlform {

namespace {
std::string decodeStrict(std::string_view input) {
  std::string buf(input);
  const char* end = url::DecodeInPlace(buf.data(), buf.data() + buf.size());
  if (end == nullptr) {
    return "<invalid>";
  }
  buf.resize(static_cast<std::size_t>(end - buf.data()));
  return buf;
}
}  // namespace

TEST(UrlEncodeDecode, EncodeGeneric) {
  std::string_view input = "a b";
  std::string out(URLEncodedSize(input, IsFormUnreserved{}), '\0');
  char* end = URLEncode(input, IsFormUnreserved{}, out.data());
  EXPECT_EQ(end, out.data() + out.size());
  EXPECT_EQ(out, "a%20b");
}

TEST(UrlEncodeDecode, FormEncodeUnreservedUntouched) {
  EXPECT_EQ(url::FormEncode("AZaz09-._*"), "AZaz09-._*");
}

TEST(UrlEncodeDecode, FormEncodeSpaceAsPlus) {
  EXPECT_EQ(url::FormEncode("hello world"), "hello+world");
  EXPECT_EQ(url::FormEncode("hello world", false), "hello%20world");
}

TEST(UrlEncodeDecode, FormEncodeReserved) {
  EXPECT_EQ(url::FormEncode("a+b&c=d"), "a%2Bb%26c%3Dd");
  EXPECT_EQ(url::FormEncode("[]~/"), "%5B%5D%7E%2F");
}

TEST(UrlEncodeDecode, FormEncodeUtf8) { EXPECT_EQ(url::FormEncode("caf\xC3\xA9"), "caf%C3%A9"); }

TEST(UrlEncodeDecode, AppendFormEncodedKeepsPrefix) {
  std::string out = "key=";
  url::AppendFormEncoded(out, "a b");
  EXPECT_EQ(out, "key=a+b");
  EXPECT_EQ(url::FormEncodedSize("a b"), 3U);
  EXPECT_EQ(url::FormEncodedSize("a b", false), 5U);
}

TEST(UrlEncodeDecode, DecodeInPlaceStrict) {
  EXPECT_EQ(decodeStrict("a%20b"), "a b");
  EXPECT_EQ(decodeStrict("a+b"), "a+b");
  EXPECT_EQ(decodeStrict("%4a%4A"), "JJ");
  EXPECT_EQ(decodeStrict("%G1"), "<invalid>");
  EXPECT_EQ(decodeStrict("abc%2"), "<invalid>");
}

TEST(UrlEncodeDecode, FormDecodePlusAsSpace) {
  EXPECT_EQ(url::FormDecode("hello+world"), "hello world");
  EXPECT_EQ(url::FormDecode("a%2Bb"), "a+b");
  EXPECT_EQ(url::FormDecode("caf%C3%A9"), "caf\xC3\xA9");
  EXPECT_EQ(url::FormDecode(""), "");
}

TEST(UrlEncodeDecode, FormDecodeMalformedKeptLiterally) {
  EXPECT_EQ(url::FormDecode("100%"), "100%");
  EXPECT_EQ(url::FormDecode("%G%41"), "%GA");
  EXPECT_EQ(url::FormDecode("abc%4"), "abc%4");
  EXPECT_EQ(url::FormDecode("%zz+x"), "%zz x");
}

TEST(UrlEncodeDecode, HasMalformedEscape) {
  EXPECT_FALSE(url::HasMalformedEscape("a%20b"));
  EXPECT_FALSE(url::HasMalformedEscape("plain"));
  EXPECT_TRUE(url::HasMalformedEscape("100%"));
  EXPECT_TRUE(url::HasMalformedEscape("%2"));
  EXPECT_TRUE(url::HasMalformedEscape("%20%xy"));
}

TEST(UrlEncodeDecode, RoundTrip) {
  for (std::string_view input : {"", "simple", "with space", "a&b=c+d", "100%", "[0]", "\xE2\x82\xAC"}) {
    EXPECT_EQ(url::FormDecode(url::FormEncode(input)), input);
  }
}

}  // namespace urlform
