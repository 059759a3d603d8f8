#include "urlform/char-hexadecimal-converter.hpp"

#include <gtest/gtest.h>

#include <string_view>

#include "urlform/blob.hpp"

namespace urlform {

TEST(CharHexadecimalConverter, LowerAndUpper) {
  char buf[2];
  EXPECT_EQ(to_lower_hex(static_cast<unsigned char>(','), buf), buf + 2);
  EXPECT_EQ(std::string_view(buf, 2), "2c");
  to_upper_hex('?', buf);
  EXPECT_EQ(std::string_view(buf, 2), "3F");
  to_upper_hex(static_cast<char>(0xE9), buf);
  EXPECT_EQ(std::string_view(buf, 2), "E9");
}

TEST(CharHexadecimalConverter, FromHexDigit) {
  EXPECT_EQ(from_hex_digit('0'), 0);
  EXPECT_EQ(from_hex_digit('a'), 10);
  EXPECT_EQ(from_hex_digit('F'), 15);
  EXPECT_EQ(from_hex_digit('g'), -1);
  EXPECT_EQ(from_hex_digit('%'), -1);
}

TEST(CharHexadecimalConverter, HexEncode) {
  EXPECT_EQ(HexEncode(MakeBlob("")), "");
  EXPECT_EQ(HexEncode(MakeBlob("\x01\xAB\xFF")), "01abff");
}

TEST(CharHexadecimalConverter, TryHexDecode) {
  EXPECT_EQ(TryHexDecode("01abFF"), MakeBlob("\x01\xAB\xFF"));
  EXPECT_EQ(TryHexDecode(""), Blob{});
  EXPECT_FALSE(TryHexDecode("abc"));
  EXPECT_FALSE(TryHexDecode("zz"));
}

}  // namespace urlform
