#include "urlform/data-strategy.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "urlform/blob.hpp"
#include "urlform/url-decode.hpp"
#include "urlform/url-encode.hpp"

namespace urlform {

TEST(DataEncodingStrategy, DefaultIsDeferred) {
  EXPECT_TRUE(DataEncodingStrategy().isDeferred());
  EXPECT_TRUE(DataDecodingStrategy().isDeferred());
  EXPECT_FALSE(DataEncodingStrategy::base64().isDeferred());
}

TEST(DataEncodingStrategy, Base64) {
  const auto strategy = DataEncodingStrategy::base64();
  EXPECT_EQ(strategy.encode(MakeBlob("hello")), "aGVsbG8=");
  EXPECT_EQ(strategy.encode(MakeBlob("")), "");
}

TEST(DataEncodingStrategy, Hex) {
  EXPECT_EQ(DataEncodingStrategy::hex().encode(MakeBlob("\x01\xAB\xff")), "01abff");
}

TEST(DataEncodingStrategy, Custom) {
  const auto strategy = DataEncodingStrategy::custom(
      [](std::span<const std::byte> data) { return "len:" + std::to_string(data.size()); });
  EXPECT_EQ(strategy.encode(MakeBlob("abc")), "len:3");
}

TEST(DataEncodingStrategy, DeferredHasNoTextForm) {
  EXPECT_THROW((void)DataEncodingStrategy::deferred().encode(MakeBlob("x")), std::logic_error);
  EXPECT_THROW((void)DataDecodingStrategy::deferred().decode("x"), std::logic_error);
}

TEST(DataEncodingStrategy, Validate) {
  EXPECT_THROW(DataEncodingStrategy::custom({}).validate(), std::invalid_argument);
  EXPECT_THROW(DataDecodingStrategy::custom({}).validate(), std::invalid_argument);
  EXPECT_NO_THROW(DataEncodingStrategy::hex().validate());
}

TEST(DataDecodingStrategy, Base64) {
  const auto strategy = DataDecodingStrategy::base64();
  EXPECT_EQ(strategy.decode("aGVsbG8="), MakeBlob("hello"));
  EXPECT_EQ(strategy.decode("aGVs bG8="), MakeBlob("hello"));
  EXPECT_EQ(strategy.decode("not base64!"), std::nullopt);
}

TEST(DataDecodingStrategy, Hex) {
  const auto strategy = DataDecodingStrategy::hex();
  EXPECT_EQ(strategy.decode("01abFF"), MakeBlob("\x01\xAB\xff"));
  EXPECT_EQ(strategy.decode("abc"), std::nullopt);
  EXPECT_EQ(strategy.decode("zz"), std::nullopt);
  EXPECT_EQ(strategy.decode(""), Blob{});
}

TEST(DataDecodingStrategy, Custom) {
  const auto strategy = DataDecodingStrategy::custom([](std::string_view value) -> std::optional<Blob> {
    if (value.starts_with("raw:")) {
      return MakeBlob(value.substr(4));
    }
    return std::nullopt;
  });
  EXPECT_EQ(strategy.decode("raw:abc"), MakeBlob("abc"));
  EXPECT_EQ(strategy.decode("abc"), std::nullopt);
}

TEST(DataStrategy, Base64SurvivesFormEncoding) {
  // '+', '/' and '=' of the base64 alphabet are reserved in form values
  const Blob data = MakeBlob("\xfb\xff\xbf?>");
  const std::string encoded = DataEncodingStrategy::base64().encode(data);
  EXPECT_NE(encoded.find_first_of("+/"), std::string::npos);
  EXPECT_EQ(DataDecodingStrategy::base64().decode(url::FormDecode(url::FormEncode(encoded))), data);
}

}  // namespace urlform
