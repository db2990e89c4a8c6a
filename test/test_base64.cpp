#include "base64.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

TEST(Base64, Encode) {
  EXPECT_EQ(repostore::base64_encode(""), "");
  EXPECT_EQ(repostore::base64_encode("f"), "Zg==");
  EXPECT_EQ(repostore::base64_encode("fo"), "Zm8=");
  EXPECT_EQ(repostore::base64_encode("foo"), "Zm9v");
  EXPECT_EQ(repostore::base64_encode("hello"), "aGVsbG8=");
  EXPECT_EQ(repostore::base64_encode(std::string("\x00\xff\xfe", 3)), "AP/+");
}

TEST(Base64, Decode) {
  EXPECT_EQ(repostore::base64_decode(""), "");
  EXPECT_EQ(repostore::base64_decode("Zg=="), "f");
  EXPECT_EQ(repostore::base64_decode("Zm8="), "fo");
  EXPECT_EQ(repostore::base64_decode("Zm9v"), "foo");
  EXPECT_EQ(repostore::base64_decode("AP/+"), std::string("\x00\xff\xfe", 3));
}

TEST(Base64, DecodeIgnoresLineBreaks) {
  // The contents API wraps encoded content every 60 characters
  EXPECT_EQ(repostore::base64_decode("aGVs\nbG8=\n"), "hello");
  EXPECT_EQ(repostore::base64_decode(" aGVsbG8= "), "hello");
}

TEST(Base64, DecodeRejectsInvalidInput) {
  EXPECT_THROW(repostore::base64_decode("aGVsbG8"), std::invalid_argument);
  EXPECT_THROW(repostore::base64_decode("aGV*bG8="), std::invalid_argument);
  EXPECT_THROW(repostore::base64_decode("Zg==Zg=="), std::invalid_argument);
  EXPECT_THROW(repostore::base64_decode("data:text/plain;base64,aGVsbG8="), std::invalid_argument);
}
