#include "trellis/char-hexadecimal-converter.hpp"

#include <gtest/gtest.h>

namespace trellis {

static_assert(FromHexDigit('7') == 7);
static_assert(FromHexDigit('c') == 12);

TEST(CharHexConverter, FromHexDigitBothCases) {
  EXPECT_EQ(FromHexDigit('0'), 0);
  EXPECT_EQ(FromHexDigit('9'), 9);
  EXPECT_EQ(FromHexDigit('a'), 10);
  EXPECT_EQ(FromHexDigit('A'), 10);
  EXPECT_EQ(FromHexDigit('f'), 15);
  EXPECT_EQ(FromHexDigit('F'), 15);
}

TEST(CharHexConverter, FromHexDigitInvalid) {
  EXPECT_EQ(FromHexDigit('g'), -1);
  EXPECT_EQ(FromHexDigit('G'), -1);
  EXPECT_EQ(FromHexDigit('/'), -1);
  EXPECT_EQ(FromHexDigit(':'), -1);
  EXPECT_EQ(FromHexDigit('%'), -1);
  EXPECT_EQ(FromHexDigit('\0'), -1);
}

}  // namespace trellis
