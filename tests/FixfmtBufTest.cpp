//===- FixfmtBufTest.cpp --------------------------------------------===//
//
// Copyright (C) 2024 Eightfold
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
//     limitations under the License.
//
//===----------------------------------------------------------------===//

#include <Fixfmt.hpp>
#include <gtest/gtest.h>

using namespace ffmt;

namespace {

bool isCompleteUtf8(StrView Str) {
  std::size_t Ix = 0;
  while (Ix < Str.size()) {
    const std::size_t Len = H::utf8SeqLen(Str[Ix]);
    if (Len == 0 || Ix + Len > Str.size())
      return false;
    if (H::decodeUtf8(Str.substr(Ix, Len)) == H::badCodePoint)
      return false;
    Ix += Len;
  }
  return true;
}

TEST(FixedBufTest, StartsEmpty) {
  FixedBuf<8> Buf;
  EXPECT_TRUE(Buf.isEmpty());
  EXPECT_EQ(Buf.size(), 0u);
  EXPECT_EQ(Buf.capacity(), 8u);
  EXPECT_FALSE(Buf.isTruncated());
  EXPECT_EQ(Buf.getError(), FmtError::None);
  EXPECT_EQ(Buf.str(), "");
}

TEST(FixedBufTest, AppendsWithinCapacity) {
  FixedBuf<16> Buf;
  Buf.pushBack('H');
  Buf.appendStr("ello");
  Buf.append(", world", 7);
  EXPECT_EQ(Buf.str(), "Hello, world");
  EXPECT_FALSE(Buf.isTruncated());
}

TEST(FixedBufTest, TruncatesAtCapacity) {
  FixedBuf<4> Buf;
  Buf.appendStr("hello");
  EXPECT_EQ(Buf.str(), "hell");
  EXPECT_TRUE(Buf.isFull());
  EXPECT_TRUE(Buf.isTruncated());
}

TEST(FixedBufTest, TruncationIsSticky) {
  FixedBuf<4> Buf;
  Buf.appendStr("abc");
  Buf.appendStr("\xC3\xA9");
  // The two byte sequence doesn't fit, so the last byte stays free.
  EXPECT_EQ(Buf.str(), "abc");
  EXPECT_TRUE(Buf.isTruncated());
  Buf.pushBack('d');
  EXPECT_EQ(Buf.str(), "abc");
}

TEST(FixedBufTest, NeverSplitsCodePoints) {
  // "aé€😀" is 1 + 2 + 3 + 4 bytes.
  const StrView Text = "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";
  const StrView Expected[] {
    "", "a", "a", "a\xC3\xA9", "a\xC3\xA9", "a\xC3\xA9",
    "a\xC3\xA9\xE2\x82\xAC", "a\xC3\xA9\xE2\x82\xAC",
    "a\xC3\xA9\xE2\x82\xAC", "a\xC3\xA9\xE2\x82\xAC"
  };
  FixedBuf<10> Buf;
  for (std::size_t Cap = 0; Cap < 10; ++Cap) {
    Buf.reset();
    Buf.appendStr(Text.substr(0, 10 - Cap));
    Buf.appendStr(Text.substr(10 - Cap));
    EXPECT_EQ(Buf.str(), Text) << "split at " << Cap;
  }

  FixedBuf<1> B1; B1.appendStr(Text);
  FixedBuf<2> B2; B2.appendStr(Text);
  FixedBuf<3> B3; B3.appendStr(Text);
  FixedBuf<5> B5; B5.appendStr(Text);
  FixedBuf<6> B6; B6.appendStr(Text);
  FixedBuf<9> B9; B9.appendStr(Text);
  EXPECT_EQ(B1.str(), Expected[1]);
  EXPECT_EQ(B2.str(), Expected[2]);
  EXPECT_EQ(B3.str(), Expected[3]);
  EXPECT_EQ(B5.str(), Expected[5]);
  EXPECT_EQ(B6.str(), Expected[6]);
  EXPECT_EQ(B9.str(), Expected[9]);
  for (StrView S : {B1.str(), B2.str(), B3.str(), B5.str(), B6.str(), B9.str()})
    EXPECT_TRUE(isCompleteUtf8(S));
}

TEST(FixedBufTest, AppendsEncodedChars) {
  FixedBuf<16> Buf;
  Buf.appendChar(U'a');
  Buf.appendChar(U'é');
  Buf.appendChar(U'€');
  Buf.appendChar(U'\U0001F600');
  EXPECT_EQ(Buf.str(), "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");

  Buf.reset();
  // Surrogates and out of range values are not scalars.
  Buf.appendChar(char32_t(0xD800));
  Buf.appendChar(char32_t(0x110000));
  EXPECT_EQ(Buf.str(), "\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(FixedBufTest, Fills) {
  FixedBuf<8> Buf;
  Buf.fill(3, U'*');
  Buf.fill(2, U'é');
  EXPECT_EQ(Buf.str(), "***\xC3\xA9\xC3\xA9");
  Buf.fill(5, U'-');
  EXPECT_EQ(Buf.str(), "***\xC3\xA9\xC3\xA9-");
  EXPECT_TRUE(Buf.isTruncated());

  FixedBuf<4> Wide;
  Wide.fill(3, U'é');
  EXPECT_EQ(Wide.str(), "\xC3\xA9\xC3\xA9");
  EXPECT_TRUE(Wide.isTruncated());
}

TEST(FixedBufTest, ResetClearsState) {
  FixedBuf<4> Buf;
  Buf.appendStr("too long");
  ASSERT_TRUE(Buf.isTruncated());
  Buf.reset();
  EXPECT_TRUE(Buf.isEmpty());
  EXPECT_FALSE(Buf.isTruncated());
  Buf.appendStr("ok");
  EXPECT_EQ(Buf.str(), "ok");
}

TEST(FixedBufTest, CopiesIntoOwnStorage) {
  FixedBuf<8> Buf;
  Buf.appendStr("abcdefghij");
  FixedBuf<8> Copy {Buf};
  EXPECT_EQ(Copy.str(), "abcdefgh");
  EXPECT_TRUE(Copy.isTruncated());
  EXPECT_NE(Copy.data(), Buf.data());

  Buf.reset();
  Buf.appendStr("xy");
  Copy = Buf;
  EXPECT_EQ(Copy.str(), "xy");
  EXPECT_FALSE(Copy.isTruncated());
}

TEST(FixedBufTest, ZeroCapacity) {
  FixedBuf<0> Buf;
  EXPECT_EQ(Buf.capacity(), 0u);
  Buf.appendStr("");
  EXPECT_FALSE(Buf.isTruncated());
  Buf.pushBack('x');
  EXPECT_TRUE(Buf.isTruncated());
  EXPECT_EQ(Buf.str(), "");
}

TEST(FixedBufTest, StrIsIdempotent) {
  FixedBuf<16> Buf;
  Buf.appendStr("stable");
  const StrView First = Buf.str();
  const StrView Second = Buf.str();
  EXPECT_EQ(First, Second);
  EXPECT_EQ(First.data(), Second.data());
}

TEST(FixedBufTest, WritesToFile) {
  std::FILE* File = std::tmpfile();
  ASSERT_NE(File, nullptr);
  FixedBuf<16> Buf;
  Buf.appendStr("to a file");
  Buf.writeTo(File);
  std::rewind(File);
  char Read[16] {};
  const std::size_t Len = std::fread(Read, 1, sizeof(Read), File);
  std::fclose(File);
  EXPECT_EQ(StrView(Read, Len), "to a file");
}

} // namespace
