//===- Fixfmt.cpp ---------------------------------------------------===//
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

#include "Fixfmt.hpp"
#include <algorithm>
#include <atomic>
#include <bit>
#include <cstring>

#if defined(NDEBUG) && FIXFMT_FORCE_ASSERT
# undef NDEBUG
# include <cassert>
# define NDEBUG 1
#endif

#undef dbgassert
#undef dbgreport
#if FIXFMT_STDERR_ASSERT
# define dbgassert(...) (void) \
  (FIXFMT_LIKELY(bool(__VA_ARGS__)) \
    ? (void(0)) : ::ffmt::dbgprintf(__func__, __LINE__, #__VA_ARGS__))
# define dbgreport(Msg) ::ffmt::dbgprintf(__func__, __LINE__, Msg)
#else
# define dbgassert(...) assert(__VA_ARGS__)
# define dbgreport(Msg) (void(0))
#endif

using namespace ffmt;
using namespace ffmt::H;

//======================================================================//
// Utilities
//======================================================================//

namespace ffmt {
  static std::atomic<bool> usesColor {false};
  static bool getColorMode() {
    return usesColor.load();
  }
  bool setColorMode(bool Value) {
    return usesColor.exchange(Value);
  }

  [[maybe_unused]] static void
   dbgprintf(const char* Function, unsigned Line, const char* Str) {
    const bool UseColors = ffmt::getColorMode();
    const char* Red   = UseColors ? "\033[0;31m" : "";
    const char* BRed  = UseColors ? "\033[0;91m" : "";
    const char* Reset = UseColors ? "\033[0m" : "";
    (void) std::fprintf(stderr,
      "%sIn %s:%u:\n%s  %s\n%s",
        Red, Function, Line,
        BRed, Str,
        Reset);
  }

  static inline int intLog2(std::uint64_t V) {
    return int(std::bit_width(V | 1)) - 1;
  }

  const char* getErrorName(FmtError Err) {
    switch (Err) {
     case FmtError::None:                  return "None";
     case FmtError::InvalidSpec:           return "InvalidSpec";
     case FmtError::ArgumentCountMismatch: return "ArgumentCountMismatch";
     default:                              return "Unknown";
    }
  }
} // namespace ffmt

std::size_t H::encodeUtf8(char32_t C, char(&Out)[4]) {
  if ((C >= 0xD800 && C <= 0xDFFF) || C > 0x10FFFF)
    C = replacementChar;
  if (C < 0x80) {
    Out[0] = char(C);
    return 1;
  } else if (C < 0x800) {
    Out[0] = char(0xC0 | (C >> 6));
    Out[1] = char(0x80 | (C & 0x3F));
    return 2;
  } else if (C < 0x10000) {
    Out[0] = char(0xE0 | (C >> 12));
    Out[1] = char(0x80 | ((C >> 6) & 0x3F));
    Out[2] = char(0x80 | (C & 0x3F));
    return 3;
  }
  Out[0] = char(0xF0 | (C >> 18));
  Out[1] = char(0x80 | ((C >> 12) & 0x3F));
  Out[2] = char(0x80 | ((C >> 6) & 0x3F));
  Out[3] = char(0x80 | (C & 0x3F));
  return 4;
}

void H::formatStringError(const char* Message) {
  dbgreport(Message);
  (void) Message;
}

//======================================================================//
// FixedBufBase
//======================================================================//

void FixedBufBase::append(const char* Begin, const char* End) {
  if FIXFMT_UNLIKELY(this->Truncated)
    return;
  const size_type Total = (End - Begin);
  if (Total == 0)
    return;
  size_type Len = Total;
  const size_type Room = this->Capacity - this->Size;
  if FIXFMT_UNLIKELY(Total > Room) {
    Len = Room;
    // Back off to the lead byte of the code point being cut.
    while (Len > 0 && isUtf8Cont(Begin[Len]))
      --Len;
    this->Truncated = true;
  }
  if (Len == 0)
    return;
  std::memcpy(this->end(), Begin, Len);
  this->Size += Len;
}

void FixedBufBase::appendChar(char32_t C) {
  char Encoded[4];
  const size_type Len = encodeUtf8(C, Encoded);
  this->append(Encoded, Encoded + Len);
}

void FixedBufBase::fill(size_type Count, char32_t Fill) {
  if (Count == 0 || this->Truncated)
    return;
  char Encoded[4];
  const size_type Len = encodeUtf8(Fill, Encoded);
  if FIXFMT_LIKELY(Len == 1) {
    const size_type Room = this->Capacity - this->Size;
    const size_type Total = std::min(Count, Room);
    if (Total != 0)
      std::memset(this->end(), Encoded[0], Total);
    this->Size += Total;
    this->Truncated = (Count > Room);
    return;
  }
  for (size_type Ix = 0; Ix < Count && !this->Truncated; ++Ix)
    this->append(Encoded, Encoded + Len);
}

void FixedBufBase::writeTo(std::FILE* File) const {
  if (const char* Ptr = this->data(); FIXFMT_LIKELY(Ptr && size()))
    (void) std::fwrite(Ptr, 1, this->size(), File);
}

void FixedBufBase::copyFrom(const FixedBufBase& Other) {
  dbgassert(Other.size() <= this->capacity() && "Buffer too small!");
  this->Size = std::min(Other.size(), this->capacity());
  if (this->Size != 0)
    std::memcpy(this->Data, Other.data(), this->Size);
  this->Truncated = Other.Truncated;
  this->Err = Other.Err;
}

//======================================================================//
// FmtValue
//======================================================================//

long long FmtValue::getInt() const {
  switch (this->Type) {
    case SignedType:   return Value.Signed;
    case UnsignedType: return static_cast<long long>(Value.Unsigned);
    default:           return 0;
  }
}

unsigned long long FmtValue::getUInt() const {
  switch (this->Type) {
    case UnsignedType: return Value.Unsigned;
    case SignedType:   return static_cast<unsigned long long>(Value.Signed);
    default:           return 0;
  }
}

double FmtValue::getFloat() const {
  if FIXFMT_UNLIKELY(!this->isFloatType())
    return 0.0;
  return Value.Float;
}

char32_t FmtValue::getChar() const {
  if FIXFMT_UNLIKELY(!this->isCharType())
    return U'\0';
  return Value.Char;
}

StrView FmtValue::getStr() const {
  if FIXFMT_UNLIKELY(!this->isStrType())
    return StrView();
  return StrView(Value.Str.Ptr, Value.Str.Len);
}

const char* FmtValue::getTypeName() const {
  switch (this->Type) {
   case CharType:     return "Char";
   case SignedType:   return "Signed";
   case UnsignedType: return "Unsigned";
   case FloatType:    return "Float";
   case DoubleType:   return "Double";
   case StrType:      return "Str";
   default:           return "Unknown";
  }
}

//======================================================================//
// Integers
//======================================================================//

namespace {

namespace HH {
  template <bool>
  struct TestType { using type = void; };

  template <>
  struct TestType<false> {};

  template <bool B>
  using MetaVoidV = std::void_t<typename TestType<B>::type>;

  template <std::size_t N>
  static constexpr bool isValidPow2 = (N > 1) && !(N & (N - 1));
} // namespace HH

template <std::size_t Base>
struct BaseTraits {
  static_assert(Base == 2 || Base == 8 || Base == 10 || Base == 16,
    "Unsupported base!");
  static constexpr std::size_t shiftCount = std::bit_width(Base) - 1;

  /// Digits needed for the largest 64-bit value.
  static constexpr std::size_t maxDigits =
    HH::isValidPow2<Base> ? (63 / shiftCount) + 1 : 20;
};

/// @brief An integer formatting utility class.
/// @tparam Base The radix base of the type.
template <std::size_t Base, typename = void>
class IntFormat;

/// @brief Specialization for powers of 2.
/// @tparam Base The radix base of the type.
template <std::size_t Base>
class IntFormat<Base, HH::MetaVoidV<HH::isValidPow2<Base>>> {
  using BT = BaseTraits<Base>;
public:
  static inline int Count(std::uint64_t V) {
    return (intLog2(V) / int(BT::shiftCount)) + 1;
  }

  /// Writes the digits of `V` so they end at `End`.
  /// @return The position of the first digit.
  static inline char* Format(char* End,
   std::uint64_t V, bool Upper = false) {
    const char* Digits = Upper
      ? "0123456789ABCDEF"
      : "0123456789abcdef";
    char* Out = End;
    do {
      constexpr std::uint64_t Mask =
        ((1ULL << BT::shiftCount) - 1ULL);
      // Mask off the lower bits of the value.
      *(--Out) = Digits[unsigned(V & Mask)];
    } while((V >>= BT::shiftCount) != 0U);
    return Out;
  }

  static inline void Write(FixedBufBase& Buf,
   std::uint64_t V, bool Upper = false) {
    char LocalBuf[BT::maxDigits];
    char* End = (LocalBuf + BT::maxDigits);
    Buf.append(Format(End, V, Upper), End);
  }
};

/// @brief Explicit specialization for base 10.
template <> class IntFormat<10> {
  using BT = BaseTraits<10>;
protected:
  static constexpr const char* DigitsGroup(std::size_t Value) {
    return
      &"0001020304050607080910111213141516171819"
       "2021222324252627282930313233343536373839"
       "4041424344454647484950515253545556575859"
       "6061626364656667686970717273747576777879"
       "8081828384858687888990919293949596979899"[Value * 2];
  }

  static inline void WriteDigitsGroup(char*& Out, std::uint64_t& V) {
    const auto Str = DigitsGroup(V % 100);
    Out -= 2;
    Out[0] = Str[0];
    Out[1] = Str[1];
    V /= 100;
  }

public:
  static inline int Count(std::uint64_t V) {
    static constexpr std::uint8_t LogTable[] {
      1, 1, 1, 2, 2, 2, 3, 3, 3, 4, 4, 4, 4,
      5, 5, 5, 6, 6, 6, 7, 7, 7, 7, 8, 8, 8, 9, 9, 9,
      10, 10, 10, 10, 11, 11, 11, 12, 12, 12,
      13, 13, 13, 13, 14, 14, 14, 15, 15, 15, 16, 16, 16, 16,
      17, 17, 17, 18, 18, 18, 19, 19, 19, 19, 20
    };
    static constexpr std::uint64_t ZeroOrPow10[] {
      0, 0, 10,
      100, 1000,
      10000, 100000,
      1000000, 10000000,
      100000000, 1000000000,
      10000000000, 100000000000,
      1000000000000, 10000000000000,
      100000000000000, 1000000000000000,
      10000000000000000, 100000000000000000,
      1000000000000000000, 10000000000000000000ULL
    };
    const int Out = LogTable[intLog2(V)];
    return Out - (V < ZeroOrPow10[Out]);
  }

  static inline char* Format(char* End,
   std::uint64_t V, [[maybe_unused]] bool Upper = false) {
    char* Out = End;
    // Loop in groups of 100.
    while (V >= 100)
      WriteDigitsGroup(Out, V);
    // If only one digit remains, write that and return.
    if (V < 10) {
      *(--Out) = char('0' + V);
      return Out;
    }
    WriteDigitsGroup(Out, V);
    return Out;
  }

  static inline void Write(FixedBufBase& Buf,
   std::uint64_t V, bool Upper = false) {
    char LocalBuf[BT::maxDigits];
    char* End = (LocalBuf + BT::maxDigits);
    Buf.append(Format(End, V, Upper), End);
  }
};

template <typename F>
static inline auto radixDispatch(RadixType Radix, F&& Func) {
  switch (Radix) {
   case RadixType::Bin:      return Func(IntFormat<2>{});
   case RadixType::Oct:      return Func(IntFormat<8>{});
   case RadixType::Hex:
   case RadixType::HexUpper: return Func(IntFormat<16>{});
   default:                  return Func(IntFormat<10>{});
  }
}

} // namespace `anonymous`

//======================================================================//
// Floats
//======================================================================//

namespace {

/// A fixed capacity unsigned integer. Large enough for any finite
/// double scaled to an integer, with room for one more decimal digit.
class BigUInt {
  static constexpr std::size_t maxWords = 36;
public:
  explicit BigUInt(std::uint64_t V) {
    Words[0] = std::uint32_t(V);
    Words[1] = std::uint32_t(V >> 32);
    Count = Words[1] ? 2 : (Words[0] ? 1 : 0);
  }

public:
  bool isZero() const { return Count == 0; }

  void shiftLeft(std::size_t Bits) {
    if (this->isZero())
      return;
    const std::size_t WordShift = Bits / 32;
    const unsigned BitShift = unsigned(Bits % 32);
    dbgassert(Count + WordShift < maxWords && "BigUInt overflow!");
    std::uint32_t Out[maxWords] {};
    for (std::size_t Ix = 0; Ix < Count; ++Ix) {
      const std::uint64_t W = std::uint64_t(Words[Ix]) << BitShift;
      Out[Ix + WordShift]     |= std::uint32_t(W);
      Out[Ix + WordShift + 1] |= std::uint32_t(W >> 32);
    }
    std::memcpy(Words, Out, sizeof(Words));
    Count += WordShift + 1;
    this->trim();
  }

  void mulSmall(std::uint32_t M) {
    std::uint64_t Carry = 0;
    for (std::size_t Ix = 0; Ix < Count; ++Ix) {
      const std::uint64_t P = std::uint64_t(Words[Ix]) * M + Carry;
      Words[Ix] = std::uint32_t(P);
      Carry = P >> 32;
    }
    if (Carry != 0) {
      dbgassert(Count < maxWords && "BigUInt overflow!");
      Words[Count++] = std::uint32_t(Carry);
    }
  }

  /// Divides in place.
  /// @return The remainder.
  std::uint32_t divSmall(std::uint32_t D) {
    std::uint64_t Rem = 0;
    for (std::size_t Ix = Count; Ix-- > 0;) {
      const std::uint64_t Cur = (Rem << 32) | Words[Ix];
      Words[Ix] = std::uint32_t(Cur / D);
      Rem = Cur % D;
    }
    this->trim();
    return std::uint32_t(Rem);
  }

  bool testBit(std::size_t Bit) const {
    const std::size_t WordIx = Bit / 32;
    if (WordIx >= Count)
      return false;
    return ((Words[WordIx] >> (Bit % 32)) & 1U) != 0;
  }

  bool anyBitsBelow(std::size_t Bit) const {
    const std::size_t WordIx = Bit / 32;
    for (std::size_t Ix = 0; Ix < WordIx && Ix < Count; ++Ix) {
      if (Words[Ix] != 0)
        return true;
    }
    if (WordIx >= Count)
      return false;
    const std::uint32_t Mask = (std::uint32_t(1) << (Bit % 32)) - 1U;
    return (Words[WordIx] & Mask) != 0;
  }

  /// Removes every bit at or above `Bit`.
  /// @return The removed bits, shifted down. Must fit in 32 bits.
  std::uint32_t takeBitsFrom(std::size_t Bit) {
    const std::size_t WordIx = Bit / 32;
    const unsigned BitIx = unsigned(Bit % 32);
    if (WordIx >= Count)
      return 0;
    std::uint64_t High = Words[WordIx] >> BitIx;
    if (WordIx + 1 < Count)
      High |= std::uint64_t(Words[WordIx + 1]) << (32 - BitIx);
    dbgassert(WordIx + 2 >= Count && "Taken bits don't fit!");
    Words[WordIx] &= (std::uint32_t(1) << BitIx) - 1U;
    for (std::size_t Ix = WordIx + 1; Ix < Count; ++Ix)
      Words[Ix] = 0;
    Count = WordIx + 1;
    this->trim();
    return std::uint32_t(High);
  }

private:
  void trim() {
    while (Count > 0 && Words[Count - 1] == 0)
      --Count;
  }

private:
  std::uint32_t Words[maxWords] {};
  std::size_t Count = 0;
};

/// The fraction `Bits / 2^Scale`, for `Scale <= 60`.
struct SmallFraction {
  SmallFraction(std::uint64_t Bits, unsigned Scale) :
   Bits(Bits), Scale(Scale) {}
public:
  bool isZero() const { return Bits == 0; }

  unsigned nextDigit() {
    Bits *= 10;
    const auto Digit = unsigned(Bits >> Scale);
    Bits &= (std::uint64_t(1) << Scale) - 1U;
    return Digit;
  }

  /// Compares the remaining fraction with one half.
  int compareHalf() const {
    const std::uint64_t Half = std::uint64_t(1) << (Scale - 1);
    return (Bits < Half) ? -1 : int(Bits > Half);
  }

public:
  std::uint64_t Bits;
  unsigned Scale;
};

/// The fraction `Bits / 2^Scale`, for scales above 60.
struct BigFraction {
  BigFraction(std::uint64_t Bits, unsigned Scale) :
   Bits(Bits), Scale(Scale) {}
public:
  bool isZero() const { return Bits.isZero(); }

  unsigned nextDigit() {
    Bits.mulSmall(10);
    return Bits.takeBitsFrom(Scale);
  }

  int compareHalf() const {
    if (!Bits.testBit(Scale - 1))
      return -1;
    return Bits.anyBitsBelow(Scale - 1) ? 1 : 0;
  }

public:
  BigUInt Bits;
  unsigned Scale;
};

struct FractionScan {
  static constexpr std::size_t npos = ~std::size_t(0);
public:
  bool RoundUp = false;
  /// Index of the last retained digit that isn't 9. A carry
  /// from rounding stops there; `npos` sends it to the integer part.
  std::size_t LastNonNine = npos;
};

/// First pass over the fractional digits. Decides rounding
/// (half to even on the exact binary value) without storing digits.
template <typename Frac>
static FractionScan scanFraction(Frac F,
 std::size_t Precision, std::uint64_t IntPart) {
  FractionScan Out;
  unsigned Last = unsigned(IntPart % 10);
  for (std::size_t Ix = 0; Ix < Precision; ++Ix) {
    // Every remaining digit is zero, so the value is exact.
    if (F.isZero())
      return Out;
    Last = F.nextDigit();
    if (Last != 9)
      Out.LastNonNine = Ix;
  }
  const int Cmp = F.compareHalf();
  Out.RoundUp = (Cmp > 0) || (Cmp == 0 && (Last & 1U));
  return Out;
}

/// Second pass, regenerates the digits and applies the carry.
template <typename Frac>
static void writeFraction(FixedBufBase& Buf, Frac F,
 std::size_t Precision, const FractionScan& Scan) {
  for (std::size_t Ix = 0; Ix < Precision; ++Ix) {
    if FIXFMT_UNLIKELY(Buf.isTruncated())
      return;
    if (F.isZero() && !Scan.RoundUp) {
      Buf.fill(Precision - Ix, U'0');
      return;
    }
    unsigned Digit = F.isZero() ? 0 : F.nextDigit();
    if (Scan.RoundUp) {
      if (Scan.LastNonNine == FractionScan::npos || Ix > Scan.LastNonNine)
        Digit = 0;
      else if (Ix == Scan.LastNonNine)
        ++Digit;
    }
    Buf.pushBack(char('0' + Digit));
  }
}

/// Fixed notation for one double, `Precision` fractional digits.
class FloatFormat {
  /// 2^1024 has 309 digits, written in chunks of 9.
  static constexpr std::size_t maxIntDigits = 320;
public:
  FloatFormat(double Value, std::size_t Precision);
  FloatFormat(const FloatFormat&) = delete;
  FloatFormat& operator=(const FloatFormat&) = delete;

public:
  bool isNegative() const { return this->Negative; }
  bool isFinite() const { return Special.empty(); }
  bool isNaN() const { return Special == "NaN"; }

  /// Length of the output without the sign.
  std::size_t size() const {
    if (!this->isFinite())
      return Special.size();
    const std::size_t IntLen = maxIntDigits - IntBegin;
    return IntLen + (Precision ? Precision + 1 : 0);
  }

  void write(FixedBufBase& Buf) const;

private:
  /// Calls `Func` with the fraction bits in the cheapest representation.
  template <typename F>
  auto withFraction(F&& Func) const {
    const unsigned Scale = unsigned(-Exponent);
    if (Scale <= 60) {
      const std::uint64_t Mask = (std::uint64_t(1) << Scale) - 1U;
      return Func(SmallFraction(Mantissa & Mask, Scale));
    }
    const std::uint64_t Bits = (Scale < 64)
      ? Mantissa & ((std::uint64_t(1) << Scale) - 1U)
      : Mantissa;
    return Func(BigFraction(Bits, Scale));
  }

  void setIntDigits(std::uint64_t V) {
    char* End = IntDigits + maxIntDigits;
    IntBegin = std::size_t(IntFormat<10>::Format(End, V) - IntDigits);
  }

  void setIntDigits(BigUInt V) {
    char* Out = IntDigits + maxIntDigits;
    while (!V.isZero()) {
      std::uint32_t Chunk = V.divSmall(1000000000U);
      for (int Ix = 0; Ix < 9; ++Ix) {
        *(--Out) = char('0' + (Chunk % 10));
        Chunk /= 10;
      }
    }
    while (*Out == '0')
      ++Out;
    IntBegin = std::size_t(Out - IntDigits);
  }

private:
  StrView Special;
  bool Negative = false;
  /// The value is `Mantissa * 2^Exponent`.
  std::uint64_t Mantissa = 0;
  int Exponent = 0;
  std::size_t Precision;
  FractionScan Scan;
  char IntDigits[maxIntDigits];
  std::size_t IntBegin = maxIntDigits;
};

FloatFormat::FloatFormat(double Value, std::size_t Precision) :
 Precision(Precision) {
  const auto Bits = std::bit_cast<std::uint64_t>(Value);
  const auto BiasedExp = unsigned((Bits >> 52) & 0x7FF);
  const std::uint64_t Fraction = Bits & ((std::uint64_t(1) << 52) - 1U);
  this->Negative = (Bits >> 63) != 0;

  if FIXFMT_UNLIKELY(BiasedExp == 0x7FF) {
    this->Special = (Fraction != 0) ? "NaN" : "inf";
    if (Fraction != 0)
      this->Negative = false;
    return;
  }

  if (BiasedExp == 0) {
    Mantissa = Fraction;
    Exponent = -1074;
  } else {
    Mantissa = Fraction | (std::uint64_t(1) << 52);
    Exponent = int(BiasedExp) - 1075;
  }

  if (Mantissa == 0) {
    Exponent = 0;
  } else {
    // Smaller scales keep more values on the fast path.
    const int Zeros = std::countr_zero(Mantissa);
    Mantissa >>= Zeros;
    Exponent += Zeros;
  }

  if (Exponent >= 0) {
    // Mantissa has at most 53 bits.
    if (Exponent <= 11) {
      this->setIntDigits(Mantissa << Exponent);
      return;
    }
    BigUInt Big {Mantissa};
    Big.shiftLeft(std::size_t(Exponent));
    this->setIntDigits(Big);
    return;
  }

  const unsigned Scale = unsigned(-Exponent);
  std::uint64_t IntPart = (Scale < 64) ? (Mantissa >> Scale) : 0;
  this->Scan = this->withFraction([&](auto Frac) {
    return scanFraction(Frac, Precision, IntPart);
  });
  if (Scan.RoundUp && Scan.LastNonNine == FractionScan::npos)
    ++IntPart;
  this->setIntDigits(IntPart);
}

void FloatFormat::write(FixedBufBase& Buf) const {
  if (!this->isFinite()) {
    Buf.appendStr(Special);
    return;
  }
  Buf.append(IntDigits + IntBegin, IntDigits + maxIntDigits);
  if (Precision == 0)
    return;
  Buf.pushBack('.');
  if (Exponent >= 0) {
    Buf.fill(Precision, U'0');
    return;
  }
  this->withFraction([&](auto Frac) {
    writeFraction(Buf, Frac, Precision, Scan);
  });
}

} // namespace `anonymous`

//======================================================================//
// Formatter
//======================================================================//

namespace {

/// Pads `Body` to the spec's width.
template <typename F>
static void writeAligned(FixedBufBase& Buf, const FmtSpec& Spec,
 std::size_t Len, AlignType DefaultSide, F&& Body) {
  if (Spec.Width <= Len) {
    Body();
    return;
  }
  const std::size_t TotalAlign = Spec.Width - Len;
  const AlignType Side = (Spec.Side == AlignType::Default)
    ? DefaultSide : Spec.Side;
  if (Side == AlignType::Left) {
    Body();
    Buf.fill(TotalAlign, Spec.Fill);
  } else if (Side == AlignType::Center) {
    const std::size_t HalfAlign = TotalAlign / 2;
    Buf.fill(HalfAlign, Spec.Fill);
    Body();
    Buf.fill((TotalAlign - HalfAlign), Spec.Fill);
  } else /* AlignType::Right */ {
    Buf.fill(TotalAlign, Spec.Fill);
    Body();
  }
}

/// Like `writeAligned`, but zero padding goes between `Head` and `Body`.
template <typename F>
static void writeNumber(FixedBufBase& Buf, const FmtSpec& Spec,
 StrView Head, std::size_t BodyLen, F&& Body) {
  const std::size_t Len = Head.size() + BodyLen;
  if (Spec.ZeroPad && Spec.Width > Len) {
    Buf.appendStr(Head);
    Buf.fill(Spec.Width - Len, U'0');
    Body();
    return;
  }
  writeAligned(Buf, Spec, Len, AlignType::Right, [&] {
    Buf.appendStr(Head);
    Body();
  });
}

/// Builds the sign and radix prefix of a number.
static StrView makeHead(char(&Out)[3], bool Negative, const FmtSpec& Spec) {
  std::size_t Len = 0;
  if (Negative)
    Out[Len++] = '-';
  else if (Spec.Sign == SignType::Plus)
    Out[Len++] = '+';
  if (Spec.Alternate && Spec.hasRadix()) {
    Out[Len++] = '0';
    switch (Spec.Radix) {
     case RadixType::Bin: Out[Len++] = 'b'; break;
     case RadixType::Oct: Out[Len++] = 'o'; break;
     default:             Out[Len++] = 'x'; break;
    }
  }
  return StrView(Out, Len);
}

} // namespace `anonymous`

bool Formatter::isCompatible(const FmtValue& Value, const FmtSpec& Spec) {
  return !Spec.hasRadix() || Value.isIntType();
}

bool Formatter::formatValue(const FmtValue& Value, const FmtSpec& Spec) const {
  if FIXFMT_UNLIKELY(!isCompatible(Value, Spec)) {
    dbgreport("Radix types only apply to integers.");
    return false;
  }

  if (Value.isSIntType()) {
    const long long V = Value.getInt();
    const auto UV = static_cast<unsigned long long>(V);
    if (V < 0 && Spec.hasRadix()) {
      // Two's complement at the width of the original type.
      const unsigned Bits = Value.getBitWidth();
      const unsigned long long Mask = (Bits >= 64)
        ? ~0ULL : ((1ULL << Bits) - 1ULL);
      this->write(UV & Mask, false, Spec);
    } else {
      this->write((V < 0) ? (0ULL - UV) : UV, V < 0, Spec);
    }
  } else if (Value.isUIntType()) {
    this->write(Value.getUInt(), false, Spec);
  } else if (Value.isFloatType()) {
    this->write(Value.getFloat(), Spec);
  } else if (Value.isCharType()) {
    this->write(Value.getChar(), Spec);
  } else if (Value.isStrType()) {
    this->write(Value.getStr(), Spec);
  } else {
    dbgassert(false && "Invalid value type!");
    FIXFMT_UNREACHABLE;
  }
  return true;
}

//=== Writers ===//

void Formatter::write(unsigned long long Value,
 bool Negative, const FmtSpec& Spec) const {
  char HeadBuf[3];
  const StrView Head = makeHead(HeadBuf, Negative, Spec);
  const bool UseUpper = (Spec.Radix == RadixType::HexUpper);
  radixDispatch(Spec.Radix, [&, this](auto Fmt) {
    const auto Digits = std::size_t(Fmt.Count(Value));
    writeNumber(Buf, Spec, Head, Digits, [&] {
      Fmt.Write(Buf, Value, UseUpper);
    });
  });
}

void Formatter::write(double Value, const FmtSpec& Spec) const {
  const std::size_t Precision = Spec.hasPrecision()
    ? Spec.Precision : std::size_t(FIXFMT_DEFAULT_PRECISION);
  const FloatFormat Float {Value, Precision};
  char HeadBuf[3];
  const StrView Head = Float.isNaN()
    ? StrView() : makeHead(HeadBuf, Float.isNegative(), Spec);
  auto Body = [&] { Float.write(Buf); };
  if (!Float.isFinite()) {
    // Zero padding is only for digits.
    FmtSpec Plain = Spec;
    Plain.ZeroPad = false;
    writeNumber(Buf, Plain, Head, Float.size(), Body);
    return;
  }
  writeNumber(Buf, Spec, Head, Float.size(), Body);
}

void Formatter::write(char32_t C, const FmtSpec& Spec) const {
  writeAligned(Buf, Spec, 1, AlignType::Left, [&] {
    Buf.appendChar(C);
  });
}

void Formatter::write(StrView Str, const FmtSpec& Spec) const {
  if (Spec.hasPrecision())
    Str = truncateCodePoints(Str, Spec.Precision);
  const std::size_t Len = countCodePoints(Str);
  writeAligned(Buf, Spec, Len, AlignType::Left, [&] {
    Buf.appendStr(Str);
  });
}

//=== Core ===//

FmtError Formatter::parseWith(StrView Str, FmtArgs Values) {
  FmtParser Parser {Str};
  while (true) {
    const FmtSegment Seg = Parser.next();
    if (Seg.isEnd())
      break;
    if FIXFMT_UNLIKELY(Seg.isError()) {
      dbgreport("Invalid placeholder. Use {{ and }} to escape braces.");
      return FmtError::InvalidSpec;
    }
    // Check if format is normal string.
    if (Seg.isLiteral()) {
      Buf.appendStr(Seg.Data);
      continue;
    }
    // There should be at least one argument here.
    const FmtValue* Value = Values.take();
    if FIXFMT_UNLIKELY(!Value) {
      dbgreport("Not enough arguments!");
      return FmtError::ArgumentCountMismatch;
    }
    if FIXFMT_UNLIKELY(!isCompatible(*Value, Seg.Spec)) {
      dbgreport("Format spec doesn't apply to the argument.");
      return FmtError::InvalidSpec;
    }
    // Output is done, keep going to find errors.
    if (Buf.isTruncated())
      continue;
    if (!this->formatValue(*Value, Seg.Spec))
      return FmtError::InvalidSpec;
  }

  if FIXFMT_UNLIKELY(Values.canTake()) {
    dbgreport("Too many arguments passed to formatter!");
    return FmtError::ArgumentCountMismatch;
  }
  return FmtError::None;
}

namespace ffmt {

FmtError vformatTo(FixedBufBase& Buf, StrView Str, FmtArgs Values) {
  Buf.reset();
  Formatter Fmt {Buf};
  Buf.Err = Fmt.parseWith(Str, Values);
  return Buf.Err;
}

} // namespace ffmt
