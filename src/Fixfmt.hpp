//===- Fixfmt.hpp ---------------------------------------------------===//
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

#pragma once

#ifndef FIXFMT_HFIXFMT_HPP
#define FIXFMT_HFIXFMT_HPP

#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string_view>
#include <type_traits>
#include <utility>

#ifndef FIXFMT_FORCE_ASSERT
# define FIXFMT_FORCE_ASSERT 0
#endif

#ifndef FIXFMT_STDERR_ASSERT
# define FIXFMT_STDERR_ASSERT 0
#endif

/// Fractional digits printed for floats without an explicit precision.
#ifndef FIXFMT_DEFAULT_PRECISION
# define FIXFMT_DEFAULT_PRECISION 6
#endif

#ifdef __has_builtin
# define FIXFMT_HAS_BUILTIN(x) (__has_builtin(x))
#else
# define FIXFMT_HAS_BUILTIN(x) (0)
#endif // __has_builtin?

#ifndef FIXFMT_CONSTEVAL
# undef FIXFMT_HAS_CONSTEVAL
# if __cpp_consteval >= 201811L
#  define FIXFMT_CONSTEVAL consteval
#  define FIXFMT_HAS_CONSTEVAL 1
# else
#  define FIXFMT_CONSTEVAL constexpr
#  define FIXFMT_HAS_CONSTEVAL 0
# endif
#endif // FIXFMT_CONSTEVAL

/// Checks templates of the convenience functions at compile time.
#ifndef FIXFMT_CXPR_CHECKS
# define FIXFMT_CXPR_CHECKS FIXFMT_HAS_CONSTEVAL
#endif

#if FIXFMT_HAS_BUILTIN(__builtin_expect)
# define FIXFMT_LIKELY(ex)   (__builtin_expect(bool(ex), true))
# define FIXFMT_UNLIKELY(ex) (__builtin_expect(bool(ex), false))
#else
# define FIXFMT_LIKELY(ex)   (bool(ex))
# define FIXFMT_UNLIKELY(ex) (bool(ex))
#endif

#ifdef NDEBUG
# define FIXFMT_UNREACHABLE ::ffmt::H::unreachable()
#else
# define FIXFMT_UNREACHABLE do { \
  assert(false && "Reached an unreachable position."); \
  ::ffmt::H::unreachable(); \
} while(0)
#endif

//======================================================================//
// Utilities
//======================================================================//

// Use `*::H` as the detail namespace to keep symbols small.
namespace ffmt::H {

[[noreturn]] inline void unreachable() {
#if __cpp_lib_unreachable >= 202202L
  std::unreachable();
#elif FIXFMT_HAS_BUILTIN(__builtin_unreachable)
  __builtin_unreachable();
#elif defined(_MSC_VER) && !defined(__GNUC__)
  __assume(false);
#endif
}

/// Returned by `decodeUtf8` for malformed sequences.
inline constexpr char32_t badCodePoint = 0xFFFFFFFF;
inline constexpr char32_t replacementChar = 0xFFFD;

inline constexpr bool isUtf8Cont(char C) {
  return (static_cast<unsigned char>(C) & 0xC0) == 0x80;
}

/// Gets the length of a UTF-8 sequence from its lead byte.
/// @return `0` if `Lead` cannot start a sequence.
inline constexpr std::size_t utf8SeqLen(char Lead) {
  const auto C = static_cast<unsigned char>(Lead);
  if (C < 0x80) return 1;
  if ((C & 0xE0) == 0xC0) return 2;
  if ((C & 0xF0) == 0xE0) return 3;
  if ((C & 0xF8) == 0xF0) return 4;
  return 0;
}

/// Decodes one complete sequence. `Seq` must hold exactly its bytes.
inline constexpr char32_t decodeUtf8(std::string_view Seq) {
  const std::size_t Len = utf8SeqLen(Seq.empty() ? '\x80' : Seq[0]);
  if (Len == 0 || Len != Seq.size())
    return badCodePoint;
  if (Len == 1)
    return char32_t(static_cast<unsigned char>(Seq[0]));
  constexpr unsigned char LeadMasks[] {0, 0, 0x1F, 0x0F, 0x07};
  char32_t Out = static_cast<unsigned char>(Seq[0]) & LeadMasks[Len];
  for (std::size_t Ix = 1; Ix < Len; ++Ix) {
    if (!isUtf8Cont(Seq[Ix]))
      return badCodePoint;
    Out = (Out << 6) | (static_cast<unsigned char>(Seq[Ix]) & 0x3F);
  }
  return Out;
}

/// Encodes `C` into `Out`, replacing invalid scalars with U+FFFD.
/// @return The number of bytes written.
std::size_t encodeUtf8(char32_t C, char(&Out)[4]);

/// Counts code points by counting non-continuation bytes.
inline constexpr std::size_t countCodePoints(std::string_view Str) {
  std::size_t Count = 0;
  for (char C : Str)
    Count += !isUtf8Cont(C);
  return Count;
}

/// Cuts `Str` after its first `Max` code points.
inline constexpr std::string_view
 truncateCodePoints(std::string_view Str, std::size_t Max) {
  std::size_t Seen = 0;
  for (std::size_t Ix = 0; Ix < Str.size(); ++Ix) {
    if (isUtf8Cont(Str[Ix]))
      continue;
    if (Seen++ == Max)
      return Str.substr(0, Ix);
  }
  return Str;
}

template <typename T>
inline constexpr bool isCharLike =
  std::is_same_v<T, char>     ||
  std::is_same_v<T, wchar_t>  ||
  std::is_same_v<T, char8_t>  ||
  std::is_same_v<T, char16_t> ||
  std::is_same_v<T, char32_t>;

template <typename T>
inline constexpr bool isFmtInt =
  std::is_integral_v<T> && !std::is_same_v<T, bool> && !isCharLike<T>;

} // namespace ffmt::H

namespace ffmt {
/// Alias for `std::string_view`.
using StrView = std::string_view;

/// The ways a render can fail.
/// Truncation is not an error, see `FixedBufBase::isTruncated`.
enum class FmtError : std::uint8_t {
  None,
  /// Malformed placeholder or format spec.
  InvalidSpec,
  /// Fewer or more arguments than placeholders.
  ArgumentCountMismatch,
};

/// Gets a printable name for `Err`.
const char* getErrorName(FmtError Err);

} // namespace ffmt

//======================================================================//
// Buffering
//======================================================================//

namespace ffmt {

class FmtResult;
class FmtArgs;

/// Bounded writer over storage owned by a derived `FixedBuf`.
/// Never allocates. Writes stop at the first append that does not fit.
class FixedBufBase {
  friend FmtError vformatTo(FixedBufBase& Buf, StrView Str, FmtArgs Values);
public:
  using value_type = char;
  using pointer = value_type*;
  using const_pointer = const value_type*;
  using iterator = value_type*;
  using const_iterator = const value_type*;
  using size_type = std::size_t;

protected:
  FixedBufBase(char* Ptr, size_type Capacity) :
   Data(Ptr), Capacity(Capacity) {}

  FixedBufBase(const FixedBufBase&) = delete;
  FixedBufBase& operator=(const FixedBufBase&) = delete;

public:
  size_type size() const { return this->Size; }
  size_type capacity() const { return this->Capacity; }

  bool isEmpty() const { return size() == 0; }
  bool isFull()  const { return size() == capacity(); }

  /// Checks if any output was dropped since the last `reset`.
  bool isTruncated() const { return this->Truncated; }

  /// Gets the error of the last render.
  FmtError getError() const { return this->Err; }

  iterator       begin()       { return this->Data; }
  const_iterator begin() const { return this->Data; }
  iterator       end()         { return begin() + size(); }
  const_iterator end()   const { return begin() + size(); }

  const_pointer data() const { return begin(); }

  /// The valid UTF-8 text written so far.
  StrView str() const { return StrView(data(), size()); }

  /// Gets the result of the last render.
  FmtResult getResult() const;

  void reset() {
    this->Size = 0;
    this->Truncated = false;
    this->Err = FmtError::None;
  }

  void pushBack(char C) {
    this->append(&C, &C + 1);
  }

  /// Appends as much of the range as fits, without splitting code points.
  void append(const char* Begin, const char* End);

  void append(const char* Begin, size_type Len) {
    if FIXFMT_UNLIKELY(!Begin || Len == 0)
      return;
    this->append(Begin, Begin + Len);
  }

  void appendStr(StrView Str) {
    this->append(Str.data(), Str.size());
  }

  /// Appends a code point as UTF-8.
  void appendChar(char32_t C);

  /// Appends `Count` copies of `Fill`.
  void fill(size_type Count, char32_t Fill);

  void writeTo(std::FILE* File) const;

  /// Resets the buffer and renders into it.
  template <typename...TT>
  FmtResult format(StrView Str, const TT&...Args);

protected:
  void copyFrom(const FixedBufBase& Other);

protected:
  char* Data = nullptr;
  size_type Size = 0, Capacity;
  bool Truncated = false;
  FmtError Err = FmtError::None;
};

namespace H {

/// The underlying storage for `FixedBuf`.
template <std::size_t Size>
struct FixedBufStorage {
protected:
  char* getBufPtr() { return this->Storage; }
  const char* getBufPtr() const { return this->Storage; }

protected:
  char Storage[Size];
};

/// Specialization for zero sized buffers.
template <>
struct FixedBufStorage<0U> {
protected:
  char* getBufPtr() { return nullptr; }
  const char* getBufPtr() const { return nullptr; }
};

} // namespace H

/// A buffer with `N` bytes of inline storage.
/// @tparam N The maximum number of bytes of output.
template <std::size_t N>
class FixedBuf : protected H::FixedBufStorage<N>, public FixedBufBase {
public:
  FixedBuf() : FixedBufBase(this->getBufPtr(), N) {}

  FixedBuf(const FixedBuf& Other) : FixedBuf() {
    this->copyFrom(Other);
  }

  FixedBuf& operator=(const FixedBuf& Other) {
    if FIXFMT_LIKELY(&Other != this)
      this->copyFrom(Other);
    return *this;
  }
};

} // namespace ffmt

//======================================================================//
// Values
//======================================================================//

namespace ffmt {

/// A formattable argument. The set of kinds is closed.
class FmtValue {
  enum ValueType : std::uint8_t {
    CharType,
    SignedType,
    UnsignedType,
    FloatType,
    DoubleType,
    StrType
  };

  struct StrData {
    const char* Ptr;
    std::size_t Len;
  };

  union Wrapper {
    char32_t Char;
    long long Signed;
    unsigned long long Unsigned;
    double Float;
    StrData Str;
  };

public:
  bool isSIntType()  const noexcept { return Type == SignedType; }
  bool isUIntType()  const noexcept { return Type == UnsignedType; }
  bool isIntType()   const noexcept { return isSIntType() || isUIntType(); }
  bool isFloatType() const noexcept {
    return Type == FloatType || Type == DoubleType;
  }
  bool isCharType()  const noexcept { return Type == CharType; }
  bool isStrType()   const noexcept { return Type == StrType; }

  /// Extracts the current value as an integer.
  /// @returns `0` if an error occurred (check `isIntType()`).
  long long getInt() const;

  /// Extracts the current value as an unsigned integer.
  /// @returns `0` if an error occurred (check `isIntType()`).
  unsigned long long getUInt() const;

  /// @returns `0.0` if the value isn't a float.
  double getFloat() const;

  /// @returns `U'\0'` if the value isn't a character.
  char32_t getChar() const;

  /// @returns An empty view if the value isn't text.
  StrView getStr() const;

  /// Bit width of the integer type the value was created from.
  unsigned getBitWidth() const { return this->Bits; }

  /// Gets the name of the active value type.
  const char* getTypeName() const;

public:
  /// `char` is treated as a Latin-1 code unit.
  FmtValue(char C) : Type(CharType), Bits(8) {
    Value.Char = char32_t(static_cast<unsigned char>(C));
  }

  /// Wide characters are taken as Unicode scalars.
  template <typename T, std::enable_if_t<
    H::isCharLike<T> && !std::is_same_v<T, char>, int> = 0>
  FmtValue(T C) : Type(CharType), Bits(sizeof(T) * 8) {
    Value.Char = char32_t(C);
  }

  template <typename T, std::enable_if_t<
    H::isFmtInt<T> && std::is_signed_v<T>, int> = 0>
  FmtValue(T V) : Type(SignedType), Bits(sizeof(T) * 8) {
    Value.Signed = V;
  }

  template <typename T, std::enable_if_t<
    H::isFmtInt<T> && std::is_unsigned_v<T>, int> = 0>
  FmtValue(T V) : Type(UnsignedType), Bits(sizeof(T) * 8) {
    Value.Unsigned = V;
  }

  FmtValue(bool B) : Type(StrType), Bits(0) {
    const StrView Str = B ? "true" : "false";
    Value.Str = {Str.data(), Str.size()};
  }

  FmtValue(float V) : Type(FloatType), Bits(32) {
    Value.Float = V;
  }

  FmtValue(double V) : Type(DoubleType), Bits(64) {
    Value.Float = V;
  }

  /// A null string formats as empty text.
  FmtValue(const char* Str) : Type(StrType), Bits(0) {
    const StrView View = Str ? StrView(Str) : StrView();
    Value.Str = {View.data(), View.size()};
  }

  FmtValue(StrView Str) : Type(StrType), Bits(0) {
    Value.Str = {Str.data(), Str.size()};
  }

  FmtValue(std::nullptr_t) = delete;
  template <typename T> FmtValue(const T*) = delete;

private:
  Wrapper Value;
  ValueType Type;
  std::uint8_t Bits;
};

/// A borrowed, ordered list of arguments consumed front to back.
class FmtArgs {
public:
  FmtArgs() = default;
  FmtArgs(const FmtValue* Ptr, std::size_t Len) :
   Begin(Ptr), End(Ptr + Len) {}

  template <std::size_t N>
  FmtArgs(const std::array<FmtValue, N>& Values) :
   Begin(Values.data()), End(Values.data() + N) {}

public:
  const FmtValue* take() {
    if FIXFMT_UNLIKELY(this->isEmpty())
      return nullptr;
    return this->Begin++;
  }
  bool canTake() const {
    return !this->isEmpty();
  }
  std::size_t size() const {
    return End - Begin;
  }
  bool isEmpty() const {
    return Begin == End;
  }

private:
  const FmtValue* Begin = nullptr;
  const FmtValue* End = nullptr;
};

} // namespace ffmt

//======================================================================//
// Parsing
//======================================================================//

namespace ffmt {

enum class AlignType : std::uint8_t {
  Left, Right, Center,
  /// Right for numbers, left for everything else.
  Default
};

enum class SignType : std::uint8_t {
  Minus, Plus,
  Default = Minus
};

enum class RadixType : std::uint8_t {
  Dec, Bin, Oct, Hex, HexUpper,
  Default = Dec
};

struct FmtSpec {
  static constexpr std::size_t noPrecision = ~std::size_t(0);
  static constexpr std::size_t maxCount = 0xFFFF;
public:
  constexpr bool hasPrecision() const {
    return Precision != noPrecision;
  }
  constexpr bool hasRadix() const {
    return Radix != RadixType::Default;
  }

public:
  char32_t Fill = U' ';
  AlignType Side = AlignType::Default;
  SignType Sign = SignType::Default;
  RadixType Radix = RadixType::Default;
  bool Alternate = false;
  bool ZeroPad = false;
  std::size_t Width = 0;
  std::size_t Precision = noPrecision;
};

struct FmtSegment {
  enum SType : std::uint8_t { End, Literal, Format, Error };
public:
  constexpr FmtSegment() = default;
  constexpr FmtSegment(SType Type, StrView Data) :
   Type(Type), Data(Data) {}
  constexpr FmtSegment(StrView Data, const FmtSpec& Spec) :
   Type(Format), Data(Data), Spec(Spec) {}

public:
  constexpr bool isEnd()     const { return Type == End; }
  constexpr bool isLiteral() const { return Type == Literal; }
  constexpr bool isFormat()  const { return Type == Format; }
  constexpr bool isError()   const { return Type == Error; }

public:
  SType Type = End;
  /// Literal text, the spec text of a placeholder,
  /// or the remaining template at an error.
  StrView Data;
  FmtSpec Spec;
};

/// Splits a template into segments, one per call to `next`.
class FmtParser {
public:
  constexpr explicit FmtParser(StrView Str) :
   FormatString(Str), Rest(Str) {}

public:
  /// Gets the next segment. Returns `End` forever after an `Error`.
  constexpr FmtSegment next();

  /// Starts again from the beginning of the template.
  constexpr void restart() { this->Rest = this->FormatString; }

  constexpr bool isDone() const { return Rest.empty(); }

  /// Parses the text after the `:` of a placeholder.
  static constexpr bool ParseSpec(StrView Spec, FmtSpec& Out);

private:
  constexpr FmtSegment fail() {
    const FmtSegment Seg {FmtSegment::Error, Rest};
    this->Rest = StrView();
    return Seg;
  }

  static constexpr bool IsAlignChar(char C) {
    return C == '<' || C == '^' || C == '>';
  }

  static constexpr AlignType ToAlign(char C) {
    switch (C) {
      case '<': return AlignType::Left;
      case '^': return AlignType::Center;
      default:  return AlignType::Right;
    }
  }

  static constexpr bool IsDigit(char C) {
    return C >= '0' && C <= '9';
  }

  /// Consumes leading digits into `Out`.
  /// @return `false` if the count exceeds `FmtSpec::maxCount`.
  static constexpr bool ParseCount(StrView& Spec, std::size_t& Out) {
    std::size_t Value = 0;
    while (!Spec.empty() && IsDigit(Spec.front())) {
      Value = (Value * 10) + std::size_t(Spec.front() - '0');
      if (Value > FmtSpec::maxCount)
        return false;
      Spec.remove_prefix(1);
    }
    Out = Value;
    return true;
  }

private:
  StrView FormatString;
  StrView Rest;
};

constexpr bool FmtParser::ParseSpec(StrView Spec, FmtSpec& Out) {
  if (Spec.empty())
    return true;

  // A fill character only exists in front of an alignment.
  const std::size_t FillLen = H::utf8SeqLen(Spec.front());
  if (FillLen != 0 && FillLen < Spec.size() && IsAlignChar(Spec[FillLen])) {
    const char32_t Fill = H::decodeUtf8(Spec.substr(0, FillLen));
    if (Fill == H::badCodePoint)
      return false;
    Out.Fill = Fill;
    Out.Side = ToAlign(Spec[FillLen]);
    Spec.remove_prefix(FillLen + 1);
  } else if (IsAlignChar(Spec.front())) {
    Out.Side = ToAlign(Spec.front());
    Spec.remove_prefix(1);
  }

  if (!Spec.empty() && (Spec.front() == '+' || Spec.front() == '-')) {
    Out.Sign = (Spec.front() == '+') ? SignType::Plus : SignType::Minus;
    Spec.remove_prefix(1);
  }
  if (!Spec.empty() && Spec.front() == '#') {
    Out.Alternate = true;
    Spec.remove_prefix(1);
  }
  if (!Spec.empty() && Spec.front() == '0') {
    Out.ZeroPad = true;
    Spec.remove_prefix(1);
  }

  if (!ParseCount(Spec, Out.Width))
    return false;

  if (!Spec.empty() && Spec.front() == '.') {
    Spec.remove_prefix(1);
    if (Spec.empty() || !IsDigit(Spec.front()))
      return false;
    if (!ParseCount(Spec, Out.Precision))
      return false;
  }

  if (Spec.empty())
    return true;

  switch (Spec.front()) {
    case 'x': Out.Radix = RadixType::Hex;      break;
    case 'X': Out.Radix = RadixType::HexUpper; break;
    case 'o': Out.Radix = RadixType::Oct;      break;
    case 'b': Out.Radix = RadixType::Bin;      break;
    default:
      return false;
  }
  Spec.remove_prefix(1);
  return Spec.empty();
}

constexpr FmtSegment FmtParser::next() {
  if (Rest.empty())
    return FmtSegment();

  const char First = Rest.front();
  if (First != '{' && First != '}') {
    std::size_t BraceOpen = Rest.find_first_of("{}");
    BraceOpen = (BraceOpen < Rest.size()) ? BraceOpen : Rest.size();
    const FmtSegment Seg {FmtSegment::Literal, Rest.substr(0, BraceOpen)};
    Rest.remove_prefix(BraceOpen);
    return Seg;
  }

  // Escaped braces become a one character literal.
  if (Rest.size() > 1 && Rest[1] == First) {
    const FmtSegment Seg {FmtSegment::Literal, Rest.substr(0, 1)};
    Rest.remove_prefix(2);
    return Seg;
  }

  if (First == '}')
    return this->fail();

  const std::size_t BraceClose = Rest.find_first_of("{}", 1);
  if (BraceClose == StrView::npos || Rest[BraceClose] != '}')
    return this->fail();

  StrView Spec = Rest.substr(1, BraceClose - 1);
  FmtSpec Parsed {};
  if (!Spec.empty()) {
    if (Spec.front() != ':')
      return this->fail();
    Spec.remove_prefix(1);
    if (!ParseSpec(Spec, Parsed))
      return this->fail();
  }

  Rest.remove_prefix(BraceClose + 1);
  return FmtSegment(Spec, Parsed);
}

/// Validates `Str` against `ArgCount` arguments without rendering it.
inline constexpr FmtError
 checkFormatString(StrView Str, std::size_t ArgCount) {
  FmtParser Parser {Str};
  std::size_t Placeholders = 0;
  while (true) {
    const FmtSegment Seg = Parser.next();
    if (Seg.isError())
      return FmtError::InvalidSpec;
    if (Seg.isEnd())
      break;
    Placeholders += Seg.isFormat();
  }
  return (Placeholders == ArgCount)
    ? FmtError::None : FmtError::ArgumentCountMismatch;
}

namespace H {
  /// Deliberately not `constexpr`, so calling it
  /// during constant evaluation fails to compile.
  void formatStringError(const char* Message);
} // namespace H

/// Wraps a template that is only known at runtime.
struct RuntimeStr {
  StrView Str;
};

inline RuntimeStr runtime(StrView Str) {
  return {Str};
}

/// A template checked against its argument types at compile time.
template <typename...TT>
class BasicFmtString {
public:
  template <typename S, typename = std::enable_if_t<
    std::is_convertible_v<const S&, StrView>>>
  FIXFMT_CONSTEVAL BasicFmtString(const S& Str) : Str(Str) {
#if FIXFMT_CXPR_CHECKS
    const FmtError Err = checkFormatString(this->Str, sizeof...(TT));
    if (Err == FmtError::InvalidSpec)
      H::formatStringError("Invalid format string.");
    else if (Err == FmtError::ArgumentCountMismatch)
      H::formatStringError("Placeholder and argument counts differ.");
#endif
  }

  BasicFmtString(RuntimeStr Runtime) : Str(Runtime.Str) {}

public:
  constexpr StrView get() const { return this->Str; }

private:
  StrView Str;
};

template <typename...TT>
using FmtString = BasicFmtString<std::type_identity_t<TT>...>;

} // namespace ffmt

//======================================================================//
// Formatting
//======================================================================//

namespace ffmt {

/// The outcome of one render into a `FixedBufBase`.
class FmtResult {
public:
  FmtResult(FmtError Err, StrView Text, bool Truncated) :
   Err(Err), Text(Text), Truncated(Truncated) {}

public:
  bool isOk() const { return Err == FmtError::None; }
  explicit operator bool() const { return isOk(); }

  FmtError getError() const { return this->Err; }

  /// The rendered text. Empty if the render failed.
  StrView str() const { return this->Text; }
  std::size_t size() const { return Text.size(); }
  bool isTruncated() const { return this->Truncated; }

private:
  FmtError Err;
  StrView Text;
  bool Truncated;
};

/// Renders segments into a buffer, one argument per placeholder.
struct Formatter {
  explicit Formatter(FixedBufBase& Buf) : Buf(Buf) {}
public:
  /// Renders the whole template. Stops at the first error.
  FmtError parseWith(StrView Str, FmtArgs Values);

  /// Checks if `Spec` can be applied to `Value`.
  static bool isCompatible(const FmtValue& Value, const FmtSpec& Spec);

  /// Formats an abstract value with `Spec`, including padding.
  bool formatValue(const FmtValue& Value, const FmtSpec& Spec) const;

  void write(unsigned long long Value, bool Negative, const FmtSpec& Spec) const;
  void write(double Value, const FmtSpec& Spec) const;
  void write(char32_t C, const FmtSpec& Spec) const;
  void write(StrView Str, const FmtSpec& Spec) const;

private:
  FixedBufBase& Buf;
};

/// The engine behind every entry point. Resets `Buf` first.
FmtError vformatTo(FixedBufBase& Buf, StrView Str, FmtArgs Values);

inline FmtResult FixedBufBase::getResult() const {
  const bool Ok = (Err == FmtError::None);
  return FmtResult(Err, Ok ? this->str() : StrView(), Truncated);
}

//======================================================================//
// API
//======================================================================//

template <typename...TT>
FmtResult formatTo(FixedBufBase& Buf, StrView Str, const TT&...Args) {
  const std::array<FmtValue, sizeof...(TT)> Values {FmtValue(Args)...};
  (void) vformatTo(Buf, Str, FmtArgs(Values));
  return Buf.getResult();
}

template <typename...TT>
FmtResult FixedBufBase::format(StrView Str, const TT&...Args) {
  return formatTo(*this, Str, Args...);
}

/// Renders into a new buffer. Overflow truncates silently,
/// check `isTruncated()` on the returned buffer.
template <std::size_t N, typename...TT>
FixedBuf<N> format(FmtString<TT...> Str, const TT&...Args) {
  FixedBuf<N> Buf;
  (void) formatTo(Buf, Str.get(), Args...);
  return Buf;
}

template <std::size_t N = 256, typename...TT>
void print(std::FILE* File, FmtString<TT...> Str, const TT&...Args) {
  FixedBuf<N> Buf;
  (void) formatTo(Buf, Str.get(), Args...);
  Buf.writeTo(File);
}

template <std::size_t N = 256, typename...TT>
void print(FmtString<TT...> Str, const TT&...Args) {
  FixedBuf<N> Buf;
  (void) formatTo(Buf, Str.get(), Args...);
  Buf.writeTo(stdout);
}

template <std::size_t N = 256, typename...TT>
void println(std::FILE* File, FmtString<TT...> Str, const TT&...Args) {
  FixedBuf<N> Buf;
  (void) formatTo(Buf, Str.get(), Args...);
  Buf.writeTo(File);
  (void) std::fputc('\n', File);
}

template <std::size_t N = 256, typename...TT>
void println(FmtString<TT...> Str, const TT&...Args) {
  FixedBuf<N> Buf;
  (void) formatTo(Buf, Str.get(), Args...);
  Buf.writeTo(stdout);
  (void) std::fputc('\n', stdout);
}

/// @brief Enables or disables colored diagnostics.
/// @return The old color mode value.
bool setColorMode(bool Value);

} // namespace ffmt

#endif // FIXFMT_HFIXFMT_HPP
