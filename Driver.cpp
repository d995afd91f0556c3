#include <Fixfmt.hpp>
#include <cfloat>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>

using namespace ffmt;

void testBuf() {
  FixedBuf<16> Buf {};
  Buf.pushBack('H');
  Buf.appendStr("ello world!");
  // Truncates
  Buf.appendStr(" Yeah let's add a reaaaallly long string here...");
  Buf.writeTo(stdout);
  ffmt::println(" [{}/{}, truncated: {}]",
    Buf.size(), Buf.capacity(), Buf.isTruncated());

  FixedBuf<6> OtherBuf {};
  OtherBuf.appendStr("Grüße!");
  Buf.reset();
  OtherBuf.writeTo(stdout);
  ffmt::println(" [{}/{}]", OtherBuf.size(), OtherBuf.capacity());

  OtherBuf.reset();
  OtherBuf.fill(3, U'.');
  OtherBuf.appendStr("ok\n");
  OtherBuf.writeTo(stdout);
}

template <typename F>
static inline void runOneTest(const char* Str, std::int64_t Int, F&& Func) {
  Func("Testing, testing, {}!",       "123");
  Func("Testing, testing, {:>9}!",    "123");
  Func("Testing, testing, {:*^9}!",   "123");
  Func("Testing, testing, {:+9}!",    123);
  Func("Testing, testing, {:09}!",    -123);
  Func("Testing, testing, {:.1}!",    "ABC");
  Func("{:#b}, {}, {} {}!!", 42, "it's great", Int, Str);
  Func("{}, {:#o}, {} {}!!", "it's great", 42, Str, Int);
  Func("{}, {}, {:.3} {}!!", Int, "it's great", 42.0625, Str);
  Func("{}, {}, {} {:#X}!!", Str, Int, "it's great", 42);
  Func("Testing, testing, {:+10x}!!", -123);
  Func("Testing, testing, {:→<10}!!", 1.5);
  Func("Testing, testing, {:.0} {:.0} {:.0}!!", 0.5, 1.5, 2.5);
  Func("write some stuff {}: {:.2}", "foo", 42.3456);
}

static inline void runOneTest(const char* Str, std::int64_t Int) {
  runOneTest(Str, Int, [](const char* Tmpl, const auto&...Args) {
    FixedBuf<128> Buf;
    const FmtResult Res = Buf.format(Tmpl, Args...);
    if (!Res)
      ffmt::println(stderr, "error: {}", getErrorName(Res.getError()));
    Buf.writeTo(stdout);
    ffmt::println("");
  });
}

void testErrors() {
  FixedBuf<32> Buf;
  const char* Templates[] {"{}", "{0}", "{:.}", "unclosed {", "{:q}"};
  for (const char* Tmpl : Templates) {
    const FmtResult Res = Buf.format(Tmpl);
    ffmt::println("{:<12} -> {}", Tmpl, getErrorName(Res.getError()));
  }
  const FmtResult Res = Buf.format("{:x}", "text");
  ffmt::println("{:<12} -> {}", "{:x}", getErrorName(Res.getError()));
}

void testLimits() {
  ffmt::println("{} {}",
    std::numeric_limits<std::int64_t>::min(),
    std::numeric_limits<std::uint64_t>::max());
  ffmt::println("{:x} {:#b}", std::int32_t(-1), std::int8_t(-2));
  ffmt::println<400>("{:.0}", DBL_MAX);
  ffmt::println("{:.0} {:.0}", 1e22, 1e23);
  ffmt::println("{:.10} {} {} {}", 0.1f, -0.0,
    std::numeric_limits<double>::infinity(),
    std::numeric_limits<double>::quiet_NaN());
}

int main() {
  namespace chrono = std::chrono;
  using TimerType = chrono::high_resolution_clock;
  ffmt::setColorMode(true);

  const char* Str = "yeah!!";
  const std::int64_t Int = -7;

  testBuf();
  runOneTest(Str, Int);
  testErrors();
  testLimits();

  constexpr std::int64_t Iters = 100000;
  auto Start = TimerType::now();
  for (std::int64_t I = 0; I < Iters; ++I) {
    runOneTest(Str, Int, [](const char* Tmpl, const auto&...Args) {
      FixedBuf<128> Buf;
      (void) Buf.format(Tmpl, Args...);
    });
  }
  auto End = TimerType::now();
  const chrono::duration<double> Secs = End - Start;

  std::cout << "Took " << Secs.count() << "s to do "
    << Iters << " iterations." << std::endl;
}
