#include "cli/CliCommon.hpp"
#include "cli/CliParse.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                    \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                    \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

// argv-style buffer for the shared option parsers.
struct ArgList {
  std::vector<std::string> storage;
  std::vector<char*> ptrs;

  explicit ArgList(std::vector<std::string> args) : storage(std::move(args))
  {
    for (std::string& a : storage) ptrs.push_back(a.data());
  }

  int argc() const { return static_cast<int>(ptrs.size()); }
  char** argv() { return ptrs.data(); }
};

static void TestNumberParsers()
{
  using namespace urbanres::cli;

  int i = 0;
  EXPECT_TRUE(ParseI32("-1", &i));
  EXPECT_EQ(i, -1);
  EXPECT_FALSE(ParseI32("1.0", &i));
  EXPECT_FALSE(ParseI32("2147483648", &i));

  // Seeds come in decimal or hex.
  std::uint64_t u = 0;
  EXPECT_TRUE(ParseU64("42", &u));
  EXPECT_EQ(u, 42u);
  EXPECT_TRUE(ParseU64("0x7472656573", &u));
  EXPECT_EQ(u, 0x7472656573ull);
  EXPECT_FALSE(ParseU64("-1", &u));
  EXPECT_FALSE(ParseU64("0x", &u));

  // Coordinates and budgets must stay finite.
  double d = 0.0;
  EXPECT_TRUE(ParseF64("-1e-3", &d));
  EXPECT_EQ(d, -1e-3);
  EXPECT_FALSE(ParseF64("nan", &d));
  EXPECT_FALSE(ParseF64("1e309", &d));
  EXPECT_FALSE(ParseF64("1 ", &d));

  bool b = false;
  EXPECT_TRUE(ParseBool01("yes", &b));
  EXPECT_TRUE(b);
  EXPECT_FALSE(ParseBool01("maybe", &b));
}

static void TestParseWxH()
{
  using namespace urbanres::cli;

  double w = 0.0;
  double h = 0.0;

  EXPECT_TRUE(ParseWxH("2000x1500", &w, &h));
  EXPECT_EQ(w, 2000.0);
  EXPECT_EQ(h, 1500.0);

  // Sizes are meters, so fractions are fine.
  EXPECT_TRUE(ParseWxH("+750.5X64", &w, &h));
  EXPECT_EQ(w, 750.5);
  EXPECT_EQ(h, 64.0);

  EXPECT_FALSE(ParseWxH("16", &w, &h));
  EXPECT_FALSE(ParseWxH("16x", &w, &h));
  EXPECT_FALSE(ParseWxH("x8", &w, &h));
  EXPECT_FALSE(ParseWxH("0x8", &w, &h));
  EXPECT_FALSE(ParseWxH("16x0", &w, &h));
  EXPECT_FALSE(ParseWxH("-5x10", &w, &h));
  EXPECT_FALSE(ParseWxH("1e400x10", &w, &h));
}

static void TestParseVec2()
{
  using namespace urbanres::cli;

  double x = 0.0;
  double y = 0.0;

  EXPECT_TRUE(ParseVec2("120.5,300", &x, &y));
  EXPECT_EQ(x, 120.5);
  EXPECT_EQ(y, 300.0);

  EXPECT_TRUE(ParseVec2("-10,-0.25", &x, &y));
  EXPECT_EQ(x, -10.0);
  EXPECT_EQ(y, -0.25);

  EXPECT_FALSE(ParseVec2("120.5", &x, &y));
  EXPECT_FALSE(ParseVec2("1,", &x, &y));
  EXPECT_FALSE(ParseVec2(",1", &x, &y));
  EXPECT_FALSE(ParseVec2("1,2,3", &x, &y));
  EXPECT_FALSE(ParseVec2("nan,1", &x, &y));
}

static void TestParseF64List()
{
  using namespace urbanres::cli;

  std::vector<double> v;
  EXPECT_TRUE(ParseF64List("300, 600,900", &v));
  ASSERT_TRUE(v.size() == 3);
  EXPECT_EQ(v[0], 300.0);
  EXPECT_EQ(v[1], 600.0);
  EXPECT_EQ(v[2], 900.0);

  // Empty items are skipped.
  EXPECT_TRUE(ParseF64List("120,,240, ", &v));
  ASSERT_TRUE(v.size() == 2);
  EXPECT_EQ(v[1], 240.0);

  // Failure leaves the previous value untouched.
  EXPECT_FALSE(ParseF64List("300,abc", &v));
  EXPECT_EQ(v.size(), static_cast<std::size_t>(2));
  EXPECT_FALSE(ParseF64List(" , ", &v));
  EXPECT_FALSE(ParseF64List("300,inf", &v));
}

static void TestCommonArgs()
{
  using namespace urbanres::cli;

  ArgList args({"tool", "--seed", "0x10", "--size", "1200x800", "--log-keep", "0", "--quiet", "--from", "1,2"});
  CommonOptions opt;
  int i = 1;
  EXPECT_TRUE(ParseCommonArg(args.storage[i], i, args.argc(), args.argv(), opt) == ArgStatus::Consumed);
  EXPECT_EQ(i, 2);
  EXPECT_EQ(opt.seed, 16u);
  ++i;
  EXPECT_TRUE(ParseCommonArg(args.storage[i], i, args.argc(), args.argv(), opt) == ArgStatus::Consumed);
  EXPECT_TRUE(opt.haveSize);
  EXPECT_EQ(opt.width, 1200.0);
  EXPECT_EQ(opt.height, 800.0);
  ++i;
  EXPECT_TRUE(ParseCommonArg(args.storage[i], i, args.argc(), args.argv(), opt) == ArgStatus::Consumed);
  EXPECT_EQ(opt.logKeep, 0);
  ++i;
  EXPECT_TRUE(ParseCommonArg(args.storage[i], i, args.argc(), args.argv(), opt) == ArgStatus::Consumed);
  EXPECT_TRUE(opt.quiet);
  ++i;
  // Tool-specific flags are left to the caller.
  EXPECT_TRUE(ParseCommonArg(args.storage[i], i, args.argc(), args.argv(), opt) == ArgStatus::NotMine);
  EXPECT_EQ(i, 8);

  ArgList bad({"tool", "--log-keep", "-1"});
  CommonOptions badOpt;
  i = 1;
  EXPECT_TRUE(ParseCommonArg(bad.storage[i], i, bad.argc(), bad.argv(), badOpt) == ArgStatus::Error);

  // A flag missing its value.
  ArgList missing({"tool", "--seed"});
  i = 1;
  EXPECT_TRUE(ParseCommonArg(missing.storage[i], i, missing.argc(), missing.argv(), badOpt) == ArgStatus::Error);
}

static void TestObstructionArgs()
{
  using namespace urbanres::cli;

  ArgList args({"tool", "--disaster-seed", "77", "--obstructions-in", "obs.json"});
  ObstructionSource src;
  EXPECT_FALSE(src.simulate);

  int i = 1;
  EXPECT_TRUE(ParseObstructionArg(args.storage[i], i, args.argc(), args.argv(), src) == ArgStatus::Consumed);
  EXPECT_TRUE(src.simulate);
  EXPECT_EQ(src.disasterSeed, 77u);
  ++i;
  EXPECT_TRUE(ParseObstructionArg(args.storage[i], i, args.argc(), args.argv(), src) == ArgStatus::Consumed);
  EXPECT_EQ(src.path, std::string("obs.json"));

  ArgList bad({"tool", "--disaster-seed", "seven"});
  ObstructionSource badSrc;
  i = 1;
  EXPECT_TRUE(ParseObstructionArg(bad.storage[i], i, bad.argc(), bad.argv(), badSrc) == ArgStatus::Error);
  EXPECT_FALSE(badSrc.simulate);
}

static void TestToolLogIsOptional()
{
  using namespace urbanres::cli;

  // Tools declare the tee up front and only start it for --log.
  urbanres::LogTee tee;
  EXPECT_FALSE(tee.active());

  CommonOptions opt;
  EXPECT_TRUE(StartToolLog(opt, tee));
  EXPECT_FALSE(tee.active());
}

int main()
{
  TestNumberParsers();
  TestParseWxH();
  TestParseVec2();
  TestParseF64List();
  TestCommonArgs();
  TestObstructionArgs();
  TestToolLogIsOptional();

  if (g_failures == 0) {
    std::cout << "urbanres_cli_parse_tests: OK\n";
    return 0;
  }

  std::cerr << "urbanres_cli_parse_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
