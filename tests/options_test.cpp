#include "core/options.hpp"
#include "net/url.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

std::expected<Options, std::string> Parse(std::vector<std::string> args) {
  args.insert(args.begin(), "tableflood");
  std::vector<char *> argv;
  for (auto &a : args) {
    argv.push_back(a.data());
  }
  return ParseArgs(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(ParseArgs, Defaults) {
  auto opt = Parse({});
  ASSERT_TRUE(opt.has_value());
  EXPECT_EQ(opt->mode, "play");
  EXPECT_EQ(opt->address, "127.0.0.1:8083");
  EXPECT_EQ(opt->num, 100u);
  EXPECT_EQ(opt->concurrency, 100);
  EXPECT_EQ(opt->user_prefix, "over-");
  EXPECT_FALSE(opt->verbose);
  EXPECT_GE(opt->threads, 1);
}

TEST(ParseArgs, ShortAndLongFlags) {
  auto opt = Parse({"-m", "register", "--address", "game.local:9000", "-n",
                    "5000", "-c", "250", "--first-id", "17", "--user-prefix",
                    "bot-", "--io-timeout-ms", "1500", "--activity-timeout-s",
                    "5", "-v"});
  ASSERT_TRUE(opt.has_value());
  EXPECT_EQ(opt->mode, "register");
  EXPECT_EQ(opt->address, "game.local:9000");
  EXPECT_EQ(opt->num, 5000u);
  EXPECT_EQ(opt->concurrency, 250);
  EXPECT_EQ(opt->first_id, 17u);
  EXPECT_EQ(opt->user_prefix, "bot-");
  EXPECT_EQ(opt->io_timeout_ms, 1500);
  EXPECT_EQ(opt->activity_timeout_s, 5);
  EXPECT_TRUE(opt->verbose);
}

TEST(ParseArgs, ClampsNonPositiveBounds) {
  auto opt = Parse({"-c", "0", "-w", "-3", "--threads", "0"});
  ASSERT_TRUE(opt.has_value());
  EXPECT_EQ(opt->concurrency, 1);
  EXPECT_EQ(opt->workers, 1);
  EXPECT_EQ(opt->threads, 1);
}

TEST(ParseArgs, RejectsUnknownOrDanglingFlags) {
  EXPECT_FALSE(Parse({"--bogus"}).has_value());
  EXPECT_FALSE(Parse({"-n"}).has_value());
}

TEST(MakeRunOptions, PlayModeSplitsAddressAndTimeouts) {
  auto opt = Parse({"-a", "10.0.0.5:8083", "--connect-timeout-ms", "250",
                    "--io-timeout-ms", "750", "--activity-timeout-s", "9"});
  ASSERT_TRUE(opt.has_value());
  auto ro = MakeRunOptions(*opt);
  ASSERT_TRUE(ro.has_value()) << ro.error();
  EXPECT_EQ(ro->mode, RunMode::play);
  EXPECT_EQ(ro->host, "10.0.0.5");
  EXPECT_EQ(ro->port, "8083");
  EXPECT_EQ(ro->session.timeouts.connect, std::chrono::milliseconds(250));
  EXPECT_EQ(ro->session.timeouts.io, std::chrono::milliseconds(750));
  EXPECT_EQ(ro->session.timeouts.activity, std::chrono::seconds(9));
}

TEST(MakeRunOptions, RegisterMode) {
  auto opt = Parse({"-m", "register"});
  ASSERT_TRUE(opt.has_value());
  auto ro = MakeRunOptions(*opt);
  ASSERT_TRUE(ro.has_value());
  EXPECT_EQ(ro->mode, RunMode::registration);
}

TEST(MakeRunOptions, AttackNeedsHttpUrl) {
  auto missing = Parse({"-m", "attack"});
  ASSERT_TRUE(missing.has_value());
  EXPECT_FALSE(MakeRunOptions(*missing).has_value());

  auto opt = Parse({"-m", "attack", "-u",
                    "http://games.local:8082/api/v0/games/g-42", "-w", "12",
                    "-t", "3"});
  ASSERT_TRUE(opt.has_value());
  auto ro = MakeRunOptions(*opt);
  ASSERT_TRUE(ro.has_value()) << ro.error();
  EXPECT_EQ(ro->mode, RunMode::attack);
  EXPECT_EQ(ro->urlHost, "games.local");
  EXPECT_EQ(ro->urlPort, "8082");
  EXPECT_EQ(ro->urlTarget, "/api/v0/games/g-42");
  EXPECT_EQ(ro->workers, 12);
  EXPECT_EQ(ro->seconds, 3);
}

TEST(MakeRunOptions, RejectsBadModeAndAddress) {
  auto bad_mode = Parse({"-m", "spectate"});
  ASSERT_TRUE(bad_mode.has_value());
  EXPECT_FALSE(MakeRunOptions(*bad_mode).has_value());

  auto bad_addr = Parse({"-a", "no-port-here"});
  ASSERT_TRUE(bad_addr.has_value());
  EXPECT_FALSE(MakeRunOptions(*bad_addr).has_value());
}

TEST(Url, HostPortForms) {
  auto v4 = URL::ParseHostPort("127.0.0.1:8083");
  ASSERT_TRUE(v4.has_value());
  EXPECT_EQ(v4->host, "127.0.0.1");
  EXPECT_EQ(v4->port, "8083");

  auto v6 = URL::ParseHostPort("[::1]:9000");
  ASSERT_TRUE(v6.has_value());
  EXPECT_EQ(v6->host, "::1");
  EXPECT_EQ(v6->port, "9000");

  EXPECT_FALSE(URL::ParseHostPort("host:").has_value());
  EXPECT_FALSE(URL::ParseHostPort(":80").has_value());
  EXPECT_FALSE(URL::ParseHostPort("host:http").has_value());
  EXPECT_FALSE(URL::ParseHostPort("[::1]9000").has_value());
}

TEST(Url, HttpDefaults) {
  auto u = URL::ParseHttpUrl("HTTP://example.org");
  ASSERT_TRUE(u.has_value());
  EXPECT_EQ(u->host, "example.org");
  EXPECT_EQ(u->port, "80");
  EXPECT_EQ(u->target, "/");
  EXPECT_FALSE(URL::ParseHttpUrl("https://example.org/").has_value());
  EXPECT_FALSE(URL::ParseHttpUrl("http:///path").has_value());
}
