#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <thread>

#include "../include/errors.hpp"
#include "../include/policy_applier.hpp"
#include "test_doubles.hpp"

namespace fs = std::filesystem;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class PolicyApplierTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("tornet_applier_" + std::to_string(getpid()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(dir_);
    torrc_ = (dir_ / "torrc").string();
    std::ofstream(torrc_) << "SocksPort 9050\n";

    ON_CALL(runner_, findExecutable("systemctl"))
        .WillByDefault(Return(std::string("/usr/bin/systemctl")));
    ON_CALL(runner_, isPrivileged()).WillByDefault(Return(true));
    ON_CALL(runner_, run(_)).WillByDefault(Return(commandResult(0)));
  }
  void TearDown() override { fs::remove_all(dir_); }

  PolicyOutcome apply(const ExitPolicy& preferred,
                      const FallbackSpec& fallback) {
    ServiceController service(runner_, logger_, "tor", dir_.string());
    ConnectivityProbe probe(fetcher_, processes_, logger_, ProbeSettings{},
                            &cancel_);
    PolicyApplier applier(editor_, service, probe, cancel_, logger_,
                          std::chrono::milliseconds(0));
    PolicyOutcome outcome = applier.apply(torrc_, preferred, fallback);
    finalState_ = applier.state();
    return outcome;
  }

  void expectRestarts(int times) {
    EXPECT_CALL(runner_,
                run(tornet::CommandSpec{"systemctl", {"restart", "tor"}}))
        .Times(times)
        .WillRepeatedly(Return(commandResult(0)));
  }

  fs::path dir_;
  std::string torrc_;
  ExitPolicyEditor editor_;
  NiceMock<MockCommandRunner> runner_;
  NiceMock<MockHttpFetcher> fetcher_;
  NiceMock<MockProcessLister> processes_;
  RecordingLogger logger_;
  CancellationToken cancel_;
  PolicyState finalState_ = PolicyState::Idle;
};

TEST_F(PolicyApplierTest, PreferredVerifiedStopsWithoutFallback) {
  expectRestarts(1);
  EXPECT_CALL(fetcher_, get(_)).WillOnce(Return(okResponse("185.1.1.1")));

  auto outcome = apply(ExitPolicy::strictCountry("ru"),
                       FallbackSpec::parse("de,nl"));

  EXPECT_TRUE(outcome.preferredVerified);
  EXPECT_FALSE(outcome.fallbackApplied);
  EXPECT_EQ(outcome.ip, std::optional<std::string>("185.1.1.1"));
  EXPECT_EQ(outcome.activePolicy, (ExitPolicy{{"ru"}, true}));
  EXPECT_EQ(editor_.readPolicy(torrc_), (ExitPolicy{{"ru"}, true}));
  EXPECT_EQ(finalState_, PolicyState::Done);
}

TEST_F(PolicyApplierTest, FallbackAnyWritesUnconstrainedPolicy) {
  expectRestarts(2);
  EXPECT_CALL(fetcher_, get(_))
      .WillOnce(Return(failedResponse()))
      .WillOnce(Return(okResponse("51.15.0.1")));

  auto outcome =
      apply(ExitPolicy::strictCountry("ru"), FallbackSpec::parse("any"));

  EXPECT_FALSE(outcome.preferredVerified);
  EXPECT_TRUE(outcome.fallbackApplied);
  EXPECT_TRUE(outcome.fallbackVerified);
  EXPECT_EQ(outcome.ip, std::optional<std::string>("51.15.0.1"));

  const ExitPolicy onDisk = editor_.readPolicy(torrc_);
  EXPECT_TRUE(onDisk.countries.empty());
  EXPECT_FALSE(onDisk.strict);
  EXPECT_TRUE(logger_.contains(tornet::LogLevel::LOG_INFO,
                               "Tor is up after fallback"));
}

TEST_F(PolicyApplierTest, FallbackListIsNonStrictEvenWhenUnverified) {
  expectRestarts(2);
  EXPECT_CALL(fetcher_, get(_)).Times(2).WillRepeatedly(
      Return(failedResponse()));

  auto outcome =
      apply(ExitPolicy::strictCountry("ru"), FallbackSpec::parse("de,nl"));

  EXPECT_TRUE(outcome.fallbackApplied);
  EXPECT_FALSE(outcome.fallbackVerified);
  EXPECT_FALSE(outcome.ip.has_value());
  EXPECT_EQ(editor_.readPolicy(torrc_), (ExitPolicy{{"de", "nl"}, false}));
  EXPECT_TRUE(logger_.contains(tornet::LogLevel::LOG_WARNING,
                               "Fallback also failed"));
  EXPECT_EQ(finalState_, PolicyState::Done);
}

TEST_F(PolicyApplierTest, EmptyFallbackMeansAny) {
  expectRestarts(2);
  ON_CALL(fetcher_, get(_)).WillByDefault(Return(failedResponse()));

  apply(ExitPolicy::strictCountry("ru"), FallbackSpec::parse(""));
  EXPECT_EQ(editor_.readPolicy(torrc_), ExitPolicy::any());
}

TEST_F(PolicyApplierTest, CancelledBeforeStartDoesNothing) {
  cancel_.cancel();
  expectRestarts(0);
  EXPECT_CALL(fetcher_, get(_)).Times(0);

  auto outcome =
      apply(ExitPolicy::strictCountry("ru"), FallbackSpec::parse("any"));
  EXPECT_TRUE(outcome.cancelled);
  EXPECT_FALSE(outcome.preferredVerified);
  EXPECT_EQ(editor_.readPolicy(torrc_), ExitPolicy::any());
}

TEST_F(PolicyApplierTest, CancelDuringGraceStopsBeforeFallback) {
  expectRestarts(1);
  EXPECT_CALL(fetcher_, get(_)).Times(0);

  ServiceController service(runner_, logger_, "tor", dir_.string());
  ConnectivityProbe probe(fetcher_, processes_, logger_, ProbeSettings{},
                          &cancel_);
  PolicyApplier applier(editor_, service, probe, cancel_, logger_,
                        std::chrono::seconds(30));

  std::thread canceller([this] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    cancel_.cancel();
  });
  const auto started = std::chrono::steady_clock::now();
  auto outcome = applier.apply(torrc_, ExitPolicy::strictCountry("ru"),
                               FallbackSpec::parse("de"));
  canceller.join();

  EXPECT_TRUE(outcome.cancelled);
  EXPECT_FALSE(outcome.fallbackApplied);
  EXPECT_LT(std::chrono::steady_clock::now() - started,
            std::chrono::seconds(10));
}

TEST_F(PolicyApplierTest, TorrcErrorsPropagate) {
  fs::remove(torrc_);
  EXPECT_THROW(
      apply(ExitPolicy::strictCountry("ru"), FallbackSpec::parse("any")),
      TorrcReadError);
}

TEST(PolicyStateTest, Names) {
  EXPECT_EQ(toString(PolicyState::TryFallback), "TryFallback");
  EXPECT_EQ(toString(PolicyState::Done), "Done");
}
