#include <gtest/gtest.h>
#include <unistd.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <thread>

#include "../include/lifecycle_manager.hpp"
#include "test_doubles.hpp"

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class LifecycleManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ON_CALL(runner_, findExecutable("systemctl"))
        .WillByDefault(Return(std::string("/usr/bin/systemctl")));
    ON_CALL(runner_, isPrivileged()).WillByDefault(Return(true));
    ON_CALL(runner_, run(_)).WillByDefault(Return(commandResult(0)));

    hooks_.exit = [this](int status) {
      exitStatus_ = status;
      ++exitCalls_;
    };
    hooks_.kill = [this](pid_t pid, int signum) {
      killed_.push_back(pid);
      lastSignal_ = signum;
      return 0;
    };
  }

  std::unique_ptr<LifecycleManager> makeManager() {
    return std::make_unique<LifecycleManager>(service_, processes_, cancel_,
                                              logger_, "tornet", hooks_);
  }

  NiceMock<MockCommandRunner> runner_;
  NiceMock<MockProcessLister> processes_;
  RecordingLogger logger_;
  CancellationToken cancel_;
  ServiceController service_{runner_, logger_, "tor",
                             std::filesystem::temp_directory_path().string()};
  LifecycleHooks hooks_;
  std::atomic<int> exitStatus_{-1};
  std::atomic<int> exitCalls_{0};
  std::vector<pid_t> killed_;
  int lastSignal_ = 0;
};

TEST_F(LifecycleManagerTest, TerminatePeersSkipsSelf) {
  ON_CALL(processes_, findMatching("tornet", tornet::MatchMode::CommandLine))
      .WillByDefault(Return(std::set<pid_t>{::getpid(), 1111, 2222}));

  auto manager = makeManager();
  EXPECT_EQ(manager->terminatePeers(), 2u);
  EXPECT_EQ(killed_, (std::vector<pid_t>{1111, 2222}));
  EXPECT_EQ(lastSignal_, SIGTERM);
}

TEST_F(LifecycleManagerTest, FailedKillIsNotCounted) {
  ON_CALL(processes_, findMatching("tornet", tornet::MatchMode::CommandLine))
      .WillByDefault(Return(std::set<pid_t>{3333}));
  hooks_.kill = [](pid_t, int) { return -1; };

  auto manager = makeManager();
  EXPECT_EQ(manager->terminatePeers(), 0u);
}

TEST_F(LifecycleManagerTest, ShutdownRunsOnce) {
  EXPECT_CALL(runner_, run(tornet::CommandSpec{"systemctl", {"stop", "tor"}}))
      .Times(1)
      .WillOnce(Return(commandResult(0)));

  auto manager = makeManager();
  EXPECT_TRUE(manager->shutdown());
  EXPECT_FALSE(manager->shutdown());
  EXPECT_TRUE(manager->isShutDown());

  EXPECT_TRUE(logger_.contains(tornet::LogLevel::LOG_WARNING,
                               "Program terminated by user."));
  EXPECT_EQ(logger_.count(tornet::LogLevel::LOG_WARNING), 1u);
}

TEST_F(LifecycleManagerTest, ServiceCannotBeStartedAfterShutdown) {
  EXPECT_CALL(runner_, run(tornet::CommandSpec{"systemctl", {"stop", "tor"}}))
      .WillOnce(Return(commandResult(0)));
  EXPECT_CALL(runner_, run(tornet::CommandSpec{"systemctl", {"start", "tor"}}))
      .Times(0);
  EXPECT_CALL(runner_,
              run(tornet::CommandSpec{"systemctl", {"restart", "tor"}}))
      .Times(0);

  auto manager = makeManager();
  manager->shutdown();

  EXPECT_TRUE(service_.start().skipped);
  EXPECT_TRUE(service_.restart().skipped);
}

TEST_F(LifecycleManagerTest, ShutdownSurvivesMissingServiceManager) {
  ON_CALL(runner_, findExecutable(_)).WillByDefault(Return(std::nullopt));

  auto manager = makeManager();
  EXPECT_TRUE(manager->shutdown());
  EXPECT_TRUE(logger_.contains(tornet::LogLevel::LOG_ERROR,
                               "Failed to stop tor service"));
  EXPECT_TRUE(logger_.contains(tornet::LogLevel::LOG_WARNING,
                               "Program terminated by user."));
}

TEST_F(LifecycleManagerTest, HandleSignalCancelsThenExitsWithZero) {
  auto manager = makeManager();
  manager->handleSignal(SIGINT);

  EXPECT_TRUE(cancel_.isCancelled());
  EXPECT_TRUE(manager->isShutDown());
  EXPECT_EQ(exitCalls_.load(), 1);
  EXPECT_EQ(exitStatus_.load(), 0);
}

TEST_F(LifecycleManagerTest, StopEverythingReports) {
  EXPECT_CALL(runner_, run(tornet::CommandSpec{"systemctl", {"stop", "tor"}}))
      .WillOnce(Return(commandResult(0)));
  ON_CALL(processes_, findMatching("tornet", tornet::MatchMode::CommandLine))
      .WillByDefault(Return(std::set<pid_t>{4444}));

  auto manager = makeManager();
  manager->stopEverything();
  EXPECT_EQ(killed_, (std::vector<pid_t>{4444}));
  EXPECT_TRUE(logger_.contains(tornet::LogLevel::LOG_INFO,
                               "Tor services and tornet processes stopped."));
}

TEST_F(LifecycleManagerTest, InstalledHandlerReactsToRealSignal) {
  auto manager = makeManager();
  manager->install();

  ASSERT_EQ(::kill(::getpid(), SIGTERM), 0);

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (exitCalls_.load() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  EXPECT_EQ(exitCalls_.load(), 1);
  EXPECT_TRUE(cancel_.isCancelled());
  manager.reset();
}
