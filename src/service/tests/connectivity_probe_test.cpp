#include <gtest/gtest.h>

#include "../include/cancellation_token.hpp"
#include "../include/connectivity_probe.hpp"
#include "test_doubles.hpp"

using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::NiceMock;
using ::testing::Return;

class ConnectivityProbeTest : public ::testing::Test {
 protected:
  ConnectivityProbe makeProbe() {
    return ConnectivityProbe(fetcher_, processes_, logger_, ProbeSettings{},
                             &cancel_);
  }

  void givenTorRunning(bool running) {
    std::set<pid_t> pids;
    if (running) pids.insert(4242);
    ON_CALL(processes_, findMatching("tor", tornet::MatchMode::ExactName))
        .WillByDefault(Return(pids));
  }

  NiceMock<MockHttpFetcher> fetcher_;
  NiceMock<MockProcessLister> processes_;
  RecordingLogger logger_;
  CancellationToken cancel_;
};

TEST_F(ConnectivityProbeTest, DirectProbeTrimsBody) {
  EXPECT_CALL(fetcher_,
              get(AllOf(Field(&HttpRequest::url, "https://api.ipify.org"),
                        Field(&HttpRequest::proxy, ""),
                        Field(&HttpRequest::timeout, std::chrono::seconds(10)))))
      .WillOnce(Return(okResponse(" 203.0.113.7\n")));

  auto probe = makeProbe();
  EXPECT_EQ(probe.getIpDirect(), std::optional<std::string>("203.0.113.7"));
}

TEST_F(ConnectivityProbeTest, ProxyProbeUsesSocksAndCancellation) {
  EXPECT_CALL(
      fetcher_,
      get(AllOf(Field(&HttpRequest::proxy, "socks5h://127.0.0.1:9050"),
                Field(&HttpRequest::timeout, std::chrono::seconds(15)),
                Field(&HttpRequest::cancel,
                      static_cast<const CancellationToken*>(&cancel_)))))
      .WillOnce(Return(okResponse("198.51.100.1")));

  auto probe = makeProbe();
  EXPECT_EQ(probe.getIpViaProxy(), std::optional<std::string>("198.51.100.1"));
}

TEST_F(ConnectivityProbeTest, DirectFailureWarnsAndReturnsEmpty) {
  ON_CALL(fetcher_, get(_)).WillByDefault(Return(failedResponse()));
  auto probe = makeProbe();

  EXPECT_FALSE(probe.getIpDirect().has_value());
  EXPECT_TRUE(logger_.contains(tornet::LogLevel::LOG_WARNING,
                               "Having trouble fetching IP address"));
}

TEST_F(ConnectivityProbeTest, ProxyFailureWarnsAndReturnsEmpty) {
  ON_CALL(fetcher_, get(_)).WillByDefault(Return(failedResponse()));
  auto probe = makeProbe();

  ProbeResult result = probe.probe(true);
  EXPECT_FALSE(result.succeeded);
  EXPECT_FALSE(result.ip.has_value());
  EXPECT_TRUE(logger_.contains(tornet::LogLevel::LOG_WARNING,
                               "Having trouble connecting to the Tor network"));
}

TEST_F(ConnectivityProbeTest, EmptyBodyIsFailure) {
  ON_CALL(fetcher_, get(_)).WillByDefault(Return(okResponse("  \n")));
  auto probe = makeProbe();
  EXPECT_FALSE(probe.probe(false).succeeded);
}

TEST_F(ConnectivityProbeTest, CurrentIpGoesThroughProxyWhenTorRuns) {
  givenTorRunning(true);
  EXPECT_CALL(fetcher_, get(Field(&HttpRequest::proxy,
                                  "socks5h://127.0.0.1:9050")))
      .WillOnce(Return(okResponse("198.51.100.9")));

  auto probe = makeProbe();
  EXPECT_TRUE(probe.isManagedProcessRunning());
  EXPECT_EQ(probe.getCurrentIp(), std::optional<std::string>("198.51.100.9"));
}

TEST_F(ConnectivityProbeTest, CurrentIpGoesDirectWhenTorStopped) {
  givenTorRunning(false);
  EXPECT_CALL(fetcher_, get(Field(&HttpRequest::proxy, "")))
      .WillOnce(Return(okResponse("203.0.113.8")));

  auto probe = makeProbe();
  EXPECT_FALSE(probe.isManagedProcessRunning());
  EXPECT_EQ(probe.getCurrentIp(), std::optional<std::string>("203.0.113.8"));
}

TEST_F(ConnectivityProbeTest, ProbesAreNeverCached) {
  EXPECT_CALL(fetcher_, get(_))
      .WillOnce(Return(okResponse("1.1.1.1")))
      .WillOnce(Return(okResponse("2.2.2.2")));

  auto probe = makeProbe();
  EXPECT_EQ(probe.getIpDirect(), std::optional<std::string>("1.1.1.1"));
  EXPECT_EQ(probe.getIpDirect(), std::optional<std::string>("2.2.2.2"));
}

TEST_F(ConnectivityProbeTest, InternetCheckAcceptsAnyHttpAnswer) {
  HttpResponse unavailable;
  unavailable.status = 503;
  unavailable.error = "HTTP status 503";
  EXPECT_CALL(fetcher_,
              get(AllOf(Field(&HttpRequest::url, "http://www.google.com"),
                        Field(&HttpRequest::timeout, std::chrono::seconds(5)))))
      .WillOnce(Return(unavailable))
      .WillOnce(Return(failedResponse("Could not resolve host")));

  auto probe = makeProbe();
  EXPECT_TRUE(probe.hasInternetConnection());
  EXPECT_FALSE(probe.hasInternetConnection());
}
