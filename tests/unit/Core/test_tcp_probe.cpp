#include "core/circuit_breaker.h"
#include "core/service_availability_manager.h"
#include "core/tcp_probe.h"
#include "helpers/fake_scheduler.h"
#include <arpa/inet.h>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;

class TcpEndpointTest : public ::testing::Test {
protected:
  void SetUp() override {
    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(listen_fd_, 0);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ASSERT_EQ(bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr),
                   sizeof(addr)),
              0);
    ASSERT_EQ(listen(listen_fd_, 16), 0);

    socklen_t len = sizeof(addr);
    ASSERT_EQ(getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr),
                          &len),
              0);
    endpoint_.host = "127.0.0.1";
    endpoint_.port = ntohs(addr.sin_port);
  }

  void TearDown() override { closeListener(); }

  void closeListener() {
    if (listen_fd_ >= 0) {
      close(listen_fd_);
      listen_fd_ = -1;
    }
  }

  int listen_fd_ = -1;
  TcpEndpoint endpoint_;
};

TEST_F(TcpEndpointTest, ConnectsToListeningSocket) {
  CancellationToken token;
  EXPECT_NO_THROW(tcpConnect(endpoint_, 1000ms, token));
}

TEST_F(TcpEndpointTest, RefusedConnectionThrows) {
  closeListener();
  CancellationToken token;
  EXPECT_THROW(tcpConnect(endpoint_, 1000ms, token), ProbeError);
}

TEST_F(TcpEndpointTest, UnresolvableHostThrows) {
  CancellationToken token;
  TcpEndpoint endpoint{"host.invalid", 80};
  EXPECT_THROW(tcpConnect(endpoint, 1000ms, token), ProbeError);
}

TEST_F(TcpEndpointTest, ConnectsByHostnameWhenAnyAddressAccepts) {
  // localhost may resolve to ::1 ahead of 127.0.0.1; only IPv4 listens here
  TcpEndpoint endpoint{"localhost", endpoint_.port};
  CancellationToken token;
  EXPECT_NO_THROW(tcpConnect(endpoint, 1000ms, token));
}

TEST_F(TcpEndpointTest, ProbeReportsHealthy) {
  HealthProbe probe = makeTcpProbe(endpoint_, 1000ms, 5000ms);
  auto token = std::make_shared<CancellationToken>();
  ProbeResult result = probe(token);
  EXPECT_EQ(result.status, ServiceStatus::Healthy);
  EXPECT_TRUE(result.message.empty());
}

TEST_F(TcpEndpointTest, ProbeThroughBreakerRetriesThenFails) {
  closeListener();

  FakeScheduler scheduler;
  CircuitBreakerConfig config;
  config.failure_threshold = 2;
  config.max_retry_attempts = 3;
  config.base_delay = 100ms;
  config.max_delay = 1000ms;
  config.timeout = 1000ms;
  auto breaker = std::make_shared<CircuitBreaker>("database", config, scheduler);

  HealthProbe probe = makeTcpProbe(endpoint_, 500ms, 5000ms, breaker);
  auto token = std::make_shared<CancellationToken>();

  EXPECT_THROW(probe(token), ProbeError);
  EXPECT_EQ(breaker->getStats().total_attempts, 3u);
  EXPECT_EQ(breaker->getFailureHistory().at("tcp_connect"), 1u);

  EXPECT_THROW(probe(token), ProbeError);
  EXPECT_EQ(breaker->getState(), CircuitBreaker::State::Open);

  // Open breaker fails fast without touching the network
  EXPECT_THROW(probe(token), CircuitOpenError);
  EXPECT_EQ(breaker->getStats().total_attempts, 6u);
}

class TcpConnectRetryTest : public TcpEndpointTest {
protected:
  void SetUp() override {
    TcpEndpointTest::SetUp();
    closeListener();

    CircuitBreakerConfig config;
    config.failure_threshold = 1;
    config.max_retry_attempts = 5;
    config.base_delay = 300ms;
    config.max_delay = 5000ms;
    config.timeout = 1000ms;
    breaker_ = std::make_shared<CircuitBreaker>("database", config, scheduler_);
  }

  void expectRetriesStopped() {
    // Long enough for the remaining attempts and backoffs to have started
    std::this_thread::sleep_for(1500ms);
    const CircuitBreaker::Stats stats = breaker_->getStats();
    EXPECT_LE(stats.total_attempts, 1u);
    EXPECT_EQ(stats.failed_calls, 0u);
    EXPECT_EQ(stats.state, CircuitBreaker::State::Closed);
    EXPECT_TRUE(breaker_->getFailureHistory().empty());
    EXPECT_EQ(scheduler_.runningTasks(), 0u);
  }

  SystemScheduler scheduler_;
  std::shared_ptr<CircuitBreaker> breaker_;
};

TEST_F(TcpConnectRetryTest, CancelledCheckStopsBreakerRetries) {
  AvailabilityConfig availability;
  availability.probe_timeout = 10000ms;
  ServiceAvailabilityManager manager(scheduler_, availability);
  manager.registerProbe(ServiceType::Database,
                        makeTcpProbe(endpoint_, 100ms, 1000ms, breaker_));

  auto cancel = std::make_shared<CancellationToken>();
  std::thread canceller([cancel] {
    std::this_thread::sleep_for(100ms);
    cancel->cancel();
  });
  EXPECT_THROW(manager.checkAllServices(cancel), OperationCancelled);
  canceller.join();

  expectRetriesStopped();
}

TEST_F(TcpConnectRetryTest, TimedOutCheckStopsBreakerRetries) {
  AvailabilityConfig availability;
  availability.probe_timeout = 150ms;
  ServiceAvailabilityManager manager(scheduler_, availability);
  manager.registerProbe(ServiceType::Database,
                        makeTcpProbe(endpoint_, 100ms, 1000ms, breaker_));

  auto results = manager.checkAllServices();
  EXPECT_EQ(results.at(ServiceType::Database).status, ServiceStatus::Failed);

  expectRetriesStopped();
}
