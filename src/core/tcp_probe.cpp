#include "core/tcp_probe.h"
#include "core/resilience_errors.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace {

constexpr std::chrono::milliseconds POLL_SLICE{50};

struct SocketGuard {
  int fd = -1;
  ~SocketGuard() {
    if (fd >= 0) {
      close(fd);
    }
  }
};

struct AddrInfoGuard {
  addrinfo *list = nullptr;
  ~AddrInfoGuard() {
    if (list) {
      freeaddrinfo(list);
    }
  }
};

/**
 * @brief Connect to one resolved address within the shared deadline
 * @return 0 once connected, otherwise the errno the attempt failed with
 * @throws ProbeError if cancelled, past the deadline or on a local error
 */
int connectCandidate(const addrinfo &addr, const TcpEndpoint &endpoint,
                     std::chrono::steady_clock::time_point deadline,
                     std::chrono::milliseconds timeout,
                     const CancellationToken &token) {
  SocketGuard sock;
  sock.fd = socket(addr.ai_family, addr.ai_socktype, addr.ai_protocol);
  if (sock.fd < 0) {
    return errno;
  }

  const int flags = fcntl(sock.fd, F_GETFL, 0);
  if (flags < 0 || fcntl(sock.fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    throw ProbeError("fcntl(O_NONBLOCK) failed: " +
                     std::string(std::strerror(errno)));
  }

  if (::connect(sock.fd, addr.ai_addr, addr.ai_addrlen) < 0) {
    if (errno != EINPROGRESS) {
      return errno;
    }

    while (true) {
      if (token.isCancelled()) {
        throw ProbeError("Connect to " + endpoint.toString() + " cancelled");
      }
      const auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(
              deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        throw ProbeError("Connect to " + endpoint.toString() +
                         " timed out after " +
                         std::to_string(timeout.count()) + "ms");
      }

      const auto slice = std::min(remaining, POLL_SLICE);
      pollfd pfd;
      pfd.fd = sock.fd;
      pfd.events = POLLOUT;
      pfd.revents = 0;
      const int rc = poll(&pfd, 1, static_cast<int>(slice.count()));
      if (rc > 0) {
        break;
      }
      if (rc < 0 && errno != EINTR) {
        throw ProbeError("poll() failed: " + std::string(std::strerror(errno)));
      }
    }

    int error = 0;
    socklen_t len = sizeof(error);
    if (getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &error, &len) < 0) {
      error = errno;
    }
    if (error != 0) {
      return error;
    }
  }

  shutdown(sock.fd, SHUT_RDWR);
  return 0;
}

} // namespace

void tcpConnect(const TcpEndpoint &endpoint, std::chrono::milliseconds timeout,
                const CancellationToken &token) {
  addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  AddrInfoGuard addresses;
  const std::string port = std::to_string(endpoint.port);
  const int rc = getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints,
                             &addresses.list);
  if (rc != 0 || !addresses.list) {
    throw ProbeError("Cannot resolve " + endpoint.toString() + ": " +
                     gai_strerror(rc));
  }

  // A name may resolve to several addresses (e.g. ::1 and 127.0.0.1); the
  // dependency is reachable if any of them accepts
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  int last_error = 0;
  for (const addrinfo *addr = addresses.list; addr; addr = addr->ai_next) {
    last_error = connectCandidate(*addr, endpoint, deadline, timeout, token);
    if (last_error == 0) {
      return;
    }
  }

  throw ProbeError("Connect to " + endpoint.toString() + " failed: " +
                   std::strerror(last_error));
}

HealthProbe makeTcpProbe(TcpEndpoint endpoint,
                         std::chrono::milliseconds connect_timeout,
                         std::chrono::milliseconds slow_threshold,
                         std::shared_ptr<CircuitBreaker> breaker) {
  return [endpoint = std::move(endpoint), connect_timeout, slow_threshold,
          breaker](const CancellationTokenPtr &token) -> ProbeResult {
    const auto started = std::chrono::steady_clock::now();

    if (breaker) {
      // The probe's token stops the retries once the check is abandoned
      breaker->call(
          [endpoint, connect_timeout](const CancellationTokenPtr &attempt) {
            tcpConnect(endpoint, connect_timeout, *attempt);
          },
          "tcp_connect", token);
    } else {
      tcpConnect(endpoint, connect_timeout, *token);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (elapsed > slow_threshold) {
      return ProbeResult::degraded("Slow response from " +
                                   endpoint.toString() + ": " +
                                   std::to_string(elapsed.count()) + "ms");
    }
    return ProbeResult::healthy();
  };
}
