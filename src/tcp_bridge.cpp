#include "obdsim/tcp_bridge.hpp"
#include "obdsim/logging.hpp"
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iterator>
#include <sstream>

namespace obdsim {
namespace bridge {

namespace {

constexpr const char* kLog = "bridge";

// Accept loop wakes this often to notice stop()
constexpr auto kAcceptPoll = std::chrono::milliseconds(100);

bool resolve_ipv4(const std::string& host, uint16_t port, sockaddr_in& out) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* res = nullptr;
  int rc = ::getaddrinfo(host.empty() ? "0.0.0.0" : host.c_str(), nullptr, &hints, &res);
  if (rc != 0 || res == nullptr) {
    logging::error(kLog, "cannot resolve " + host + ": " + gai_strerror(rc));
    return false;
  }

  std::memcpy(&out, res->ai_addr, sizeof(sockaddr_in));
  out.sin_port = htons(port);
  ::freeaddrinfo(res);
  return true;
}

std::string describe_peer(const sockaddr_in& addr) {
  char buf[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
  std::ostringstream oss;
  oss << buf << ':' << ntohs(addr.sin_port);
  return oss.str();
}

void set_no_delay(int fd) {
  int one = 1;
  ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
}

// A send that cannot complete within `timeout` fails with EAGAIN
bool set_send_timeout(int fd, std::chrono::milliseconds timeout) {
  struct timeval tv;
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  return ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

std::string errno_text(const char* what) {
  return std::string(what) + ": " + strerror(errno);
}

} // namespace

// ============================================================================
// Socket helpers
// ============================================================================

ReadStatus read_exact(int fd, uint8_t* buf, size_t len) {
  size_t got = 0;
  while (got < len) {
    ssize_t n = ::recv(fd, buf + got, len - got, 0);
    if (n == 0) {
      return got == 0 ? ReadStatus::Closed : ReadStatus::ShortRead;
    }
    if (n < 0) {
      if (errno == EINTR) continue;
      return ReadStatus::Error;
    }
    got += static_cast<size_t>(n);
  }
  return ReadStatus::Ok;
}

bool write_all(int fd, const uint8_t* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    sent += static_cast<size_t>(n);
  }
  return true;
}

ReadStatus read_frame(int fd, CANFrame& out, bool& malformed) {
  codec::WireFrame wire{};
  malformed = false;

  ReadStatus status = read_exact(fd, wire.data(), wire.size());
  if (status != ReadStatus::Ok) {
    return status;
  }

  if (!codec::decode(wire, out)) {
    malformed = true;
  }
  return ReadStatus::Ok;
}

const char* read_status_name(ReadStatus status) {
  switch (status) {
    case ReadStatus::Ok:        return "ok";
    case ReadStatus::Closed:    return "connection closed";
    case ReadStatus::ShortRead: return "short read";
    case ReadStatus::Error:     return "read error";
    default:                    return "unknown";
  }
}

// ============================================================================
// BridgeServer Implementation
// ============================================================================

BridgeServer::Connection::~Connection() {
  if (fd >= 0) {
    ::close(fd);
  }
}

BridgeServer::~BridgeServer() {
  stop();
}

bool BridgeServer::start(const std::string& host, uint16_t port) {
  if (running_.load()) return false;

  // The accept loop may have exited on its own; release what it left behind
  if (accept_thread_.joinable()) {
    stop();
  }

  sockaddr_in addr{};
  if (!resolve_ipv4(host, port, addr)) return false;

  listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    logging::error(kLog, errno_text("socket"));
    return false;
  }

  int opt = 1;
  ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    logging::error(kLog, errno_text("bind"));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  if (::listen(listen_fd_, kListenBacklog) < 0) {
    logging::error(kLog, errno_text("listen"));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
    bound_port_ = ntohs(bound.sin_port);
  } else {
    bound_port_ = port;
  }

  running_ = true;
  accept_thread_ = std::thread(&BridgeServer::accept_loop, this);

  logging::info(kLog, "TCP server listening on " + describe_peer(bound));
  return true;
}

void BridgeServer::stop() {
  bool was_running = running_.exchange(false);

  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }

  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }

  // Receive threads wake up, find the registry empty and exit
  std::map<uint64_t, std::shared_ptr<Connection>> remaining;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    remaining.swap(clients_);
  }
  for (auto& entry : remaining) {
    ::shutdown(entry.second->fd, SHUT_RDWR);
  }
  remaining.clear();

  reap_workers(true);

  if (was_running) {
    logging::info(kLog, "TCP server stopped");
  }
}

void BridgeServer::accept_loop() {
  while (running_.load()) {
    reap_workers(false);

    fd_set rfds;
    FD_ZERO(&rfds);
    FD_SET(listen_fd_, &rfds);

    struct timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = static_cast<suseconds_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(kAcceptPoll).count());

    int ret = ::select(listen_fd_ + 1, &rfds, nullptr, nullptr, &tv);
    if (ret < 0) {
      if (errno == EINTR) continue;
      logging::error(kLog, errno_text("select"));
      running_ = false;
      break;
    }
    if (ret == 0) continue;  // timeout, re-check running_

    sockaddr_in peer_addr{};
    socklen_t peer_len = sizeof(peer_addr);
    int fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&peer_addr), &peer_len);
    if (fd < 0) {
      if (errno == EBADF || errno == EINVAL || errno == ENOTSOCK) {
        // Listener is gone; start() can bring the server back
        logging::error(kLog, errno_text("accept"));
        running_ = false;
        break;
      }
      if (errno != EINTR && errno != ECONNABORTED) {
        logging::warning(kLog, errno_text("accept"));
      }
      continue;
    }
    set_no_delay(fd);
    if (!set_send_timeout(fd, kClientSendTimeout)) {
      logging::warning(kLog, errno_text("setsockopt(SO_SNDTIMEO)"));
    }

    auto conn = std::make_shared<Connection>();
    conn->fd = fd;
    conn->peer = describe_peer(peer_addr);
    {
      std::lock_guard<std::mutex> lock(registry_mutex_);
      conn->id = next_client_id_++;
      clients_[conn->id] = conn;
    }
    clients_accepted_++;
    logging::info(kLog, "Client connected from " + conn->peer);

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.push_back(Worker{std::thread(&BridgeServer::receive_loop, this, conn, done), done});
  }
}

void BridgeServer::receive_loop(std::shared_ptr<Connection> conn,
                                std::shared_ptr<std::atomic<bool>> done) {
  for (;;) {
    CANFrame frame;
    bool malformed = false;
    ReadStatus status = read_frame(conn->fd, frame, malformed);

    if (status != ReadStatus::Ok) {
      remove_client(conn->id, read_status_name(status));
      break;
    }
    if (malformed) {
      malformed_frames_++;
      remove_client(conn->id, "malformed frame");
      break;
    }

    frames_received_++;
    if (logging::enabled(logging::Level::Debug)) {
      logging::debug(kLog, "rx " + conn->peer + ": " + to_string(frame));
    }
    sink_.push(frame);
  }

  done->store(true);
}

void BridgeServer::remove_client(uint64_t id, const char* reason) {
  std::shared_ptr<Connection> conn;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = clients_.find(id);
    if (it == clients_.end()) return;
    conn = it->second;
    clients_.erase(it);
  }

  // Unblocks the receive thread; the descriptor closes with the last reference
  ::shutdown(conn->fd, SHUT_RDWR);
  clients_dropped_++;
  logging::info(kLog, "Client " + conn->peer + " removed (" + reason + ")");
}

void BridgeServer::reap_workers(bool join_all) {
  std::vector<Worker> finished;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = std::partition(workers_.begin(), workers_.end(), [join_all](const Worker& w) {
      return !join_all && !w.done->load();
    });
    std::move(it, workers_.end(), std::back_inserter(finished));
    workers_.erase(it, workers_.end());
  }

  for (auto& worker : finished) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

std::vector<std::shared_ptr<BridgeServer::Connection>> BridgeServer::snapshot_clients() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  std::vector<std::shared_ptr<Connection>> out;
  out.reserve(clients_.size());
  for (const auto& entry : clients_) {
    out.push_back(entry.second);
  }
  return out;
}

size_t BridgeServer::broadcast(const CANFrame& frame) {
  const codec::WireFrame wire = codec::encode(frame);
  frames_broadcast_++;

  size_t delivered = 0;
  std::vector<uint64_t> failed;

  for (const auto& conn : snapshot_clients()) {
    bool ok;
    {
      std::lock_guard<std::mutex> lock(conn->write_mutex);
      ok = write_all(conn->fd, wire.data(), wire.size());
    }
    if (ok) {
      ++delivered;
    } else {
      write_failures_++;
      failed.push_back(conn->id);
    }
  }

  for (uint64_t id : failed) {
    remove_client(id, "write failed");
  }
  return delivered;
}

size_t BridgeServer::client_count() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return clients_.size();
}

BridgeServer::Statistics BridgeServer::stats() const {
  Statistics s;
  s.clients_accepted = clients_accepted_.load();
  s.clients_dropped = clients_dropped_.load();
  s.frames_received = frames_received_.load();
  s.frames_broadcast = frames_broadcast_.load();
  s.write_failures = write_failures_.load();
  s.malformed_frames = malformed_frames_.load();
  return s;
}

// ============================================================================
// BridgeClient Implementation
// ============================================================================

BridgeClient::~BridgeClient() {
  close();
}

bool BridgeClient::connect(const std::string& host, uint16_t port) {
  close();

  sockaddr_in addr{};
  if (!resolve_ipv4(host, port, addr)) return false;

  fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd_ < 0) {
    logging::error(kLog, errno_text("socket"));
    return false;
  }

  if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    logging::error(kLog, "connect " + describe_peer(addr) + ": " + strerror(err));
    ::close(fd_);
    fd_ = -1;
    return false;
  }
  set_no_delay(fd_);

  connected_ = true;
  rx_thread_ = std::thread(&BridgeClient::receive_loop, this);

  logging::info(kLog, "Connected to " + describe_peer(addr));
  return true;
}

void BridgeClient::close() {
  if (fd_ < 0) return;

  connected_ = false;
  ::shutdown(fd_, SHUT_RDWR);
  if (rx_thread_.joinable()) {
    rx_thread_.join();
  }
  ::close(fd_);
  fd_ = -1;
}

void BridgeClient::receive_loop() {
  for (;;) {
    CANFrame frame;
    bool malformed = false;
    ReadStatus status = read_frame(fd_, frame, malformed);

    if (status != ReadStatus::Ok) {
      if (connected_.load()) {
        logging::info(kLog, std::string("Bridge connection lost (") +
                                read_status_name(status) + ")");
      }
      break;
    }
    if (malformed) {
      malformed_frames_++;
      logging::warning(kLog, "Malformed frame from bridge, dropping connection");
      break;
    }

    frames_received_++;
    inbound_.push(frame);
  }

  connected_ = false;
  ::shutdown(fd_, SHUT_RDWR);
}

bool BridgeClient::send(const CANFrame& f) {
  if (!connected_.load()) return false;

  const codec::WireFrame wire = codec::encode(f);
  bool ok;
  {
    std::lock_guard<std::mutex> lock(tx_mutex_);
    ok = write_all(fd_, wire.data(), wire.size());
  }

  if (!ok) {
    logging::warning(kLog, errno_text("send"));
    connected_ = false;
    return false;
  }
  frames_sent_++;
  return true;
}

bool BridgeClient::recv(CANFrame& f, std::chrono::milliseconds timeout) {
  return inbound_.pop(f, timeout);
}

BridgeClient::Statistics BridgeClient::stats() const {
  Statistics s;
  s.frames_sent = frames_sent_.load();
  s.frames_received = frames_received_.load();
  s.malformed_frames = malformed_frames_.load();
  return s;
}

} // namespace bridge
} // namespace obdsim
