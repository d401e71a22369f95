#ifndef OBDSIM_TCP_BRIDGE_HPP
#define OBDSIM_TCP_BRIDGE_HPP

/**
 * @file tcp_bridge.hpp
 * @brief TCP relay that makes one simulated CAN bus visible to many processes
 *
 * Every message on a bridge connection is one 13-byte codec frame (see
 * can_frame.hpp). The server side accepts any number of peers, feeds every
 * frame they send into a FrameQueue and broadcasts frames to all of them.
 * The client side sends frames and collects everything the server
 * broadcasts into its own FrameQueue.
 *
 * A peer is dropped on the first read error, EOF, short read, malformed
 * frame or write error. A write that stalls for kClientSendTimeout counts
 * as a write error, so a peer that stops reading cannot hold up a broadcast.
 * Dropping one peer never affects the others.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "obdsim/can_bus.hpp"
#include "obdsim/can_frame.hpp"
#include "obdsim/frame_queue.hpp"

namespace obdsim {
namespace bridge {

constexpr const char* kDefaultHost = "127.0.0.1";
constexpr uint16_t kDefaultPort = 55555;
constexpr int kListenBacklog = 5;

/// A peer that leaves a broadcast blocked this long is dropped
constexpr std::chrono::milliseconds kClientSendTimeout{250};

/// Server half: listener, client registry and broadcaster
class BridgeServer {
public:
  struct Statistics {
    uint64_t clients_accepted = 0;
    uint64_t clients_dropped = 0;
    uint64_t frames_received = 0;
    uint64_t frames_broadcast = 0;
    uint64_t write_failures = 0;
    uint64_t malformed_frames = 0;
  };

  /// @param sink Queue receiving every frame any client sends
  explicit BridgeServer(FrameQueue& sink) : sink_(sink) {}
  ~BridgeServer();

  // Non-copyable
  BridgeServer(const BridgeServer&) = delete;
  BridgeServer& operator=(const BridgeServer&) = delete;

  /// Bind, listen and start the accept thread. Port 0 picks an ephemeral port.
  bool start(const std::string& host = kDefaultHost, uint16_t port = kDefaultPort);

  /// Close the listener and every client, join all threads
  void stop();

  bool is_running() const { return running_.load(); }

  /// Port actually bound (valid after a successful start)
  uint16_t port() const { return bound_port_; }

  /// Encode once and write to every registered client. Clients whose write
  /// fails are removed; delivery to the others continues.
  /// @return number of clients the frame was written to
  size_t broadcast(const CANFrame& frame);

  size_t client_count() const;

  Statistics stats() const;

private:
  struct Connection {
    uint64_t id{0};
    int fd{-1};
    std::string peer;
    std::mutex write_mutex;

    ~Connection();
  };

  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void accept_loop();
  void receive_loop(std::shared_ptr<Connection> conn, std::shared_ptr<std::atomic<bool>> done);
  void remove_client(uint64_t id, const char* reason);
  void reap_workers(bool join_all);
  std::vector<std::shared_ptr<Connection>> snapshot_clients() const;

  FrameQueue& sink_;
  int listen_fd_{-1};
  uint16_t bound_port_{0};
  std::atomic<bool> running_{false};
  std::thread accept_thread_;

  // Client registry
  mutable std::mutex registry_mutex_;
  std::map<uint64_t, std::shared_ptr<Connection>> clients_;
  uint64_t next_client_id_{1};

  std::mutex workers_mutex_;
  std::vector<Worker> workers_;

  // Statistics
  std::atomic<uint64_t> clients_accepted_{0};
  std::atomic<uint64_t> clients_dropped_{0};
  std::atomic<uint64_t> frames_received_{0};
  std::atomic<uint64_t> frames_broadcast_{0};
  std::atomic<uint64_t> write_failures_{0};
  std::atomic<uint64_t> malformed_frames_{0};
};

/// Client half: one connection, one receive thread
class BridgeClient : public ICanDriver {
public:
  struct Statistics {
    uint64_t frames_sent = 0;
    uint64_t frames_received = 0;
    uint64_t malformed_frames = 0;
  };

  BridgeClient() = default;
  ~BridgeClient() override;

  // Non-copyable
  BridgeClient(const BridgeClient&) = delete;
  BridgeClient& operator=(const BridgeClient&) = delete;

  /// Connect and start the receive thread
  bool connect(const std::string& host = kDefaultHost, uint16_t port = kDefaultPort);

  /// Shut the socket down and join the receive thread
  void close();

  /// False once the server went away or close() was called
  bool is_connected() const { return connected_.load(); }

  // ICanDriver interface
  bool send(const CANFrame& f) override;
  bool recv(CANFrame& f, std::chrono::milliseconds timeout) override;

  /// Frames broadcast by the server, oldest first
  FrameQueue& inbound() { return inbound_; }

  Statistics stats() const;

private:
  void receive_loop();

  int fd_{-1};
  std::atomic<bool> connected_{false};
  std::thread rx_thread_;
  std::mutex tx_mutex_;
  FrameQueue inbound_;

  std::atomic<uint64_t> frames_sent_{0};
  std::atomic<uint64_t> frames_received_{0};
  std::atomic<uint64_t> malformed_frames_{0};
};

// ============================================================================
// Socket helpers
// ============================================================================

enum class ReadStatus {
  Ok,        ///< Exactly the requested number of bytes was read
  Closed,    ///< Orderly shutdown by the peer (EOF)
  ShortRead, ///< Peer closed mid-frame
  Error      ///< Socket error
};

/// Read exactly `len` bytes, blocking
ReadStatus read_exact(int fd, uint8_t* buf, size_t len);

/// Write all `len` bytes without raising SIGPIPE. Fails on any error,
/// including EAGAIN from a send timeout.
bool write_all(int fd, const uint8_t* data, size_t len);

/// Read one 13-byte frame. When all bytes arrived but do not decode, returns
/// Ok with `malformed` set and `out` untouched.
ReadStatus read_frame(int fd, CANFrame& out, bool& malformed);

const char* read_status_name(ReadStatus status);

} // namespace bridge
} // namespace obdsim

#endif // OBDSIM_TCP_BRIDGE_HPP
