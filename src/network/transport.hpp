/**
 * @file transport.hpp
 * @brief TCP transport for bundle delivery with length-prefixed framing.
 * @author Dimitris Kafetzis
 *
 * Provides both client (connect + send/receive) and server (accept + handle)
 * sides. Messages are framed as [4-byte big-endian length][payload].
 * Uses non-blocking I/O with poll() so every call honours a timeout.
 */

#pragma once

#include "core/result.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace bundle_forwarder {

/**
 * @brief Length-prefixed TCP transport.
 *
 * Wire format per message:
 *   [uint32_t big-endian length][payload bytes]
 *
 * One frame carries one whole bundle, so the frame limit caps the size of
 * a bundle the TCP backend can deliver.
 */
class TcpTransport {
public:
    static constexpr uint32_t MAX_MESSAGE_SIZE = 256 * 1024 * 1024;  // 256 MB
    static constexpr int DEFAULT_BACKLOG = 16;

    TcpTransport();
    ~TcpTransport();

    // Non-copyable
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // ── Client-side ──────────────────────────
    /// @param host IPv4 literal or resolvable host name.
    Result<void> connect(const std::string& host, uint16_t port,
                         uint32_t timeout_ms = 5000);
    Result<void> send(const std::vector<uint8_t>& data, uint32_t timeout_ms = 5000);
    Result<std::vector<uint8_t>> receive(uint32_t timeout_ms = 10000);
    void disconnect();

    // ── Server-side ──────────────────────────
    using MessageHandler = std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)>;

    /// @param port 0 binds an ephemeral port; see bound_port().
    Result<void> listen(uint16_t port, int backlog = DEFAULT_BACKLOG);
    void serve(MessageHandler handler);
    void stop_serving();

    // ── State queries ────────────────────────
    [[nodiscard]] bool is_connected() const noexcept;
    [[nodiscard]] bool is_listening() const noexcept;
    [[nodiscard]] uint16_t bound_port() const noexcept { return bound_port_; }

private:
    // Wire helpers
    static Result<void> send_on_fd(int fd, const std::vector<uint8_t>& data, uint32_t timeout_ms);
    static Result<std::vector<uint8_t>> recv_on_fd(int fd, uint32_t timeout_ms);
    static bool send_all(int fd, const void* buf, size_t len, uint32_t timeout_ms);
    static bool recv_all(int fd, void* buf, size_t len, uint32_t timeout_ms);

    int client_fd_ = -1;
    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::jthread serve_thread_;
    std::atomic<bool> serving_{false};
};

}  // namespace bundle_forwarder
