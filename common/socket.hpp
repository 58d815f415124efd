#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <stdexcept>
#include <vector>

class TcpSocket {
public:
    TcpSocket() = default;
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: resolve host (name or dotted IPv4) and connect to the first
    // address that accepts.
    void connect(const std::string& host, u16 port);

    // Server: bind + listen. Port 0 picks an ephemeral port (see local_port).
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 16);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send exactly 'len' bytes; throws on error
    void send_all(const void* buf, size_t len);

    // Receive exactly 'len' bytes; returns false on clean close or timeout
    bool recv_all(void* buf, size_t len);

    // Send a complete frame (header + payload)
    void write_frame(MsgType type, u16 flags, const void* payload, u32 payload_len);

    // Read next frame: fills header, resizes payload_buf and reads payload
    // Returns false on clean close (peer disconnected) or timeout
    bool read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf);

    void tune();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    void close();

    std::string peer_addr() const;
    u16 local_port() const;

    // Set receive timeout in milliseconds (0 = infinite)
    void set_recv_timeout_ms(int ms);

private:
    socket_t fd_{INVALID_SOCKET_VAL};

    void apply_socket_opts();
};
