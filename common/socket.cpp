// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "protocol_io.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/uio.h>
#include <sys/time.h>

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {
    if (fd_ != INVALID_SOCKET_VAL) {
        apply_socket_opts();
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    int on = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &keepalive, sizeof(keepalive));
}

void TcpSocket::connect(const std::string& host, u16 port) {
    close();

    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0) {
        throw std::runtime_error("getaddrinfo(" + host + ") failed: " + gai_strerror(rc));
    }

    int last_err = 0;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        socket_t fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd == INVALID_SOCKET_VAL) {
            last_err = last_socket_error();
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == SOCKET_ERROR_VAL) {
            last_err = last_socket_error();
            CLOSE_SOCKET(fd);
            continue;
        }
        fd_ = fd;
        break;
    }
    ::freeaddrinfo(res);

    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("connect(" + host + ":" + std::to_string(port) +
                                 ") failed: " + socket_error_str(last_err));
    }
    apply_socket_opts();
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    close();
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("socket() failed: " + socket_error_str(last_socket_error()));
    }
    apply_socket_opts();

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid IP address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("bind() failed: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
    socklen_t peer_len = sizeof(peer);
    socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
    if (client == INVALID_SOCKET_VAL) {
        throw std::runtime_error("accept() failed: " + socket_error_str(last_socket_error()));
    }
    return TcpSocket(client);
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent == 0) {
                throw std::runtime_error("Connection closed during send");
            }
            int err = last_socket_error();
            if (err == EINTR) continue;
            throw std::runtime_error("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

bool TcpSocket::recv_all(void* buf, size_t len) {
    char* p = static_cast<char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t received = ::recv(fd_, p, remaining, 0);
        if (received == 0) return false; // clean close
        if (received < 0) {
            int err = last_socket_error();
            if (err == EINTR) continue;
            if (would_block(err)) {
                // SO_RCVTIMEO expired
                return false;
            }
            throw std::runtime_error("recv() failed: " + socket_error_str(err));
        }
        p += received;
        remaining -= static_cast<size_t>(received);
    }
    return true;
}

void TcpSocket::write_frame(MsgType type, u16 flags, const void* payload, u32 payload_len) {
    u8 hdr_buf[8];
    FrameHeader hdr;
    hdr.msg_type    = static_cast<u16>(type);
    hdr.flags       = flags;
    hdr.payload_len = payload_len;
    proto::encode_header(hdr, hdr_buf);

    if (payload_len == 0 || !payload) {
        send_all(hdr_buf, 8);
        return;
    }

    // writev: merge header + payload into one syscall, handle partial sends
    size_t total = 8 + payload_len;
    size_t sent_total = 0;
    while (sent_total < total) {
        struct iovec cur[2];
        int cur_cnt = 0;
        size_t skip = sent_total;
        for (int i = 0; i < 2; ++i) {
            size_t seg_len = (i == 0) ? 8 : (size_t)payload_len;
            const char* seg_base = (i == 0) ? reinterpret_cast<const char*>(hdr_buf)
                                             : static_cast<const char*>(payload);
            if (skip >= seg_len) { skip -= seg_len; continue; }
            cur[cur_cnt].iov_base = const_cast<char*>(seg_base + skip);
            cur[cur_cnt].iov_len  = seg_len - skip;
            skip = 0;
            ++cur_cnt;
        }
        ssize_t n = ::writev(fd_, cur, cur_cnt);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("writev failed: " + socket_error_str(errno));
        }
        sent_total += static_cast<size_t>(n);
    }
}

bool TcpSocket::read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf) {
    u8 hdr_buf[8];
    if (!recv_all(hdr_buf, 8)) return false;
    hdr = proto::decode_header(hdr_buf);
    if (hdr.payload_len > MAX_PAYLOAD_LEN) {
        throw std::runtime_error("Payload too large: " + std::to_string(hdr.payload_len));
    }
    payload_buf.resize(hdr.payload_len);
    if (hdr.payload_len > 0) {
        if (!recv_all(payload_buf.data(), hdr.payload_len)) return false;
    }
    return true;
}

void TcpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
        }
    }
    return "unknown";
}

u16 TcpSocket::local_port() const {
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (getsockname(fd_, (sockaddr*)&local, &len) != 0) {
        throw std::runtime_error("getsockname() failed: " + socket_error_str(last_socket_error()));
    }
    return ntohs(local.sin_port);
}

void TcpSocket::set_recv_timeout_ms(int ms) {
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}
