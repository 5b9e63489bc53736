// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "errors.hpp"
#include <cstring>
#include <string>
#include <vector>
#include <algorithm>

#include <sys/uio.h>
#include <poll.h>

// Buffer size for SO_SNDBUF / SO_RCVBUF = 1 MB
static constexpr int SOCKET_BUF_SIZE = 1024 * 1024;

static ConnectionError io_error(const char* what, int err) {
    if (would_block(err)) {
        return ConnectionError(ConnectionErrc::TIMEOUT,
            std::string(what) + " timed out");
    }
    return ConnectionError(ConnectionErrc::BROKEN,
        std::string(what) + " failed: " + socket_error_str(err));
}

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
    int sndbuf = SOCKET_BUF_SIZE;
    int rcvbuf = SOCKET_BUF_SIZE;
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,   &sndbuf,  sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,   &rcvbuf,  sizeof(rcvbuf));
}

// Non-blocking connect bounded by poll(), then back to blocking mode
static bool connect_with_timeout(socket_t fd, const sockaddr* addr, socklen_t len,
                                 int timeout_ms, int& err) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (timeout_ms > 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, addr, len);
    if (rc != 0 && errno == EINPROGRESS && timeout_ms > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        do {
            rc = ::poll(&pfd, 1, timeout_ms);
        } while (rc < 0 && errno == EINTR);
        if (rc == 0) {
            err = ETIMEDOUT;
            return false;
        }
        if (rc < 0) {
            err = errno;
            return false;
        }
        int so_err = 0;
        socklen_t so_len = sizeof(so_err);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &so_len);
        if (so_err != 0) {
            err = so_err;
            return false;
        }
        rc = 0;
    } else if (rc != 0) {
        err = errno;
        return false;
    }

    fcntl(fd, F_SETFL, flags);
    return true;
}

void TcpSocket::connect(const std::string& host, u16 port, int timeout_ms) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int gai = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
        throw ConnectionError(ConnectionErrc::REFUSED,
            "cannot resolve " + host + ": " + gai_strerror(gai));
    }

    int last_err = ECONNREFUSED;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        socket_t fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd == INVALID_SOCKET_VAL) {
            last_err = errno;
            continue;
        }
        if (connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, timeout_ms, last_err)) {
            ::freeaddrinfo(res);
            close();
            fd_ = fd;
            apply_socket_opts();
            tune();
            return;
        }
        CLOSE_SOCKET(fd);
    }
    ::freeaddrinfo(res);

    std::string where = host + ":" + port_str;
    if (last_err == ETIMEDOUT) {
        throw ConnectionError(ConnectionErrc::TIMEOUT, "connect to " + where + " timed out");
    }
    throw ConnectionError(ConnectionErrc::REFUSED,
        "connect to " + where + " failed: " + socket_error_str(last_err));
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    close();
    fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw ConnectionError(ConnectionErrc::BROKEN,
            "socket() failed: " + socket_error_str(last_socket_error()));
    }
    apply_socket_opts();

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw ConnectionError(ConnectionErrc::REFUSED, "Invalid IP address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw ConnectionError(ConnectionErrc::REFUSED,
            "bind() failed: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SOCKET_ERROR_VAL) {
        throw ConnectionError(ConnectionErrc::REFUSED,
            "listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
    socklen_t peer_len = sizeof(peer);
    socket_t client;
    do {
        client = ::accept4(fd_, (sockaddr*)&peer, &peer_len, SOCK_CLOEXEC);
    } while (client == INVALID_SOCKET_VAL && errno == EINTR);
    if (client == INVALID_SOCKET_VAL) {
        throw ConnectionError(ConnectionErrc::BROKEN,
            "accept() failed: " + socket_error_str(last_socket_error()));
    }
    TcpSocket s(client);
    s.tune();
    return s;
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
        if (sent < 0) {
            int err = last_socket_error();
            if (err == EINTR) continue;
            throw io_error("send()", err);
        }
        if (sent == 0) {
            throw ConnectionError(ConnectionErrc::BROKEN, "Connection closed during send");
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
        if (received == 0) {
            if (remaining == len) return false; // clean close
            throw ConnectionError(ConnectionErrc::BROKEN,
                "connection closed after " + std::to_string(len - remaining) +
                " of " + std::to_string(len) + " bytes");
        }
        if (received < 0) {
            int err = last_socket_error();
            if (err == EINTR) continue;
            throw io_error("recv()", err);
        }
        p += received;
        remaining -= static_cast<size_t>(received);
    }
    return true;
}

size_t TcpSocket::recv_some(void* buf, size_t len) {
    for (;;) {
        ssize_t received = ::recv(fd_, buf, len, 0);
        if (received >= 0) return static_cast<size_t>(received);
        int err = last_socket_error();
        if (err == EINTR) continue;
        throw io_error("recv()", err);
    }
}

void TcpSocket::write_frame(const proto::AdbFrame& frame) {
    if (frame.payload.size() > FASTADB_MAX_PAYLOAD) {
        throw ProtocolError(ProtocolErrc::PAYLOAD_TOO_LARGE,
            "payload too large: " + std::to_string(frame.payload.size()));
    }
    u8 hdr_buf[proto::ADB_HEADER_SIZE];
    proto::encode_header(proto::make_header(frame), hdr_buf);

    const size_t payload_len = frame.payload.size();
    if (payload_len == 0) {
        send_all(hdr_buf, sizeof(hdr_buf));
        return;
    }

    // sendmsg: header + payload in one syscall, handle partial sends.
    // MSG_NOSIGNAL turns a closed peer into EPIPE instead of SIGPIPE.
    size_t total = sizeof(hdr_buf) + payload_len;
    size_t sent_total = 0;
    while (sent_total < total) {
        struct iovec cur[2];
        int cur_cnt = 0;
        size_t skip = sent_total;
        for (int i = 0; i < 2; ++i) {
            size_t seg_len = (i == 0) ? sizeof(hdr_buf) : payload_len;
            const u8* seg_base = (i == 0) ? hdr_buf : frame.payload.data();
            if (skip >= seg_len) { skip -= seg_len; continue; }
            cur[cur_cnt].iov_base = const_cast<u8*>(seg_base + skip);
            cur[cur_cnt].iov_len  = seg_len - skip;
            skip = 0;
            ++cur_cnt;
        }
        struct msghdr msg{};
        msg.msg_iov    = cur;
        msg.msg_iovlen = (size_t)cur_cnt;
        ssize_t n = ::sendmsg(fd_, &msg, MSG_NOSIGNAL);
        if (n < 0) {
            int err = last_socket_error();
            if (err == EINTR) continue;
            throw io_error("sendmsg()", err);
        }
        sent_total += (size_t)n;
    }
}

bool TcpSocket::read_frame(proto::AdbFrame& frame) {
    u8 hdr_buf[proto::ADB_HEADER_SIZE];
    if (!recv_all(hdr_buf, sizeof(hdr_buf))) return false;
    AdbMessageHdr hdr = proto::decode_header(hdr_buf);
    proto::validate_header(hdr);

    frame.command = hdr.command;
    frame.arg0    = hdr.arg0;
    frame.arg1    = hdr.arg1;
    frame.payload.resize(hdr.data_length);
    if (hdr.data_length > 0 && !recv_all(frame.payload.data(), hdr.data_length)) {
        throw ConnectionError(ConnectionErrc::BROKEN,
            "connection closed inside " + proto::id_to_string(hdr.command) + " frame");
    }
    proto::verify_payload(hdr, frame.payload.data());
    return true;
}

void TcpSocket::shutdown_write() {
    if (fd_ != INVALID_SOCKET_VAL) ::shutdown(fd_, SHUT_WR);
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
    if (getsockname(fd_, (sockaddr*)&local, &len) != 0) return 0;
    return ntohs(local.sin_port);
}

static void set_timeout_opt(socket_t fd, int opt, int ms) {
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, opt, &tv, sizeof(tv));
}

void TcpSocket::set_recv_timeout_ms(int ms) {
    set_timeout_opt(fd_, SO_RCVTIMEO, ms);
}

void TcpSocket::set_send_timeout_ms(int ms) {
    set_timeout_opt(fd_, SO_SNDTIMEO, ms);
}
