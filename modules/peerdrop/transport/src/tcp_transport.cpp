#include "tcp_transport.h"
#include "config_manager.h"
#include "logger.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#if defined(__linux__)
#include <linux/sockios.h>
#endif

#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace {

constexpr int kPollSliceMs = 200;

std::string errno_string(int err) {
    std::ostringstream oss;
    oss << err;
    const char* s = std::strerror(err);
    if (s) {
        oss << " (" << s << ")";
    }
    return oss.str();
}

int send_flags_no_sigpipe() {
#if defined(MSG_NOSIGNAL)
    return MSG_NOSIGNAL;
#else
    return 0;
#endif
}

void set_no_sigpipe_best_effort(int fd) {
#if defined(SO_NOSIGPIPE)
    int one = 1;
    (void)::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#else
    (void)fd;
#endif
}

bool send_all(int fd, const void* buf, size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(buf);
    size_t total = 0;
    while (total < len) {
        const ssize_t n = ::send(fd, p + total, len - total, send_flags_no_sigpipe());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (n == 0) {
            return false;
        }
        total += static_cast<size_t>(n);
    }
    return true;
}

// 1 = filled, 0 = orderly EOF, -1 = error (errno set)
int recv_exact(int fd, void* out, size_t len) {
    uint8_t* p = static_cast<uint8_t*>(out);
    size_t total = 0;
    while (total < len) {
        const ssize_t n = ::recv(fd, p + total, len - total, 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return -1;
        }
        if (n == 0) {
            return 0;
        }
        total += static_cast<size_t>(n);
    }
    return 1;
}

std::string format_address(const sockaddr_storage& addr) {
    char host[INET6_ADDRSTRLEN] = {0};
    uint16_t port = 0;
    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        port = ntohs(in->sin_port);
        return std::string(host) + ":" + std::to_string(port);
    }
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
    inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
    port = ntohs(in6->sin6_port);
    return "[" + std::string(host) + "]:" + std::to_string(port);
}

} // namespace

bool parse_peer_address(const std::string& peer_id, std::string& host, uint16_t& port) {
    std::string host_part;
    std::string port_part;

    if (!peer_id.empty() && peer_id.front() == '[') {
        const auto close = peer_id.find("]:");
        if (close == std::string::npos) {
            return false;
        }
        host_part = peer_id.substr(1, close - 1);
        port_part = peer_id.substr(close + 2);
    } else {
        const auto colon = peer_id.rfind(':');
        if (colon == std::string::npos || colon == 0) {
            return false;
        }
        host_part = peer_id.substr(0, colon);
        port_part = peer_id.substr(colon + 1);
    }

    if (host_part.empty() || port_part.empty() || port_part.size() > 5) {
        return false;
    }
    for (char c : port_part) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    const unsigned long value = std::stoul(port_part);
    if (value == 0 || value > 65535) {
        return false;
    }

    host = host_part;
    port = static_cast<uint16_t>(value);
    return true;
}

// ============================================================================
// TcpConnection
// ============================================================================

std::shared_ptr<TcpConnection> TcpConnection::createOutbound(const std::string& remote_id,
                                                             const std::string& host,
                                                             uint16_t port,
                                                             int connect_timeout_ms) {
    return std::shared_ptr<TcpConnection>(
        new TcpConnection(-1, remote_id, host, port, connect_timeout_ms));
}

std::shared_ptr<TcpConnection> TcpConnection::createInbound(int fd, const std::string& remote_id) {
    return std::shared_ptr<TcpConnection>(new TcpConnection(fd, remote_id, "", 0, 0));
}

TcpConnection::TcpConnection(int fd, std::string remote_id, std::string host, uint16_t port,
                             int connect_timeout_ms)
    : m_fd(fd),
      m_remote_id(std::move(remote_id)),
      m_host(std::move(host)),
      m_port(port),
      m_connect_timeout_ms(connect_timeout_ms) {}

TcpConnection::~TcpConnection() {
    close();
    if (m_worker.joinable()) {
        m_worker.join();
    }
    const int fd = m_fd.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }
}

void TcpConnection::bindChannel(std::shared_ptr<ConnectionChannel> channel) {
    if (m_channel) {
        LOG_WARN("TCP: Channel already bound for " + m_remote_id);
        return;
    }
    m_channel = std::move(channel);
    m_worker = std::thread(&TcpConnection::run, this);
}

bool TcpConnection::send(const std::string& message) {
    if (!isOpen()) {
        return false;
    }
    if (message.size() > kMaxRecordSize) {
        LOG_WARN("TCP: Refusing to send oversized record (" + std::to_string(message.size()) + " bytes)");
        return false;
    }

    const uint32_t length = htonl(static_cast<uint32_t>(message.size()));
    std::string framed;
    framed.reserve(sizeof(length) + message.size());
    framed.append(reinterpret_cast<const char*>(&length), sizeof(length));
    framed.append(message);

    std::lock_guard<std::mutex> lock(m_send_mutex);
    if (!send_all(m_fd.load(), framed.data(), framed.size())) {
        LOG_WARN("TCP: send to " + m_remote_id + " failed: " + errno_string(errno));
        m_open.store(false);
        return false;
    }
    return true;
}

void TcpConnection::close() {
    if (m_closing.exchange(true)) {
        return;
    }
    m_open.store(false);
    const int fd = m_fd.load();
    if (fd >= 0) {
        // Unblocks the reader; the descriptor itself is closed after join.
        ::shutdown(fd, SHUT_RDWR);
    }
}

bool TcpConnection::isOpen() const {
    return m_open.load() && !m_closing.load();
}

size_t TcpConnection::bufferedAmount() const {
#if defined(SIOCOUTQ)
    const int fd = m_fd.load();
    int pending = 0;
    if (fd >= 0 && ::ioctl(fd, SIOCOUTQ, &pending) == 0 && pending > 0) {
        return static_cast<size_t>(pending);
    }
#endif
    return 0;
}

void TcpConnection::run() {
    if (m_fd.load() < 0) {
        std::string error;
        if (!connectSocket(error)) {
            if (!m_closing.load()) {
                LOG_WARN("TCP: Connect to " + m_remote_id + " failed: " + error);
                report(TransportErrorEvent{error});
            }
            return;
        }
    }

    if (m_closing.load()) {
        return;
    }

    const int one = 1;
    (void)::setsockopt(m_fd.load(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    set_no_sigpipe_best_effort(m_fd.load());

    m_open.store(true);
    LOG_INFO("TCP: Connection open with " + m_remote_id);
    if (!report(TransportOpenEvent{})) {
        return;
    }
    readLoop();
}

bool TcpConnection::connectSocket(std::string& error) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    const int rc = ::getaddrinfo(m_host.c_str(), std::to_string(m_port).c_str(), &hints, &results);
    if (rc != 0) {
        error = "cannot resolve " + m_host + ": " + gai_strerror(rc);
        return false;
    }

    error = "no usable address for " + m_host;
    for (addrinfo* ai = results; ai != nullptr && !m_closing.load(); ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            error = "socket() failed: " + errno_string(errno);
            continue;
        }
        m_fd.store(fd);

        const int old_flags = fcntl(fd, F_GETFL, 0);
        (void)fcntl(fd, F_SETFL, old_flags | O_NONBLOCK);

        bool connected = false;
        const int res = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (res == 0) {
            connected = true;
        } else if (errno != EINPROGRESS) {
            error = "connect() failed: " + errno_string(errno);
        } else {
            // Poll in slices so close() can interrupt a pending connect.
            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_connect_timeout_ms);
            error = "connect() timed out";
            while (!m_closing.load() && std::chrono::steady_clock::now() < deadline) {
                pollfd pfd{fd, POLLOUT, 0};
                const int sel = ::poll(&pfd, 1, kPollSliceMs);
                if (sel < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    error = "poll() failed: " + errno_string(errno);
                    break;
                }
                if (sel == 0) {
                    continue;
                }
                int so_error = 0;
                socklen_t slen = sizeof(so_error);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &slen) != 0) {
                    error = "getsockopt(SO_ERROR) failed: " + errno_string(errno);
                } else if (so_error != 0) {
                    error = "connect() failed: " + errno_string(so_error);
                } else {
                    connected = true;
                }
                break;
            }
        }

        if (connected) {
            (void)fcntl(fd, F_SETFL, old_flags);
            ::freeaddrinfo(results);
            return true;
        }
        m_fd.store(-1);
        ::close(fd);
    }

    ::freeaddrinfo(results);
    if (m_closing.load()) {
        error = "connect cancelled";
    }
    return false;
}

void TcpConnection::readLoop() {
    const int fd = m_fd.load();
    std::string failure;
    bool eof = false;

    while (!m_closing.load()) {
        uint32_t length_be = 0;
        int rc = recv_exact(fd, &length_be, sizeof(length_be));
        if (rc == 0) {
            eof = true;
            break;
        }
        if (rc < 0) {
            failure = "recv failed: " + errno_string(errno);
            break;
        }

        const uint32_t length = ntohl(length_be);
        if (length > kMaxRecordSize) {
            failure = "oversized record (" + std::to_string(length) + " bytes)";
            break;
        }

        std::string payload(length, '\0');
        if (length > 0) {
            rc = recv_exact(fd, &payload[0], length);
            if (rc == 0) {
                failure = "connection closed mid-record";
                break;
            }
            if (rc < 0) {
                failure = "recv failed: " + errno_string(errno);
                break;
            }
        }

        if (!report(TransportDataEvent{std::move(payload)})) {
            // Channel closed or overflowed; nothing more can be delivered.
            m_open.store(false);
            ::shutdown(fd, SHUT_RDWR);
            return;
        }
    }

    m_open.store(false);
    if (m_closing.load()) {
        return;  // Local close: the owner already dropped the channel.
    }
    if (eof) {
        LOG_INFO("TCP: " + m_remote_id + " closed the connection");
        report(TransportClosedEvent{});
    } else {
        LOG_WARN("TCP: Connection with " + m_remote_id + " failed: " + failure);
        report(TransportErrorEvent{failure});
        ::shutdown(fd, SHUT_RDWR);
    }
}

bool TcpConnection::report(TransportEvent event) {
    if (!m_channel) {
        return false;
    }
    if (m_channel->push(std::move(event))) {
        return true;
    }
    if (m_channel->isClosed()) {
        return false;
    }
    LOG_WARN("TCP: Inbound channel full for " + m_remote_id + ", dropping connection");
    m_channel->push(TransportErrorEvent{"inbound queue overflow"});
    return false;
}

// ============================================================================
// TcpTransport
// ============================================================================

TcpTransport::Options TcpTransport::optionsFromConfig() {
    ConfigManager& config = ConfigManager::getInstance();
    Options options;
    options.bind_address = config.getBindAddress();
    options.advertise_address = config.getAdvertiseAddress();
    options.listen_port = config.getListenPort();
    options.connect_timeout_ms = config.getConnectTimeoutMs();
    return options;
}

TcpTransport::TcpTransport(Options options)
    : m_options(std::move(options)) {}

TcpTransport::~TcpTransport() {
    stop();
}

std::string TcpTransport::allocateIdentity() {
    if (m_running.load()) {
        return m_identity;
    }
    if (m_options.listen_port < 0 || m_options.listen_port > 65535) {
        throw std::invalid_argument("listen port out of range: " + std::to_string(m_options.listen_port));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(m_options.listen_port));
    if (inet_pton(AF_INET, m_options.bind_address.c_str(), &addr.sin_addr) != 1) {
        throw std::invalid_argument("invalid bind address: " + m_options.bind_address);
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error("socket() failed: " + errno_string(errno));
    }
    const int one = 1;
    (void)::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        const int err = errno;
        ::close(fd);
        throw std::runtime_error("bind(" + m_options.bind_address + ":" +
                                 std::to_string(m_options.listen_port) + ") failed: " + errno_string(err));
    }
    if (::listen(fd, 8) != 0) {
        const int err = errno;
        ::close(fd);
        throw std::runtime_error("listen() failed: " + errno_string(err));
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) != 0) {
        const int err = errno;
        ::close(fd);
        throw std::runtime_error("getsockname() failed: " + errno_string(err));
    }

    m_listen_fd = fd;
    m_bound_port.store(ntohs(bound.sin_port));
    m_identity = m_options.advertise_address + ":" + std::to_string(m_bound_port.load());
    m_running.store(true);
    m_accept_thread = std::thread(&TcpTransport::acceptLoop, this);

    LOG_INFO("TCP: Listening on " + m_options.bind_address + ":" + std::to_string(m_bound_port.load()) +
             ", identity " + m_identity);
    return m_identity;
}

std::shared_ptr<ITransportConnection> TcpTransport::connect(const std::string& remote_id) {
    if (!m_running.load()) {
        throw std::runtime_error("transport has no local identity");
    }
    std::string host;
    uint16_t port = 0;
    if (!parse_peer_address(remote_id, host, port)) {
        throw std::invalid_argument("invalid peer id '" + remote_id + "', expected host:port");
    }
    LOG_INFO("TCP: Dialing " + host + ":" + std::to_string(port));
    return TcpConnection::createOutbound(remote_id, host, port, m_options.connect_timeout_ms);
}

void TcpTransport::setIncomingConnectionCallback(IncomingConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(m_callback_mutex);
    m_incoming_callback = std::move(callback);
}

void TcpTransport::stop() {
    if (!m_running.exchange(false)) {
        return;
    }
    if (m_accept_thread.joinable()) {
        m_accept_thread.join();
    }
    if (m_listen_fd >= 0) {
        ::close(m_listen_fd);
        m_listen_fd = -1;
    }
    LOG_INFO("TCP: Stopped listening");
}

void TcpTransport::acceptLoop() {
    while (m_running.load()) {
        pollfd pfd{m_listen_fd, POLLIN, 0};
        const int sel = ::poll(&pfd, 1, kPollSliceMs);
        if (sel < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("TCP: poll() on listener failed: " + errno_string(errno));
            break;
        }
        if (sel == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        sockaddr_storage peer{};
        socklen_t len = sizeof(peer);
        const int fd = ::accept(m_listen_fd, reinterpret_cast<sockaddr*>(&peer), &len);
        if (fd < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("TCP: accept() failed: " + errno_string(errno));
            }
            continue;
        }

        const std::string remote_id = format_address(peer);
        auto connection = TcpConnection::createInbound(fd, remote_id);
        LOG_INFO("TCP: Accepted connection from " + remote_id);

        IncomingConnectionCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callback_mutex);
            callback = m_incoming_callback;
        }
        if (callback) {
            callback(std::move(connection));
        } else {
            LOG_WARN("TCP: No session to take the connection from " + remote_id);
            connection->close();
        }
    }
}
