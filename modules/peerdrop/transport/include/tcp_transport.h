#ifndef TCP_TRANSPORT_H
#define TCP_TRANSPORT_H

#include "connection_channel.h"
#include "signaling_service.h"
#include "transport_connection.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief One TCP socket carrying length-prefixed records.
 *
 * Record format: [length: 4 bytes big-endian][payload]. A worker thread
 * (started by bindChannel) connects when outbound, then pushes open, one
 * data event per record, and finally close or error into the channel.
 */
class TcpConnection : public ITransportConnection {
public:
    static constexpr uint32_t kMaxRecordSize = 16u * 1024u * 1024u;

    static std::shared_ptr<TcpConnection> createOutbound(const std::string& remote_id,
                                                         const std::string& host,
                                                         uint16_t port,
                                                         int connect_timeout_ms);
    static std::shared_ptr<TcpConnection> createInbound(int fd, const std::string& remote_id);

    ~TcpConnection() override;

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    const std::string& remotePeerId() const override { return m_remote_id; }
    void bindChannel(std::shared_ptr<ConnectionChannel> channel) override;
    bool send(const std::string& message) override;
    void close() override;
    bool isOpen() const override;
    size_t bufferedAmount() const override;

private:
    TcpConnection(int fd, std::string remote_id, std::string host, uint16_t port, int connect_timeout_ms);

    void run();
    bool connectSocket(std::string& error);
    void readLoop();
    bool report(TransportEvent event);

    std::atomic<int> m_fd;
    const std::string m_remote_id;
    const std::string m_host;
    const uint16_t m_port;
    const int m_connect_timeout_ms;

    std::atomic<bool> m_open{false};
    std::atomic<bool> m_closing{false};
    std::mutex m_send_mutex;

    std::shared_ptr<ConnectionChannel> m_channel;
    std::thread m_worker;
};

/**
 * @brief Direct-address signaling over TCP.
 *
 * The local identity is "advertise_address:port" of a listening socket
 * (port 0 picks an ephemeral port). connect("host:port") dials directly.
 * Accepted connections are identified by the caller's socket address.
 * No NAT traversal.
 */
class TcpTransport : public ISignalingService {
public:
    struct Options {
        std::string bind_address = "0.0.0.0";
        std::string advertise_address = "127.0.0.1";
        int listen_port = 30001;
        int connect_timeout_ms = 15000;
    };

    // Reads the signaling and connection sections of ConfigManager.
    static Options optionsFromConfig();

    explicit TcpTransport(Options options);
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    std::string allocateIdentity() override;
    std::shared_ptr<ITransportConnection> connect(const std::string& remote_id) override;
    void setIncomingConnectionCallback(IncomingConnectionCallback callback) override;

    void stop();
    uint16_t boundPort() const { return m_bound_port.load(); }

private:
    void acceptLoop();

    const Options m_options;

    int m_listen_fd = -1;
    std::atomic<uint16_t> m_bound_port{0};
    std::atomic<bool> m_running{false};
    std::string m_identity;
    std::thread m_accept_thread;

    std::mutex m_callback_mutex;
    IncomingConnectionCallback m_incoming_callback;
};

// "host:port" -> host, port. IPv6 hosts may be bracketed ("[::1]:30001").
bool parse_peer_address(const std::string& peer_id, std::string& host, uint16_t& port);

#endif // TCP_TRANSPORT_H
