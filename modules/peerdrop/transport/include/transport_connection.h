#ifndef TRANSPORT_CONNECTION_H
#define TRANSPORT_CONNECTION_H

#include "connection_channel.h"
#include <cstddef>
#include <memory>
#include <string>

// Reliable, ordered, message-based link to one remote peer.
class ITransportConnection {
public:
    virtual ~ITransportConnection() = default;

    virtual const std::string& remotePeerId() const = 0;

    // Attaches the channel that receives open/data/close/error for this link.
    // Called exactly once, before the transport reports any event.
    virtual void bindChannel(std::shared_ptr<ConnectionChannel> channel) = 0;

    // Queues one message. Returns false if the link is not open.
    virtual bool send(const std::string& message) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Outbound bytes accepted by send() but not yet handed to the network.
    virtual size_t bufferedAmount() const { return 0; }
};

#endif // TRANSPORT_CONNECTION_H
