#ifndef SIGNALING_SERVICE_H
#define SIGNALING_SERVICE_H

#include "transport_connection.h"
#include <functional>
#include <memory>
#include <string>

// Allocates the local identity and brokers connection setup.
class ISignalingService {
public:
    // May be invoked from a transport thread.
    using IncomingConnectionCallback = std::function<void(std::shared_ptr<ITransportConnection>)>;

    virtual ~ISignalingService() = default;

    // Throws std::runtime_error when the service is unreachable.
    virtual std::string allocateIdentity() = 0;

    // Starts connecting to remote_id. The returned link reports "open" later
    // through its channel. Throws on immediate failure (bad id, no identity).
    virtual std::shared_ptr<ITransportConnection> connect(const std::string& remote_id) = 0;

    virtual void setIncomingConnectionCallback(IncomingConnectionCallback callback) = 0;
};

#endif // SIGNALING_SERVICE_H
