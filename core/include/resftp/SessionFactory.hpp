// Creates ready-to-use sessions. Invoked once at startup and again on every
// reconnect; implementations keep no per-connection state.
#pragma once
#include "RemoteSession.hpp"
#include <memory>

namespace resftp {

class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    // Dial, handshake, authenticate and start SFTP. No retries.
    // Returns null and fills err (kind Connect or Trust) on failure.
    virtual std::unique_ptr<RemoteSession> connect(Error &err) = 0;
};

} // namespace resftp
