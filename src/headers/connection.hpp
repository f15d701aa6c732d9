#pragma once

#include <cstdint>
#include <memory>
#include <string>

using ConnectionId = std::uint64_t;

// One participant's channel into a room. Implemented by the WebSocket
// session; tests substitute their own.
class Connection {
public:
    virtual ~Connection() = default;

    virtual ConnectionId id() const = 0;
    virtual const std::string& roomId() const = 0;
    virtual const std::string& user() const = 0;

    // Hands a frame to the outbound queue. Must not block; frames are
    // written in the order they were delivered. Returns false once the
    // connection is closed.
    virtual bool deliver(std::shared_ptr<const std::string> frame) = 0;
};
