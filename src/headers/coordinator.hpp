#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "connection.hpp"
#include "rooms.hpp"

// Turns connection events into room transitions and fans the resulting
// state out to every member. Shared by all connections; holds no state of
// its own beyond the registry it drives.
class Coordinator {
public:
    Coordinator(RoomRegistry& registry, bool broadcast_on_leave);

    // Joins the connection's room and sends it the current state alone.
    void open(const std::shared_ptr<Connection>& connection);

    // vote / reveal / reset; anything else is dropped without a reply.
    void handleMessage(Connection& connection, std::string_view text);

    // Leave semantics for closes, transport errors and evictions alike.
    // Safe to call more than once.
    void close(Connection& connection);

    RoomRegistry& registry() { return registry_; }

private:
    struct Departure {
        std::string roomId;
        ConnectionId connection;
    };

    // Encodes the room's state once and queues it on every member. Caller
    // holds the room mutex. Members that refuse the frame are returned.
    std::vector<ConnectionId> fanOut(Room& room);

    // Removes each departed connection, destroying rooms that empty out
    // and re-broadcasting to rooms that do not.
    void depart(std::vector<Departure> pending);

    RoomRegistry& registry_;
    bool broadcast_on_leave_;
};
