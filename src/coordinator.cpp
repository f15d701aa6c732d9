#include "headers/coordinator.hpp"
#include "headers/log.hpp"
#include "headers/protocol.hpp"

Coordinator::Coordinator(RoomRegistry& registry, bool broadcast_on_leave)
    : registry_(registry), broadcast_on_leave_(broadcast_on_leave) {
}

void Coordinator::open(const std::shared_ptr<Connection>& connection) {
    std::size_t members = 0;

    // The initial frame is queued under the room lock so that no
    // broadcast can reach the new member ahead of it.
    registry_.join(connection->roomId(), [&](Room& room) {
        room.join(connection->id(), connection->user(), connection);
        members = room.memberCount();
        auto frame = std::make_shared<const std::string>(protocol::encodeState(room.snapshot()));
        if (!connection->deliver(std::move(frame))) {
            logging::debug("Initial state not delivered to connection " + std::to_string(connection->id()));
        }
    });

    logging::info("User " + connection->user() + " joined room " + connection->roomId()
        + " (members: " + std::to_string(members) + ")");
}

void Coordinator::handleMessage(Connection& connection, std::string_view text) {
    protocol::InboundMessage msg = protocol::parseMessage(text);
    if (msg.type == protocol::MessageType::Unknown) {
        logging::debug("Ignoring frame from " + connection.user() + ": " + std::string(text.substr(0, 128)));
        return;
    }

    std::shared_ptr<Room> room = registry_.find(connection.roomId());
    if (!room) {
        return;
    }

    std::vector<ConnectionId> refused;
    {
        std::lock_guard<std::mutex> lock(room->mutex());
        if (!room->hasMember(connection.id())) {
            return;
        }

        switch (msg.type) {
        case protocol::MessageType::Vote:
            room->submitVote(connection.user(), std::move(msg.value));
            break;
        case protocol::MessageType::Reveal:
            room->reveal();
            break;
        case protocol::MessageType::Reset:
            room->reset();
            break;
        case protocol::MessageType::Unknown:
            return;
        }
        refused = fanOut(*room);
    }

    std::vector<Departure> pending;
    for (ConnectionId id : refused) {
        pending.push_back(Departure{ room->id(), id });
    }
    depart(std::move(pending));
}

void Coordinator::close(Connection& connection) {
    depart({ Departure{ connection.roomId(), connection.id() } });
}

std::vector<ConnectionId> Coordinator::fanOut(Room& room) {
    auto frame = std::make_shared<const std::string>(protocol::encodeState(room.snapshot()));

    std::vector<ConnectionId> refused;
    for (const auto& member : room.members()) {
        std::shared_ptr<Connection> channel = member.second.lock();
        if (!channel || !channel->deliver(frame)) {
            refused.push_back(member.first);
        }
    }
    return refused;
}

void Coordinator::depart(std::vector<Departure> pending) {
    while (!pending.empty()) {
        Departure next = std::move(pending.back());
        pending.pop_back();

        std::shared_ptr<Room> room = registry_.find(next.roomId);
        if (!room) {
            continue;
        }

        LeaveResult left;
        {
            std::lock_guard<std::mutex> lock(room->mutex());
            left = room->leave(next.connection);
        }
        if (!left.removed) {
            continue;
        }

        logging::info("Connection " + std::to_string(next.connection) + " left room " + next.roomId
            + (left.voteDropped ? " (vote removed)" : ""));

        if (registry_.removeIfEmpty(room) || !broadcast_on_leave_) {
            continue;
        }

        std::vector<ConnectionId> refused;
        {
            std::lock_guard<std::mutex> lock(room->mutex());
            refused = fanOut(*room);
        }
        for (ConnectionId id : refused) {
            pending.push_back(Departure{ next.roomId, id });
        }
    }
}
