#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "connection.hpp"

using json = nlohmann::json;

// Votes are keyed by user name and kept ordered so frames are stable.
using VoteMap = std::map<std::string, json>;

struct RoomState {
    VoteMap votes;
    bool revealed = false;
};

struct LeaveResult {
    bool removed = false;      // the connection was a member
    bool voteDropped = false;  // its user's vote went with it
};

// Membership and vote state of a single room. No I/O happens here; the
// caller holds mutex() around every call.
class Room {
public:
    explicit Room(std::string id);

    Room(const Room&) = delete;
    Room& operator=(const Room&) = delete;

    const std::string& id() const { return id_; }
    std::mutex& mutex() { return mutex_; }

    void join(ConnectionId connection, std::string user, std::weak_ptr<Connection> channel = {});

    // A vote is only dropped when no other connection of the same user
    // is left in the room.
    LeaveResult leave(ConnectionId connection);

    void submitVote(const std::string& user, json value);
    void reveal();
    void reset();

    bool revealed() const { return revealed_; }
    const VoteMap& votes() const { return votes_; }
    RoomState snapshot() const { return RoomState{ votes_, revealed_ }; }

    // Set under mutex() once the registry gives an empty room up. A
    // defunct room never takes members again; readable without the lock.
    bool defunct() const { return defunct_.load(); }
    void markDefunct() { defunct_.store(true); }

    bool empty() const { return members_.empty(); }
    std::size_t memberCount() const { return members_.size(); }
    bool hasMember(ConnectionId connection) const { return members_.count(connection) != 0; }
    std::vector<std::pair<ConnectionId, std::weak_ptr<Connection>>> members() const;

private:
    struct Member {
        std::string user;
        std::weak_ptr<Connection> channel;
    };

    std::string id_;
    std::mutex mutex_;
    std::unordered_map<ConnectionId, Member> members_;
    VoteMap votes_;
    bool revealed_ = false;
    std::atomic<bool> defunct_{ false };
};
