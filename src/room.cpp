#include "headers/room.hpp"

#include <algorithm>

Room::Room(std::string id)
    : id_(std::move(id)) {
}

void Room::join(ConnectionId connection, std::string user, std::weak_ptr<Connection> channel) {
    members_[connection] = Member{ std::move(user), std::move(channel) };
}

LeaveResult Room::leave(ConnectionId connection) {
    LeaveResult result;
    auto it = members_.find(connection);
    if (it == members_.end()) {
        return result;
    }

    const std::string user = std::move(it->second.user);
    members_.erase(it);
    result.removed = true;

    bool stillPresent = std::any_of(members_.begin(), members_.end(),
        [&user](const std::pair<const ConnectionId, Member>& m) { return m.second.user == user; });
    if (!stillPresent) {
        result.voteDropped = votes_.erase(user) != 0;
    }
    return result;
}

void Room::submitVote(const std::string& user, json value) {
    // A changed vote invalidates the current reveal.
    if (revealed_) {
        revealed_ = false;
    }
    votes_[user] = std::move(value);
}

void Room::reveal() {
    revealed_ = true;
}

void Room::reset() {
    votes_.clear();
    revealed_ = false;
}

std::vector<std::pair<ConnectionId, std::weak_ptr<Connection>>> Room::members() const {
    std::vector<std::pair<ConnectionId, std::weak_ptr<Connection>>> out;
    out.reserve(members_.size());
    for (const auto& m : members_) {
        out.emplace_back(m.first, m.second.channel);
    }
    return out;
}
