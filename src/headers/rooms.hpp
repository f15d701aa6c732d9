#pragma once

#include <string>
#include <unordered_map>
#include <mutex>
#include <memory>

#include "room.hpp"

// Process-wide map from room id to Room. Its mutex only covers the map
// and is never held while waiting on a room, so a busy room cannot stall
// lookups for the others.
class RoomRegistry {
public:
    std::shared_ptr<Room> getOrCreate(const std::string& room_id);

    // Runs fn(room) with the room locked, creating the room when absent.
    // A room found defunct after locking was removed in between; the
    // lookup is retried and yields its replacement.
    template <typename Fn>
    std::shared_ptr<Room> join(const std::string& room_id, Fn&& fn) {
        for (;;) {
            std::shared_ptr<Room> room = getOrCreate(room_id);
            std::lock_guard<std::mutex> room_lock(room->mutex());
            if (room->defunct()) {
                continue;
            }
            fn(*room);
            return room;
        }
    }

    // Gives the room up only if it has no members right now. Returns true
    // when the room is gone afterwards.
    bool removeIfEmpty(const std::shared_ptr<Room>& room);
    bool removeIfEmpty(const std::string& room_id);

    std::shared_ptr<Room> find(const std::string& room_id);
    bool contains(const std::string& room_id);
    std::size_t size();

private:
    std::unordered_map<std::string, std::shared_ptr<Room>> rooms_;
    std::mutex mutex_;
};
