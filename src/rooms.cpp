#include "headers/rooms.hpp"
#include "headers/log.hpp"

#include <algorithm>


std::shared_ptr<Room> RoomRegistry::getOrCreate(const std::string& room_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room_id);
    if (it != rooms_.end() && !it->second->defunct()) {
        return it->second;
    }

    // A defunct entry is about to be erased by its remover; replace it now.
    auto room = std::make_shared<Room>(room_id);
    rooms_[room_id] = room;
    logging::info("Room created: " + room_id + " (rooms: " + std::to_string(rooms_.size()) + ")");
    return room;
}

bool RoomRegistry::removeIfEmpty(const std::shared_ptr<Room>& room) {
    {
        std::lock_guard<std::mutex> room_lock(room->mutex());
        if (!room->empty()) {
            return false;
        }
        if (room->defunct()) {
            return true;
        }
        room->markDefunct();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room->id());
    if (it != rooms_.end() && it->second == room) {
        rooms_.erase(it);
    }
    logging::info("Room destroyed: " + room->id() + " (rooms: " + std::to_string(rooms_.size()) + ")");
    return true;
}

bool RoomRegistry::removeIfEmpty(const std::string& room_id) {
    std::shared_ptr<Room> room = find(room_id);
    return !room || removeIfEmpty(room);
}

std::shared_ptr<Room> RoomRegistry::find(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room_id);
    return it != rooms_.end() && !it->second->defunct() ? it->second : nullptr;
}

bool RoomRegistry::contains(const std::string& room_id) {
    return find(room_id) != nullptr;
}

std::size_t RoomRegistry::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(rooms_.begin(), rooms_.end(),
        [](const std::pair<const std::string, std::shared_ptr<Room>>& entry) { return !entry.second->defunct(); }));
}
