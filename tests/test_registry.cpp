#include "headers/log.hpp"
#include "headers/rooms.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

// Test 1: rooms appear on first use and are shared afterwards
void test_get_or_create() {
    std::cout << "\n=== Test 1: getOrCreate ===" << std::endl;
    RoomRegistry registry;
    assert(!registry.contains("R1"));
    assert(registry.find("R1") == nullptr);

    auto a = registry.getOrCreate("R1");
    auto b = registry.getOrCreate("R1");
    assert(a && a == b && "Same id must yield the same room");
    assert(registry.contains("R1"));
    assert(registry.size() == 1);

    registry.getOrCreate("R2");
    assert(registry.size() == 2);
    std::cout << "✓ Test 1 PASSED" << std::endl;
}

// Test 2: removeIfEmpty only removes rooms without members
void test_remove_if_empty() {
    std::cout << "\n=== Test 2: removeIfEmpty ===" << std::endl;
    RoomRegistry registry;
    registry.join("R1", [](Room& room) { room.join(1, "alice"); });

    assert(!registry.removeIfEmpty("R1") && "Occupied room must stay");
    assert(registry.contains("R1"));

    auto room = registry.find("R1");
    {
        std::lock_guard<std::mutex> lock(room->mutex());
        room->leave(1);
    }
    assert(registry.removeIfEmpty("R1"));
    assert(!registry.contains("R1"));
    assert(registry.removeIfEmpty("R1") && "Absent room counts as removed");
    std::cout << "✓ Test 2 PASSED" << std::endl;
}

// Test 3: lifecycle of a room id across first join and last leave
void test_room_lifecycle() {
    std::cout << "\n=== Test 3: Room Lifecycle ===" << std::endl;
    RoomRegistry registry;
    assert(!registry.contains("R1"));

    registry.join("R1", [](Room& room) { room.join(1, "alice"); });
    assert(registry.contains("R1"));
    registry.join("R1", [](Room& room) { room.join(2, "bob"); });

    auto room = registry.find("R1");
    {
        std::lock_guard<std::mutex> lock(room->mutex());
        room->leave(1);
    }
    assert(!registry.removeIfEmpty("R1"));
    {
        std::lock_guard<std::mutex> lock(room->mutex());
        room->leave(2);
    }
    assert(registry.removeIfEmpty("R1"));
    assert(!registry.contains("R1"));

    // A later join starts over with a fresh room.
    auto fresh = registry.join("R1", [](Room& r) { r.join(3, "carol"); });
    assert(fresh != room);
    assert(fresh->votes().empty());
    std::cout << "✓ Test 3 PASSED" << std::endl;
}

// Test 4: concurrent join/leave churn never strands a member in a
// room that is no longer registered
void test_concurrent_churn() {
    std::cout << "\n=== Test 4: Concurrent Join/Leave Churn ===" << std::endl;
    RoomRegistry registry;
    const int threads = 8;
    const int rounds = 2000;
    std::atomic<bool> orphaned{ false };

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t]() {
            const std::string room_id = "R" + std::to_string(t % 2);
            for (int i = 0; i < rounds; ++i) {
                ConnectionId id = static_cast<ConnectionId>(t) * rounds + i + 1;
                auto room = registry.join(room_id, [&](Room& r) { r.join(id, "user" + std::to_string(t)); });

                if (registry.find(room_id) != room) {
                    orphaned = true;
                }

                {
                    std::lock_guard<std::mutex> lock(room->mutex());
                    room->submitVote("user" + std::to_string(t), i);
                    room->leave(id);
                }
                registry.removeIfEmpty(room_id);
            }
        });
    }
    for (auto& w : workers) w.join();

    assert(!orphaned && "A joined room must be the registered one");
    assert(registry.size() == 0 && "All rooms must be gone after the last leave");
    std::cout << "✓ Test 4 PASSED" << std::endl;
}

// Test 5: rooms do not share state
void test_rooms_are_independent() {
    std::cout << "\n=== Test 5: Rooms Are Independent ===" << std::endl;
    RoomRegistry registry;
    auto r1 = registry.join("R1", [](Room& room) {
        room.join(1, "alice");
        room.submitVote("alice", "5");
        room.reveal();
    });
    auto r2 = registry.join("R2", [](Room& room) { room.join(2, "alice"); });

    assert(r1 != r2);
    assert(r1->revealed() && !r2->revealed());
    assert(r2->votes().empty());
    std::cout << "✓ Test 5 PASSED" << std::endl;
}

// Test 6: a room held busy does not stall lookups, joins or removals in
// other rooms
void test_busy_room_does_not_block_others() {
    std::cout << "\n=== Test 6: Busy Room Does Not Block Others ===" << std::endl;
    RoomRegistry registry;
    auto r1 = registry.join("R1", [](Room& room) { room.join(1, "alice"); });
    std::unique_lock<std::mutex> busy(r1->mutex());

    // Both wait on R1 for as long as it is held.
    auto joining = std::async(std::launch::async, [&]() {
        registry.join("R1", [](Room& room) { room.join(2, "bob"); });
    });
    auto removing = std::async(std::launch::async, [&]() { return registry.removeIfEmpty("R1"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto other = std::async(std::launch::async, [&]() {
        auto r2 = registry.join("R2", [](Room& room) { room.join(3, "carol"); });
        return registry.find("R2") == r2 && registry.size() == 2 && registry.removeIfEmpty("R3");
    });
    assert(other.wait_for(std::chrono::milliseconds(500)) == std::future_status::ready
        && "Work on R2 must not wait for R1");
    assert(other.get());

    busy.unlock();
    joining.get();
    assert(!removing.get() && "R1 still has members");
    assert(registry.find("R1") == r1);
    std::lock_guard<std::mutex> lock(r1->mutex());
    assert(r1->memberCount() == 2);
    std::cout << "✓ Test 6 PASSED" << std::endl;
}

// Test 7: a room given up but not yet erased is replaced on the next
// join, and erasing it later leaves the replacement alone
void test_defunct_room_replaced() {
    std::cout << "\n=== Test 7: Defunct Room Replaced ===" << std::endl;
    RoomRegistry registry;
    auto stale = registry.getOrCreate("R1");
    {
        std::lock_guard<std::mutex> lock(stale->mutex());
        stale->markDefunct();
    }
    assert(!registry.contains("R1"));
    assert(registry.size() == 0);

    auto fresh = registry.join("R1", [](Room& room) { room.join(1, "alice"); });
    assert(fresh != stale);
    assert(!fresh->defunct());

    assert(registry.removeIfEmpty(stale) && "A defunct room counts as removed");
    assert(registry.find("R1") == fresh && "The replacement must survive");
    assert(!registry.removeIfEmpty(fresh));
    std::cout << "✓ Test 7 PASSED" << std::endl;
}

}

int main() {
    logging::setQuiet(true);
    std::cout << "=== Room Registry Tests ===" << std::endl;

    try {
        test_get_or_create();
        test_remove_if_empty();
        test_room_lifecycle();
        test_concurrent_churn();
        test_rooms_are_independent();
        test_busy_room_does_not_block_others();
        test_defunct_room_replaced();

        std::cout << "\n✓ All Registry tests PASSED" << std::endl;
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "\n✗ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
