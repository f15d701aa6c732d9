#include "headers/client.hpp"
#include "headers/protocol.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

using protocol::MessageType;

namespace {

// Test 1: the three recognized message types
void test_parse_known_types() {
    std::cout << "\n=== Test 1: Known Message Types ===" << std::endl;

    auto vote = protocol::parseMessage(R"({"type":"vote","value":"5"})");
    assert(vote.type == MessageType::Vote);
    assert(vote.value == "5");

    auto reveal = protocol::parseMessage(R"({"type":"reveal"})");
    assert(reveal.type == MessageType::Reveal);

    auto reset = protocol::parseMessage(R"({"type":"reset","extra":[1,2,3]})");
    assert(reset.type == MessageType::Reset && "Extra fields are ignored");
    std::cout << "✓ Test 1 PASSED" << std::endl;
}

// Test 2: vote values pass through untouched
void test_vote_values() {
    std::cout << "\n=== Test 2: Vote Values ===" << std::endl;

    auto number = protocol::parseMessage(R"({"type":"vote","value":13})");
    assert(number.type == MessageType::Vote && number.value == 13);

    auto null_value = protocol::parseMessage(R"({"type":"vote","value":null})");
    assert(null_value.type == MessageType::Vote && null_value.value.is_null());

    auto missing = protocol::parseMessage(R"({"type":"vote"})");
    assert(missing.type == MessageType::Vote && missing.value.is_null() && "Missing value records null");

    auto empty = protocol::parseMessage(R"({"type":"vote","value":""})");
    assert(empty.type == MessageType::Vote && empty.value == "");
    std::cout << "✓ Test 2 PASSED" << std::endl;
}

// Test 3: anything malformed maps to Unknown
void test_malformed_is_unknown() {
    std::cout << "\n=== Test 3: Malformed Frames ===" << std::endl;
    const char* frames[] = {
        "",
        "not json",
        "{\"type\":\"vote\"",
        "[1,2,3]",
        "\"vote\"",
        "42",
        "{}",
        R"({"value":"5"})",
        R"({"type":5})",
        R"({"type":null})",
        R"({"type":"VOTE"})",
        R"({"type":"kick"})",
    };
    for (const char* frame : frames) {
        auto msg = protocol::parseMessage(frame);
        assert(msg.type == MessageType::Unknown);
    }
    std::cout << "✓ Test 3 PASSED" << std::endl;
}

// Test 4: the outbound frame has exactly one shape
void test_encode_state() {
    std::cout << "\n=== Test 4: State Frame ===" << std::endl;

    RoomState empty;
    assert(protocol::encodeState(empty) == R"({"revealed":false,"type":"state","votes":{}})");

    RoomState state;
    state.votes["alice"] = "5";
    state.votes["bob"] = nullptr;
    state.revealed = true;
    json j = json::parse(protocol::encodeState(state));
    assert(j["type"] == "state");
    assert(j["revealed"] == true);
    assert(j["votes"].size() == 2);
    assert(j["votes"]["alice"] == "5");
    assert(j["votes"]["bob"].is_null());
    std::cout << "✓ Test 4 PASSED" << std::endl;
}

// Test 5: connection parameters from the upgrade target
void test_join_request() {
    std::cout << "\n=== Test 5: Join Request ===" << std::endl;

    auto ok = protocol::parseJoinRequest("/ws?roomId=R1&user=alice");
    assert(ok && ok->roomId == "R1" && ok->user == "alice");

    auto swapped = protocol::parseJoinRequest("/ws?user=bob&roomId=Sprint%2042");
    assert(swapped && swapped->roomId == "Sprint 42" && swapped->user == "bob");

    auto plus = protocol::parseJoinRequest("/ws?roomId=a+b&user=J%C3%BCrgen");
    assert(plus && plus->roomId == "a b" && plus->user == "J\xC3\xBCrgen");

    assert(!protocol::parseJoinRequest("/ws"));
    assert(!protocol::parseJoinRequest("/ws?roomId=R1"));
    assert(!protocol::parseJoinRequest("/ws?user=alice"));
    assert(!protocol::parseJoinRequest("/ws?roomId=&user=alice"));
    assert(!protocol::parseJoinRequest("/ws?roomId=R1&user="));
    assert(!protocol::parseJoinRequest("/ws?roomId&user=alice"));

    assert(protocol::targetPath("/ws?roomId=R1") == "/ws");
    assert(protocol::targetPath("/static/app.js") == "/static/app.js");
    std::cout << "✓ Test 5 PASSED" << std::endl;
}

// Test 6: percent encoding used by the client
void test_url_coding() {
    std::cout << "\n=== Test 6: URL Coding ===" << std::endl;
    assert(protocol::urlEncode("Sprint 42/α") == "Sprint%2042%2F%CE%B1");
    assert(protocol::urlDecode(protocol::urlEncode("a&b=c?d")) == "a&b=c?d");
    assert(protocol::urlDecode("100%") == "100%" && "Truncated escapes are kept literally");
    assert(protocol::urlDecode("%zz") == "%zz");
    std::cout << "✓ Test 6 PASSED" << std::endl;
}

// Test 7: the average skips votes that are not numbers
void test_average_vote() {
    std::cout << "\n=== Test 7: Average Vote ===" << std::endl;
    json votes = { {"alice", "5"}, {"bob", "8"}, {"carol", "?"}, {"dave", "0.5"}, {"erin", 2} };
    auto avg = protocol::averageVote(votes);
    assert(avg && std::fabs(*avg - 3.875) < 1e-9);

    assert(!protocol::averageVote(json::object()));
    assert(!protocol::averageVote(json{ {"alice", "?"}, {"bob", "coffee"} }));

    // Numbers are read off the front of the string.
    avg = protocol::averageVote(json{ {"alice", " 5"}, {"bob", "5pts"}, {"carol", "0x10"} });
    assert(avg && std::fabs(*avg - 10.0 / 3.0) < 1e-9);
    avg = protocol::averageVote(json{ {"alice", "1e1x"}, {"bob", "2e"}, {"carol", ".5"}, {"dave", "-"} });
    assert(avg && std::fabs(*avg - 12.5 / 3.0) < 1e-9);

    // Non-finite readings do not count.
    avg = protocol::averageVote(json{ {"alice", "nan"}, {"bob", "3"}, {"carol", "inf"}, {"dave", "1e999"} });
    assert(avg && *avg == 3.0);
    assert(!protocol::averageVote(json{ {"alice", "Infinity"}, {"bob", true}, {"carol", nullptr} }));
    std::cout << "✓ Test 7 PASSED" << std::endl;
}

// Test 8: the terminal client hides values until reveal
void test_client_format() {
    std::cout << "\n=== Test 8: Client State Rendering ===" << std::endl;
    json hidden = json::parse(R"({"type":"state","votes":{"alice":"5"},"revealed":false})");
    std::string text = RoomClient::formatState(hidden);
    assert(text.find("alice: voted") != std::string::npos);
    assert(text.find("5") == std::string::npos && "Hidden votes must not leak");

    json shown = json::parse(R"({"type":"state","votes":{"alice":"5","bob":"8"},"revealed":true})");
    text = RoomClient::formatState(shown);
    assert(text.find("alice: 5") != std::string::npos);
    assert(text.find("Average: 6.5") != std::string::npos);

    json thirds = json::parse(R"({"type":"state","votes":{"a":"1","b":"2","c":"2"},"revealed":true})");
    assert(RoomClient::formatState(thirds).find("Average: 1.67") != std::string::npos);
    json mixed = json::parse(R"({"type":"state","votes":{"a":"0x10","b":"5pts"},"revealed":true})");
    assert(RoomClient::formatState(mixed).find("Average: 2.5") != std::string::npos);
    json whole = json::parse(R"({"type":"state","votes":{"a":"nan","b":"3"},"revealed":true})");
    text = RoomClient::formatState(whole);
    const std::string tail = "Average: 3";
    assert(text.size() >= tail.size() && text.compare(text.size() - tail.size(), tail.size(), tail) == 0);

    json none = json::parse(R"({"type":"state","votes":{},"revealed":false})");
    assert(RoomClient::formatState(none).find("no votes yet") != std::string::npos);
    std::cout << "✓ Test 8 PASSED" << std::endl;
}

}

int main() {
    std::cout << "=== Protocol Tests ===" << std::endl;

    try {
        test_parse_known_types();
        test_vote_values();
        test_malformed_is_unknown();
        test_encode_state();
        test_join_request();
        test_url_coding();
        test_average_vote();
        test_client_format();

        std::cout << "\n✓ All Protocol tests PASSED" << std::endl;
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "\n✗ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
