#include "headers/protocol.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Longest leading decimal number after optional whitespace, so " 5" and
// "5pts" read as 5 and "0x10" as 0. Hex, "inf" and "nan" are not numbers.
std::optional<double> leadingDecimal(const std::string& s) {
    std::size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    const std::size_t start = i;

    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    std::size_t digits = 0;
    while (i < s.size() && isDigit(s[i])) { ++i; ++digits; }
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && isDigit(s[i])) { ++i; ++digits; }
    }
    if (digits == 0) {
        return std::nullopt;
    }

    // The exponent only counts when digits follow it.
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        std::size_t j = i + 1;
        if (j < s.size() && (s[j] == '+' || s[j] == '-')) ++j;
        if (j < s.size() && isDigit(s[j])) {
            while (j < s.size() && isDigit(s[j])) ++j;
            i = j;
        }
    }

    return std::strtod(s.substr(start, i - start).c_str(), nullptr);
}

std::optional<double> numericVote(const json& value) {
    std::optional<double> v;
    if (value.is_number()) {
        v = value.get<double>();
    }
    else if (value.is_string()) {
        v = leadingDecimal(value.get_ref<const std::string&>());
    }

    if (v && !std::isfinite(*v)) {
        return std::nullopt;
    }
    return v;
}

}

protocol::InboundMessage protocol::parseMessage(std::string_view text) {
    InboundMessage msg;

    json j;
    try {
        j = json::parse(text.begin(), text.end());
    }
    catch (const json::parse_error&) {
        return msg;
    }
    if (!j.is_object()) {
        return msg;
    }

    auto typeIt = j.find("type");
    if (typeIt == j.end() || !typeIt->is_string()) {
        return msg;
    }

    const std::string& type = typeIt->get_ref<const std::string&>();
    if (type == "vote") {
        msg.type = MessageType::Vote;
        auto valueIt = j.find("value");
        if (valueIt != j.end()) {
            msg.value = std::move(*valueIt);
        }
    }
    else if (type == "reveal") {
        msg.type = MessageType::Reveal;
    }
    else if (type == "reset") {
        msg.type = MessageType::Reset;
    }
    return msg;
}

json protocol::stateMessage(const RoomState& state) {
    json votes = json::object();
    for (const auto& vote : state.votes) {
        votes[vote.first] = vote.second;
    }
    return json{
        {"type", "state"},
        {"votes", std::move(votes)},
        {"revealed", state.revealed}
    };
}

std::string protocol::encodeState(const RoomState& state) {
    return stateMessage(state).dump();
}

std::string_view protocol::targetPath(std::string_view target) {
    auto qpos = target.find('?');
    return qpos == std::string_view::npos ? target : target.substr(0, qpos);
}

std::optional<std::string> protocol::queryValue(std::string_view target, std::string_view key) {
    auto qpos = target.find('?');
    if (qpos == std::string_view::npos) return std::nullopt;

    std::string_view query = target.substr(qpos + 1);
    auto hash = query.find('#');
    if (hash != std::string_view::npos) query = query.substr(0, hash);

    while (!query.empty()) {
        auto amp = query.find('&');
        std::string_view part = query.substr(0, amp);
        auto eq = part.find('=');
        std::string k = urlDecode(part.substr(0, eq));
        if (k == key) {
            return eq == std::string_view::npos ? std::string() : urlDecode(part.substr(eq + 1));
        }
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
    return std::nullopt;
}

std::optional<protocol::JoinRequest> protocol::parseJoinRequest(std::string_view target) {
    auto roomId = queryValue(target, "roomId");
    auto user = queryValue(target, "user");
    if (!roomId || roomId->empty() || !user || user->empty()) {
        return std::nullopt;
    }
    return JoinRequest{ std::move(*roomId), std::move(*user) };
}

std::string protocol::urlDecode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            int hi = hexValue(in[i + 1]);
            int lo = hexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(in[i] == '+' ? ' ' : in[i]);
    }
    return out;
}

std::string protocol::urlEncode(std::string_view in) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size() * 3);
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        }
        else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::optional<double> protocol::averageVote(const json& votes) {
    if (!votes.is_object()) return std::nullopt;

    double sum = 0.0;
    int count = 0;
    for (const auto& item : votes.items()) {
        if (auto v = numericVote(item.value())) {
            sum += *v;
            ++count;
        }
    }
    if (count == 0) return std::nullopt;
    return sum / count;
}
