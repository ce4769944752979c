#include "relay/protocol.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace jukebox {
namespace protocol {

namespace {

std::string string_field(const json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

ScreenSize parse_screen(const json& data) {
    ScreenSize size;
    if (!data.is_object()) return size;
    size.width = data.value("width", 0);
    size.height = data.value("height", 0);
    size.rate = data.value("rate", 0);
    return size;
}

std::vector<Member> parse_members(const json& data) {
    std::vector<Member> members;
    if (!data.is_array()) return members;

    for (const auto& entry : data) {
        if (!entry.is_object()) continue;
        members.push_back({string_field(entry, "id"), string_field(entry, "name")});
    }
    return members;
}

ServerMessage decode_event(const std::string& event, const json& data) {
    if (event == "system/init") {
        SystemInit init;
        init.session_id = string_field(data, "session_id");
        if (data.contains("control_host") && data["control_host"].is_string()) {
            init.control_host = data["control_host"].get<std::string>();
        }
        if (data.contains("screen_size")) {
            init.screen_size = parse_screen(data["screen_size"]);
        }
        if (data.contains("members")) {
            init.members = parse_members(data["members"]);
        }
        return init;
    }
    if (event == "system/disconnect") {
        return SystemDisconnect{string_field(data, "message")};
    }
    if (event == "system/error") {
        std::string message = string_field(data, "message");
        return SystemError{message.empty() ? data.dump() : message};
    }
    if (event == "control/locked") {
        return ControlLocked{string_field(data, "id")};
    }
    if (event == "control/release") {
        return ControlRelease{string_field(data, "id")};
    }
    if (event == "control/requesting") {
        return ControlRequesting{string_field(data, "id")};
    }
    if (event == "member/list") {
        return MemberList{data.contains("members") ? parse_members(data["members"]) : std::vector<Member>{}};
    }
    if (event == "member/connected") {
        return MemberConnected{string_field(data, "id")};
    }
    if (event == "member/disconnected") {
        return MemberDisconnected{string_field(data, "id")};
    }
    if (event == "screen/resolution") {
        return ScreenResolution{parse_screen(data)};
    }

    return Unknown{event};
}

} // namespace

ServerMessage decode(const std::string& text) {
    json data;
    try {
        data = json::parse(text);
    } catch (const json::parse_error& e) {
        throw RelayProtocolError(std::string("Invalid relay message: ") + e.what());
    }

    if (!data.is_object() || !data.contains("event") || !data["event"].is_string()) {
        throw RelayProtocolError("Relay message has no event field");
    }

    std::string event = data["event"].get<std::string>();
    try {
        return decode_event(event, data);
    } catch (const json::exception& e) {
        throw RelayProtocolError("Malformed " + event + " message: " + e.what());
    }
}

std::string event_name(const ServerMessage& message) {
    struct Namer {
        std::string operator()(const SystemInit&) const { return "system/init"; }
        std::string operator()(const SystemDisconnect&) const { return "system/disconnect"; }
        std::string operator()(const SystemError&) const { return "system/error"; }
        std::string operator()(const ControlLocked&) const { return "control/locked"; }
        std::string operator()(const ControlRelease&) const { return "control/release"; }
        std::string operator()(const ControlRequesting&) const { return "control/requesting"; }
        std::string operator()(const MemberList&) const { return "member/list"; }
        std::string operator()(const MemberConnected&) const { return "member/connected"; }
        std::string operator()(const MemberDisconnected&) const { return "member/disconnected"; }
        std::string operator()(const ScreenResolution&) const { return "screen/resolution"; }
        std::string operator()(const Unknown& unknown) const { return unknown.event; }
    };
    return std::visit(Namer{}, message);
}

std::string encode_control_request() {
    json payload;
    payload["event"] = "control/request";
    return payload.dump();
}

std::string encode_control_release() {
    json payload;
    payload["event"] = "control/release";
    return payload.dump();
}

std::string encode_heartbeat() {
    json payload;
    payload["event"] = "client/heartbeat";
    return payload.dump();
}

std::string encode_mouse_move(int x, int y) {
    json payload;
    payload["event"] = "mousemove";
    payload["x"] = x;
    payload["y"] = y;
    return payload.dump();
}

std::string encode_mouse_button(bool down, int x, int y, int button) {
    json payload;
    payload["event"] = down ? "mousedown" : "mouseup";
    payload["x"] = x;
    payload["y"] = y;
    payload["button"] = button;
    return payload.dump();
}

std::string encode_key(bool down, uint32_t keysym) {
    json payload;
    payload["event"] = down ? "keydown" : "keyup";
    payload["keysym"] = keysym;
    return payload.dump();
}

std::vector<uint32_t> text_to_keysyms(const std::string& text) {
    std::vector<uint32_t> keysyms;
    size_t i = 0;

    while (i < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        uint32_t code_point = 0;
        size_t extra = 0;

        if (lead < 0x80) {
            code_point = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            code_point = lead & 0x1F;
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            code_point = lead & 0x0F;
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0) {
            code_point = lead & 0x07;
            extra = 3;
        } else {
            // Stray continuation byte
            ++i;
            continue;
        }

        // Truncated sequence at the end
        if (i + extra >= text.size()) {
            break;
        }

        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }

        i += valid ? extra + 1 : 1;
        if (!valid) continue;

        keysyms.push_back(code_point <= 0xFF ? code_point : 0x01000000 | code_point);
    }

    return keysyms;
}

} // namespace protocol
} // namespace jukebox
