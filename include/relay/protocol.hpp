#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jukebox {
namespace protocol {

// X11 keysyms used by the input choreography
namespace keysym {
constexpr uint32_t Control_L = 0xFFE3;
constexpr uint32_t Return = 0xFF0D;
constexpr uint32_t Space = 0x0020;
constexpr uint32_t a = 0x0061;
} // namespace keysym

namespace mouse {
constexpr int Left = 0;
} // namespace mouse

struct Member {
    std::string id;
    std::string name;
};

struct ScreenSize {
    int width = 0;
    int height = 0;
    int rate = 0;
};

// ==================== Server -> client ====================

struct SystemInit {
    std::string session_id;
    std::optional<std::string> control_host;
    ScreenSize screen_size;
    std::vector<Member> members;
};

struct SystemDisconnect {
    std::string message;
};

struct SystemError {
    std::string message;
};

struct ControlLocked {
    std::string id;
};

struct ControlRelease {
    std::string id;
};

struct ControlRequesting {
    std::string id;
};

struct MemberList {
    std::vector<Member> members;
};

struct MemberConnected {
    std::string id;
};

struct MemberDisconnected {
    std::string id;
};

struct ScreenResolution {
    ScreenSize size;
};

// Anything else the server sends (signal/*, broadcast/*, ...)
struct Unknown {
    std::string event;
};

using ServerMessage = std::variant<SystemInit, SystemDisconnect, SystemError,
                                   ControlLocked, ControlRelease, ControlRequesting,
                                   MemberList, MemberConnected, MemberDisconnected,
                                   ScreenResolution, Unknown>;

// Throws RelayProtocolError on malformed JSON or a missing "event" field
ServerMessage decode(const std::string& text);

std::string event_name(const ServerMessage& message);

// ==================== Client -> server ====================

std::string encode_control_request();
std::string encode_control_release();
std::string encode_heartbeat();
std::string encode_mouse_move(int x, int y);
std::string encode_mouse_button(bool down, int x, int y, int button);
std::string encode_key(bool down, uint32_t keysym);

// One keysym per code point; non-Latin-1 code points map into the 0x01000000 range
std::vector<uint32_t> text_to_keysyms(const std::string& text);

} // namespace protocol
} // namespace jukebox
