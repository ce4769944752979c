#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace jukebox {

class PlaybackError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// play/skip on a guild with no live session; a caller bug, never retried
class NotConnectedError : public PlaybackError {
public:
    explicit NotConnectedError(const std::string& message = "Not connected to any voice channel")
        : PlaybackError(message) {}
};

// Extractor blocked by sign-in walls, CAPTCHAs, age gates or rate limits
class BotDetectionError : public PlaybackError {
public:
    using PlaybackError::PlaybackError;
};

class ExtractionError : public PlaybackError {
public:
    using PlaybackError::PlaybackError;
};

class NoPlaybackMethodError : public PlaybackError {
public:
    using PlaybackError::PlaybackError;
};

class NoHealthyRelayError : public NoPlaybackMethodError {
public:
    explicit NoHealthyRelayError(const std::string& message = "No healthy relay instances available")
        : NoPlaybackMethodError(message) {}
};

class ConnectionLostError : public PlaybackError {
public:
    using PlaybackError::PlaybackError;
};

class StreamError : public PlaybackError {
public:
    using PlaybackError::PlaybackError;
};

class RelayProtocolError : public PlaybackError {
public:
    using PlaybackError::PlaybackError;
};

class RelayProtocolTimeout : public RelayProtocolError {
public:
    using RelayProtocolError::RelayProtocolError;
};

// what() of a captured exception, for logs and user-facing text
std::string error_message(std::exception_ptr error);

// Classifies extractor error text as a bot-detection block
bool is_bot_detection_message(const std::string& message);

} // namespace jukebox
