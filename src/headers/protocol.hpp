#pragma once

#include <stdexcept>
#include <string>

namespace protocol {

    enum class Action { Start, Stop, Unknown };

    struct ControlMessage {
        Action action = Action::Unknown;
        std::string filename;
    };

    class ProtocolError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Parses one inbound text frame. Throws ProtocolError when the frame is not
    // a JSON object with a string "action" (and, if present, a string "filename").
    ControlMessage parseControlMessage(const std::string& text);

    std::string encodeControlMessage(const ControlMessage& message);

    // {"type":"status","data":<text>}
    std::string encodeStatus(const std::string& text);

    // Returns true and fills text when frame is a status message.
    bool decodeStatus(const std::string& frame, std::string& text);

    namespace status {

        extern const char* const kNoFilename;
        extern const char* const kFinished;
        extern const char* const kStopped;
        extern const char* const kReadError;
        extern const char* const kWriteError;
        extern const char* const kOpenError;

        std::string fileNotFound(const std::string& filename);
        std::string streaming(const std::string& filename);

        // True for the messages that end a transfer from the client's point of view.
        bool isTerminal(const std::string& text);

    }

}
