#include "headers/protocol.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace protocol {

    namespace status {
        const char* const kNoFilename = "Error: No filename provided";
        const char* const kFinished = "Streaming finished";
        const char* const kStopped = "Streaming stopped";
        const char* const kReadError = "Error reading audio file";
        const char* const kWriteError = "Error writing audio stream";
        const char* const kOpenError = "Error opening audio file";

        std::string fileNotFound(const std::string& filename) {
            return "Error: File " + filename + " not found";
        }

        std::string streaming(const std::string& filename) {
            return "Streaming " + filename;
        }

        bool isTerminal(const std::string& text) {
            return text == kFinished || text == kStopped || text.compare(0, 5, "Error") == 0;
        }
    }

    ControlMessage parseControlMessage(const std::string& text) {
        json j;
        try {
            j = json::parse(text);
        }
        catch (const json::parse_error& e) {
            throw ProtocolError(std::string("invalid JSON: ") + e.what());
        }

        if (!j.is_object()) {
            throw ProtocolError("control message is not an object");
        }

        auto action = j.find("action");
        if (action == j.end() || !action->is_string()) {
            throw ProtocolError("missing 'action' field");
        }

        ControlMessage message;
        const std::string& name = action->get_ref<const std::string&>();
        if (name == "start") {
            message.action = Action::Start;
        }
        else if (name == "stop") {
            message.action = Action::Stop;
        }

        auto filename = j.find("filename");
        if (filename != j.end() && !filename->is_null()) {
            if (!filename->is_string()) {
                throw ProtocolError("'filename' must be a string");
            }
            message.filename = filename->get<std::string>();
        }
        return message;
    }

    std::string encodeControlMessage(const ControlMessage& message) {
        json j;
        switch (message.action) {
        case Action::Start:
            j["action"] = "start";
            j["filename"] = message.filename;
            break;
        case Action::Stop:
            j["action"] = "stop";
            break;
        case Action::Unknown:
            j["action"] = "";
            break;
        }
        return j.dump();
    }

    std::string encodeStatus(const std::string& text) {
        json j = {
            {"type", "status"},
            {"data", text}
        };
        return j.dump();
    }

    bool decodeStatus(const std::string& frame, std::string& text) {
        json j = json::parse(frame, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return false;
        }
        auto type = j.find("type");
        if (type == j.end() || !type->is_string() || type->get<std::string>() != "status") {
            return false;
        }
        auto data = j.find("data");
        if (data == j.end() || !data->is_string()) {
            return false;
        }
        text = data->get<std::string>();
        return true;
    }

}
