#include "frame.hpp"
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// ============================================================================
// ENCODING - Outbound Control Frames
// ============================================================================

namespace {

// Names and chat text are whatever bytes the user had; bytes that are not
// UTF-8 go out as U+FFFD instead of failing the whole frame.
Frame textFrame(const json& j) {
    return Frame::text(j.dump(-1, ' ', false, json::error_handler_t::replace));
}

}  // namespace

Frame encodeChat(const ChatMessage& msg) {
    json j = {
        {"type", "msg"},
        {"sender", msg.sender},
        {"text", msg.text}
    };
    return textFrame(j);
}

Frame encodeFileMeta(const FileMeta& meta) {
    json j = {
        {"type", "file-meta"},
        {"name", meta.name},
        {"size", meta.totalSize},
        {"mime", meta.mimeType},
        {"totalChunks", meta.chunkCount},
        {"fileId", meta.fileId},
        {"sender", meta.sender}
    };
    return textFrame(j);
}

Frame encodeFileHeader(const FileHeader& header) {
    json j = {
        {"type", "file-header"},
        {"fileId", header.fileId},
        {"idx", header.chunkIndex},
        {"total", header.chunkCount},
        {"size", header.byteLength}
    };
    return textFrame(j);
}

// ============================================================================
// DECODING - Inbound Control Frames
// ============================================================================

namespace {

struct MalformedFrame : std::runtime_error {
    using std::runtime_error::runtime_error;
};

std::string requireString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw MalformedFrame(std::string("missing string field '") + key + "'");
    }
    return it->get<std::string>();
}

std::string optionalString(const json& j, const char* key, const char* fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return fallback;
    }
    std::string value = it->get<std::string>();
    return value.empty() ? std::string(fallback) : value;
}

// Counts and sizes must be non-negative integers.
uint64_t requireCount(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) {
        throw MalformedFrame(std::string("missing integer field '") + key + "'");
    }
    if (it->is_number_unsigned()) {
        return it->get<uint64_t>();
    }
    int64_t value = it->get<int64_t>();
    if (value < 0) {
        throw MalformedFrame(std::string("negative value for '") + key + "'");
    }
    return static_cast<uint64_t>(value);
}

uint32_t requireCount32(const json& j, const char* key) {
    uint64_t value = requireCount(j, key);
    if (value > UINT32_MAX) {
        throw MalformedFrame(std::string("value out of range for '") + key + "'");
    }
    return static_cast<uint32_t>(value);
}

}  // namespace

std::optional<ControlFrame> decodeControl(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        std::cerr << "Ignoring text frame: not a JSON object" << std::endl;
        return std::nullopt;
    }

    try {
        std::string type = requireString(j, "type");
        ControlFrame frame;

        if (type == "msg") {
            frame.kind = ControlKind::Chat;
            frame.chat.sender = optionalString(j, "sender", kDefaultSender);
            frame.chat.text = requireString(j, "text");
        } else if (type == "file-meta") {
            frame.kind = ControlKind::FileMeta;
            frame.meta.fileId = requireString(j, "fileId");
            frame.meta.name = requireString(j, "name");
            frame.meta.mimeType = optionalString(j, "mime", kDefaultMimeType);
            frame.meta.totalSize = requireCount(j, "size");
            frame.meta.chunkCount = requireCount32(j, "totalChunks");
            frame.meta.sender = optionalString(j, "sender", kDefaultSender);
        } else if (type == "file-header") {
            frame.kind = ControlKind::FileHeader;
            frame.header.fileId = requireString(j, "fileId");
            frame.header.chunkIndex = requireCount32(j, "idx");
            frame.header.chunkCount = requireCount32(j, "total");
            frame.header.byteLength = requireCount(j, "size");
        } else {
            std::cerr << "Ignoring text frame: unknown type '" << type << "'" << std::endl;
            return std::nullopt;
        }
        return frame;
    } catch (const MalformedFrame& e) {
        std::cerr << "Ignoring text frame: " << e.what() << std::endl;
        return std::nullopt;
    }
}

void dispatchFrame(const Frame& frame, FrameListener& listener) {
    if (frame.isBinary()) {
        listener.onBinary(frame.getData());
        return;
    }

    auto control = decodeControl(frame.getData());
    if (!control) {
        return;
    }

    switch (control->kind) {
        case ControlKind::Chat:
            listener.onChat(control->chat);
            break;
        case ControlKind::FileMeta:
            listener.onFileMeta(control->meta);
            break;
        case ControlKind::FileHeader:
            listener.onFileHeader(control->header);
            break;
    }
}
