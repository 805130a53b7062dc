#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <string>

#ifndef FRAME_HPP
#define FRAME_HPP

/*
 * ============================================================================
 * FRAME - The Unit Everything Else Passes Around
 * ============================================================================
 *
 * Purpose: One WebSocket message, exactly as it travelled on the wire
 *
 * Two flavours share the same channel:
 *
 *   Text frame   -> UTF-8 JSON object, a ControlFrame (chat, file-meta,
 *                   file-header)
 *   Binary frame -> raw file bytes, meaningful only through the file-header
 *                   that was received just before it
 *
 * The relay never looks inside a Frame. It only needs the payload and the
 * text/binary flag so it can replay the message verbatim to the others.
 * ============================================================================
 */

class Frame {

public:
    Frame() : data_(std::make_shared<const std::string>()), binary_(false) {}

    static Frame text(std::string payload) {
        return Frame(std::move(payload), false);
    }

    static Frame binary(std::string bytes) {
        return Frame(std::move(bytes), true);
    }

    bool isBinary() const { return binary_; }
    bool isText() const { return !binary_; }

    const std::string& getData() const { return *data_; }
    size_t size() const { return data_->size(); }

private:
    Frame(std::string data, bool binary)
        : data_(std::make_shared<const std::string>(std::move(data))), binary_(binary) {}

    // Shared so that fanning one frame out to a whole room copies a pointer,
    // not a 256 KiB chunk per recipient.
    std::shared_ptr<const std::string> data_;
    bool binary_;
};

// ============================================================================
// CONTROL FRAMES - The Typed Vocabulary
// ============================================================================

// {"type":"msg","sender":...,"text":...}
struct ChatMessage {
    std::string sender;
    std::string text;
};

// {"type":"file-meta","name","size","mime","totalChunks","fileId","sender"}
struct FileMeta {
    std::string fileId;
    std::string name;
    std::string mimeType;
    uint64_t totalSize = 0;
    uint32_t chunkCount = 0;
    std::string sender;
};

// {"type":"file-header","fileId","idx","total","size"}
struct FileHeader {
    std::string fileId;
    uint32_t chunkIndex = 0;
    uint32_t chunkCount = 0;
    uint64_t byteLength = 0;
};

enum class ControlKind { Chat, FileMeta, FileHeader };

/*
 * ControlFrame - a decoded text frame
 *
 * Only the member matching `kind` is meaningful. Kept as a plain struct
 * so the codec and its callers stay simple to read.
 */
struct ControlFrame {
    ControlKind kind = ControlKind::Chat;
    ChatMessage chat;
    FileMeta meta;
    FileHeader header;
};

// ============================================================================
// CODEC - Serialization and Classification
// ============================================================================

const char* const kDefaultMimeType = "application/octet-stream";
const char* const kDefaultSender = "peer";

Frame encodeChat(const ChatMessage& msg);
Frame encodeFileMeta(const FileMeta& meta);
Frame encodeFileHeader(const FileHeader& header);

/*
 * decodeControl() - parse one text frame
 *
 * Returns an empty optional for anything that is not a recognised control
 * frame: invalid JSON, a non-object, an unknown "type", or required fields
 * that are missing or of the wrong type. The reason is logged to stderr;
 * nothing is thrown.
 */
std::optional<ControlFrame> decodeControl(const std::string& text);

/*
 * FrameListener - receiver side of the classification
 *
 * dispatchFrame() routes a Frame to exactly one of these callbacks, or to
 * none when the text frame is malformed. Binary frames are never parsed.
 */
class FrameListener {
    public:
        virtual void onChat(const ChatMessage& msg) = 0;
        virtual void onFileMeta(const FileMeta& meta) = 0;
        virtual void onFileHeader(const FileHeader& header) = 0;
        virtual void onBinary(const std::string& bytes) = 0;
    virtual ~FrameListener() = default;
};

void dispatchFrame(const Frame& frame, FrameListener& listener);

#endif // FRAME_HPP
