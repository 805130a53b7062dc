#include "frame.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#ifndef TRANSFER_RECEIVER_HPP
#define TRANSFER_RECEIVER_HPP

/*
 * ============================================================================
 * TRANSFER RECEIVER - Reassembling Chunks per Connection
 * ============================================================================
 *
 * State machine, one instance per connection:
 *
 *   file-meta    -> open a TransferSession for fileId
 *   file-header  -> PendingHeader = (fileId, idx)
 *   binary frame -> slots[idx] = bytes, PendingHeader cleared
 *                   all slots filled? -> concatenate, report, drop session
 *
 * A file-meta whose chunk count cannot describe its size (more chunks than
 * bytes, or no chunks for a non-empty file) is ignored. A binary frame whose
 * length differs from its header's size is dropped. Slots are stored
 * sparsely, so memory follows the bytes received, not the announced count.
 *
 * PendingHeader is a single slot. Two headers in a row means the first one
 * is forgotten and its chunk will land wherever the second points. This is
 * the protocol: binary frames carry no id of their own, so interleaving two
 * transfers on one connection is not supported.
 * ============================================================================
 */

struct ReceivedFile {
    std::string fileId;
    std::string name;
    std::string mimeType;
    std::string sender;
    std::string data;
};

/*
 * TransferObserver - what the receiver reports upward
 *
 * Every callback has an empty default so callers override only what they
 * display.
 */
class TransferObserver {
    public:
        virtual void onChat(const ChatMessage& msg) { (void)msg; }
        virtual void onFileStarted(const FileMeta& meta) { (void)meta; }
        virtual void onProgress(const std::string& fileId, double fraction) { (void)fileId; (void)fraction; }
        virtual void onFileReceived(const ReceivedFile& file) = 0;
    virtual ~TransferObserver() = default;
};

class TransferReceiver : public FrameListener {
    public:
        explicit TransferReceiver(TransferObserver& observer);

        void onChat(const ChatMessage& msg) override;
        void onFileMeta(const FileMeta& meta) override;
        void onFileHeader(const FileHeader& header) override;
        void onBinary(const std::string& bytes) override;

        // Drops every in-flight session and the pending header. Called when
        // the connection closes.
        void reset();

        size_t activeTransfers() const { return sessions.size(); }
        bool hasPendingHeader() const { return pending.has_value(); }

    private:
        struct TransferSession {
            FileMeta meta;
            std::map<uint32_t, std::string> slots;
        };

        struct PendingHeader {
            std::string fileId;
            uint32_t chunkIndex;
            uint64_t byteLength;
        };

        void complete(const std::string& fileId);

        TransferObserver& observer;
        std::map<std::string, TransferSession> sessions;
        std::optional<PendingHeader> pending;
};

#endif // TRANSFER_RECEIVER_HPP
