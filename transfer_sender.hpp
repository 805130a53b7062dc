#include "frame.hpp"
#include <cstdint>
#include <functional>
#include <istream>
#include <stdexcept>
#include <string>

#ifndef TRANSFER_SENDER_HPP
#define TRANSFER_SENDER_HPP

/*
 * ============================================================================
 * TRANSFER SENDER - Slicing a File into Header+Binary Pairs
 * ============================================================================
 *
 * Wire sequence for a 600000 byte file with 256 KiB chunks:
 *
 *   file-meta   {fileId, name, size=600000, totalChunks=3, ...}
 *   file-header {idx=0, size=262144}   binary[262144 bytes]
 *   file-header {idx=1, size=262144}   binary[262144 bytes]
 *   file-header {idx=2, size= 75712}   binary[ 75712 bytes]
 *
 * A header and its binary frame must be adjacent on the connection. The
 * receiver has no other way to know which chunk a binary frame is.
 * ============================================================================
 */

const size_t kDefaultChunkSize = 256 * 1024;

/*
 * FrameSink - where the sender writes
 *
 * send() blocks until the frame has been handed to the transport and
 * throws if it could not be.
 */
class FrameSink {
    public:
        virtual void send(const Frame& frame) = 0;
        virtual bool isOpen() const = 0;
    virtual ~FrameSink() = default;
};

// Thrown when the connection goes away mid-transfer. There is no resume:
// start over with a new fileId.
class TransferAborted : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
};

typedef std::function<void(double)> ProgressCallback;

std::string generateFileId();
uint32_t chunkCountFor(uint64_t totalSize, size_t chunkSize);

class TransferSender {
    public:
        TransferSender(FrameSink& sink, std::string senderName, size_t chunkSize = kDefaultChunkSize);

        // Returns the fileId used for the transfer.
        std::string sendFile(const std::string& path, ProgressCallback progress = ProgressCallback());

        /*
         * sendStream() - send exactly `totalSize` bytes read from `in`
         *
         * Progress is reported after every chunk as bytesSent / totalSize,
         * never decreasing, and reaches 1.0 only after the last chunk. An
         * empty file reports 1.0 once, right after its file-meta.
         */
        std::string sendStream(std::istream& in,
                               const std::string& name,
                               uint64_t totalSize,
                               const std::string& mimeType,
                               ProgressCallback progress = ProgressCallback());

        size_t chunkSize() const { return chunkSize_; }

    private:
        void emit(const Frame& frame);

        FrameSink& sink;
        std::string senderName_;
        size_t chunkSize_;
};

#endif // TRANSFER_SENDER_HPP
