#include "transfer_sender.hpp"
#include "util.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

std::string generateFileId() {
    try {
        boost::uuids::random_generator generator;
        return boost::uuids::to_string(generator());
    } catch (const std::exception&) {
        // No usable entropy source: timestamp plus a pseudo-random tail.
        auto now = std::chrono::system_clock::now().time_since_epoch();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
        static thread_local std::mt19937_64 rng(static_cast<uint64_t>(millis));

        std::ostringstream id;
        id << millis << std::hex << std::setw(16) << std::setfill('0') << rng();
        return id.str();
    }
}

uint32_t chunkCountFor(uint64_t totalSize, size_t chunkSize) {
    if (chunkSize == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
    uint64_t count = (totalSize + chunkSize - 1) / chunkSize;
    if (count > UINT32_MAX) {
        throw std::invalid_argument("File needs more chunks than the protocol can describe");
    }
    return static_cast<uint32_t>(count);
}

TransferSender::TransferSender(FrameSink& sink, std::string senderName, size_t chunkSize)
    : sink(sink), senderName_(std::move(senderName)), chunkSize_(chunkSize) {
    if (chunkSize_ == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
    if (senderName_.empty()) {
        senderName_ = "Web User";
    }
}

std::string TransferSender::sendFile(const std::string& path, ProgressCallback progress) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    std::error_code ec;
    uint64_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Cannot stat file " + path + ": " + ec.message());
    }

    std::string name = std::filesystem::path(path).filename().string();
    return sendStream(in, name, size, guessMimeType(name), std::move(progress));
}

std::string TransferSender::sendStream(std::istream& in,
                                       const std::string& name,
                                       uint64_t totalSize,
                                       const std::string& mimeType,
                                       ProgressCallback progress) {
    FileMeta meta;
    meta.fileId = generateFileId();
    meta.name = name;
    meta.mimeType = mimeType.empty() ? std::string(kDefaultMimeType) : mimeType;
    meta.totalSize = totalSize;
    meta.chunkCount = chunkCountFor(totalSize, chunkSize_);
    meta.sender = senderName_;

    emit(encodeFileMeta(meta));

    if (meta.chunkCount == 0) {
        if (progress) progress(1.0);
        return meta.fileId;
    }

    std::vector<char> buffer(chunkSize_);
    uint64_t sent = 0;

    for (uint32_t idx = 0; idx < meta.chunkCount; ++idx) {
        size_t length = static_cast<size_t>(std::min<uint64_t>(chunkSize_, totalSize - sent));

        in.read(buffer.data(), static_cast<std::streamsize>(length));
        if (static_cast<size_t>(in.gcount()) != length) {
            throw TransferAborted("File '" + name + "' ended early at chunk " + std::to_string(idx));
        }

        FileHeader header;
        header.fileId = meta.fileId;
        header.chunkIndex = idx;
        header.chunkCount = meta.chunkCount;
        header.byteLength = length;

        // Header, then its bytes. Nothing else from us may go in between.
        emit(encodeFileHeader(header));
        emit(Frame::binary(std::string(buffer.data(), length)));

        sent += length;
        if (progress) {
            progress(static_cast<double>(sent) / static_cast<double>(totalSize));
        }
    }
    return meta.fileId;
}

void TransferSender::emit(const Frame& frame) {
    if (!sink.isOpen()) {
        throw TransferAborted("Connection closed during transfer");
    }
    try {
        sink.send(frame);
    } catch (const TransferAborted&) {
        throw;
    } catch (const std::exception& e) {
        throw TransferAborted(std::string("Connection lost during transfer: ") + e.what());
    }
}
