#include "transfer_receiver.hpp"
#include <iostream>

TransferReceiver::TransferReceiver(TransferObserver& observer) : observer(observer) {
}

void TransferReceiver::onChat(const ChatMessage& msg) {
    observer.onChat(msg);
}

void TransferReceiver::onFileMeta(const FileMeta& meta) {
    // Every chunk but an empty file's carries at least one byte.
    if (meta.chunkCount > meta.totalSize || (meta.chunkCount == 0 && meta.totalSize > 0)) {
        std::cerr << "Ignoring file-meta for " << meta.fileId << ": " << meta.chunkCount
                  << " chunks cannot hold " << meta.totalSize << " bytes" << std::endl;
        return;
    }

    // A repeated fileId replaces the old session; ids are the sender's job.
    TransferSession& session = sessions[meta.fileId];
    session.meta = meta;
    session.slots.clear();

    observer.onFileStarted(meta);
    observer.onProgress(meta.fileId, 0.0);

    if (meta.chunkCount == 0) {
        complete(meta.fileId);
    }
}

void TransferReceiver::onFileHeader(const FileHeader& header) {
    pending = PendingHeader{header.fileId, header.chunkIndex, header.byteLength};
}

void TransferReceiver::onBinary(const std::string& bytes) {
    if (!pending) {
        return;
    }

    PendingHeader target = *pending;
    pending.reset();

    auto it = sessions.find(target.fileId);
    if (it == sessions.end()) {
        return;
    }

    TransferSession& session = it->second;
    if (target.chunkIndex >= session.meta.chunkCount || bytes.size() != target.byteLength) {
        return;
    }

    // A duplicate index overwrites its slot without counting twice.
    session.slots[target.chunkIndex] = bytes;

    observer.onProgress(target.fileId,
                        static_cast<double>(session.slots.size()) / session.meta.chunkCount);

    if (session.slots.size() == session.meta.chunkCount) {
        complete(target.fileId);
    }
}

void TransferReceiver::complete(const std::string& fileId) {
    auto it = sessions.find(fileId);
    TransferSession& session = it->second;

    ReceivedFile file;
    file.fileId = fileId;
    file.name = session.meta.name;
    file.mimeType = session.meta.mimeType;
    file.sender = session.meta.sender;

    size_t total = 0;
    for (const auto& slot : session.slots) {
        total += slot.second.size();
    }
    file.data.reserve(total);
    // std::map iterates by index, so this is file order.
    for (const auto& slot : session.slots) {
        file.data += slot.second;
    }

    sessions.erase(it);
    observer.onFileReceived(file);
}

void TransferReceiver::reset() {
    sessions.clear();
    pending.reset();
}
