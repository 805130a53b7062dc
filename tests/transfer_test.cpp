#include "transfer_receiver.hpp"
#include "transfer_sender.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <map>
#include <sstream>
#include <vector>

using json = nlohmann::json;

namespace {

std::string patternBytes(size_t size) {
    std::string bytes(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<char>((i * 31 + 7) & 0xFF);
    }
    return bytes;
}

// Collects every frame the sender emits. Optionally closes after `limit` frames.
class RecordingSink : public FrameSink {
    public:
        void send(const Frame& frame) override {
            if (!open) {
                throw std::runtime_error("closed");
            }
            frames.push_back(frame);
            if (limit && frames.size() >= limit) {
                open = false;
            }
        }
        bool isOpen() const override { return open; }

        std::vector<Frame> frames;
        size_t limit = 0;
        bool open = true;
};

class CollectingObserver : public TransferObserver {
    public:
        void onChat(const ChatMessage& msg) override { chats.push_back(msg); }
        void onFileStarted(const FileMeta& meta) override { started.push_back(meta); }
        void onProgress(const std::string& fileId, double fraction) override {
            progress[fileId].push_back(fraction);
        }
        void onFileReceived(const ReceivedFile& file) override { received.push_back(file); }

        std::vector<ChatMessage> chats;
        std::vector<FileMeta> started;
        std::map<std::string, std::vector<double>> progress;
        std::vector<ReceivedFile> received;
};

void replay(const std::vector<Frame>& frames, TransferReceiver& receiver) {
    for (const auto& frame : frames) {
        dispatchFrame(frame, receiver);
    }
}

FileMeta metaFor(const std::string& fileId, uint32_t chunks) {
    FileMeta meta;
    meta.fileId = fileId;
    meta.name = "notes.txt";
    meta.mimeType = "text/plain";
    meta.totalSize = chunks;
    meta.chunkCount = chunks;
    meta.sender = "alice";
    return meta;
}

FileHeader headerFor(const std::string& fileId, uint32_t idx, uint32_t total, uint64_t length = 1) {
    FileHeader header;
    header.fileId = fileId;
    header.chunkIndex = idx;
    header.chunkCount = total;
    header.byteLength = length;
    return header;
}

}  // namespace

// ============================================================================
// SENDER
// ============================================================================

TEST(TransferSender, ChunkCountIsCeiling) {
    EXPECT_EQ(chunkCountFor(0, 262144), 0u);
    EXPECT_EQ(chunkCountFor(1, 262144), 1u);
    EXPECT_EQ(chunkCountFor(262144, 262144), 1u);
    EXPECT_EQ(chunkCountFor(262145, 262144), 2u);
    EXPECT_EQ(chunkCountFor(600000, 262144), 3u);
    EXPECT_THROW(chunkCountFor(10, 0), std::invalid_argument);
}

TEST(TransferSender, EmitsMetaThenAdjacentHeaderBinaryPairs) {
    RecordingSink sink;
    TransferSender sender(sink, "alice");
    std::istringstream in(patternBytes(600000));

    std::string fileId = sender.sendStream(in, "big.bin", 600000, "application/octet-stream");

    ASSERT_EQ(sink.frames.size(), 1u + 3u * 2u);

    json meta = json::parse(sink.frames[0].getData());
    EXPECT_EQ(meta["type"], "file-meta");
    EXPECT_EQ(meta["totalChunks"], 3);
    EXPECT_EQ(meta["size"], 600000);
    EXPECT_EQ(meta["fileId"], fileId);
    EXPECT_EQ(meta["sender"], "alice");

    const size_t expectedSizes[] = {262144, 262144, 75712};
    for (size_t idx = 0; idx < 3; ++idx) {
        const Frame& header = sink.frames[1 + idx * 2];
        const Frame& body = sink.frames[2 + idx * 2];
        ASSERT_TRUE(header.isText());
        ASSERT_TRUE(body.isBinary());

        json h = json::parse(header.getData());
        EXPECT_EQ(h["type"], "file-header");
        EXPECT_EQ(h["fileId"], fileId);
        EXPECT_EQ(h["idx"], idx);
        EXPECT_EQ(h["total"], 3);
        EXPECT_EQ(h["size"], expectedSizes[idx]);
        EXPECT_EQ(body.size(), expectedSizes[idx]);
    }
}

TEST(TransferSender, ProgressIsMonotonicAndEndsAtOne) {
    RecordingSink sink;
    TransferSender sender(sink, "alice", 1000);
    std::istringstream in(patternBytes(4500));

    std::vector<double> progress;
    sender.sendStream(in, "p.bin", 4500, "", [&progress](double f) { progress.push_back(f); });

    ASSERT_EQ(progress.size(), 5u);
    for (size_t i = 1; i < progress.size(); ++i) {
        EXPECT_GE(progress[i], progress[i - 1]);
    }
    for (size_t i = 0; i + 1 < progress.size(); ++i) {
        EXPECT_LT(progress[i], 1.0);
    }
    EXPECT_DOUBLE_EQ(progress.back(), 1.0);
}

TEST(TransferSender, FileIdsAreFresh) {
    EXPECT_NE(generateFileId(), generateFileId());
}

TEST(TransferSender, EmptyFileSendsOnlyMeta) {
    RecordingSink sink;
    TransferSender sender(sink, "");
    std::istringstream in("");

    std::vector<double> progress;
    sender.sendStream(in, "empty.txt", 0, "text/plain", [&progress](double f) { progress.push_back(f); });

    ASSERT_EQ(sink.frames.size(), 1u);
    json meta = json::parse(sink.frames[0].getData());
    EXPECT_EQ(meta["totalChunks"], 0);
    EXPECT_EQ(meta["sender"], "Web User");
    EXPECT_EQ(progress, std::vector<double>{1.0});
}

TEST(TransferSender, ClosedConnectionAborts) {
    RecordingSink sink;
    sink.limit = 3;  // meta, header 0, binary 0
    TransferSender sender(sink, "alice", 100);
    std::istringstream in(patternBytes(300));

    EXPECT_THROW(sender.sendStream(in, "x.bin", 300, ""), TransferAborted);
    EXPECT_EQ(sink.frames.size(), 3u);
}

TEST(TransferSender, ShortSourceAborts) {
    RecordingSink sink;
    TransferSender sender(sink, "alice", 100);
    std::istringstream in(patternBytes(150));

    EXPECT_THROW(sender.sendStream(in, "x.bin", 300, ""), TransferAborted);
}

// ============================================================================
// RECEIVER
// ============================================================================

TEST(TransferReceiver, RoundTripReproducesBytes) {
    RecordingSink sink;
    TransferSender sender(sink, "alice");
    std::string original = patternBytes(600000);
    std::istringstream in(original);
    std::string fileId = sender.sendStream(in, "big.bin", original.size(), "application/zip");

    CollectingObserver observer;
    TransferReceiver receiver(observer);
    replay(sink.frames, receiver);

    ASSERT_EQ(observer.received.size(), 1u);
    const ReceivedFile& file = observer.received[0];
    EXPECT_EQ(file.fileId, fileId);
    EXPECT_EQ(file.name, "big.bin");
    EXPECT_EQ(file.mimeType, "application/zip");
    EXPECT_EQ(file.sender, "alice");
    EXPECT_EQ(file.data.size(), 600000u);
    EXPECT_TRUE(file.data == original);
    EXPECT_EQ(receiver.activeTransfers(), 0u);
    EXPECT_FALSE(receiver.hasPendingHeader());
}

TEST(TransferReceiver, ProgressIsMonotonicAndEndsAtOne) {
    RecordingSink sink;
    TransferSender sender(sink, "alice", 10);
    std::istringstream in(patternBytes(95));
    std::string fileId = sender.sendStream(in, "p.bin", 95, "");

    CollectingObserver observer;
    TransferReceiver receiver(observer);
    replay(sink.frames, receiver);

    const auto& progress = observer.progress[fileId];
    ASSERT_EQ(progress.size(), 11u);  // 0.0, then one per chunk
    EXPECT_DOUBLE_EQ(progress.front(), 0.0);
    for (size_t i = 1; i < progress.size(); ++i) {
        EXPECT_GE(progress[i], progress[i - 1]);
    }
    for (size_t i = 0; i + 1 < progress.size(); ++i) {
        EXPECT_LT(progress[i], 1.0);
    }
    EXPECT_DOUBLE_EQ(progress.back(), 1.0);
}

TEST(TransferReceiver, ChunksOutOfOrderStillAssembleByIndex) {
    CollectingObserver observer;
    TransferReceiver receiver(observer);

    receiver.onFileMeta(metaFor("f", 3));
    receiver.onFileHeader(headerFor("f", 2, 3));
    receiver.onBinary("C");
    receiver.onFileHeader(headerFor("f", 0, 3));
    receiver.onBinary("A");
    receiver.onFileHeader(headerFor("f", 1, 3));
    receiver.onBinary("B");

    ASSERT_EQ(observer.received.size(), 1u);
    EXPECT_EQ(observer.received[0].data, "ABC");
}

TEST(TransferReceiver, BinaryWithoutHeaderIsDiscarded) {
    CollectingObserver observer;
    TransferReceiver receiver(observer);

    receiver.onFileMeta(metaFor("f", 1));
    receiver.onBinary("stray");

    EXPECT_TRUE(observer.received.empty());
    EXPECT_EQ(receiver.activeTransfers(), 1u);
}

TEST(TransferReceiver, HeaderForUnknownFileIsDiscarded) {
    CollectingObserver observer;
    TransferReceiver receiver(observer);

    receiver.onFileHeader(headerFor("ghost", 0, 1));
    receiver.onBinary("boo");

    EXPECT_TRUE(observer.received.empty());
    EXPECT_FALSE(receiver.hasPendingHeader());
}

TEST(TransferReceiver, SecondHeaderOverwritesPending) {
    CollectingObserver observer;
    TransferReceiver receiver(observer);

    receiver.onFileMeta(metaFor("f", 2));
    receiver.onFileHeader(headerFor("f", 0, 2));
    receiver.onFileHeader(headerFor("f", 1, 2, 11));
    receiver.onBinary("meant-for-0");

    // The bytes went to slot 1; slot 0 is still missing.
    EXPECT_TRUE(observer.received.empty());

    receiver.onFileHeader(headerFor("f", 0, 2, 5));
    receiver.onBinary("zero|");

    ASSERT_EQ(observer.received.size(), 1u);
    EXPECT_EQ(observer.received[0].data, "zero|meant-for-0");
}

TEST(TransferReceiver, DuplicateIndexDoesNotCompleteEarly) {
    CollectingObserver observer;
    TransferReceiver receiver(observer);

    receiver.onFileMeta(metaFor("f", 2));
    receiver.onFileHeader(headerFor("f", 0, 2));
    receiver.onBinary("a");
    receiver.onFileHeader(headerFor("f", 0, 2));
    receiver.onBinary("b");

    EXPECT_TRUE(observer.received.empty());

    receiver.onFileHeader(headerFor("f", 1, 2));
    receiver.onBinary("c");
    ASSERT_EQ(observer.received.size(), 1u);
    EXPECT_EQ(observer.received[0].data, "bc");
}

TEST(TransferReceiver, IndexPastEndIsDiscarded) {
    CollectingObserver observer;
    TransferReceiver receiver(observer);

    receiver.onFileMeta(metaFor("f", 1));
    receiver.onFileHeader(headerFor("f", 5, 1));
    receiver.onBinary("x");

    EXPECT_TRUE(observer.received.empty());
    EXPECT_EQ(receiver.activeTransfers(), 1u);
}

TEST(TransferReceiver, ChunkWithWrongLengthIsDiscarded) {
    CollectingObserver observer;
    TransferReceiver receiver(observer);

    receiver.onFileMeta(metaFor("f", 1));
    receiver.onFileHeader(headerFor("f", 0, 1, 4));
    receiver.onBinary("toolong");

    EXPECT_TRUE(observer.received.empty());
    EXPECT_FALSE(receiver.hasPendingHeader());

    receiver.onFileHeader(headerFor("f", 0, 1, 4));
    receiver.onBinary("okay");
    ASSERT_EQ(observer.received.size(), 1u);
    EXPECT_EQ(observer.received[0].data, "okay");
}

TEST(TransferReceiver, ImpossibleChunkCountOpensNoSession) {
    CollectingObserver observer;
    TransferReceiver receiver(observer);

    // 100 million chunks announced for a 10-byte file.
    Frame huge = Frame::text(
        R"({"type":"file-meta","name":"x.bin","size":10,"mime":"application/octet-stream",)"
        R"("totalChunks":100000000,"fileId":"evil","sender":"mallory"})");
    EXPECT_NO_THROW(dispatchFrame(huge, receiver));
    EXPECT_EQ(receiver.activeTransfers(), 0u);
    EXPECT_TRUE(observer.started.empty());

    FileMeta noChunks = metaFor("hollow", 0);
    noChunks.totalSize = 5;
    receiver.onFileMeta(noChunks);
    EXPECT_EQ(receiver.activeTransfers(), 0u);
    EXPECT_TRUE(observer.received.empty());

    // A count that fits its size still works after the rejected ones.
    receiver.onFileMeta(metaFor("f", 1));
    EXPECT_EQ(receiver.activeTransfers(), 1u);
}

TEST(TransferReceiver, EmptyFileCompletesOnMeta) {
    CollectingObserver observer;
    TransferReceiver receiver(observer);

    receiver.onFileMeta(metaFor("empty", 0));

    ASSERT_EQ(observer.received.size(), 1u);
    EXPECT_TRUE(observer.received[0].data.empty());
    EXPECT_EQ(receiver.activeTransfers(), 0u);
}

TEST(TransferReceiver, SequentialTransfersOnOneConnection) {
    RecordingSink sink;
    TransferSender sender(sink, "alice", 64);
    std::string first = patternBytes(200);
    std::string second = patternBytes(130);
    std::istringstream in1(first);
    std::istringstream in2(second);
    sender.sendStream(in1, "one.bin", first.size(), "");
    sink.frames.push_back(encodeChat(ChatMessage{"alice", "between"}));
    sender.sendStream(in2, "two.bin", second.size(), "");

    CollectingObserver observer;
    TransferReceiver receiver(observer);
    replay(sink.frames, receiver);

    ASSERT_EQ(observer.received.size(), 2u);
    EXPECT_EQ(observer.received[0].data, first);
    EXPECT_EQ(observer.received[1].data, second);
    ASSERT_EQ(observer.chats.size(), 1u);
    EXPECT_EQ(observer.chats[0].text, "between");
}

TEST(TransferReceiver, ResetDropsInFlightState) {
    CollectingObserver observer;
    TransferReceiver receiver(observer);

    receiver.onFileMeta(metaFor("f", 3));
    receiver.onFileHeader(headerFor("f", 0, 3));
    receiver.reset();

    EXPECT_EQ(receiver.activeTransfers(), 0u);
    EXPECT_FALSE(receiver.hasPendingHeader());

    receiver.onBinary("late");
    EXPECT_TRUE(observer.received.empty());
}
