#include "client.hpp"
#include "config.hpp"
#include "download_store.hpp"
#include "transfer_receiver.hpp"
#include "transfer_sender.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>

namespace {

// stdout is shared by the I/O thread (incoming) and the input loop.
std::mutex consoleMutex;

std::string megabytes(uint64_t bytes) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << bytes / 1024.0 / 1024.0 << " MB";
    return out.str();
}

class ConsoleObserver : public TransferObserver {
    public:
        explicit ConsoleObserver(std::string downloadDir) : downloadDir(std::move(downloadDir)) {}

        void onChat(const ChatMessage& msg) override {
            std::lock_guard<std::mutex> lock(consoleMutex);
            std::cout << "💬 [" << msg.sender << "] " << msg.text << std::endl;
        }

        void onFileStarted(const FileMeta& meta) override {
            std::lock_guard<std::mutex> lock(consoleMutex);
            lastDecile[meta.fileId] = -1;
            std::cout << "📥 Receiving: " << meta.name << " from " << meta.sender
                      << " (" << megabytes(meta.totalSize) << ")" << std::endl;
        }

        void onProgress(const std::string& fileId, double fraction) override {
            // One line per 10% is plenty for a terminal.
            int decile = static_cast<int>(std::floor(fraction * 10));
            std::lock_guard<std::mutex> lock(consoleMutex);
            if (decile > lastDecile[fileId]) {
                lastDecile[fileId] = decile;
                std::cout << "   " << decile * 10 << "%" << std::endl;
            }
        }

        void onFileReceived(const ReceivedFile& file) override {
            std::lock_guard<std::mutex> lock(consoleMutex);
            lastDecile.erase(file.fileId);
            try {
                std::string path = saveReceivedFile(downloadDir, file);
                std::cout << "✓ File received: " << path << " (" << file.mimeType << ")" << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "❌ Could not save " << file.name << ": " << e.what() << std::endl;
            }
        }

    private:
        std::string downloadDir;
        std::map<std::string, int> lastDecile;
};

void sendFile(RoomClient& client, const std::string& userName, const std::string& path) {
    TransferSender sender(client, userName);
    {
        std::lock_guard<std::mutex> lock(consoleMutex);
        std::cout << "📤 Sending: " << path << std::endl;
    }

    int lastDecile = -1;
    sender.sendFile(path, [&lastDecile](double fraction) {
        int decile = static_cast<int>(std::floor(fraction * 10));
        if (decile > lastDecile) {
            lastDecile = decile;
            std::lock_guard<std::mutex> lock(consoleMutex);
            std::cout << "   " << decile * 10 << "%" << std::endl;
        }
    });

    std::lock_guard<std::mutex> lock(consoleMutex);
    std::cout << "✓ File sent successfully" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        ClientConfig config = parseClientArgs(argc, argv);

        // Declared before the client so they outlive its I/O thread.
        ConsoleObserver observer(config.downloadDir);
        TransferReceiver receiver(observer);

        RoomClient client(config.host, config.port, config.roomId);
        client.connect();

        std::cout << "✓ Connected to room: " << config.roomId << std::endl;
        std::cout << "Type messages and press Enter. /send <path> shares a file, "
                     "/room shows the room, /quit exits.\n" << std::endl;

        // The receiver is only touched from the I/O thread; it is reset there
        // too when the connection drops.
        client.startReceiving(receiver, [&receiver]() {
            receiver.reset();
            std::lock_guard<std::mutex> lock(consoleMutex);
            std::cout << "✗ Disconnected" << std::endl;
        });

        std::string input;
        while (std::getline(std::cin, input)) {
            if (input == "/quit" || input == "/exit") {
                break;
            }
            if (input.empty()) {
                continue;
            }
            if (!client.isOpen()) {
                std::cerr << "⚠ Not connected." << std::endl;
                break;
            }

            try {
                if (input == "/room") {
                    std::lock_guard<std::mutex> lock(consoleMutex);
                    std::cout << "Room " << client.roomId() << " at " << client.roomPath() << std::endl;
                } else if (input.rfind("/send ", 0) == 0) {
                    sendFile(client, config.userName, input.substr(6));
                } else {
                    client.send(encodeChat(ChatMessage{config.userName, input}));
                }
            } catch (const TransferAborted& e) {
                std::cerr << "⚠ Transfer aborted: " << e.what() << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "⚠ " << e.what() << std::endl;
            }
        }

        client.close();
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
