#include "config.hpp"
#include "util.hpp"
#include <stdexcept>

namespace {

unsigned long parseNumber(const std::string& text, const char* what) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": '" + text + "'");
    }
    try {
        return std::stoul(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": '" + text + "'");
    }
}

unsigned short parsePort(const std::string& text) {
    unsigned long port = parseNumber(text, "port");
    if (port == 0 || port > 65535) {
        throw std::invalid_argument("Port out of range: " + text);
    }
    return static_cast<unsigned short>(port);
}

}  // namespace

std::string serverUsage(const char* program) {
    return std::string("Usage: ") + program + " <port> [threads] [address]";
}

std::string clientUsage(const char* program) {
    return std::string("Usage: ") + program + " <host> <port> [room] [name] [downloadDir]";
}

ServerConfig parseServerArgs(int argc, const char* const argv[]) {
    if (argc < 2 || argc > 4) {
        throw std::invalid_argument(serverUsage(argv[0]));
    }

    ServerConfig config;
    config.port = parsePort(argv[1]);

    if (argc >= 3) {
        unsigned long threads = parseNumber(argv[2], "thread count");
        if (threads == 0 || threads > 256) {
            throw std::invalid_argument(std::string("Thread count out of range: ") + argv[2]);
        }
        config.threads = static_cast<unsigned>(threads);
    }
    if (argc >= 4) {
        config.address = argv[3];
    }
    return config;
}

ClientConfig parseClientArgs(int argc, const char* const argv[]) {
    if (argc < 3 || argc > 6) {
        throw std::invalid_argument(clientUsage(argv[0]));
    }

    ClientConfig config;
    config.host = argv[1];
    config.port = std::to_string(parsePort(argv[2]));

    if (argc >= 4) {
        config.roomId = argv[3];
    }
    if (config.roomId.empty() || config.roomId == "-") {
        config.roomId = generateRoomId();
    }

    if (argc >= 5 && argv[4][0] != '\0') {
        config.userName = argv[4];
    }
    if (argc >= 6 && argv[5][0] != '\0') {
        config.downloadDir = argv[5];
    }
    return config;
}
