#include <cstddef>
#include <string>

#ifndef CONFIG_HPP
#define CONFIG_HPP

// ============================================================================
// COMMAND LINE CONFIGURATION
// ============================================================================

struct ServerConfig {
    std::string address = "0.0.0.0";
    unsigned short port = 0;
    unsigned threads = 1;

    // A recipient that falls this far behind is disconnected.
    size_t maxQueuedBytes = 64 * 1024 * 1024;
};

struct ClientConfig {
    std::string host;
    std::string port;
    std::string roomId;          // generated when empty or "-"
    std::string userName = "Web User";
    std::string downloadDir = "downloads";
};

/*
 * Usage:
 *   datashare_server <port> [threads] [address]
 *   datashare_client <host> <port> [room] [name] [downloadDir]
 *
 * Both throw std::invalid_argument with a message fit for printing
 * after "Error: " when the arguments are wrong.
 */
ServerConfig parseServerArgs(int argc, const char* const argv[]);
ClientConfig parseClientArgs(int argc, const char* const argv[]);

std::string serverUsage(const char* program);
std::string clientUsage(const char* program);

#endif // CONFIG_HPP
