#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <map>
#include <random>
#include <stdexcept>

std::string generateRoomId() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, std::strlen(kRoomIdAlphabet) - 1);

    std::string id;
    for (size_t i = 0; i < kRoomIdLength; ++i) {
        id += kRoomIdAlphabet[pick(rng)];
    }
    return id;
}

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string urlDecode(const std::string& segment) {
    std::string decoded;
    decoded.reserve(segment.size());

    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] != '%') {
            decoded += segment[i];
            continue;
        }
        if (i + 2 >= segment.size()) {
            throw std::invalid_argument("Truncated percent escape in '" + segment + "'");
        }
        int hi = hexValue(segment[i + 1]);
        int lo = hexValue(segment[i + 2]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid percent escape in '" + segment + "'");
        }
        decoded += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return decoded;
}

std::string urlEncode(const std::string& segment) {
    static const char* hex = "0123456789ABCDEF";
    std::string encoded;

    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += hex[c >> 4];
            encoded += hex[c & 0x0F];
        }
    }
    return encoded;
}

std::string guessMimeType(const std::string& fileName) {
    static const std::map<std::string, std::string> types = {
        {"txt", "text/plain"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"css", "text/css"},
        {"csv", "text/csv"},
        {"js", "text/javascript"},
        {"json", "application/json"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"gz", "application/gzip"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"svg", "image/svg+xml"},
        {"mp3", "audio/mpeg"},
        {"wav", "audio/wav"},
        {"mp4", "video/mp4"},
        {"webm", "video/webm"},
    };

    auto dot = fileName.rfind('.');
    if (dot == std::string::npos || dot + 1 == fileName.size()) {
        return "application/octet-stream";
    }

    std::string ext = fileName.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = types.find(ext);
    return it == types.end() ? "application/octet-stream" : it->second;
}

std::string sanitizeFileName(const std::string& name) {
    // Both separators count: the sender may be on Windows.
    auto slash = name.find_last_of("/\\");
    std::string base = slash == std::string::npos ? name : name.substr(slash + 1);

    std::string clean;
    for (unsigned char c : base) {
        if (c < 0x20 || c == 0x7F || c == ':') {
            clean += '_';
        } else {
            clean += static_cast<char>(c);
        }
    }

    if (clean.empty() || clean == "." || clean == "..") {
        return "download";
    }
    return clean;
}
