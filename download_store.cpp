#include "download_store.hpp"
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

std::string saveReceivedFile(const std::string& directory, const ReceivedFile& file) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("Cannot create " + directory + ": " + ec.message());
    }

    fs::path name(sanitizeFileName(file.name));
    fs::path target = fs::path(directory) / name;

    std::string stem = name.stem().string();
    std::string extension = name.extension().string();
    for (int n = 1; fs::exists(target); ++n) {
        target = fs::path(directory) / (stem + " (" + std::to_string(n) + ")" + extension);
    }

    std::ofstream out(target, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Cannot open " + target.string() + " for writing");
    }
    out.write(file.data.data(), static_cast<std::streamsize>(file.data.size()));
    out.close();
    if (!out) {
        throw std::runtime_error("Failed writing " + target.string());
    }
    return target.string();
}
