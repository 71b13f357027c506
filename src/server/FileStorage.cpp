#include "server/FileStorage.hpp"
#include "core/Error.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace chunkwire {

namespace fs = std::filesystem;

FileStorage::FileStorage(const std::string& basePath)
    : basePath_(basePath) {
    ensureStorageDirectory();
}

void FileStorage::ensureStorageDirectory() const {
    std::error_code ec;
    fs::create_directories(basePath_ / partialDirName(), ec);
    if (ec) {
        throw StorageError("Failed to create storage directory " + basePath_.string() + ": " + ec.message());
    }
}

void FileStorage::checkName(const std::string& name) const {
    if (name.empty() || name == "." || name == ".." || name == partialDirName() ||
        name.find_first_of("/\\") != std::string::npos) {
        throw std::invalid_argument("Name not allowed in storage: '" + name + "'");
    }
}

std::string FileStorage::getFullPath(const std::string& name) const {
    return (basePath_ / name).string();
}

std::string FileStorage::getPartialPath(const std::string& name) const {
    return (basePath_ / partialDirName() / (name + ".part")).string();
}

void FileStorage::begin(const std::string& name) {
    checkName(name);
    std::string path = getPartialPath(name);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::string error = "Failed to create file: " + path + " (" + strerror(errno) + ")";
        std::cerr << "[storage] " << error << std::endl;
        throw StorageError(error);
    }
}

void FileStorage::append(const std::string& name, const std::vector<uint8_t>& bytes) {
    checkName(name);
    std::string path = getPartialPath(name);
    if (!fs::exists(path)) {
        throw StorageError("No partial file for " + name);
    }

    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out) {
        std::string error = "Failed to open file: " + path + " (" + strerror(errno) + ")";
        std::cerr << "[storage] " << error << std::endl;
        throw StorageError(error);
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        std::string error = "Failed to write " + std::to_string(bytes.size()) + " bytes to " + path;
        std::cerr << "[storage] " << error << std::endl;
        throw StorageError(error);
    }
}

void FileStorage::finalize(const std::string& name) {
    checkName(name);
    std::error_code ec;
    fs::rename(getPartialPath(name), getFullPath(name), ec);
    if (ec) {
        std::string error = "Failed to finalize " + name + ": " + ec.message();
        std::cerr << "[storage] " << error << std::endl;
        throw StorageError(error);
    }
    std::cout << "[storage] File saved successfully: " << getFullPath(name) << std::endl;
}

void FileStorage::discard(const std::string& name) {
    checkName(name);
    std::error_code ec;
    fs::remove(getPartialPath(name), ec);
    if (ec) {
        throw StorageError("Failed to remove partial file for " + name + ": " + ec.message());
    }
}

std::vector<std::string> FileStorage::listCompleted() const {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(basePath_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file()) {
            names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        throw StorageError("Failed to list " + basePath_.string() + ": " + ec.message());
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<uint8_t> FileStorage::readFile(const std::string& name) const {
    std::ifstream inFile(getFullPath(name), std::ios::binary);
    if (!inFile) {
        throw StorageError("File not found: " + name);
    }
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(inFile)),
                                std::istreambuf_iterator<char>());
}

} // namespace chunkwire
