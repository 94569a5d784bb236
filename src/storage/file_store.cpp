/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file file_store.cpp
 * @brief Implementation of the file-backed key-value store.
 *
 * @details
 * Each key maps to one **Binary Length-Prefixed Frame** file:
 * `[4-byte Little Endian Length Header] + [N-byte UTF-8 Payload]`
 *
 * Replacement always goes through a temporary file followed by a rename, so a crash
 * mid-write leaves the previous value intact.
 */

#include "larder/storage/store.hpp"

#include "larder/infra/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace larder::storage {

namespace {

constexpr const char* kExtension = ".lrd";

} // namespace

FileStore::FileStore(std::string base_path, size_t capacity)
    : base_path_(std::move(base_path)), capacity_(capacity)
{
    std::error_code ec;
    if (!fs::exists(base_path_, ec)) {
        fs::create_directories(base_path_, ec);
    }
    if (ec || !fs::is_directory(base_path_)) {
        throw std::runtime_error("Storage: Cannot initialize data directory '" + base_path_ +
                                 "'" + (ec ? ": " + ec.message() : ""));
    }
}

std::string FileStore::get_path(const std::string& key) const
{
    return base_path_ + "/" + key + kExtension;
}

/**
 * @brief Reads one frame and validates it against the length header.
 *
 * Returns `std::nullopt` for a missing file or a partial frame.
 */
std::optional<std::string> FileStore::read_frame(const std::string& path) const
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    uint32_t payload_length = 0;
    file.read(reinterpret_cast<char*>(&payload_length), sizeof(payload_length));
    if (file.gcount() < static_cast<std::streamsize>(sizeof(payload_length))) {
        infra::Logger::log(infra::LogLevel::ERROR, "Storage: Truncated header in " + path);
        return std::nullopt;
    }

    std::string buffer;
    buffer.resize(payload_length);
    if (payload_length > 0) {
        file.read(&buffer[0], payload_length);
    }
    if (file.gcount() != static_cast<std::streamsize>(payload_length)) {
        infra::Logger::log(infra::LogLevel::ERROR, "Storage: Partial frame detected in " + path);
        return std::nullopt;
    }
    return buffer;
}

std::optional<std::string> FileStore::read(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return read_frame(get_path(key));
}

size_t FileStore::used_bytes_excluding(const std::string& key) const
{
    size_t used = 0;
    std::error_code ec;
    if (!fs::exists(base_path_, ec)) {
        return 0;
    }
    for (fs::directory_iterator it(base_path_, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec) || entry.path().extension() != kExtension) {
            continue;
        }
        if (entry.path().stem().string() == key) {
            continue;
        }
        std::error_code size_ec;
        auto size = fs::file_size(entry.path(), size_ec);
        if (!size_ec && size >= sizeof(uint32_t)) {
            used += static_cast<size_t>(size) - sizeof(uint32_t);
        }
    }
    return used;
}

/**
 * @brief Quota-checked atomic replacement.
 *
 * **Strategy:**
 * 1. **Quota:** Rejects the write if the other keys plus this payload exceed capacity.
 * 2. **Snapshot:** Writes the frame into `<key>.lrd.tmp`.
 * 3. **Atomic Swap:** Renames the temp file over the live one.
 */
bool FileStore::write(const std::string& key, const std::string& bytes)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (used_bytes_excluding(key) + bytes.size() > capacity_) {
        return false;
    }

    std::string path = get_path(key);
    std::string temp_path = path + ".tmp";

    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    uint32_t length = static_cast<uint32_t>(bytes.size());
    file.write(reinterpret_cast<const char*>(&length), sizeof(length));
    file.write(bytes.data(), length);
    file.flush();
    file.close();

    std::error_code ec;
    if (file.fail()) {
        fs::remove(temp_path, ec);
        return false;
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        fs::remove(temp_path, ec);
        return false;
    }
    return true;
}

bool FileStore::remove(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::remove(get_path(key), ec);
    return !ec;
}

std::vector<std::string> FileStore::keys()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::exists(base_path_, ec)) {
        return out;
    }
    for (fs::directory_iterator it(base_path_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && it->path().extension() == kExtension) {
            out.push_back(it->path().stem().string());
        }
    }
    if (ec) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Storage: Listing '" + base_path_ + "' stopped early: " +
                               ec.message());
    }
    return out;
}

} // namespace larder::storage
