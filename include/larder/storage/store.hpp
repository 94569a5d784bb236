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
 * @file store.hpp
 * @brief Durable local key-value storage abstraction.
 *
 * @details
 * The offline engine persists four records (entity cache, query cache, pending
 * queue, favorites), each as one value under one key. This header declares the
 * contract the engine depends on and two implementations: `FileStore`, which
 * survives process restarts, and `MemoryStore`, used for embedding and tests.
 *
 * Both stores have a bounded capacity. A write that would push the total past it
 * fails (returns `false`) rather than throwing, which is how storage exhaustion
 * reaches the engine.
 */

#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace larder::storage {

/**
 * @class KeyValueStore
 * @brief Whole-value replacement store with bounded capacity.
 */
class KeyValueStore {
  public:
    virtual ~KeyValueStore() = default;

    /// @brief Returns the stored bytes, or `std::nullopt` if the key is absent or unreadable.
    virtual std::optional<std::string> read(const std::string& key) = 0;

    /**
     * @brief Atomically replaces the value under `key`.
     *
     * A reader observes either the previous value or the new one, never a mix.
     *
     * @return false If the write was rejected (quota exceeded, I/O error).
     */
    virtual bool write(const std::string& key, const std::string& bytes) = 0;

    /// @brief Deletes `key`. Removing an absent key succeeds.
    virtual bool remove(const std::string& key) = 0;

    /// @brief Lists every key currently stored.
    virtual std::vector<std::string> keys() = 0;

    /// @brief The configured capacity in bytes.
    virtual size_t capacity() const = 0;
};

/**
 * @class FileStore
 * @brief Persists one file per key under a base directory.
 *
 * @details
 * **Storage Characteristics:**
 * 1. **Framing:** Each file holds `[4-byte Little Endian Length] + [N-byte payload]`,
 * so a truncated file is detected on read instead of being decoded as garbage.
 * 2. **Atomic Replacement:** Values are written to `<key>.lrd.tmp` and renamed over
 * `<key>.lrd`.
 * 3. **Quota:** The sum of payload sizes never exceeds `capacity`.
 */
class FileStore : public KeyValueStore {
  public:
    /**
     * @brief Configures and bootstraps the store.
     *
     * @param base_path Directory holding the `.lrd` files; created if absent.
     * @param capacity Byte quota across all keys.
     * @throws std::runtime_error If the directory cannot be created.
     */
    FileStore(std::string base_path, size_t capacity);

    std::optional<std::string> read(const std::string& key) override;
    bool write(const std::string& key, const std::string& bytes) override;
    bool remove(const std::string& key) override;
    std::vector<std::string> keys() override;
    size_t capacity() const override { return capacity_; }

  private:
    std::string base_path_;
    size_t capacity_;

    /// @brief Serializes quota accounting with the file replacement it guards.
    std::mutex mutex_;

    /**
     * @brief Resolves a key to its file path.
     *
     * Example: `get_path("larder_favorites")` -> `/var/lib/larder/larder_favorites.lrd`
     */
    std::string get_path(const std::string& key) const;

    std::optional<std::string> read_frame(const std::string& path) const;
    size_t used_bytes_excluding(const std::string& key) const;
};

/**
 * @class MemoryStore
 * @brief Process-local store with the same quota semantics as `FileStore`.
 *
 * `set_fail_writes(true)` makes every write fail, simulating an unavailable medium.
 */
class MemoryStore : public KeyValueStore {
  public:
    explicit MemoryStore(size_t capacity = 5 * 1024 * 1024);

    std::optional<std::string> read(const std::string& key) override;
    bool write(const std::string& key, const std::string& bytes) override;
    bool remove(const std::string& key) override;
    std::vector<std::string> keys() override;
    size_t capacity() const override { return capacity_; }

    void set_fail_writes(bool fail);

  private:
    size_t capacity_;
    bool fail_writes_ = false;
    std::map<std::string, std::string> values_;
    std::mutex mutex_;
};

} // namespace larder::storage
