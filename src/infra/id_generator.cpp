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
 * @file id_generator.cpp
 * @brief Implementation of the operation identifier generator.
 */

#include "larder/infra/id_generator.hpp"

#include <random>

namespace larder::infra {

namespace {

constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr size_t kSuffixLength = 9;

} // namespace

/**
 * @brief Generates a `<prefix>_<millis>_<suffix>` identifier.
 *
 * Implementation Strategy:
 * 1. **Thread Safety**: Employs `thread_local` random engines so that the
 * scheduler workers and the caller thread never contend on a shared generator.
 * 2. **Entropy Source**: Seeds a 64-bit Mersenne Twister with `std::random_device`.
 * 3. **Encoding**: Draws each suffix character uniformly from the base-36 alphabet.
 */
std::string IdGenerator::generate(const std::string& prefix, int64_t now_ms)
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<size_t> dis(0, sizeof(kAlphabet) - 2);

    std::string id;
    id.reserve(prefix.size() + 32);
    id += prefix;
    id += '_';
    id += std::to_string(now_ms);
    id += '_';
    for (size_t i = 0; i < kSuffixLength; ++i) {
        id += kAlphabet[dis(gen)];
    }
    return id;
}

} // namespace larder::infra
