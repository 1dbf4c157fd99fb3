/**
 * @file sha256.cpp
 * @brief Потоковый SHA256 и hash_all
 */

#include "sha256.hpp"
#include "../core/byte_order.hpp"

#include <cstring>
#include <algorithm>

namespace weavekit::crypto {

// =============================================================================
// Sha256
// =============================================================================

Sha256::Sha256() noexcept : state_(constants::SHA256_INIT) {}

void Sha256::reset() noexcept {
    state_ = constants::SHA256_INIT;
    buffered_ = 0;
    total_len_ = 0;
}

Sha256& Sha256::update(ByteSpan data) noexcept {
    const uint8_t* ptr = data.data();
    std::size_t len = data.size();
    total_len_ += len;

    // Дополняем ранее накопленный неполный блок
    if (buffered_ > 0) {
        std::size_t take = std::min(len, buffer_.size() - buffered_);
        std::memcpy(buffer_.data() + buffered_, ptr, take);
        buffered_ += take;
        ptr += take;
        len -= take;

        if (buffered_ < buffer_.size()) {
            return *this;
        }
        sha256_transform(state_, buffer_.data());
        buffered_ = 0;
    }

    // Полные блоки обрабатываем напрямую из входа
    while (len >= constants::SHA256_BLOCK_SIZE) {
        sha256_transform(state_, ptr);
        ptr += constants::SHA256_BLOCK_SIZE;
        len -= constants::SHA256_BLOCK_SIZE;
    }

    if (len > 0) {
        std::memcpy(buffer_.data(), ptr, len);
        buffered_ = len;
    }
    return *this;
}

Hash256 Sha256::finalize() noexcept {
    const uint64_t bit_len = total_len_ * 8;

    // 0x80, затем нули до 56 байт в последнем блоке, затем длина в битах
    buffer_[buffered_++] = 0x80;
    if (buffered_ > 56) {
        std::memset(buffer_.data() + buffered_, 0, buffer_.size() - buffered_);
        sha256_transform(state_, buffer_.data());
        buffered_ = 0;
    }
    std::memset(buffer_.data() + buffered_, 0, 56 - buffered_);
    write_be64(buffer_.data() + 56, bit_len);
    sha256_transform(state_, buffer_.data());

    Hash256 result;
    for (std::size_t i = 0; i < state_.size(); ++i) {
        write_be32(result.data() + i * 4, state_[i]);
    }

    reset();
    return result;
}

// =============================================================================
// Свободные функции
// =============================================================================

Hash256 sha256(ByteSpan data) noexcept {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

Hash256 hash_all(std::span<const ByteSpan> parts) noexcept {
    Sha256 outer;
    for (const auto& part : parts) {
        const Hash256 digest = sha256(part);
        outer.update(digest);
    }
    return outer.finalize();
}

Hash256 hash_all(std::initializer_list<ByteSpan> parts) noexcept {
    return hash_all(std::span<const ByteSpan>(parts.begin(), parts.size()));
}

} // namespace weavekit::crypto
