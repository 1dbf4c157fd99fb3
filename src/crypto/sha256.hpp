/**
 * @file sha256.hpp
 * @brief SHA256 и схема "хешировать каждое, склеить, хешировать снова"
 *
 * Предоставляет:
 * - Потоковый хешер Sha256 (update/finalize)
 * - Функцию sha256() для буфера целиком
 * - hash_all(): SHA256(SHA256(x1) || SHA256(x2) || ... || SHA256(xn))
 *
 * hash_all используется для id листьев и ветвей Merkle дерева.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>
#include <cstdint>
#include <initializer_list>
#include <span>

namespace weavekit::crypto {

/**
 * @brief SHA256 состояние (8 x 32-bit слов)
 */
using Sha256State = std::array<uint32_t, 8>;

/**
 * @brief Функция сжатия SHA256 для одного 64-байтного блока
 *
 * @param state Текущее состояние хеша (будет модифицировано)
 * @param block Указатель на 64 байта данных
 */
void sha256_transform(Sha256State& state, const uint8_t* block) noexcept;

/**
 * @brief Потоковый SHA256 хешер
 *
 * Позволяет хешировать данные частями без промежуточной конкатенации.
 *
 * @code
 * Sha256 hasher;
 * hasher.update(left);
 * hasher.update(right);
 * Hash256 digest = hasher.finalize();
 * @endcode
 */
class Sha256 {
public:
    Sha256() noexcept;

    /**
     * @brief Добавить данные
     */
    Sha256& update(ByteSpan data) noexcept;

    /**
     * @brief Завершить вычисление и получить хеш
     *
     * После вызова хешер сбрасывается в начальное состояние.
     */
    [[nodiscard]] Hash256 finalize() noexcept;

    /**
     * @brief Сбросить в начальное состояние
     */
    void reset() noexcept;

private:
    Sha256State state_;
    std::array<uint8_t, constants::SHA256_BLOCK_SIZE> buffer_{};
    std::size_t buffered_{0};
    uint64_t total_len_{0};
};

/**
 * @brief Вычислить SHA256 хеш данных произвольной длины
 *
 * @param data Входные данные для хеширования
 * @return Hash256 32-байтный хеш
 */
[[nodiscard]] Hash256 sha256(ByteSpan data) noexcept;

/**
 * @brief Хешировать каждый элемент, склеить хеши и хешировать результат
 *
 * hash_all(x1..xn) = SHA256(SHA256(x1) || ... || SHA256(xn))
 */
[[nodiscard]] Hash256 hash_all(std::span<const ByteSpan> parts) noexcept;

/**
 * @brief Перегрузка для списка инициализации
 */
[[nodiscard]] Hash256 hash_all(std::initializer_list<ByteSpan> parts) noexcept;

} // namespace weavekit::crypto
