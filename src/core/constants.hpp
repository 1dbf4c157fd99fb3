/**
 * @file constants.hpp
 * @brief Константы формата данных и сетевого протокола
 *
 * Размеры chunk, бинарный формат доказательств и значения по умолчанию
 * для передачи данных и обхода пиров.
 *
 * @note Все константы определены как constexpr для compile-time вычислений.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <array>

namespace weavekit::constants {

// =============================================================================
// Разбиение данных на chunks
// =============================================================================

/// @brief Максимальный размер chunk (256 KiB)
inline constexpr std::size_t MAX_CHUNK_SIZE = 256 * 1024;

/// @brief Минимальный размер последнего chunk (32 KiB)
inline constexpr std::size_t MIN_CHUNK_SIZE = 32 * 1024;

// =============================================================================
// Бинарный формат доказательств
// =============================================================================

/// @brief Размер SHA256 хеша в байтах
inline constexpr std::size_t HASH_SIZE = 32;

/// @brief Размер note (big-endian число, дополненное нулями слева)
inline constexpr std::size_t NOTE_SIZE = 32;

/// @brief Размер записи ветви: left_id[32] + right_id[32] + note[32]
inline constexpr std::size_t BRANCH_RECORD_SIZE = 2 * HASH_SIZE + NOTE_SIZE;
static_assert(BRANCH_RECORD_SIZE == 96, "Запись ветви должна быть 96 байт");

/// @brief Размер записи листа: data_hash[32] + note[32]
inline constexpr std::size_t LEAF_RECORD_SIZE = HASH_SIZE + NOTE_SIZE;
static_assert(LEAF_RECORD_SIZE == 64, "Запись листа должна быть 64 байта");

/// @brief Размер блока SHA256 (один transform) в байтах
inline constexpr std::size_t SHA256_BLOCK_SIZE = 64;

// =============================================================================
// Передача данных
// =============================================================================

/// @brief Размер окна при скачивании (совпадает с MAX_CHUNK_SIZE)
inline constexpr uint64_t DOWNLOAD_WINDOW_SIZE = 256 * 1024;

/// @brief Количество параллельных запросов при скачивании по умолчанию
inline constexpr std::size_t DEFAULT_CONCURRENCY_LEVEL = 100;

/// @brief Количество попыток на одно окно при скачивании
inline constexpr uint32_t DEFAULT_RETRIES_PER_CHUNK = 3;

/// @brief Количество повторных отправок chunk
inline constexpr uint32_t CHUNKS_RETRIES = 10;

/// @brief Пауза между повторными отправками chunk (мс)
inline constexpr uint32_t CHUNKS_RETRY_SLEEP_MS = 1000;

/// @brief Количество параллельных отправок chunk по умолчанию
inline constexpr std::size_t DEFAULT_UPLOAD_CONCURRENCY = 20;

// =============================================================================
// Обход пиров
// =============================================================================

/// @brief Максимальная глубина обхода по умолчанию
inline constexpr std::size_t DEFAULT_CRAWL_MAX_DEPTH = 3;

/// @brief Максимальное количество найденных пиров по умолчанию
inline constexpr std::size_t DEFAULT_CRAWL_MAX_COUNT = 100;

/// @brief Параллельность обхода по умолчанию
inline constexpr std::size_t DEFAULT_CRAWL_CONCURRENCY = 50;

/// @brief Таймаут запроса списка пиров (мс)
inline constexpr uint32_t DEFAULT_CRAWL_TIMEOUT_MS = 5000;

// =============================================================================
// HTTP
// =============================================================================

/// @brief Gateway по умолчанию
inline constexpr const char* DEFAULT_GATEWAY_URL = "http://arweave.net:80";

/// @brief Таймаут HTTP запроса (мс)
inline constexpr uint32_t DEFAULT_HTTP_TIMEOUT_MS = 30000;

/// @brief Таймаут подключения (мс)
inline constexpr uint32_t DEFAULT_CONNECT_TIMEOUT_MS = 5000;

// =============================================================================
// Начальные значения SHA256 (H0-H7)
// =============================================================================

/// @brief Начальные значения хеша SHA256 (FIPS 180-4)
inline constexpr std::array<uint32_t, 8> SHA256_INIT = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

/// @brief Константы раунда SHA256 (первые 32 бита дробной части кубических корней простых чисел)
inline constexpr std::array<uint32_t, 64> SHA256_K = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

} // namespace weavekit::constants
