/**
 * @file peer_transport.hpp
 * @brief Абстрактный транспорт к узлам сети
 *
 * Все методы принимают базовый URL пира ("http://host:port"). Адреса из
 * списка /peers приходят в виде "host:port" и приводятся к URL через
 * peer_url().
 *
 * Используемые конечные точки:
 * - GET  /tx/{id}/offset   -> {"offset": ..., "size": ...}
 * - GET  /chunk/{offset}   -> {"chunk": base64url}
 * - POST /chunk            <- {data_root, data_size, data_path, offset, chunk}
 * - GET  /peers            -> ["host:port", ...]
 *
 * Реализации должны быть потокобезопасны: один экземпляр используется
 * всеми рабочими потоками операции.
 */

#pragma once

#include "../core/types.hpp"
#include "../merkle/data_payload.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace weavekit::net {

/**
 * @brief Положение транзакции в общем пространстве данных сети
 */
struct TxOffset {
    /// @brief Абсолютное смещение последнего байта данных
    uint64_t offset{0};

    /// @brief Размер данных в байтах
    uint64_t size{0};

    /// @brief Абсолютное смещение первого байта
    [[nodiscard]] uint64_t start() const noexcept { return offset + 1 - size; }
};

/**
 * @brief Транспорт к пирам
 */
class PeerTransport {
public:
    virtual ~PeerTransport() = default;

    /**
     * @brief Получить положение данных транзакции
     */
    [[nodiscard]] virtual Result<TxOffset> get_tx_offset(
        const std::string& peer, std::string_view tx_id) = 0;

    /**
     * @brief Получить chunk по абсолютному смещению
     *
     * @return Декодированные байты или NetworkChunkNotFound
     */
    [[nodiscard]] virtual Result<Bytes> get_chunk(const std::string& peer, uint64_t offset) = 0;

    /**
     * @brief Отправить chunk с доказательством
     */
    [[nodiscard]] virtual Result<void> post_chunk(
        const std::string& peer, const merkle::ChunkEnvelope& envelope) = 0;

    /**
     * @brief Получить список известных пиру адресов
     *
     * @param timeout Таймаут этого запроса
     */
    [[nodiscard]] virtual Result<std::vector<std::string>> get_peers(
        const std::string& peer, std::chrono::milliseconds timeout) = 0;
};

// =============================================================================
// Адреса пиров
// =============================================================================

/**
 * @brief Привести адрес к базовому URL
 *
 * "1.2.3.4:1984" -> "http://1.2.3.4:1984". URL со схемой возвращается
 * без завершающего '/'.
 */
[[nodiscard]] std::string peer_url(std::string_view address);

/**
 * @brief Ключ пира для дедупликации: адрес без схемы и завершающего '/'
 *
 * "http://arweave.net:80/" -> "arweave.net:80"
 */
[[nodiscard]] std::string peer_key(std::string_view url);

} // namespace weavekit::net
