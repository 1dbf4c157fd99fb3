/**
 * @file http_transport.hpp
 * @brief HTTP транспорт к узлам на libcurl
 *
 * Каждый запрос выполняется на собственном easy handle, поэтому один
 * экземпляр можно использовать из любого числа потоков.
 */

#pragma once

#include "peer_transport.hpp"
#include "../core/constants.hpp"

#include <chrono>
#include <memory>

namespace weavekit::net {

/**
 * @brief Параметры HTTP запросов
 */
struct HttpOptions {
    /// @brief Таймаут всего запроса
    std::chrono::milliseconds timeout{constants::DEFAULT_HTTP_TIMEOUT_MS};

    /// @brief Таймаут установки соединения
    std::chrono::milliseconds connect_timeout{constants::DEFAULT_CONNECT_TIMEOUT_MS};
};

/**
 * @brief Транспорт поверх HTTP
 */
class HttpTransport final : public PeerTransport {
public:
    explicit HttpTransport(const HttpOptions& options = {});
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    HttpTransport(HttpTransport&&) noexcept;
    HttpTransport& operator=(HttpTransport&&) noexcept;

    [[nodiscard]] Result<TxOffset> get_tx_offset(
        const std::string& peer, std::string_view tx_id) override;

    [[nodiscard]] Result<Bytes> get_chunk(const std::string& peer, uint64_t offset) override;

    [[nodiscard]] Result<void> post_chunk(
        const std::string& peer, const merkle::ChunkEnvelope& envelope) override;

    [[nodiscard]] Result<std::vector<std::string>> get_peers(
        const std::string& peer, std::chrono::milliseconds timeout) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace weavekit::net
