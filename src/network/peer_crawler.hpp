/**
 * @file peer_crawler.hpp
 * @brief Обход сети в ширину для поиска доступных пиров
 *
 * Каждый пир опрашивается запросом /peers. Ответившие пиры попадают в
 * результат, их соседи добавляются в очередь на глубине depth + 1, пока
 * depth < max_depth. Общая таблица visited гарантирует, что каждый адрес
 * опрашивается не более одного раза, даже при циклах в графе.
 *
 * Собственный адрес шлюза помечается посещённым до начала обхода и
 * поэтому никогда не попадает в результат.
 */

#pragma once

#include "../core/constants.hpp"
#include "../net/peer_transport.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace weavekit::network {

/**
 * @brief Состояние пира в таблице обхода
 */
enum class PeerStatus {
    Pending,
    Ok,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(PeerStatus status) noexcept {
    switch (status) {
        case PeerStatus::Pending: return "pending";
        case PeerStatus::Ok: return "ok";
        case PeerStatus::Failed: return "failed";
    }
    return "unknown";
}

/**
 * @brief Параметры обхода
 */
struct CrawlOptions {
    /// @brief Одновременных запросов
    std::size_t concurrency = constants::DEFAULT_CRAWL_CONCURRENCY;

    /// @brief Таймаут одного запроса /peers
    std::chrono::milliseconds timeout{constants::DEFAULT_CRAWL_TIMEOUT_MS};

    /// @brief Максимальная глубина от начальных пиров
    std::size_t max_depth = constants::DEFAULT_CRAWL_MAX_DEPTH;

    /// @brief Остановиться после стольких ответивших пиров
    std::size_t max_count = constants::DEFAULT_CRAWL_MAX_COUNT;
};

/**
 * @brief Обходчик пиров
 */
class PeerCrawler {
public:
    /**
     * @param transport Транспорт
     * @param gateway_url URL шлюза ("http://arweave.net:80")
     */
    PeerCrawler(net::PeerTransport& transport, std::string gateway_url);

    /**
     * @brief Обойти сеть начиная с заданных пиров
     *
     * @param seeds Начальные адреса (host:port или URL)
     * @param options Параметры
     * @return Ответившие пиры (host:port) в порядке ответа, не более max_count
     */
    [[nodiscard]] Result<std::vector<std::string>> crawl(
        const std::vector<std::string>& seeds,
        const CrawlOptions& options = {}
    );

    /**
     * @brief Получить список пиров шлюза и обойти сеть от него
     */
    [[nodiscard]] Result<std::vector<std::string>> discover(const CrawlOptions& options = {});

    [[nodiscard]] const std::string& gateway() const noexcept { return gateway_url_; }

private:
    net::PeerTransport& transport_;
    std::string gateway_url_;
};

} // namespace weavekit::network
