/**
 * @file downloader.hpp
 * @brief Параллельное скачивание данных транзакции
 *
 * Алгоритм:
 * 1. Первый отвечающий пир сообщает положение данных (offset, size)
 * 2. Диапазон [start, start + size) режется на окна по 256 KiB
 * 3. Окна обрабатываются пулом потоков через GrowableQueue, каждое окно
 *    запрашивается по абсолютному смещению первого байта, с повторами
 *    на других пирах
 * 4. Полученные байты пишутся в приёмник по смещению окна
 *
 * Границы окон не обязаны совпадать с листьями Merkle дерева отправителя,
 * доказательства на этом уровне не проверяются: от пира требуется только
 * точная длина окна.
 */

#pragma once

#include "chunk_sink.hpp"
#include "../core/constants.hpp"
#include "../net/peer_transport.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace weavekit::transfer {

/**
 * @brief Параметры скачивания
 */
struct DownloadOptions {
    /// @brief Количество одновременных запросов
    std::size_t concurrency = constants::DEFAULT_CONCURRENCY_LEVEL;

    /// @brief Повторов на окно после первого запроса
    uint32_t retries_per_chunk = constants::DEFAULT_RETRIES_PER_CHUNK;

    /// @brief Размер окна
    uint64_t window_size = constants::DOWNLOAD_WINDOW_SIZE;
};

/**
 * @brief Окно скачивания
 */
struct DownloadWindow {
    /// @brief Абсолютное смещение первого байта окна в сети
    uint64_t seed_offset{0};

    /// @brief Смещение окна в выходном файле
    uint64_t file_offset{0};

    /// @brief Ожидаемый размер
    uint64_t size{0};

    [[nodiscard]] bool operator==(const DownloadWindow&) const noexcept = default;
};

/**
 * @brief Итоги скачивания
 */
struct DownloadStats {
    uint64_t total_size{0};
    std::size_t windows_expected{0};
    std::size_t windows_written{0};
    uint64_t bytes_written{0};
};

/**
 * @brief Разбить данные транзакции на окна
 *
 * Последнее окно может быть короче window_size.
 */
[[nodiscard]] std::vector<DownloadWindow> partition_windows(
    const net::TxOffset& location,
    uint64_t window_size = constants::DOWNLOAD_WINDOW_SIZE
);

/**
 * @brief Загрузчик данных транзакции
 */
class Downloader {
public:
    explicit Downloader(net::PeerTransport& transport, DownloadOptions options = {});

    /**
     * @brief Скачать данные транзакции в приёмник
     *
     * @param tx_id Идентификатор транзакции
     * @param sink Приёмник
     * @param peers Кандидаты (базовые URL или host:port)
     * @return Статистика или TransferMissingChunks, если записаны не все окна
     */
    [[nodiscard]] Result<DownloadStats> download(
        std::string_view tx_id,
        ChunkSink& sink,
        const std::vector<std::string>& peers
    );

    /**
     * @brief Узнать положение данных у первого отвечающего пира
     */
    [[nodiscard]] Result<net::TxOffset> locate(
        std::string_view tx_id,
        const std::vector<std::string>& peers
    );

    /**
     * @brief Скачать одно окно с повторами
     *
     * @param window Окно
     * @param peers Кандидаты, перебираются по кругу начиная с first_peer
     * @param first_peer Индекс первого пира
     * @return Байты окна или последняя ошибка
     */
    [[nodiscard]] Result<Bytes> fetch_window(
        const DownloadWindow& window,
        const std::vector<std::string>& peers,
        std::size_t first_peer = 0
    );

private:
    net::PeerTransport& transport_;
    DownloadOptions options_;
};

} // namespace weavekit::transfer
