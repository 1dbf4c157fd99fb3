/**
 * @file downloader.cpp
 * @brief Реализация скачивания данных транзакции
 */

#include "downloader.hpp"
#include "../log/logger.hpp"
#include "../sync/growable_queue.hpp"

#include <algorithm>
#include <mutex>

namespace weavekit::transfer {

namespace {

constexpr std::string_view COMPONENT = "downloader";

struct WindowTask {
    std::size_t index{0};
    DownloadWindow window;
};

} // anonymous namespace

std::vector<DownloadWindow> partition_windows(const net::TxOffset& location, uint64_t window_size) {
    std::vector<DownloadWindow> windows;
    if (location.size == 0 || window_size == 0) {
        return windows;
    }

    const uint64_t start = location.start();
    windows.reserve(static_cast<std::size_t>((location.size + window_size - 1) / window_size));

    for (uint64_t file_offset = 0; file_offset < location.size; file_offset += window_size) {
        DownloadWindow window;
        window.seed_offset = start + file_offset;
        window.file_offset = file_offset;
        window.size = std::min(window_size, location.size - file_offset);
        windows.push_back(window);
    }

    return windows;
}

Downloader::Downloader(net::PeerTransport& transport, DownloadOptions options)
    : transport_(transport), options_(options)
{
}

Result<net::TxOffset> Downloader::locate(std::string_view tx_id,
                                         const std::vector<std::string>& peers) {
    if (peers.empty()) {
        return Err<net::TxOffset>(ErrorCode::TransferNoPeers);
    }

    Error last_error{ErrorCode::TransferNoPeers};
    for (const auto& peer : peers) {
        auto location = transport_.get_tx_offset(peer, tx_id);
        if (location) {
            log::debug(COMPONENT, "Транзакция " + std::string(tx_id) + ": offset=" +
                                  std::to_string(location->offset) + ", size=" +
                                  std::to_string(location->size));
            return location;
        }
        log::warning(COMPONENT, "Пир " + peer + " не вернул offset: " + location.error().message);
        last_error = location.error();
    }

    return std::unexpected(last_error);
}

Result<Bytes> Downloader::fetch_window(const DownloadWindow& window,
                                       const std::vector<std::string>& peers,
                                       std::size_t first_peer) {
    if (peers.empty()) {
        return Err<Bytes>(ErrorCode::TransferNoPeers);
    }

    // Первый запрос плюс retries_per_chunk повторов
    const uint64_t attempts = uint64_t{options_.retries_per_chunk} + 1;
    Error last_error{ErrorCode::NetworkConnectionFailed};

    for (uint64_t attempt = 0; attempt < attempts; ++attempt) {
        const auto& peer = peers[(first_peer + attempt) % peers.size()];

        auto bytes = transport_.get_chunk(peer, window.seed_offset);
        if (!bytes) {
            last_error = bytes.error();
        } else if (bytes->size() != window.size) {
            last_error = Error{
                ErrorCode::ChunkInvalidLength,
                "Окно " + std::to_string(window.seed_offset) + ": ожидалось " +
                    std::to_string(window.size) + " байт, получено " +
                    std::to_string(bytes->size())
            };
        } else {
            return bytes;
        }

        log::debug(COMPONENT, "Попытка " + std::to_string(attempt + 1) + "/" +
                              std::to_string(attempts) + " для " + peer + ": " +
                              last_error.message);

        if (!is_transient(last_error.code)) {
            break;
        }
    }

    return std::unexpected(last_error);
}

Result<DownloadStats> Downloader::download(std::string_view tx_id,
                                           ChunkSink& sink,
                                           const std::vector<std::string>& peers) {
    auto location = locate(tx_id, peers);
    if (!location) {
        return std::unexpected(location.error());
    }

    const auto windows = partition_windows(*location, options_.window_size);

    DownloadStats stats;
    stats.total_size = location->size;
    stats.windows_expected = windows.size();

    std::vector<WindowTask> tasks;
    tasks.reserve(windows.size());
    for (std::size_t i = 0; i < windows.size(); ++i) {
        tasks.push_back(WindowTask{i, windows[i]});
    }

    sync::GrowableQueue<WindowTask> queue(std::move(tasks));
    std::mutex sink_mutex;

    sync::drain_with_workers(queue, options_.concurrency, [&](WindowTask task) {
        auto bytes = fetch_window(task.window, peers, task.index);
        if (!bytes) {
            log::error(COMPONENT, "Окно " + std::to_string(task.window.seed_offset) +
                                  " не получено: " + bytes.error().message);
            return;
        }

        std::lock_guard<std::mutex> lock(sink_mutex);
        auto written = sink.write_at(task.window.file_offset, *bytes);
        if (written) {
            written = sink.flush();
        }
        if (!written) {
            log::error(COMPONENT, written.error().message);
            return;
        }
        ++stats.windows_written;
        stats.bytes_written += bytes->size();
    });

    if (stats.windows_written != stats.windows_expected) {
        return Err<DownloadStats>(
            ErrorCode::TransferMissingChunks,
            "Записано окон: " + std::to_string(stats.windows_written) + "/" +
                std::to_string(stats.windows_expected)
        );
    }

    log::info(COMPONENT, "Скачано " + std::to_string(stats.bytes_written) + " байт, окон: " +
                         std::to_string(stats.windows_written));
    return stats;
}

} // namespace weavekit::transfer
