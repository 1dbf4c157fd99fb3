/**
 * @file uploader.cpp
 * @brief Реализация выгрузки chunks
 */

#include "uploader.hpp"
#include "../log/logger.hpp"
#include "../sync/growable_queue.hpp"

#include <algorithm>
#include <mutex>
#include <thread>

namespace weavekit::transfer {

namespace {

constexpr std::string_view COMPONENT = "uploader";

} // anonymous namespace

Uploader::Uploader(net::PeerTransport& transport, std::string peer, UploadOptions options)
    : transport_(transport), peer_(std::move(peer)), options_(options)
{
}

Result<void> Uploader::upload_chunk_with_retries(const merkle::ChunkEnvelope& envelope) {
    auto result = transport_.post_chunk(peer_, envelope);

    for (uint32_t retry = 0; retry < options_.max_retries && !result; ++retry) {
        log::debug(COMPONENT, "Chunk " + std::to_string(envelope.offset) + ": " +
                              result.error().message + ", повтор " +
                              std::to_string(retry + 1) + "/" +
                              std::to_string(options_.max_retries));

        if (options_.retry_backoff.count() > 0) {
            std::this_thread::sleep_for(options_.retry_backoff);
        }
        result = transport_.post_chunk(peer_, envelope);
    }

    return result;
}

Result<UploadReport> Uploader::upload_all(const merkle::PreparedData& payload,
                                          UploadReport* report) {
    UploadReport local;
    std::mutex report_mutex;

    sync::GrowableQueue<merkle::ChunkEnvelope> queue(payload.envelopes());

    sync::drain_with_workers(queue, options_.concurrency, [&](merkle::ChunkEnvelope envelope) {
        auto result = upload_chunk_with_retries(envelope);

        std::lock_guard<std::mutex> lock(report_mutex);
        if (result) {
            ++local.succeeded;
        } else {
            log::error(COMPONENT, "Chunk " + std::to_string(envelope.offset) +
                                  " не отправлен: " + result.error().message);
            local.failed_offsets.push_back(envelope.offset);
        }
    });

    std::sort(local.failed_offsets.begin(), local.failed_offsets.end());

    if (report) {
        *report = local;
    }

    if (!local.ok()) {
        return Err<UploadReport>(
            ErrorCode::TransferUploadFailed,
            "Не отправлено chunks: " + std::to_string(local.failed_offsets.size()) + "/" +
                std::to_string(local.failed_offsets.size() + local.succeeded)
        );
    }

    log::info(COMPONENT, "Отправлено chunks: " + std::to_string(local.succeeded));
    return local;
}

} // namespace weavekit::transfer
