/**
 * @file uploader.hpp
 * @brief Выгрузка chunks с доказательствами на узел
 *
 * Каждый chunk отправляется отдельным POST /chunk. При неудаче запрос
 * повторяется после фиксированной паузы. Пакетная выгрузка пытается
 * отправить все chunks, даже если часть из них уже не прошла, и
 * завершается ошибкой, если хоть один chunk так и не был принят.
 */

#pragma once

#include "../core/constants.hpp"
#include "../merkle/data_payload.hpp"
#include "../net/peer_transport.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace weavekit::transfer {

/**
 * @brief Параметры выгрузки
 */
struct UploadOptions {
    /// @brief Количество одновременных запросов
    std::size_t concurrency = constants::DEFAULT_UPLOAD_CONCURRENCY;

    /// @brief Повторов после первой неудачной попытки
    uint32_t max_retries = constants::CHUNKS_RETRIES;

    /// @brief Пауза перед повтором
    std::chrono::milliseconds retry_backoff{constants::CHUNKS_RETRY_SLEEP_MS};
};

/**
 * @brief Итоги пакетной выгрузки
 */
struct UploadReport {
    std::size_t succeeded{0};

    /// @brief Смещения (Proof::offset) chunks, которые не удалось отправить
    std::vector<uint64_t> failed_offsets;

    [[nodiscard]] bool ok() const noexcept { return failed_offsets.empty(); }
};

/**
 * @brief Выгрузчик chunks
 */
class Uploader {
public:
    /**
     * @param transport Транспорт
     * @param peer Узел, принимающий chunks
     * @param options Параметры
     */
    Uploader(net::PeerTransport& transport, std::string peer, UploadOptions options = {});

    /**
     * @brief Отправить один chunk с повторами
     *
     * Не более max_retries + 1 попыток.
     *
     * @return Успех или ошибка последней попытки
     */
    [[nodiscard]] Result<void> upload_chunk_with_retries(const merkle::ChunkEnvelope& envelope);

    /**
     * @brief Отправить все chunks подготовленных данных
     *
     * @param report Заполняется итогами, если не nullptr (в том числе при ошибке)
     * @return Отчёт или TransferUploadFailed
     */
    [[nodiscard]] Result<UploadReport> upload_all(
        const merkle::PreparedData& payload,
        UploadReport* report = nullptr
    );

private:
    net::PeerTransport& transport_;
    std::string peer_;
    UploadOptions options_;
};

} // namespace weavekit::transfer
