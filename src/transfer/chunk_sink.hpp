/**
 * @file chunk_sink.hpp
 * @brief Приёмник скачанных данных с позиционной записью
 *
 * Окна скачиваются в произвольном порядке, поэтому приёмник должен
 * поддерживать запись по смещению. Вызывающая сторона сериализует
 * вызовы: реализация не обязана быть потокобезопасной.
 */

#pragma once

#include "../core/types.hpp"

#include <filesystem>
#include <fstream>
#include <memory>

namespace weavekit::transfer {

/**
 * @brief Приёмник данных
 */
class ChunkSink {
public:
    virtual ~ChunkSink() = default;

    /**
     * @brief Записать данные по смещению от начала файла
     */
    [[nodiscard]] virtual Result<void> write_at(uint64_t offset, ByteSpan data) = 0;

    /**
     * @brief Сбросить буферы
     */
    [[nodiscard]] virtual Result<void> flush() = 0;
};

/**
 * @brief Приёмник в файл
 */
class FileSink final : public ChunkSink {
public:
    /**
     * @brief Создать (или обрезать) файл и открыть его на запись
     *
     * @return Приёмник или SystemIOError
     */
    [[nodiscard]] static Result<std::unique_ptr<FileSink>> create(const std::filesystem::path& path);

    [[nodiscard]] Result<void> write_at(uint64_t offset, ByteSpan data) override;
    [[nodiscard]] Result<void> flush() override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    FileSink(std::filesystem::path path, std::fstream stream);

    std::filesystem::path path_;
    std::fstream stream_;
};

} // namespace weavekit::transfer
