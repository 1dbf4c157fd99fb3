/**
 * @file chunk_sink.cpp
 * @brief Реализация файлового приёмника
 */

#include "chunk_sink.hpp"

namespace weavekit::transfer {

FileSink::FileSink(std::filesystem::path path, std::fstream stream)
    : path_(std::move(path)), stream_(std::move(stream))
{
}

Result<std::unique_ptr<FileSink>> FileSink::create(const std::filesystem::path& path) {
    std::fstream stream(path, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
    if (!stream.is_open()) {
        return Err<std::unique_ptr<FileSink>>(
            ErrorCode::SystemIOError,
            "Не удалось открыть файл: " + path.string()
        );
    }
    return std::unique_ptr<FileSink>(new FileSink(path, std::move(stream)));
}

Result<void> FileSink::write_at(uint64_t offset, ByteSpan data) {
    stream_.seekp(static_cast<std::streamoff>(offset));
    if (!stream_) {
        stream_.clear();
        return Err<void>(
            ErrorCode::SystemIOError,
            "Не удалось перейти к смещению " + std::to_string(offset) + " в " + path_.string()
        );
    }

    stream_.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    if (!stream_) {
        stream_.clear();
        return Err<void>(
            ErrorCode::SystemIOError,
            "Ошибка записи по смещению " + std::to_string(offset) + " в " + path_.string()
        );
    }

    return {};
}

Result<void> FileSink::flush() {
    stream_.flush();
    if (!stream_) {
        stream_.clear();
        return Err<void>(ErrorCode::SystemIOError, "Ошибка сброса буферов " + path_.string());
    }
    return {};
}

} // namespace weavekit::transfer
