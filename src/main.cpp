/**
 * @file main.cpp
 * @brief Точка входа weavekit
 *
 * weavekit - клиент хранения данных в сети Arweave: разбиение на chunks,
 * Merkle доказательства, параллельная выгрузка и скачивание, поиск пиров.
 *
 * Использование:
 *   weavekit [опции] <команда> [аргументы]
 *
 * Команды:
 *   data-root FILE            Вычислить data root файла
 *   download TX_ID OUT        Скачать данные транзакции в файл
 *   upload FILE               Выгрузить chunks файла на шлюз
 *   crawl                     Найти доступных пиров
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/encoding.hpp"
#include "log/logger.hpp"
#include "merkle/data_payload.hpp"
#include "net/http_transport.hpp"
#include "network/peer_crawler.hpp"
#include "transfer/chunk_sink.hpp"
#include "transfer/downloader.hpp"
#include "transfer/uploader.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

constexpr std::string_view COMPONENT = "main";

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
weavekit v)" << VERSION << R"(
Клиент хранения данных в сети Arweave

ИСПОЛЬЗОВАНИЕ:
    weavekit [ОПЦИИ] <КОМАНДА> [АРГУМЕНТЫ]

КОМАНДЫ:
    data-root FILE         Вычислить data root и количество chunks
    download TX_ID OUT     Скачать данные транзакции в файл OUT
    upload FILE            Выгрузить chunks файла с доказательствами
    crawl                  Найти доступных пиров (от шлюза или --peer)

ОПЦИИ:
    -c, --config PATH      Путь к файлу конфигурации (weavekit.toml)
    -p, --peer ADDR        Пир (можно указать несколько раз)
    -g, --gateway URL      URL шлюза (перекрывает gateway.url)
    --verbose              Подробный вывод (уровень debug)
    -h, --help             Показать эту справку
    -v, --version          Показать версию программы

ПРИМЕРЫ:
    weavekit data-root ./photo.jpg
    weavekit -p 1.2.3.4:1984 download <tx_id> ./out.bin
    weavekit crawl

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "weavekit v" << VERSION << std::endl;
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    std::optional<std::string> gateway;
    std::vector<std::string> peers;
    std::vector<std::string> positional;
    bool show_help = false;
    bool show_version = false;
    bool verbose = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-g" || arg == "--gateway") && i + 1 < argc) {
            args.gateway = argv[++i];
        } else if ((arg == "-p" || arg == "--peer") && i + 1 < argc) {
            args.peers.emplace_back(argv[++i]);
        } else {
            args.positional.emplace_back(arg);
        }
    }

    return args;
}

/**
 * @brief Прочитать файл целиком
 */
weavekit::Result<weavekit::Bytes> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return weavekit::Err<weavekit::Bytes>(
            weavekit::ErrorCode::SystemIOError,
            "Не удалось открыть файл: " + path
        );
    }
    weavekit::Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return weavekit::Err<weavekit::Bytes>(
            weavekit::ErrorCode::SystemIOError,
            "Ошибка чтения файла: " + path
        );
    }
    return data;
}

/**
 * @brief Загрузить конфигурацию
 *
 * Без явного пути отсутствие файла не ошибка: используются значения
 * по умолчанию.
 */
weavekit::Result<weavekit::Config> load_config(const Args& args) {
    using namespace weavekit;

    Result<Config> config = args.config_path
        ? Config::load(*args.config_path)
        : Config::load_with_search();

    if (!config && !args.config_path && config.error().code == ErrorCode::ConfigNotFound) {
        config = Config{};
    }
    if (!config) {
        return config;
    }

    if (args.gateway) {
        config->gateway.url = *args.gateway;
    }

    auto validation = config->validate();
    if (!validation) {
        return std::unexpected(validation.error());
    }
    return config;
}

int report(const weavekit::Error& error) {
    weavekit::log::error(COMPONENT, error.message);
    return 1;
}

// =============================================================================
// Команды
// =============================================================================

int cmd_data_root(const std::vector<std::string>& positional) {
    using namespace weavekit;

    if (positional.size() < 2) {
        std::cerr << "Использование: weavekit data-root FILE" << std::endl;
        return 2;
    }

    auto data = read_file(positional[1]);
    if (!data) {
        return report(data.error());
    }

    auto prepared = merkle::prepare_data(*data);
    if (!prepared) {
        return report(prepared.error());
    }

    std::cout << "data_root: " << encoding::base64url_encode(prepared->data_root) << std::endl;
    std::cout << "data_size: " << prepared->data_size << std::endl;
    std::cout << "chunks:    " << prepared->chunks.size() << std::endl;
    return 0;
}

/**
 * @brief Кандидаты: явно указанные пиры или шлюз
 */
std::vector<std::string> candidate_peers(const weavekit::Config& config, const Args& args) {
    if (!args.peers.empty()) {
        return args.peers;
    }
    return {config.gateway.url};
}

weavekit::net::HttpOptions http_options(const weavekit::Config& config) {
    weavekit::net::HttpOptions options;
    options.timeout = std::chrono::milliseconds(config.gateway.timeout_ms);
    options.connect_timeout = std::chrono::milliseconds(config.gateway.connect_timeout_ms);
    return options;
}

int cmd_download(const weavekit::Config& config, const Args& args) {
    using namespace weavekit;

    if (args.positional.size() < 3) {
        std::cerr << "Использование: weavekit download TX_ID OUT" << std::endl;
        return 2;
    }

    auto sink = transfer::FileSink::create(args.positional[2]);
    if (!sink) {
        return report(sink.error());
    }

    net::HttpTransport transport(http_options(config));

    transfer::DownloadOptions options;
    options.concurrency = config.download.concurrency;
    options.retries_per_chunk = config.download.retries_per_chunk;

    transfer::Downloader downloader(transport, options);
    auto stats = downloader.download(args.positional[1], **sink, candidate_peers(config, args));
    if (!stats) {
        return report(stats.error());
    }

    std::cout << "Скачано " << stats->bytes_written << " байт в "
              << args.positional[2] << std::endl;
    return 0;
}

int cmd_upload(const weavekit::Config& config, const Args& args) {
    using namespace weavekit;

    if (args.positional.size() < 2) {
        std::cerr << "Использование: weavekit upload FILE" << std::endl;
        return 2;
    }

    auto data = read_file(args.positional[1]);
    if (!data) {
        return report(data.error());
    }

    auto prepared = merkle::prepare_data(*data);
    if (!prepared) {
        return report(prepared.error());
    }
    if (prepared->empty()) {
        log::warning(COMPONENT, "Файл пуст, выгружать нечего");
        return 0;
    }

    log::info(COMPONENT, "data_root " + encoding::base64url_encode(prepared->data_root) +
                         ", chunks: " + std::to_string(prepared->chunks.size()));

    net::HttpTransport transport(http_options(config));

    transfer::UploadOptions options;
    options.concurrency = config.upload.concurrency;
    options.max_retries = config.upload.max_retries;
    options.retry_backoff = std::chrono::milliseconds(config.upload.retry_backoff_ms);

    const std::string peer = args.peers.empty() ? config.gateway.url : args.peers.front();
    transfer::Uploader uploader(transport, peer, options);

    transfer::UploadReport upload_report;
    auto result = uploader.upload_all(*prepared, &upload_report);
    if (!result) {
        for (uint64_t offset : upload_report.failed_offsets) {
            std::cerr << "  не отправлен chunk с offset " << offset << std::endl;
        }
        return report(result.error());
    }

    std::cout << "Отправлено chunks: " << result->succeeded << std::endl;
    return 0;
}

int cmd_crawl(const weavekit::Config& config, const Args& args) {
    using namespace weavekit;

    net::HttpTransport transport(http_options(config));
    network::PeerCrawler crawler(transport, config.gateway.url);

    network::CrawlOptions options;
    options.concurrency = config.crawler.concurrency;
    options.timeout = std::chrono::milliseconds(config.crawler.timeout_ms);
    options.max_depth = config.crawler.max_depth;
    options.max_count = config.crawler.max_count;

    auto peers = args.peers.empty()
        ? crawler.discover(options)
        : crawler.crawl(args.peers, options);
    if (!peers) {
        return report(peers.error());
    }

    for (const auto& peer : *peers) {
        std::cout << peer << std::endl;
    }
    return 0;
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace weavekit;

    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    if (args.positional.empty()) {
        print_help();
        return 2;
    }

    auto config = load_config(args);
    if (!config) {
        std::cerr << "[ERROR] " << config.error().message << std::endl;
        return 1;
    }

    log::LoggerConfig logger_config;
    logger_config.min_level = args.verbose
        ? log::Level::Debug
        : log::parse_level(config->logging.level).value_or(log::Level::Info);
    logger_config.color = config->logging.color;
    log::Logger::instance().configure(logger_config);

    const std::string& command = args.positional.front();

    if (command == "data-root") {
        return cmd_data_root(args.positional);
    }
    if (command == "download") {
        return cmd_download(*config, args);
    }
    if (command == "upload") {
        return cmd_upload(*config, args);
    }
    if (command == "crawl") {
        return cmd_crawl(*config, args);
    }

    std::cerr << "Неизвестная команда: " << command << std::endl;
    print_help();
    return 2;
}
