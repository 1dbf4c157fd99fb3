/**
 * @file http_transport.cpp
 * @brief Реализация HTTP транспорта
 *
 * Использует libcurl: один easy handle на запрос, таймауты на каждый
 * запрос отдельно.
 */

#include "http_transport.hpp"
#include "json.hpp"

#include <curl/curl.h>

#include <mutex>

namespace weavekit::net {

namespace {

std::once_flag g_curl_init;

/**
 * @brief Ответ HTTP сервера
 */
struct HttpResponse {
    long status{0};
    std::string body;
};

/**
 * @brief RAII обёртка над easy handle
 */
struct CurlHandle {
    CURL* curl = curl_easy_init();

    CurlHandle() = default;
    ~CurlHandle() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

/**
 * @brief RAII обёртка над списком заголовков
 */
struct CurlHeaders {
    curl_slist* list = nullptr;

    ~CurlHeaders() {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
    const size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

} // anonymous namespace

// =============================================================================
// Реализация (PIMPL)
// =============================================================================

struct HttpTransport::Impl {
    HttpOptions options;

    explicit Impl(const HttpOptions& opts) : options(opts) {
        std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    /**
     * @brief Выполнить запрос
     *
     * @param url Полный URL
     * @param body Тело POST запроса (nullptr для GET)
     * @param timeout Таймаут запроса
     */
    Result<HttpResponse> perform(const std::string& url, const std::string* body,
                                 std::chrono::milliseconds timeout) const {
        CurlHandle handle;
        if (!handle.curl) {
            return Err<HttpResponse>(ErrorCode::NetworkConnectionFailed,
                                     "CURL не инициализирован");
        }
        CURL* curl = handle.curl;

        HttpResponse response;
        CurlHeaders headers;

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(options.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

        if (body) {
            headers.list = curl_slist_append(headers.list, "Content-Type: application/json");
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.list);
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(body->size()));
        }

        const CURLcode res = curl_easy_perform(curl);
        if (res == CURLE_OPERATION_TIMEDOUT) {
            return Err<HttpResponse>(ErrorCode::NetworkTimeout, url);
        }
        if (res == CURLE_URL_MALFORMAT || res == CURLE_UNSUPPORTED_PROTOCOL) {
            return Err<HttpResponse>(ErrorCode::NetworkInvalidUrl, url);
        }
        if (res != CURLE_OK) {
            return Err<HttpResponse>(
                ErrorCode::NetworkConnectionFailed,
                url + ": " + curl_easy_strerror(res)
            );
        }

        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        return response;
    }

    /**
     * @brief GET с проверкой статуса 2xx
     */
    Result<std::string> get(const std::string& url, std::chrono::milliseconds timeout) const {
        auto response = perform(url, nullptr, timeout);
        if (!response) {
            return std::unexpected(response.error());
        }
        if (response->status == 404) {
            return Err<std::string>(ErrorCode::NetworkChunkNotFound, url);
        }
        if (response->status < 200 || response->status >= 300) {
            return Err<std::string>(
                ErrorCode::NetworkBadStatus,
                url + ": HTTP " + std::to_string(response->status)
            );
        }
        return std::move(response->body);
    }
};

// =============================================================================
// HttpTransport
// =============================================================================

HttpTransport::HttpTransport(const HttpOptions& options)
    : impl_(std::make_unique<Impl>(options))
{
}

HttpTransport::~HttpTransport() = default;

HttpTransport::HttpTransport(HttpTransport&&) noexcept = default;
HttpTransport& HttpTransport::operator=(HttpTransport&&) noexcept = default;

Result<TxOffset> HttpTransport::get_tx_offset(const std::string& peer, std::string_view tx_id) {
    const std::string url = peer_url(peer) + "/tx/" + std::string(tx_id) + "/offset";
    auto body = impl_->get(url, impl_->options.timeout);
    if (!body) {
        return std::unexpected(body.error());
    }
    return parse_tx_offset(*body);
}

Result<Bytes> HttpTransport::get_chunk(const std::string& peer, uint64_t offset) {
    const std::string url = peer_url(peer) + "/chunk/" + std::to_string(offset);
    auto body = impl_->get(url, impl_->options.timeout);
    if (!body) {
        return std::unexpected(body.error());
    }
    return parse_chunk_response(*body);
}

Result<void> HttpTransport::post_chunk(const std::string& peer,
                                       const merkle::ChunkEnvelope& envelope) {
    const std::string url = peer_url(peer) + "/chunk";
    const std::string body = build_chunk_body(envelope);

    auto response = impl_->perform(url, &body, impl_->options.timeout);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status != 200) {
        return Err<void>(
            ErrorCode::NetworkBadStatus,
            url + ": HTTP " + std::to_string(response->status) + " " + response->body
        );
    }
    return {};
}

Result<std::vector<std::string>> HttpTransport::get_peers(const std::string& peer,
                                                          std::chrono::milliseconds timeout) {
    const std::string url = peer_url(peer) + "/peers";
    auto body = impl_->get(url, timeout);
    if (!body) {
        return std::unexpected(body.error());
    }
    return parse_string_array(*body);
}

} // namespace weavekit::net
