/**
 * @file peer_transport.cpp
 * @brief Нормализация адресов пиров
 */

#include "peer_transport.hpp"

namespace weavekit::net {

namespace {

constexpr std::string_view SCHEME_SEPARATOR = "://";

std::string_view strip_trailing_slashes(std::string_view text) noexcept {
    while (!text.empty() && text.back() == '/') {
        text.remove_suffix(1);
    }
    return text;
}

} // anonymous namespace

std::string peer_url(std::string_view address) {
    address = strip_trailing_slashes(address);
    if (address.find(SCHEME_SEPARATOR) != std::string_view::npos) {
        return std::string(address);
    }
    return "http://" + std::string(address);
}

std::string peer_key(std::string_view url) {
    auto scheme = url.find(SCHEME_SEPARATOR);
    if (scheme != std::string_view::npos) {
        url.remove_prefix(scheme + SCHEME_SEPARATOR.size());
    }
    return std::string(strip_trailing_slashes(url));
}

} // namespace weavekit::net
