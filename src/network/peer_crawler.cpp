/**
 * @file peer_crawler.cpp
 * @brief Реализация обхода пиров
 */

#include "peer_crawler.hpp"
#include "../log/logger.hpp"
#include "../sync/growable_queue.hpp"

#include <mutex>
#include <unordered_map>

namespace weavekit::network {

namespace {

constexpr std::string_view COMPONENT = "crawler";

struct ProbeTask {
    std::string address;
    std::size_t depth{0};
};

} // anonymous namespace

PeerCrawler::PeerCrawler(net::PeerTransport& transport, std::string gateway_url)
    : transport_(transport), gateway_url_(std::move(gateway_url))
{
}

Result<std::vector<std::string>> PeerCrawler::crawl(const std::vector<std::string>& seeds,
                                                    const CrawlOptions& options) {
    std::vector<std::string> found;
    if (options.max_count == 0) {
        return found;
    }

    const std::string gateway_key = net::peer_key(gateway_url_);

    // Шлюз заранее отмечен посещённым: он не опрашивается и не попадает в результат
    std::unordered_map<std::string, PeerStatus> visited;
    visited.emplace(gateway_key, PeerStatus::Ok);

    std::vector<ProbeTask> initial;
    initial.reserve(seeds.size());
    for (const auto& seed : seeds) {
        auto key = net::peer_key(seed);
        if (key.empty()) {
            continue;
        }
        if (visited.emplace(key, PeerStatus::Pending).second) {
            initial.push_back(ProbeTask{std::move(key), 0});
        }
    }

    log::debug(COMPONENT, "Обход: начальных пиров " + std::to_string(initial.size()) +
                          ", max_depth=" + std::to_string(options.max_depth) +
                          ", max_count=" + std::to_string(options.max_count));

    sync::GrowableQueue<ProbeTask> queue(std::move(initial));
    std::mutex mutex;

    sync::drain_with_workers(queue, options.concurrency, [&](ProbeTask task) {
        auto peers = transport_.get_peers(net::peer_url(task.address), options.timeout);

        std::lock_guard<std::mutex> lock(mutex);

        if (!peers) {
            visited[task.address] = PeerStatus::Failed;
            log::debug(COMPONENT, task.address + ": " + peers.error().message);
            return;
        }

        visited[task.address] = PeerStatus::Ok;

        // После достижения лимита опросы в полёте завершаются, но их
        // соседи уже не исследуются
        if (found.size() >= options.max_count) {
            return;
        }
        found.push_back(task.address);
        if (found.size() == options.max_count) {
            queue.close();
            return;
        }

        if (task.depth >= options.max_depth) {
            return;
        }

        std::vector<ProbeTask> discovered;
        for (const auto& peer : *peers) {
            auto key = net::peer_key(peer);
            if (key.empty()) {
                continue;
            }
            if (visited.emplace(key, PeerStatus::Pending).second) {
                discovered.push_back(ProbeTask{std::move(key), task.depth + 1});
            }
        }

        log::debug(COMPONENT, task.address + ": пиров " + std::to_string(peers->size()) +
                              ", новых " + std::to_string(discovered.size()));
        queue.push(std::move(discovered));
    });

    log::info(COMPONENT, "Найдено пиров: " + std::to_string(found.size()) +
                         ", известно адресов: " + std::to_string(visited.size() - 1));
    return found;
}

Result<std::vector<std::string>> PeerCrawler::discover(const CrawlOptions& options) {
    auto seeds = transport_.get_peers(net::peer_url(gateway_url_), options.timeout);
    if (!seeds) {
        log::error(COMPONENT, "Шлюз " + gateway_url_ + " не вернул пиров: " +
                              seeds.error().message);
        return std::unexpected(seeds.error());
    }
    return crawl(*seeds, options);
}

} // namespace weavekit::network
