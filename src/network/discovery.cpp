#include "network/discovery.hpp"

#include <algorithm>

namespace pairlink::network {

DiscoveryRegistry::DiscoveryRegistry(std::chrono::milliseconds liveness_window)
    : liveness_window_(liveness_window) {}

DiscoveredDevice DiscoveryRegistry::upsert(const Announcement& announcement,
                                           const QString& sender_ip,
                                           Clock::time_point now,
                                           Timestamp wall_now) {
    QMutexLocker lock(&mu_);

    auto it = entries_.find(announcement.fingerprint);
    if (it == entries_.end()) {
        Entry entry{
            .device = DiscoveredDevice{
                .alias = announcement.alias,
                .device_model = announcement.device_model,
                .device_type = announcement.device_type,
                .fingerprint = announcement.fingerprint,
                .port = announcement.port,
                .last_seen = wall_now,
                .ips = {},
            },
            .refreshed = now,
        };
        if (!sender_ip.isEmpty()) {
            entry.device.ips << sender_ip;
        }
        it = entries_.insert(announcement.fingerprint, std::move(entry));
        return it->device;
    }

    auto& device = it->device;
    device.alias = announcement.alias;
    device.device_model = announcement.device_model;
    device.device_type = announcement.device_type;
    device.port = announcement.port;
    device.last_seen = std::max(device.last_seen, wall_now);
    if (!sender_ip.isEmpty() && !device.ips.contains(sender_ip)) {
        device.ips << sender_ip;
    }
    it->refreshed = std::max(it->refreshed, now);
    return device;
}

std::vector<QString> DiscoveryRegistry::sweep(Clock::time_point now) {
    QMutexLocker lock(&mu_);

    std::vector<QString> evicted;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->refreshed + liveness_window_ < now) {
            evicted.push_back(it.key());
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    std::sort(evicted.begin(), evicted.end());
    return evicted;
}

std::vector<DiscoveredDevice> DiscoveryRegistry::devices() const {
    QMutexLocker lock(&mu_);

    std::vector<DiscoveredDevice> out;
    out.reserve(static_cast<size_t>(entries_.size()));
    for (const auto& entry : entries_) {
        out.push_back(entry.device);
    }
    std::sort(out.begin(), out.end(), [](const DiscoveredDevice& a, const DiscoveredDevice& b) {
        const int by_alias = a.alias.compare(b.alias, Qt::CaseInsensitive);
        if (by_alias != 0) return by_alias < 0;
        return a.fingerprint < b.fingerprint;
    });
    return out;
}

std::optional<DiscoveredDevice> DiscoveryRegistry::device(const QString& fingerprint) const {
    QMutexLocker lock(&mu_);
    auto it = entries_.constFind(fingerprint);
    if (it == entries_.cend()) {
        return std::nullopt;
    }
    return it->device;
}

size_t DiscoveryRegistry::size() const {
    QMutexLocker lock(&mu_);
    return static_cast<size_t>(entries_.size());
}

void DiscoveryRegistry::clear() {
    QMutexLocker lock(&mu_);
    entries_.clear();
}

void DiscoveryRegistry::set_liveness_window(std::chrono::milliseconds window) {
    QMutexLocker lock(&mu_);
    liveness_window_ = window;
}

} // namespace pairlink::network
