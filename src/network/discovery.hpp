#pragma once

#include "core/types.hpp"

#include <QHash>
#include <QMetaType>
#include <QMutex>
#include <QString>
#include <QStringList>

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace pairlink::network {

/**
 * Announcement - what a device says about itself on the discovery channel.
 */
struct Announcement {
    QString alias;
    QString version = QStringLiteral("2.0");
    QString device_model;
    QString device_type;
    QString fingerprint;
    uint16_t port = 0;
    QString protocol = QStringLiteral("https");

    bool operator==(const Announcement&) const = default;
};

/**
 * DiscoveredDevice - a peer heard on the LAN recently.
 *
 * `ips` lists every source address the peer was heard from, in order of
 * first sighting and without duplicates.
 */
struct DiscoveredDevice {
    QString alias;
    QString device_model;
    QString device_type;
    QString fingerprint;
    uint16_t port = 0;
    Timestamp last_seen;
    QStringList ips;

    bool operator==(const DiscoveredDevice&) const = default;
};

/**
 * DiscoveryRegistry - live view of discovered devices keyed by fingerprint.
 *
 * Liveness is measured on a monotonic clock so wall-clock jumps neither
 * evict live peers nor keep dead ones. All members are thread-safe.
 */
class DiscoveryRegistry {
public:
    using Clock = std::chrono::steady_clock;

    explicit DiscoveryRegistry(std::chrono::milliseconds liveness_window);

    /**
     * Insert or refresh the device behind `announcement`.
     *
     * `last_seen` never moves backwards, even if the wall clock does.
     */
    DiscoveredDevice upsert(const Announcement& announcement,
                            const QString& sender_ip,
                            Clock::time_point now = Clock::now(),
                            Timestamp wall_now = Timestamp::now());

    /**
     * Drop entries not refreshed within the liveness window as of `now`.
     * Returns the evicted fingerprints. Entries refreshed at or after `now`
     * always survive.
     */
    std::vector<QString> sweep(Clock::time_point now = Clock::now());

    // Sorted by alias (case-insensitive), then fingerprint.
    [[nodiscard]] std::vector<DiscoveredDevice> devices() const;
    [[nodiscard]] std::optional<DiscoveredDevice> device(const QString& fingerprint) const;
    [[nodiscard]] size_t size() const;

    void clear();
    void set_liveness_window(std::chrono::milliseconds window);

private:
    struct Entry {
        DiscoveredDevice device;
        Clock::time_point refreshed;
    };

    mutable QMutex mu_;
    QHash<QString, Entry> entries_;
    std::chrono::milliseconds liveness_window_;
};

} // namespace pairlink::network

Q_DECLARE_METATYPE(pairlink::network::DiscoveredDevice)
