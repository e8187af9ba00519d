#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "network/discovery.hpp"

#include <QHostAddress>
#include <QMutex>
#include <QObject>

#include <limits>
#include <memory>
#include <vector>

class QTimer;
class QUdpSocket;

namespace pairlink::network {

/**
 * DiscoveryBroadcaster - announces this device on the LAN for a while.
 *
 * One session at a time. Starting while a session runs replaces it: the
 * old timers are cancelled and the new duration counts from now.
 *
 * Announcements go out immediately and then every announce interval, to the
 * multicast group and to the limited broadcast address.
 */
class DiscoveryBroadcaster : public QObject {
    Q_OBJECT

public:
    explicit DiscoveryBroadcaster(PairingConfig config, QObject* parent = nullptr);
    ~DiscoveryBroadcaster() override;

    // Longest session whose length in milliseconds still fits a timer interval.
    static constexpr int MAX_DURATION_SECONDS = std::numeric_limits<int>::max() / 1000;

    /**
     * Begin a session of `duration_seconds`, between 1 and
     * MAX_DURATION_SECONDS; anything else is InvalidArgument.
     */
    Result<void, Error> startBroadcast(int duration_seconds,
                                       const QString& alias,
                                       const QString& fingerprint);

    /**
     * Change what the next packets of the running session say.
     */
    void updateIdentity(const QString& alias, const QString& fingerprint);

    /**
     * Stop the running session. Idempotent; may be called from any thread.
     */
    void stopBroadcast();

    [[nodiscard]] bool isBroadcasting() const { return broadcasting_; }
    [[nodiscard]] int announcementsSent() const { return sent_; }

    // Replace the default multicast + broadcast destinations.
    void setTargets(std::vector<QHostAddress> targets);

signals:
    void broadcastingChanged(bool broadcasting);
    void broadcastFinished();
    void error(const QString& message);

private slots:
    void onAnnounceTick();
    void onDurationElapsed();

private:
    [[nodiscard]] Announcement snapshot() const;
    void stopTimers();

    PairingConfig config_;
    std::unique_ptr<QUdpSocket> socket_;
    std::unique_ptr<QTimer> announce_timer_;
    std::unique_ptr<QTimer> duration_timer_;
    std::vector<QHostAddress> targets_;

    mutable QMutex identity_mu_;
    Announcement identity_;

    bool broadcasting_ = false;
    int sent_ = 0;
};

} // namespace pairlink::network
