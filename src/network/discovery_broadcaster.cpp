#include "network/discovery_broadcaster.hpp"

#include "core/logging.hpp"
#include "network/discovery_datagram.hpp"

#include <QMetaObject>
#include <QThread>
#include <QTimer>
#include <QUdpSocket>

#include <chrono>
#include <string>

namespace pairlink::network {

DiscoveryBroadcaster::DiscoveryBroadcaster(PairingConfig config, QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , announce_timer_(std::make_unique<QTimer>(this))
    , duration_timer_(std::make_unique<QTimer>(this))
    , targets_{QHostAddress(config_.multicast_group), QHostAddress(QHostAddress::Broadcast)}
{
    announce_timer_->setInterval(config_.announce_interval_ms);
    duration_timer_->setSingleShot(true);

    connect(announce_timer_.get(), &QTimer::timeout, this, &DiscoveryBroadcaster::onAnnounceTick);
    connect(duration_timer_.get(), &QTimer::timeout, this, &DiscoveryBroadcaster::onDurationElapsed);
}

DiscoveryBroadcaster::~DiscoveryBroadcaster() {
    stopTimers();
}

void DiscoveryBroadcaster::setTargets(std::vector<QHostAddress> targets) {
    targets_ = std::move(targets);
}

Result<void, Error> DiscoveryBroadcaster::startBroadcast(int duration_seconds,
                                                         const QString& alias,
                                                         const QString& fingerprint) {
    if (duration_seconds <= 0 || duration_seconds > MAX_DURATION_SECONDS) {
        return fail("broadcast duration must be between 1 and " + std::to_string(MAX_DURATION_SECONDS) +
                        " seconds",
                    ErrorCode::InvalidArgument);
    }
    if (fingerprint.isEmpty()) {
        return fail("broadcast needs a fingerprint", ErrorCode::InvalidArgument);
    }

    if (broadcasting_) {
        qCInfo(pairlinkDiscoveryLog) << "Replacing running broadcast session";
        stopTimers();
    }

    if (!socket_) {
        socket_ = std::make_unique<QUdpSocket>(this);
        socket_->setSocketOption(QAbstractSocket::MulticastTtlOption, 1);
    }

    {
        QMutexLocker lock(&identity_mu_);
        identity_ = Announcement{
            .alias = alias,
            .version = QStringLiteral("2.0"),
            .device_model = config_.device_model,
            .device_type = config_.device_type,
            .fingerprint = fingerprint,
            .port = config_.server_port,
            .protocol = QStringLiteral("https"),
        };
    }

    const bool was_broadcasting = broadcasting_;
    broadcasting_ = true;
    sent_ = 0;
    duration_timer_->start(std::chrono::milliseconds(std::chrono::seconds(duration_seconds)));
    announce_timer_->start();
    onAnnounceTick();

    qCInfo(pairlinkDiscoveryLog) << "Broadcasting as" << alias << "for" << duration_seconds << "s";
    if (!was_broadcasting) {
        emit broadcastingChanged(true);
    }
    return Result<void, Error>::ok();
}

void DiscoveryBroadcaster::updateIdentity(const QString& alias, const QString& fingerprint) {
    QMutexLocker lock(&identity_mu_);
    identity_.alias = alias;
    identity_.fingerprint = fingerprint;
}

void DiscoveryBroadcaster::stopBroadcast() {
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(this, [this] { stopBroadcast(); }, Qt::BlockingQueuedConnection);
        return;
    }
    if (!broadcasting_) return;

    stopTimers();
    broadcasting_ = false;
    qCInfo(pairlinkDiscoveryLog) << "Broadcast stopped after" << sent_ << "announcements";
    emit broadcastingChanged(false);
}

Announcement DiscoveryBroadcaster::snapshot() const {
    QMutexLocker lock(&identity_mu_);
    return identity_;
}

void DiscoveryBroadcaster::stopTimers() {
    announce_timer_->stop();
    duration_timer_->stop();
}

void DiscoveryBroadcaster::onAnnounceTick() {
    if (!broadcasting_ || !socket_) return;

    const auto bytes = encode_announcement(snapshot());
    bool any_sent = false;
    for (const auto& target : targets_) {
        const auto written = socket_->writeDatagram(bytes, target, config_.discovery_port);
        if (written < 0) {
            const auto message = QStringLiteral("announce to %1 failed: %2")
                                     .arg(target.toString(), socket_->errorString());
            qCWarning(pairlinkDiscoveryLog).noquote() << message;
            emit error(message);
        } else {
            any_sent = true;
        }
    }
    if (any_sent) {
        ++sent_;
    }
}

void DiscoveryBroadcaster::onDurationElapsed() {
    if (!broadcasting_) return;
    announce_timer_->stop();
    broadcasting_ = false;
    qCInfo(pairlinkDiscoveryLog) << "Broadcast session finished";
    emit broadcastingChanged(false);
    emit broadcastFinished();
}

} // namespace pairlink::network
