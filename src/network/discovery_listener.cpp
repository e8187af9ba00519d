#include "network/discovery_listener.hpp"

#include "core/logging.hpp"
#include "network/discovery_datagram.hpp"

#include <QMetaObject>
#include <QNetworkDatagram>
#include <QThread>
#include <QTimer>
#include <QUdpSocket>

namespace pairlink::network {
namespace {

// IPv4-mapped IPv6 senders are reported in dotted form.
QString sender_to_string(const QHostAddress& sender) {
    bool is_v4 = false;
    const auto v4 = sender.toIPv4Address(&is_v4);
    if (is_v4) {
        return QHostAddress(v4).toString();
    }
    return sender.toString();
}

} // namespace

DiscoveryListener::DiscoveryListener(PairingConfig config, QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , sweep_timer_(std::make_unique<QTimer>(this))
    , registry_(std::chrono::milliseconds(config_.liveness_window_ms))
{
    sweep_timer_->setInterval(config_.sweep_interval_ms);
    connect(sweep_timer_.get(), &QTimer::timeout, this, &DiscoveryListener::onSweepTick);
}

DiscoveryListener::~DiscoveryListener() {
    sweep_timer_->stop();
    closeSocket();
}

uint16_t DiscoveryListener::boundPort() const {
    return socket_ ? socket_->localPort() : 0;
}

Result<void, Error> DiscoveryListener::startListening(const QString& alias, const QString& fingerprint) {
    if (state_ == State::Listening) {
        qCInfo(pairlinkDiscoveryLog) << "Already listening; replacing local identity";
        local_alias_ = alias;
        local_fingerprint_ = fingerprint;
        return Result<void, Error>::ok();
    }

    closeSocket();
    socket_ = std::make_unique<QUdpSocket>(this);
    if (!socket_->bind(QHostAddress::AnyIPv4,
                       config_.discovery_port,
                       QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        const auto message = socket_->errorString();
        const int native = static_cast<int>(socket_->error());
        socket_.reset();
        state_ = State::Error;
        qCWarning(pairlinkDiscoveryLog) << "Cannot bind discovery port" << config_.discovery_port
                                        << message;
        emit error(message);
        return fail("bind discovery port: " + message.toStdString(),
                    ErrorCode::NetworkUnreachable, native);
    }

    const QHostAddress group(config_.multicast_group);
    if (!socket_->joinMulticastGroup(group)) {
        // Broadcast still works without multicast membership.
        qCWarning(pairlinkDiscoveryLog) << "Cannot join multicast group" << group.toString()
                                        << socket_->errorString();
    }

    connect(socket_.get(), &QUdpSocket::readyRead, this, &DiscoveryListener::onReadyRead);
    connect(socket_.get(), &QUdpSocket::errorOccurred, this, &DiscoveryListener::onSocketError);

    local_alias_ = alias;
    local_fingerprint_ = fingerprint;
    state_ = State::Listening;
    sweep_timer_->start();

    qCInfo(pairlinkDiscoveryLog) << "Listening on port" << socket_->localPort() << "as" << alias;
    emit listeningChanged(true);
    return Result<void, Error>::ok();
}

void DiscoveryListener::stopListening() {
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(this, [this] { stopListening(); }, Qt::BlockingQueuedConnection);
        return;
    }

    const bool was_listening = state_ == State::Listening;
    sweep_timer_->stop();
    closeSocket();
    registry_.clear();
    state_ = State::Idle;

    if (was_listening) {
        qCInfo(pairlinkDiscoveryLog) << "Stopped listening";
        emit listeningChanged(false);
    }
}

void DiscoveryListener::closeSocket() {
    if (!socket_) return;
    socket_->disconnect(this);
    if (socket_->state() == QAbstractSocket::BoundState) {
        socket_->leaveMulticastGroup(QHostAddress(config_.multicast_group));
    }
    socket_->close();
    socket_.reset();
}

void DiscoveryListener::processDatagram(const QByteArray& datagram, const QString& sender_ip) {
    auto decoded = decode_announcement(datagram);
    if (decoded.is_err()) {
        qCDebug(pairlinkDiscoveryLog) << "Dropping datagram from" << sender_ip << ":"
                                      << decoded.unwrap_err().message.c_str();
        return;
    }

    const auto& announcement = decoded.unwrap();
    if (announcement.fingerprint == local_fingerprint_) {
        return;
    }

    const auto device = registry_.upsert(announcement, sender_ip);
    emit deviceDiscovered(device);
}

void DiscoveryListener::onReadyRead() {
    if (!socket_ || state_ != State::Listening) return;

    while (socket_->hasPendingDatagrams()) {
        const QNetworkDatagram datagram = socket_->receiveDatagram(MAX_DATAGRAM_SIZE + 1);
        if (!datagram.isValid()) {
            continue;
        }
        processDatagram(datagram.data(), sender_to_string(datagram.senderAddress()));
    }
}

void DiscoveryListener::onSocketError(QAbstractSocket::SocketError socket_error) {
    if (!socket_) return;
    const auto message = socket_->errorString();
    qCWarning(pairlinkDiscoveryLog) << "Discovery socket error" << socket_error << message;

    // Transient send/receive errors on UDP are not fatal.
    if (socket_->state() == QAbstractSocket::BoundState) {
        emit error(message);
        return;
    }
    sweep_timer_->stop();
    state_ = State::Error;
    emit error(message);
    emit listeningChanged(false);
}

void DiscoveryListener::onSweepTick() {
    for (const auto& fingerprint : registry_.sweep()) {
        qCDebug(pairlinkDiscoveryLog) << "Device lost" << fingerprint;
        emit deviceLost(fingerprint);
    }
}

} // namespace pairlink::network
