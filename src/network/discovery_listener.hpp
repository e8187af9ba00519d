#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "network/discovery.hpp"

#include <QAbstractSocket>
#include <QHostAddress>
#include <QObject>

#include <memory>
#include <vector>

class QTimer;
class QUdpSocket;

namespace pairlink::network {

/**
 * DiscoveryListener - maintains the set of devices announcing on the LAN.
 *
 * Every valid announcement from another device refreshes the registry and
 * is reported through deviceDiscovered. A sweep timer evicts devices that
 * went quiet for longer than the liveness window.
 */
class DiscoveryListener : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        Listening,
        Error,
    };
    Q_ENUM(State)

    explicit DiscoveryListener(PairingConfig config, QObject* parent = nullptr);
    ~DiscoveryListener() override;

    /**
     * Bind the discovery port and start tracking devices.
     *
     * When already listening only the local identity used to filter out our
     * own announcements is replaced; the registry is kept.
     */
    Result<void, Error> startListening(const QString& alias, const QString& fingerprint);

    /**
     * Close the socket and forget every device. Idempotent; may be called
     * from any thread.
     */
    void stopListening();

    /**
     * Feed one datagram as if it had arrived from `sender_ip`.
     */
    void processDatagram(const QByteArray& datagram, const QString& sender_ip);

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool isListening() const { return state_ == State::Listening; }
    [[nodiscard]] uint16_t boundPort() const;
    [[nodiscard]] std::vector<DiscoveredDevice> devices() const { return registry_.devices(); }
    [[nodiscard]] const DiscoveryRegistry& registry() const { return registry_; }

signals:
    void deviceDiscovered(const pairlink::network::DiscoveredDevice& device);
    void deviceLost(const QString& fingerprint);
    void listeningChanged(bool listening);
    void error(const QString& message);

private slots:
    void onReadyRead();
    void onSocketError(QAbstractSocket::SocketError socket_error);
    void onSweepTick();

private:
    void closeSocket();

    PairingConfig config_;
    std::unique_ptr<QUdpSocket> socket_;
    std::unique_ptr<QTimer> sweep_timer_;
    DiscoveryRegistry registry_;

    QString local_alias_;
    QString local_fingerprint_;
    State state_ = State::Idle;
};

} // namespace pairlink::network
