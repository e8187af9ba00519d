#pragma once

#include <QCoreApplication>
#include <QElapsedTimer>

#include <functional>
#include <string>

#include "crypto/fingerprint.hpp"

namespace pairlink::test {

class EnvVarGuard {
public:
    explicit EnvVarGuard(const char* name)
        : name_(name)
        , old_(qgetenv(name))
        , had_(qEnvironmentVariableIsSet(name))
    {
    }

    ~EnvVarGuard() {
        if (had_) {
            qputenv(name_.constData(), old_);
        } else {
            qunsetenv(name_.constData());
        }
    }

private:
    QByteArray name_;
    QByteArray old_;
    bool had_ = false;
};

inline bool spinUntil(const std::function<bool()>& predicate, int timeoutMs) {
    QElapsedTimer timer;
    timer.start();
    while (!predicate()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 25);
    }
    return true;
}

// A well-formed fingerprint derived from `seed`.
inline QString fakeFingerprint(const std::string& seed) {
    const auto digest = crypto::sha256(reinterpret_cast<const uint8_t*>(seed.data()), seed.size());
    return QString::fromStdString(crypto::encode_base85(digest.data(), digest.size()));
}

} // namespace pairlink::test
