#pragma once

#include <memory>

#include <QElapsedTimer>
#include <QList>
#include <QPointer>
#include <QSet>
#include <QTimer>
#include <QVector>

#include "tradfri_client.h"

namespace tradfri::test {

// In-process gateway: records every call with a timestamp and completes it
// from the event loop after a configurable delay.
class FakeProtocolClient : public ProtocolClient
{
    Q_OBJECT
public:
    struct Settings {
        bool authenticateOk = true;
        Status authenticateFailure = Status::AuthenticationFailed;
        GatewayIdentity issuedIdentity {QStringLiteral("tradfri-test-client"), QStringLiteral("0123456789abcdef")};

        bool connectOk = true;
        Status connectFailure = Status::AuthenticationFailed;

        bool observeOk = true;
        QList<Accessory> devices;

        // Zero-based indexes into the operateLight calls that are rejected.
        QSet<int> failOperateAt;
        int operateDelayMs = 0;

        bool updateOk = true;
    };

    struct Call {
        QString method;
        int deviceId = 0;
        LightOperation operation;
        Accessory accessory;
        bool ackRequired = false;
        QString securityCode;
        GatewayIdentity identity;
        qint64 atMs = 0;
    };

    explicit FakeProtocolClient(const Settings &settings, QObject *parent = nullptr)
        : ProtocolClient(parent)
        , settings(settings)
    {
        m_clock.start();
    }

    void authenticate(const QString &securityCode, AuthCallback done) override
    {
        Call call = record(QStringLiteral("authenticate"));
        call.securityCode = securityCode;
        calls.back() = call;

        const Settings current = settings;
        QTimer::singleShot(0, this, [done, current]() {
            AuthResult result;
            if (current.authenticateOk) {
                result.ok = true;
                result.identity = current.issuedIdentity;
            } else {
                result.status = current.authenticateFailure;
                result.error = QStringLiteral("gateway answered 4.01 Unauthorized");
            }
            done(result);
        });
    }

    void connectGateway(const GatewayIdentity &identity, ResultCallback done) override
    {
        Call call = record(QStringLiteral("connectGateway"));
        call.identity = identity;
        calls.back() = call;

        const bool ok = settings.connectOk;
        const Status failure = settings.connectFailure;
        QTimer::singleShot(0, this, [done, ok, failure]() {
            done(ok ? CommandResult::success()
                    : CommandResult::failure(failure, QStringLiteral("DTLS handshake failed")));
        });
    }

    void observeDevices(ResultCallback done) override
    {
        record(QStringLiteral("observeDevices"));

        const Settings current = settings;
        QTimer::singleShot(0, this, [this, done, current]() {
            if (!current.observeOk) {
                done(CommandResult::failure(Status::ConnectionFailed, QStringLiteral("observe refused")));
                return;
            }
            for (const Accessory &accessory : current.devices)
                emit deviceUpdated(accessory);
            done(CommandResult::success());
        });
    }

    void operateLight(const Accessory &accessory,
                      const LightOperation &operation,
                      bool ackRequired,
                      ResultCallback done) override
    {
        Call call = record(QStringLiteral("operateLight"));
        call.deviceId = accessory.instanceId;
        call.accessory = accessory;
        call.operation = operation;
        call.ackRequired = ackRequired;
        calls.back() = call;

        const bool fail = settings.failOperateAt.contains(m_operateCount++);
        QTimer::singleShot(settings.operateDelayMs, this, [done, fail]() {
            done(fail ? CommandResult::failure(Status::DeviceCommandError, QStringLiteral("gateway answered 4.05"))
                      : CommandResult::success());
        });
    }

    void updateDevice(const Accessory &accessory, ResultCallback done) override
    {
        Call call = record(QStringLiteral("updateDevice"));
        call.deviceId = accessory.instanceId;
        call.accessory = accessory;
        calls.back() = call;

        const bool ok = settings.updateOk;
        QTimer::singleShot(0, this, [done, ok]() {
            done(ok ? CommandResult::success()
                    : CommandResult::failure(Status::DeviceCommandError, QStringLiteral("update rejected")));
        });
    }

    void pushDevice(const Accessory &accessory) { emit deviceUpdated(accessory); }
    void dropConnection(const QString &reason) { emit connectionLost(reason); }

    QVector<Call> callsTo(const QString &method) const
    {
        QVector<Call> out;
        for (const Call &call : calls) {
            if (call.method == method)
                out.push_back(call);
        }
        return out;
    }

    Settings settings;
    QVector<Call> calls;

private:
    Call record(const QString &method)
    {
        Call call;
        call.method = method;
        call.atMs = m_clock.elapsed();
        calls.push_back(call);
        return call;
    }

    QElapsedTimer m_clock;
    int m_operateCount = 0;
};

class FakeClientFactory : public ProtocolClientFactory
{
public:
    std::unique_ptr<ProtocolClient> create(const QHostAddress &address) override
    {
        ++created;
        lastAddress = address;
        if (refuse)
            return nullptr;
        auto client = std::make_unique<FakeProtocolClient>(settings);
        lastClient = client.get();
        return client;
    }

    FakeProtocolClient *client() const { return lastClient.data(); }

    FakeProtocolClient::Settings settings;
    bool refuse = false;
    int created = 0;
    QHostAddress lastAddress;
    QPointer<FakeProtocolClient> lastClient;
};

} // namespace tradfri::test
