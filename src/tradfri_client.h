#pragma once

#include <functional>
#include <memory>

#include <QHostAddress>
#include <QObject>
#include <QString>

#include "tradfri_model.h"

namespace tradfri {

// Secure channel plus protocol encoding for one gateway. Implementations
// complete every call asynchronously on the thread the client lives in and
// invoke each callback exactly once.
class ProtocolClient : public QObject
{
    Q_OBJECT
public:
    using AuthCallback = std::function<void(const AuthResult &)>;
    using ResultCallback = std::function<void(const CommandResult &)>;

    explicit ProtocolClient(QObject *parent = nullptr) : QObject(parent) {}
    ~ProtocolClient() override = default;

    // One-time bootstrap with the code printed on the gateway.
    virtual void authenticate(const QString &securityCode, AuthCallback done) = 0;
    virtual void connectGateway(const GatewayIdentity &identity, ResultCallback done) = 0;

    // Starts emitting deviceUpdated(), beginning with every known device.
    virtual void observeDevices(ResultCallback done) = 0;

    virtual void operateLight(const Accessory &accessory,
                              const LightOperation &operation,
                              bool ackRequired,
                              ResultCallback done) = 0;
    virtual void updateDevice(const Accessory &accessory, ResultCallback done) = 0;

signals:
    void deviceUpdated(const tradfri::Accessory &accessory);
    void connectionLost(const QString &reason);
};

class ProtocolClientFactory
{
public:
    virtual ~ProtocolClientFactory() = default;

    virtual std::unique_ptr<ProtocolClient> create(const QHostAddress &address) = 0;
};

} // namespace tradfri
