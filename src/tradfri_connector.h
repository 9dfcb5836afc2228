#pragma once

#include <functional>

#include <QHostAddress>
#include <QObject>
#include <QPointer>
#include <QString>

#include "tradfri_config.h"
#include "tradfri_discovery.h"
#include "tradfri_model.h"
#include "tradfri_session.h"

namespace tradfri {

class CredentialStore;

// Finds a gateway, brings up a Session against it and keeps the identity
// in the credential store so later runs can skip the security code.
class GatewayConnector : public QObject
{
    Q_OBJECT
public:
    using DiscoveryCallback = std::function<void(const DiscoveryResult &)>;
    using AuthCallback = std::function<void(const AuthResult &)>;
    using ResultCallback = std::function<void(const CommandResult &)>;

    GatewayConnector(Discovery &discovery,
                     ProtocolClientFactory &clientFactory,
                     CredentialStore &credentialStore,
                     const ConnectorConfig &config = ConnectorConfig(),
                     QObject *parent = nullptr);
    ~GatewayConnector() override;

    void discover(DiscoveryCallback done);

    void connectWithSecurityCode(const QString &securityCode, AuthCallback done);
    void connectWithIdentity(const GatewayIdentity &identity, ResultCallback done);
    void connectWithStoredIdentity(ResultCallback done);

    Session *session() const { return m_session.data(); }
    QHostAddress gatewayAddress() const { return m_address; }
    QString gatewayName() const { return m_name; }
    bool hasStoredIdentity() const;
    const ConnectorConfig &config() const { return m_config; }

signals:
    void sessionChanged(tradfri::Session *session);

private:
    bool ensureDiscovered(QString *error) const;
    Session *replaceSession();
    void finishConnect(const QPointer<Session> &session,
                       const GatewayIdentity &identity,
                       ResultCallback done);

    Discovery &m_discovery;
    ProtocolClientFactory &m_clientFactory;
    CredentialStore &m_credentials;
    ConnectorConfig m_config;

    QString m_name;
    QHostAddress m_address;
    QPointer<Session> m_session;
};

} // namespace tradfri
