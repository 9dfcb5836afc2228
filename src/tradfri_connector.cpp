#include "tradfri_connector.h"

#include <utility>

#include <QLoggingCategory>

#include "tradfri_client.h"
#include "tradfri_credentials.h"
#include "tradfri_session.h"
#include "tradfri_timeout.h"

Q_LOGGING_CATEGORY(connectorLog, "tradfri.connector");

namespace tradfri {

GatewayConnector::GatewayConnector(Discovery &discovery,
                                   ProtocolClientFactory &clientFactory,
                                   CredentialStore &credentialStore,
                                   const ConnectorConfig &config,
                                   QObject *parent)
    : QObject(parent)
    , m_discovery(discovery)
    , m_clientFactory(clientFactory)
    , m_credentials(credentialStore)
    , m_config(config)
{
}

GatewayConnector::~GatewayConnector() = default;

void GatewayConnector::discover(DiscoveryCallback done)
{
    QPointer<GatewayConnector> self(this);
    m_discovery.discover([self, done](const DiscoveryResult &found) {
        if (!self)
            return;

        DiscoveryResult result = found;
        if (result.ok && result.addresses.isEmpty()) {
            result.ok = false;
            result.status = Status::DiscoveryFailed;
            result.error = QStringLiteral("Gateway reported no address");
        }
        if (!result.ok && result.status == Status::Success)
            result.status = Status::DiscoveryFailed;

        if (result.ok) {
            self->m_name = result.name;
            self->m_address = result.addresses.first();
            qCInfo(connectorLog) << "found gateway" << result.name << "at" << self->m_address.toString();
        } else {
            qCWarning(connectorLog) << "gateway discovery failed:" << result.error;
        }

        // Discovery may answer inline; callers always get the result later.
        delay(0, self.data(), [done, result]() {
            if (done)
                done(result);
        });
    });
}

bool GatewayConnector::hasStoredIdentity() const
{
    return m_credentials.value(m_config.credentialKey).has_value();
}

bool GatewayConnector::ensureDiscovered(QString *error) const
{
    if (!m_address.isNull())
        return true;
    if (error)
        *error = QStringLiteral("No gateway discovered yet");
    return false;
}

Session *GatewayConnector::replaceSession()
{
    if (m_session) {
        qCDebug(connectorLog) << "dropping previous session for" << m_session->address().toString();
        m_session->deleteLater();
    }

    m_session = new Session(m_address, m_clientFactory, m_config.session, this);
    emit sessionChanged(m_session.data());
    return m_session.data();
}

void GatewayConnector::connectWithSecurityCode(const QString &securityCode, AuthCallback done)
{
    QString error;
    if (!ensureDiscovered(&error)) {
        AuthResult result;
        result.status = Status::DiscoveryFailed;
        result.error = error;
        delay(0, this, [done, result]() {
            if (done)
                done(result);
        });
        return;
    }

    QPointer<GatewayConnector> self(this);
    QPointer<Session> session = replaceSession();
    session->authenticateWithSecurityCode(securityCode, [self, session, done](const AuthResult &auth) {
        if (!self)
            return;
        if (!auth.ok) {
            if (done)
                done(auth);
            return;
        }

        const GatewayIdentity identity = auth.identity;
        self->finishConnect(session, identity, [done, identity](const CommandResult &connected) {
            AuthResult result;
            result.ok = connected.ok;
            result.status = connected.status;
            result.error = connected.error;
            result.identity = identity;
            if (done)
                done(result);
        });
    });
}

void GatewayConnector::connectWithIdentity(const GatewayIdentity &identity, ResultCallback done)
{
    QString error;
    if (!ensureDiscovered(&error)) {
        delay(0, this, [done, error]() {
            if (done)
                done(CommandResult::failure(Status::DiscoveryFailed, error));
        });
        return;
    }

    QPointer<GatewayConnector> self(this);
    QPointer<Session> session = replaceSession();
    session->authenticateWithIdentity(identity, [self, session, identity, done](const CommandResult &auth) {
        if (!self)
            return;
        if (!auth.ok) {
            if (done)
                done(auth);
            return;
        }
        self->finishConnect(session, identity, done);
    });
}

void GatewayConnector::connectWithStoredIdentity(ResultCallback done)
{
    Status status = Status::Success;
    QString error;
    const std::optional<GatewayIdentity> identity =
        loadIdentity(m_credentials, m_config.credentialKey, &status, &error);
    if (!identity) {
        qCWarning(connectorLog) << "no usable identity under" << m_config.credentialKey << ":" << error;
        delay(0, this, [done, status, error]() {
            if (done)
                done(CommandResult::failure(status, error));
        });
        return;
    }

    connectWithIdentity(*identity, std::move(done));
}

void GatewayConnector::finishConnect(const QPointer<Session> &session,
                                     const GatewayIdentity &identity,
                                     ResultCallback done)
{
    if (!session) {
        if (done)
            done(CommandResult::failure(Status::NotAuthenticated, QStringLiteral("Session closed")));
        return;
    }

    storeIdentity(m_credentials, m_config.credentialKey, identity);
    qCInfo(connectorLog) << "identity stored under" << m_config.credentialKey;

    if (!m_config.startObserving) {
        if (done)
            done(CommandResult::success());
        return;
    }

    // A session closed meanwhile still answers, with NotAuthenticated.
    session->startReceivingDeviceUpdates([done](const CommandResult &observed) {
        if (!observed.ok)
            qCWarning(connectorLog) << "could not observe devices:" << observed.error;
        if (done)
            done(observed);
    });
}

} // namespace tradfri
