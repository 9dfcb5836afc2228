#pragma once

#include <functional>
#include <memory>

#include <QHash>
#include <QHostAddress>
#include <QList>
#include <QObject>
#include <QPair>
#include <QQueue>
#include <QReadWriteLock>
#include <QSharedPointer>

#include "tradfri_client.h"
#include "tradfri_config.h"
#include "tradfri_light.h"
#include "tradfri_model.h"

namespace tradfri {

enum class SessionState {
    Unauthenticated,
    Authenticating,
    Authenticated,
    Observing
};

QString sessionStateName(SessionState state);

// One logical connection to one gateway. Owns the protocol client, the
// registry of lights reported by the gateway and the per-light sequencer.
// All callbacks run on the session's thread, never from inside the call
// that was given them.
class Session : public QObject
{
    Q_OBJECT
public:
    using AuthCallback = std::function<void(const AuthResult &)>;
    using ResultCallback = std::function<void(const CommandResult &)>;
    using SequenceCallback = std::function<void(const SequenceResult &)>;
    using BatchCallback = std::function<void(const BatchResult &)>;

    Session(const QHostAddress &address,
            ProtocolClientFactory &factory,
            const SessionConfig &config = SessionConfig(),
            QObject *parent = nullptr);
    ~Session() override;

    QHostAddress address() const { return m_address; }
    SessionState state() const { return m_state; }
    bool isAuthenticated() const { return m_authenticated; }
    const SessionConfig &config() const { return m_config; }

    // Exchanges the code for a long-lived identity, connects with it and
    // hands the identity back for the caller to persist.
    void authenticateWithSecurityCode(const QString &securityCode, AuthCallback done);
    void authenticateWithIdentity(const GatewayIdentity &identity, ResultCallback done);

    void startReceivingDeviceUpdates(ResultCallback done);

    // Registry access; safe to call from any thread.
    LightPtr getLightFromDeviceId(int deviceId) const;
    LightPtr findLight(int deviceId, QString *error = nullptr) const;
    LightList getTradfriLights() const;
    int lightCount() const;

    // State of the newest registry entry for the light's id, or the light's
    // own state when the id is not registered.
    LightState currentLightState(const Light &light) const;

    void syncLightState(const Light &light, ResultCallback done);
    void operateLight(const Light &light, const LightOperation &operation, ResultCallback done);

    // Transmits operations in order, waiting pacingMs after each
    // acknowledged step. With revert the state captured before the first
    // step is pushed back afterwards. Sequences for the same device id run
    // one after another in call order.
    void executeOperations(const Light &light,
                           const LightOperationList &operations,
                           int pacingMs,
                           bool revert,
                           SequenceCallback done);
    void executeOperations(const Light &light, const LightOperationList &operations, SequenceCallback done);

    // Runs Light::identifyOperations() with the configured pacing and
    // reverts afterwards. The pattern is sent as is, without color checks.
    void identifyLight(const Light &light, SequenceCallback done);

    void executeOperationsMultiple(const LightList &lights,
                                   const LightOperationList &operations,
                                   int pacingMs,
                                   bool revert,
                                   BatchCallback done);
    void executeOperationsMultiple(const QList<int> &deviceIds,
                                   const LightOperationList &operations,
                                   int pacingMs,
                                   bool revert,
                                   BatchCallback done);

    bool isSequenceRunning(int deviceId) const;
    int pendingSequenceCount(int deviceId) const;

signals:
    void stateChanged(tradfri::SessionState state);
    void lightUpdated(int deviceId, bool firstSighting);
    void disconnected(const QString &reason);

private slots:
    void onDeviceUpdated(const tradfri::Accessory &accessory);
    void onConnectionLost(const QString &reason);

private:
    struct SequenceRun;
    using SequenceRunPtr = QSharedPointer<SequenceRun>;
    using BatchTarget = QPair<int, LightPtr>;

    void setState(SessionState state);
    bool ensureClient(QString *error) const;
    void connectWithIdentity(const GatewayIdentity &identity, ResultCallback done);
    Accessory latestAccessory(const Light &light) const;

    template <typename Result, typename Callback>
    void finishLater(Callback done, const Result &result);

    // In-flight client calls; the handler is run with a failure when the
    // session goes away before the client answered.
    quint64 trackCall(ResultCallback onAbort);
    bool releaseCall(quint64 callId);
    void abortPending();

    void submitSequence(const Light &light,
                        const LightOperationList &operations,
                        int pacingMs,
                        bool revert,
                        bool validate,
                        SequenceCallback done);
    void startSequence(const SequenceRunPtr &run);
    void runNextStep(const SequenceRunPtr &run);
    void finishSteps(const SequenceRunPtr &run);
    void completeSequence(const SequenceRunPtr &run);
    void runBatch(const QList<BatchTarget> &targets,
                  const LightOperationList &operations,
                  int pacingMs,
                  bool revert,
                  BatchCallback done);

    const QHostAddress m_address;
    SessionConfig m_config;
    std::unique_ptr<ProtocolClient> m_client;
    SessionState m_state = SessionState::Unauthenticated;
    bool m_authenticated = false;
    bool m_subscribed = false;
    bool m_closing = false;

    mutable QReadWriteLock m_registryLock;
    QHash<int, LightPtr> m_lights;

    QHash<int, SequenceRunPtr> m_activeSequences;
    QHash<int, QQueue<SequenceRunPtr>> m_pendingSequences;
    QHash<quint64, ResultCallback> m_inFlight;
    quint64 m_nextCallId = 0;
};

} // namespace tradfri

Q_DECLARE_METATYPE(tradfri::SessionState)
