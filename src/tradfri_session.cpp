#include "tradfri_session.h"

#include <utility>

#include <QList>
#include <QLoggingCategory>
#include <QPointer>
#include <QReadLocker>
#include <QWriteLocker>

#include "tradfri_timeout.h"

Q_LOGGING_CATEGORY(sessionLog, "tradfri.session");

namespace tradfri {

struct Session::SequenceRun {
    explicit SequenceRun(const Light &target)
        : light(target)
    {
    }

    Light light;
    LightOperationList operations;
    int pacingMs = 0;
    bool revert = false;
    SequenceCallback done;

    Accessory accessory;
    LightState snapshot;
    LightState working;
    int nextStep = 0;
    SequenceResult result;
};

QString sessionStateName(SessionState state)
{
    switch (state) {
    case SessionState::Unauthenticated:
        return QStringLiteral("Unauthenticated");
    case SessionState::Authenticating:
        return QStringLiteral("Authenticating");
    case SessionState::Authenticated:
        return QStringLiteral("Authenticated");
    case SessionState::Observing:
        return QStringLiteral("Observing");
    }
    return QStringLiteral("Unknown");
}

Session::Session(const QHostAddress &address,
                 ProtocolClientFactory &factory,
                 const SessionConfig &config,
                 QObject *parent)
    : QObject(parent)
    , m_address(address)
    , m_config(config)
{
    if (m_address.isNull()) {
        qCWarning(sessionLog) << "session created without a valid gateway address";
        return;
    }

    m_client = factory.create(m_address);
    if (!m_client) {
        qCWarning(sessionLog) << "no protocol client for gateway" << m_address.toString();
        return;
    }

    connect(m_client.get(), &ProtocolClient::deviceUpdated,
            this, &Session::onDeviceUpdated);
    connect(m_client.get(), &ProtocolClient::connectionLost,
            this, &Session::onConnectionLost);
}

Session::~Session()
{
    m_closing = true;
    abortPending();
    qCDebug(sessionLog) << "session destroyed for" << m_address.toString();
}

template <typename Result, typename Callback>
void Session::finishLater(Callback done, const Result &result)
{
    // Not bound to this session, so the answer survives its destruction.
    delay(0, nullptr, [done = std::move(done), result]() {
        if (done)
            done(result);
    });
}

quint64 Session::trackCall(ResultCallback onAbort)
{
    const quint64 callId = ++m_nextCallId;
    m_inFlight.insert(callId, std::move(onAbort));
    return callId;
}

bool Session::releaseCall(quint64 callId)
{
    return m_inFlight.remove(callId) > 0;
}

void Session::abortPending()
{
    const QString reason = QStringLiteral("Session closed");

    const QHash<quint64, ResultCallback> calls = std::exchange(m_inFlight, {});
    for (const ResultCallback &onAbort : calls) {
        delay(0, nullptr, [onAbort, reason]() {
            if (onAbort)
                onAbort(CommandResult::failure(Status::NotAuthenticated, reason));
        });
    }

    QList<SequenceRunPtr> runs = m_activeSequences.values();
    for (const QQueue<SequenceRunPtr> &queue : std::as_const(m_pendingSequences)) {
        for (const SequenceRunPtr &run : queue)
            runs.push_back(run);
    }
    m_activeSequences.clear();
    m_pendingSequences.clear();

    if (!runs.isEmpty())
        qCInfo(sessionLog) << "failing" << runs.size() << "unfinished sequences on close";

    for (const SequenceRunPtr &run : std::as_const(runs)) {
        SequenceResult result = run->result;
        result.ok = false;
        if (result.status == Status::Success) {
            result.status = Status::NotAuthenticated;
            result.error = reason;
            if (result.failedStep < 0 && run->nextStep < run->operations.size())
                result.failedStep = run->nextStep;
        }
        const SequenceCallback done = std::exchange(run->done, SequenceCallback());
        delay(0, nullptr, [done, result]() {
            if (done)
                done(result);
        });
    }
}

void Session::setState(SessionState state)
{
    if (m_state == state)
        return;

    qCInfo(sessionLog).noquote() << "gateway" << m_address.toString() << "state"
                                 << sessionStateName(m_state) << "->" << sessionStateName(state);
    m_state = state;
    emit stateChanged(state);
}

bool Session::ensureClient(QString *error) const
{
    if (m_address.isNull()) {
        if (error)
            *error = QStringLiteral("Session is not bound to a valid gateway address");
        return false;
    }
    if (!m_client) {
        if (error)
            *error = QStringLiteral("No protocol client available for %1").arg(m_address.toString());
        return false;
    }
    return true;
}

void Session::authenticateWithSecurityCode(const QString &securityCode, AuthCallback done)
{
    auto fail = [this, &done](Status status, const QString &error) {
        AuthResult result;
        result.status = status;
        result.error = error;
        finishLater(std::move(done), result);
    };

    QString error;
    if (!ensureClient(&error))
        return fail(Status::InvalidArgument, error);
    if (securityCode.trimmed().isEmpty())
        return fail(Status::InvalidArgument, QStringLiteral("Security code must not be empty"));
    if (m_authenticated)
        return fail(Status::InvalidArgument, QStringLiteral("Session is already authenticated"));
    if (m_state == SessionState::Authenticating)
        return fail(Status::AuthenticationFailed, QStringLiteral("Authentication already in progress"));

    setState(SessionState::Authenticating);
    qCInfo(sessionLog) << "authenticating with security code at" << m_address.toString();

    QPointer<Session> self(this);
    const quint64 callId = trackCall([done](const CommandResult &aborted) {
        AuthResult result;
        result.status = aborted.status;
        result.error = aborted.error;
        if (done)
            done(result);
    });
    m_client->authenticate(securityCode.trimmed(), [self, done, callId](const AuthResult &auth) {
        if (!self || !self->releaseCall(callId))
            return;

        if (!auth.ok || !auth.identity.isValid()) {
            AuthResult result;
            result.status = auth.status == Status::ConnectionFailed ? Status::ConnectionFailed
                                                                     : Status::AuthenticationFailed;
            result.error = auth.error.isEmpty() ? QStringLiteral("Gateway rejected the security code")
                                                : auth.error;
            qCWarning(sessionLog) << "security code authentication failed:" << result.error;
            self->setState(SessionState::Unauthenticated);
            if (done)
                done(result);
            return;
        }

        const GatewayIdentity identity = auth.identity;
        self->connectWithIdentity(identity, [done, identity](const CommandResult &connected) {
            AuthResult result;
            result.ok = connected.ok;
            result.status = connected.status;
            result.error = connected.error;
            if (connected.ok)
                result.identity = identity;
            if (done)
                done(result);
        });
    });
}

void Session::authenticateWithIdentity(const GatewayIdentity &identity, ResultCallback done)
{
    QString error;
    if (!ensureClient(&error))
        return finishLater(std::move(done), CommandResult::failure(Status::InvalidArgument, error));
    if (!identity.isValid()) {
        return finishLater(std::move(done),
                           CommandResult::failure(Status::InvalidArgument,
                                                  QStringLiteral("Identity and PSK must not be empty")));
    }
    if (m_authenticated) {
        return finishLater(std::move(done),
                           CommandResult::failure(Status::InvalidArgument,
                                                  QStringLiteral("Session is already authenticated")));
    }
    if (m_state == SessionState::Authenticating) {
        return finishLater(std::move(done),
                           CommandResult::failure(Status::AuthenticationFailed,
                                                  QStringLiteral("Authentication already in progress")));
    }

    setState(SessionState::Authenticating);
    connectWithIdentity(identity, std::move(done));
}

void Session::connectWithIdentity(const GatewayIdentity &identity, ResultCallback done)
{
    qCInfo(sessionLog) << "connecting to" << m_address.toString() << "as" << identity.identity;

    QPointer<Session> self(this);
    const quint64 callId = trackCall(done);
    m_client->connectGateway(identity, [self, done, callId](const CommandResult &connected) {
        if (!self || !self->releaseCall(callId))
            return;

        if (!connected.ok) {
            const Status status = connected.status == Status::ConnectionFailed ? Status::ConnectionFailed
                                                                                : Status::AuthenticationFailed;
            const QString error = connected.error.isEmpty()
                ? QStringLiteral("Gateway rejected the identity")
                : connected.error;
            qCWarning(sessionLog) << "connect failed:" << error;
            self->setState(SessionState::Unauthenticated);
            if (done)
                done(CommandResult::failure(status, error));
            return;
        }

        self->m_authenticated = true;
        self->setState(SessionState::Authenticated);
        if (done)
            done(CommandResult::success());
    });
}

void Session::startReceivingDeviceUpdates(ResultCallback done)
{
    QString error;
    if (!ensureClient(&error))
        return finishLater(std::move(done), CommandResult::failure(Status::InvalidArgument, error));
    if (!m_authenticated) {
        return finishLater(std::move(done),
                           CommandResult::failure(Status::NotAuthenticated,
                                                  QStringLiteral("Authenticate before observing devices")));
    }
    if (m_subscribed)
        return finishLater(std::move(done), CommandResult::success());

    // Initial enumeration arrives as deviceUpdated() before the callback.
    m_subscribed = true;
    qCInfo(sessionLog) << "observing devices on" << m_address.toString();

    QPointer<Session> self(this);
    const quint64 callId = trackCall(done);
    m_client->observeDevices([self, done, callId](const CommandResult &observed) {
        if (!self || !self->releaseCall(callId))
            return;

        if (!observed.ok) {
            self->m_subscribed = false;
            const QString error = observed.error.isEmpty()
                ? QStringLiteral("Gateway refused the device subscription")
                : observed.error;
            qCWarning(sessionLog) << "observeDevices failed:" << error;
            if (done) {
                done(CommandResult::failure(observed.status == Status::Success ? Status::ConnectionFailed
                                                                               : observed.status,
                                            error));
            }
            return;
        }

        if (self->m_authenticated)
            self->setState(SessionState::Observing);
        qCInfo(sessionLog) << "device registry live with" << self->lightCount() << "lights";
        if (done)
            done(CommandResult::success());
    });
}

void Session::onDeviceUpdated(const Accessory &accessory)
{
    if (!m_subscribed) {
        qCDebug(sessionLog) << "ignoring update for" << accessory.instanceId << "while not observing";
        return;
    }
    if (accessory.type != AccessoryType::Lightbulb) {
        qCDebug(sessionLog) << "ignoring non-lightbulb accessory" << accessory.instanceId;
        return;
    }
    if (!accessory.hasLight) {
        qCWarning(sessionLog) << "lightbulb" << accessory.instanceId << "reported without light data";
        return;
    }

    const int deviceId = accessory.instanceId;
    const LightPtr light = LightPtr::create(this, accessory);
    bool firstSighting = false;
    {
        QWriteLocker locker(&m_registryLock);
        firstSighting = !m_lights.contains(deviceId);
        m_lights.insert(deviceId, light);
    }

    if (firstSighting) {
        qCInfo(sessionLog).noquote() << "new light" << light->getDeviceData().displayLine();
    } else {
        qCDebug(sessionLog) << "light" << deviceId << "replaced by newer report";
    }
    emit lightUpdated(deviceId, firstSighting);
}

void Session::onConnectionLost(const QString &reason)
{
    qCWarning(sessionLog) << "connection to" << m_address.toString() << "lost:" << reason;
    m_authenticated = false;
    m_subscribed = false;
    setState(SessionState::Unauthenticated);
    emit disconnected(reason);
}

LightPtr Session::getLightFromDeviceId(int deviceId) const
{
    QReadLocker locker(&m_registryLock);
    return m_lights.value(deviceId);
}

LightPtr Session::findLight(int deviceId, QString *error) const
{
    LightPtr light = getLightFromDeviceId(deviceId);
    if (!light && error)
        *error = QStringLiteral("No light with id %1").arg(deviceId);
    return light;
}

LightList Session::getTradfriLights() const
{
    QReadLocker locker(&m_registryLock);
    return m_lights.values();
}

int Session::lightCount() const
{
    QReadLocker locker(&m_registryLock);
    return m_lights.size();
}

Accessory Session::latestAccessory(const Light &light) const
{
    const LightPtr current = getLightFromDeviceId(light.getDeviceId());
    return current ? current->getAccessory() : light.getAccessory();
}

LightState Session::currentLightState(const Light &light) const
{
    return latestAccessory(light).light;
}

void Session::syncLightState(const Light &light, ResultCallback done)
{
    QString error;
    if (!ensureClient(&error))
        return finishLater(std::move(done), CommandResult::failure(Status::InvalidArgument, error));
    if (!m_authenticated) {
        return finishLater(std::move(done),
                           CommandResult::failure(Status::NotAuthenticated,
                                                  QStringLiteral("Session is not authenticated")));
    }

    const int deviceId = light.getDeviceId();
    QPointer<Session> self(this);
    const quint64 callId = trackCall(done);
    m_client->updateDevice(light.getAccessory(), [self, done, deviceId, callId](const CommandResult &result) {
        if (!self || !self->releaseCall(callId))
            return;
        if (!result.ok) {
            qCWarning(sessionLog) << "sync of light" << deviceId << "failed:" << result.error;
            if (done)
                done(CommandResult::failure(Status::DeviceCommandError, result.error));
            return;
        }
        if (done)
            done(CommandResult::success());
    });
}

void Session::operateLight(const Light &light, const LightOperation &operation, ResultCallback done)
{
    // Single commands share the per-light queue with sequences.
    executeOperations(light, {operation}, 0, false, [done](const SequenceResult &sequence) {
        if (!done)
            return;
        if (sequence.ok)
            done(CommandResult::success());
        else
            done(CommandResult::failure(sequence.status, sequence.error));
    });
}

void Session::executeOperations(const Light &light, const LightOperationList &operations, SequenceCallback done)
{
    executeOperations(light, operations, m_config.defaultPacingMs, false, std::move(done));
}

void Session::executeOperations(const Light &light,
                                const LightOperationList &operations,
                                int pacingMs,
                                bool revert,
                                SequenceCallback done)
{
    submitSequence(light, operations, pacingMs, revert, true, std::move(done));
}

void Session::identifyLight(const Light &light, SequenceCallback done)
{
    submitSequence(light, Light::identifyOperations(), m_config.identifyPacingMs, true, false, std::move(done));
}

void Session::submitSequence(const Light &light,
                             const LightOperationList &operations,
                             int pacingMs,
                             bool revert,
                             bool validate,
                             SequenceCallback done)
{
    const int deviceId = light.getDeviceId();
    auto fail = [this, &done, deviceId](Status status, const QString &error) {
        SequenceResult result;
        result.deviceId = deviceId;
        result.status = status;
        result.error = error;
        finishLater(std::move(done), result);
    };

    QString error;
    if (!ensureClient(&error))
        return fail(Status::InvalidArgument, error);
    if (!m_authenticated)
        return fail(Status::NotAuthenticated, QStringLiteral("Session is not authenticated"));
    if (pacingMs < 0)
        return fail(Status::InvalidArgument, QStringLiteral("Pacing must not be negative"));

    const Spectrum spectrum = latestAccessory(light).light.spectrum;
    LightOperationList validated = operations;
    for (int i = 0; validate && i < validated.size(); ++i) {
        QString stepError;
        if (!validateOperation(spectrum, &validated[i], &stepError))
            return fail(Status::InvalidArgument, QStringLiteral("Step %1: %2").arg(i + 1).arg(stepError));
    }

    auto run = SequenceRunPtr::create(light);
    run->operations = validated;
    run->pacingMs = pacingMs;
    run->revert = revert;
    run->done = std::move(done);
    run->result.deviceId = deviceId;

    if (m_activeSequences.contains(deviceId)) {
        qCDebug(sessionLog) << "queueing sequence for light" << deviceId << "behind running sequence";
        m_pendingSequences[deviceId].enqueue(run);
        return;
    }

    startSequence(run);
}

void Session::startSequence(const SequenceRunPtr &run)
{
    const int deviceId = run->light.getDeviceId();
    m_activeSequences.insert(deviceId, run);

    run->accessory = latestAccessory(run->light);
    run->snapshot = run->accessory.light;
    run->working = run->snapshot;

    qCDebug(sessionLog) << "sequence for light" << deviceId << "with" << run->operations.size()
                        << "steps, pacing" << run->pacingMs << "ms, revert" << run->revert;

    // First step from the event loop so that even an empty sequence
    // completes after the call returned.
    delay(0, this, [this, run]() {
        runNextStep(run);
    });
}

void Session::runNextStep(const SequenceRunPtr &run)
{
    if (run->nextStep >= run->operations.size()) {
        finishSteps(run);
        return;
    }

    const int step = run->nextStep;
    if (!m_authenticated) {
        run->result.status = Status::NotAuthenticated;
        run->result.error = QStringLiteral("Session lost authentication before step %1").arg(step + 1);
        run->result.failedStep = step;
        finishSteps(run);
        return;
    }

    const LightOperation operation = run->operations.at(step);
    QPointer<Session> self(this);
    m_client->operateLight(run->accessory, operation, m_config.ackRequired,
        [self, run, step, operation](const CommandResult &sent) {
            if (!self || self->m_closing)
                return;

            if (!sent.ok) {
                run->result.status = Status::DeviceCommandError;
                run->result.error = sent.error.isEmpty()
                    ? QStringLiteral("Gateway rejected step %1").arg(step + 1)
                    : sent.error;
                run->result.failedStep = step;
                qCWarning(sessionLog) << "light" << run->result.deviceId << "step" << step + 1
                                      << "failed:" << run->result.error;
                self->finishSteps(run);
                return;
            }

            run->working.apply(operation);
            run->result.completedSteps = step + 1;
            run->nextStep = step + 1;
            delay(run->pacingMs, self.data(), [self, run]() {
                self->runNextStep(run);
            });
        });
}

void Session::finishSteps(const SequenceRunPtr &run)
{
    if (!run->revert) {
        completeSequence(run);
        return;
    }

    if (!m_authenticated) {
        run->result.revertStatus = Status::NotAuthenticated;
        run->result.revertError = QStringLiteral("Session is not authenticated; previous state not restored");
        completeSequence(run);
        return;
    }

    // Snapshot fields win over whatever the sequence left behind. A color
    // the light cannot keep (identify red on a white light) is not pushed.
    LightState restored = run->working;
    restored.merge(run->snapshot);
    if (restored.hasColor && normalizeColor(restored.spectrum, restored.color).isEmpty()) {
        restored.hasColor = false;
        restored.color.clear();
    }
    Accessory accessory = run->accessory;
    accessory.light = restored;
    run->result.revertAttempted = true;

    QPointer<Session> self(this);
    m_client->updateDevice(accessory, [self, run](const CommandResult &reverted) {
        if (!self || self->m_closing)
            return;
        if (!reverted.ok) {
            run->result.revertStatus = Status::DeviceCommandError;
            run->result.revertError = reverted.error.isEmpty()
                ? QStringLiteral("Gateway rejected the revert")
                : reverted.error;
            qCWarning(sessionLog) << "light" << run->result.deviceId << "revert failed:"
                                  << run->result.revertError;
        }
        self->completeSequence(run);
    });
}

void Session::completeSequence(const SequenceRunPtr &run)
{
    SequenceResult &result = run->result;
    if (result.status == Status::Success && result.revertStatus != Status::Success) {
        result.status = result.revertStatus;
        result.error = QStringLiteral("Revert to previous state failed");
    }
    result.ok = result.status == Status::Success;

    const int deviceId = result.deviceId;
    m_activeSequences.remove(deviceId);

    // Start the next queued sequence before reporting so that work scheduled
    // from the callback lines up behind it.
    auto pending = m_pendingSequences.find(deviceId);
    if (pending != m_pendingSequences.end()) {
        const SequenceRunPtr next = pending->dequeue();
        if (pending->isEmpty())
            m_pendingSequences.erase(pending);
        startSequence(next);
    }

    if (run->done)
        run->done(result);
}

void Session::executeOperationsMultiple(const LightList &lights,
                                        const LightOperationList &operations,
                                        int pacingMs,
                                        bool revert,
                                        BatchCallback done)
{
    QList<BatchTarget> targets;
    targets.reserve(lights.size());
    for (const LightPtr &light : lights)
        targets.push_back(qMakePair(light ? light->getDeviceId() : 0, light));
    runBatch(targets, operations, pacingMs, revert, std::move(done));
}

void Session::executeOperationsMultiple(const QList<int> &deviceIds,
                                        const LightOperationList &operations,
                                        int pacingMs,
                                        bool revert,
                                        BatchCallback done)
{
    QList<BatchTarget> targets;
    targets.reserve(deviceIds.size());
    for (int deviceId : deviceIds)
        targets.push_back(qMakePair(deviceId, getLightFromDeviceId(deviceId)));
    runBatch(targets, operations, pacingMs, revert, std::move(done));
}

void Session::runBatch(const QList<BatchTarget> &targets,
                       const LightOperationList &operations,
                       int pacingMs,
                       bool revert,
                       BatchCallback done)
{
    struct BatchRun {
        BatchResult result;
        int pending = 0;
        BatchCallback done;
    };

    auto batch = QSharedPointer<BatchRun>::create();
    batch->done = std::move(done);
    batch->pending = targets.size();
    batch->result.outcomes.resize(targets.size());

    if (targets.isEmpty()) {
        finishLater(batch->done, batch->result);
        return;
    }

    qCInfo(sessionLog) << "running" << operations.size() << "steps on" << targets.size() << "lights";

    for (int i = 0; i < targets.size(); ++i) {
        const int deviceId = targets.at(i).first;
        const LightPtr &light = targets.at(i).second;
        batch->result.outcomes[i].deviceId = deviceId;

        auto record = [batch, i](const SequenceResult &result) {
            batch->result.outcomes[i].result = result;
            if (--batch->pending == 0 && batch->done)
                batch->done(batch->result);
        };

        if (!light) {
            SequenceResult missing;
            missing.deviceId = deviceId;
            missing.status = Status::NotFound;
            missing.error = QStringLiteral("No light with id %1").arg(deviceId);
            finishLater(record, missing);
            continue;
        }

        executeOperations(*light, operations, pacingMs, revert, record);
    }
}

bool Session::isSequenceRunning(int deviceId) const
{
    return m_activeSequences.contains(deviceId);
}

int Session::pendingSequenceCount(int deviceId) const
{
    return m_pendingSequences.value(deviceId).size();
}

} // namespace tradfri
