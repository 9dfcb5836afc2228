#pragma once

#include <functional>

#include <QPointer>
#include <QSharedPointer>
#include <QString>

#include "tradfri_model.h"

namespace tradfri {

class Session;

struct LightInfo {
    int deviceId = 0;
    QString name;
    Spectrum spectrum = Spectrum::None;

    // "<name> (#<id>) - <spectrum>"
    QString displayLine() const;
};

// A lightbulb accessory as last reported by the gateway. Instances are
// replaced, not updated, when a newer report arrives; every mutation goes
// through the owning session.
class Light
{
public:
    using ResultCallback = std::function<void(const CommandResult &)>;
    using SequenceCallback = std::function<void(const SequenceResult &)>;

    Light(Session *session, const Accessory &accessory);

    int getDeviceId() const { return m_accessory.instanceId; }
    LightInfo getDeviceData() const;
    const Accessory &getAccessory() const { return m_accessory; }
    const LightState &getLightState() const { return m_accessory.light; }
    Spectrum spectrum() const { return m_accessory.light.spectrum; }
    Session *session() const;

    void toggle(ResultCallback done) const;
    void setBrightness(double value, ResultCallback done) const;
    void setColor(const QString &value, ResultCallback done) const;

    // Flashes the light so it can be found in a room, then restores its
    // previous state.
    void identify(SequenceCallback done) const;

    // {on, red, 100}, then off, on, off, on, off.
    static LightOperationList identifyOperations();

private:
    bool ensureSession(const ResultCallback &done) const;

    QPointer<Session> m_session;
    Accessory m_accessory;
};

using LightPtr = QSharedPointer<Light>;
using LightList = QList<LightPtr>;

} // namespace tradfri
