#include "tradfri_light.h"

#include <QLoggingCategory>

#include "tradfri_session.h"
#include "tradfri_timeout.h"

Q_LOGGING_CATEGORY(lightLog, "tradfri.light");

namespace tradfri {

namespace {

const QString kSessionGone = QStringLiteral("Light is no longer attached to a gateway session");

} // namespace

QString LightInfo::displayLine() const
{
    return QStringLiteral("%1 (#%2) - %3").arg(name).arg(deviceId).arg(spectrumName(spectrum));
}

Light::Light(Session *session, const Accessory &accessory)
    : m_session(session)
    , m_accessory(accessory)
{
}

Session *Light::session() const
{
    return m_session.data();
}

LightInfo Light::getDeviceData() const
{
    LightInfo info;
    info.deviceId = m_accessory.instanceId;
    info.name = m_accessory.name;
    info.spectrum = m_accessory.light.spectrum;
    return info;
}

bool Light::ensureSession(const ResultCallback &done) const
{
    if (m_session)
        return true;

    qCWarning(lightLog) << "light" << m_accessory.instanceId << "has no session";
    delay(0, nullptr, [done]() {
        if (done)
            done(CommandResult::failure(Status::NotAuthenticated, kSessionGone));
    });
    return false;
}

void Light::toggle(ResultCallback done) const
{
    if (!ensureSession(done))
        return;

    const LightState current = m_session->currentLightState(*this);
    LightOperation operation;
    operation.onOff = !(current.hasOn && current.on);
    m_session->operateLight(*this, operation, std::move(done));
}

void Light::setBrightness(double value, ResultCallback done) const
{
    if (!ensureSession(done))
        return;

    LightOperation operation;
    operation.brightness = value;
    m_session->operateLight(*this, operation, std::move(done));
}

void Light::setColor(const QString &value, ResultCallback done) const
{
    if (!ensureSession(done))
        return;

    LightOperation operation;
    operation.color = value;
    m_session->operateLight(*this, operation, std::move(done));
}

void Light::identify(SequenceCallback done) const
{
    if (!m_session) {
        const int deviceId = m_accessory.instanceId;
        delay(0, nullptr, [done, deviceId]() {
            SequenceResult result;
            result.deviceId = deviceId;
            result.status = Status::NotAuthenticated;
            result.error = kSessionGone;
            if (done)
                done(result);
        });
        return;
    }

    qCInfo(lightLog) << "identify light" << m_accessory.instanceId << m_accessory.name;
    m_session->identifyLight(*this, std::move(done));
}

LightOperationList Light::identifyOperations()
{
    LightOperation first;
    first.onOff = true;
    first.color = QStringLiteral("FF0000");
    first.brightness = 100.0;

    auto power = [](bool on) {
        LightOperation operation;
        operation.onOff = on;
        return operation;
    };

    return {first, power(false), power(true), power(false), power(true), power(false)};
}

} // namespace tradfri
