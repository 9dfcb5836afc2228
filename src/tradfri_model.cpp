#include "tradfri_model.h"

#include <cmath>

#include <QJsonDocument>
#include <QRegularExpression>

namespace tradfri {

namespace {

bool isHexColor(const QString &value)
{
    static const QRegularExpression pattern(QStringLiteral("^[0-9a-fA-F]{6}$"));
    return pattern.match(value).hasMatch();
}

} // namespace

QString statusName(Status status)
{
    switch (status) {
    case Status::Success:
        return QStringLiteral("Success");
    case Status::DiscoveryFailed:
        return QStringLiteral("DiscoveryFailed");
    case Status::ConnectionFailed:
        return QStringLiteral("ConnectionFailed");
    case Status::AuthenticationFailed:
        return QStringLiteral("AuthenticationFailed");
    case Status::NotAuthenticated:
        return QStringLiteral("NotAuthenticated");
    case Status::DeviceCommandError:
        return QStringLiteral("DeviceCommandError");
    case Status::InvalidArgument:
        return QStringLiteral("InvalidArgument");
    case Status::NotFound:
        return QStringLiteral("NotFound");
    }
    return QStringLiteral("Unknown");
}

QString statusMessage(Status status)
{
    switch (status) {
    case Status::Success:
        return QStringLiteral("Done.");
    case Status::DiscoveryFailed:
        return QStringLiteral("Could not find an IKEA Tradfri gateway on the network.");
    case Status::ConnectionFailed:
        return QStringLiteral("Could not reach the gateway. Check the network and retry.");
    case Status::AuthenticationFailed:
        return QStringLiteral("Could not authenticate with the given parameters. Retry with corrected credentials.");
    case Status::NotAuthenticated:
        return QStringLiteral("You are not connected/authenticated to an IKEA Tradfri gateway. Run \"connect\" first.");
    case Status::DeviceCommandError:
        return QStringLiteral("The gateway did not accept the command for this light.");
    case Status::InvalidArgument:
        return QStringLiteral("The entered value is not valid for this light.");
    case Status::NotFound:
        return QStringLiteral("The selected light couldn't be found.");
    }
    return QString();
}

QString spectrumName(Spectrum spectrum)
{
    switch (spectrum) {
    case Spectrum::White:
        return QStringLiteral("white");
    case Spectrum::Rgb:
        return QStringLiteral("rgb");
    case Spectrum::None:
        break;
    }
    return QStringLiteral("none");
}

Spectrum spectrumFromString(const QString &text)
{
    const QString normalized = text.trimmed().toLower();
    if (normalized == QLatin1String("rgb"))
        return Spectrum::Rgb;
    if (normalized == QLatin1String("white"))
        return Spectrum::White;
    return Spectrum::None;
}

void LightState::merge(const LightState &other)
{
    if (other.spectrum != Spectrum::None)
        spectrum = other.spectrum;
    if (other.hasOn) {
        hasOn = true;
        on = other.on;
    }
    if (other.hasBrightness) {
        hasBrightness = true;
        brightness = other.brightness;
    }
    if (other.hasColor) {
        hasColor = true;
        color = other.color;
    }
}

void LightState::apply(const LightOperation &operation)
{
    if (operation.onOff) {
        hasOn = true;
        on = *operation.onOff;
    }
    if (operation.brightness) {
        hasBrightness = true;
        brightness = *operation.brightness;
    }
    if (operation.color) {
        hasColor = true;
        color = *operation.color;
    }
}

bool LightState::operator==(const LightState &other) const
{
    return spectrum == other.spectrum
        && hasOn == other.hasOn && (!hasOn || on == other.on)
        && hasBrightness == other.hasBrightness && (!hasBrightness || qFuzzyCompare(brightness + 1.0, other.brightness + 1.0))
        && hasColor == other.hasColor && (!hasColor || color == other.color);
}

QJsonObject GatewayIdentity::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("identity"), identity);
    obj.insert(QStringLiteral("psk"), psk);
    return obj;
}

QByteArray GatewayIdentity::serialize() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

std::optional<GatewayIdentity> GatewayIdentity::fromJson(const QJsonObject &obj)
{
    GatewayIdentity out;
    out.identity = obj.value(QStringLiteral("identity")).toString();
    out.psk = obj.value(QStringLiteral("psk")).toString();
    if (!out.isValid())
        return std::nullopt;
    return out;
}

std::optional<GatewayIdentity> GatewayIdentity::deserialize(const QByteArray &data, QString *error)
{
    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error)
            *error = QStringLiteral("Stored identity is not a JSON object");
        return std::nullopt;
    }

    auto identity = fromJson(doc.object());
    if (!identity && error)
        *error = QStringLiteral("Stored identity lacks identity or psk");
    return identity;
}

CommandResult CommandResult::success()
{
    CommandResult result;
    result.ok = true;
    return result;
}

CommandResult CommandResult::failure(Status status, const QString &error)
{
    CommandResult result;
    result.status = status;
    result.error = error;
    return result;
}

bool BatchResult::allSucceeded() const
{
    return failureCount() == 0;
}

int BatchResult::failureCount() const
{
    int count = 0;
    for (const LightOutcome &outcome : outcomes) {
        if (!outcome.result.ok)
            ++count;
    }
    return count;
}

QVector<PaletteEntry> whitePalette()
{
    return {
        {"White", "f5faf6"},
        {"Warm", "f1e0b5"},
        {"Yellow", "efd275"},
    };
}

QString normalizeColor(Spectrum spectrum, const QString &value, QString *error)
{
    auto fail = [error](const QString &message) {
        if (error)
            *error = message;
        return QString();
    };

    QString text = value.trimmed();
    if (text.startsWith(QLatin1Char('#')))
        text.remove(0, 1);

    switch (spectrum) {
    case Spectrum::Rgb:
        if (!isHexColor(text))
            return fail(QStringLiteral("Expected a 6-digit hex color, got \"%1\"").arg(value));
        return text.toLower();
    case Spectrum::White:
        for (const PaletteEntry &entry : whitePalette()) {
            if (text.compare(QLatin1String(entry.hex), Qt::CaseInsensitive) == 0
                || text.compare(QLatin1String(entry.name), Qt::CaseInsensitive) == 0) {
                return QString::fromLatin1(entry.hex);
            }
        }
        return fail(QStringLiteral("\"%1\" is not a white spectrum palette color").arg(value));
    case Spectrum::None:
        break;
    }
    return fail(QStringLiteral("Light does not support colors"));
}

bool validateOperation(Spectrum spectrum, LightOperation *operation, QString *error)
{
    if (!operation) {
        if (error)
            *error = QStringLiteral("Operation is null");
        return false;
    }

    if (operation->isEmpty()) {
        if (error)
            *error = QStringLiteral("Operation changes nothing");
        return false;
    }

    if (operation->brightness) {
        const double value = *operation->brightness;
        if (std::isnan(value) || value < 0.0 || value > 100.0) {
            if (error)
                *error = QStringLiteral("Brightness %1 is outside 0-100").arg(value);
            return false;
        }
    }

    if (operation->transitionTimeMs && *operation->transitionTimeMs < 0) {
        if (error)
            *error = QStringLiteral("Transition time must not be negative");
        return false;
    }

    if (operation->color) {
        const QString normalized = normalizeColor(spectrum, *operation->color, error);
        if (normalized.isEmpty())
            return false;
        operation->color = normalized;
    }

    return true;
}

} // namespace tradfri
