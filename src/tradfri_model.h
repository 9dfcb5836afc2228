#pragma once

#include <optional>

#include <QByteArray>
#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <QVector>

namespace tradfri {

enum class Status {
    Success,
    DiscoveryFailed,
    ConnectionFailed,
    AuthenticationFailed,
    NotAuthenticated,
    DeviceCommandError,
    InvalidArgument,
    NotFound
};

QString statusName(Status status);

// User-facing line for the presentation layer.
QString statusMessage(Status status);

enum class AccessoryType {
    Unknown,
    Remote,
    SlaveRemote,
    Lightbulb,
    Plug,
    MotionSensor,
    SignalRepeater,
    Blind,
    SoundRemote,
    AirPurifier
};

enum class Spectrum {
    None,
    White,
    Rgb
};

QString spectrumName(Spectrum spectrum);
Spectrum spectrumFromString(const QString &text);

struct LightOperation {
    std::optional<bool> onOff;
    std::optional<QString> color;
    std::optional<double> brightness;
    std::optional<int> transitionTimeMs;

    bool isEmpty() const noexcept
    {
        return !onOff && !color && !brightness && !transitionTimeMs;
    }
};

using LightOperationList = QVector<LightOperation>;

struct LightState {
    Spectrum spectrum = Spectrum::None;
    bool hasOn = false;
    bool on = false;
    bool hasBrightness = false;
    double brightness = 0.0;
    bool hasColor = false;
    QString color;

    // Overwrites every field that is present in other.
    void merge(const LightState &other);
    void apply(const LightOperation &operation);

    bool operator==(const LightState &other) const;
    bool operator!=(const LightState &other) const { return !(*this == other); }
};

struct Accessory {
    int instanceId = 0;
    QString name;
    AccessoryType type = AccessoryType::Unknown;
    bool hasLight = false;
    LightState light;
};

struct GatewayIdentity {
    QString identity;
    QString psk;

    bool isValid() const noexcept { return !identity.isEmpty() && !psk.isEmpty(); }

    QJsonObject toJson() const;
    QByteArray serialize() const;
    static std::optional<GatewayIdentity> fromJson(const QJsonObject &obj);
    static std::optional<GatewayIdentity> deserialize(const QByteArray &data, QString *error = nullptr);
};

struct CommandResult {
    bool ok = false;
    Status status = Status::Success;
    QString error;

    static CommandResult success();
    static CommandResult failure(Status status, const QString &error);
};

struct AuthResult {
    bool ok = false;
    Status status = Status::Success;
    QString error;
    GatewayIdentity identity;
};

struct SequenceResult {
    bool ok = false;
    Status status = Status::Success;
    QString error;
    int deviceId = 0;
    int completedSteps = 0;
    // Index of the step that failed, -1 when no step failed.
    int failedStep = -1;
    bool revertAttempted = false;
    Status revertStatus = Status::Success;
    QString revertError;
};

struct LightOutcome {
    int deviceId = 0;
    SequenceResult result;
};

struct BatchResult {
    QVector<LightOutcome> outcomes;

    bool allSucceeded() const;
    int failureCount() const;
};

// Palette offered by white spectrum lights.
struct PaletteEntry {
    const char *name;
    const char *hex;
};

QVector<PaletteEntry> whitePalette();

// Validates and normalizes a color for the given spectrum. Returns an
// empty string and sets error when the value is not acceptable.
QString normalizeColor(Spectrum spectrum, const QString &value, QString *error = nullptr);

bool validateOperation(Spectrum spectrum, LightOperation *operation, QString *error = nullptr);

} // namespace tradfri

Q_DECLARE_METATYPE(tradfri::Accessory)
Q_DECLARE_METATYPE(tradfri::Status)
