#include "tradfri_config.h"

#include <QVariant>

namespace tradfri {

namespace {

int readInt(const QJsonObject &obj, const QString &key, int fallback, int minValue)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    if (!ok || value < minValue)
        return fallback;
    return value;
}

bool readBool(const QJsonObject &obj, const QString &key, bool fallback)
{
    const QJsonValue value = obj.value(key);
    return value.isBool() ? value.toBool() : fallback;
}

} // namespace

SessionConfig SessionConfig::fromJson(const QJsonObject &obj)
{
    SessionConfig config;
    config.identifyPacingMs = readInt(obj, QStringLiteral("identifyPacingMs"), config.identifyPacingMs, 0);
    config.defaultPacingMs = readInt(obj, QStringLiteral("defaultPacingMs"), config.defaultPacingMs, 0);
    config.ackRequired = readBool(obj, QStringLiteral("ackRequired"), config.ackRequired);
    return config;
}

QJsonObject SessionConfig::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("identifyPacingMs"), identifyPacingMs);
    obj.insert(QStringLiteral("defaultPacingMs"), defaultPacingMs);
    obj.insert(QStringLiteral("ackRequired"), ackRequired);
    return obj;
}

ConnectorConfig ConnectorConfig::fromJson(const QJsonObject &obj)
{
    ConnectorConfig config;
    const QString key = obj.value(QStringLiteral("credentialKey")).toString().trimmed();
    if (!key.isEmpty())
        config.credentialKey = key;
    config.startObserving = readBool(obj, QStringLiteral("startObserving"), config.startObserving);
    config.session = SessionConfig::fromJson(obj.value(QStringLiteral("session")).toObject());
    return config;
}

} // namespace tradfri
