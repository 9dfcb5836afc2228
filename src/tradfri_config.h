#pragma once

#include <QJsonObject>
#include <QString>

namespace tradfri {

struct SessionConfig {
    int identifyPacingMs = 1000;
    int defaultPacingMs = 0;
    bool ackRequired = true;

    static SessionConfig fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;
};

struct ConnectorConfig {
    QString credentialKey = QStringLiteral("idpsk");
    bool startObserving = true;
    SessionConfig session;

    static ConnectorConfig fromJson(const QJsonObject &obj);
};

} // namespace tradfri
