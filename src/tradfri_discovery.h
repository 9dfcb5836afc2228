#pragma once

#include <functional>

#include <QHostAddress>
#include <QList>
#include <QString>

#include "tradfri_model.h"

class QJsonObject;

namespace tradfri {

struct DiscoveryResult {
    bool ok = false;
    Status status = Status::Success;
    QString error;
    QString name;
    QList<QHostAddress> addresses;
};

// Implementations may invoke done before discover() returns.
class Discovery
{
public:
    using DiscoveryCallback = std::function<void(const DiscoveryResult &)>;

    virtual ~Discovery() = default;

    virtual void discover(DiscoveryCallback done) = 0;
};

// Reports a fixed gateway, e.g. one configured as
// {"name": "gw-b072bf", "addresses": ["192.168.1.40"]}.
class StaticDiscovery final : public Discovery
{
public:
    StaticDiscovery() = default;
    StaticDiscovery(const QString &name, const QList<QHostAddress> &addresses);

    static StaticDiscovery fromJson(const QJsonObject &config);

    void discover(DiscoveryCallback done) override;

private:
    QString m_name;
    QList<QHostAddress> m_addresses;
};

} // namespace tradfri
