#include "tradfri_discovery.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(discoveryLog, "tradfri.discovery");

namespace tradfri {

StaticDiscovery::StaticDiscovery(const QString &name, const QList<QHostAddress> &addresses)
    : m_name(name)
    , m_addresses(addresses)
{
}

StaticDiscovery StaticDiscovery::fromJson(const QJsonObject &config)
{
    QList<QHostAddress> addresses;
    const QJsonArray arr = config.value(QStringLiteral("addresses")).toArray();
    for (const QJsonValue &value : arr) {
        const QString text = value.toString().trimmed();
        if (text.isEmpty())
            continue;
        const QHostAddress address(text);
        if (address.isNull()) {
            qCWarning(discoveryLog) << "ignoring invalid gateway address" << text;
            continue;
        }
        addresses.push_back(address);
    }

    return StaticDiscovery(config.value(QStringLiteral("name")).toString().trimmed(), addresses);
}

void StaticDiscovery::discover(DiscoveryCallback done)
{
    DiscoveryResult result;
    if (m_addresses.isEmpty()) {
        result.status = Status::DiscoveryFailed;
        result.error = QStringLiteral("No gateway configured");
    } else {
        result.ok = true;
        result.name = m_name;
        result.addresses = m_addresses;
    }

    if (done)
        done(result);
}

} // namespace tradfri
