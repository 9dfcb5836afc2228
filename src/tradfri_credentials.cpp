#include "tradfri_credentials.h"

namespace tradfri {

std::optional<QByteArray> MemoryCredentialStore::value(const QString &key) const
{
    const auto it = m_values.constFind(key);
    if (it == m_values.cend())
        return std::nullopt;
    return it.value();
}

void MemoryCredentialStore::setValue(const QString &key, const QByteArray &data)
{
    m_values.insert(key, data);
}

void storeIdentity(CredentialStore &store, const QString &key, const GatewayIdentity &identity)
{
    store.setValue(key, identity.serialize());
}

std::optional<GatewayIdentity> loadIdentity(const CredentialStore &store,
                                            const QString &key,
                                            Status *status,
                                            QString *error)
{
    const std::optional<QByteArray> stored = store.value(key);
    if (!stored.has_value() || stored->isEmpty()) {
        if (status)
            *status = Status::NotFound;
        if (error)
            *error = QStringLiteral("No stored identity under \"%1\"").arg(key);
        return std::nullopt;
    }

    auto identity = GatewayIdentity::deserialize(*stored, error);
    if (!identity) {
        if (status)
            *status = Status::InvalidArgument;
        return std::nullopt;
    }

    if (status)
        *status = Status::Success;
    return identity;
}

} // namespace tradfri
