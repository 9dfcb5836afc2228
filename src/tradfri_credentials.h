#pragma once

#include <optional>

#include <QByteArray>
#include <QHash>
#include <QString>

#include "tradfri_model.h"

namespace tradfri {

// Key/value storage owned by the embedding application.
class CredentialStore
{
public:
    virtual ~CredentialStore() = default;

    virtual std::optional<QByteArray> value(const QString &key) const = 0;
    virtual void setValue(const QString &key, const QByteArray &data) = 0;
};

class MemoryCredentialStore final : public CredentialStore
{
public:
    std::optional<QByteArray> value(const QString &key) const override;
    void setValue(const QString &key, const QByteArray &data) override;

private:
    QHash<QString, QByteArray> m_values;
};

void storeIdentity(CredentialStore &store, const QString &key, const GatewayIdentity &identity);

// Returns std::nullopt with status NotFound when nothing is stored and
// InvalidArgument when the stored text cannot be parsed.
std::optional<GatewayIdentity> loadIdentity(const CredentialStore &store,
                                            const QString &key,
                                            Status *status = nullptr,
                                            QString *error = nullptr);

} // namespace tradfri
