// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/crypto/secret_store.hpp>
#include <libsecret/secret.h>
#include <memory>

namespace vault::crypto {

using core::Error;
using core::Result;
using core::VaultErrc;

namespace {

const SecretSchema* vault_schema() {
    static const SecretSchema schema = {
        "vault",
        SECRET_SCHEMA_NONE,
        {
            {"service", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {"name", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {nullptr, SECRET_SCHEMA_ATTRIBUTE_STRING},
        },
    };
    return &schema;
}

struct GErrorDeleter {
    void operator()(GError* e) const noexcept { g_error_free(e); }
};
using ErrorPtr = std::unique_ptr<GError, GErrorDeleter>;

struct PasswordDeleter {
    void operator()(gchar* p) const noexcept { secret_password_free(p); }
};
using PasswordPtr = std::unique_ptr<gchar, PasswordDeleter>;

Error unavailable(const char* action, const ErrorPtr& error) {
    std::string detail = action;
    if (error && error->message) {
        detail += ": ";
        detail += error->message;
    }
    return Error(VaultErrc::secret_store_unavailable, std::move(detail));
}

} // namespace

LibsecretSecretStore::LibsecretSecretStore(std::string service)
    : service_(std::move(service)) {}

Result<std::optional<std::string>> LibsecretSecretStore::get(std::string_view name) {
    const std::string key(name);
    GError* raw = nullptr;
    PasswordPtr password(secret_password_lookup_sync(vault_schema(), nullptr, &raw,
                                                     "service", service_.c_str(),
                                                     "name", key.c_str(),
                                                     nullptr));
    ErrorPtr error(raw);
    if (error) {
        return std::unexpected(unavailable("keyring lookup failed", error));
    }
    if (!password) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{std::string(password.get())};
}

Result<void> LibsecretSecretStore::set(std::string_view name, std::string_view value) {
    const std::string key(name);
    const std::string secret(value);
    const std::string label = service_ + " " + key;

    GError* raw = nullptr;
    const gboolean stored = secret_password_store_sync(vault_schema(), SECRET_COLLECTION_DEFAULT,
                                                       label.c_str(), secret.c_str(), nullptr, &raw,
                                                       "service", service_.c_str(),
                                                       "name", key.c_str(),
                                                       nullptr);
    ErrorPtr error(raw);
    if (!stored || error) {
        return std::unexpected(unavailable("keyring store failed", error));
    }
    return {};
}

Result<void> LibsecretSecretStore::remove(std::string_view name) {
    const std::string key(name);
    GError* raw = nullptr;
    // FALSE without an error means there was nothing to remove
    (void)secret_password_clear_sync(vault_schema(), nullptr, &raw,
                                     "service", service_.c_str(),
                                     "name", key.c_str(),
                                     nullptr);
    ErrorPtr error(raw);
    if (error) {
        return std::unexpected(unavailable("keyring clear failed", error));
    }
    return {};
}

} // namespace vault::crypto
