#pragma once

#include <optional>
#include <string>

class CredentialStore {
public:
    virtual ~CredentialStore() = default;
    virtual std::optional<std::string> api_key() const = 0;
    bool has_credential() const { return api_key().has_value(); }
};
