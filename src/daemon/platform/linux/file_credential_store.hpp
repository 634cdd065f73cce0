#pragma once

#include "platform/credential_store.hpp"

#include <string>

// API key from an environment variable, falling back to a key file.
// Read on every call so a key added while the daemon runs is picked up.
class FileCredentialStore : public CredentialStore {
public:
    FileCredentialStore(std::string env_var, std::string key_file);

    std::optional<std::string> api_key() const override;

private:
    std::string env_var_;
    std::string key_file_;
};
