#include "platform/linux/file_credential_store.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>

namespace {

std::string trim(std::string s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

FileCredentialStore::FileCredentialStore(std::string env_var, std::string key_file)
    : env_var_(std::move(env_var)), key_file_(std::move(key_file)) {}

std::optional<std::string> FileCredentialStore::api_key() const {
    if (!env_var_.empty()) {
        if (const char* v = std::getenv(env_var_.c_str())) {
            auto key = trim(v);
            if (!key.empty()) return key;
        }
    }

    if (key_file_.empty()) return std::nullopt;

    std::ifstream f(key_file_);
    if (!f.is_open()) return std::nullopt;

    auto key = trim(std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>()));
    if (key.empty()) return std::nullopt;
    return key;
}
