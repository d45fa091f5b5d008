// =================================================================
// src/Maestro/CredentialProvider.cpp
// =================================================================
// Implementation of credential providers.

#include "Maestro/CredentialProvider.hpp"
#include "Maestro/Errors.hpp"
#include <cstdlib>

namespace Maestro {

std::string EnvCredentialProvider::resolve(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        throw CredentialError("Environment variable not set: " + name);
    }
    return value;
}

StaticCredentialProvider::StaticCredentialProvider(std::map<std::string, std::string> secrets)
    : m_secrets(std::move(secrets)) {}

void StaticCredentialProvider::set(const std::string& name, const std::string& secret) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_secrets[name] = secret;
}

std::string StaticCredentialProvider::resolve(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_secrets.find(name);
    if (it == m_secrets.end()) {
        throw CredentialError("Unknown credential: " + name);
    }
    return it->second;
}

} // namespace Maestro
