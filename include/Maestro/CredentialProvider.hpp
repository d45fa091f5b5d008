// =================================================================
// include/Maestro/CredentialProvider.hpp
// =================================================================
// Resolution of credential references into secrets.

#pragma once

#include <map>
#include <mutex>
#include <string>

namespace Maestro {

/**
 * @brief Resolves a credential reference (e.g. "DEEPSEEK_API_KEY")
 *
 * resolve() throws CredentialError when the reference cannot be resolved.
 */
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    virtual std::string resolve(const std::string& name) = 0;
};

/**
 * @brief Reads credentials from process environment variables
 */
class EnvCredentialProvider : public CredentialProvider {
public:
    std::string resolve(const std::string& name) override;
};

/**
 * @brief Fixed in-memory credentials
 */
class StaticCredentialProvider : public CredentialProvider {
public:
    StaticCredentialProvider() = default;
    explicit StaticCredentialProvider(std::map<std::string, std::string> secrets);

    void set(const std::string& name, const std::string& secret);
    std::string resolve(const std::string& name) override;

private:
    std::mutex m_mutex;
    std::map<std::string, std::string> m_secrets;
};

} // namespace Maestro
