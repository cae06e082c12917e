/**
 * @file domain_policy.h
 * @brief Registered-domain computation and disposable provider detection
 */

#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace everify::verification {

/**
 * @brief eTLD+1 of a domain using a built-in public suffix subset
 *
 * "mail.yopmail.com" -> "yopmail.com", "shop.example.co.uk" -> "example.co.uk".
 * Returns empty when the domain is itself a public suffix ("co.uk", "com").
 */
std::string registeredDomain(const std::string& domain);

/**
 * @brief Check whether a domain is a known multi-label public suffix
 */
bool isPublicSuffix(const std::string& domain);

/**
 * @brief Disposable provider policy
 *
 * Usage:
 * @code
 *   DomainPolicy policy;                      // built-in list
 *   policy.loadFromFile("/etc/ev/disposable.txt");
 *   if (policy.isDisposable("x.mailinator.com")) { ... }
 * @endcode
 */
class DomainPolicy {
public:
    /// @brief Policy with the built-in disposable list
    DomainPolicy();

    /// @brief Policy with an explicit list (built-in list not included)
    explicit DomainPolicy(const std::vector<std::string>& disposableDomains);

    /**
     * @brief True when the registered domain (or the domain itself) is disposable
     */
    bool isDisposable(const std::string& domain) const;

    void addDisposable(const std::string& domain);

    /**
     * @brief Add domains from a text file
     *
     * One domain per line; blank lines and lines starting with '#' are ignored.
     *
     * @return Number of domains added
     * @throws common::ConfigException if the file cannot be opened
     */
    size_t loadFromFile(const std::string& path);

    size_t size() const { return disposable_.size(); }

    static const std::vector<std::string>& defaultDisposableDomains();

private:
    std::unordered_set<std::string> disposable_;
};

} // namespace everify::verification
