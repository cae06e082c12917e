/**
 * @file email_classifier.h
 * @brief Per-address classification pipeline
 *
 * Uses IMxProvider, ISmtpProber and IResultCache for infrastructure abstraction.
 * Evaluation order: cache -> syntax -> disposable -> MX -> SMTP (deep only).
 */

#pragma once

#include "types.h"
#include "providers.h"
#include "domain_policy.h"

namespace everify::verification {

struct ClassifierOptions {
    bool deep = false;  ///< Probe mailboxes over SMTP
};

/**
 * @brief Address classifier
 *
 * Thread-safe as long as the providers are.
 *
 * Usage:
 * @code
 *   MxTable table = resolveAll(resolver, domains, 16);
 *   EmailClassifier classifier(&table, nullptr, &cache, &policy, {false});
 *   VerificationResult r = classifier.classify("john@example.com", "list.txt");
 * @endcode
 */
class EmailClassifier {
public:
    /**
     * @param mxProvider MX lookup (non-owning, required)
     * @param smtpProber SMTP prober (non-owning, required when options.deep)
     * @param cache Result cache (non-owning, nullptr disables caching)
     * @param policy Disposable domain policy (non-owning, required)
     * @throws std::invalid_argument on a missing required collaborator
     */
    EmailClassifier(
        IMxProvider* mxProvider,
        ISmtpProber* smtpProber,
        IResultCache* cache,
        const DomainPolicy* policy,
        ClassifierOptions options = {});

    /**
     * @brief Classify one normalized address
     *
     * A fresh cache entry is returned as-is (fromCache=true). Otherwise the
     * computed result is stored in the cache before returning.
     */
    VerificationResult classify(const std::string& email, const std::string& sourceFile = "");

    bool isDeep() const { return options_.deep; }

private:
    IMxProvider* mxProvider_;
    ISmtpProber* smtpProber_;
    IResultCache* cache_;
    const DomainPolicy* policy_;
    ClassifierOptions options_;

    VerificationResult evaluate(const std::string& email);
};

} // namespace everify::verification
