/**
 * @file email_classifier.cpp
 * @brief Per-address classification pipeline implementation
 */

#include "everify/verification/email_classifier.h"
#include "everify/verification/syntax_validator.h"

#include <ctime>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace everify::verification {

namespace {

void setOutcome(VerificationResult& r, Verdict verdict, Reason reason, ActiveStatus status) {
    r.verdict = verdict;
    r.reason = reason;
    r.activeStatus = status;
}

} // anonymous namespace

EmailClassifier::EmailClassifier(
    IMxProvider* mxProvider,
    ISmtpProber* smtpProber,
    IResultCache* cache,
    const DomainPolicy* policy,
    ClassifierOptions options)
    : mxProvider_(mxProvider)
    , smtpProber_(smtpProber)
    , cache_(cache)
    , policy_(policy)
    , options_(options)
{
    if (!mxProvider_) {
        throw std::invalid_argument("EmailClassifier: mxProvider cannot be nullptr");
    }
    if (!policy_) {
        throw std::invalid_argument("EmailClassifier: policy cannot be nullptr");
    }
    if (options_.deep && !smtpProber_) {
        throw std::invalid_argument("EmailClassifier: deep mode requires an smtpProber");
    }
}

VerificationResult EmailClassifier::classify(const std::string& email, const std::string& sourceFile) {
    // Step 1: Cache
    if (cache_) {
        if (auto cached = cache_->find(email)) {
            cached->sourceFile = sourceFile;
            cached->fromCache = true;
            return *cached;
        }
    }

    // Steps 2-5: Fresh evaluation
    VerificationResult result = evaluate(email);
    result.sourceFile = sourceFile;
    result.checkedAt = static_cast<int64_t>(std::time(nullptr));

    if (cache_) {
        cache_->store(result);
    }
    return result;
}

VerificationResult EmailClassifier::evaluate(const std::string& email) {
    VerificationResult result;
    result.email = email;

    // Step 2: Syntax
    SyntaxCheckResult syntax = SyntaxValidator::validate(email);
    if (!syntax.valid) {
        spdlog::trace("[EmailClassifier] {} invalid: {}", email, syntax.message);
        setOutcome(result, Verdict::BAD, Reason::INVALID, ActiveStatus::INACTIVE);
        return result;
    }
    result.mxDomain = syntax.domain;

    // Step 3: Disposable provider
    if (policy_->isDisposable(syntax.domain)) {
        setOutcome(result, Verdict::RISKY, Reason::DISPOSABLE, ActiveStatus::UNKNOWN);
        return result;
    }

    // Step 4: MX
    MxLookupResult mx = mxProvider_->lookup(syntax.domain);
    if (!mx.hasHosts()) {
        spdlog::trace("[EmailClassifier] {} has no MX ({})",
                      syntax.domain, mxLookupStatusToString(mx.status));
        setOutcome(result, Verdict::BAD, Reason::NO_MX, ActiveStatus::INACTIVE);
        return result;
    }

    if (!options_.deep) {
        setOutcome(result, Verdict::GOOD, Reason::SYNTAX_MX, ActiveStatus::UNKNOWN);
        return result;
    }

    // Step 5: SMTP RCPT probe
    SmtpProbeOutcome probe = smtpProber_->probe(email, mx.hosts);
    switch (probe.status) {
        case SmtpProbeStatus::ACCEPTED:
            setOutcome(result, Verdict::GOOD, Reason::SMTP_ACTIVE, ActiveStatus::ACTIVE);
            break;
        case SmtpProbeStatus::REJECTED:
            setOutcome(result, Verdict::BAD, Reason::SMTP_REJECT, ActiveStatus::INACTIVE);
            break;
        case SmtpProbeStatus::UNKNOWN:
            setOutcome(result, Verdict::RISKY, Reason::SMTP_UNKNOWN, ActiveStatus::UNKNOWN);
            break;
    }
    return result;
}

} // namespace everify::verification
