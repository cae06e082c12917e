/**
 * @file domain_policy.cpp
 * @brief Disposable provider detection implementation
 */

#include "everify/verification/domain_policy.h"
#include "everify/verification/email_extractor.h"
#include "exception/exceptions.h"

#include <fstream>
#include <spdlog/spdlog.h>

namespace everify::verification {

namespace {

// Multi-label public suffixes seen in real mailing lists. Single-label TLDs
// are implicit: any last label is a suffix.
const std::unordered_set<std::string>& multiLabelSuffixes() {
    static const std::unordered_set<std::string> suffixes = {
        "co.uk", "org.uk", "ac.uk", "gov.uk", "ltd.uk", "plc.uk", "me.uk", "net.uk",
        "com.au", "net.au", "org.au", "edu.au", "gov.au",
        "co.nz", "org.nz", "net.nz",
        "co.jp", "ne.jp", "or.jp", "ac.jp",
        "co.kr", "or.kr", "ne.kr", "ac.kr", "go.kr",
        "com.br", "net.br", "org.br",
        "com.cn", "net.cn", "org.cn",
        "com.mx", "com.ar", "com.tr", "com.sg", "com.my", "com.hk", "com.tw",
        "co.in", "net.in", "org.in", "firm.in",
        "co.za", "org.za",
        "co.il", "co.id", "co.th",
        "com.pl", "com.ua", "com.ru",
    };
    return suffixes;
}

} // anonymous namespace

bool isPublicSuffix(const std::string& domain) {
    if (domain.find('.') == std::string::npos) {
        return !domain.empty();
    }
    return multiLabelSuffixes().count(domain) > 0;
}

std::string registeredDomain(const std::string& domain) {
    std::string d = normalizeEmail(domain);
    while (!d.empty() && d.back() == '.') {
        d.pop_back();
    }
    if (d.empty() || isPublicSuffix(d)) {
        return "";
    }

    size_t last = d.rfind('.');
    if (last == 0) {
        return "";
    }
    size_t second = d.rfind('.', last - 1);
    if (second == std::string::npos) {
        return d;  // already label.tld
    }

    std::string lastTwo = d.substr(second + 1);
    if (!multiLabelSuffixes().count(lastTwo)) {
        return lastTwo;
    }

    if (second == 0) {
        return "";
    }
    size_t third = d.rfind('.', second - 1);
    return (third == std::string::npos) ? d : d.substr(third + 1);
}

// ============================================================================
// DomainPolicy
// ============================================================================

const std::vector<std::string>& DomainPolicy::defaultDisposableDomains() {
    static const std::vector<std::string> domains = {
        "mailinator.com",
        "10minutemail.com",
        "yopmail.com",
        "guerrillamail.com",
        "trashmail.com",
        "tempmail.com",
        "tempmail.net",
        "getnada.com",
        "dispostable.com",
    };
    return domains;
}

DomainPolicy::DomainPolicy()
    : DomainPolicy(defaultDisposableDomains())
{
}

DomainPolicy::DomainPolicy(const std::vector<std::string>& disposableDomains) {
    for (const auto& d : disposableDomains) {
        addDisposable(d);
    }
}

void DomainPolicy::addDisposable(const std::string& domain) {
    std::string d = normalizeEmail(domain);
    if (!d.empty()) {
        disposable_.insert(d);
    }
}

bool DomainPolicy::isDisposable(const std::string& domain) const {
    std::string d = normalizeEmail(domain);
    if (d.empty()) {
        return false;
    }

    std::string reg = registeredDomain(d);
    if (!reg.empty() && disposable_.count(reg)) {
        return true;
    }
    return disposable_.count(d) > 0;
}

size_t DomainPolicy::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw common::ConfigException("cannot open disposable domains file: " + path);
    }

    size_t added = 0;
    std::string line;
    while (std::getline(in, line)) {
        std::string d = normalizeEmail(line);
        if (d.empty() || d[0] == '#') {
            continue;
        }
        if (disposable_.insert(d).second) {
            added++;
        }
    }

    spdlog::info("[DomainPolicy] Loaded {} disposable domains from {}", added, path);
    return added;
}

} // namespace everify::verification
