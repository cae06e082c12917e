/**
 * @file mx_resolver.cpp
 * @brief DNS MX resolution implementation
 */

#include "everify/verification/mx_resolver.h"
#include "everify/verification/email_extractor.h"

#include <netinet/in.h>
#include <arpa/nameser.h>
#include <resolv.h>
#include <netdb.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <mutex>
#include <set>
#include <thread>
#include <utility>
#include <spdlog/spdlog.h>

namespace everify::verification {

namespace {

constexpr int MAX_ANSWER_SIZE = 4096;

/// Per-thread resolver state, closed when the thread exits
class ThreadResolverState {
public:
    ThreadResolverState() {
        std::memset(&state_, 0, sizeof(state_));
        ready_ = (res_ninit(&state_) == 0);
        if (!ready_) {
            spdlog::error("[MxResolver] res_ninit failed");
        }
    }

    ~ThreadResolverState() {
        if (ready_) {
            res_nclose(&state_);
        }
    }

    ThreadResolverState(const ThreadResolverState&) = delete;
    ThreadResolverState& operator=(const ThreadResolverState&) = delete;

    res_state get() { return ready_ ? &state_ : nullptr; }

private:
    struct __res_state state_;
    bool ready_ = false;
};

res_state threadState() {
    thread_local ThreadResolverState state;
    return state.get();
}

MxLookupStatus statusFromHErrno(int herr) {
    switch (herr) {
        case HOST_NOT_FOUND: return MxLookupStatus::DOMAIN_NOT_FOUND;
        case NO_DATA:        return MxLookupStatus::NO_RECORDS;
        case TRY_AGAIN:      return MxLookupStatus::TIMEOUT;
        case NO_RECOVERY:    return MxLookupStatus::SERVER_FAILURE;
        default:             return MxLookupStatus::ERROR;
    }
}

} // anonymous namespace

// ============================================================================
// MxResolver
// ============================================================================

MxResolver::MxResolver(MxResolverOptions options)
    : options_(options)
{
    if (options_.timeoutSec < 1) options_.timeoutSec = 1;
    if (options_.attempts < 1) options_.attempts = 1;
}

MxLookupResult MxResolver::resolve(const std::string& domain) {
    MxLookupResult result;
    result.domain = domain;

    res_state state = threadState();
    if (!state) {
        result.status = MxLookupStatus::ERROR;
        result.message = "resolver initialization failed";
        return result;
    }
    state->retrans = options_.timeoutSec;
    state->retry = options_.attempts;

    unsigned char answer[MAX_ANSWER_SIZE];
    int len = res_nquery(state, domain.c_str(), ns_c_in, ns_t_mx, answer, sizeof(answer));
    if (len < 0) {
        result.status = statusFromHErrno(state->res_h_errno);
        result.message = hstrerror(state->res_h_errno);
        spdlog::debug("[MxResolver] {}: {} ({})", domain,
                      mxLookupStatusToString(result.status), result.message);
        return result;
    }

    result = parseAnswer(domain, answer, std::min(len, MAX_ANSWER_SIZE));
    spdlog::debug("[MxResolver] {}: {} host(s), status {}", domain,
                  result.hosts.size(), mxLookupStatusToString(result.status));
    return result;
}

MxLookupResult MxResolver::parseAnswer(
    const std::string& domain,
    const unsigned char* answer,
    int length)
{
    MxLookupResult result;
    result.domain = domain;

    ns_msg msg;
    if (ns_initparse(answer, length, &msg) < 0) {
        result.status = MxLookupStatus::ERROR;
        result.message = "malformed DNS answer";
        return result;
    }

    std::vector<std::pair<int, std::string>> records;
    bool nullMx = false;

    int count = ns_msg_count(msg, ns_s_an);
    for (int i = 0; i < count; i++) {
        ns_rr rr;
        if (ns_parserr(&msg, ns_s_an, i, &rr) < 0) {
            continue;
        }
        if (ns_rr_type(rr) != ns_t_mx || ns_rr_rdlen(rr) < 3) {
            continue;
        }

        const unsigned char* rdata = ns_rr_rdata(rr);
        int preference = ns_get16(rdata);

        char name[NS_MAXDNAME];
        if (dn_expand(ns_msg_base(msg), ns_msg_end(msg), rdata + NS_INT16SZ, name, sizeof(name)) < 0) {
            continue;
        }

        std::string host = normalizeEmail(name);
        while (!host.empty() && host.back() == '.') {
            host.pop_back();
        }
        if (host.empty()) {
            nullMx = true;
            continue;
        }
        records.emplace_back(preference, host);
    }

    std::sort(records.begin(), records.end());
    for (const auto& [preference, host] : records) {
        if (std::find(result.hosts.begin(), result.hosts.end(), host) == result.hosts.end()) {
            result.hosts.push_back(host);
        }
    }

    if (!result.hosts.empty()) {
        result.status = MxLookupStatus::OK;
    } else if (nullMx) {
        result.status = MxLookupStatus::NULL_MX;
        result.message = "domain publishes a null MX";
    } else {
        result.status = MxLookupStatus::NO_RECORDS;
        result.message = "no MX records";
    }
    return result;
}

// ============================================================================
// MxTable
// ============================================================================

MxLookupResult MxTable::lookup(const std::string& domain) {
    auto it = entries_.find(domain);
    if (it != entries_.end()) {
        return it->second;
    }

    MxLookupResult result;
    result.domain = domain;
    result.status = MxLookupStatus::ERROR;
    result.message = "domain was not resolved";
    return result;
}

size_t MxTable::resolvedCount() const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [](const auto& entry) { return entry.second.hasHosts(); }));
}

// ============================================================================
// Parallel resolution
// ============================================================================

MxTable resolveAll(IMxProvider& provider, const std::vector<std::string>& domains, int workers) {
    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (const auto& d : domains) {
        if (!d.empty() && seen.insert(d).second) {
            unique.push_back(d);
        }
    }

    std::map<std::string, MxLookupResult> entries;
    if (unique.empty()) {
        return MxTable(std::move(entries));
    }

    size_t threadCount = std::min(static_cast<size_t>(std::max(workers, 1)), unique.size());
    spdlog::info("[MxResolver] Resolving {} domain(s) with {} thread(s)", unique.size(), threadCount);

    std::vector<MxLookupResult> results(unique.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        size_t i;
        while ((i = next.fetch_add(1)) < unique.size()) {
            try {
                results[i] = provider.lookup(unique[i]);
            } catch (const std::exception& e) {
                spdlog::warn("[MxResolver] Lookup for {} failed: {}", unique[i], e.what());
                results[i].status = MxLookupStatus::ERROR;
                results[i].message = e.what();
            }
            results[i].domain = unique[i];
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(threadCount);
    for (size_t t = 0; t < threadCount; t++) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    for (size_t i = 0; i < unique.size(); i++) {
        entries.emplace(unique[i], std::move(results[i]));
    }
    return MxTable(std::move(entries));
}

} // namespace everify::verification
