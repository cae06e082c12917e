/**
 * @file test_verification_service.cpp
 * @brief End-to-end tests of a verification run with fake DNS/SMTP providers
 */

#include <gtest/gtest.h>
#include "../src/services/verification_service.h"
#include "exception/exceptions.h"

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <sstream>

namespace fs = std::filesystem;
using namespace everify::verification;
using services::VerificationRequest;
using services::VerificationService;

namespace {

class FakeMxProvider : public IMxProvider {
public:
    std::map<std::string, std::vector<std::string>> records;
    std::atomic<int> calls{0};

    MxLookupResult lookup(const std::string& domain) override {
        calls++;
        MxLookupResult result;
        result.domain = domain;
        auto it = records.find(domain);
        if (it == records.end()) {
            result.status = MxLookupStatus::DOMAIN_NOT_FOUND;
            return result;
        }
        result.hosts = it->second;
        result.status = MxLookupStatus::OK;
        return result;
    }
};

class FakeSmtpProber : public ISmtpProber {
public:
    std::map<std::string, SmtpProbeStatus> byEmail;
    std::atomic<int> calls{0};

    SmtpProbeOutcome probe(const std::string& email, const std::vector<std::string>& hosts) override {
        calls++;
        SmtpProbeOutcome outcome;
        auto it = byEmail.find(email);
        outcome.status = it == byEmail.end() ? SmtpProbeStatus::UNKNOWN : it->second;
        outcome.host = hosts.empty() ? "" : hosts.front();
        return outcome;
    }
};

class FakeCache : public IResultCache {
public:
    std::optional<VerificationResult> find(const std::string& email) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(email);
        if (it == entries_.end()) return std::nullopt;
        VerificationResult r = it->second;
        r.fromCache = true;
        return r;
    }

    void store(const VerificationResult& result) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[result.email] = result;
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    std::mutex mutex_;
    std::map<std::string, VerificationResult> entries_;
};

} // anonymous namespace

class VerificationServiceTest : public ::testing::Test {
protected:
    std::string root;
    std::string inputDir;
    std::string outputDir;
    FakeMxProvider mx;
    FakeSmtpProber smtp;
    FakeCache cache;
    DomainPolicy policy;

    void SetUp() override {
        char tmpl[] = "/tmp/everify_run_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        root = tmpl;
        inputDir = root + "/sample_files";
        outputDir = root + "/output";
        fs::create_directories(inputDir);

        mx.records["example.com"] = {"mx1.example.com", "mx2.example.com"};
        mx.records["corp.co.uk"] = {"mail.corp.co.uk"};
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void writeInput(const std::string& name, const std::string& content) {
        std::ofstream(fs::path(inputDir) / name, std::ios::binary) << content;
    }

    static std::string readAll(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    VerificationRequest request(int workers = 4, bool deep = false) const {
        VerificationRequest req;
        req.inputPath = inputDir;
        req.outputDir = outputDir;
        req.workers = workers;
        req.deep = deep;
        return req;
    }

    static const VerificationResult* findResult(const services::VerificationSummary& s, const std::string& email) {
        for (const auto& r : s.results) {
            if (r.email == email) return &r;
        }
        return nullptr;
    }
};

TEST_F(VerificationServiceTest, NullCollaboratorsThrow) {
    EXPECT_THROW(VerificationService(nullptr, &smtp, &cache, &policy), std::invalid_argument);
    EXPECT_THROW(VerificationService(&mx, &smtp, &cache, nullptr), std::invalid_argument);
}

TEST_F(VerificationServiceTest, NonPositiveWorkersRejected) {
    VerificationService service(&mx, &smtp, nullptr, &policy);
    writeInput("a.txt", "john@example.com");
    EXPECT_THROW(service.run(request(0)), common::ConfigException);
    EXPECT_THROW(service.run(request(-3)), common::ConfigException);
}

TEST_F(VerificationServiceTest, DeepWithoutProberRejected) {
    VerificationService service(&mx, nullptr, nullptr, &policy);
    EXPECT_THROW(service.run(request(2, true)), common::ConfigException);
}

TEST_F(VerificationServiceTest, MissingInputThrows) {
    VerificationService service(&mx, &smtp, nullptr, &policy);
    VerificationRequest req = request();
    req.inputPath = root + "/nope";
    EXPECT_THROW(service.run(req), common::InputException);
}

TEST_F(VerificationServiceTest, StandardRunClassifiesAndWritesReport) {
    writeInput("a.txt",
               "John.Doe@Example.com, ghost@nowhere-domain.org\n"
               "temp@mailinator.com and .dot@example.com\n");
    writeInput("b.csv", "name,email\nJane,jane@corp.co.uk\nDup,john.doe@example.com\n");
    writeInput("ignored.pdf", "skip@example.com");

    VerificationService service(&mx, &smtp, nullptr, &policy);
    auto summary = service.run(request());

    EXPECT_EQ(summary.filesScanned, 2u);
    EXPECT_EQ(summary.totalEmails, 5u);
    EXPECT_EQ(summary.good, 2u);
    EXPECT_EQ(summary.risky, 1u);
    EXPECT_EQ(summary.bad, 2u);
    EXPECT_EQ(summary.cacheHits, 0u);
    EXPECT_EQ(smtp.calls.load(), 0);

    const VerificationResult* john = findResult(summary, "john.doe@example.com");
    ASSERT_NE(john, nullptr);
    EXPECT_EQ(john->sourceFile, "a.txt");
    EXPECT_EQ(john->reason, Reason::SYNTAX_MX);

    const VerificationResult* dot = findResult(summary, ".dot@example.com");
    ASSERT_NE(dot, nullptr);
    EXPECT_EQ(dot->reason, Reason::INVALID);

    const VerificationResult* ghost = findResult(summary, "ghost@nowhere-domain.org");
    ASSERT_NE(ghost, nullptr);
    EXPECT_EQ(ghost->reason, Reason::NO_MX);

    ASSERT_EQ(summary.reportPaths.size(), 1u);
    EXPECT_EQ(summary.reportPaths[0], (fs::path(outputDir) / "verified_results.csv").string());
    EXPECT_EQ(readAll(summary.reportPaths[0]),
              "email,verdict,reason,active_status\r\n"
              ".dot@example.com,bad,invalid,inactive\r\n"
              "ghost@nowhere-domain.org,bad,no-mx,inactive\r\n"
              "jane@corp.co.uk,good,syntax+mx,unknown\r\n"
              "john.doe@example.com,good,syntax+mx,unknown\r\n"
              "temp@mailinator.com,risky,disposable,unknown\r\n");
}

TEST_F(VerificationServiceTest, MxResolvedOncePerDomainAndNotForDisposable) {
    writeInput("a.txt", "a@example.com b@example.com c@example.com x@mailinator.com bad@@example.com");

    VerificationService service(&mx, &smtp, nullptr, &policy);
    service.run(request(8));

    EXPECT_EQ(mx.calls.load(), 1);
}

TEST_F(VerificationServiceTest, DeepRunUsesSmtp) {
    writeInput("a.txt", "live@example.com dead@example.com maybe@example.com none@nowhere.org");
    smtp.byEmail["live@example.com"] = SmtpProbeStatus::ACCEPTED;
    smtp.byEmail["dead@example.com"] = SmtpProbeStatus::REJECTED;

    VerificationService service(&mx, &smtp, nullptr, &policy);
    auto summary = service.run(request(3, true));

    EXPECT_TRUE(summary.deep);
    EXPECT_EQ(smtp.calls.load(), 3);
    EXPECT_EQ(findResult(summary, "live@example.com")->reason, Reason::SMTP_ACTIVE);
    EXPECT_EQ(findResult(summary, "live@example.com")->activeStatus, ActiveStatus::ACTIVE);
    EXPECT_EQ(findResult(summary, "dead@example.com")->reason, Reason::SMTP_REJECT);
    EXPECT_EQ(findResult(summary, "maybe@example.com")->reason, Reason::SMTP_UNKNOWN);
    EXPECT_EQ(findResult(summary, "none@nowhere.org")->reason, Reason::NO_MX);
}

TEST_F(VerificationServiceTest, SecondRunServedFromCache) {
    writeInput("a.txt", "a@example.com b@example.com");

    VerificationService service(&mx, &smtp, &cache, &policy);
    auto first = service.run(request());
    EXPECT_EQ(first.cacheHits, 0u);
    EXPECT_EQ(cache.size(), 2u);

    int lookupsAfterFirst = mx.calls.load();
    auto second = service.run(request());
    EXPECT_EQ(second.cacheHits, 2u);
    EXPECT_EQ(second.good, 2u);
    for (const auto& r : second.results) {
        EXPECT_TRUE(r.fromCache);
        EXPECT_EQ(r.sourceFile, "a.txt");
    }
    // Domains are still resolved up front; classification never consults them
    EXPECT_EQ(mx.calls.load(), lookupsAfterFirst + 1);

    // Second combined report goes to the fallback name
    ASSERT_EQ(second.reportPaths.size(), 1u);
    EXPECT_EQ(fs::path(second.reportPaths[0]).filename().string(), "verified_results_new.csv");
}

TEST_F(VerificationServiceTest, ProgressReportsEveryAddress) {
    writeInput("a.txt", "a@example.com b@example.com c@example.com d@example.com");

    VerificationService service(&mx, &smtp, nullptr, &policy);
    VerificationRequest req = request(2);
    std::vector<size_t> seen;
    size_t reportedTotal = 0;
    req.onProgress = [&](size_t done, size_t total) {
        seen.push_back(done);
        reportedTotal = total;
    };
    service.run(req);

    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(reportedTotal, 4u);
    std::set<size_t> unique(seen.begin(), seen.end());
    EXPECT_EQ(unique, (std::set<size_t>{1, 2, 3, 4}));
}

TEST_F(VerificationServiceTest, SingleFileInputAndPerFileLayout) {
    writeInput("list.dat", "one@example.com two@example.com");

    VerificationService service(&mx, &smtp, nullptr, &policy);
    VerificationRequest req = request();
    req.inputPath = inputDir + "/list.dat";
    req.layout = services::ReportLayout::PER_FILE;
    auto summary = service.run(req);

    ASSERT_EQ(summary.reportPaths.size(), 1u);
    EXPECT_EQ(fs::path(summary.reportPaths[0]).filename().string(), "list.dat.emails.csv");
    EXPECT_EQ(readAll(summary.reportPaths[0]),
              "filename,email,verdict,active_status,reason\r\n"
              "list.dat,one@example.com,good,unknown,syntax+mx\r\n"
              "list.dat,two@example.com,good,unknown,syntax+mx\r\n");
}

TEST_F(VerificationServiceTest, EmptyInputWritesHeaderOnly) {
    VerificationService service(&mx, &smtp, nullptr, &policy);
    auto summary = service.run(request());

    EXPECT_EQ(summary.totalEmails, 0u);
    ASSERT_EQ(summary.reportPaths.size(), 1u);
    EXPECT_EQ(readAll(summary.reportPaths[0]), "email,verdict,reason,active_status\r\n");
}

TEST_F(VerificationServiceTest, CollectAddressesFirstFileWins) {
    auto addresses = VerificationService::collectAddresses(
        {"a.txt", "b.txt"},
        {"X@Example.com y@example.com", "y@EXAMPLE.com z@example.com"});

    ASSERT_EQ(addresses.size(), 3u);
    EXPECT_EQ(addresses[0], std::make_pair(std::string("x@example.com"), std::string("a.txt")));
    EXPECT_EQ(addresses[1], std::make_pair(std::string("y@example.com"), std::string("a.txt")));
    EXPECT_EQ(addresses[2], std::make_pair(std::string("z@example.com"), std::string("b.txt")));
}
