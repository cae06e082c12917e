/**
 * @file job_manager.cpp
 * @brief Background verification job tracking
 */

#include "job_manager.h"
#include "services/verification_service.h"
#include <everify/utils/file_utils.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>
#include <uuid/uuid.h>

namespace fs = std::filesystem;

namespace api {

std::string jobStateToString(JobState state) {
    switch (state) {
        case JobState::RUNNING: return "running";
        case JobState::DONE:    return "done";
        case JobState::ERROR:   return "error";
    }
    return "error";
}

double JobStatus::percent() const {
    if (total == 0) {
        return 0.0;
    }
    return std::round(static_cast<double>(done) * 10000.0 / static_cast<double>(total)) / 100.0;
}

Json::Value JobStatus::toJson() const {
    Json::Value json;
    json["job_id"] = jobId;
    json["done"] = static_cast<Json::UInt64>(done);
    json["total"] = static_cast<Json::UInt64>(total);
    json["percent"] = percent();
    json["status"] = jobStateToString(state);
    if (state == JobState::ERROR) {
        json["error"] = error;
    }
    return json;
}

JobManager::JobManager(services::VerificationService* service,
                       std::string outputRoot,
                       int workers,
                       size_t retainedJobs)
    : service_(service), outputRoot_(std::move(outputRoot)), workers_(workers),
      retainedJobs_(retainedJobs)
{
    if (!service_) {
        throw std::invalid_argument("JobManager: service cannot be nullptr");
    }
    if (workers_ <= 0) {
        workers_ = DEFAULT_JOB_WORKERS;
    }
}

JobManager::~JobManager() {
    waitAll();
}

std::string JobManager::generateJobId() {
    uuid_t uuid;
    char uuidStr[37];
    uuid_generate(uuid);
    uuid_unparse_lower(uuid, uuidStr);
    return std::string(uuidStr);
}

bool JobManager::isValidJobId(const std::string& jobId) {
    if (jobId.empty() || jobId.size() > 36) {
        return false;
    }
    return std::all_of(jobId.begin(), jobId.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || c == '-';
    });
}

fs::path JobManager::jobOutputDir(const std::string& jobId) const {
    return outputRoot_ / jobId;
}

void JobManager::start(const std::string& jobId, const std::string& inputPath, bool deep) {
    reapFinishedThreads();

    {
        std::lock_guard<std::mutex> lock(threadsMutex_);
        if (threads_.count(jobId)) {
            throw std::invalid_argument("JobManager: job " + jobId + " is already running");
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        JobStatus status;
        status.jobId = jobId;
        jobs_[jobId] = status;
        finishedJobs_.erase(std::remove(finishedJobs_.begin(), finishedJobs_.end(), jobId),
                            finishedJobs_.end());
    }

    spdlog::info("[JobManager] Starting job {} ({} mode): {}",
                 jobId, deep ? "deep" : "standard", inputPath);

    std::lock_guard<std::mutex> lock(threadsMutex_);
    threads_.emplace(jobId, std::thread(&JobManager::runJob, this, jobId, inputPath, deep));
}

void JobManager::reapFinishedThreads() {
    std::vector<std::thread> exited;
    {
        std::lock_guard<std::mutex> lock(threadsMutex_);
        for (const auto& jobId : exitedThreads_) {
            auto it = threads_.find(jobId);
            if (it != threads_.end()) {
                exited.push_back(std::move(it->second));
                threads_.erase(it);
            }
        }
        exitedThreads_.clear();
    }
    // These threads have returned from runJob, so join does not block for long
    for (auto& t : exited) {
        if (t.joinable()) {
            t.join();
        }
    }
    if (!exited.empty()) {
        spdlog::debug("[JobManager] Joined {} finished job thread(s)", exited.size());
    }
}

size_t JobManager::threadCount() const {
    std::lock_guard<std::mutex> lock(threadsMutex_);
    return threads_.size();
}

void JobManager::retireLocked(const std::string& jobId) {
    finishedJobs_.push_back(jobId);
    while (finishedJobs_.size() > retainedJobs_) {
        jobs_.erase(finishedJobs_.front());
        finishedJobs_.pop_front();
    }
}

std::optional<JobStatus> JobManager::getStatus(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<fs::path> JobManager::findReport(const std::string& jobId) const {
    if (!isValidJobId(jobId)) {
        return std::nullopt;
    }
    std::error_code ec;
    fs::path dir = jobOutputDir(jobId);
    if (!fs::is_directory(dir, ec)) {
        return std::nullopt;
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    if (files.empty()) {
        return std::nullopt;
    }
    std::sort(files.begin(), files.end());
    return files.front();
}

void JobManager::waitAll() {
    std::map<std::string, std::thread> pending;
    {
        std::lock_guard<std::mutex> lock(threadsMutex_);
        pending.swap(threads_);
        exitedThreads_.clear();
    }
    for (auto& entry : pending) {
        if (entry.second.joinable()) {
            entry.second.join();
        }
    }
}

void JobManager::runJob(const std::string& jobId, const std::string& inputPath, bool deep) {
    services::VerificationRequest request;
    request.inputPath = inputPath;
    request.outputDir = jobOutputDir(jobId).string();
    request.workers = workers_;
    request.deep = deep;
    request.onProgress = [this, jobId](size_t done, size_t total) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& job = jobs_[jobId];
        job.done = done;
        job.total = total;
    };

    try {
        services::VerificationSummary summary = service_->run(request);

        std::lock_guard<std::mutex> lock(mutex_);
        auto& job = jobs_[jobId];
        job.done = summary.totalEmails;
        job.total = summary.totalEmails;
        job.state = JobState::DONE;
        retireLocked(jobId);
        spdlog::info("[JobManager] Job {} done: {} address(es)", jobId, summary.totalEmails);
    } catch (const std::exception& e) {
        markFailed(jobId, e.what());
    }

    std::lock_guard<std::mutex> lock(threadsMutex_);
    exitedThreads_.push_back(jobId);
}

void JobManager::markFailed(const std::string& jobId, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& job = jobs_[jobId];
        job.state = JobState::ERROR;
        job.error = message;
        retireLocked(jobId);
    }
    spdlog::error("[JobManager] Job {} failed: {}", jobId, message);

    std::string logPath = (outputRoot_ / (jobId + "_error.log")).string();
    try {
        std::error_code ec;
        fs::create_directories(outputRoot_, ec);
        everify::utils::writeFileContent(logPath, message + "\n");
    } catch (const std::exception& e) {
        spdlog::warn("[JobManager] Cannot write {}: {}", logPath, e.what());
    }
}

} // namespace api
