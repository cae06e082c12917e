#pragma once

/**
 * @file job_manager.h
 * @brief Background verification jobs started from the HTTP API
 *
 * Each uploaded file becomes a job identified by a UUID. The job runs
 * VerificationService::run on its own thread and publishes done/total
 * counts that /progress/{job_id} reads.
 *
 * @date 2026-10-09
 */

#include <cstddef>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <json/json.h>

namespace services {
class VerificationService;
}

namespace api {

enum class JobState {
    RUNNING,
    DONE,
    ERROR
};

std::string jobStateToString(JobState state);

struct JobStatus {
    std::string jobId;
    size_t done = 0;
    size_t total = 0;
    JobState state = JobState::RUNNING;
    std::string error;

    /// @brief Completion percentage rounded to 2 decimals (0 when total is 0)
    double percent() const;

    Json::Value toJson() const;
};

class JobManager {
public:
    static constexpr int DEFAULT_JOB_WORKERS = 5;
    static constexpr size_t DEFAULT_RETAINED_JOBS = 1000;

    /**
     * @param service Verification service (non-owning)
     * @param outputRoot Parent directory of every job's output folder
     * @param workers Classification threads per job
     * @param retainedJobs Finished jobs whose status stays queryable; older ones are forgotten
     * @throws std::invalid_argument if service is nullptr
     */
    JobManager(services::VerificationService* service,
               std::string outputRoot,
               int workers = DEFAULT_JOB_WORKERS,
               size_t retainedJobs = DEFAULT_RETAINED_JOBS);

    /// @brief Joins all job threads
    ~JobManager();

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    static std::string generateJobId();

    /// @brief True for lowercase hex digits and '-' only (rejects path components)
    static bool isValidJobId(const std::string& jobId);

    /**
     * @brief Register the job as running and start it in the background
     *
     * Threads of jobs that finished since the last call are joined first.
     *
     * @param jobId Identifier returned by generateJobId()
     * @param inputPath Uploaded file
     * @param deep Enable SMTP verification
     * @throws std::invalid_argument if a job with this id is still running
     */
    void start(const std::string& jobId, const std::string& inputPath, bool deep);

    std::optional<JobStatus> getStatus(const std::string& jobId) const;

    /**
     * @brief First report file (by name) in the job's output folder
     * @return std::nullopt if the folder is missing or holds no file
     */
    std::optional<std::filesystem::path> findReport(const std::string& jobId) const;

    std::filesystem::path jobOutputDir(const std::string& jobId) const;

    /// @brief Block until every started job has finished
    void waitAll();

    /// @brief Job threads not joined yet (running or finished since the last start())
    size_t threadCount() const;

private:
    void runJob(const std::string& jobId, const std::string& inputPath, bool deep);
    void markFailed(const std::string& jobId, const std::string& message);
    /// Called with mutex_ held once a job leaves RUNNING
    void retireLocked(const std::string& jobId);
    void reapFinishedThreads();

    services::VerificationService* service_;
    std::filesystem::path outputRoot_;
    int workers_;
    size_t retainedJobs_;

    mutable std::mutex mutex_;
    std::map<std::string, JobStatus> jobs_;
    std::deque<std::string> finishedJobs_;      // Oldest first

    mutable std::mutex threadsMutex_;
    std::map<std::string, std::thread> threads_;
    std::vector<std::string> exitedThreads_;    // Ready to join
};

} // namespace api
