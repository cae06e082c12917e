/** @file verification_cache_repository.cpp
 *  @brief VerificationCacheRepository implementation
 */

#include "verification_cache_repository.h"
#include "exception/exceptions.h"
#include <everify/utils/time_utils.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

using everify::verification::VerificationResult;

namespace repositories {

namespace {

constexpr int64_t SECONDS_PER_DAY = 86400;

const char* SELECT_COLUMNS =
    "SELECT email, verdict, reason, active_status, mx_domain, last_checked FROM cache ";

} // anonymous namespace

VerificationCacheRepository::VerificationCacheRepository(common::IQueryExecutor* executor, int ttlDays)
    : executor_(executor), ttlDays_(ttlDays)
{
    if (!executor_) {
        throw std::invalid_argument("VerificationCacheRepository: executor cannot be nullptr");
    }
    if (ttlDays_ < 0) {
        throw std::invalid_argument("VerificationCacheRepository: ttlDays cannot be negative");
    }
    spdlog::debug("[VerificationCacheRepository] Initialized (DB type: {}, TTL: {} days)",
                  executor_->getDatabaseType(), ttlDays_);
}

VerificationCacheRepository::~VerificationCacheRepository() {}

void VerificationCacheRepository::ensureSchema() {
    executor_->executeCommand(
        "CREATE TABLE IF NOT EXISTS cache ("
        "  email TEXT PRIMARY KEY,"
        "  verdict TEXT NOT NULL,"
        "  reason TEXT NOT NULL,"
        "  active_status TEXT NOT NULL,"
        "  mx_domain TEXT,"
        "  last_checked BIGINT NOT NULL"
        ")");
    executor_->executeCommand(
        "CREATE INDEX IF NOT EXISTS idx_cache_last_checked ON cache (last_checked)");
    spdlog::debug("[VerificationCacheRepository] Schema ready");
}

std::optional<VerificationResult> VerificationCacheRepository::find(const std::string& email) {
    std::string query = std::string(SELECT_COLUMNS) + "WHERE email = $1";
    std::vector<std::string> params = { email };

    if (ttlDays_ > 0) {
        query += " AND last_checked >= $2";
        params.push_back(std::to_string(expiryCutoff()));
    }

    Json::Value rows = executor_->executeQuery(query, params);
    if (!rows.isArray() || rows.empty()) {
        return std::nullopt;
    }
    return rowToResult(rows[0]);
}

void VerificationCacheRepository::save(const VerificationResult& result) {
    const char* query =
        "INSERT INTO cache (email, verdict, reason, active_status, mx_domain, last_checked) "
        "VALUES ($1, $2, $3, $4, $5, $6) "
        "ON CONFLICT (email) DO UPDATE SET "
        "  verdict = excluded.verdict,"
        "  reason = excluded.reason,"
        "  active_status = excluded.active_status,"
        "  mx_domain = excluded.mx_domain,"
        "  last_checked = excluded.last_checked";

    int64_t checkedAt = result.checkedAt > 0 ? result.checkedAt : everify::utils::nowUnix();

    std::vector<std::string> params = {
        result.email,
        everify::verification::verdictToString(result.verdict),
        everify::verification::reasonToString(result.reason),
        everify::verification::activeStatusToString(result.activeStatus),
        result.mxDomain,
        std::to_string(checkedAt)
    };

    executor_->executeCommand(query, params);
}

int VerificationCacheRepository::purgeExpired() {
    if (ttlDays_ == 0) {
        return 0;
    }

    int deleted = executor_->executeCommand(
        "DELETE FROM cache WHERE last_checked < $1",
        { std::to_string(expiryCutoff()) });

    if (deleted > 0) {
        spdlog::info("[VerificationCacheRepository] Purged {} expired entries", deleted);
    }
    return deleted;
}

int VerificationCacheRepository::count() {
    Json::Value value = executor_->executeScalar("SELECT COUNT(*) FROM cache");
    return static_cast<int>(toInt64(value));
}

// --- Private ---

int64_t VerificationCacheRepository::expiryCutoff() const {
    return everify::utils::nowUnix() - static_cast<int64_t>(ttlDays_) * SECONDS_PER_DAY;
}

std::optional<VerificationResult> VerificationCacheRepository::rowToResult(const Json::Value& row) {
    std::string email = row.get("email", "").asString();
    auto verdict = everify::verification::parseVerdict(row.get("verdict", "").asString());
    auto reason = everify::verification::parseReason(row.get("reason", "").asString());
    auto active = everify::verification::parseActiveStatus(row.get("active_status", "").asString());

    if (!verdict || !reason || !active) {
        spdlog::warn("[VerificationCacheRepository] Ignoring unreadable cache row for {}", email);
        return std::nullopt;
    }

    VerificationResult result;
    result.email = email;
    result.verdict = *verdict;
    result.reason = *reason;
    result.activeStatus = *active;
    result.mxDomain = row["mx_domain"].isNull() ? "" : row["mx_domain"].asString();
    result.checkedAt = toInt64(row["last_checked"]);
    result.fromCache = true;
    return result;
}

int64_t VerificationCacheRepository::toInt64(const Json::Value& val) {
    if (val.isIntegral()) {
        return val.asInt64();
    }
    if (val.isString()) {
        try {
            return std::stoll(val.asString());
        } catch (const std::exception&) {
            throw common::DatabaseException("non-numeric value: " + val.asString());
        }
    }
    if (val.isDouble()) {
        return static_cast<int64_t>(val.asDouble());
    }
    return 0;
}

} // namespace repositories
