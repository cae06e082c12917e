#pragma once

/**
 * @file service_container.h
 * @brief Centralized service container for dependency management
 *
 * Owns the domain policy, DNS resolver, SMTP prober, cache connection pool,
 * repositories and the verification service. Provides non-owning pointer
 * accessors for dependency injection.
 *
 * @date 2026-10-06
 */

#include <memory>

struct AppConfig;

// Forward declarations - Infrastructure
namespace common {
    class IDbConnectionPool;
    class IQueryExecutor;
}

namespace everify::verification {
    class DomainPolicy;
    class MxResolver;
    class SmtpProber;
}

// Forward declarations - Repositories
namespace repositories {
    class VerificationCacheRepository;
}

// Forward declarations - Adapters
namespace adapters {
    class CacheResultProvider;
}

// Forward declarations - Services
namespace services {
    class VerificationService;
}

namespace infrastructure {

/**
 * @brief Centralized service container managing all application dependencies
 *
 * Initialization order:
 * 1. Domain policy (built-in list + optional file)
 * 2. MX resolver and SMTP prober
 * 3. Cache connection pool + Query Executor + repository (optional)
 * 4. Verification service
 *
 * A cache that cannot be opened is logged and disabled; verification
 * proceeds without it.
 */
class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    // Non-copyable, non-movable
    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     * @param config Application configuration
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const AppConfig& config);

    /**
     * @brief Release all resources (called automatically by destructor)
     */
    void shutdown();

    /// @brief True when the cache was opened successfully
    bool cacheAvailable() const;

    // --- Infrastructure Accessors ---
    common::IDbConnectionPool* dbPool() const;
    common::IQueryExecutor* queryExecutor() const;
    everify::verification::DomainPolicy* domainPolicy() const;
    everify::verification::MxResolver* mxResolver() const;
    everify::verification::SmtpProber* smtpProber() const;

    // --- Repository / Adapter Accessors ---
    repositories::VerificationCacheRepository* cacheRepository() const;
    adapters::CacheResultProvider* cacheProvider() const;

    // --- Service Accessors ---
    services::VerificationService* verificationService() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    void initializeCache(const AppConfig& config);
};

} // namespace infrastructure
