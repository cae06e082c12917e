/**
 * @file service_container.cpp
 * @brief ServiceContainer implementation - centralized dependency initialization
 *
 * @date 2026-10-06
 */

#include "service_container.h"
#include "app_config.h"

// Infrastructure (shared libraries)
#include "db_connection_interface.h"
#include "db_connection_pool_factory.h"
#include "i_query_executor.h"
#include "exception/exceptions.h"
#include <everify/verification/domain_policy.h>
#include <everify/verification/mx_resolver.h>
#include <everify/verification/smtp_client.h>

// Repositories / Adapters / Services
#include "../repositories/verification_cache_repository.h"
#include "../adapters/cache_result_provider.h"
#include "../services/verification_service.h"

#include <spdlog/spdlog.h>

namespace infrastructure {

struct ServiceContainer::Impl {
    // Engine components
    std::unique_ptr<everify::verification::DomainPolicy> domainPolicy;
    std::unique_ptr<everify::verification::MxResolver> mxResolver;
    std::unique_ptr<everify::verification::SmtpProber> smtpProber;

    // Cache
    std::shared_ptr<common::IDbConnectionPool> dbPool;
    std::unique_ptr<common::IQueryExecutor> queryExecutor;
    std::unique_ptr<repositories::VerificationCacheRepository> cacheRepository;
    std::unique_ptr<adapters::CacheResultProvider> cacheProvider;

    // Services
    std::unique_ptr<services::VerificationService> verificationService;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

void ServiceContainer::shutdown() {
    if (!impl_) return;

    // Release in reverse order
    impl_->verificationService.reset();

    impl_->cacheProvider.reset();
    impl_->cacheRepository.reset();
    impl_->queryExecutor.reset();
    if (impl_->dbPool) {
        impl_->dbPool->shutdown();
        impl_->dbPool.reset();
    }

    impl_->smtpProber.reset();
    impl_->mxResolver.reset();
    impl_->domainPolicy.reset();
}

bool ServiceContainer::initialize(const AppConfig& config) {
    try {
        // Step 1: Disposable domain policy
        impl_->domainPolicy = std::make_unique<everify::verification::DomainPolicy>();
        if (!config.disposableDomainsFile.empty()) {
            size_t added = impl_->domainPolicy->loadFromFile(config.disposableDomainsFile);
            spdlog::info("[ServiceContainer] Loaded {} extra disposable domains from {}",
                         added, config.disposableDomainsFile);
        }

        // Step 2: DNS and SMTP (the SMTP client only runs for deep verification)
        impl_->mxResolver = std::make_unique<everify::verification::MxResolver>(config.toMxResolverOptions());
        impl_->smtpProber = std::make_unique<everify::verification::SmtpProber>(config.toSmtpProbeOptions(true));

        // Step 3: Cache (optional)
        if (config.cacheEnabled) {
            initializeCache(config);
        } else {
            spdlog::info("[ServiceContainer] Verification cache disabled");
        }

        // Step 4: Verification service
        services::VerificationServiceOptions options;
        options.mxWorkers = config.mxWorkers;
        impl_->verificationService = std::make_unique<services::VerificationService>(
            impl_->mxResolver.get(),
            impl_->smtpProber.get(),
            impl_->cacheProvider.get(),
            impl_->domainPolicy.get(),
            options);

        spdlog::info("[ServiceContainer] Initialized (cache: {}, disposable domains: {})",
                     cacheAvailable() ? impl_->queryExecutor->getDatabaseType() : "off",
                     impl_->domainPolicy->size());
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[ServiceContainer] Initialization failed: {}", e.what());
        return false;
    }
}

void ServiceContainer::initializeCache(const AppConfig& config) {
    try {
        common::DbPoolConfig poolConfig = config.toDbPoolConfig();
        auto pool = common::DbConnectionPoolFactory::create(poolConfig);
        if (!pool->initialize()) {
            throw common::DatabaseException("cannot open cache " + pool->describe());
        }

        auto executor = common::createQueryExecutor(pool.get());
        auto repository = std::make_unique<repositories::VerificationCacheRepository>(
            executor.get(), config.cacheTtlDays);
        repository->ensureSchema();
        repository->purgeExpired();

        impl_->dbPool = pool;
        impl_->queryExecutor = std::move(executor);
        impl_->cacheRepository = std::move(repository);
        impl_->cacheProvider = std::make_unique<adapters::CacheResultProvider>(impl_->cacheRepository.get());

        spdlog::info("[ServiceContainer] Cache ready ({}, {} entries, TTL {} days)",
                     impl_->dbPool->describe(),
                     impl_->cacheRepository->count(), config.cacheTtlDays);

    } catch (const std::exception& e) {
        spdlog::warn("[ServiceContainer] Cache unavailable, continuing without it: {}", e.what());
        impl_->cacheProvider.reset();
        impl_->cacheRepository.reset();
        impl_->queryExecutor.reset();
        impl_->dbPool.reset();
    }
}

bool ServiceContainer::cacheAvailable() const {
    return impl_->cacheProvider != nullptr;
}

// --- Accessors ---

common::IDbConnectionPool* ServiceContainer::dbPool() const { return impl_->dbPool.get(); }
common::IQueryExecutor* ServiceContainer::queryExecutor() const { return impl_->queryExecutor.get(); }
everify::verification::DomainPolicy* ServiceContainer::domainPolicy() const { return impl_->domainPolicy.get(); }
everify::verification::MxResolver* ServiceContainer::mxResolver() const { return impl_->mxResolver.get(); }
everify::verification::SmtpProber* ServiceContainer::smtpProber() const { return impl_->smtpProber.get(); }

repositories::VerificationCacheRepository* ServiceContainer::cacheRepository() const {
    return impl_->cacheRepository.get();
}
adapters::CacheResultProvider* ServiceContainer::cacheProvider() const {
    return impl_->cacheProvider.get();
}

services::VerificationService* ServiceContainer::verificationService() const {
    return impl_->verificationService.get();
}

} // namespace infrastructure
