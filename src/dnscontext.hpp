/**
 * @file dnscontext.hpp
 * @brief One resolver, cache and combined list front end per application.
 */

#pragma once

#include "combined.hpp"
#include "config.hpp"
#include "dnscache.hpp"
#include "resolver.hpp"

#include <memory>
#include <string>
#include <vector>

/**
 * @class DnsContext
 * @brief Owns the DNS state shared by all parts of an application.
 *
 * Create one instance at startup and hand it to everything doing lookups, so
 * that all of them profit from the same cache. The context is not
 * synchronized, use one per thread or guard it externally.
 */
class DnsContext {
    private:
        std::shared_ptr<Resolver> m_resolver;
        DnsCache m_cache;
        CombinedDnsCache m_combined;

    public:
        /**
         * @brief Builds the context from the application configuration.
         *
         * @param config Nameserver, timeout and combined lists settings.
         * @throw std::invalid_argument if the configured nameserver is invalid.
         * @throw std::runtime_error if the resolver can not be initialized.
         */
        explicit DnsContext(const Config& config);

        /**
         * @brief Builds the context around an existing resolver.
         */
        DnsContext(const std::shared_ptr<Resolver>& resolver, const CombinedLists& lists,
                   unsigned timeout = DnsCache::DEFAULT_TIMEOUT);

        DnsContext(const DnsContext&) = delete;
        DnsContext& operator=(const DnsContext&) = delete;

        DnsCache& cache() { return m_cache; }
        CombinedDnsCache& combined() { return m_combined; }
};

/**
 * @class DnsClient
 * @brief Lightweight handle through which a module does its lookups.
 *
 * Each module may use its own timeout. The timeout travels with every call,
 * so handles with different timeouts can share one context.
 */
class DnsClient {
    private:
        DnsContext& m_context;
        unsigned m_timeout;

    public:
        explicit DnsClient(DnsContext& context, unsigned timeout = DnsCache::DEFAULT_TIMEOUT)
            : m_context(context)
            , m_timeout(timeout)
        {}

        unsigned getTimeout() const { return m_timeout; }

        /** @brief Like CombinedDnsCache::lookup() with this handle's timeout. */
        std::vector<std::string> lookup(const std::string& question, const std::string& qtype = "A",
                                        const std::string& qclass = "IN", bool exact = false);

        /** @brief Like CombinedDnsCache::getNs() with this handle's timeout. */
        std::vector<std::string> getNs(const std::string& domain);
};
