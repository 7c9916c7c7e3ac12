/**
 * @file dnscache.hpp
 * @brief Memoizing DNS lookups for short-lived processes.
 */

#pragma once

#include "logging.hpp"
#include "resolver.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <tuple>
#include <vector>

/**
 * @class DnsCache
 * @brief Provides DNS lookups that remember both answers and failures.
 *
 * The owning process is expected to be short-lived, so nothing is ever
 * evicted: once a query succeeded or failed, the same query returns the
 * same result for the lifetime of the object without touching the network.
 * Failures are cached too, because they are often slow to generate.
 *
 * Not thread-safe.
 */
class DnsCache {
    public:
        /**
         * @typedef QueryKey
         * @brief (question, type, class), compared verbatim with no case or
         *        trailing dot normalization.
         */
        typedef std::tuple<std::string, uint16_t, uint16_t> QueryKey;

        static constexpr unsigned DEFAULT_TIMEOUT = 10; ///< Seconds, for the complete query.

    private:
        std::shared_ptr<Resolver> m_resolver;
        unsigned m_timeout;
        Log::Level m_timeoutLogLevel = Log::Level::Info;

        std::map<QueryKey, DnsResponse> m_replies;
        std::map<QueryKey, std::vector<std::string>> m_failures;
        std::map<std::string, std::vector<std::string>> m_nsCache;
        std::set<std::string> m_nsFailures;

        void logTimeout(const std::string& question, const std::string& qtype);

        /**
         * @brief Asks the parent zone's nameserver for the NS records of domain.
         *
         * @param domain Domain whose NS query was answered with a CNAME.
         * @param timeout Lifetime of the direct query, 0 for the default.
         * @param nameservers Receives the additional section owner names.
         * @return bool False if any step of the chase failed.
         */
        bool chaseParentNs(const std::string& domain, unsigned timeout, std::vector<std::string>& nameservers);

    public:
        /**
         * @brief Constructs a DnsCache.
         *
         * @param resolver Upstream name-resolution primitive.
         * @param timeout Default lifetime of a query in seconds.
         */
        explicit DnsCache(const std::shared_ptr<Resolver>& resolver, unsigned timeout = DEFAULT_TIMEOUT);

        /**
         * @brief Selects the level at which timeouts are logged.
         *
         * Timeouts are interesting because the next run of the process may
         * well get an answer, default is Info.
         */
        void setTimeoutLogLevel(Log::Level lvl) { m_timeoutLogLevel = lvl; }

        unsigned getTimeout() const { return m_timeout; }

        /**
         * @brief Does a lookup, or returns the remembered result.
         *
         * Failures (domain not found, no answer, timeout, malformed response)
         * yield an empty result and are never retried.
         *
         * @param question Hostname or IP to query.
         * @param qtype Record type mnemonic, e.g. "A", "TXT", "PTR".
         * @param qclass Record class mnemonic.
         * @param exact When true, return values of every answer record set
         *              matching qtype and qclass. Otherwise return values of
         *              the first answer record set, whatever its type.
         * @param timeout Lifetime of the query in seconds, 0 for the default.
         * @return std::vector<std::string> Record values in response order.
         * @throw std::invalid_argument if qtype or qclass is unknown.
         */
        std::vector<std::string> lookup(const std::string& question, const std::string& qtype = "A",
                                        const std::string& qclass = "IN", bool exact = false, unsigned timeout = 0);

        /**
         * @brief Like lookup(domain, "NS"), but follows a CNAME once.
         *
         * When the domain is a CNAME, the NS records are requested directly
         * from one of the parent zone's nameservers and the names from its
         * additional section are returned. Only a completely successful
         * resolution is remembered; on failure the names gathered so far are
         * returned.
         *
         * @param domain Domain to get nameservers for.
         * @param timeout Lifetime of each query in seconds, 0 for the default.
         * @return std::vector<std::string> Nameserver names.
         */
        std::vector<std::string> getNs(const std::string& domain, unsigned timeout = 0);
};
