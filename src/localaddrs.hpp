/**
 * @file localaddrs.hpp
 * @brief Discovery of the IP addresses this machine is using.
 */

#pragma once

#include <string>
#include <vector>

/**
 * @class LocalAddresses
 * @brief Enumerates the addresses of this machine, with a file based cache.
 *
 * Enumeration inspects all network interfaces and optionally asks an HTTP
 * service which address our requests come from. Results are stored in a
 * cache file that may be shared by processes running as different users,
 * so a newly created cache file is made group writable.
 */
class LocalAddresses {
    protected:
        std::string m_cacheOwner;

        /**
         * @brief Lists addresses of all interfaces.
         *
         * IPv4 addresses except 127.0.0.1 and IPv6 addresses of global scope.
         */
        virtual std::vector<std::string> interfaceAddresses();

        /**
         * @brief Retrieves our address as seen by an external HTTP service.
         *
         * @param url Service returning the client address as the response body.
         * @return std::string Response body without surrounding whitespace.
         * @throw std::runtime_error when the request fails.
         */
        virtual std::string fetchExternal(const std::string& url);

        bool readCache(const std::string& path, std::vector<std::string>& ips);
        void writeCache(const std::string& path, const std::vector<std::string>& ips);

    public:
        static constexpr long CACHE_MAX_AGE = 60 * 60 * 24; ///< Seconds before the cache file is stale.
        static constexpr long EXTERNAL_TIMEOUT = 5;         ///< Seconds allowed for the external request.

        /**
         * @param cacheOwner User whose primary group gets access to a newly created cache file.
         */
        explicit LocalAddresses(const std::string& cacheOwner = "Debian-exim");
        virtual ~LocalAddresses() = default;

        /**
         * @brief Gets all the IP addresses in use on this machine.
         *
         * @param cacheFile Path of the cache file, rewritten after every enumeration.
         * @param externalUrl When not empty, also add the address reported by this URL.
         * @param useCached Use the cache file if it is younger than CACHE_MAX_AGE.
         * @return std::vector<std::string> Sorted addresses without duplicates.
         */
        std::vector<std::string> addresses(const std::string& cacheFile, const std::string& externalUrl = "",
                                           bool useCached = false);
};
