/**
 * @file hosts.hpp
 * @brief Decides whether two host names or addresses are the same machine.
 */

#pragma once

#include "dnscontext.hpp"
#include "localaddrs.hpp"

#include <string>

/**
 * @class HostMatcher
 * @brief Compares hosts by the addresses they resolve to.
 *
 * Loopback addresses and "localhost" are taken to mean this machine, whose
 * addresses come from the local interfaces rather than DNS.
 */
class HostMatcher {
    protected:
        DnsClient& m_dns;
        LocalAddresses& m_local;

        /** @brief Canonical name of this machine. */
        virtual std::string hostname();

        /**
         * @brief Resolves a name through the system resolver (getaddrinfo).
         *
         * @param name Host name to resolve.
         * @param preferIpv6 Return an IPv6 address when there is one.
         * @return std::string Address, empty if the name has no addresses.
         * @throw std::runtime_error when resolution fails.
         */
        virtual std::string nameToIp(const std::string& name, bool preferIpv6 = true);

    public:
        HostMatcher(DnsClient& dns, LocalAddresses& local);
        virtual ~HostMatcher() = default;

        /**
         * @brief Returns true if both hosts are the same physical machine.
         *
         * @param host1 Host name or literal IP address.
         * @param host2 Host name or literal IP address.
         * @param cacheFile Cache file for the local IP addresses.
         * @param skipFallback Only use DNS and local addresses, no system resolver.
         * @param externalUrl Also count the address reported by this URL as local.
         */
        bool hostsEqual(const std::string& host1, const std::string& host2, const std::string& cacheFile,
                        bool skipFallback = false, const std::string& externalUrl = "");
};
