#include "hosts.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <netdb.h>
#include <sys/socket.h>

#include <memory>
#include <set>
#include <stdexcept>

namespace {
    struct Host {
        std::string name;    ///< Name used for lookups, this machine's name for loopback
        std::string literal; ///< Normalized address if the host is an address we look at directly
        bool isIp = false;
    };

    Host classify(const std::string& host, const std::string& localName)
    {
        Host result;
        result.name = host;

        Util::IpAddress ip;
        if (Util::parseIP(host, ip)) {
            if (!localName.empty() && (Util::isLoopback(ip) || Util::isSiteLocal(ip))) {
                result.name = localName;
            } else {
                result.isIp = true;
                result.literal = Util::ipToString(ip);
            }
        } else if (host == "localhost" && !localName.empty()) {
            result.name = localName;
        }
        return result;
    }

    void append(std::vector<std::string>& to, const std::vector<std::string>& from)
    {
        to.insert(to.end(), from.begin(), from.end());
    }
};

HostMatcher::HostMatcher(DnsClient& dns, LocalAddresses& local)
    : m_dns(dns)
    , m_local(local)
{
}

std::string HostMatcher::hostname()
{
    return Util::getHostName();
}

std::string HostMatcher::nameToIp(const std::string& name, bool preferIpv6)
{
    struct addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    auto err = ::getaddrinfo(name.c_str(), nullptr, &hints, &res);
    if (err != 0) {
        throw std::runtime_error(gai_strerror(err));
    }
    std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> guard(res, freeaddrinfo);

    std::string ipv4, ipv6;
    for (auto ai = res; ai != nullptr; ai = ai->ai_next) {
        char buf[NI_MAXHOST] = "";
        if (::getnameinfo(ai->ai_addr, ai->ai_addrlen, buf, sizeof(buf), nullptr, 0, NI_NUMERICHOST) != 0) {
            continue;
        }
        if (ai->ai_family == AF_INET6) {
            ipv6 = buf;
            if (preferIpv6) {
                return ipv6;
            }
        } else if (ai->ai_family == AF_INET) {
            ipv4 = buf;
        }
    }
    return ipv4.empty() ? ipv6 : ipv4;
}

bool HostMatcher::hostsEqual(const std::string& host1, const std::string& host2, const std::string& cacheFile,
                             bool skipFallback, const std::string& externalUrl)
{
    if (host1 == host2) {
        return true;
    }

    // Check whether the hosts resolve to the same IP, localhost is this machine
    // Without a hostname of our own, loopback is compared like any other address
    auto localName = hostname();
    auto first = classify(host1, localName);
    auto second = classify(host2, localName);

    std::vector<std::string> ips1;
    bool hasIpv6 = false;
    if (first.isIp) {
        ips1.push_back(first.literal);
    } else {
        append(ips1, m_dns.lookup(first.name, "A", "IN", true));
        auto aaaa = m_dns.lookup(first.name, "AAAA", "IN", true);
        if (!aaaa.empty()) {
            append(ips1, aaaa);
            hasIpv6 = true;
        }
    }
    if (!localName.empty() && first.name == localName) {
        append(ips1, m_local.addresses(cacheFile, externalUrl, true));
    }

    std::vector<std::string> ips2;
    if (second.isIp) {
        ips2.push_back(second.literal);
    } else {
        append(ips2, m_dns.lookup(second.name, "A", "IN", true));
        // Without AAAA records for host1 there is nothing to match them against
        if (hasIpv6) {
            append(ips2, m_dns.lookup(second.name, "AAAA", "IN", true));
        }
    }
    if (!localName.empty() && second.name == localName) {
        append(ips2, m_local.addresses(cacheFile, externalUrl, true));
    }

    std::set<std::string> set1(ips1.begin(), ips1.end());
    for (auto& ip: ips2) {
        if (set1.count(ip) > 0) {
            LOG_DEBUG(host1, " and ", host2, " share address ", ip);
            return true;
        }
    }

    if (skipFallback) {
        return false;
    }

    try {
        auto ip1 = first.isIp ? first.literal : nameToIp(first.name);
        auto ip2 = second.isIp ? second.literal : nameToIp(second.name);
        return !ip1.empty() && ip1 == ip2;
    } catch (std::runtime_error& e) {
        LOG_DEBUG("Failed to resolve ", host1, " or ", host2, ": ", e.what());
        return false;
    }
}
