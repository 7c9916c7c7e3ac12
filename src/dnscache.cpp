#include "dnscache.hpp"

#include <arpa/nameser.h>

#include <random>

DnsCache::DnsCache(const std::shared_ptr<Resolver>& resolver, unsigned timeout)
    : m_resolver(resolver)
    , m_timeout(timeout > 0 ? timeout : DEFAULT_TIMEOUT)
{
}

void DnsCache::logTimeout(const std::string& question, const std::string& qtype)
{
    Log::write(m_timeoutLogLevel, question, " ", qtype, " lookup timed out.");
}

std::vector<std::string> DnsCache::lookup(const std::string& question, const std::string& qtype,
                                          const std::string& qclass, bool exact, unsigned timeout)
{
    auto rdtype = Resolver::typeFromText(qtype);
    auto rdclass = Resolver::classFromText(qclass);
    QueryKey key(question, rdtype, rdclass);

    auto failure = m_failures.find(key);
    if (failure != m_failures.end()) {
        return failure->second;
    }

    auto it = m_replies.find(key);
    if (it == m_replies.end()) {
        auto reply = m_resolver->query(question, rdtype, rdclass, timeout > 0 ? timeout : m_timeout);
        switch (reply.outcome) {
            case DnsReply::Outcome::Success:
                break;

            case DnsReply::Outcome::NotFound:
                // A valid answer, not an error condition
                m_failures[key] = {};
                return {};

            case DnsReply::Outcome::Timeout:
                // May well succeed next time this process runs
                logTimeout(question, qtype);
                m_failures[key] = {};
                return {};

            case DnsReply::Outcome::NoAnswer:
            case DnsReply::Outcome::NoNameservers:
                if (qtype != "MX" && qtype != "AAAA" && qtype != "TXT") {
                    // Usually a nameserver misconfiguration
                    LOG_DEBUG(question, " ", qtype, " lookup failed: ", reply.error);
                }
                m_failures[key] = {};
                return {};

            case DnsReply::Outcome::Malformed:
                LOG_WARN(question, " ", qtype, " lookup failed: ", reply.error);
                m_failures[key] = {};
                return {};
        }
        it = m_replies.emplace(key, std::move(reply.response)).first;
    }

    const auto& answer = it->second.answer;
    std::vector<std::string> result;
    if (exact) {
        for (auto& set: answer) {
            if (set.type == rdtype && set.rclass == rdclass) {
                result.insert(result.end(), set.values.begin(), set.values.end());
            }
        }
    } else if (!answer.empty()) {
        // First record set, even if it is a CNAME rather than what was asked for
        result = answer.front().values;
    }
    return result;
}

bool DnsCache::chaseParentNs(const std::string& domain, unsigned timeout, std::vector<std::string>& nameservers)
{
    auto pos = domain.find('.');
    if (pos == std::string::npos || pos + 1 >= domain.size()) {
        LOG_DEBUG(domain, " NS lookup failed.");
        return false;
    }
    auto parent = domain.substr(pos + 1);
    if (parent.back() != '.') {
        parent += '.';
    }

    auto parentNs = lookup(parent, "NS", "IN", false, timeout);
    if (parentNs.empty()) {
        LOG_DEBUG(domain, " NS lookup failed.");
        return false;
    }

    static std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, parentNs.size() - 1);
    auto parentNsIps = lookup(parentNs[pick(generator)], "A", "IN", false, timeout);
    if (parentNsIps.empty()) {
        LOG_DEBUG(domain, " NS lookup has no parent.");
        return false;
    }

    auto reply = m_resolver->query(domain, ns_t_ns, ns_c_in, timeout > 0 ? timeout : m_timeout, parentNsIps);
    if (reply.outcome == DnsReply::Outcome::Timeout) {
        logTimeout(domain, "NS parent");
        return false;
    } else if (!reply.ok()) {
        LOG_DEBUG(domain, " NS parent lookup failed: ", reply.error);
        return false;
    }

    for (auto& set: reply.response.additional) {
        nameservers.push_back(set.name);
    }
    return true;
}

std::vector<std::string> DnsCache::getNs(const std::string& domain, unsigned timeout)
{
    if (m_nsFailures.count(domain) > 0) {
        return {};
    }

    auto cached = m_nsCache.find(domain);
    if (cached != m_nsCache.end() && !cached->second.empty()) {
        return cached->second;
    }

    std::vector<std::string> nameservers;
    auto reply = m_resolver->query(domain, ns_t_ns, ns_c_in, timeout > 0 ? timeout : m_timeout);
    switch (reply.outcome) {
        case DnsReply::Outcome::Success:
        case DnsReply::Outcome::NoAnswer:
            break;

        case DnsReply::Outcome::NotFound:
            m_nsFailures.insert(domain);
            return nameservers;

        case DnsReply::Outcome::Timeout:
            logTimeout(domain, "NS");
            return nameservers;

        default:
            LOG_DEBUG(domain, " NS lookup failed: ", reply.error);
            return nameservers;
    }

    for (auto& set: reply.response.answer) {
        if (set.type == ns_t_cname) {
            // Only one level of indirection is followed
            if (!chaseParentNs(domain, timeout, nameservers)) {
                return nameservers;
            }
        } else {
            nameservers.insert(nameservers.end(), set.values.begin(), set.values.end());
        }
    }

    m_nsCache[domain] = nameservers;
    return nameservers;
}
