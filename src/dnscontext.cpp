#include "dnscontext.hpp"

DnsContext::DnsContext(const Config& config)
    : m_resolver(std::make_shared<LibResolver>(config.dns_server))
    , m_cache(m_resolver, config.dns_timeout)
    , m_combined(m_cache, CombinedLists::load(config.combined_lists))
{
    m_cache.setTimeoutLogLevel(config.dns_timeout_log_level);
}

DnsContext::DnsContext(const std::shared_ptr<Resolver>& resolver, const CombinedLists& lists, unsigned timeout)
    : m_resolver(resolver)
    , m_cache(m_resolver, timeout)
    , m_combined(m_cache, lists)
{
}

std::vector<std::string> DnsClient::lookup(const std::string& question, const std::string& qtype,
                                           const std::string& qclass, bool exact)
{
    return m_context.combined().lookup(question, qtype, qclass, exact, m_timeout);
}

std::vector<std::string> DnsClient::getNs(const std::string& domain)
{
    return m_context.combined().getNs(domain, m_timeout);
}
