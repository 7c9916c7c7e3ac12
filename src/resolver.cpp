#include "logging.hpp"
#include "resolver.hpp"

#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <netdb.h>
#include <netinet/in.h>
#include <resolv.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <map>

static const std::map<std::string, uint16_t> g_types = {
    { "A",      ns_t_a      },
    { "NS",     ns_t_ns     },
    { "CNAME",  ns_t_cname  },
    { "SOA",    ns_t_soa    },
    { "PTR",    ns_t_ptr    },
    { "HINFO",  ns_t_hinfo  },
    { "MX",     ns_t_mx     },
    { "TXT",    ns_t_txt    },
    { "AAAA",   ns_t_aaaa   },
    { "SRV",    ns_t_srv    },
    { "NAPTR",  ns_t_naptr  },
    { "DNAME",  ns_t_dname  },
    { "DS",     43          },
    { "DNSKEY", 48          },
    { "SPF",    99          },
    { "ANY",    ns_t_any    },
    { "CAA",    257         },
};

static const std::map<std::string, uint16_t> g_classes = {
    { "IN",   ns_c_in   },
    { "CH",   ns_c_chaos },
    { "HS",   ns_c_hs   },
    { "NONE", ns_c_none },
    { "ANY",  ns_c_any  },
};

/* Parses "<prefix><number>" generic mnemonics from RFC 3597 */
static bool parseGeneric(const std::string& text, const std::string& prefix, uint16_t& value)
{
    if (text.size() <= prefix.size() || text.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    auto digits = text.substr(prefix.size());
    if (digits.find_first_not_of("0123456789") != std::string::npos || digits.size() > 5) {
        return false;
    }
    auto tmp = std::stoul(digits);
    if (tmp > 65535) {
        return false;
    }
    value = static_cast<uint16_t>(tmp);
    return true;
}

uint16_t Resolver::typeFromText(const std::string& text)
{
    auto it = g_types.find(text);
    if (it != g_types.end()) {
        return it->second;
    }
    uint16_t value;
    if (parseGeneric(text, "TYPE", value)) {
        return value;
    }
    throw std::invalid_argument("unknown DNS record type '" + text + "'");
}

uint16_t Resolver::classFromText(const std::string& text)
{
    auto it = g_classes.find(text);
    if (it != g_classes.end()) {
        return it->second;
    }
    uint16_t value;
    if (parseGeneric(text, "CLASS", value)) {
        return value;
    }
    throw std::invalid_argument("unknown DNS record class '" + text + "'");
}

std::string Resolver::typeToText(uint16_t type)
{
    for (auto& entry: g_types) {
        if (entry.second == type) {
            return entry.first;
        }
    }
    return "TYPE" + std::to_string(type);
}

const char* Resolver::outcomeToText(DnsReply::Outcome outcome)
{
    switch (outcome) {
        case DnsReply::Outcome::Success:       return "success";
        case DnsReply::Outcome::NotFound:      return "domain not found";
        case DnsReply::Outcome::NoAnswer:      return "no answer";
        case DnsReply::Outcome::NoNameservers: return "no nameservers";
        case DnsReply::Outcome::Timeout:       return "timeout";
        default:                               return "malformed response";
    }
}

/* Releases a private resolver state */
class ResStateGuard {
    public:
        struct __res_state state;
        bool initialized = false;

        ResStateGuard()
        {
            state = {};
            initialized = (res_ninit(&state) == 0);
        }

        ~ResStateGuard()
        {
            if (initialized) {
                res_nclose(&state);
            }
        }

        ResStateGuard(const ResStateGuard&) = delete;
        ResStateGuard& operator=(const ResStateGuard&) = delete;
};

static bool toSockaddr(const std::string& ip, struct sockaddr_in& addr)
{
    addr = {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(NS_DEFAULTPORT);
    return ::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) == 1;
}

LibResolver::LibResolver(const std::string& nameserver)
    : m_nameserver(nameserver)
{
    struct sockaddr_in addr;
    if (!m_nameserver.empty() && !toSockaddr(m_nameserver, addr)) {
        throw std::invalid_argument("nameserver '" + m_nameserver + "' is not an IPv4 address");
    }

    ResStateGuard guard;
    if (!guard.initialized) {
        throw std::runtime_error("failed to initialize resolver");
    }
}

DnsReply LibResolver::query(const std::string& question, uint16_t qtype, uint16_t qclass,
                            unsigned lifetime, const std::vector<std::string>& nameservers)
{
    DnsReply reply;

    ResStateGuard guard;
    if (!guard.initialized) {
        reply.outcome = DnsReply::Outcome::NoNameservers;
        reply.error = "failed to initialize resolver";
        return reply;
    }
    auto& state = guard.state;

    auto servers = nameservers;
    if (servers.empty() && !m_nameserver.empty()) {
        servers.push_back(m_nameserver);
    }
    if (!servers.empty()) {
        int count = 0;
        for (auto& server: servers) {
            if (count == MAXNS) {
                break;
            }
            struct sockaddr_in addr;
            if (!toSockaddr(server, addr)) {
                LOG_DEBUG("Skipping nameserver ", server, " for ", question, ", not an IPv4 address");
                continue;
            }
            state.nsaddr_list[count++] = addr;
        }
        if (count == 0) {
            reply.outcome = DnsReply::Outcome::NoNameservers;
            reply.error = "no usable nameserver";
            return reply;
        }
        state.nscount = count;
    }

    auto budget = queryBudget(lifetime, state.nscount);
    state.nscount = budget.nscount;
    state.retrans = budget.retrans;
    state.retry = budget.retry;

    std::vector<unsigned char> buffer(NS_MAXMSG);
    errno = 0;
    auto len = res_nquery(&state, question.c_str(), qclass, qtype, buffer.data(), static_cast<int>(buffer.size()));
    if (len < 0) {
        reply.outcome = outcomeFromError(state.res_h_errno, errno);
        reply.error = hstrerror(state.res_h_errno);
        return reply;
    }

    try {
        reply.response = parseResponse(buffer.data(), len);
    } catch (MalformedResponse& e) {
        reply.outcome = DnsReply::Outcome::Malformed;
        reply.error = e.what();
        return reply;
    }

    // NOERROR with only a CNAME chain is no answer, unless the chain itself is wanted
    if (qtype != ns_t_cname && qtype != ns_t_any && qtype != ns_t_ns && !answers(reply.response, qtype, qclass)) {
        reply.outcome = DnsReply::Outcome::NoAnswer;
        reply.error = "no " + typeToText(qtype) + " records in answer";
    }
    return reply;
}

DnsReply::Outcome LibResolver::outcomeFromError(int herrno, int err)
{
    switch (herrno) {
        case HOST_NOT_FOUND:
            return DnsReply::Outcome::NotFound;
        case NO_DATA:
            return DnsReply::Outcome::NoAnswer;
        case TRY_AGAIN:
            // Also reported for SERVFAIL, only a silent server sets ETIMEDOUT
            return (err == ETIMEDOUT) ? DnsReply::Outcome::Timeout : DnsReply::Outcome::NoNameservers;
        default:
            return DnsReply::Outcome::NoNameservers;
    }
}

unsigned LibResolver::roundSeconds(int retrans, int nscount)
{
    // glibc send_dg() waits retrans << n, divided by nscount for all but the first server
    unsigned total = 0;
    for (int n = 0; n < nscount; n++) {
        int seconds = retrans << n;
        if (n > 0) {
            seconds /= nscount;
        }
        total += static_cast<unsigned>(std::max(seconds, 1));
    }
    return total;
}

LibResolver::QueryBudget LibResolver::queryBudget(unsigned lifetime, int nscount)
{
    QueryBudget budget;
    lifetime = std::max(lifetime, 1u);
    budget.nscount = std::max(1, std::min(nscount, MAXNS));
    budget.retrans = static_cast<int>(std::min(lifetime, 2u));

    // Servers that do not fit into the lifetime are not asked, a single one always fits
    while (budget.nscount > 1 && roundSeconds(budget.retrans, budget.nscount) > lifetime) {
        budget.nscount--;
    }
    auto round = roundSeconds(budget.retrans, budget.nscount);
    budget.retry = static_cast<int>(std::min(std::max(lifetime / round, 1u), static_cast<unsigned>(RES_MAXRETRY)));
    return budget;
}

bool LibResolver::answers(const DnsResponse& response, uint16_t qtype, uint16_t qclass)
{
    for (auto& set: response.answer) {
        if (set.type == qtype && (set.rclass == qclass || qclass == ns_c_any)) {
            return true;
        }
    }
    return false;
}

static std::string absoluteName(const char* name)
{
    std::string absolute(name);
    if (absolute.empty() || absolute.back() != '.') {
        absolute += '.';
    }
    return absolute;
}

static std::string expandName(const ns_msg& handle, const unsigned char*& rdata, const unsigned char* end)
{
    char name[NS_MAXDNAME];
    auto consumed = dn_expand(ns_msg_base(handle), ns_msg_end(handle), rdata, name, sizeof(name));
    if (consumed < 0 || rdata + consumed > end) {
        throw MalformedResponse("bad domain name in record data");
    }
    rdata += consumed;
    return absoluteName(name);
}

static uint32_t getLong(const unsigned char*& rdata, const unsigned char* end)
{
    if (end - rdata < 4) {
        throw MalformedResponse("record data too short");
    }
    uint32_t value;
    NS_GET32(value, rdata);
    return value;
}

static uint16_t getShort(const unsigned char*& rdata, const unsigned char* end)
{
    if (end - rdata < 2) {
        throw MalformedResponse("record data too short");
    }
    uint16_t value;
    NS_GET16(value, rdata);
    return value;
}

static std::string quoteCharacterString(const unsigned char* data, size_t len)
{
    std::string text = "\"";
    for (size_t i = 0; i < len; i++) {
        auto c = data[i];
        if (c == '"' || c == '\\') {
            text += '\\';
            text += static_cast<char>(c);
        } else if (c < 0x20 || c > 0x7e) {
            char escaped[8];
            snprintf(escaped, sizeof(escaped), "\\%03u", c);
            text += escaped;
        } else {
            text += static_cast<char>(c);
        }
    }
    text += '"';
    return text;
}

static std::string rdataToText(const ns_msg& handle, const ns_rr& rr)
{
    const unsigned char* rdata = ns_rr_rdata(rr);
    const unsigned char* end = rdata + ns_rr_rdlen(rr);
    if (end > ns_msg_end(handle)) {
        throw MalformedResponse("record data exceeds message");
    }

    switch (ns_rr_type(rr)) {
        case ns_t_a:
        case ns_t_aaaa: {
            int family = (ns_rr_type(rr) == ns_t_a) ? AF_INET : AF_INET6;
            size_t expected = (family == AF_INET) ? 4 : 16;
            if (static_cast<size_t>(end - rdata) != expected) {
                throw MalformedResponse("bad address length");
            }
            char ip[INET6_ADDRSTRLEN] = {0};
            ::inet_ntop(family, rdata, ip, sizeof(ip));
            return ip;
        }

        case ns_t_ns:
        case ns_t_cname:
        case ns_t_ptr:
        case ns_t_dname:
            return expandName(handle, rdata, end);

        case ns_t_mx: {
            auto preference = getShort(rdata, end);
            return std::to_string(preference) + " " + expandName(handle, rdata, end);
        }

        case ns_t_srv: {
            auto priority = getShort(rdata, end);
            auto weight = getShort(rdata, end);
            auto port = getShort(rdata, end);
            return std::to_string(priority) + " " + std::to_string(weight) + " " +
                   std::to_string(port) + " " + expandName(handle, rdata, end);
        }

        case ns_t_soa: {
            auto mname = expandName(handle, rdata, end);
            auto rname = expandName(handle, rdata, end);
            std::string text = mname + " " + rname;
            for (int i = 0; i < 5; i++) {
                text += " " + std::to_string(getLong(rdata, end));
            }
            return text;
        }

        case ns_t_txt:
        case 99: {
            std::string text;
            while (rdata < end) {
                size_t len = *rdata++;
                if (static_cast<size_t>(end - rdata) < len) {
                    throw MalformedResponse("character string exceeds record data");
                }
                if (!text.empty()) {
                    text += ' ';
                }
                text += quoteCharacterString(rdata, len);
                rdata += len;
            }
            return text;
        }

        default: {
            // RFC 3597 unknown record presentation
            std::string text = "\\# " + std::to_string(end - rdata);
            if (rdata < end) {
                text += ' ';
            }
            char hex[3];
            for (; rdata < end; rdata++) {
                snprintf(hex, sizeof(hex), "%02x", *rdata);
                text += hex;
            }
            return text;
        }
    }
}

static void parseSection(ns_msg& handle, ns_sect section, std::vector<DnsRecordSet>& sets)
{
    auto count = ns_msg_count(handle, section);
    for (int i = 0; i < count; i++) {
        ns_rr rr;
        if (ns_parserr(&handle, section, i, &rr) < 0) {
            throw MalformedResponse("failed to parse record " + std::to_string(i));
        }
        if (ns_rr_type(rr) == ns_t_opt) {
            continue;
        }

        auto name = absoluteName(ns_rr_name(rr));
        auto type = static_cast<uint16_t>(ns_rr_type(rr));
        auto rclass = static_cast<uint16_t>(ns_rr_class(rr));
        auto value = rdataToText(handle, rr);

        auto it = std::find_if(sets.begin(), sets.end(), [&](const DnsRecordSet& set) {
            return set.type == type && set.rclass == rclass && set.name == name;
        });
        if (it == sets.end()) {
            sets.push_back({ name, type, rclass, {} });
            it = sets.end() - 1;
        }
        it->values.push_back(value);
    }
}

DnsResponse LibResolver::parseResponse(const unsigned char* msg, int len)
{
    ns_msg handle;
    if (ns_initparse(msg, len, &handle) < 0) {
        throw MalformedResponse("failed to parse response header");
    }

    DnsResponse response;
    parseSection(handle, ns_s_an, response.answer);
    parseSection(handle, ns_s_ar, response.additional);
    return response;
}
