/**
 * @file resolver.hpp
 * @brief Name-resolution primitive and the typed reply it produces.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @struct DnsRecordSet
 * @brief All records of one section sharing owner name, type and class.
 */
struct DnsRecordSet {
    std::string name;                ///< Absolute owner name, with trailing dot.
    uint16_t type = 0;               ///< Record type (ns_t_*).
    uint16_t rclass = 0;             ///< Record class (ns_c_*).
    std::vector<std::string> values; ///< Record data in presentation format, response order.
};

/**
 * @struct DnsResponse
 * @brief Parsed sections of a DNS response that callers are interested in.
 */
struct DnsResponse {
    std::vector<DnsRecordSet> answer;
    std::vector<DnsRecordSet> additional;
};

/**
 * @struct DnsReply
 * @brief Result of a single upstream query.
 *
 * Every expected failure is reported through the outcome, never thrown.
 */
struct DnsReply {
    enum class Outcome {
        Success,       ///< Response parsed, answer section may be empty for NS queries.
        NotFound,      ///< NXDOMAIN.
        NoAnswer,      ///< NOERROR without answer records.
        NoNameservers, ///< No server could answer (SERVFAIL, REFUSED, no usable server).
        Timeout,       ///< Lifetime expired.
        Malformed,     ///< Response could not be parsed.
    };

    Outcome outcome = Outcome::Success;
    DnsResponse response;
    std::string error; ///< Human readable reason for logging, empty on success.

    bool ok() const { return outcome == Outcome::Success; }
};

/**
 * @class MalformedResponse
 * @brief Thrown by the wire parser when a response violates the DNS format.
 */
class MalformedResponse : public std::runtime_error {
    public:
        explicit MalformedResponse(const std::string &message)
            : std::runtime_error(message) {};
};

/**
 * @class Resolver
 * @brief Abstract name-resolution primitive.
 */
class Resolver {
    public:
        virtual ~Resolver() = default;

        /**
         * @brief Sends one query and waits for the reply.
         *
         * @param question Name to query, relative names are not searched.
         * @param qtype Record type (ns_t_*).
         * @param qclass Record class (ns_c_*).
         * @param lifetime Overall time budget for the query in seconds.
         * @param nameservers IP addresses to query instead of the configured ones.
         * @return DnsReply Outcome and, on success, the parsed response.
         */
        virtual DnsReply query(const std::string& question, uint16_t qtype, uint16_t qclass,
                               unsigned lifetime, const std::vector<std::string>& nameservers = {}) = 0;

        /**
         * @brief Converts a record type mnemonic ("A", "MX", "TYPE65") to its value.
         * @throw std::invalid_argument for unknown mnemonics.
         */
        static uint16_t typeFromText(const std::string& text);

        /**
         * @brief Converts a record class mnemonic ("IN", "CH", "CLASS3") to its value.
         * @throw std::invalid_argument for unknown mnemonics.
         */
        static uint16_t classFromText(const std::string& text);

        /** @brief Returns the mnemonic of a record type, or "TYPE<n>". */
        static std::string typeToText(uint16_t type);

        static const char* outcomeToText(DnsReply::Outcome outcome);
};

/**
 * @class LibResolver
 * @brief Resolver backed by the system stub resolver (libresolv).
 *
 * Every query uses a private resolver state, initialized from
 * /etc/resolv.conf and optionally overridden with explicit nameservers.
 * Only IPv4 nameservers can be given explicitly.
 */
class LibResolver : public Resolver {
    private:
        std::string m_nameserver; ///< Default nameserver override, empty to use resolv.conf.

    public:
        /**
         * @brief Constructs a LibResolver.
         *
         * @param nameserver IPv4 address of the server to use for all queries,
         *                   empty to use the system configuration.
         * @throw std::invalid_argument if nameserver is not an IPv4 address.
         * @throw std::runtime_error if the resolver can not be initialized.
         */
        explicit LibResolver(const std::string& nameserver = "");

        DnsReply query(const std::string& question, uint16_t qtype, uint16_t qclass,
                       unsigned lifetime, const std::vector<std::string>& nameservers = {}) override;

        /**
         * @brief Parses answer and additional sections of a wire-format response.
         *
         * @param msg Response buffer.
         * @param len Number of valid bytes in msg.
         * @return DnsResponse Record sets in the order they first appear.
         * @throw MalformedResponse when the message can not be parsed.
         */
        static DnsResponse parseResponse(const unsigned char* msg, int len);

        /**
         * @brief Maps a failed res_nquery() to an outcome.
         *
         * @param herrno h_errno of the resolver state.
         * @param err errno after the query, ETIMEDOUT tells a timeout from a SERVFAIL.
         */
        static DnsReply::Outcome outcomeFromError(int herrno, int err);

        /** @brief True if an answer record set has the requested type and class. */
        static bool answers(const DnsResponse& response, uint16_t qtype, uint16_t qclass);

        /**
         * @struct QueryBudget
         * @brief Resolver state settings keeping a query within its lifetime.
         */
        struct QueryBudget {
            int nscount = 1; ///< Number of configured servers to ask.
            int retrans = 1; ///< Base wait for a reply in seconds.
            int retry = 1;   ///< Rounds over all servers.
        };

        /**
         * @brief Chooses settings for which retry * roundSeconds() does not exceed lifetime.
         *
         * Servers are dropped from the end of the list until one round fits,
         * at least one server is always asked for at least one second.
         */
        static QueryBudget queryBudget(unsigned lifetime, int nscount);

        /** @brief Seconds glibc waits in one round over nscount silent servers. */
        static unsigned roundSeconds(int retrans, int nscount);
};
