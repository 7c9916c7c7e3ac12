/**
 * @file combined.hpp
 * @brief Transparent use of combined DNSBL/URLBL zones.
 */

#pragma once

#include "dnscache.hpp"

#include <map>
#include <string>
#include <vector>

/**
 * @struct CombinedLists
 * @brief Description of the combined zones and the lists they mirror.
 *
 * Only lists that answer a plain "listed"/"not listed" are combined. DNSBL
 * and URLBL are convenient labels, whitelists may be found here as well.
 */
struct CombinedLists {
    static constexpr const char* DEFAULT_PATH = "/etc/combined_lists.json";

    std::string dnsblZone; ///< COMBINED: zone answering for all combined IP lists.
    std::string urlblZone; ///< COMBINED_URL: zone answering for all combined URL lists.
    std::map<std::string, std::string> dnsbl;        ///< COMBINED_DNSBL: list domain to answer.
    std::map<std::string, std::string> dnsblReverse; ///< COMBINED_DNSBL_REVERSE: answer to list domain.
    std::map<std::string, std::string> urlbl;        ///< COMBINED_URLBL: list domain to answer.
    std::map<std::string, std::string> urlblReverse; ///< COMBINED_URLBL_REVERSE: answer to list domain.

    /**
     * @brief Parses the JSON description.
     *
     * Missing keys keep their empty defaults. A key of the wrong type is
     * logged and left empty.
     *
     * @throw nlohmann::json::parse_error if text is not valid JSON.
     */
    static CombinedLists parse(const std::string& text);

    /**
     * @brief Loads the JSON description from a file.
     *
     * A missing or unreadable file disables combined lookups, it is not an error.
     */
    static CombinedLists load(const std::string& path = DEFAULT_PATH);
};

/**
 * @class CombinedDnsCache
 * @brief DnsCache front end that queries combined zones instead of single lists.
 *
 * Callers keep using the normal name of a list. When the list is mirrored
 * in a combined zone, the combined zone is queried instead and its answer is
 * translated back. Since DnsCache remembers the combined answer, checking
 * the same address against further lists of that zone costs nothing.
 *
 * Lists are recognized by their last four labels, e.g. list1.dnsbl.example.com.
 */
class CombinedDnsCache {
    private:
        DnsCache& m_cache;
        CombinedLists m_lists;

    public:
        static constexpr const char* LISTED = "127.0.0.2"; ///< The only answer given for a listed address.

        CombinedDnsCache(DnsCache& cache, const CombinedLists& lists);

        /**
         * @brief Same as DnsCache::lookup(), with combined zone rewriting.
         *
         * For a question that is not for a combined list, the result is
         * exactly what DnsCache::lookup() returns. For a combined list the
         * result is {LISTED} when the combined answer maps back to the list
         * asked for, and empty otherwise. The raw combined answer is never
         * returned as it may describe unrelated lists.
         */
        std::vector<std::string> lookup(const std::string& question, const std::string& qtype = "A",
                                        const std::string& qclass = "IN", bool exact = false, unsigned timeout = 0);

        /** @brief Same as DnsCache::getNs(), no rewriting is done. */
        std::vector<std::string> getNs(const std::string& domain, unsigned timeout = 0);

        const CombinedLists& getLists() const { return m_lists; }
};
