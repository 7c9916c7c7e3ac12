#include "combined.hpp"
#include "logging.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

template<typename T>
static void readKey(const json& data, const char* key, T& value)
{
    auto it = data.find(key);
    if (it == data.end()) {
        return;
    }
    try {
        value = it->template get<T>();
    } catch (json::exception& e) {
        LOG_ERROR("Ignoring combined lists key ", key, ": ", e.what());
    }
}

CombinedLists CombinedLists::parse(const std::string& text)
{
    CombinedLists lists;
    auto data = json::parse(text);
    if (!data.is_object()) {
        LOG_ERROR("Combined lists description is not a JSON object");
        return lists;
    }

    readKey(data, "COMBINED",               lists.dnsblZone);
    readKey(data, "COMBINED_URL",           lists.urlblZone);
    readKey(data, "COMBINED_DNSBL",         lists.dnsbl);
    readKey(data, "COMBINED_DNSBL_REVERSE", lists.dnsblReverse);
    readKey(data, "COMBINED_URLBL",         lists.urlbl);
    readKey(data, "COMBINED_URLBL_REVERSE", lists.urlblReverse);
    return lists;
}

CombinedLists CombinedLists::load(const std::string& path)
{
    std::ifstream file(path);
    if (!file) {
        LOG_DEBUG("No combined lists in ", path, ", combined lookups disabled");
        return CombinedLists();
    }

    std::ostringstream text;
    text << file.rdbuf();
    try {
        auto lists = parse(text.str());
        LOG_VERBOSE("Loaded ", lists.dnsblReverse.size(), " combined DNSBL and ",
                    lists.urlblReverse.size(), " combined URLBL answers from ", path);
        return lists;
    } catch (json::parse_error& e) {
        LOG_ERROR("Failed to parse ", path, ", combined lookups disabled: ", e.what());
        return CombinedLists();
    }
}

static bool isMirrored(const std::map<std::string, std::string>& reverse, const std::string& list)
{
    for (auto& entry: reverse) {
        if (entry.second == list) {
            return true;
        }
    }
    return false;
}

static std::vector<std::string> splitLabels(const std::string& name)
{
    std::vector<std::string> labels;
    std::string::size_type start = 0, pos;
    while ((pos = name.find('.', start)) != std::string::npos) {
        labels.push_back(name.substr(start, pos - start));
        start = pos + 1;
    }
    labels.push_back(name.substr(start));
    return labels;
}

static std::string joinLabels(std::vector<std::string>::const_iterator first, std::vector<std::string>::const_iterator last)
{
    std::string joined;
    for (auto it = first; it != last; ++it) {
        if (it != first) {
            joined += '.';
        }
        joined += *it;
    }
    return joined;
}

CombinedDnsCache::CombinedDnsCache(DnsCache& cache, const CombinedLists& lists)
    : m_cache(cache)
    , m_lists(lists)
{
}

std::vector<std::string> CombinedDnsCache::lookup(const std::string& question, const std::string& qtype,
                                                  const std::string& qclass, bool exact, unsigned timeout)
{
    const std::vector<std::string> labels = splitLabels(question);
    // Our lists always have 4 labels
    auto split = labels.begin() + (labels.size() > 4 ? labels.size() - 4 : 0);
    auto list = joinLabels(split, labels.end());
    auto address = joinLabels(labels.begin(), split);

    std::string rewritten = question;
    const std::map<std::string, std::string>* reverse = nullptr;
    if (!m_lists.dnsblZone.empty() && isMirrored(m_lists.dnsblReverse, list)) {
        LOG_DEBUG("Rewriting ", question, " to use combined list.");
        rewritten = address + "." + m_lists.dnsblZone;
        reverse = &m_lists.dnsblReverse;
    } else if (!m_lists.urlblZone.empty() && isMirrored(m_lists.urlblReverse, list)) {
        LOG_DEBUG("Rewriting ", question, " to use url combined list.");
        rewritten = address + "." + m_lists.urlblZone;
        reverse = &m_lists.urlblReverse;
    }

    LOG_DEBUG("Looking up ", qtype, ": ", rewritten);
    auto result = m_cache.lookup(rewritten, qtype, qclass, exact, timeout);
    if (reverse == nullptr || result.empty()) {
        return result;
    }

    for (auto& answer: result) {
        auto it = reverse->find(answer);
        if (it != reverse->end() && it->second == list) {
            LOG_DEBUG("Converting answer from ", rewritten, " to ", LISTED, " for ", question);
            return { LISTED };
        }
    }
    LOG_DEBUG("Ignoring answer from ", rewritten, " with respect to ", question);
    return {};
}

std::vector<std::string> CombinedDnsCache::getNs(const std::string& domain, unsigned timeout)
{
    return m_cache.getNs(domain, timeout);
}
