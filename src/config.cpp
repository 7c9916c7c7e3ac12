#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <regex>

bool Config::parseFile(const std::string& path)
{
    std::regex reLogLevel     ("^[ \t]*LOG_LEVEL[= \t]+([^# \t]*)[ \t]*(#.*)?$");
    std::regex reLogFacility  ("^[ \t]*SYSLOG_FACILITY[= \t]+([^# \t]*)[ \t]*(#.*)?$");
    std::regex reLogId        ("^[ \t]*SYSLOG_ID[= \t]+([^# \t]*)[ \t]*(#.*)?$");
    std::regex reDnsServer    ("^[ \t]*DNS_SERVER[= \t]+([0-9]{1,3}(\\.[0-9]{1,3}){3})[ \t]*(#.*)?$");
    std::regex reDnsTimeout   ("^[ \t]*DNS_TIMEOUT[= \t]+([0-9]+)[ \t]*(#.*)?$");
    std::regex reTimeoutLevel ("^[ \t]*DNS_TIMEOUT_LOG_LEVEL[= \t]+([^# \t]*)[ \t]*(#.*)?$");
    std::regex reCombined     ("^[ \t]*COMBINED_LISTS[= \t]+([^# \t]*)[ \t]*(#.*)?$");
    std::regex reIpCache      ("^[ \t]*LOCAL_IP_CACHE[= \t]+([^# \t]*)[ \t]*(#.*)?$");
    std::regex reIpCacheOwner ("^[ \t]*LOCAL_IP_CACHE_OWNER[= \t]+([^# \t]*)[ \t]*(#.*)?$");
    std::regex reExternalUrl  ("^[ \t]*EXTERNAL_IP_URL[= \t]+([^# \t]*)[ \t]*(#.*)?$");

    std::ifstream file(path);
    if (!file) {
        fprintf(stderr, "ERROR: Failed to open config file %s\n", path.c_str());
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::smatch tokens;

        // Strip off any comments
        auto pos = line.find_first_of('#');
        if (pos != std::string::npos) {
            line = line.erase(pos);
        }
        pos = line.find_last_not_of(" \t\r");
        if (pos != std::string::npos) {
            line = line.erase(pos + 1);
        }

        if (std::regex_match(line, tokens, reLogLevel)) {
            if (!Log::parseLevel(tokens[1].str(), log_level)) {
                fprintf(stderr, "ERROR: Invalid config value LOG_LEVEL=%s\n", tokens[1].str().c_str());
            }

        } else if (std::regex_match(line, tokens, reLogFacility)) {
            syslog_facility = tokens[1].str();

        } else if (std::regex_match(line, tokens, reLogId)) {
            syslog_id = tokens[1].str();

        } else if (std::regex_match(line, tokens, reDnsServer)) {
            dns_server = tokens[1].str();

        } else if (std::regex_match(line, tokens, reDnsTimeout)) {
            auto tmp = std::atol(tokens[1].str().c_str());
            if (tmp > 0) { dns_timeout = static_cast<unsigned>(tmp); }
            else { fprintf(stderr, "ERROR: Invalid config value DNS_TIMEOUT=%s\n", tokens[1].str().c_str()); }

        } else if (std::regex_match(line, tokens, reTimeoutLevel)) {
            if (!Log::parseLevel(tokens[1].str(), dns_timeout_log_level)) {
                fprintf(stderr, "ERROR: Invalid config value DNS_TIMEOUT_LOG_LEVEL=%s\n", tokens[1].str().c_str());
            }

        } else if (std::regex_match(line, tokens, reCombined)) {
            combined_lists = tokens[1].str();

        } else if (std::regex_match(line, tokens, reIpCacheOwner)) {
            local_ip_cache_owner = tokens[1].str();

        } else if (std::regex_match(line, tokens, reIpCache)) {
            local_ip_cache = tokens[1].str();

        } else if (std::regex_match(line, tokens, reExternalUrl)) {
            external_ip_url = tokens[1].str();

        }
    }

    return true;
}
