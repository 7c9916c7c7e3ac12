/**
 * @file config.hpp
 * @brief Application configuration.
 */

#pragma once

#include "logging.hpp"

#include <string>

/**
 * @class Config
 * @brief Application configuration container.
 *
 * Stores runtime settings parsed from a KEY=value configuration file:
 * logging preferences, resolver settings and the locations of the combined
 * lists description and the local IP address cache.
 */
class Config {
    public:
        Log::Level  log_level = Log::Level::Error;      ///< Logging verbosity level.
        std::string syslog_facility;                    ///< Syslog facility name. If empty, logs to stderr.
        std::string syslog_id = "dnscombine";           ///< Identity tag used in log messages.

        std::string dns_server;                         ///< IPv4 nameserver to query, empty for resolv.conf.
        unsigned    dns_timeout = 10;                   ///< Lifetime of a complete query in seconds.
        Log::Level  dns_timeout_log_level = Log::Level::Info; ///< Level at which query timeouts are logged.

        std::string combined_lists = "/etc/combined_lists.json"; ///< JSON description of combined lists.

        std::string local_ip_cache = "/var/cache/dnscombine/local_ips"; ///< Cache file of local IP addresses.
        std::string local_ip_cache_owner = "Debian-exim"; ///< User whose group gets access to a new cache file.
        std::string external_ip_url;                    ///< URL returning our public address, empty to skip.

        /**
         * @brief Parses configuration from a file.
         *
         * Reads the specified configuration file and populates the members of
         * this class. Unknown lines are ignored, invalid values are reported on
         * stderr and leave the default in place.
         *
         * @param path The filesystem path to the configuration file.
         * @return bool False if the file could not be opened.
         */
        bool parseFile(const std::string &path);
};
