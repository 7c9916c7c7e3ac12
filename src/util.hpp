#pragma once

#include <netinet/in.h>

#include <string>

namespace Util {

    /** Literal IPv4 or IPv6 address */
    struct IpAddress {
        int family = AF_UNSPEC;
        unsigned char bytes[16] = {0};
    };

    /** Parse text as a literal IP address, return false if it is anything else (e.g. a hostname) */
    bool parseIP(const std::string& text, IpAddress& ip);

    /** Canonical text form, e.g. "::1" for "0:0:0:0:0:0:0:1" */
    std::string ipToString(const IpAddress& ip);

    /** 127.0.0.0/8 or ::1 */
    bool isLoopback(const IpAddress& ip);

    /** Deprecated IPv6 site-local fec0::/10, never true for IPv4 */
    bool isSiteLocal(const IpAddress& ip);

    /** fe80::/10 or 169.254.0.0/16 */
    bool isLinkLocal(const IpAddress& ip);

    /** Name of this machine as reported by gethostname(), empty on failure */
    std::string getHostName();

    /** Strip leading and trailing whitespace */
    std::string trim(const std::string& text);
};
