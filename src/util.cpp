#include "logging.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstring>

namespace Util {

    bool parseIP(const std::string& text, IpAddress& ip)
    {
        ip = IpAddress();
        if (::inet_pton(AF_INET, text.c_str(), ip.bytes) == 1) {
            ip.family = AF_INET;
            return true;
        }
        if (::inet_pton(AF_INET6, text.c_str(), ip.bytes) == 1) {
            ip.family = AF_INET6;
            return true;
        }
        return false;
    }

    std::string ipToString(const IpAddress& ip)
    {
        char buf[INET6_ADDRSTRLEN] = "";
        if (ip.family == AF_UNSPEC || ::inet_ntop(ip.family, ip.bytes, buf, sizeof(buf)) == nullptr) {
            return "";
        }
        return buf;
    }

    bool isLoopback(const IpAddress& ip)
    {
        if (ip.family == AF_INET) {
            return ip.bytes[0] == 127;
        }
        if (ip.family == AF_INET6) {
            static const unsigned char loopback[16] = {0,0,0,0, 0,0,0,0, 0,0,0,0, 0,0,0,1};
            return std::memcmp(ip.bytes, loopback, sizeof(loopback)) == 0;
        }
        return false;
    }

    bool isSiteLocal(const IpAddress& ip)
    {
        return ip.family == AF_INET6 && ip.bytes[0] == 0xfe && (ip.bytes[1] & 0xc0) == 0xc0;
    }

    bool isLinkLocal(const IpAddress& ip)
    {
        if (ip.family == AF_INET) {
            return ip.bytes[0] == 169 && ip.bytes[1] == 254;
        }
        return ip.family == AF_INET6 && ip.bytes[0] == 0xfe && (ip.bytes[1] & 0xc0) == 0x80;
    }

    std::string getHostName()
    {
        char buf[HOST_NAME_MAX + 1] = "";
        if (::gethostname(buf, sizeof(buf) - 1) != 0) {
            LOG_ERROR("Failed to get hostname - ", strerror(errno));
            return "";
        }
        return buf;
    }

    std::string trim(const std::string& text)
    {
        static const char* whitespace = " \t\r\n";
        auto first = text.find_first_not_of(whitespace);
        if (first == std::string::npos) {
            return "";
        }
        auto last = text.find_last_not_of(whitespace);
        return text.substr(first, last - first + 1);
    }
};
