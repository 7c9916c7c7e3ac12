#include "localaddrs.hpp"
#include "logging.hpp"
#include "util.hpp"

// Makes CURL a complete type that unique_ptr can own
#define CURL_STRICTER 1
#include <curl/curl.h>

#include <ifaddrs.h>
#include <netinet/in.h>
#include <pwd.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iterator>
#include <memory>
#include <set>
#include <stdexcept>

#ifndef DNSCOMBINE_VERSION
#define DNSCOMBINE_VERSION "0.0.0"
#endif

using json = nlohmann::json;

LocalAddresses::LocalAddresses(const std::string& cacheOwner)
    : m_cacheOwner(cacheOwner)
{
}

std::vector<std::string> LocalAddresses::interfaceAddresses()
{
    std::vector<std::string> ips;
    struct ifaddrs* ifaddr = nullptr;
    if (::getifaddrs(&ifaddr) == -1) {
        LOG_ERROR("Failed to enumerate network interfaces - ", strerror(errno));
        return ips;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr) {
            continue;
        }

        Util::IpAddress ip;
        ip.family = ifa->ifa_addr->sa_family;
        if (ip.family == AF_INET) {
            auto sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
            std::memcpy(ip.bytes, &sin->sin_addr, sizeof(sin->sin_addr));
            auto text = Util::ipToString(ip);
            if (text != "127.0.0.1") {
                ips.push_back(text);
            }
        } else if (ip.family == AF_INET6) {
            auto sin6 = reinterpret_cast<struct sockaddr_in6*>(ifa->ifa_addr);
            std::memcpy(ip.bytes, &sin6->sin6_addr, sizeof(sin6->sin6_addr));
            if (!Util::isLoopback(ip) && !Util::isLinkLocal(ip) && !Util::isSiteLocal(ip)) {
                ips.push_back(Util::ipToString(ip));
            }
        }
    }

    ::freeifaddrs(ifaddr);
    return ips;
}

static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string LocalAddresses::fetchExternal(const std::string& url)
{
    static std::atomic_flag s_init = ATOMIC_FLAG_INIT;
    if (!s_init.test_and_set() && curl_global_init(CURL_GLOBAL_ALL) != 0) {
        throw std::runtime_error("Error initializing libcurl");
    }

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw std::runtime_error("Error creating a libcurl session");
    }

    std::string userAgent = std::string("dnscombine/") + DNSCOMBINE_VERSION;
    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, EXTERNAL_TIMEOUT);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

    auto res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw std::runtime_error(curl_easy_strerror(res));
    }
    return Util::trim(body);
}

bool LocalAddresses::readCache(const std::string& path, std::vector<std::string>& ips)
{
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        LOG_DEBUG("Not using cache: ", path, " - ", strerror(errno));
        return false;
    }
    if (std::time(nullptr) - st.st_mtime >= CACHE_MAX_AGE) {
        LOG_DEBUG("Not using cache for local IP addresses.");
        return false;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG_WARN("Bad local IP address cache; replacing: ", strerror(errno));
        return false;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    try {
        ips = json::from_cbor(data).get<std::vector<std::string>>();
    } catch (std::exception& e) {
        LOG_WARN("Bad local IP address cache; replacing: ", e.what());
        return false;
    }

    LOG_DEBUG("Using cache for local IP addresses.");
    return true;
}

void LocalAddresses::writeCache(const std::string& path, const std::vector<std::string>& ips)
{
    struct stat st;
    bool adjust = (::stat(path.c_str(), &st) != 0);

    auto data = json::to_cbor(json(ips));
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.close();
    if (!file) {
        LOG_WARN("Unable to cache IP list in ", path);
        return;
    }

    if (!adjust) {
        return;
    }

    // Processes of several users share the cache, the group makes it work
    if (::chmod(path.c_str(), 0660) != 0) {
        LOG_INFO("Unable to set permissions of cache: ", strerror(errno));
    }
    auto pw = ::getpwnam(m_cacheOwner.c_str());
    if (pw == nullptr) {
        LOG_INFO("Unable to set owner/group of cache: unknown user ", m_cacheOwner);
    } else if (::chown(path.c_str(), ::geteuid(), pw->pw_gid) != 0) {
        LOG_INFO("Unable to set owner/group of cache: ", strerror(errno));
    }
}

std::vector<std::string> LocalAddresses::addresses(const std::string& cacheFile, const std::string& externalUrl,
                                                   bool useCached)
{
    std::vector<std::string> cached;
    if (useCached && readCache(cacheFile, cached)) {
        std::set<std::string> unique(cached.begin(), cached.end());
        return std::vector<std::string>(unique.begin(), unique.end());
    }

    auto found = interfaceAddresses();
    std::set<std::string> ips(found.begin(), found.end());

    if (!externalUrl.empty()) {
        try {
            auto ip = fetchExternal(externalUrl);
            // IPv4 clients of a dual stack web server
            if (ip.compare(0, 7, "::ffff:") == 0) {
                ip = ip.substr(ip.rfind(':') + 1);
            }
            if (!ip.empty()) {
                ips.insert(ip);
            }
        } catch (std::runtime_error& e) {
            LOG_WARN("Unable to retrieve external IP: ", e.what());
        }
    }

    std::vector<std::string> result(ips.begin(), ips.end());
    std::string joined;
    for (auto& ip: result) {
        joined += (joined.empty() ? "" : ", ") + ip;
    }
    LOG_INFO("Local IP addresses: ", joined);

    writeCache(cacheFile, result);
    return result;
}
