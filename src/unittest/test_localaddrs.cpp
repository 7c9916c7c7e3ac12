#include <catch2/catch.hpp>

#include "helpers.hpp"
#include "localaddrs.hpp"

#include <utime.h>

#include <ctime>
#include <stdexcept>

class FakeLocalAddresses : public LocalAddresses {
    public:
        std::vector<std::string> interfaces;
        std::string external;       ///< Address reported by the external service, empty to fail
        unsigned enumerations = 0;
        std::vector<std::string> urls;

    protected:
        std::vector<std::string> interfaceAddresses() override
        {
            enumerations++;
            return interfaces;
        }

        std::string fetchExternal(const std::string& url) override
        {
            urls.push_back(url);
            if (external.empty()) {
                throw std::runtime_error("Couldn't connect to server");
            }
            return external;
        }
};

TEST_CASE("Interface addresses are sorted and unique") {
    TempDir dir;
    FakeLocalAddresses local;
    local.interfaces = {"192.0.2.20", "2001:db8::1", "192.0.2.10", "192.0.2.20"};

    std::vector<std::string> expected{"192.0.2.10", "192.0.2.20", "2001:db8::1"};
    REQUIRE(local.addresses(dir.file("local_ips")) == expected);
    REQUIRE(local.urls.empty());
}

TEST_CASE("Fresh cache file is used instead of enumerating") {
    TempDir dir;
    auto cache = dir.file("local_ips");
    FakeLocalAddresses local;
    local.interfaces = {"192.0.2.10"};

    REQUIRE(local.addresses(cache, "", true) == std::vector<std::string>{"192.0.2.10"});
    REQUIRE(local.enumerations == 1);

    local.interfaces = {"192.0.2.11"};
    REQUIRE(local.addresses(cache, "", true) == std::vector<std::string>{"192.0.2.10"});
    REQUIRE(local.enumerations == 1);

    // Without useCached the interfaces are always inspected and the cache refreshed
    REQUIRE(local.addresses(cache) == std::vector<std::string>{"192.0.2.11"});
    REQUIRE(local.enumerations == 2);
    REQUIRE(local.addresses(cache, "", true) == std::vector<std::string>{"192.0.2.11"});
    REQUIRE(local.enumerations == 2);
}

TEST_CASE("Stale or broken cache files are replaced") {
    TempDir dir;
    FakeLocalAddresses local;
    local.interfaces = {"192.0.2.10"};

    SECTION("stale") {
        auto cache = dir.file("local_ips");
        local.addresses(cache);
        REQUIRE(local.enumerations == 1);

        struct utimbuf times;
        times.actime = times.modtime = std::time(nullptr) - LocalAddresses::CACHE_MAX_AGE - 60;
        REQUIRE(::utime(cache.c_str(), &times) == 0);

        local.interfaces = {"192.0.2.12"};
        REQUIRE(local.addresses(cache, "", true) == std::vector<std::string>{"192.0.2.12"});
        REQUIRE(local.enumerations == 2);
    }

    SECTION("not CBOR") {
        auto cache = dir.write("local_ips", "\xff");
        REQUIRE(local.addresses(cache, "", true) == std::vector<std::string>{"192.0.2.10"});
        REQUIRE(local.enumerations == 1);

        // Rewritten with a valid list
        REQUIRE(local.addresses(cache, "", true) == std::vector<std::string>{"192.0.2.10"});
        REQUIRE(local.enumerations == 1);
    }

    SECTION("not a list of addresses") {
        auto cache = dir.write("local_ips", "\x01");
        REQUIRE(local.addresses(cache, "", true) == std::vector<std::string>{"192.0.2.10"});
        REQUIRE(local.enumerations == 1);
    }
}

TEST_CASE("External address is added when a URL is given") {
    TempDir dir;
    FakeLocalAddresses local;
    local.interfaces = {"10.0.0.5"};

    SECTION("plain address") {
        local.external = "203.0.113.9";
        REQUIRE(local.addresses(dir.file("local_ips"), "https://ip.example.com/") ==
                std::vector<std::string>{"10.0.0.5", "203.0.113.9"});
        REQUIRE(local.urls == std::vector<std::string>{"https://ip.example.com/"});
    }

    SECTION("IPv4 mapped address") {
        local.external = "::ffff:198.51.100.7";
        REQUIRE(local.addresses(dir.file("local_ips"), "https://ip.example.com/") ==
                std::vector<std::string>{"10.0.0.5", "198.51.100.7"});
    }

    SECTION("service unavailable") {
        REQUIRE(local.addresses(dir.file("local_ips"), "https://ip.example.com/") ==
                std::vector<std::string>{"10.0.0.5"});
        REQUIRE(local.urls.size() == 1);
    }
}
