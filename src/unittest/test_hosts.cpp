#include <catch2/catch.hpp>

#include "dnscontext.hpp"
#include "helpers.hpp"
#include "hosts.hpp"
#include "localaddrs.hpp"

#include <map>
#include <memory>

class TestLocalAddresses : public LocalAddresses {
    public:
        std::vector<std::string> interfaces;
        unsigned enumerations = 0;

    protected:
        std::vector<std::string> interfaceAddresses() override
        {
            enumerations++;
            return interfaces;
        }

        std::string fetchExternal(const std::string&) override
        {
            throw std::runtime_error("no network in tests");
        }
};

class TestHostMatcher : public HostMatcher {
    public:
        std::map<std::string, std::string> system; ///< What getaddrinfo would say, missing names fail
        std::string localName = "myhost.example.com";

        TestHostMatcher(DnsClient& dns, LocalAddresses& local)
            : HostMatcher(dns, local)
        {}

    protected:
        std::string hostname() override
        {
            return localName;
        }

        std::string nameToIp(const std::string& name, bool) override
        {
            auto it = system.find(name);
            if (it == system.end()) {
                throw std::runtime_error("Name or service not known");
            }
            return it->second;
        }
};

struct HostsFixture {
    std::shared_ptr<FakeResolver> resolver = std::make_shared<FakeResolver>();
    DnsContext context{resolver, CombinedLists()};
    DnsClient dns{context};
    TestLocalAddresses local;
    TestHostMatcher matcher{dns, local};
    TempDir dir;
    std::string cacheFile = dir.file("local_ips");

    void address(const std::string& name, uint16_t type, const std::vector<std::string>& ips)
    {
        resolver->replies[{name, type}] = FakeResolver::answer({ records(name + ".", type, ips) });
    }
};

TEST_CASE_METHOD(HostsFixture, "Identical strings are the same host") {
    REQUIRE(matcher.hostsEqual("localhost", "localhost", cacheFile));
    REQUIRE(matcher.hostsEqual("127.0.0.1", "127.0.0.1", cacheFile));
    REQUIRE(resolver->calls.empty());
    REQUIRE(local.enumerations == 0);
}

TEST_CASE_METHOD(HostsFixture, "Hosts resolving to a common address are the same host") {
    address("a.example.com", ns_t_a, {"192.0.2.1", "192.0.2.2"});
    address("b.example.com", ns_t_a, {"192.0.2.2"});
    address("c.example.com", ns_t_a, {"192.0.2.3"});

    REQUIRE(matcher.hostsEqual("a.example.com", "b.example.com", cacheFile, true));
    REQUIRE(matcher.hostsEqual("a.example.com", "192.0.2.1", cacheFile, true));
    REQUIRE_FALSE(matcher.hostsEqual("a.example.com", "c.example.com", cacheFile, true));
    REQUIRE(local.enumerations == 0);
}

TEST_CASE_METHOD(HostsFixture, "Loopback addresses stand for this machine") {
    local.interfaces = {"192.0.2.10"};

    REQUIRE(matcher.hostsEqual("127.0.0.1", "192.0.2.10", cacheFile, true));
    REQUIRE(matcher.hostsEqual("::1", "192.0.2.10", cacheFile, true));
    REQUIRE(matcher.hostsEqual("localhost", "192.0.2.10", cacheFile, true));
    REQUIRE(matcher.hostsEqual("192.0.2.10", "myhost.example.com", cacheFile, true));
    REQUIRE_FALSE(matcher.hostsEqual("127.0.0.1", "192.0.2.20", cacheFile, true));

    // Local addresses are enumerated once, then taken from the cache file
    REQUIRE(local.enumerations == 1);
}

TEST_CASE_METHOD(HostsFixture, "The loopback literal itself is not one of our addresses") {
    local.interfaces = {"192.0.2.10"};
    address("loop.example.com", ns_t_a, {"127.0.0.1"});

    REQUIRE_FALSE(matcher.hostsEqual("127.0.0.1", "loop.example.com", cacheFile, true));
}

TEST_CASE_METHOD(HostsFixture, "Private addresses are compared literally") {
    local.interfaces = {"10.1.2.3"};

    REQUIRE(matcher.hostsEqual("10.1.2.3", "localhost", cacheFile, true));
    REQUIRE_FALSE(matcher.hostsEqual("10.1.2.4", "localhost", cacheFile, true));
}

TEST_CASE_METHOD(HostsFixture, "AAAA records of the second host are only fetched when the first has some") {
    address("v4.example.com", ns_t_a, {"192.0.2.1"});
    address("v6.example.com", ns_t_aaaa, {"2001:db8::1"});
    address("dual.example.com", ns_t_a, {"192.0.2.7"});
    address("dual.example.com", ns_t_aaaa, {"2001:db8::1"});

    REQUIRE_FALSE(matcher.hostsEqual("v4.example.com", "dual.example.com", cacheFile, true));
    REQUIRE(resolver->count("dual.example.com", ns_t_aaaa) == 0);

    REQUIRE(matcher.hostsEqual("v6.example.com", "dual.example.com", cacheFile, true));
    REQUIRE(resolver->count("dual.example.com", ns_t_aaaa) == 1);
}

TEST_CASE_METHOD(HostsFixture, "IPv6 literals are normalized") {
    address("v6.example.com", ns_t_aaaa, {"2001:db8::1"});

    REQUIRE(matcher.hostsEqual("v6.example.com", "2001:0db8:0:0::0001", cacheFile, true));
}

TEST_CASE_METHOD(HostsFixture, "System resolver is the last resort") {
    matcher.system["a.example.com"] = "2001:db8::5";
    matcher.system["b.example.com"] = "2001:db8::5";
    matcher.system["c.example.com"] = "2001:db8::6";

    REQUIRE(matcher.hostsEqual("a.example.com", "b.example.com", cacheFile));
    REQUIRE(matcher.hostsEqual("a.example.com", "2001:db8::5", cacheFile));
    REQUIRE_FALSE(matcher.hostsEqual("a.example.com", "c.example.com", cacheFile));
    REQUIRE_FALSE(matcher.hostsEqual("a.example.com", "b.example.com", cacheFile, true));

    // Resolution errors mean not equal
    REQUIRE_FALSE(matcher.hostsEqual("a.example.com", "unknown.example.com", cacheFile));
}

TEST_CASE_METHOD(HostsFixture, "Without a hostname loopback is just an address") {
    matcher.localName = "";
    local.interfaces = {"192.0.2.10"};
    address("localhost", ns_t_a, {"127.0.0.1"});

    REQUIRE(matcher.hostsEqual("localhost", "127.0.0.1", cacheFile, true));
    REQUIRE_FALSE(matcher.hostsEqual("127.0.0.1", "192.0.2.10", cacheFile, true));
    REQUIRE(resolver->count("", ns_t_a) == 0);
    REQUIRE(local.enumerations == 0);

    // Nothing is resolved for an empty name in the fallback either
    matcher.system[""] = "192.0.2.10";
    REQUIRE_FALSE(matcher.hostsEqual("::1", "192.0.2.10", cacheFile));
}
