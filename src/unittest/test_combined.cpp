#include <catch2/catch.hpp>

#include "combined.hpp"
#include "dnscontext.hpp"
#include "helpers.hpp"

#include <nlohmann/json.hpp>

#include <memory>

static CombinedLists dnsblLists()
{
    CombinedLists lists;
    lists.dnsblZone = "combined.list";
    lists.dnsblReverse = {
        { "match.result", "list1.dnsbl.example.com" },
        { "other.result", "list2.dnsbl.example.com" },
    };
    return lists;
}

TEST_CASE("Questions for other domains pass through unmodified") {
    auto resolver = std::make_shared<FakeResolver>();
    resolver->replies[{"www.example.org", ns_t_a}] = FakeResolver::answer({
        records("www.example.org.", ns_t_a, {"192.0.2.80", "192.0.2.81"}),
    });
    DnsCache cache(resolver);
    CombinedDnsCache combined(cache, dnsblLists());

    REQUIRE(combined.lookup("www.example.org") == std::vector<std::string>{"192.0.2.80", "192.0.2.81"});
    REQUIRE(resolver->calls[0].question == "www.example.org");
}

TEST_CASE("Without combined zones nothing is rewritten") {
    auto resolver = std::make_shared<FakeResolver>();
    resolver->replies[{"test.list1.dnsbl.example.com", ns_t_a}] = FakeResolver::answer({
        records("test.list1.dnsbl.example.com.", ns_t_a, {"127.0.0.4"}),
    });
    DnsCache cache(resolver);
    auto lists = dnsblLists();
    lists.dnsblZone = "";
    CombinedDnsCache combined(cache, lists);

    REQUIRE(combined.lookup("test.list1.dnsbl.example.com") == std::vector<std::string>{"127.0.0.4"});
    REQUIRE(resolver->calls[0].question == "test.list1.dnsbl.example.com");
}

TEST_CASE("Combined DNSBL answer for the list asked for means listed") {
    auto resolver = std::make_shared<FakeResolver>();
    resolver->replies[{"addr.combined.list", ns_t_a}] = FakeResolver::answer({
        records("addr.combined.list.", ns_t_a, {"match.result"}),
    });
    DnsCache cache(resolver);
    CombinedDnsCache combined(cache, dnsblLists());

    REQUIRE(combined.lookup("addr.list1.dnsbl.example.com") == std::vector<std::string>{"127.0.0.2"});
    REQUIRE(resolver->calls.size() == 1);
    REQUIRE(resolver->calls[0].question == "addr.combined.list");
    REQUIRE(resolver->calls[0].qtype == ns_t_a);
    REQUIRE(resolver->calls[0].qclass == ns_c_in);
}

TEST_CASE("Combined DNSBL answer for another list means not listed") {
    auto resolver = std::make_shared<FakeResolver>();
    resolver->replies[{"addr.combined.list", ns_t_a}] = FakeResolver::answer({
        records("addr.combined.list.", ns_t_a, {"other.result"}),
    });
    DnsCache cache(resolver);
    CombinedDnsCache combined(cache, dnsblLists());

    REQUIRE(combined.lookup("addr.list1.dnsbl.example.com").empty());
    REQUIRE(resolver->calls[0].question == "addr.combined.list");
}

TEST_CASE("No combined DNSBL answer means not listed") {
    auto resolver = std::make_shared<FakeResolver>();
    DnsCache cache(resolver);
    CombinedDnsCache combined(cache, dnsblLists());

    REQUIRE(combined.lookup("addr.list1.dnsbl.example.com").empty());
    REQUIRE(resolver->calls[0].question == "addr.combined.list");
}

TEST_CASE("All lists of a combined zone share one query") {
    auto resolver = std::make_shared<FakeResolver>();
    resolver->replies[{"2.0.0.127.combined.list", ns_t_a}] = FakeResolver::answer({
        records("2.0.0.127.combined.list.", ns_t_a, {"match.result", "unknown.result"}),
    });
    DnsCache cache(resolver);
    CombinedDnsCache combined(cache, dnsblLists());

    REQUIRE(combined.lookup("2.0.0.127.list1.dnsbl.example.com") == std::vector<std::string>{"127.0.0.2"});
    REQUIRE(combined.lookup("2.0.0.127.list2.dnsbl.example.com").empty());
    REQUIRE(combined.lookup("2.0.0.127.list1.dnsbl.example.com") == std::vector<std::string>{"127.0.0.2"});
    REQUIRE(resolver->calls.size() == 1);
}

TEST_CASE("Combined URLBL is used for URL lists") {
    auto resolver = std::make_shared<FakeResolver>();
    resolver->replies[{"test.combined.url", ns_t_a}] = FakeResolver::answer({
        records("test.combined.url.", ns_t_a, {"cache.result"}),
    });
    DnsCache cache(resolver);

    CombinedLists lists;
    lists.dnsblZone = "combined.list";
    lists.urlblZone = "combined.url";
    lists.urlblReverse = { { "cache.result", "list1.urlbl.example.com" } };

    SECTION("listed") {
        CombinedDnsCache combined(cache, lists);
        REQUIRE(combined.lookup("test.list1.urlbl.example.com") == std::vector<std::string>{"127.0.0.2"});
        REQUIRE(resolver->calls[0].question == "test.combined.url");
    }

    SECTION("not listed") {
        lists.urlblReverse = { { "cache1.result", "list1.urlbl.example.com" } };
        CombinedDnsCache combined(cache, lists);
        REQUIRE(combined.lookup("test.list1.urlbl.example.com").empty());
        REQUIRE(resolver->calls[0].question == "test.combined.url");
    }
}

TEST_CASE("Combined lists description is parsed from JSON") {
    auto lists = CombinedLists::parse(R"({
        "COMBINED": "combined.list",
        "COMBINED_URL": "combined.url",
        "COMBINED_DNSBL": { "list1.dnsbl.example.com": "127.0.0.2" },
        "COMBINED_DNSBL_REVERSE": { "127.0.1.1": "list1.dnsbl.example.com" },
        "COMBINED_URLBL": {},
        "COMBINED_URLBL_REVERSE": { "127.0.2.1": "list1.urlbl.example.com" }
    })");

    REQUIRE(lists.dnsblZone == "combined.list");
    REQUIRE(lists.urlblZone == "combined.url");
    REQUIRE(lists.dnsbl.at("list1.dnsbl.example.com") == "127.0.0.2");
    REQUIRE(lists.dnsblReverse.at("127.0.1.1") == "list1.dnsbl.example.com");
    REQUIRE(lists.urlbl.empty());
    REQUIRE(lists.urlblReverse.at("127.0.2.1") == "list1.urlbl.example.com");
}

TEST_CASE("Bad combined lists descriptions disable combined lookups") {
    SECTION("wrong types") {
        auto lists = CombinedLists::parse(R"({"COMBINED": 5, "COMBINED_DNSBL_REVERSE": ["a"], "COMBINED_URL": "combined.url"})");
        REQUIRE(lists.dnsblZone.empty());
        REQUIRE(lists.dnsblReverse.empty());
        REQUIRE(lists.urlblZone == "combined.url");
    }

    SECTION("not JSON") {
        REQUIRE_THROWS_AS(CombinedLists::parse("COMBINED=combined.list"), nlohmann::json::parse_error);

        TempDir dir;
        auto lists = CombinedLists::load(dir.write("lists.json", "{ broken"));
        REQUIRE(lists.dnsblZone.empty());
        REQUIRE(lists.dnsblReverse.empty());
    }

    SECTION("missing file") {
        auto lists = CombinedLists::load("/nonexistent/combined_lists.json");
        REQUIRE(lists.dnsblZone.empty());
        REQUIRE(lists.urlblZone.empty());
        REQUIRE(lists.dnsblReverse.empty());
        REQUIRE(lists.urlblReverse.empty());
    }

    SECTION("valid file") {
        TempDir dir;
        auto lists = CombinedLists::load(dir.write("lists.json", R"({"COMBINED": "combined.list"})"));
        REQUIRE(lists.dnsblZone == "combined.list");
    }
}

TEST_CASE("DnsClient handles carry their own timeout") {
    auto resolver = std::make_shared<FakeResolver>();
    DnsContext context(resolver, dnsblLists());
    DnsClient fast(context, 2);
    DnsClient slow(context, 20);

    fast.lookup("one.example.com");
    slow.lookup("two.example.com", "MX");
    fast.getNs("example.com");
    REQUIRE(resolver->calls.size() == 3);
    REQUIRE(resolver->calls[0].lifetime == 2);
    REQUIRE(resolver->calls[1].lifetime == 20);
    REQUIRE(resolver->calls[1].qtype == ns_t_mx);
    REQUIRE(resolver->calls[2].lifetime == 2);

    // Both handles share the cache of the context
    slow.lookup("one.example.com");
    REQUIRE(resolver->calls.size() == 3);
}
