#include <catch2/catch_test_macros.hpp>
#include "scrubby/report.hpp"

using namespace scrubby;

TEST_CASE("Summary merges IPv4 and IPv6 counts", "[report]")
{
    KindCounts counts{};
    counts[kind_index(DetectorKind::Email)] = 2;
    counts[kind_index(DetectorKind::IPv4)] = 1;
    counts[kind_index(DetectorKind::IPv6)] = 3;
    counts[kind_index(DetectorKind::Token)] = 1;

    auto summary = Summary::from_counts(counts);
    REQUIRE(summary.emails == 2);
    REQUIRE(summary.ips == 4);
    REQUIRE(summary.uuids == 0);
    REQUIRE(summary.jwts == 0);
    REQUIRE(summary.tokens == 1);
    REQUIRE(summary.total() == 7);
}

TEST_CASE("Text summary format", "[report]")
{
    Summary summary{1, 1, 0, 0, 2};
    REQUIRE(format_summary(summary) ==
            "Scrubby cleaned your clipboard:\n"
            "- Emails: 1\n"
            "- IPs: 1\n"
            "- UUIDs: 0\n"
            "- JWTs: 0\n"
            "- Tokens: 2\n"
            "Safe to paste.");
}

TEST_CASE("JSON report", "[report]")
{
    Summary summary{1, 2, 3, 4, 5};
    auto j = summary_to_json(summary);
    REQUIRE(j["emails"] == 1);
    REQUIRE(j["ips"] == 2);
    REQUIRE(j["uuids"] == 3);
    REQUIRE(j["jwts"] == 4);
    REQUIRE(j["tokens"] == 5);
    REQUIRE(j["safe_to_paste"] == true);
    REQUIRE(j.size() == 6);
}
