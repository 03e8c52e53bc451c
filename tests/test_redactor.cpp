#include <catch2/catch_test_macros.hpp>
#include "scrubby/redactor.hpp"

using namespace scrubby;

namespace
{
    Span at(std::string_view text, std::size_t start, std::size_t end, DetectorKind kind)
    {
        return Span{start, end, std::string(text.substr(start, end - start)), kind};
    }
}

TEST_CASE("Redactor replaces spans in one pass", "[redactor]")
{
    const std::string input = "mail a@b.com from 10.0.0.5 ok";
    std::vector<Span> spans{at(input, 5, 12, DetectorKind::Email), at(input, 18, 26, DetectorKind::IPv4)};

    PlaceholderAllocator allocator;
    auto result = Redactor::redact(input, spans, allocator);

    REQUIRE(result.text == "mail <EMAIL> from <IP> ok");
    REQUIRE(result.count(DetectorKind::Email) == 1);
    REQUIRE(result.count(DetectorKind::IPv4) == 1);
    REQUIRE(result.count(DetectorKind::Token) == 0);
    REQUIRE(result.total() == 2);
    REQUIRE(result.spans_replaced.size() == 2);
}

TEST_CASE("Redactor skips invalid spans", "[redactor]")
{
    const std::string input = "abcdefghij";
    std::vector<Span> spans{
        at(input, 0, 4, DetectorKind::Token),
        at(input, 2, 6, DetectorKind::Token), // overlaps the previous span
        Span{8, 20, "ij", DetectorKind::Token}, // runs past the input
        Span{6, 6, "", DetectorKind::Token}};

    PlaceholderAllocator allocator;
    auto result = Redactor::redact(input, spans, allocator);

    REQUIRE(result.text == "<TOKEN>efghij");
    REQUIRE(result.total() == 1);
}

TEST_CASE("Redactor without spans returns the input", "[redactor]")
{
    PlaceholderAllocator allocator;
    auto result = Redactor::redact("nothing here", {}, allocator);
    REQUIRE(result.text == "nothing here");
    REQUIRE(result.total() == 0);
    REQUIRE(result.spans_replaced.empty());
}
