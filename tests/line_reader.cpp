#include <catch2/catch.hpp>
#include "LineReader.hpp"

#include <sstream>
#include <stdexcept>

TEST_CASE("LineReader: strips terminator and trims", "[line]") {
    std::istringstream in("abc\n  hello  \r\n\tinner  space \n");
    LineReader reader(in);

    REQUIRE(reader.readLine() == "abc");
    REQUIRE(reader.readLine() == "hello");
    REQUIRE(reader.readLine() == "inner  space");
    REQUIRE_FALSE(reader.readLine().has_value());
}

TEST_CASE("LineReader: empty line is not end of input", "[line]") {
    std::istringstream in("\n   \n");
    LineReader reader(in);

    auto first = reader.readLine();
    REQUIRE(first.has_value());
    REQUIRE(first->empty());

    auto second = reader.readLine();
    REQUIRE(second.has_value());
    REQUIRE(second->empty());

    REQUIRE_FALSE(reader.readLine().has_value());
}

TEST_CASE("LineReader: unterminated last line is returned", "[line]") {
    std::istringstream in("last");
    LineReader reader(in);

    REQUIRE(reader.readLine() == "last");
    REQUIRE_FALSE(reader.readLine().has_value());
}

TEST_CASE("LineReader: empty stream signals end of input", "[line]") {
    std::istringstream in("");
    LineReader reader(in);
    REQUIRE_FALSE(reader.readLine().has_value());
    // and keeps signalling it
    REQUIRE_FALSE(reader.readLine().has_value());
}

TEST_CASE("LineReader: raw line keeps surrounding spaces", "[line]") {
    std::istringstream in("  pass word \r\n");
    LineReader reader(in);
    REQUIRE(reader.readRawLine() == "  pass word ");
}

TEST_CASE("LineReader: bad stream is an error, not end of input", "[line]") {
    std::istringstream in("abc\n");
    in.setstate(std::ios::badbit);
    LineReader reader(in);
    REQUIRE_THROWS_AS(reader.readLine(), std::runtime_error);
}
