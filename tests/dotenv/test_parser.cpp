#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <vector>

#include "dotenvpp/dotenv/parser.hpp"

using namespace dotenvpp;
using namespace dotenvpp::dotenv;

namespace {

auto parse_ok(std::string_view text, const Environment& env, bool expand = true) -> EnvMap {
    auto result = parse(text, expand, env);
    REQUIRE(result.has_value());
    return *result;
}

auto value_of(const EnvMap& m, std::string_view key) -> std::string {
    auto entry = m.get(key);
    REQUIRE(entry.has_value());
    return entry->value;
}

} // anonymous namespace

TEST_CASE("parse keeps entries in file order", "[dotenv][parser]") {
    MemoryEnvironment env;
    auto m = parse_ok("A=1\nB=2\nC=3", env);

    REQUIRE(m.len() == 3);
    CHECK(m.get("A") == EnvMap::Entry{"1", 0});
    CHECK(m.get("B") == EnvMap::Entry{"2", 1});
    CHECK(m.get("C") == EnvMap::Entry{"3", 2});
}

TEST_CASE("parse skips blank and comment lines", "[dotenv][parser]") {
    MemoryEnvironment env;
    auto m = parse_ok(
        "# This is a comment\n"
        "\n"
        "KEY1=value1\n"
        "  \n"
        "   # indented comment\n"
        "KEY2=value2\n", env);

    REQUIRE(m.len() == 2);
    CHECK(value_of(m, "KEY1") == "value1");
    CHECK(value_of(m, "KEY2") == "value2");
}

TEST_CASE("parse handles CRLF line endings", "[dotenv][parser]") {
    MemoryEnvironment env;
    auto m = parse_ok("A=1\r\nB=\"two\"\r\n", env);
    CHECK(value_of(m, "A") == "1");
    CHECK(value_of(m, "B") == "two");
}

TEST_CASE("repeated keys keep their first position", "[dotenv][parser]") {
    MemoryEnvironment env;
    auto m = parse_ok("A=1\nB=2\nA=3", env);
    REQUIRE(m.len() == 2);
    CHECK(m.get("A") == EnvMap::Entry{"3", 0});
}

TEST_CASE("comments are stripped outside quotes", "[dotenv][parser]") {
    MemoryEnvironment env;

    SECTION("trailing comment on an unquoted value") {
        auto m = parse_ok("PORT=8080 # server port", env);
        CHECK(value_of(m, "PORT") == "8080");
    }

    SECTION("hash inside double quotes") {
        auto m = parse_ok("FOO=\"bar # baz\"", env);
        CHECK(value_of(m, "FOO") == "bar # baz");
    }

    SECTION("hash inside single quotes followed by a comment") {
        auto m = parse_ok("FOO='bar # baz' # trailing", env);
        CHECK(value_of(m, "FOO") == "bar # baz");
    }

    SECTION("several hashes inside quotes") {
        auto m = parse_ok("COLOR=\"#fff#000\"", env);
        CHECK(value_of(m, "COLOR") == "#fff#000");
    }
}

TEST_CASE("strip_comment follows the segment quote-count rule", "[dotenv][parser]") {
    CHECK(strip_comment("A=1") == "A=1");
    CHECK(strip_comment("A=1 # note") == "A=1 ");
    CHECK(strip_comment("A=\"x # y\" # note") == "A=\"x # y\" ");

    SECTION("a lone apostrophe keeps the rest of the line") {
        CHECK(strip_comment("A=it's # here") == "A=it's # here");
    }

    SECTION("escaped quotes do not open a span") {
        CHECK(strip_comment("A=\\\"x # y") == "A=\\\"x ");
    }

    SECTION("a segment with two quotes does not toggle") {
        CHECK(strip_comment("A=\"x\" # \"y\" # z") == "A=\"x\" ");
    }
}

TEST_CASE("split_line separators", "[dotenv][parser]") {
    SECTION("equals") {
        auto a = split_line("KEY=value");
        REQUIRE(a.has_value());
        CHECK(a->key == "KEY");
        CHECK(a->value == "value");
    }

    SECTION("colon form") {
        MemoryEnvironment env;
        auto m = parse_ok("a: 1", env);
        CHECK(m.get("a") == EnvMap::Entry{"1", 0});
    }

    SECTION("colon after equals belongs to the value") {
        auto a = split_line("URL=http://example.com");
        REQUIRE(a.has_value());
        CHECK(a->key == "URL");
        CHECK(a->value == "http://example.com");
    }

    SECTION("colon before equals wins") {
        auto a = split_line("a: b=c");
        REQUIRE(a.has_value());
        CHECK(a->key == "a");
        CHECK(a->value == " b=c");
    }

    SECTION("export prefix") {
        auto a = split_line("export API_KEY=secret");
        REQUIRE(a.has_value());
        CHECK(a->key == "API_KEY");
    }

    SECTION("export prefix is removed without a word boundary") {
        auto a = split_line("exportFOO=bar");
        REQUIRE(a.has_value());
        CHECK(a->key == "FOO");
    }

    SECTION("no separator") {
        auto a = split_line("no_separator_here");
        REQUIRE_FALSE(a.has_value());
        CHECK(a.error().code() == ErrorCode::MalformedLine);
        CHECK(a.error().message() == "cannot separate key from value");
    }
}

TEST_CASE("parse reports the failing line", "[dotenv][parser]") {
    MemoryEnvironment env;
    auto result = parse("GOOD=1\nmalformed\nALSO_GOOD=2", true, env);

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::MalformedLine);
    CHECK(result.error().detail() == "line 2");
}

TEST_CASE("parse_line rejects empty input", "[dotenv][parser]") {
    MemoryEnvironment env;
    EnvMap m;
    auto result = parse_line("", m, true, env);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::EmptyLine);
}

TEST_CASE("parse surfaces stream failures", "[dotenv][parser]") {
    MemoryEnvironment env;
    std::istringstream in("A=1\n");
    in.setstate(std::ios::badbit);

    auto result = parse(in, true, env);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::IoError);
}

TEST_CASE("value quoting and escapes", "[dotenv][parser]") {
    MemoryEnvironment env;

    SECTION("surrounding spaces are trimmed") {
        auto m = parse_ok("A =   spaced out   ", env);
        CHECK(value_of(m, "A") == "spaced out");
    }

    SECTION("empty value") {
        auto m = parse_ok("EMPTY=\nNOTEMPTY=something", env);
        CHECK(value_of(m, "EMPTY") == "");
        CHECK(value_of(m, "NOTEMPTY") == "something");
    }

    SECTION("double quotes decode newlines and carriage returns") {
        auto m = parse_ok(R"(MSG="line1\nline2\rend")", env);
        CHECK(value_of(m, "MSG") == "line1\nline2\rend");
    }

    SECTION("double quotes collapse other escapes") {
        auto m = parse_ok(R"(Q="say \"hi\"")" "\n" R"(P="path\\to\\file")" "\n" R"(T="a\tb")", env);
        CHECK(value_of(m, "Q") == "say \"hi\"");
        CHECK(value_of(m, "P") == "path\\to\\file");
        CHECK(value_of(m, "T") == "atb");
    }

    SECTION("single quotes are literal") {
        auto m = parse_ok(R"(LITERAL='hello\nworld')", env);
        CHECK(value_of(m, "LITERAL") == "hello\\nworld");
    }

    SECTION("unquoted values keep backslashes") {
        auto m = parse_ok(R"(RAW=a\nb)", env);
        CHECK(value_of(m, "RAW") == "a\\nb");
    }

    SECTION("only one layer of quotes is removed") {
        auto m = parse_ok(R"(NESTED="'inner'")", env);
        CHECK(value_of(m, "NESTED") == "'inner'");
    }

    SECTION("mismatched quotes are kept") {
        auto m = parse_ok(R"(MIXED="value')", env);
        CHECK(value_of(m, "MIXED") == "\"value'");
    }

    SECTION("single characters are left untouched") {
        auto m = parse_ok("Q=\"\nD=$", env);
        CHECK(value_of(m, "Q") == "\"");
        CHECK(value_of(m, "D") == "$");
    }
}

TEST_CASE("unescape_double_quoted", "[dotenv][parser]") {
    CHECK(unescape_double_quoted(R"(a\nb)") == "a\nb");
    CHECK(unescape_double_quoted(R"(a\\nb)") == "a\\nb");
    CHECK(unescape_double_quoted(R"(\$KEEP)") == "\\$KEEP");
    CHECK(unescape_double_quoted(R"(\!\`)") == "!`");
    CHECK(unescape_double_quoted("trailing\\") == "trailing\\");
}

TEST_CASE("variable expansion", "[dotenv][parser]") {
    SECTION("reference to an earlier key") {
        MemoryEnvironment env;
        auto m = parse_ok("A=1\nX=${A}Y", env);
        CHECK(value_of(m, "X") == "1Y");
    }

    SECTION("unknown reference expands to nothing") {
        MemoryEnvironment env;
        auto m = parse_ok("X=${A}Y", env);
        CHECK(value_of(m, "X") == "Y");
    }

    SECTION("falls back to the environment") {
        MemoryEnvironment env({{"HOME_DIR", "/home/me"}});
        auto m = parse_ok("BIN=$HOME_DIR/bin", env);
        CHECK(value_of(m, "BIN") == "/home/me/bin");
    }

    SECTION("the file takes precedence over the environment") {
        MemoryEnvironment env({{"A", "from-env"}});
        auto m = parse_ok("A=from-file\nB=$A", env);
        CHECK(value_of(m, "B") == "from-file");
    }

    SECTION("a key can extend its own earlier value") {
        MemoryEnvironment env;
        auto m = parse_ok("LIST=a\nLIST=${LIST}:b", env);
        REQUIRE(m.len() == 1);
        CHECK(value_of(m, "LIST") == "a:b");
    }

    SECTION("expansion inside double quotes") {
        MemoryEnvironment env({{"USER_NAME", "ada"}});
        auto m = parse_ok(R"(GREETING="hello ${USER_NAME}!")", env);
        CHECK(value_of(m, "GREETING") == "hello ada!");
    }

    SECTION("single-quoted values never expand") {
        MemoryEnvironment env({{"A", "1"}});
        auto m = parse_ok("Z='$A'", env);
        CHECK(value_of(m, "Z") == "$A");
    }

    SECTION("escaped dollar is kept literally") {
        MemoryEnvironment env({{"FOO", "x"}});
        auto m = parse_ok("U=\\$FOO\nD=\"\\$FOO\"", env);
        CHECK(value_of(m, "U") == "$FOO");
        CHECK(value_of(m, "D") == "$FOO");
    }

    SECTION("command substitution syntax loses its dollar") {
        MemoryEnvironment env;
        auto m = parse_ok("CMD=$(whoami)", env);
        CHECK(value_of(m, "CMD") == "(whoami)");
    }

    SECTION("bare and lowercase dollars are left alone") {
        MemoryEnvironment env({{"foo", "nope"}});
        auto m = parse_ok("PRICE=cost $ 5\nLOWER=$foo\nBRACES=x${}y", env);
        CHECK(value_of(m, "PRICE") == "cost $ 5");
        CHECK(value_of(m, "LOWER") == "$foo");
        CHECK(value_of(m, "BRACES") == "x${}y");
    }

    SECTION("expansion can be disabled") {
        MemoryEnvironment env;
        auto m = parse_ok("A=1\nB=$A", env, false);
        CHECK(value_of(m, "B") == "$A");
    }
}

TEST_CASE("expand_variables resolves map, environment, then empty", "[dotenv][parser]") {
    EnvMap m;
    m.set("IN_MAP", "map");
    MemoryEnvironment env({{"IN_MAP", "env"}, {"IN_ENV", "env"}});

    CHECK(expand_variables("$IN_MAP/$IN_ENV/$NOWHERE.", m, env) == "map/env/.");
    CHECK(expand_variables("${IN_ENV}", m, env) == "env");
    CHECK(expand_variables("no references", m, env) == "no references");
}

TEST_CASE("unmarshal expands against the process environment", "[dotenv][parser]") {
    REQUIRE(process_environment().set("DOTENVPP_UNMARSHAL_BASE", "/srv").has_value());

    auto m = unmarshal("APP=$DOTENVPP_UNMARSHAL_BASE/app\nLOG=${APP}/log");
    REQUIRE(m.has_value());
    CHECK(m->get("APP")->value == "/srv/app");
    CHECK(m->get("LOG")->value == "/srv/app/log");
}

TEST_CASE("expansion handles very long references", "[dotenv][parser]") {
    MemoryEnvironment env;
    const std::string name(100000, 'A');

    SECTION("unresolved reference") {
        auto m = parse_ok("A=$" + name, env);
        CHECK(value_of(m, "A") == "");
    }

    SECTION("resolved through the map") {
        auto m = parse_ok(name + "=found\nB=${" + name + "}", env);
        CHECK(value_of(m, "B") == "found");
    }

    SECTION("escaped reference") {
        auto m = parse_ok("A=\\$" + name, env);
        CHECK(value_of(m, "A") == "$" + name);
    }
}

TEST_CASE("is_ignored_line", "[dotenv][parser]") {
    CHECK(is_ignored_line(""));
    CHECK(is_ignored_line("   \t"));
    CHECK(is_ignored_line("# comment"));
    CHECK(is_ignored_line("  # comment"));
    CHECK_FALSE(is_ignored_line("A=1 # comment"));
}
