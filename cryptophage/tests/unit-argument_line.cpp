#include "doctest_compatibility.h"

#include "cryptophage/argument_line.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace std::string_literals;
using namespace std::string_view_literals;

TEST_CASE("argument line split test")
{
    using cryptophage::utils::split_argument_line;
    using strings = std::vector<std::string>;

    SECTION("plain arguments")
    {
        REQUIRE_EQ(split_argument_line("--batch --quiet  --list-keys"sv), strings{"--batch", "--quiet", "--list-keys"});
        REQUIRE_EQ(split_argument_line("  \t--verify\n"sv), strings{"--verify"});
        REQUIRE(split_argument_line(""sv).empty());
        REQUIRE(split_argument_line("   "sv).empty());
    }
    SECTION("double quotes")
    {
        REQUIRE_EQ(split_argument_line(R"(--output "my file.gpg" --encrypt "in put.txt")"sv),
            strings{"--output", "my file.gpg", "--encrypt", "in put.txt"});
        REQUIRE_EQ(split_argument_line(R"("say \"hi\"" "back\\slash")"sv), strings{R"(say "hi")", R"(back\slash)"});
        REQUIRE_EQ(split_argument_line(R"(pre"quoted part"post)"sv), strings{"prequoted partpost"});
    }
    SECTION("single quotes keep content literally")
    {
        REQUIRE_EQ(split_argument_line(R"('%s|' 'a "b" \c')"sv), strings{"%s|", R"(a "b" \c)"});
    }
    SECTION("empty quoted arguments are preserved")
    {
        REQUIRE_EQ(split_argument_line(R"(--passphrase "" next '')"sv), strings{"--passphrase", "", "next", ""});
    }
    SECTION("backslash outside quotes")
    {
        REQUIRE_EQ(split_argument_line(R"(two\ words C:\path)"sv), strings{"two words", R"(C:\path)"});
    }
}

TEST_CASE("argument quoting test")
{
    using cryptophage::utils::quote_argument;
    using cryptophage::utils::split_argument_line;

    REQUIRE_EQ(quote_argument("bob@example.com"sv), R"("bob@example.com")"s);
    REQUIRE_EQ(quote_argument(R"(pass"word\)"sv), R"("pass\"word\\")"s);
    REQUIRE_EQ(quote_argument(""sv), R"("")"s);

    for (const auto value : {"plain"sv, "with space"sv, R"(quo"te)"sv, R"(back\slash)"sv, ""sv, "it's"sv}) {
        CAPTURE(value);
        const auto& args = split_argument_line(quote_argument(value));
        REQUIRE_EQ(args.size(), 1U);
        REQUIRE_EQ(args.front(), value);
    }
}
