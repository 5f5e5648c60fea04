#include <catch2/catch.hpp>
#include "protocol/MessageText.hpp"

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

using namespace tlcp::protocol;

using Views = std::vector<std::string_view>;

// ============================================================================
// cleanMessage
// ============================================================================

TEST_CASE("cleanMessage strips line endings and lowercases", "[clean]") {
    REQUIRE(cleanMessage("Hello\nWorld") == "helloworld");
    REQUIRE(cleanMessage("Hello\r\nWorld") == "helloworld");
    REQUIRE(cleanMessage("Hello WORLD") == "hello world");
    REQUIRE(cleanMessage("") == "");
}

TEST_CASE("cleanMessage on protocol lines", "[clean]") {
    REQUIRE(cleanMessage("CONOK,S8f4aec42c3c14ad0,50000,5000,*\r\n") ==
            "conok,s8f4aec42c3c14ad0,50000,5000,*");
    REQUIRE(cleanMessage("PROBE\r\n") == "probe");
}

TEST_CASE("cleanMessage keeps braces in place", "[clean]") {
    SECTION("single level") {
        REQUIRE(cleanMessage("Message with {Preserved\nContent} and not preserved\nContent") ==
                "message with {preservedcontent} and not preservedcontent");
    }

    SECTION("nested") {
        REQUIRE(cleanMessage("Message with {Outer{Inner\nContent}Outer} and regular\nContent") ==
                "message with {outer{innercontent}outer} and regularcontent");
    }

    SECTION("unbalanced open brace") {
        REQUIRE(cleanMessage("Message with {Unbalanced and regular\nContent") ==
                "message with {unbalanced and regularcontent");
    }

    SECTION("brace at start or end of input") {
        REQUIRE(cleanMessage("{partial brace content} followed by text") ==
                "{partial brace content} followed by text");
        REQUIRE(cleanMessage("text followed by {partial brace content}") ==
                "text followed by {partial brace content}");
    }

    SECTION("stray and adjacent braces") {
        REQUIRE(cleanMessage("}A{B}{C\r\n}") == "}a{b}{c}");
        REQUIRE(cleanMessage("{}") == "{}");
        REQUIRE(cleanMessage("{{\n}}") == "{{}}");
    }
}

TEST_CASE("cleanMessage lowercases UTF-8 text", "[clean]") {
    // "ÉCOLE,ÜBER\r\n" -> "école,über"
    REQUIRE(cleanMessage("\xC3\x89" "COLE,\xC3\x9C" "BER\r\n") == "\xC3\xA9" "cole,\xC3\xBC" "ber");
    // Greek "ΑΒΓ" -> "αβγ"
    REQUIRE(cleanMessage("\xCE\x91\xCE\x92\xCE\x93") == "\xCE\xB1\xCE\xB2\xCE\xB3");

    SECTION("inside brace runs") {
        REQUIRE(cleanMessage("u,1,{\xC3\x89T\xC3\x89\n}") == "u,1,{\xC3\xA9t\xC3\xA9}");
    }

    SECTION("invalid UTF-8 still folds ASCII") {
        std::string out;
        REQUIRE_NOTHROW(out = cleanMessage("AB\xFF" "CD\r\n"));
        REQUIRE(out.find("ab") != std::string::npos);
        REQUIRE(out.find('\r') == std::string::npos);
    }
}

TEST_CASE("cleanMessage on brace-free ASCII text", "[clean]") {
    const std::string inputs[] = {
        "ABC", "a\rb\nc", "\r\n\r\n", "Mixed Case, With Commas\r\n", "already clean",
    };
    for (const auto& in : inputs) {
        std::string expected;
        for (char c : in) {
            if (c == '\r' || c == '\n') continue;
            expected.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        INFO("input: " << in);
        const auto once = cleanMessage(in);
        REQUIRE(once == expected);
        REQUIRE(once.size() <= in.size());
        REQUIRE(cleanMessage(once) == once);
    }
}

// ============================================================================
// parseArguments
// ============================================================================

TEST_CASE("parseArguments basic splitting", "[args]") {
    REQUIRE(parseArguments("arg1,arg2,arg3") == Views{"arg1", "arg2", "arg3"});
    REQUIRE(parseArguments("arg1") == Views{"arg1"});
    REQUIRE(parseArguments("").empty());
}

TEST_CASE("parseArguments trims and drops empty tokens", "[args]") {
    REQUIRE(parseArguments(" arg1 , arg2 , arg3 ") == Views{"arg1", "arg2", "arg3"});
    REQUIRE(parseArguments("arg1,,arg3") == Views{"arg1", "arg3"});
    REQUIRE(parseArguments(",, ,\t,").empty());
    REQUIRE(parseArguments("  inner  space  ,x") == Views{"inner  space", "x"});
}

TEST_CASE("parseArguments keeps brace payloads whole", "[args]") {
    SECTION("single level") {
        REQUIRE(parseArguments("arg1,{inner1,inner2},arg3") ==
                Views{"arg1", "{inner1,inner2}", "arg3"});
    }

    SECTION("nested") {
        REQUIRE(parseArguments("arg1,{outer{inner1,inner2}outer},arg3") ==
                Views{"arg1", "{outer{inner1,inner2}outer}", "arg3"});
    }

    SECTION("unmatched open brace swallows the rest") {
        REQUIRE(parseArguments("arg1,{unbalanced,arg3") == Views{"arg1", "{unbalanced,arg3"});
        REQUIRE(parseArguments("{a,b,c") == Views{"{a,b,c"});
    }

    SECTION("stray close brace makes depth negative") {
        // depth is -1 after '}', so the following commas do not split
        REQUIRE(parseArguments("a,b},c,d") == Views{"a", "b},c,d"});
        // a later '{' brings depth back to zero
        REQUIRE(parseArguments("}x{,y") == Views{"}x{", "y"});
    }
}

TEST_CASE("parseArguments on protocol lines", "[args]") {
    REQUIRE(parseArguments("CONOK,S8f4aec42c3c14ad0,50000,5000,*") ==
            Views{"CONOK", "S8f4aec42c3c14ad0", "50000", "5000", "*"});
    REQUIRE(parseArguments("u,1,1,a|b|c") == Views{"u", "1", "1", "a|b|c"});
}

TEST_CASE("parseArguments returns views into the input", "[args]") {
    const std::string input = " First , {Second,Part} ";
    auto args = parseArguments(input);
    REQUIRE(args.size() == 2);
    for (auto a : args) {
        REQUIRE(a.data() >= input.data());
        REQUIRE(a.data() + a.size() <= input.data() + input.size());
    }
    REQUIRE(args[0] == "First");
    REQUIRE(args[1] == "{Second,Part}");
}

TEST_CASE("parseArguments matches naive split on brace-free text", "[args]") {
    const std::string input = " a ,b,, c d ,\te\t, ";
    Views naive;
    std::string_view rest = input;
    while (true) {
        auto pos = rest.find(',');
        auto piece = rest.substr(0, pos);
        auto b = piece.find_first_not_of(" \t");
        if (b != std::string_view::npos) {
            auto e = piece.find_last_not_of(" \t");
            naive.push_back(piece.substr(b, e - b + 1));
        }
        if (pos == std::string_view::npos) break;
        rest.remove_prefix(pos + 1);
    }
    REQUIRE(parseArguments(input) == naive);
    REQUIRE(naive == Views{"a", "b", "c d", "e"});
}
