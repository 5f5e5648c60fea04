// src/protocol/MessageText.cpp
#include "protocol/MessageText.hpp"

#include <cctype>
#include <locale>

#include <boost/locale/conversion.hpp>
#include <boost/locale/encoding_errors.hpp>
#include <boost/locale/generator.hpp>

namespace tlcp::protocol {

namespace {
    constexpr std::string_view kWhitespace = " \t\r\n\f\v";

    const std::locale& utf8Locale() {
        static const std::locale loc = boost::locale::generator()("en_US.UTF-8");
        return loc;
    }

    void appendAsciiLower(std::string& out, std::string_view s) {
        for (char c : s) {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    // append run without CR/LF, lowercased as UTF-8
    void appendCleaned(std::string& out, std::string_view run) {
        std::string stripped;
        stripped.reserve(run.size());
        bool ascii = true;
        for (char c : run) {
            if (c == '\n' || c == '\r') continue;
            if (static_cast<unsigned char>(c) >= 0x80) ascii = false;
            stripped.push_back(c);
        }

        if (ascii) {
            appendAsciiLower(out, stripped);
            return;
        }
        try {
            out += boost::locale::to_lower(stripped, utf8Locale());
        } catch (const boost::locale::conv::conversion_error&) {
            // not valid UTF-8: only ASCII letters can be folded safely
            appendAsciiLower(out, stripped);
        }
    }

    std::string_view trim(std::string_view s) {
        const auto b = s.find_first_not_of(kWhitespace);
        if (b == std::string_view::npos) return {};
        const auto e = s.find_last_not_of(kWhitespace);
        return s.substr(b, e - b + 1);
    }
} // namespace

std::string cleanMessage(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    bool insideBraces = false;

    std::size_t start = 0;
    while (start < text.size()) {
        // a run ends right after the next brace, or at end of input
        std::size_t end = text.find_first_of("{}", start);
        end = (end == std::string_view::npos) ? text.size() : end + 1;
        const std::string_view run = text.substr(start, end - start);

        if (run.front() == '{' && run.back() == '}') {
            insideBraces = true;
            result.append(run);
        } else if (insideBraces) {
            // exactly one run after a braced run is copied as is
            insideBraces = false;
            result.append(run);
        } else {
            appendCleaned(result, run);
        }
        start = end;
    }

    return result;
}

std::vector<std::string_view> parseArguments(std::string_view input) {
    std::vector<std::string_view> arguments;
    std::size_t start = 0;
    int depth = 0; // goes negative on a stray '}', never clamped

    for (std::size_t i = 0; i < input.size(); ++i) {
        switch (input[i]) {
            case '{':
                ++depth;
                break;
            case '}':
                --depth;
                break;
            case ',':
                if (depth == 0) {
                    auto arg = trim(input.substr(start, i - start));
                    if (!arg.empty()) {
                        arguments.push_back(arg);
                    }
                    start = i + 1;
                }
                break;
            default:
                break;
        }
    }

    if (start < input.size()) {
        auto arg = trim(input.substr(start));
        if (!arg.empty()) {
            arguments.push_back(arg);
        }
    }

    return arguments;
}

} // namespace tlcp::protocol
