#pragma once
/**
 * MessageText.hpp
 *
 * Lexical helpers applied to inbound TLCP text before it is dispatched.
 *
 *  - cleanMessage: walks the text in runs that end (inclusively) at each '{' or '}'
 *    and drops CR/LF while lowercasing (full Unicode, UTF-8 in and out) every run
 *    that is not a self-contained "{...}" run or the single run that follows one.
 *    Runs that are not valid UTF-8 get ASCII-only lowercasing.
 *  - parseArguments: splits on commas at brace depth zero. Braces are content,
 *    not delimiters. Tokens are trimmed and empty ones are skipped.
 *
 * Neither function fails on any input, including unbalanced braces.
 * Both are stateless and may be called concurrently.
 *
 * Usage:
 *   auto cleaned = cleanMessage("CONOK,S8f4aec42c3c14ad0,50000,5000,*\r\n");
 *   auto args = parseArguments(cleaned); // views into `cleaned`
 */

#include <string>
#include <string_view>
#include <vector>

namespace tlcp::protocol {

// Returns a new string. ASCII input never grows; a few Unicode lowercase
// mappings take more bytes than their uppercase form.
std::string cleanMessage(std::string_view text);

// Returned views point into `input`; keep it alive while using them.
std::vector<std::string_view> parseArguments(std::string_view input);

} // namespace tlcp::protocol
