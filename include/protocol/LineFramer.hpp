#pragma once
#include <string>
#include <vector>

namespace tlcp::protocol {

// Moves every complete '\n'-terminated line out of `buffer` (without the '\n';
// a trailing '\r' is left for cleanMessage). An unterminated tail stays in
// `buffer` until more bytes arrive.
std::vector<std::string> extractLines(std::string& buffer);

} // namespace tlcp::protocol
