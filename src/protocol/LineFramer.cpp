// src/protocol/LineFramer.cpp
#include "protocol/LineFramer.hpp"

namespace tlcp::protocol {

std::vector<std::string> extractLines(std::string& buffer) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    std::size_t pos = std::string::npos;
    while ((pos = buffer.find('\n', start)) != std::string::npos) {
        lines.push_back(buffer.substr(start, pos - start));
        start = pos + 1;
    }
    buffer.erase(0, start);
    return lines;
}

} // namespace tlcp::protocol
