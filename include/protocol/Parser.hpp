#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace tlcp::protocol {

/**
 * MessageKind: server message families of the TLCP text protocol.
 * Unknown covers any command token outside this set.
 */
enum class MessageKind {
    ConOk,
    ConErr,
    End,
    Loop,
    Probe,
    Sync,
    Noop,
    ReqOk,
    ReqErr,
    Error,
    SubOk,
    SubCmd,
    Unsub,
    Eos,
    Cs,
    Ov,
    Conf,
    Update,
    MsgDone,
    MsgFail,
    ServName,
    ClientIp,
    Cons,
    Prg,
    Unknown
};

const char* toString(MessageKind kind) noexcept;

/**
 * Response: one inbound line after cleaning and argument splitting
 * - kind: classification of the command token
 * - command: first argument of the cleaned line (e.g., "conok", "u")
 * - params: remaining arguments, in order; brace payloads stay whole
 * - cleaned: line after cleanMessage
 * - raw: original line
 */
struct Response {
    MessageKind kind{MessageKind::Unknown};
    std::string command;
    std::vector<std::string> params;
    std::string cleaned;
    std::string raw;
};

struct Parser {
    // cleanMessage, then parseArguments. Throws ClientException(IllegalArgument) when
    // the line yields no command token. Argument counts are not validated.
    static Response parse(const std::string& line);

    // expects a cleaned (lowercase) command token
    static MessageKind classify(std::string_view command);
};

} // namespace tlcp::protocol
