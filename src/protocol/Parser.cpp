// src/protocol/Parser.cpp
#include "protocol/Parser.hpp"
#include "protocol/MessageText.hpp"
#include "protocol/exceptions/ClientException.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace tlcp::protocol {

namespace {
    struct KindName {
        std::string_view name;
        MessageKind kind;
    };

    constexpr KindName kKinds[] = {
        {"conok", MessageKind::ConOk},
        {"conerr", MessageKind::ConErr},
        {"end", MessageKind::End},
        {"loop", MessageKind::Loop},
        {"probe", MessageKind::Probe},
        {"sync", MessageKind::Sync},
        {"noop", MessageKind::Noop},
        {"reqok", MessageKind::ReqOk},
        {"reqerr", MessageKind::ReqErr},
        {"error", MessageKind::Error},
        {"subok", MessageKind::SubOk},
        {"subcmd", MessageKind::SubCmd},
        {"unsub", MessageKind::Unsub},
        {"eos", MessageKind::Eos},
        {"cs", MessageKind::Cs},
        {"ov", MessageKind::Ov},
        {"conf", MessageKind::Conf},
        {"u", MessageKind::Update},
        {"msgdone", MessageKind::MsgDone},
        {"msgfail", MessageKind::MsgFail},
        {"servname", MessageKind::ServName},
        {"clientip", MessageKind::ClientIp},
        {"cons", MessageKind::Cons},
        {"prg", MessageKind::Prg},
    };
} // namespace

const char* toString(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::ConOk: return "CONOK";
        case MessageKind::ConErr: return "CONERR";
        case MessageKind::End: return "END";
        case MessageKind::Loop: return "LOOP";
        case MessageKind::Probe: return "PROBE";
        case MessageKind::Sync: return "SYNC";
        case MessageKind::Noop: return "NOOP";
        case MessageKind::ReqOk: return "REQOK";
        case MessageKind::ReqErr: return "REQERR";
        case MessageKind::Error: return "ERROR";
        case MessageKind::SubOk: return "SUBOK";
        case MessageKind::SubCmd: return "SUBCMD";
        case MessageKind::Unsub: return "UNSUB";
        case MessageKind::Eos: return "EOS";
        case MessageKind::Cs: return "CS";
        case MessageKind::Ov: return "OV";
        case MessageKind::Conf: return "CONF";
        case MessageKind::Update: return "U";
        case MessageKind::MsgDone: return "MSGDONE";
        case MessageKind::MsgFail: return "MSGFAIL";
        case MessageKind::ServName: return "SERVNAME";
        case MessageKind::ClientIp: return "CLIENTIP";
        case MessageKind::Cons: return "CONS";
        case MessageKind::Prg: return "PRG";
        case MessageKind::Unknown: break;
    }
    return "UNKNOWN";
}

MessageKind Parser::classify(std::string_view command) {
    auto it = std::find_if(std::begin(kKinds), std::end(kKinds),
                           [command](const KindName& k) { return k.name == command; });
    return it != std::end(kKinds) ? it->kind : MessageKind::Unknown;
}

Response Parser::parse(const std::string& line) {
    Response resp;
    resp.raw = line;
    resp.cleaned = cleanMessage(line);

    // views point into resp.cleaned; copy them out before it can move
    auto args = parseArguments(resp.cleaned);
    if (args.empty()) {
        throw illegalArgument("Parser: line has no command token");
    }

    resp.command = std::string(args.front());
    resp.params.reserve(args.size() - 1);
    for (std::size_t i = 1; i < args.size(); ++i) {
        resp.params.emplace_back(args[i]);
    }
    resp.kind = classify(resp.command);
    return resp;
}

} // namespace tlcp::protocol
