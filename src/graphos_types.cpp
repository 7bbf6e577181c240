#include "graphos_types.hpp"

namespace graphos {

const char* to_string(GraphErrc code) {
    switch (code) {
        case GraphErrc::Unknown: return "Unknown";
        case GraphErrc::UnknownNode: return "UnknownNode";
        case GraphErrc::UnknownEdge: return "UnknownEdge";
        case GraphErrc::MalformedInput: return "MalformedInput";
        case GraphErrc::Io: return "Io";
        case GraphErrc::Terminal: return "TerminalError";
        case GraphErrc::InvalidParameter: return "InvalidParameter";
    }
    return "Unknown";
}

} // namespace graphos
