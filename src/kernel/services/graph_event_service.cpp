#include "kernel/services/graph_event_service.hpp"

namespace graphos {

void GraphEventService::push(const TopologyEvent& event) {
    buffer_.push_back(event);
}

std::vector<GraphEventService::TopologyEvent> GraphEventService::drain() {
    std::vector<TopologyEvent> out;
    out.swap(buffer_);
    return out;
}

const char* to_string(GraphEventService::TopologyEvent::Kind kind) {
    using Kind = GraphEventService::TopologyEvent::Kind;
    switch (kind) {
        case Kind::NodeAdded: return "node-added";
        case Kind::NodeRemoved: return "node-removed";
        case Kind::EdgeAdded: return "edge-added";
        case Kind::EdgeRemoved: return "edge-removed";
        case Kind::PinChanged: return "pin-changed";
        case Kind::Cleared: return "cleared";
    }
    return "unknown";
}

} // namespace graphos
