#pragma once

#include <string>
#include <vector>

#include "graphos_types.hpp"

namespace graphos {

// Buffer of topology notifications. GraphModel pushes one event per
// successful mutation; the session drains it once per loop iteration and
// hands the batch to the layout engine and the session log.
class GraphEventService {
 public:
  struct TopologyEvent {
    enum class Kind { NodeAdded, NodeRemoved, EdgeAdded, EdgeRemoved,
                      PinChanged, Cleared };
    Kind kind;
    NodeId node = kInvalidId;
    EdgeId edge = kInvalidId;
    // NodeAdded only: the node came with an explicit position.
    bool placed = false;
  };

  void push(const TopologyEvent& event);
  std::vector<TopologyEvent> drain();
  bool empty() const { return buffer_.empty(); }
  std::size_t size() const { return buffer_.size(); }

 private:
  std::vector<TopologyEvent> buffer_;
};

const char* to_string(GraphEventService::TopologyEvent::Kind kind);

}  // namespace graphos
