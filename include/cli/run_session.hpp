#pragma once

#include "cli/terminal_backend.hpp"
#include "kernel/session.hpp"

namespace graphos {

// Interactive loop: poll input until the next layout tick, feed events to
// an InteractionController, advance the layout, and write the frame diff
// whenever something visible changed. Returns when the user quits.
// GraphError(Terminal) from the backend propagates.
void run_session(Session& session, TerminalBackend& terminal);

} // namespace graphos
