#include "cli/run_session.hpp"

#include <algorithm>
#include <chrono>

#include "cli/interaction_controller.hpp"

namespace graphos {

namespace {

void fit_to_terminal(Session& session, const TermSize& size) {
    // Last row belongs to the HUD.
    session.resize(std::max(0, size.rows - 1), std::max(0, size.cols));
}

} // namespace

void run_session(Session& session, TerminalBackend& terminal) {
    using Clock = Session::Clock;
    const int hz = std::max(1, session.config().tick_rate_hz);
    const auto period = std::chrono::microseconds(1000000 / hz);

    fit_to_terminal(session, terminal.size());
    session.center_view();
    InteractionController controller(session);
    session.log().info("Session started: {} nodes, {} edges, {}",
                       session.graph().node_count(), session.graph().edge_count(),
                       session.graph().directed() ? "directed" : "undirected");

    bool dirty = true;
    bool settled = session.layout().converged();
    auto next_tick = Clock::now();
    while (true) {
        auto now = Clock::now();
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::max(next_tick - now, Clock::duration::zero()));

        if (auto event = terminal.poll(wait)) {
            if (event->type == InputEvent::Type::Resize) {
                fit_to_terminal(session, terminal.size());
            }
            ControllerOutcome out = controller.handle(*event);
            if (out.quit) break;
            dirty = dirty || out.render;
        }

        if (session.pump_events()) dirty = true;

        now = Clock::now();
        if (now >= next_tick) {
            if (session.layout().tick(session.graph())) dirty = true;
            if (session.expire_status(now)) dirty = true;
            next_tick += period;
            if (next_tick < now) next_tick = now + period;
        }
        if (session.layout().converged() != settled) {
            settled = session.layout().converged();
            dirty = true;
        }

        if (dirty) {
            Overlay overlay;
            controller.fill_overlay(overlay);
            overlay.status = session.status();
            overlay.status_level = session.status_level();
            overlay.layout_settled = settled;
            ftxui::Screen frame = session.compose(overlay);
            terminal.write(session.renderer().diff(frame));
            dirty = false;
        }
    }

    if (session.modified()) {
        session.log().warn("Quit with unsaved changes");
    }
    session.log().info("Session ended");
}

} // namespace graphos
