#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cli/context_menu.hpp"
#include "cli/terminal_input.hpp"
#include "kernel/session.hpp"

namespace graphos {

enum class InteractionState {
    Idle,
    NodeSelected,
    EdgeSelected,
    EdgeDrawing,
    Panning,
    Editing,
    Menu
};

// Short upper-case name shown in the HUD.
const char* to_string(InteractionState state);

struct ControllerOutcome {
    // Something visible changed: graph, viewport, selection or an overlay.
    bool render = false;
    bool quit = false;
};

// Turns input events into graph and viewport mutations.
//
// Pointer input and the keyboard cursor share one code path: Space presses
// or releases the "pointer" at the cursor cell, and moving the cursor
// while pressed drags. Hit-testing uses the session's hit map, i.e. what
// the last composed frame drew.
class InteractionController {
public:
    explicit InteractionController(Session& session);

    ControllerOutcome handle(const InputEvent& event);

    InteractionState state() const { return state_; }
    std::optional<NodeId> selected_node() const { return selected_node_; }
    std::optional<EdgeId> selected_edge() const { return selected_edge_; }
    CellPos cursor() const { return cursor_; }
    bool grabbing() const { return grab_; }
    const std::string& edit_buffer() const { return edit_buffer_; }

    // Mode, cursor, rubber band, menu and edit box.
    void fill_overlay(Overlay& overlay) const;

    // Back to Idle with nothing selected; used after the graph is replaced.
    void reset();
    // Puts the keyboard cursor in the middle of the canvas.
    void center_cursor();

private:
    enum class MenuAction {
        NewNode,
        EditLabel,
        TogglePin,
        DeleteNode,
        DeleteEdge,
        CenterView,
        Relayout,
        SaveEdgeList,
        SaveSnapshot,
        Close
    };

    ControllerOutcome on_key(const InputEvent& event);
    ControllerOutcome on_edit_key(const InputEvent& event);
    ControllerOutcome on_menu_key(const InputEvent& event);
    ControllerOutcome on_mouse(const MouseEvent& mouse);

    ControllerOutcome pointer_press(CellPos c);
    ControllerOutcome pointer_drag(CellPos c);
    ControllerOutcome pointer_release(CellPos c);
    ControllerOutcome finish_edge(CellPos c);

    ControllerOutcome pan(int dx, int dy);
    ControllerOutcome zoom_by(double factor, CellPos anchor);
    ControllerOutcome move_cursor(int dx, int dy);
    ControllerOutcome toggle_grab();
    ControllerOutcome cancel();
    ControllerOutcome create_node();
    ControllerOutcome begin_edit();
    ControllerOutcome delete_selection();
    ControllerOutcome toggle_pin();
    ControllerOutcome nudge(int dx, int dy);
    ControllerOutcome select_next();
    ControllerOutcome relayout();
    ControllerOutcome save_edge_list();
    ControllerOutcome save_snapshot();

    ControllerOutcome open_menu(CellPos c);
    ControllerOutcome menu_press(CellPos c);
    ControllerOutcome activate(int index);
    void close_menu();

    void select_node(NodeId id);
    void select_edge(EdgeId id);
    bool deselect();
    CellPos clamp_to_canvas(CellPos c) const;
    std::string node_name(NodeId id) const;

    Session& session_;
    InteractionState state_ = InteractionState::Idle;
    std::optional<NodeId> selected_node_;
    std::optional<EdgeId> selected_edge_;

    bool pressed_ = false;
    NodeId drag_source_ = kInvalidId;
    CellPos pan_anchor_;
    CellPos rubber_to_;

    CellPos cursor_;
    bool grab_ = false;

    std::string edit_buffer_;
    NodeId editing_node_ = kInvalidId;

    ContextMenu menu_;
    std::vector<MenuAction> menu_actions_;
    InteractionState menu_return_ = InteractionState::Idle;
};

} // namespace graphos
