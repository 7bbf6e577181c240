#include "cli/interaction_controller.hpp"

#include <algorithm>

namespace graphos {

namespace {

// Drops the last UTF-8 encoded character of `s`.
void pop_glyph(std::string& s) {
    if (s.empty()) return;
    std::size_t i = s.size() - 1;
    while (i > 0 && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) --i;
    s.erase(i);
}

} // namespace

const char* to_string(InteractionState state) {
    switch (state) {
        case InteractionState::Idle: return "IDLE";
        case InteractionState::NodeSelected: return "NODE";
        case InteractionState::EdgeSelected: return "EDGE";
        case InteractionState::EdgeDrawing: return "DRAW";
        case InteractionState::Panning: return "PAN";
        case InteractionState::Editing: return "EDIT";
        case InteractionState::Menu: return "MENU";
    }
    return "?";
}

InteractionController::InteractionController(Session& session)
    : session_(session) {
    center_cursor();
}

ControllerOutcome InteractionController::handle(const InputEvent& event) {
    const InteractionState before = state_;
    ControllerOutcome out;
    try {
        switch (event.type) {
            case InputEvent::Type::Key:
            case InputEvent::Type::Character:
                out = on_key(event);
                break;
            case InputEvent::Type::Mouse:
                out = on_mouse(event.mouse);
                break;
            case InputEvent::Type::Resize:
                cursor_ = clamp_to_canvas(cursor_);
                if (menu_.is_open()) close_menu();
                out.render = true;
                break;
        }
    } catch (const GraphError& e) {
        session_.report(e);
        out.render = true;
    }
    // The mode is part of the HUD.
    if (state_ != before) out.render = true;
    return out;
}

void InteractionController::fill_overlay(Overlay& overlay) const {
    overlay.mode = to_string(state_);
    overlay.cursor = cursor_;
    overlay.cursor_grab = grab_;
    if (state_ == InteractionState::EdgeDrawing) {
        overlay.rubber_from = drag_source_;
        overlay.rubber_to = rubber_to_;
    }
    if (menu_.is_open()) overlay.menu = menu_.overlay();
    if (state_ == InteractionState::Editing) overlay.edit_text = edit_buffer_;
}

void InteractionController::reset() {
    deselect();
    menu_.close();
    menu_actions_.clear();
    state_ = InteractionState::Idle;
    pressed_ = false;
    grab_ = false;
    drag_source_ = kInvalidId;
    editing_node_ = kInvalidId;
    edit_buffer_.clear();
}

void InteractionController::center_cursor() {
    const Viewport& vp = session_.viewport();
    cursor_ = clamp_to_canvas({vp.cols() / 2, vp.rows() / 2});
}

// ---------------------------------------------------------------------------
// Keyboard
// ---------------------------------------------------------------------------
ControllerOutcome InteractionController::on_key(const InputEvent& event) {
    if (event.is_key(CTRL_C)) return {false, true};
    if (state_ == InteractionState::Editing) return on_edit_key(event);
    if (event.is_char("q")) return {false, true};
    if (state_ == InteractionState::Menu) return on_menu_key(event);

    const CliConfig& cfg = session_.config();
    if (event.type == InputEvent::Type::Key) {
        switch (event.key) {
            case UP: return pan(0, -cfg.pan_step);
            case DOWN: return pan(0, cfg.pan_step);
            case LEFT: return pan(-cfg.pan_step, 0);
            case RIGHT: return pan(cfg.pan_step, 0);
            case ESC: return cancel();
            case DEL: return delete_selection();
            case TAB: return select_next();
            default: return {};
        }
    }

    const Viewport& vp = session_.viewport();
    const CellPos middle{vp.cols() / 2, vp.rows() / 2};
    const std::string& c = event.text;
    if (c == "+" || c == "=") return zoom_by(cfg.zoom_step, middle);
    if (c == "-") return zoom_by(1.0 / cfg.zoom_step, middle);
    if (c == "h") return move_cursor(-1, 0);
    if (c == "l") return move_cursor(1, 0);
    if (c == "k") return move_cursor(0, -1);
    if (c == "j") return move_cursor(0, 1);
    if (c == "H") return nudge(-1, 0);
    if (c == "L") return nudge(1, 0);
    if (c == "K") return nudge(0, -1);
    if (c == "J") return nudge(0, 1);
    if (c == " ") return toggle_grab();
    if (c == "n") return create_node();
    if (c == "e") return begin_edit();
    if (c == "x") return delete_selection();
    if (c == "p") return toggle_pin();
    if (c == "c") {
        session_.center_view();
        return {true};
    }
    if (c == "r") return relayout();
    if (c == "s") return save_edge_list();
    if (c == "w") return save_snapshot();
    if (c == "m") return open_menu(cursor_);
    return {};
}

ControllerOutcome InteractionController::on_edit_key(const InputEvent& event) {
    if (event.type == InputEvent::Type::Character) {
        edit_buffer_ += event.text;
        return {true};
    }
    switch (event.key) {
        case BACKSPACE:
            if (edit_buffer_.empty()) return {};
            pop_glyph(edit_buffer_);
            return {true};
        case ENTER: {
            GraphModel& graph = session_.graph();
            if (graph.has_node(editing_node_)) {
                const std::string old = graph.node(editing_node_).label;
                graph.set_label(editing_node_, edit_buffer_);
                session_.set_modified(true);
                session_.log().info("Renamed node {} '{}' -> '{}'", editing_node_,
                                    old, edit_buffer_);
                session_.set_status("Label set to '" + edit_buffer_ + "'");
                state_ = InteractionState::NodeSelected;
            } else {
                state_ = InteractionState::Idle;
            }
            edit_buffer_.clear();
            editing_node_ = kInvalidId;
            return {true};
        }
        case ESC:
            state_ = session_.graph().has_node(editing_node_)
                         ? InteractionState::NodeSelected
                         : InteractionState::Idle;
            edit_buffer_.clear();
            editing_node_ = kInvalidId;
            return {true};
        default:
            return {};
    }
}

ControllerOutcome InteractionController::on_menu_key(const InputEvent& event) {
    if (event.is_key(UP) || event.is_char("k")) {
        menu_.move_selection(-1);
        return {true};
    }
    if (event.is_key(DOWN) || event.is_char("j")) {
        menu_.move_selection(1);
        return {true};
    }
    if (event.is_key(ENTER) || event.is_char(" ")) {
        return menu_.selected() >= 0 ? activate(menu_.selected()) : ControllerOutcome{};
    }
    if (event.is_key(ESC) || event.is_char("m")) {
        close_menu();
        return {true};
    }
    return {};
}

// ---------------------------------------------------------------------------
// Pointer
// ---------------------------------------------------------------------------
ControllerOutcome InteractionController::on_mouse(const MouseEvent& mouse) {
    using Button = MouseEvent::Button;
    using Action = MouseEvent::Action;
    const CellPos pos = clamp_to_canvas(mouse.pos);
    const CliConfig& cfg = session_.config();

    if (state_ == InteractionState::Editing) return {};

    if (state_ == InteractionState::Menu) {
        if (mouse.action == Action::Press &&
            (mouse.button == Button::Left || mouse.button == Button::Right)) {
            return menu_press(pos);
        }
        if (mouse.action == Action::Drag || mouse.action == Action::Move) {
            return {menu_.hover(pos)};
        }
        return {};
    }

    switch (mouse.action) {
        case Action::Press:
            if (mouse.button == Button::WheelUp) return zoom_by(cfg.zoom_step, pos);
            if (mouse.button == Button::WheelDown) return zoom_by(1.0 / cfg.zoom_step, pos);
            cursor_ = pos;
            if (mouse.button == Button::Left) {
                ControllerOutcome out = pointer_press(pos);
                out.render = true;  // cursor moved
                return out;
            }
            if (mouse.button == Button::Right) return open_menu(pos);
            return {true};
        case Action::Drag: {
            bool moved = cursor_ != pos;
            cursor_ = pos;
            ControllerOutcome out = pointer_drag(pos);
            out.render = out.render || moved;
            return out;
        }
        case Action::Move: {
            bool moved = cursor_ != pos;
            cursor_ = pos;
            return {moved};
        }
        case Action::Release: {
            cursor_ = pos;
            ControllerOutcome out = pointer_release(pos);
            out.render = true;
            return out;
        }
    }
    return {};
}

ControllerOutcome InteractionController::pointer_press(CellPos c) {
    pressed_ = true;
    const HitMap& hits = session_.hits();
    const GraphModel& graph = session_.graph();
    // The hit map is one frame old; skip ids deleted since.
    auto n = hits.node_at(c);
    if (n && graph.has_node(*n)) {
        bool changed = selected_node_ != n;
        select_node(*n);
        drag_source_ = *n;
        state_ = InteractionState::NodeSelected;
        return {changed};
    }
    drag_source_ = kInvalidId;
    auto e = hits.edge_at(c);
    if (e && graph.has_edge(*e)) {
        bool changed = selected_edge_ != e;
        select_edge(*e);
        state_ = InteractionState::EdgeSelected;
        return {changed};
    }
    bool had_selection = deselect();
    state_ = InteractionState::Panning;
    pan_anchor_ = c;
    return {had_selection};
}

ControllerOutcome InteractionController::pointer_drag(CellPos c) {
    if (!pressed_) return {};
    switch (state_) {
        case InteractionState::Panning: {
            int dx = pan_anchor_.x - c.x;
            int dy = pan_anchor_.y - c.y;
            pan_anchor_ = c;
            if (dx == 0 && dy == 0) return {};
            session_.viewport().pan(dx, dy);
            return {true};
        }
        case InteractionState::NodeSelected: {
            if (drag_source_ == kInvalidId) return {};
            auto under = session_.hits().node_at(c);
            if (under && *under == drag_source_) return {};
            state_ = InteractionState::EdgeDrawing;
            rubber_to_ = c;
            return {true};
        }
        case InteractionState::EdgeDrawing:
            if (c == rubber_to_) return {};
            rubber_to_ = c;
            return {true};
        default:
            return {};
    }
}

ControllerOutcome InteractionController::pointer_release(CellPos c) {
    pressed_ = false;
    switch (state_) {
        case InteractionState::Panning:
            state_ = InteractionState::Idle;
            return {};
        case InteractionState::EdgeDrawing:
            return finish_edge(c);
        case InteractionState::NodeSelected:
            drag_source_ = kInvalidId;
            return {};
        default:
            return {};
    }
}

ControllerOutcome InteractionController::finish_edge(CellPos c) {
    const NodeId source = drag_source_;
    drag_source_ = kInvalidId;
    GraphModel& graph = session_.graph();
    auto target = session_.hits().node_at(c);

    if (target && *target == source) {
        state_ = InteractionState::NodeSelected;
        return {true};
    }
    if (target && graph.has_node(source) && graph.has_node(*target)) {
        if (graph.find_edge(source, *target)) {
            session_.set_status("Edge " + node_name(source) + " - " +
                                    node_name(*target) + " already exists",
                                StatusLevel::Warning);
        } else {
            EdgeId id = graph.add_edge(source, *target);
            session_.log().info("Created edge {} ({} - {})", id, source, *target);
            session_.set_status("Edge " + node_name(source) + " - " +
                                node_name(*target) + " created");
        }
    }
    deselect();
    state_ = InteractionState::Idle;
    return {true};
}

// ---------------------------------------------------------------------------
// Actions
// ---------------------------------------------------------------------------
ControllerOutcome InteractionController::pan(int dx, int dy) {
    session_.viewport().pan(dx, dy);
    return {true};
}

ControllerOutcome InteractionController::zoom_by(double factor, CellPos anchor) {
    return {session_.viewport().zoom(factor, anchor)};
}

ControllerOutcome InteractionController::move_cursor(int dx, int dy) {
    CellPos next = clamp_to_canvas({cursor_.x + dx, cursor_.y + dy});
    if (next == cursor_) return {};
    cursor_ = next;
    if (grab_) pointer_drag(cursor_);
    return {true};
}

ControllerOutcome InteractionController::toggle_grab() {
    grab_ = !grab_;
    if (grab_) {
        pointer_press(cursor_);
    } else {
        pointer_release(cursor_);
    }
    return {true};
}

ControllerOutcome InteractionController::cancel() {
    pressed_ = false;
    grab_ = false;
    switch (state_) {
        case InteractionState::EdgeDrawing:
            drag_source_ = kInvalidId;
            state_ = InteractionState::NodeSelected;
            return {true};
        case InteractionState::Panning:
            state_ = InteractionState::Idle;
            return {true};
        default: {
            bool had_selection = deselect();
            state_ = InteractionState::Idle;
            return {had_selection};
        }
    }
}

ControllerOutcome InteractionController::create_node() {
    GraphModel& graph = session_.graph();
    NodeId id = graph.add_node("", session_.viewport().unproject(cursor_));
    graph.set_label(id, "n" + std::to_string(id));
    session_.log().info("Created node {} at cell ({}, {})", id, cursor_.x, cursor_.y);
    select_node(id);
    editing_node_ = id;
    edit_buffer_ = graph.node(id).label;
    state_ = InteractionState::Editing;
    return {true};
}

ControllerOutcome InteractionController::begin_edit() {
    if (!selected_node_) {
        session_.set_status("Select a node to edit its label");
        return {true};
    }
    editing_node_ = *selected_node_;
    edit_buffer_ = session_.graph().node(editing_node_).label;
    pressed_ = false;
    grab_ = false;
    state_ = InteractionState::Editing;
    return {true};
}

ControllerOutcome InteractionController::delete_selection() {
    GraphModel& graph = session_.graph();
    if (selected_node_) {
        NodeId id = *selected_node_;
        std::string name = node_name(id);
        deselect();
        graph.remove_node(id);
        session_.log().info("Deleted node {} '{}'", id, name);
        session_.set_status("Deleted node " + name);
    } else if (selected_edge_) {
        EdgeId id = *selected_edge_;
        deselect();
        graph.remove_edge(id);
        session_.log().info("Deleted edge {}", id);
        session_.set_status("Deleted edge");
    } else {
        session_.set_status("Nothing selected");
        return {true};
    }
    pressed_ = false;
    grab_ = false;
    state_ = InteractionState::Idle;
    return {true};
}

ControllerOutcome InteractionController::toggle_pin() {
    if (!selected_node_) {
        session_.set_status("Select a node to pin it");
        return {true};
    }
    GraphModel& graph = session_.graph();
    bool pinned = !graph.node(*selected_node_).state.pinned;
    graph.set_pinned(*selected_node_, pinned);
    session_.set_status((pinned ? "Pinned " : "Unpinned ") + node_name(*selected_node_));
    return {true};
}

ControllerOutcome InteractionController::nudge(int dx, int dy) {
    if (!selected_node_) return {};
    GraphModel& graph = session_.graph();
    const double scale = session_.viewport().scale();
    Vec2 pos = graph.node(*selected_node_).position + Vec2(dx / scale, dy / scale);
    graph.set_position(*selected_node_, pos);
    graph.set_pinned(*selected_node_, true);
    session_.layout().invalidate();
    return {true};
}

ControllerOutcome InteractionController::select_next() {
    std::vector<NodeId> ids = session_.graph().node_ids();
    if (ids.empty()) return {};
    NodeId next = ids.front();
    if (selected_node_) {
        auto it = std::upper_bound(ids.begin(), ids.end(), *selected_node_);
        if (it != ids.end()) next = *it;
    }
    select_node(next);
    state_ = InteractionState::NodeSelected;
    return {true};
}

ControllerOutcome InteractionController::relayout() {
    session_.layout().relayout(session_.graph());
    session_.log().info("Relayout requested");
    session_.set_status("Relayout");
    return {true};
}

ControllerOutcome InteractionController::save_edge_list() {
    session_.save_edge_list();
    return {true};
}

ControllerOutcome InteractionController::save_snapshot() {
    session_.save_snapshot();
    return {true};
}

// ---------------------------------------------------------------------------
// Context menu
// ---------------------------------------------------------------------------
ControllerOutcome InteractionController::open_menu(CellPos c) {
    const HitMap& hits = session_.hits();
    std::string title;
    std::vector<std::string> items;
    menu_actions_.clear();
    pressed_ = false;
    grab_ = false;
    cursor_ = c;

    auto add = [&](const std::string& item, MenuAction action) {
        items.push_back(item);
        menu_actions_.push_back(action);
    };

    const GraphModel& graph = session_.graph();
    auto n = hits.node_at(c);
    auto e = hits.edge_at(c);
    if (n && graph.has_node(*n)) {
        select_node(*n);
        menu_return_ = InteractionState::NodeSelected;
        title = node_name(*n);
        add("Edit label", MenuAction::EditLabel);
        add(graph.node(*n).state.pinned ? "Unpin" : "Pin",
            MenuAction::TogglePin);
        add("Delete node", MenuAction::DeleteNode);
    } else if (e && graph.has_edge(*e)) {
        select_edge(*e);
        menu_return_ = InteractionState::EdgeSelected;
        const Edge& edge = graph.edge(*e);
        title = node_name(edge.from) + " - " + node_name(edge.to);
        add("Delete edge", MenuAction::DeleteEdge);
    } else {
        menu_return_ = selected_node_   ? InteractionState::NodeSelected
                       : selected_edge_ ? InteractionState::EdgeSelected
                                        : InteractionState::Idle;
        title = "Graph";
        add("New node here", MenuAction::NewNode);
        add("Center view", MenuAction::CenterView);
        add("Relayout", MenuAction::Relayout);
        add("Save edge list", MenuAction::SaveEdgeList);
        add("Write snapshot", MenuAction::SaveSnapshot);
    }
    add("Close", MenuAction::Close);

    const Viewport& vp = session_.viewport();
    menu_.open(title, std::move(items), c, vp.cols(), vp.rows());
    state_ = InteractionState::Menu;
    return {true};
}

ControllerOutcome InteractionController::menu_press(CellPos c) {
    if (!menu_.is_focused(c)) {
        close_menu();
        return {true};
    }
    int index = menu_.item_at(c);
    if (index < 0) return {};
    return activate(index);
}

ControllerOutcome InteractionController::activate(int index) {
    MenuAction action = menu_actions_.at(static_cast<std::size_t>(index));
    close_menu();
    switch (action) {
        case MenuAction::NewNode: return create_node();
        case MenuAction::EditLabel: return begin_edit();
        case MenuAction::TogglePin: return toggle_pin();
        case MenuAction::DeleteNode:
        case MenuAction::DeleteEdge: return delete_selection();
        case MenuAction::CenterView:
            session_.center_view();
            return {true};
        case MenuAction::Relayout: return relayout();
        case MenuAction::SaveEdgeList: return save_edge_list();
        case MenuAction::SaveSnapshot: return save_snapshot();
        case MenuAction::Close: return {true};
    }
    return {true};
}

void InteractionController::close_menu() {
    menu_.close();
    menu_actions_.clear();
    if (state_ == InteractionState::Menu) state_ = menu_return_;
}

// ---------------------------------------------------------------------------
// Selection
// ---------------------------------------------------------------------------
void InteractionController::select_node(NodeId id) {
    GraphModel& graph = session_.graph();
    graph.clear_selection();
    graph.set_selected(id, true);
    for (NodeId n : graph.neighbors(id)) {
        graph.set_highlighted(n, true);
    }
    selected_node_ = id;
    selected_edge_.reset();
}

void InteractionController::select_edge(EdgeId id) {
    GraphModel& graph = session_.graph();
    graph.clear_selection();
    graph.set_edge_selected(id, true);
    selected_edge_ = id;
    selected_node_.reset();
}

bool InteractionController::deselect() {
    bool had = session_.graph().clear_selection();
    had = had || selected_node_ || selected_edge_;
    selected_node_.reset();
    selected_edge_.reset();
    return had;
}

CellPos InteractionController::clamp_to_canvas(CellPos c) const {
    const Viewport& vp = session_.viewport();
    return {std::clamp(c.x, 0, std::max(0, vp.cols() - 1)),
            std::clamp(c.y, 0, std::max(0, vp.rows() - 1))};
}

std::string InteractionController::node_name(NodeId id) const {
    const GraphModel& graph = session_.graph();
    return graph.has_node(id) ? graph.node(id).display_label() : "#" + std::to_string(id);
}

} // namespace graphos
