#pragma once
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/Errors.hpp"
#include "core/input/Geometry.hpp"
#include "utils/Logger.hpp"

namespace ct {

struct TabSlot {
    SessionId id;
    Rect bounds;
};

// Snapshot of the tab strip taken when a drag starts. Slots are in tab order.
struct TabStripLayout {
    Rect strip;
    std::vector<TabSlot> slots;
    Orientation orientation{Orientation::Horizontal};
};

enum class DragState { Idle, Dragging };

enum class DragOutcome { None, Dropped, Cancelled };

// Turns one pointer gesture over the tab strip into at most one reorder
// request. Idle -> Dragging on pointer-down over a tab; pointer-up inside the
// strip drops. Leaving the strip, Escape or focus loss cancels, and a
// cancelled gesture stays cancelled until the next pointer-down.
class DragReorderController {
public:
    using ReorderHandler = std::function<void(SessionId id, int newIndex)>;

    explicit DragReorderController(ReorderHandler onReorder)
        : m_onReorder(std::move(onReorder)) {}

    // Returns true if the press landed on a tab and a drag started.
    bool pointerDown(const Point &pos, TabStripLayout layout) {
        if (m_state != DragState::Idle)
            return false;
        for (std::size_t i = 0; i < layout.slots.size(); ++i) {
            const Rect &r = layout.slots[i].bounds;
            if (!r.contains(pos))
                continue;
            m_layout = std::move(layout);
            m_sourceIndex = static_cast<int>(i);
            m_sourceId = m_layout.slots[i].id;
            m_offset = {pos.x - r.x, pos.y - r.y};
            m_pointer = pos;
            m_candidate = m_sourceIndex;
            m_state = DragState::Dragging;
            CT_SESSION_LOG(LogLevel::Debug, m_sourceId, "Drag start");
            return true;
        }
        return false;
    }

    // Leaving the strip ends the gesture; the pointer coming back later
    // does not resume it.
    DragOutcome pointerMove(const Point &pos) {
        if (m_state != DragState::Dragging)
            return DragOutcome::None;
        m_pointer = pos;
        if (!m_layout.strip.contains(pos)) {
            CT_LOG(LogLevel::Debug, "Pointer left the tab strip");
            return cancel();
        }
        m_candidate = candidateFor(pos);
        if (logEnabled(LogLevel::Debug))
            CT_LOG(LogLevel::Debug, "Drag candidate " + std::to_string(m_candidate));
        return DragOutcome::None;
    }

    // Drops when released over the strip, cancels otherwise.
    DragOutcome pointerUp(const Point &pos) {
        if (m_state != DragState::Dragging)
            return DragOutcome::None;
        if (pointerMove(pos) == DragOutcome::Cancelled)
            return DragOutcome::Cancelled;
        const SessionId id = m_sourceId;
        const int target = m_candidate;
        reset();
        CT_SESSION_LOG(LogLevel::Debug, id, "Drop at " + std::to_string(target));
        if (m_onReorder)
            m_onReorder(id, target);
        return DragOutcome::Dropped;
    }

    // Explicit cancel, pointer leaving the strip, focus loss.
    DragOutcome cancel() {
        if (m_state != DragState::Dragging)
            return DragOutcome::None;
        CT_LOG(LogLevel::Debug, "Drag cancelled");
        reset();
        return DragOutcome::Cancelled;
    }

    DragState state() const { return m_state; }
    bool dragging() const { return m_state == DragState::Dragging; }

    std::optional<SessionId> sourceId() const {
        if (m_state != DragState::Dragging)
            return std::nullopt;
        return m_sourceId;
    }

    int sourceIndex() const { return m_sourceIndex; }

    // -1 while idle.
    int candidateIndex() const { return m_state == DragState::Dragging ? m_candidate : -1; }

    // Where the dragged tab's top-left corner should be drawn.
    Point feedbackPosition() const { return {m_pointer.x - m_offset.x, m_pointer.y - m_offset.y}; }

    const Point &pointerOffset() const { return m_offset; }

private:
    static float along(const Point &p, Orientation o) { return o == Orientation::Horizontal ? p.x : p.y; }

    // Midpoint rule: the pointer claims a neighbour's slot once it passes
    // that neighbour's midpoint.
    int candidateFor(const Point &pos) const {
        const float v = along(pos, m_layout.orientation);
        const int n = static_cast<int>(m_layout.slots.size());
        int candidate = m_sourceIndex;
        for (int j = m_sourceIndex + 1; j < n; ++j) {
            if (v > along(m_layout.slots[static_cast<std::size_t>(j)].bounds.center(), m_layout.orientation))
                candidate = j;
            else
                break;
        }
        if (candidate != m_sourceIndex)
            return candidate;
        for (int j = m_sourceIndex - 1; j >= 0; --j) {
            if (v < along(m_layout.slots[static_cast<std::size_t>(j)].bounds.center(), m_layout.orientation))
                candidate = j;
            else
                break;
        }
        return candidate;
    }

    void reset() {
        m_state = DragState::Idle;
        m_layout = TabStripLayout();
        m_sourceIndex = -1;
        m_sourceId = 0;
        m_candidate = -1;
    }

    ReorderHandler m_onReorder;
    DragState m_state{DragState::Idle};
    TabStripLayout m_layout;
    SessionId m_sourceId{0};
    int m_sourceIndex{-1};
    int m_candidate{-1};
    Point m_offset{0.f, 0.f};
    Point m_pointer{0.f, 0.f};
};

} // namespace ct
