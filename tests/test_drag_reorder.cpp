#include "Fakes.hpp"
#include "core/input/DragReorderController.hpp"
#include <cassert>
#include <vector>

namespace {

// Three 100px tabs in a 400x30 strip.
ct::TabStripLayout stripFor(const ct::TabManager &tabs) {
    ct::TabStripLayout layout;
    layout.strip = {0.f, 0.f, 400.f, 30.f};
    for (int i = 0; i < tabs.count(); ++i)
        layout.slots.push_back({tabs.sessionAt(i)->id(), {100.f * i, 0.f, 100.f, 30.f}});
    return layout;
}

} // namespace

int main() {
    FakeViewFactory factory;
    auto tabs = makeTabs(factory);
    ct::SessionId a = tabs.openSession();
    ct::SessionId b = tabs.openSession();
    ct::SessionId c = tabs.openSession();

    int reorderCalls = 0;
    ct::DragReorderController drag([&](ct::SessionId id, int index) {
        ++reorderCalls;
        tabs.reorder(id, index);
    });
    assert(drag.state() == ct::DragState::Idle);

    // Dropping outside the strip cancels and keeps [A,B,C].
    assert(drag.pointerDown({250.f, 15.f}, stripFor(tabs)));
    assert(drag.sourceId() == c);
    drag.pointerMove({40.f, 15.f});
    assert(drag.candidateIndex() == 0);
    assert(drag.pointerUp({40.f, 200.f}) == ct::DragOutcome::Cancelled);
    assert(drag.state() == ct::DragState::Idle);
    assert(reorderCalls == 0);
    assert((tabs.order() == std::vector<ct::SessionId>{a, b, c}));

    // Leaving the strip cancels at once; coming back and releasing over the
    // first slot does not revive the gesture.
    assert(drag.pointerDown({250.f, 15.f}, stripFor(tabs)));
    assert(drag.pointerMove({250.f, 200.f}) == ct::DragOutcome::Cancelled);
    assert(drag.state() == ct::DragState::Idle);
    assert(drag.candidateIndex() == -1);
    assert(drag.pointerMove({10.f, 15.f}) == ct::DragOutcome::None);
    assert(drag.pointerUp({10.f, 15.f}) == ct::DragOutcome::None);
    assert(reorderCalls == 0);
    assert((tabs.order() == std::vector<ct::SessionId>{a, b, c}));

    // Dragging C to index 0 yields [C,A,B], with one reorder for many moves.
    assert(drag.pointerDown({250.f, 15.f}, stripFor(tabs)));
    assert(drag.pointerOffset().x == 50.f);
    for (float x = 250.f; x >= 10.f; x -= 5.f)
        drag.pointerMove({x, 12.f});
    assert(reorderCalls == 0);
    assert(drag.pointerUp({10.f, 12.f}) == ct::DragOutcome::Dropped);
    assert(reorderCalls == 1);
    assert((tabs.order() == std::vector<ct::SessionId>{c, a, b}));

    // Releasing again without a new press does nothing.
    assert(drag.pointerUp({10.f, 12.f}) == ct::DragOutcome::None);
    assert(reorderCalls == 1);

    // Midpoint rule: the neighbour's slot is claimed only past its midpoint.
    assert(drag.pointerDown({20.f, 10.f}, stripFor(tabs))); // C at 0
    drag.pointerMove({149.f, 10.f});
    assert(drag.candidateIndex() == 0);
    drag.pointerMove({151.f, 10.f});
    assert(drag.candidateIndex() == 1);
    drag.pointerMove({251.f, 10.f});
    assert(drag.candidateIndex() == 2);
    drag.pointerMove({380.f, 10.f}); // past the last tab, still inside the strip
    assert(drag.candidateIndex() == 2);
    drag.pointerMove({160.f, 10.f});
    assert(drag.candidateIndex() == 1);
    assert(drag.pointerUp({160.f, 10.f}) == ct::DragOutcome::Dropped);
    assert((tabs.order() == std::vector<ct::SessionId>{a, c, b}));
    assert(reorderCalls == 2);

    // Explicit cancel mid-drag.
    assert(drag.pointerDown({120.f, 10.f}, stripFor(tabs)));
    drag.pointerMove({10.f, 10.f});
    assert(drag.cancel() == ct::DragOutcome::Cancelled);
    assert(!drag.dragging());
    assert(drag.cancel() == ct::DragOutcome::None);
    assert(reorderCalls == 2);

    // A press between tabs or outside them starts nothing.
    assert(!drag.pointerDown({350.f, 10.f}, stripFor(tabs)));
    assert(!drag.dragging());

    // A click without movement drops on its own slot: no visible change.
    assert(drag.pointerDown({120.f, 10.f}, stripFor(tabs)));
    assert(drag.pointerUp({121.f, 10.f}) == ct::DragOutcome::Dropped);
    assert(reorderCalls == 3);
    assert((tabs.order() == std::vector<ct::SessionId>{a, c, b}));

    // Vertical strips use the y axis.
    ct::TabStripLayout vertical;
    vertical.orientation = ct::Orientation::Vertical;
    vertical.strip = {0.f, 0.f, 80.f, 300.f};
    for (int i = 0; i < tabs.count(); ++i)
        vertical.slots.push_back({tabs.sessionAt(i)->id(), {0.f, 100.f * i, 80.f, 100.f}});
    assert(drag.pointerDown({40.f, 250.f}, vertical)); // B
    drag.pointerMove({40.f, 10.f});
    assert(drag.candidateIndex() == 0);
    drag.pointerUp({40.f, 10.f});
    assert((tabs.order() == std::vector<ct::SessionId>{b, a, c}));
    return 0;
}
