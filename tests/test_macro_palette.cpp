#include "Fakes.hpp"
#include "core/config/ConfigStore.hpp"
#include "core/input/InputInjector.hpp"
#include "core/palette/MacroPalette.hpp"
#include <cassert>
#include <string>
#include <vector>

int main() {
    const ct::Configuration cfg = ct::ConfigStore::parseDocument(
        R"({"home_url": "https://gateway.test/", "macros": [
              {"name": "1", "text": "sebastian.garcia"},
              {"name": "4", "text": "sudo apt update"},
              {"name": "4", "text": "duplicate names are allowed"}]})");

    FakeViewFactory factory;
    auto tabs = makeTabs(factory);
    FakeClipboard clipboard;
    ct::InputInjector injector(tabs, &clipboard);
    ct::MacroPalette palette(injector);

    std::vector<std::string> notices;
    int renders = 0;
    palette.setNoticeHandler([&](const std::string &msg) { notices.push_back(msg); });
    palette.setRenderHandler([&] { ++renders; });

    palette.render(cfg);
    assert(renders == 1);
    assert(palette.size() == 3);
    assert(palette.entries()[0].macro.name == "1");
    assert(palette.entries()[1].displayText == "sudo apt update");
    assert(palette.indexOf("4") == 1u);
    assert(!palette.indexOf("missing"));

    // No session: a notice naming the action, no exception.
    assert(!palette.activateByName("4"));
    assert(notices.size() == 1);
    assert(notices[0].find("Could not paste macro \"4\"") == 0);
    assert(clipboard.text().empty());

    // One session, activate "4": clipboard holds the text, the view got a paste.
    ct::SessionId id = tabs.openSession();
    assert(palette.activateByName("4"));
    assert(clipboard.text() == "sudo apt update");
    assert(factory.record(id)->pasteCount == 1);
    assert(notices.size() == 1);

    // Edits to the shown text are visual only.
    palette.editDisplay(0, "someone.else");
    assert(palette.entries()[0].displayText == "someone.else");
    assert(palette.activate(0));
    assert(clipboard.text() == "sebastian.garcia");
    assert(cfg.macros[0].text == "sebastian.garcia");
    palette.render(cfg);
    assert(palette.entries()[0].displayText == "sebastian.garcia");
    assert(renders == 2);

    // Out of range and unknown names are harmless.
    assert(!palette.activate(17));
    assert(!palette.activateByName("nope"));
    assert(notices.size() == 2);

    // Delivery failure becomes a notice too.
    factory.pasteWorks = false;
    factory.typingWorks = false;
    tabs.openSession();
    assert(!palette.activate(1));
    assert(notices.size() == 3);
    assert(notices.back() == "Could not paste macro \"4\"");

    // Rendering an empty configuration clears the bar.
    palette.render(ct::defaultConfiguration());
    assert(palette.size() == 0);
    return 0;
}
