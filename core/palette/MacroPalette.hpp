#pragma once
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/Errors.hpp"
#include "core/config/Configuration.hpp"
#include "core/input/InputInjector.hpp"
#include "utils/Logger.hpp"

namespace ct {

// Model behind the macro bar: one entry per configured macro, in order.
// displayText starts as the macro text and may be edited by the user, but
// activation always injects the configured text and render() discards edits.
class MacroPalette {
public:
    struct Entry {
        MacroDef macro;
        std::string displayText;
    };

    using NoticeHandler = std::function<void(const std::string &message)>;
    using RenderHandler = std::function<void()>;

    explicit MacroPalette(InputInjector &injector) : m_injector(injector) {}

    void setNoticeHandler(NoticeHandler handler) { m_notice = std::move(handler); }
    void setRenderHandler(RenderHandler handler) { m_rendered = std::move(handler); }

    // Replaces every entry with the configuration's macros.
    void render(const Configuration &config) {
        std::vector<Entry> next;
        next.reserve(config.macros.size());
        for (const MacroDef &macro : config.macros)
            next.push_back({macro, macro.text});
        m_entries = std::move(next);
        CT_LOG(LogLevel::Debug, "Palette rendered with " + std::to_string(m_entries.size()) + " macros");
        if (m_rendered)
            m_rendered();
    }

    const std::vector<Entry> &entries() const { return m_entries; }

    std::size_t size() const { return m_entries.size(); }

    // First entry with the given name; names are not guaranteed unique.
    std::optional<std::size_t> indexOf(const std::string &name) const {
        for (std::size_t i = 0; i < m_entries.size(); ++i) {
            if (m_entries[i].macro.name == name)
                return i;
        }
        return std::nullopt;
    }

    // Visual-only edit; never written back to the configuration.
    void editDisplay(std::size_t index, std::string text) {
        if (index < m_entries.size())
            m_entries[index].displayText = std::move(text);
    }

    // Injects the macro into the active session. Failures become a notice
    // and a false return; nothing propagates.
    bool activate(std::size_t index) {
        if (index >= m_entries.size()) {
            CT_LOG(LogLevel::Warn, "Macro index " + std::to_string(index) + " out of range");
            return false;
        }
        const MacroDef &macro = m_entries[index].macro;
        try {
            InjectionMethod method = m_injector.inject(macro.text);
            CT_LOG(LogLevel::Info, "Macro \"" + macro.name + "\" delivered via " + methodName(method));
            return true;
        } catch (const NoActiveSession &) {
            CT_LOG(LogLevel::Warn, "Macro \"" + macro.name + "\" activated with no active session");
            notify("Could not paste macro \"" + macro.name + "\": no console tab is open");
        } catch (const Error &e) {
            CT_LOG(LogLevel::Error, "Macro \"" + macro.name + "\" failed: " + e.what());
            notify("Could not paste macro \"" + macro.name + "\"");
        }
        return false;
    }

    bool activateByName(const std::string &name) {
        auto index = indexOf(name);
        if (!index) {
            notify("Could not paste macro \"" + name + "\": no such macro");
            return false;
        }
        return activate(*index);
    }

private:
    void notify(const std::string &message) {
        if (m_notice)
            m_notice(message);
    }

    InputInjector &m_injector;
    std::vector<Entry> m_entries;
    NoticeHandler m_notice;
    RenderHandler m_rendered;
};

} // namespace ct
