#pragma once
#include <string>

#include "core/Errors.hpp"
#include "core/tabs/TabManager.hpp"
#include "core/view/Clipboard.hpp"
#include "utils/Logger.hpp"

namespace ct {

enum class InjectionMethod { None, ClipboardPaste, Keystrokes };

inline const char *methodName(InjectionMethod method) {
    switch (method) {
    case InjectionMethod::None:
        return "none";
    case InjectionMethod::ClipboardPaste:
        return "clipboard paste";
    case InjectionMethod::Keystrokes:
        return "keystrokes";
    }
    return "none";
}

// Delivers text to the active session's view. The clipboard is tried first
// (set text, then paste); when the clipboard or the paste is unavailable the
// text is typed as keystrokes instead.
class InputInjector {
public:
    // clipboard may be null when the environment has none.
    InputInjector(TabManager &tabs, Clipboard *clipboard)
        : m_tabs(tabs), m_clipboard(clipboard) {}

    // Throws NoActiveSession or InjectionError.
    InjectionMethod inject(const std::string &text) {
        Session *session = m_tabs.activeSession();
        if (!session)
            throw NoActiveSession();
        return deliver(*session, text);
    }

    // Same as inject() but for a caller that names its target. Anything but
    // the active session is refused.
    InjectionMethod injectInto(SessionId target, const std::string &text) {
        Session *session = m_tabs.activeSession();
        if (!session)
            throw NoActiveSession();
        if (session->id() != target)
            throw InjectionError("session " + std::to_string(target) +
                                 " is not the active session");
        return deliver(*session, text);
    }

    bool clipboardAvailable() const { return m_clipboard && m_clipboard->available(); }

private:
    InjectionMethod deliver(Session &session, const std::string &text) {
        if (text.empty())
            return InjectionMethod::None;
        ViewHost &view = session.view();
        view.focus();

        if (clipboardAvailable()) {
            if (m_clipboard->setText(text) && m_clipboard->text() == text) {
                if (view.paste()) {
                    CT_SESSION_LOG(LogLevel::Debug, session.id(),
                                   "Pasted " + std::to_string(text.size()) + " bytes");
                    return InjectionMethod::ClipboardPaste;
                }
                CT_SESSION_LOG(LogLevel::Warn, session.id(), "Paste not delivered; typing text instead");
            } else {
                CT_SESSION_LOG(LogLevel::Warn, session.id(), "Clipboard rejected text; typing text instead");
            }
        }

        if (!view.injectText(text))
            throw InjectionError("text could not be delivered to session " +
                                 std::to_string(session.id()));
        CT_SESSION_LOG(LogLevel::Debug, session.id(), "Typed " + std::to_string(text.size()) + " bytes");
        return InjectionMethod::Keystrokes;
    }

    TabManager &m_tabs;
    Clipboard *m_clipboard;
};

} // namespace ct
