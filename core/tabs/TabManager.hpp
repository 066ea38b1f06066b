#pragma once
#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/Errors.hpp"
#include "core/tabs/Session.hpp"
#include "core/view/ViewHost.hpp"
#include "utils/Logger.hpp"

namespace ct {

// Owns the sessions in tab order and the active-session pointer. This is the
// only place either is mutated; the drag controller and the palette request
// changes through the operations below.
class TabManager {
public:
    using HomeUrlProvider = std::function<std::string()>;
    using ChangeHandler = std::function<void()>;

    TabManager(ViewHostFactory factory, HomeUrlProvider homeUrl)
        : m_factory(std::move(factory)), m_homeUrl(std::move(homeUrl)) {}

    TabManager(const TabManager &) = delete;
    TabManager &operator=(const TabManager &) = delete;

    // Called after every change to the order, the active session or a
    // session's title/url. The handler must not call back into mutators.
    void setChangeHandler(ChangeHandler handler) { m_changeHandler = std::move(handler); }

    // Appends a session, makes it active and starts navigation. Throws
    // ViewHostError when no view could be created; state is unchanged then.
    SessionId openSession(const std::optional<std::string> &url = std::nullopt) {
        const std::string target = url && !url->empty() ? *url : m_homeUrl();
        const SessionId id = m_nextId;
        std::unique_ptr<ViewHost> view = m_factory ? m_factory(id) : nullptr;
        if (!view)
            throw ViewHostError("could not create a view for " + target);
        ++m_nextId;

        auto session = std::make_unique<Session>(id, target, std::move(view));
        Session *ptr = session.get();
        m_sessions.push_back(std::move(session));
        renumber();
        m_active = id;
        CT_SESSION_LOG(LogLevel::Info, id, "Opened at " + target);
        ptr->view().navigate(target);
        ptr->view().focus();
        notify();
        return id;
    }

    // Unknown ids are ignored. When the active session closes, the session
    // that slides into its index becomes active, else the one before it.
    void closeSession(SessionId id) {
        auto it = findIt(id);
        if (it == m_sessions.end()) {
            CT_SESSION_LOG(LogLevel::Debug, id, "closeSession: unknown session");
            return;
        }
        const auto index = static_cast<std::size_t>(it - m_sessions.begin());
        const bool wasActive = m_active && *m_active == id;
        std::unique_ptr<Session> closing = std::move(*it);
        m_sessions.erase(it);
        renumber();

        if (wasActive) {
            if (m_sessions.empty()) {
                m_active.reset();
            } else {
                const std::size_t next = std::min(index, m_sessions.size() - 1);
                m_active = m_sessions[next]->id();
                m_sessions[next]->view().focus();
            }
        }
        CT_SESSION_LOG(LogLevel::Info, id, "Closed");
        closing.reset();
        notify();
    }

    // Throws NotFound for an unknown id.
    void activate(SessionId id) {
        Session *session = find(id);
        if (!session)
            throw NotFound(id);
        const bool changed = !m_active || *m_active != id;
        m_active = id;
        session->view().focus();
        if (changed)
            notify();
    }

    // Stable move to newIndex, clamped into range. Returns false for an
    // unknown id or when the session already sits at the target index.
    bool reorder(SessionId id, int newIndex) {
        auto it = findIt(id);
        if (it == m_sessions.end()) {
            CT_SESSION_LOG(LogLevel::Warn, id, "reorder: unknown session");
            return false;
        }
        const int from = static_cast<int>(it - m_sessions.begin());
        const int to = std::clamp(newIndex, 0, static_cast<int>(m_sessions.size()) - 1);
        if (from == to)
            return false;
        if (from < to)
            std::rotate(m_sessions.begin() + from, m_sessions.begin() + from + 1,
                        m_sessions.begin() + to + 1);
        else
            std::rotate(m_sessions.begin() + to, m_sessions.begin() + from,
                        m_sessions.begin() + from + 1);
        renumber();
        CT_SESSION_LOG(LogLevel::Debug, id,
                       "Moved from " + std::to_string(from) + " to " + std::to_string(to));
        notify();
        return true;
    }

    // Starts navigation in an existing session. Throws NotFound.
    void navigate(SessionId id, const std::string &url) {
        Session *session = find(id);
        if (!session)
            throw NotFound(id);
        session->m_url = url;
        session->view().navigate(url);
        notify();
    }

    void navigateHome(SessionId id) { navigate(id, m_homeUrl()); }

    // Records what the view reports; no navigation is started.
    void setTitle(SessionId id, const std::string &title) {
        Session *session = find(id);
        if (!session || session->m_title == title)
            return;
        session->m_title = title;
        notify();
    }

    void setUrl(SessionId id, const std::string &url) {
        Session *session = find(id);
        if (!session || session->m_url == url)
            return;
        session->m_url = url;
        notify();
    }

    Session *find(SessionId id) const {
        auto it = std::find_if(m_sessions.begin(), m_sessions.end(),
                               [id](const std::unique_ptr<Session> &s) { return s->id() == id; });
        return it == m_sessions.end() ? nullptr : it->get();
    }

    Session *sessionAt(int index) const {
        if (index < 0 || index >= count())
            return nullptr;
        return m_sessions[static_cast<std::size_t>(index)].get();
    }

    int indexOf(SessionId id) const {
        Session *session = find(id);
        return session ? session->position() : -1;
    }

    Session *activeSession() const { return m_active ? find(*m_active) : nullptr; }

    std::optional<SessionId> activeId() const { return m_active; }

    int count() const { return static_cast<int>(m_sessions.size()); }

    bool empty() const { return m_sessions.empty(); }

    std::vector<SessionId> order() const {
        std::vector<SessionId> ids;
        ids.reserve(m_sessions.size());
        for (const auto &s : m_sessions)
            ids.push_back(s->id());
        return ids;
    }

    const std::vector<std::unique_ptr<Session>> &sessions() const { return m_sessions; }

private:
    using SessionList = std::vector<std::unique_ptr<Session>>;

    SessionList::iterator findIt(SessionId id) {
        return std::find_if(m_sessions.begin(), m_sessions.end(),
                            [id](const std::unique_ptr<Session> &s) { return s->id() == id; });
    }

    void renumber() {
        for (std::size_t i = 0; i < m_sessions.size(); ++i)
            m_sessions[i]->m_position = static_cast<int>(i);
    }

    void notify() {
        if (m_changeHandler)
            m_changeHandler();
    }

    ViewHostFactory m_factory;
    HomeUrlProvider m_homeUrl;
    ChangeHandler m_changeHandler;
    SessionList m_sessions;
    std::optional<SessionId> m_active;
    SessionId m_nextId{1};
};

} // namespace ct
