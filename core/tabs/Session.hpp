#pragma once
#include <memory>
#include <string>
#include <utility>

#include "core/Errors.hpp"
#include "core/view/ViewHost.hpp"

namespace ct {

// One open tab. The session owns its view; destroying the session releases
// the view. position is maintained by TabManager and always equals the
// session's index in the tab order.
class Session {
public:
    Session(SessionId id, std::string url, std::unique_ptr<ViewHost> view)
        : m_id(id), m_title(url), m_url(std::move(url)), m_view(std::move(view)) {}

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    SessionId id() const { return m_id; }
    const std::string &title() const { return m_title; }
    const std::string &url() const { return m_url; }
    int position() const { return m_position; }
    ViewHost &view() const { return *m_view; }

private:
    friend class TabManager;

    SessionId m_id;
    std::string m_title;
    std::string m_url;
    int m_position{0};
    std::unique_ptr<ViewHost> m_view;
};

} // namespace ct
