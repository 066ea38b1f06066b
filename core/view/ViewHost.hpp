#pragma once
#include <functional>
#include <memory>
#include <string>

#include "core/Errors.hpp"

namespace ct {

// The rendering surface behind one tab. The concrete implementation embeds a
// web engine; the core only drives it through this interface.
class ViewHost {
public:
    virtual ~ViewHost() = default;

    // Fire-and-forget; loading happens asynchronously inside the host.
    virtual void navigate(const std::string &url) = 0;

    virtual void focus() = 0;

    // Dispatches the platform paste shortcut to the focused page. Returns
    // false when the host cannot deliver a paste.
    virtual bool paste() = 0;

    // Types the text as synthetic key events, one per character. Returns
    // false when the events could not be delivered.
    virtual bool injectText(const std::string &text) = 0;
};

// Creates the host for a new session. May return nullptr or throw
// ViewHostError; either way only the openSession call that asked fails.
using ViewHostFactory = std::function<std::unique_ptr<ViewHost>(SessionId id)>;

} // namespace ct
