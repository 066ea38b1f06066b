#pragma once
#include <string>

namespace ct {

// System clipboard as seen by the injector.
class Clipboard {
public:
    virtual ~Clipboard() = default;

    // False when the hosting environment has no usable clipboard.
    virtual bool available() const = 0;

    // Returns false if the text could not be placed on the clipboard.
    virtual bool setText(const std::string &text) = 0;

    virtual std::string text() const = 0;
};

} // namespace ct
