#pragma once
#include <string>
#include <vector>

namespace ct {

// A named text snippet from the configuration file.
struct MacroDef {
    std::string name;
    std::string text;
};

struct Configuration {
    std::string homeUrl;
    std::vector<MacroDef> macros;
};

inline constexpr const char *kDefaultHomeUrl = "https://www.google.com";

// Used when no configuration file exists at all.
inline Configuration defaultConfiguration() {
    Configuration cfg;
    cfg.homeUrl = kDefaultHomeUrl;
    return cfg;
}

} // namespace ct
