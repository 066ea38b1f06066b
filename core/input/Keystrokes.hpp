#pragma once
#include <string>
#include <vector>

#include <QString>
#include <QVector>

namespace ct {

enum class KeyKind { Character, Enter, Tab, Backspace, Escape };

struct Keystroke {
    KeyKind kind;
    char32_t codepoint;
};

// Splits UTF-8 text into the key presses that would type it. Control
// characters with a key of their own map to that key, one press per
// character, so "\r\n" is two Enters. Everything else, including other
// control characters, is sent literally.
inline std::vector<Keystroke> keystrokesFor(const std::string &text) {
    const QVector<uint> codepoints = QString::fromStdString(text).toUcs4();
    std::vector<Keystroke> keys;
    keys.reserve(static_cast<std::size_t>(codepoints.size()));
    for (int i = 0; i < codepoints.size(); ++i) {
        const char32_t cp = static_cast<char32_t>(codepoints[i]);
        switch (cp) {
        case U'\r':
        case U'\n':
            keys.push_back({KeyKind::Enter, cp});
            break;
        case U'\t':
            keys.push_back({KeyKind::Tab, cp});
            break;
        case U'\b':
            keys.push_back({KeyKind::Backspace, cp});
            break;
        case 0x1b:
            keys.push_back({KeyKind::Escape, cp});
            break;
        default:
            keys.push_back({KeyKind::Character, cp});
            break;
        }
    }
    return keys;
}

} // namespace ct
