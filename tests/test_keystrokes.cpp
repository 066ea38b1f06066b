#include "core/input/Keystrokes.hpp"
#include <cassert>

int main() {
    auto keys = ct::keystrokesFor("ls\n");
    assert(keys.size() == 3);
    assert(keys[0].kind == ct::KeyKind::Character && keys[0].codepoint == U'l');
    assert(keys[1].kind == ct::KeyKind::Character && keys[1].codepoint == U's');
    assert(keys[2].kind == ct::KeyKind::Enter);

    // Every CR and every LF is its own Enter, so CRLF presses it twice.
    keys = ct::keystrokesFor("a\r\nb\rc");
    assert(keys.size() == 6);
    assert(keys[1].kind == ct::KeyKind::Enter && keys[1].codepoint == U'\r');
    assert(keys[2].kind == ct::KeyKind::Enter && keys[2].codepoint == U'\n');
    assert(keys[3].codepoint == U'b');
    assert(keys[4].kind == ct::KeyKind::Enter && keys[4].codepoint == U'\r');
    assert(keys[5].codepoint == U'c');

    keys = ct::keystrokesFor("\t\b\x1b");
    assert(keys.size() == 3);
    assert(keys[0].kind == ct::KeyKind::Tab);
    assert(keys[1].kind == ct::KeyKind::Backspace);
    assert(keys[2].kind == ct::KeyKind::Escape);

    // Multi-byte characters stay whole and in order.
    keys = ct::keystrokesFor("caf\xc3\xa9 \xe2\x82\xac");
    assert(keys.size() == 6);
    assert(keys[3].codepoint == 0xE9);
    assert(keys[4].codepoint == U' ');
    assert(keys[5].codepoint == 0x20AC);

    // Other control characters are passed through literally.
    keys = ct::keystrokesFor(std::string("x\x03y"));
    assert(keys.size() == 3);
    assert(keys[1].kind == ct::KeyKind::Character && keys[1].codepoint == 0x03);

    assert(ct::keystrokesFor("").empty());
    return 0;
}
