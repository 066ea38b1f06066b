#include "core/config/ConfigStore.hpp"
#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <cassert>
#include <string>

namespace {

void writeFile(const QString &path, const QByteArray &data) {
    QFile file(path);
    bool opened = file.open(QIODevice::WriteOnly | QIODevice::Truncate);
    assert(opened);
    (void)opened;
    file.write(data);
}

std::string failingField(const QByteArray &doc) {
    try {
        ct::ConfigStore::parseDocument(doc);
    } catch (const ct::ConfigError &e) {
        return e.field();
    }
    return std::string();
}

} // namespace

int main() {
    // Well-formed document keeps macro order.
    ct::Configuration cfg = ct::ConfigStore::parseDocument(
        R"({"home_url": "https://gw.example.com/", "macros": [
              {"name": "1", "text": "sebastian.garcia"},
              {"name": "4", "text": "sudo apt update"}]})");
    assert(cfg.homeUrl == "https://gw.example.com/");
    assert(cfg.macros.size() == 2);
    assert(cfg.macros[0].name == "1" && cfg.macros[0].text == "sebastian.garcia");
    assert(cfg.macros[1].name == "4" && cfg.macros[1].text == "sudo apt update");

    // Missing or unusable home_url is reported by name.
    assert(failingField(R"({"macros": []})") == "home_url");
    assert(failingField(R"({"home_url": 42})") == "home_url");
    assert(failingField(R"({"home_url": "   "})") == "home_url");
    assert(failingField(R"({"home_url": "http://"})") == "home_url");

    // Malformed macro entries name the entry and the field.
    assert(failingField(R"({"home_url": "https://a.b", "macros": [{"name": "x", "text": "y"}, {"name": "z"}]})") ==
           "macros[1].text");
    assert(failingField(R"({"home_url": "https://a.b", "macros": [{"text": "y"}]})") == "macros[0].name");
    assert(failingField(R"({"home_url": "https://a.b", "macros": ["plain"]})") == "macros[0]");
    assert(failingField(R"({"home_url": "https://a.b", "macros": {"name": "x"}})") == "macros");
    assert(failingField("[1, 2]") == "configuration");
    assert(failingField("{not json") == "configuration");

    // Scheme-less URLs get https, alias keys are accepted, macros are optional.
    cfg = ct::ConfigStore::parseDocument(
        R"({"home_url": "gw.example.com/guacamole", "macros": [{"label": "ls", "macro": "ls -la\n"}]})");
    assert(cfg.homeUrl == "https://gw.example.com/guacamole");
    assert(cfg.macros.size() == 1 && cfg.macros[0].name == "ls" && cfg.macros[0].text == "ls -la\n");
    cfg = ct::ConfigStore::parseDocument(R"({"home_url": "http://localhost:8080/"})");
    assert(cfg.macros.empty());

    QTemporaryDir dir;
    assert(dir.isValid());
    const QString installPath = dir.filePath(QStringLiteral("install.json"));
    const QString userPath = dir.filePath(QStringLiteral("user.json"));

    // First run: no file anywhere gives the defaults instead of an error.
    ct::ConfigStore store({installPath, userPath});
    auto snap = store.loadInitial();
    assert(snap->homeUrl == ct::kDefaultHomeUrl);
    assert(snap->macros.empty());
    assert(store.activePath().isEmpty());

    // The installation file is used until a user file appears.
    writeFile(installPath, R"({"home_url": "https://install.example/"})");
    snap = store.loadInitial();
    assert(snap->homeUrl == "https://install.example/");
    writeFile(userPath, R"({"home_url": "https://user.example/", "macros": [{"name": "a", "text": "b"}]})");
    assert(store.reload());
    assert(store.snapshot()->homeUrl == "https://user.example/");
    assert(store.activePath() == userPath);

    // A failed load leaves the previous snapshot in place.
    const QString broken = dir.filePath(QStringLiteral("broken.json"));
    writeFile(broken, R"({"macros": []})");
    auto before = store.snapshot();
    bool threw = false;
    try {
        store.load(broken);
    } catch (const ct::ConfigError &e) {
        threw = true;
        assert(e.field() == "home_url");
    }
    assert(threw);
    assert(store.snapshot() == before);
    assert(store.snapshot()->homeUrl == "https://user.example/");

    // Unreadable path names the file.
    threw = false;
    try {
        ct::ConfigStore::parseFile(dir.filePath(QStringLiteral("nope.json")));
    } catch (const ct::ConfigError &e) {
        threw = true;
        assert(e.field().find("nope.json") != std::string::npos);
    }
    assert(threw);
    return 0;
}
