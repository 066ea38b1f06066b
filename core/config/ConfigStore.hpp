#pragma once

#include <initializer_list>
#include <memory>
#include <string>
#include <utility>

#include <QByteArray>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QStandardPaths>
#include <QString>
#include <QUrl>

#include "core/Errors.hpp"
#include "core/config/Configuration.hpp"
#include "utils/Logger.hpp"

namespace ct {

// Owns the process-wide configuration snapshot. Consumers get an immutable
// shared snapshot; load() and reload() either swap in a fully validated
// configuration or leave the current one untouched.
class ConfigStore {
public:
  struct Paths {
    QString installPath;
    QString userPath;
  };

  static Paths defaultPaths() {
    Paths paths;
    paths.installPath = QDir(QCoreApplication::applicationDirPath())
                            .filePath(QStringLiteral("config/config.json"));
    const QString userDir =
        QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (!userDir.isEmpty())
      paths.userPath = QDir(userDir).filePath(QStringLiteral("config.json"));
    return paths;
  }

  ConfigStore() : m_snapshot(std::make_shared<const Configuration>(defaultConfiguration())) {}

  explicit ConfigStore(Paths paths)
      : m_paths(std::move(paths)),
        m_snapshot(std::make_shared<const Configuration>(defaultConfiguration())) {}

  // The user file takes precedence over the installation file. Returns an
  // empty string when neither exists.
  QString resolvePath() const {
    if (!m_paths.userPath.isEmpty() && QFileInfo::exists(m_paths.userPath))
      return m_paths.userPath;
    if (!m_paths.installPath.isEmpty() && QFileInfo::exists(m_paths.installPath))
      return m_paths.installPath;
    return QString();
  }

  // Loads the given file and makes it the current snapshot. Throws
  // ConfigError and keeps the previous snapshot on failure.
  std::shared_ptr<const Configuration> load(const QString &path) {
    auto next = std::make_shared<const Configuration>(parseFile(path));
    m_snapshot = std::move(next);
    m_activePath = path;
    CT_LOG(LogLevel::Info, "Loaded configuration from " + path.toStdString() +
                               " (" + std::to_string(m_snapshot->macros.size()) +
                               " macros)");
    return m_snapshot;
  }

  // Startup load. A missing file is the first-run case and yields the
  // default configuration; a present but invalid file throws ConfigError.
  std::shared_ptr<const Configuration> loadInitial() {
    const QString path = resolvePath();
    if (path.isEmpty()) {
      CT_LOG(LogLevel::Info, "No configuration file found; using defaults");
      m_snapshot = std::make_shared<const Configuration>(defaultConfiguration());
      m_activePath.clear();
      return m_snapshot;
    }
    return load(path);
  }

  // Re-reads the configuration. On failure the previous snapshot stays
  // active and the reason is written to *error.
  bool reload(std::string *error = nullptr) {
    QString path = resolvePath();
    try {
      if (path.isEmpty()) {
        if (!m_activePath.isEmpty())
          throw ConfigError(m_activePath.toStdString(), "configuration file is missing");
        m_snapshot = std::make_shared<const Configuration>(defaultConfiguration());
        return true;
      }
      load(path);
      return true;
    } catch (const ConfigError &e) {
      CT_LOG(LogLevel::Warn, std::string("Configuration reload failed: ") + e.what());
      if (error)
        *error = e.what();
      return false;
    }
  }

  std::shared_ptr<const Configuration> snapshot() const { return m_snapshot; }

  const QString &activePath() const { return m_activePath; }

  const Paths &paths() const { return m_paths; }

  static Configuration parseFile(const QString &path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
      throw ConfigError(path.toStdString(), "cannot open configuration file");
    const QByteArray data = file.readAll();
    file.close();
    return parseDocument(data, path);
  }

  static Configuration parseDocument(const QByteArray &data,
                                     const QString &source = QStringLiteral("configuration")) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError)
      throw ConfigError(source.toStdString(),
                        "invalid JSON: " + parseError.errorString().toStdString());
    if (!doc.isObject())
      throw ConfigError(source.toStdString(), "top level must be a JSON object");
    const QJsonObject obj = doc.object();

    Configuration cfg;
    cfg.homeUrl = parseHomeUrl(obj.value(QStringLiteral("home_url")));

    const QJsonValue macros = obj.value(QStringLiteral("macros"));
    if (macros.isUndefined() || macros.isNull())
      return cfg;
    if (!macros.isArray())
      throw ConfigError("macros", "must be an array");
    const QJsonArray array = macros.toArray();
    for (int i = 0; i < array.size(); ++i)
      cfg.macros.push_back(parseMacro(array.at(i), i));
    return cfg;
  }

  // Adds https:// to scheme-less values, then requires an absolute URL.
  static std::string normalizeHomeUrl(const QString &raw) {
    QString url = raw.trimmed();
    if (url.isEmpty())
      throw ConfigError("home_url", "must not be empty");
    if (!url.contains(QStringLiteral("://")) && !url.startsWith(QStringLiteral("about:")))
      url.prepend(QStringLiteral("https://"));
    const QUrl parsed(url, QUrl::StrictMode);
    if (!parsed.isValid() || parsed.isRelative())
      throw ConfigError("home_url", "not a valid absolute URL: " + raw.toStdString());
    const QString scheme = parsed.scheme();
    if ((scheme == QStringLiteral("http") || scheme == QStringLiteral("https")) &&
        parsed.host().isEmpty())
      throw ConfigError("home_url", "URL has no host: " + raw.toStdString());
    return parsed.toString().toStdString();
  }

private:
  static std::string parseHomeUrl(const QJsonValue &value) {
    if (value.isUndefined() || value.isNull())
      throw ConfigError("home_url", "required field is missing");
    if (!value.isString())
      throw ConfigError("home_url", "must be a string");
    return normalizeHomeUrl(value.toString());
  }

  static QJsonValue firstPresent(const QJsonObject &obj, std::initializer_list<const char *> keys) {
    for (const char *key : keys) {
      const QJsonValue v = obj.value(QLatin1String(key));
      if (!v.isUndefined() && !v.isNull())
        return v;
    }
    return QJsonValue(QJsonValue::Undefined);
  }

  static MacroDef parseMacro(const QJsonValue &entry, int index) {
    const std::string prefix = "macros[" + std::to_string(index) + "]";
    if (!entry.isObject())
      throw ConfigError(prefix, "must be an object");
    const QJsonObject obj = entry.toObject();

    const QJsonValue name = firstPresent(obj, {"name", "label", "button"});
    if (name.isUndefined())
      throw ConfigError(prefix + ".name", "required field is missing");
    if (!name.isString() || name.toString().trimmed().isEmpty())
      throw ConfigError(prefix + ".name", "must be a non-empty string");

    const QJsonValue text = firstPresent(obj, {"text", "macro"});
    if (text.isUndefined())
      throw ConfigError(prefix + ".text", "required field is missing");
    if (!text.isString())
      throw ConfigError(prefix + ".text", "must be a string");

    MacroDef macro;
    macro.name = name.toString().trimmed().toStdString();
    macro.text = text.toString().toStdString();
    return macro;
  }

  Paths m_paths;
  std::shared_ptr<const Configuration> m_snapshot;
  QString m_activePath;
};

} // namespace ct
