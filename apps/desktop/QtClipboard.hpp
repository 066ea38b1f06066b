#ifndef QTCLIPBOARD_HPP
#define QTCLIPBOARD_HPP
#include <QClipboard>
#include <QGuiApplication>
#include <QString>
#include <string>

#include "core/view/Clipboard.hpp"

// System clipboard through Qt. Writes also go to the X11 primary selection
// where the platform has one.
class QtClipboard : public ct::Clipboard {
public:
  bool available() const override {
    const QString platform = QGuiApplication::platformName();
    if (platform == QStringLiteral("offscreen") || platform == QStringLiteral("minimal"))
      return false;
    return QGuiApplication::clipboard() != nullptr;
  }

  bool setText(const std::string &text) override {
    QClipboard *clipboard = QGuiApplication::clipboard();
    if (!clipboard)
      return false;
    const QString value = QString::fromStdString(text);
    clipboard->setText(value, QClipboard::Clipboard);
    if (clipboard->supportsSelection())
      clipboard->setText(value, QClipboard::Selection);
    return true;
  }

  std::string text() const override {
    QClipboard *clipboard = QGuiApplication::clipboard();
    if (!clipboard)
      return std::string();
    return clipboard->text(QClipboard::Clipboard).toStdString();
  }
};

#endif // QTCLIPBOARD_HPP
