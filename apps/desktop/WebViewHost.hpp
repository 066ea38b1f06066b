#ifndef WEBVIEWHOST_HPP
#define WEBVIEWHOST_HPP
#include <QApplication>
#include <QKeyEvent>
#include <QProcess>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QWebEnginePage>
#include <QWebEngineSettings>
#include <QWebEngineView>
#include <QWidget>
#include <functional>
#include <string>
#include <utility>

#include "core/input/Keystrokes.hpp"
#include "core/view/ViewHost.hpp"
#include "utils/Logger.hpp"

// A web view hosting one gateway console. Pages may read and write the
// system clipboard so the gateway can keep the remote clipboard in sync.
class WebViewHost : public QWebEngineView, public ct::ViewHost {
  Q_OBJECT
public:
  using WindowRequestHandler = std::function<QWebEngineView *()>;

  explicit WebViewHost(ct::SessionId id, QWidget *parent = nullptr)
      : QWebEngineView(parent), m_id(id) {
    QWebEngineSettings *settings = page()->settings();
    settings->setAttribute(QWebEngineSettings::JavascriptCanAccessClipboard, true);
    settings->setAttribute(QWebEngineSettings::JavascriptCanPaste, true);
  }

  ct::SessionId sessionId() const { return m_id; }

  void setWindowRequestHandler(WindowRequestHandler handler) {
    m_windowRequest = std::move(handler);
  }

  void navigate(const std::string &url) override {
    setUrl(QUrl(QString::fromStdString(url)));
  }

  void focus() override { setFocus(Qt::OtherFocusReason); }

  bool paste() override {
    if (!page())
      return false;
    page()->triggerAction(QWebEnginePage::Paste);
    return true;
  }

  bool injectText(const std::string &text) override {
    QWidget *target = inputTarget();
    if (!target)
      return false;
    for (const ct::Keystroke &key : ct::keystrokesFor(text))
      postKey(target, key);
    return true;
  }

  // The gateway opens its sidebar on Ctrl+Alt+Shift. xdotool reaches it
  // most reliably; synthetic Qt events are the fallback.
  void sendSidebarChord() {
    focus();
    const int rc = QProcess::execute(QStringLiteral("xdotool"),
                                     {QStringLiteral("key"), QStringLiteral("ctrl+alt+shift")});
    if (rc == 0)
      return;
    CT_LOG(ct::LogLevel::Debug, "xdotool unavailable; sending sidebar chord as key events");
    QWidget *target = inputTarget();
    if (!target)
      return;
    const Qt::Key chord[] = {Qt::Key_Control, Qt::Key_Alt, Qt::Key_Shift};
    Qt::KeyboardModifiers mods = Qt::NoModifier;
    const Qt::KeyboardModifier modFor[] = {Qt::ControlModifier, Qt::AltModifier, Qt::ShiftModifier};
    for (int i = 0; i < 3; ++i) {
      mods |= modFor[i];
      QApplication::postEvent(target, new QKeyEvent(QEvent::KeyPress, chord[i], mods));
    }
    for (int i = 2; i >= 0; --i) {
      mods &= ~modFor[i];
      QApplication::postEvent(target, new QKeyEvent(QEvent::KeyRelease, chord[i], mods));
    }
  }

protected:
  QWebEngineView *createWindow(QWebEnginePage::WebWindowType) override {
    if (!m_windowRequest)
      return nullptr;
    return m_windowRequest();
  }

private:
  // Key events have to reach the render widget, which is the focus proxy.
  QWidget *inputTarget() {
    QWidget *proxy = focusProxy();
    return proxy ? proxy : this;
  }

  static void postKey(QWidget *target, const ct::Keystroke &key) {
    int code = 0;
    QString text;
    switch (key.kind) {
    case ct::KeyKind::Enter:
      code = Qt::Key_Return;
      text = QStringLiteral("\r");
      break;
    case ct::KeyKind::Tab:
      code = Qt::Key_Tab;
      text = QStringLiteral("\t");
      break;
    case ct::KeyKind::Backspace:
      code = Qt::Key_Backspace;
      text = QStringLiteral("\b");
      break;
    case ct::KeyKind::Escape:
      code = Qt::Key_Escape;
      text = QString(QChar(0x1b));
      break;
    case ct::KeyKind::Character: {
      char32_t cp = key.codepoint;
      text = QString::fromUcs4(&cp, 1);
      if (cp < 0x80 && text.at(0).isPrint())
        code = text.at(0).toUpper().unicode();
      break;
    }
    }
    QApplication::postEvent(target, new QKeyEvent(QEvent::KeyPress, code, Qt::NoModifier, text));
    QApplication::postEvent(target, new QKeyEvent(QEvent::KeyRelease, code, Qt::NoModifier, text));
  }

  ct::SessionId m_id;
  WindowRequestHandler m_windowRequest;
};

#endif // WEBVIEWHOST_HPP
