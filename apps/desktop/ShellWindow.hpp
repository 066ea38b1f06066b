#ifndef SHELLWINDOW_HPP
#define SHELLWINDOW_HPP
#include <QAction>
#include <QCoreApplication>
#include <QKeySequence>
#include <QMainWindow>
#include <QSignalBlocker>
#include <QStackedWidget>
#include <QStatusBar>
#include <QString>
#include <QTabBar>
#include <QToolBar>
#include <QVBoxLayout>
#include <QVariant>
#include <QWidget>
#include <memory>
#include <optional>
#include <string>

#include "MacroBar.hpp"
#include "QtClipboard.hpp"
#include "TabStripDragFilter.hpp"
#include "WebViewHost.hpp"
#include "core/config/ConfigStore.hpp"
#include "core/input/DragReorderController.hpp"
#include "core/input/InputInjector.hpp"
#include "core/palette/MacroPalette.hpp"
#include "core/tabs/TabManager.hpp"
#include "utils/Logger.hpp"

// Main window: navigation toolbar with the macro bar, the tab strip, and a
// stack holding one web view per session. Every core error raised by a user
// action ends here as a status bar notice.
class ShellWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit ShellWindow(ct::ConfigStore &config, QWidget *parent = nullptr)
      : QMainWindow(parent), m_config(config),
        m_tabs([this](ct::SessionId id) { return createView(id); },
               [this] { return m_config.snapshot()->homeUrl; }),
        m_injector(m_tabs, &m_clipboard), m_palette(m_injector),
        m_drag([this](ct::SessionId id, int index) { m_tabs.reorder(id, index); }) {
    auto *central = new QWidget(this);
    auto *layout = new QVBoxLayout(central);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    m_tabBar = new QTabBar(central);
    m_tabBar->setDocumentMode(true);
    m_tabBar->setTabsClosable(true);
    m_tabBar->setMovable(false);
    m_tabBar->setExpanding(false);
    m_tabBar->setElideMode(Qt::ElideRight);
    layout->addWidget(m_tabBar);

    m_stack = new QStackedWidget(central);
    layout->addWidget(m_stack, 1);
    setCentralWidget(central);

    connect(m_tabBar, &QTabBar::currentChanged, this, &ShellWindow::onTabSelected);
    connect(m_tabBar, &QTabBar::tabCloseRequested, this, &ShellWindow::onTabCloseRequested);
    connect(m_tabBar, &QTabBar::tabBarDoubleClicked, this, [this](int index) {
      if (index == -1)
        openSession();
    });
    m_dragFilter = new TabStripDragFilter(m_tabBar, m_drag);

    setupToolBar();
    setStatusBar(new QStatusBar(this));

    m_tabs.setChangeHandler([this] { syncTabStrip(); });
    m_palette.setNoticeHandler([this](const std::string &msg) { showNotice(msg); });
    m_palette.setRenderHandler([this] { m_macroBar->rebuild(); });
    m_palette.render(*m_config.snapshot());

    if (!m_injector.clipboardAvailable())
      CT_LOG(ct::LogLevel::Warn, "No usable clipboard; macros will be typed as keystrokes");

    resize(1280, 800);
    syncTabStrip();
  }

  // The tab bar outlives the members below; detach it before they go.
  ~ShellWindow() override {
    delete m_dragFilter;
    m_tabBar->disconnect(this);
    m_tabs.setChangeHandler(nullptr);
  }

  void openSession(const std::optional<std::string> &url = std::nullopt) {
    try {
      m_tabs.openSession(url);
    } catch (const ct::Error &e) {
      CT_LOG(ct::LogLevel::Error, std::string("openSession failed: ") + e.what());
      showNotice("Could not open a new console tab");
    }
  }

  void showNotice(const std::string &message) {
    statusBar()->showMessage(QString::fromStdString(message), 5000);
  }

private slots:
  void onTabSelected(int index) {
    const auto id = sessionIdAt(index);
    if (!id)
      return;
    try {
      m_tabs.activate(*id);
    } catch (const ct::NotFound &e) {
      CT_LOG(ct::LogLevel::Warn, e.what());
      syncTabStrip();
    }
  }

  void onTabCloseRequested(int index) {
    if (const auto id = sessionIdAt(index))
      m_tabs.closeSession(*id);
  }

  void reloadConfiguration() {
    std::string error;
    if (!m_config.reload(&error)) {
      showNotice("Could not reload configuration (" + error + ")");
      return;
    }
    m_palette.render(*m_config.snapshot());
    showNotice("Configuration reloaded");
  }

  void navigateHome() {
    ct::Session *session = m_tabs.activeSession();
    if (!session) {
      showNotice("Could not go home: no console tab is open");
      return;
    }
    m_tabs.navigateHome(session->id());
  }

  void toggleSidebar() {
    WebViewHost *view = activeView();
    if (!view) {
      showNotice("Could not toggle the sidebar: no console tab is open");
      return;
    }
    view->sendSidebarChord();
  }

private:
  std::unique_ptr<ct::ViewHost> createView(ct::SessionId id) {
    auto view = std::make_unique<WebViewHost>(id, m_stack);
    m_stack->addWidget(view.get());
    view->setWindowRequestHandler([this]() -> QWebEngineView * {
      try {
        const ct::SessionId created = m_tabs.openSession(std::string("about:blank"));
        return viewFor(m_tabs.find(created));
      } catch (const ct::Error &e) {
        CT_LOG(ct::LogLevel::Error, std::string("Popup tab failed: ") + e.what());
        showNotice("Could not open a new console tab");
        return nullptr;
      }
    });
    connect(view.get(), &QWebEngineView::titleChanged, this, [this, id](const QString &title) {
      const QString trimmed = title.trimmed();
      if (!trimmed.isEmpty())
        m_tabs.setTitle(id, trimmed.toStdString());
    });
    connect(view.get(), &QWebEngineView::urlChanged, this, [this, id](const QUrl &url) {
      m_tabs.setUrl(id, url.toString().toStdString());
    });
    return view;
  }

  static WebViewHost *viewFor(const ct::Session *session) {
    return session ? dynamic_cast<WebViewHost *>(&session->view()) : nullptr;
  }

  WebViewHost *activeView() const { return viewFor(m_tabs.activeSession()); }

  std::optional<ct::SessionId> sessionIdAt(int index) const {
    if (index < 0 || index >= m_tabBar->count())
      return std::nullopt;
    return static_cast<ct::SessionId>(m_tabBar->tabData(index).toULongLong());
  }

  void setupToolBar() {
    QToolBar *nav = addToolBar(tr("Navigation"));
    nav->setMovable(false);

    auto addNav = [&](const QString &text, const QString &tip, auto slot) {
      QAction *action = nav->addAction(text);
      action->setStatusTip(tip);
      connect(action, &QAction::triggered, this, slot);
      return action;
    };
    addNav(tr("Back"), tr("Back to previous page"), [this] {
      if (WebViewHost *v = activeView())
        v->back();
    });
    addNav(tr("Forward"), tr("Forward to next page"), [this] {
      if (WebViewHost *v = activeView())
        v->forward();
    });
    addNav(tr("Reload"), tr("Reload current page"), [this] {
      if (WebViewHost *v = activeView())
        v->reload();
    });
    addNav(tr("Home"), tr("Go to home page"), [this] { navigateHome(); });
    addNav(tr("Stop"), tr("Stop loading current page"), [this] {
      if (WebViewHost *v = activeView())
        v->stop();
    });
    addNav(tr("Sidebar"), tr("Toggle gateway sidebar (Ctrl+Alt+Shift)"), [this] { toggleSidebar(); });

    nav->addSeparator();
    QAction *newTab = addNav(tr("New Tab"), tr("Open a console tab at the home page"),
                             [this] { openSession(); });
    newTab->setShortcut(QKeySequence::AddTab);
    QAction *closeTab = addNav(tr("Close Tab"), tr("Close the active console tab"), [this] {
      if (ct::Session *s = m_tabs.activeSession())
        m_tabs.closeSession(s->id());
    });
    closeTab->setShortcut(QKeySequence::Close);
    addNav(tr("Reload Config"), tr("Re-read the configuration file"),
           [this] { reloadConfiguration(); });

    nav->addSeparator();
    m_macroBar = new MacroBar(m_palette, nav);
    nav->addWidget(m_macroBar);
  }

  // Mirrors the tab manager into the tab bar and the view stack.
  void syncTabStrip() {
    QSignalBlocker blocker(m_tabBar);
    const int n = m_tabs.count();
    while (m_tabBar->count() > n)
      m_tabBar->removeTab(m_tabBar->count() - 1);
    while (m_tabBar->count() < n)
      m_tabBar->addTab(QString());
    for (int i = 0; i < n; ++i) {
      const ct::Session *session = m_tabs.sessionAt(i);
      m_tabBar->setTabText(i, QString::fromStdString(session->title()));
      m_tabBar->setTabToolTip(i, QString::fromStdString(session->url()));
      m_tabBar->setTabData(i, QVariant::fromValue<qulonglong>(session->id()));
    }

    const ct::Session *active = m_tabs.activeSession();
    if (!active) {
      setWindowTitle(QCoreApplication::applicationName());
      return;
    }
    m_tabBar->setCurrentIndex(active->position());
    if (WebViewHost *view = viewFor(active))
      m_stack->setCurrentWidget(view);
    setWindowTitle(QString::fromStdString(active->title()) + QStringLiteral(" - ") +
                   QCoreApplication::applicationName());
  }

  ct::ConfigStore &m_config;
  QtClipboard m_clipboard;
  QTabBar *m_tabBar{nullptr};
  QStackedWidget *m_stack{nullptr};
  MacroBar *m_macroBar{nullptr};
  TabStripDragFilter *m_dragFilter{nullptr};
  ct::TabManager m_tabs;
  ct::InputInjector m_injector;
  ct::MacroPalette m_palette;
  ct::DragReorderController m_drag;
};

#endif // SHELLWINDOW_HPP
