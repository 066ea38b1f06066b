#ifndef TABSTRIPDRAGFILTER_HPP
#define TABSTRIPDRAGFILTER_HPP
#include <QEvent>
#include <QFrame>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QObject>
#include <QRect>
#include <QTabBar>
#include <QVariant>

#include "core/input/DragReorderController.hpp"

// Feeds mouse events from the tab bar into the drag controller and draws a
// drop marker at the candidate slot. Events are never consumed, so the tab
// bar still handles selection and close buttons itself.
class TabStripDragFilter : public QObject {
  Q_OBJECT
public:
  TabStripDragFilter(QTabBar *tabBar, ct::DragReorderController &controller)
      : QObject(tabBar), m_tabBar(tabBar), m_controller(controller) {
    m_marker = new QFrame(tabBar);
    m_marker->setFrameShape(QFrame::VLine);
    m_marker->setStyleSheet(QStringLiteral("background:palette(highlight);"));
    m_marker->hide();
    tabBar->installEventFilter(this);
  }

protected:
  bool eventFilter(QObject *watched, QEvent *event) override {
    if (watched != m_tabBar)
      return QObject::eventFilter(watched, event);
    switch (event->type()) {
    case QEvent::MouseButtonPress: {
      auto *me = static_cast<QMouseEvent *>(event);
      if (me->button() == Qt::LeftButton)
        m_controller.pointerDown(toPoint(me->pos()), captureLayout());
      break;
    }
    case QEvent::MouseMove: {
      auto *me = static_cast<QMouseEvent *>(event);
      if (m_controller.dragging()) {
        if (m_controller.pointerMove(toPoint(me->pos())) == ct::DragOutcome::Cancelled)
          m_marker->hide();
        else
          updateMarker();
      }
      break;
    }
    case QEvent::MouseButtonRelease: {
      auto *me = static_cast<QMouseEvent *>(event);
      if (me->button() == Qt::LeftButton && m_controller.dragging()) {
        m_marker->hide();
        m_controller.pointerUp(toPoint(me->pos()));
      }
      break;
    }
    case QEvent::KeyPress:
      if (static_cast<QKeyEvent *>(event)->key() == Qt::Key_Escape)
        cancelDrag();
      break;
    case QEvent::Hide:
    case QEvent::FocusOut:
    case QEvent::WindowDeactivate:
      cancelDrag();
      break;
    default:
      break;
    }
    return QObject::eventFilter(watched, event);
  }

private:
  static ct::Point toPoint(const QPoint &p) {
    return {static_cast<float>(p.x()), static_cast<float>(p.y())};
  }

  static ct::Rect toRect(const QRect &r) {
    return {static_cast<float>(r.x()), static_cast<float>(r.y()),
            static_cast<float>(r.width()), static_cast<float>(r.height())};
  }

  ct::TabStripLayout captureLayout() const {
    ct::TabStripLayout layout;
    layout.strip = toRect(m_tabBar->rect());
    const QTabBar::Shape shape = m_tabBar->shape();
    const bool vertical = shape == QTabBar::RoundedWest || shape == QTabBar::RoundedEast ||
                          shape == QTabBar::TriangularWest || shape == QTabBar::TriangularEast;
    layout.orientation = vertical ? ct::Orientation::Vertical : ct::Orientation::Horizontal;
    for (int i = 0; i < m_tabBar->count(); ++i) {
      const ct::SessionId id = m_tabBar->tabData(i).toULongLong();
      layout.slots.push_back({id, toRect(m_tabBar->tabRect(i))});
    }
    return layout;
  }

  void cancelDrag() {
    m_marker->hide();
    m_controller.cancel();
  }

  void updateMarker() {
    const int candidate = m_controller.candidateIndex();
    if (!m_controller.dragging() || candidate < 0 || candidate == m_controller.sourceIndex()) {
      m_marker->hide();
      return;
    }
    const QRect r = m_tabBar->tabRect(candidate);
    const bool after = candidate > m_controller.sourceIndex();
    const int x = after ? r.right() - 1 : r.left();
    m_marker->setGeometry(x, r.top(), 2, r.height());
    m_marker->show();
    m_marker->raise();
  }

  QTabBar *m_tabBar;
  ct::DragReorderController &m_controller;
  QFrame *m_marker;
};

#endif // TABSTRIPDRAGFILTER_HPP
