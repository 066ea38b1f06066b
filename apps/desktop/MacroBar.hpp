#ifndef MACROBAR_HPP
#define MACROBAR_HPP
#include <QHBoxLayout>
#include <QLabel>
#include <QLayoutItem>
#include <QLineEdit>
#include <QMouseEvent>
#include <QString>
#include <QWidget>

#include "core/palette/MacroPalette.hpp"

// Line edit that activates its macro when clicked.
class MacroLineEdit : public QLineEdit {
  Q_OBJECT
public:
  using QLineEdit::QLineEdit;

signals:
  void activated();

protected:
  void mousePressEvent(QMouseEvent *event) override {
    QLineEdit::mousePressEvent(event);
    if (event->button() == Qt::LeftButton)
      emit activated();
  }
};

// One label and one editable box per macro, in configuration order. Rebuilt
// from the palette on every render, which drops any edits made in the boxes.
class MacroBar : public QWidget {
  Q_OBJECT
public:
  explicit MacroBar(ct::MacroPalette &palette, QWidget *parent = nullptr)
      : QWidget(parent), m_palette(palette) {
    m_layout = new QHBoxLayout(this);
    m_layout->setContentsMargins(4, 0, 4, 0);
    m_layout->setSpacing(6);
  }

  void rebuild() {
    clear();
    const auto &entries = m_palette.entries();
    for (std::size_t i = 0; i < entries.size(); ++i) {
      const auto &entry = entries[i];
      auto *label = new QLabel(QString::fromStdString(entry.macro.name) + QStringLiteral(":"), this);
      m_layout->addWidget(label);

      auto *box = new MacroLineEdit(this);
      box->setText(QString::fromStdString(entry.displayText));
      box->setFixedWidth(200);
      box->setToolTip(tr("Click to paste into the active console"));
      connect(box, &QLineEdit::textEdited, this, [this, i](const QString &text) {
        m_palette.editDisplay(i, text.toStdString());
      });
      connect(box, &MacroLineEdit::activated, this, [this, i] { m_palette.activate(i); });
      m_layout->addWidget(box);
    }
    setVisible(!entries.empty());
    adjustSize();
  }

private:
  void clear() {
    while (QLayoutItem *item = m_layout->takeAt(0)) {
      if (QWidget *w = item->widget())
        w->deleteLater();
      delete item;
    }
  }

  ct::MacroPalette &m_palette;
  QHBoxLayout *m_layout{nullptr};
};

#endif // MACROBAR_HPP
