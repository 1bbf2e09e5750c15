#pragma once

#include "BrowserTypes.h"
#include <QtCore/QRect>
#include <QtWidgets/QWidget>
#include <vector>

class BrowserShell;

// Tab header row of a browser window. Paints the window's tabs, publishes
// their screen geometry and feeds pointer events to the drag session.
class TabStripWidget : public QWidget {
  Q_OBJECT

public:
  TabStripWidget(BrowserShell *shell, Kestrel::WindowHandle handle,
                 QWidget *parent = nullptr);
  ~TabStripWidget();

  void PublishLayout();

  QSize sizeHint() const override { return QSize(400, StripHeight); }

  static constexpr int StripHeight = 32;
  static constexpr int MinTabWidth = 80;
  static constexpr int MaxTabWidth = 200;

protected:
  void paintEvent(QPaintEvent *event) override;
  void mousePressEvent(QMouseEvent *event) override;
  void mouseMoveEvent(QMouseEvent *event) override;
  void mouseReleaseEvent(QMouseEvent *event) override;
  void mouseDoubleClickEvent(QMouseEvent *event) override;
  void keyPressEvent(QKeyEvent *event) override;
  void resizeEvent(QResizeEvent *event) override;

private:
  struct TabHeader {
    Kestrel::TabId Id;
    QRect Rect; // Widget coordinates
  };

  std::vector<TabHeader> computeHeaders() const;
  const TabHeader *headerAt(const std::vector<TabHeader> &headers,
                            const QPoint &pos) const;
  static QRect closeRect(const QRect &tabRect);
  bool isDraggingFromHere() const;
  void finishGesture(Kestrel::DragOutcome outcome);

  BrowserShell *m_shell;
  Kestrel::WindowHandle m_handle;

  // Tab whose close button is pressed
  Kestrel::TabId m_closePressed;
};
