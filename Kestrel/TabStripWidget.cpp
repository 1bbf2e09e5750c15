#include "TabStripWidget.h"
#include "BrowserShell.h"
#include <QtGui/QFontMetrics>
#include <QtGui/QKeyEvent>
#include <QtGui/QMouseEvent>
#include <QtGui/QPainter>
#include <algorithm>

using namespace Kestrel;

namespace {

glm::vec2 ToScreen(const QPointF &global) {
  return glm::vec2(static_cast<float>(global.x()),
                   static_cast<float>(global.y()));
}

glm::vec4 ToRect(const QRect &rect) {
  return glm::vec4(rect.x(), rect.y(), rect.width(), rect.height());
}

} // namespace

TabStripWidget::TabStripWidget(BrowserShell *shell, WindowHandle handle,
                               QWidget *parent)
    : QWidget(parent), m_shell(shell), m_handle(handle) {
  setFixedHeight(StripHeight);
  setFocusPolicy(Qt::ClickFocus);
  setMouseTracking(false);
}

TabStripWidget::~TabStripWidget() {}

std::vector<TabStripWidget::TabHeader> TabStripWidget::computeHeaders() const {
  std::vector<TabHeader> headers;

  WindowContext *context = m_shell->GetRegistry().Find(m_handle);
  if (!context) {
    return headers;
  }

  QFontMetrics metrics(font());
  const WindowTabList &tabs = context->GetTabs();
  int x = 0;
  for (size_t i = 0; i < tabs.Size(); i++) {
    const Tab &tab = tabs.At(i);
    int textWidth =
        metrics.horizontalAdvance(QString::fromStdString(tab.Title));
    int width = std::clamp(textWidth + 44, MinTabWidth, MaxTabWidth);
    headers.push_back({tab.Id, QRect(x, 0, width, StripHeight)});
    x += width;
  }
  return headers;
}

const TabStripWidget::TabHeader *
TabStripWidget::headerAt(const std::vector<TabHeader> &headers,
                         const QPoint &pos) const {
  for (const TabHeader &header : headers) {
    if (header.Rect.contains(pos)) {
      return &header;
    }
  }
  return nullptr;
}

QRect TabStripWidget::closeRect(const QRect &tabRect) {
  return QRect(tabRect.right() - 22, tabRect.top() + 8, 16, 16);
}

bool TabStripWidget::isDraggingFromHere() const {
  const DragSessionController &drag = m_shell->GetDragSession();
  return drag.IsInProgress() && drag.GetOriginWindow() == m_handle;
}

void TabStripWidget::PublishLayout() {
  std::vector<TabHeader> headers = computeHeaders();
  QPoint origin = mapToGlobal(QPoint(0, 0));

  std::vector<TabRect> rects;
  rects.reserve(headers.size());
  for (const TabHeader &header : headers) {
    rects.push_back({header.Id, ToRect(header.Rect.translated(origin))});
  }

  QRect strip(origin, size());
  m_shell->GetRegistry().UpdateTabStripLayout(
      m_handle, TabStripLayout(ToRect(strip), std::move(rects)));
}

void TabStripWidget::paintEvent(QPaintEvent *event) {
  Q_UNUSED(event);

  QPainter painter(this);
  painter.fillRect(rect(), QColor(36, 36, 36));

  WindowContext *context = m_shell->GetRegistry().Find(m_handle);
  if (!context) {
    return;
  }

  const WindowTabList &tabs = context->GetTabs();
  std::optional<TabId> active = tabs.GetActiveId();
  const DragSessionController &drag = m_shell->GetDragSession();
  bool dragActive = drag.GetState() == DragState::Active;

  std::vector<TabHeader> headers = computeHeaders();
  QFontMetrics metrics(font());

  for (const TabHeader &header : headers) {
    const Tab *tab = tabs.Find(header.Id);
    if (!tab) {
      continue;
    }

    bool isActive = active && *active == header.Id;
    bool isDragged = dragActive && drag.GetDraggedTab() == header.Id;

    QColor background = isActive ? QColor(53, 53, 53) : QColor(42, 42, 42);
    if (isDragged) {
      background = QColor(30, 30, 30);
    }
    QRect body = header.Rect.adjusted(1, 3, -1, 0);
    painter.fillRect(body, background);
    painter.setPen(QColor(66, 66, 66));
    painter.drawRect(body.adjusted(0, 0, -1, -1));

    // Title, with a dot while loading
    QString title = QString::fromStdString(tab->Title);
    if (tab->IsLoading) {
      title = QString("%1 %2").arg(QChar(0x2022)).arg(title);
    }
    QRect textRect = body.adjusted(10, 0, -28, 0);
    painter.setPen(isDragged ? QColor(128, 128, 128) : QColor(Qt::white));
    painter.drawText(textRect, Qt::AlignVCenter | Qt::AlignLeft,
                     metrics.elidedText(title, Qt::ElideRight,
                                        textRect.width()));

    // Close button
    QRect close = closeRect(header.Rect);
    painter.setPen(QColor(160, 160, 160));
    painter.drawLine(close.topLeft() + QPoint(4, 4),
                     close.bottomRight() - QPoint(4, 4));
    painter.drawLine(close.topRight() + QPoint(-4, 4),
                     close.bottomLeft() + QPoint(4, -4));
  }

  // Drop indicator for the candidate target in this window
  const DropTarget &target = drag.GetDropTarget();
  bool insertHere = (target.Kind == DropKind::Reorder ||
                     target.Kind == DropKind::InsertOther) &&
                    target.Window == m_handle;
  if (!insertHere || headers.empty()) {
    return;
  }

  int x = headers.back().Rect.right() + 1;
  if (target.AnchorTab && !target.AtEnd) {
    auto it = std::find_if(headers.begin(), headers.end(),
                           [&target](const TabHeader &header) {
                             return header.Id == *target.AnchorTab;
                           });
    if (it != headers.end()) {
      x = target.InsertAfter ? it->Rect.right() + 1 : it->Rect.left();
    }
  }

  painter.fillRect(QRect(x - 1, 2, 3, StripHeight - 4), QColor(38, 79, 120));
}

void TabStripWidget::mousePressEvent(QMouseEvent *event) {
  std::vector<TabHeader> headers = computeHeaders();
  const TabHeader *header = headerAt(headers, event->position().toPoint());
  if (!header) {
    QWidget::mousePressEvent(event);
    return;
  }

  if (event->button() == Qt::MiddleButton) {
    m_shell->GetLifecycle().CloseTab(header->Id);
    return;
  }

  if (event->button() != Qt::LeftButton) {
    return;
  }

  if (closeRect(header->Rect).contains(event->position().toPoint())) {
    m_closePressed = header->Id;
    return;
  }

  // The strip may have moved since the last publish
  PublishLayout();

  DragOutcome outcome = m_shell->GetDragSession().BeginDrag(
      header->Id, m_handle, ToScreen(event->globalPosition()));
  if (outcome != DragOutcome::Pending) {
    finishGesture(outcome);
  }
}

void TabStripWidget::mouseMoveEvent(QMouseEvent *event) {
  if (!isDraggingFromHere()) {
    QWidget::mouseMoveEvent(event);
    return;
  }

  DragSessionController &drag = m_shell->GetDragSession();
  DragOutcome outcome = drag.UpdateDrag(ToScreen(event->globalPosition()));
  if (outcome != DragOutcome::Pending) {
    finishGesture(outcome);
    return;
  }

  if (drag.GetState() == DragState::Active) {
    setCursor(Qt::ClosedHandCursor);
  }
  m_shell->RefreshTabStrips();
}

void TabStripWidget::mouseReleaseEvent(QMouseEvent *event) {
  if (event->button() != Qt::LeftButton) {
    return;
  }

  if (m_closePressed.IsValid()) {
    TabId pressed = m_closePressed;
    m_closePressed = TabId{};

    std::vector<TabHeader> headers = computeHeaders();
    const TabHeader *header = headerAt(headers, event->position().toPoint());
    if (header && header->Id == pressed &&
        closeRect(header->Rect).contains(event->position().toPoint())) {
      m_shell->GetLifecycle().CloseTab(pressed);
    }
    return;
  }

  if (!isDraggingFromHere()) {
    return;
  }

  finishGesture(
      m_shell->GetDragSession().EndDrag(ToScreen(event->globalPosition())));
}

void TabStripWidget::mouseDoubleClickEvent(QMouseEvent *event) {
  std::vector<TabHeader> headers = computeHeaders();
  if (event->button() == Qt::LeftButton &&
      !headerAt(headers, event->position().toPoint())) {
    m_shell->GetLifecycle().OpenTab(m_handle, "");
    return;
  }
  QWidget::mouseDoubleClickEvent(event);
}

void TabStripWidget::keyPressEvent(QKeyEvent *event) {
  if (event->key() == Qt::Key_Escape && isDraggingFromHere()) {
    finishGesture(m_shell->GetDragSession().Cancel());
    return;
  }
  QWidget::keyPressEvent(event);
}

void TabStripWidget::resizeEvent(QResizeEvent *event) {
  QWidget::resizeEvent(event);
  PublishLayout();
}

void TabStripWidget::finishGesture(DragOutcome outcome) {
  unsetCursor();
  m_shell->OnDragFinished(outcome);
}
