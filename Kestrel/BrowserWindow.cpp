#include "BrowserWindow.h"
#include "BrowserMenu.h"
#include "BrowserShell.h"
#include "NavigationToolBar.h"
#include "TabPageWidget.h"
#include "TabStripWidget.h"
#include <QtGui/QCloseEvent>
#include <QtGui/QGuiApplication>
#include <QtWidgets/QVBoxLayout>
#include <iostream>

using namespace Kestrel;

BrowserWindow::BrowserWindow(BrowserShell *shell, WindowHandle handle,
                             QWidget *parent)
    : QMainWindow(parent), m_shell(shell), m_handle(handle) {
  setAttribute(Qt::WA_DeleteOnClose, false);
  setWindowTitle(tr("Kestrel"));

  setupMenu();
  setupToolBar();
  setupCentralWidget();
}

BrowserWindow::~BrowserWindow() {}

void BrowserWindow::setupMenu() {
  m_menu = new BrowserMenu(m_shell, this);
  setMenuBar(m_menu);
}

void BrowserWindow::setupToolBar() {
  m_toolBar = new NavigationToolBar(this);
  addToolBar(m_toolBar);

  connect(m_toolBar, &NavigationToolBar::navigateRequested, this,
          &BrowserWindow::onNavigateRequested);
  connect(m_toolBar, &NavigationToolBar::reloadRequested, this,
          &BrowserWindow::onReloadRequested);
  connect(m_toolBar, &NavigationToolBar::backRequested, this,
          &BrowserWindow::onBackRequested);
  connect(m_toolBar, &NavigationToolBar::forwardRequested, this,
          &BrowserWindow::onForwardRequested);
  connect(m_toolBar, &NavigationToolBar::newTabRequested, [this]() {
    m_shell->GetLifecycle().OpenTab(m_handle, "");
  });
}

void BrowserWindow::setupCentralWidget() {
  QWidget *central = new QWidget(this);
  QVBoxLayout *layout = new QVBoxLayout(central);
  layout->setContentsMargins(0, 0, 0, 0);
  layout->setSpacing(0);

  m_tabStrip = new TabStripWidget(m_shell, m_handle, central);
  m_pages = new QStackedWidget(central);

  layout->addWidget(m_tabStrip);
  layout->addWidget(m_pages, 1);
  central->setLayout(layout);
  setCentralWidget(central);
}

void BrowserWindow::AttachPage(TabPageWidget *page) {
  if (m_pages->indexOf(page) < 0) {
    m_pages->addWidget(page);
  }

  // Keep showing the active tab's page
  WindowContext *context = m_shell->GetRegistry().Find(m_handle);
  if (context) {
    SetActiveTab(context->GetTabs().GetActiveTab());
  }
}

void BrowserWindow::DetachPage(TabPageWidget *page) {
  if (m_pages->indexOf(page) >= 0) {
    m_pages->removeWidget(page);
  }
  page->hide();
  page->setParent(nullptr);
}

void BrowserWindow::RefreshTabs() {
  WindowContext *context = m_shell->GetRegistry().Find(m_handle);
  if (!context) {
    return;
  }

  // Tab fields may have changed without a page being moved
  const WindowTabList &tabs = context->GetTabs();
  for (size_t i = 0; i < tabs.Size(); i++) {
    const Tab &tab = tabs.At(i);
    if (TabPageWidget *page = findPage(tab.Id)) {
      page->Update(tab);
    }
  }

  m_tabStrip->update();
  PublishTabStrip();
}

void BrowserWindow::SetActiveTab(const Tab *active) {
  m_toolBar->SetTab(active);

  if (!active) {
    setWindowTitle(tr("Kestrel"));
    return;
  }

  setWindowTitle(QString("%1 - Kestrel").arg(QString::fromStdString(active->Title)));

  if (TabPageWidget *page = findPage(active->Id)) {
    page->Update(*active);
    m_pages->setCurrentWidget(page);
  }
  m_tabStrip->update();
}

void BrowserWindow::RefreshDropIndicator() { m_tabStrip->update(); }

void BrowserWindow::PublishTabStrip() { m_tabStrip->PublishLayout(); }

TabPageWidget *BrowserWindow::findPage(TabId id) const {
  for (int i = 0; i < m_pages->count(); i++) {
    TabPageWidget *page = qobject_cast<TabPageWidget *>(m_pages->widget(i));
    if (page && page->GetTabId() == id) {
      return page;
    }
  }
  return nullptr;
}

void BrowserWindow::moveEvent(QMoveEvent *event) {
  QMainWindow::moveEvent(event);
  m_shell->SyncWindowGeometry(m_handle);
}

void BrowserWindow::resizeEvent(QResizeEvent *event) {
  QMainWindow::resizeEvent(event);
  m_shell->SyncWindowGeometry(m_handle);
}

void BrowserWindow::closeEvent(QCloseEvent *event) {
  if (!m_released) {
    DragSessionController &drag = m_shell->GetDragSession();
    if (drag.IsInProgress() && drag.GetOriginWindow() == m_handle) {
      drag.Cancel();
    }

    // Releases this window through the shell
    m_shell->GetLifecycle().CloseWindow(m_handle);
  }
  event->accept();
}

void BrowserWindow::changeEvent(QEvent *event) {
  QMainWindow::changeEvent(event);

  if (event->type() != QEvent::ActivationChange) {
    return;
  }

  if (isActiveWindow()) {
    m_shell->GetRegistry().BringToFront(m_handle);
    return;
  }

  // Focus moved away without the release reaching us
  DragSessionController &drag = m_shell->GetDragSession();
  if (drag.IsInProgress() && drag.GetOriginWindow() == m_handle &&
      QGuiApplication::mouseButtons() == Qt::NoButton) {
    m_shell->OnDragFinished(drag.Cancel());
  }
}

void BrowserWindow::onNavigateRequested(const QString &address) {
  WindowContext *context = m_shell->GetRegistry().Find(m_handle);
  if (!context) {
    return;
  }

  std::optional<TabId> active = context->GetTabs().GetActiveId();
  if (!active) {
    return;
  }
  m_shell->Navigate(*active, address.trimmed().toStdString());
}

void BrowserWindow::onReloadRequested() {
  WindowContext *context = m_shell->GetRegistry().Find(m_handle);
  if (!context) {
    return;
  }

  std::optional<TabId> active = context->GetTabs().GetActiveId();
  if (active) {
    m_shell->GetLifecycle().OnLoadingChanged(*active, true);
    m_shell->GetLifecycle().OnLoadingChanged(*active, false);
  }
}

void BrowserWindow::onBackRequested() {
  WindowContext *context = m_shell->GetRegistry().Find(m_handle);
  if (!context) {
    return;
  }

  if (std::optional<TabId> active = context->GetTabs().GetActiveId()) {
    m_shell->GoBack(*active);
  }
}

void BrowserWindow::onForwardRequested() {
  WindowContext *context = m_shell->GetRegistry().Find(m_handle);
  if (!context) {
    return;
  }

  if (std::optional<TabId> active = context->GetTabs().GetActiveId()) {
    m_shell->GoForward(*active);
  }
}
