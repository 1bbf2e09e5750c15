#pragma once

#include "BrowserTypes.h"
#include <QtWidgets/QMainWindow>
#include <QtWidgets/QStackedWidget>

namespace Kestrel {
struct Tab;
}

class BrowserShell;
class BrowserMenu;
class NavigationToolBar;
class TabStripWidget;
class TabPageWidget;

// One top-level browser window: menu, navigation bar, tab strip and the
// stack of tab pages it currently hosts.
class BrowserWindow : public QMainWindow {
  Q_OBJECT

public:
  BrowserWindow(BrowserShell *shell, Kestrel::WindowHandle handle,
                QWidget *parent = nullptr);
  ~BrowserWindow();

  Kestrel::WindowHandle GetHandle() const { return m_handle; }

  // Page stack membership, driven by TabPageSurface
  void AttachPage(TabPageWidget *page);
  void DetachPage(TabPageWidget *page);

  // Called by the shell for host notifications
  void RefreshTabs();
  void SetActiveTab(const Kestrel::Tab *active);
  void RefreshDropIndicator();

  // Publishes the strip geometry in screen coordinates
  void PublishTabStrip();

  // The lifecycle manager already dropped this window; closing must not
  // route back into it
  void MarkReleased() { m_released = true; }

protected:
  void moveEvent(QMoveEvent *event) override;
  void resizeEvent(QResizeEvent *event) override;
  void closeEvent(QCloseEvent *event) override;
  void changeEvent(QEvent *event) override;

private slots:
  void onNavigateRequested(const QString &address);
  void onReloadRequested();
  void onBackRequested();
  void onForwardRequested();

private:
  void setupMenu();
  void setupToolBar();
  void setupCentralWidget();
  TabPageWidget *findPage(Kestrel::TabId id) const;

  BrowserShell *m_shell;
  Kestrel::WindowHandle m_handle;
  bool m_released = false;

  // Menu bar
  BrowserMenu *m_menu;

  // Tool bar
  NavigationToolBar *m_toolBar;

  // Central widget contents
  TabStripWidget *m_tabStrip;
  QStackedWidget *m_pages;
};
