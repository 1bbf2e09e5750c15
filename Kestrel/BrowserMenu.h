#pragma once

#include <QtWidgets/QMenuBar>

class BrowserShell;
class BrowserWindow;

class BrowserMenu : public QMenuBar {
  Q_OBJECT

public:
  BrowserMenu(BrowserShell *shell, BrowserWindow *window);
  ~BrowserMenu();

private:
  void setupMenus();
  void populateRecentlyClosed();

  BrowserShell *m_shell;
  BrowserWindow *m_window;

  QMenu *m_fileMenu;
  QMenu *m_historyMenu;
  QMenu *m_recentlyClosedMenu;
  QMenu *m_viewMenu;
  QMenu *m_helpMenu;

  QAction *m_newTabAction;
  QAction *m_newWindowAction;
  QAction *m_closeTabAction;
  QAction *m_closeWindowAction;
  QAction *m_reopenTabAction;
  QAction *m_consoleAction;
};
