#include "BrowserMenu.h"
#include "BrowserShell.h"
#include "BrowserWindow.h"
#include <QApplication>
#include <QMessageBox>

using namespace Kestrel;

BrowserMenu::BrowserMenu(BrowserShell *shell, BrowserWindow *window)
    : QMenuBar(window), m_shell(shell), m_window(window) {
  setupMenus();
}

BrowserMenu::~BrowserMenu() {}

void BrowserMenu::setupMenus() {
  // File Menu
  m_fileMenu = addMenu(tr("&File"));

  m_newTabAction = m_fileMenu->addAction(tr("New &Tab"));
  m_newTabAction->setShortcut(QKeySequence::AddTab);
  connect(m_newTabAction, &QAction::triggered, [this]() {
    m_shell->GetLifecycle().OpenTab(m_window->GetHandle(), "");
  });

  m_newWindowAction = m_fileMenu->addAction(tr("&New Window"));
  m_newWindowAction->setShortcut(QKeySequence::New);
  connect(m_newWindowAction, &QAction::triggered,
          [this]() { m_shell->GetLifecycle().OpenWindow(); });

  m_fileMenu->addSeparator();

  m_closeTabAction = m_fileMenu->addAction(tr("&Close Tab"));
  m_closeTabAction->setShortcut(QKeySequence::Close);
  connect(m_closeTabAction, &QAction::triggered, [this]() {
    WindowContext *context =
        m_shell->GetRegistry().Find(m_window->GetHandle());
    if (!context)
      return;

    std::optional<TabId> active = context->GetTabs().GetActiveId();
    if (active) {
      m_shell->GetLifecycle().CloseTab(*active);
    }
  });

  m_closeWindowAction = m_fileMenu->addAction(tr("Close &Window"));
  m_closeWindowAction->setShortcut(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_W));
  connect(m_closeWindowAction, &QAction::triggered,
          [this]() { m_window->close(); });

  m_fileMenu->addSeparator();

  QAction *quitAction = m_fileMenu->addAction(tr("&Quit"));
  quitAction->setShortcut(QKeySequence::Quit);
  connect(quitAction, &QAction::triggered,
          []() { QApplication::closeAllWindows(); });

  // History Menu
  m_historyMenu = addMenu(tr("&History"));

  m_reopenTabAction = m_historyMenu->addAction(tr("&Reopen Closed Tab"));
  m_reopenTabAction->setShortcut(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_T));
  connect(m_reopenTabAction, &QAction::triggered, [this]() {
    m_shell->GetLifecycle().ReopenLastClosedTab(m_window->GetHandle());
  });

  m_recentlyClosedMenu = m_historyMenu->addMenu(tr("Recently &Closed"));
  connect(m_historyMenu, &QMenu::aboutToShow, this,
          &BrowserMenu::populateRecentlyClosed);

  // View Menu
  m_viewMenu = addMenu(tr("&View"));

  m_consoleAction = m_viewMenu->addAction(tr("Transfer &Console"));
  connect(m_consoleAction, &QAction::triggered,
          [this]() { m_shell->ShowConsole(); });

  // Help Menu
  m_helpMenu = addMenu(tr("&Help"));
  QAction *aboutAction = m_helpMenu->addAction(tr("&About Kestrel"));
  connect(aboutAction, &QAction::triggered, [this]() {
    QMessageBox::about(m_window, tr("About Kestrel"),
                       tr("Kestrel - multi-window tabbed browser shell.\n"
                          "Drag tabs to reorder them, move them between "
                          "windows or tear them off into a new window."));
  });
}

void BrowserMenu::populateRecentlyClosed() {
  m_recentlyClosedMenu->clear();

  RecentlyClosedTabs &closed = m_shell->GetLifecycle().GetRecentlyClosed();
  m_recentlyClosedMenu->setEnabled(!closed.Empty());

  for (const ClosedTabRecord &record : closed.GetEntries()) {
    QString title = QString::fromStdString(
        record.Title.empty() ? record.Address : record.Title);
    QAction *action = m_recentlyClosedMenu->addAction(title);
    action->setToolTip(QString::fromStdString(record.Address));

    std::string address = record.Address;
    connect(action, &QAction::triggered, [this, address]() {
      // Reopens into this window and drops the history entry
      if (m_shell->GetLifecycle().OpenTab(m_window->GetHandle(), address)) {
        m_shell->GetLifecycle().GetRecentlyClosed().RemoveByAddress(address);
      }
    });
  }

  if (!closed.Empty()) {
    m_recentlyClosedMenu->addSeparator();
    QAction *clearAction = m_recentlyClosedMenu->addAction(tr("Clear History"));
    connect(clearAction, &QAction::triggered, [this]() {
      m_shell->GetLifecycle().GetRecentlyClosed().Clear();
    });
  }
}
