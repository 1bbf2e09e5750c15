#pragma once

#include "TabSurface.h"
#include <QtCore/QPointer>
#include <QtWidgets/QLabel>
#include <QtWidgets/QWidget>

class BrowserShell;

// Content area of one tab. Stands in for the rendering collaborator's view:
// it survives moves between windows and only its parent changes.
class TabPageWidget : public QWidget {
  Q_OBJECT

public:
  explicit TabPageWidget(const Kestrel::Tab &tab, QWidget *parent = nullptr);
  ~TabPageWidget();

  Kestrel::TabId GetTabId() const { return m_tabId; }

  // Refreshes the labels from the tab record
  void Update(const Kestrel::Tab &tab);

private:
  Kestrel::TabId m_tabId;

  QLabel *m_titleLabel;
  QLabel *m_addressLabel;
  QLabel *m_statusLabel;
};

// ITabSurface over a TabPageWidget. Moves the page between the page stacks
// of the windows it is attached to.
class TabPageSurface : public Kestrel::ITabSurface {
public:
  TabPageSurface(BrowserShell *shell, TabPageWidget *page);
  ~TabPageSurface() override;

  void OnDetached(Kestrel::WindowHandle from) override;
  void OnAttached(Kestrel::WindowHandle to) override;

  TabPageWidget *GetPage() const { return m_Page.data(); }

private:
  BrowserShell *m_Shell;
  QPointer<TabPageWidget> m_Page;
};
