#pragma once

#include <QtWidgets/QToolBar>
#include <QtWidgets/QWidget>

class QAction;
class QLineEdit;

namespace Kestrel {
struct Tab;
}

class NavigationToolBar : public QToolBar {
  Q_OBJECT

public:
  NavigationToolBar(QWidget *parent = nullptr);
  ~NavigationToolBar();

  // Mirrors the active tab (null clears the bar)
  void SetTab(const Kestrel::Tab *tab);

signals:
  void navigateRequested(const QString &address);
  void backRequested();
  void forwardRequested();
  void reloadRequested();
  void newTabRequested();

private slots:
  void onAddressEntered();

private:
  void setupToolBar();

  QAction *m_backAction;
  QAction *m_forwardAction;
  QAction *m_reloadAction;
  QAction *m_newTabAction;
  QLineEdit *m_addressEdit;
};
