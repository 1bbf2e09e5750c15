#include "NavigationToolBar.h"
#include "Tab.h"
#include <QAction>
#include <QtWidgets/QLineEdit>
#include <QtWidgets/QStyle>

NavigationToolBar::NavigationToolBar(QWidget *parent) : QToolBar(parent) {
  setObjectName("NavigationToolBar");
  setMovable(false);
  setIconSize(QSize(20, 20));
  setupToolBar();
}

NavigationToolBar::~NavigationToolBar() {}

void NavigationToolBar::setupToolBar() {
  // === History Actions ===
  m_backAction = new QAction(this);
  m_backAction->setIcon(style()->standardIcon(QStyle::SP_ArrowBack));
  m_backAction->setToolTip("Back");
  m_backAction->setShortcut(QKeySequence::Back);
  m_backAction->setEnabled(false);
  addAction(m_backAction);
  connect(m_backAction, &QAction::triggered, this,
          &NavigationToolBar::backRequested);

  m_forwardAction = new QAction(this);
  m_forwardAction->setIcon(style()->standardIcon(QStyle::SP_ArrowForward));
  m_forwardAction->setToolTip("Forward");
  m_forwardAction->setShortcut(QKeySequence::Forward);
  m_forwardAction->setEnabled(false);
  addAction(m_forwardAction);
  connect(m_forwardAction, &QAction::triggered, this,
          &NavigationToolBar::forwardRequested);

  m_reloadAction = new QAction(this);
  m_reloadAction->setIcon(style()->standardIcon(QStyle::SP_BrowserReload));
  m_reloadAction->setToolTip("Reload (F5)");
  m_reloadAction->setShortcut(QKeySequence(Qt::Key_F5));
  addAction(m_reloadAction);
  connect(m_reloadAction, &QAction::triggered, this,
          &NavigationToolBar::reloadRequested);

  addSeparator();

  // === Address Bar ===
  m_addressEdit = new QLineEdit(this);
  m_addressEdit->setPlaceholderText("Enter address");
  m_addressEdit->setClearButtonEnabled(true);
  addWidget(m_addressEdit);
  connect(m_addressEdit, &QLineEdit::returnPressed, this,
          &NavigationToolBar::onAddressEntered);

  addSeparator();

  m_newTabAction = new QAction("+", this);
  m_newTabAction->setToolTip("New Tab");
  addAction(m_newTabAction);
  connect(m_newTabAction, &QAction::triggered, this,
          &NavigationToolBar::newTabRequested);
}

void NavigationToolBar::SetTab(const Kestrel::Tab *tab) {
  if (!tab) {
    m_addressEdit->clear();
    m_backAction->setEnabled(false);
    m_forwardAction->setEnabled(false);
    return;
  }

  // Internal pages show an empty address bar
  if (tab->IsSpecialPage()) {
    m_addressEdit->clear();
  } else if (!m_addressEdit->hasFocus()) {
    m_addressEdit->setText(QString::fromStdString(tab->Address));
  }

  m_backAction->setEnabled(tab->CanGoBack);
  m_forwardAction->setEnabled(tab->CanGoForward);
}

void NavigationToolBar::onAddressEntered() {
  QString address = m_addressEdit->text().trimmed();
  if (address.isEmpty()) {
    return;
  }
  m_addressEdit->clearFocus();
  emit navigateRequested(address);
}
