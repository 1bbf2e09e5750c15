#include "TabPageWidget.h"
#include "BrowserShell.h"
#include "BrowserWindow.h"
#include "ConsoleWidget.h"
#include <QtGui/QFont>
#include <QtWidgets/QVBoxLayout>
#include <iostream>

using namespace Kestrel;

TabPageWidget::TabPageWidget(const Tab &tab, QWidget *parent)
    : QWidget(parent), m_tabId(tab.Id) {
  QVBoxLayout *layout = new QVBoxLayout(this);
  layout->setContentsMargins(24, 24, 24, 24);
  layout->setSpacing(8);

  m_titleLabel = new QLabel(this);
  QFont titleFont = m_titleLabel->font();
  titleFont.setPointSize(18);
  titleFont.setBold(true);
  m_titleLabel->setFont(titleFont);

  m_addressLabel = new QLabel(this);
  m_addressLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
  m_addressLabel->setStyleSheet("QLabel { color: #9cdcfe; }");

  m_statusLabel = new QLabel(this);
  m_statusLabel->setStyleSheet("QLabel { color: #808080; }");

  layout->addWidget(m_titleLabel);
  layout->addWidget(m_addressLabel);
  layout->addWidget(m_statusLabel);
  layout->addStretch();
  setLayout(layout);

  Update(tab);
}

TabPageWidget::~TabPageWidget() {}

void TabPageWidget::Update(const Tab &tab) {
  m_titleLabel->setText(QString::fromStdString(tab.Title));
  m_addressLabel->setText(QString::fromStdString(tab.Address));
  m_statusLabel->setText(
      QString("Tab #%1%2")
          .arg(static_cast<qulonglong>(tab.Id.Value))
          .arg(tab.IsLoading ? QString(" - loading") : QString()));
}

// === TabPageSurface ===

TabPageSurface::TabPageSurface(BrowserShell *shell, TabPageWidget *page)
    : m_Shell(shell), m_Page(page) {}

TabPageSurface::~TabPageSurface() {
  if (m_Page) {
    m_Page->deleteLater();
  }
}

void TabPageSurface::OnDetached(WindowHandle from) {
  if (!m_Page) {
    return;
  }

  if (BrowserWindow *window = m_Shell->FindWindow(from)) {
    window->DetachPage(m_Page);
  } else {
    m_Page->hide();
    m_Page->setParent(nullptr);
  }
}

void TabPageSurface::OnAttached(WindowHandle to) {
  if (!m_Page) {
    return;
  }

  BrowserWindow *window = m_Shell->FindWindow(to);
  if (!window) {
    std::string message =
        "[TabPageSurface] No chrome for window #" + std::to_string(to.Value);
    std::cerr << message << std::endl;
    if (ConsoleWidget *console = ConsoleWidget::Instance()) {
      console->PrintError(message);
    }
    return;
  }

  window->AttachPage(m_Page);
}
