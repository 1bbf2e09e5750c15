#include "BrowserShell.h"
#include "BrowserWindow.h"
#include "ConsoleWidget.h"
#include "TabPageWidget.h"
#include <QtCore/QTimer>
#include <iostream>

using namespace Kestrel;

BrowserShell::BrowserShell(const BrowserSettings &settings, QObject *parent)
    : QObject(parent), m_Settings(settings),
      m_Lifecycle(m_Registry, *this, m_Settings),
      m_DragSession(m_Registry, m_Lifecycle, m_Settings) {
  m_Lifecycle.GetRecentlyClosed().SetCapacity(m_Settings.RecentlyClosedCapacity);

  // Diagnostics window, shared by every browser window
  m_Console = new ConsoleWidget();
  m_Console->setWindowTitle(tr("Kestrel - Transfer Console"));
  m_Console->resize(800, 240);
  m_Console->SetErrorLog(&m_DragSession.GetErrors());

  m_DragSession.GetErrors().SetListener([this](const TransferError &error) {
    m_Console->PrintTransferError(error);
  });

  m_Lifecycle.AddWindowDestroyedListener([this](WindowHandle handle) {
    m_Console->PrintDebug("Window #" + std::to_string(handle.Value) +
                          " destroyed");
  });

  m_Lifecycle.AddTabClosedListener([this](TabId id) { m_History.erase(id); });
}

BrowserShell::~BrowserShell() {
  m_DragSession.Cancel();
  m_DragSession.GetErrors().SetListener(nullptr);
  if (m_DragSession.GetErrors().Count() > 0) {
    m_DragSession.GetErrors().ListErrors();
  }

  for (WindowHandle handle : m_Registry.GetHandles()) {
    m_Lifecycle.CloseWindow(handle);
  }

  delete m_Console;
}

WindowHandle BrowserShell::CreateWindowChrome(const glm::vec4 &frame) {
  WindowHandle handle{++m_LastHandle};

  BrowserWindow *window = new BrowserWindow(this, handle);
  window->setGeometry(static_cast<int>(frame.x), static_cast<int>(frame.y),
                      static_cast<int>(frame.z), static_cast<int>(frame.w));
  m_Windows[handle] = window;
  window->show();

  // Registration happens after this returns, so the first geometry sync
  // has to wait for the event loop
  QTimer::singleShot(0, this, [this, handle]() { SyncWindowGeometry(handle); });

  return handle;
}

void BrowserShell::ReleaseWindowChrome(WindowHandle handle) {
  auto it = m_Windows.find(handle);
  if (it == m_Windows.end()) {
    return;
  }

  QPointer<BrowserWindow> window = it->second;
  m_Windows.erase(it);

  if (window) {
    window->MarkReleased();
    window->close();
    window->deleteLater();
  }
}

void BrowserShell::OnTabsChanged(WindowHandle handle) {
  if (BrowserWindow *window = FindWindow(handle)) {
    window->RefreshTabs();
  }
}

void BrowserShell::OnActiveTabChanged(WindowHandle handle, const Tab *active) {
  if (BrowserWindow *window = FindWindow(handle)) {
    window->SetActiveTab(active);
  }
}

std::unique_ptr<ITabSurface> BrowserShell::CreateSurface(const Tab &tab) {
  return std::make_unique<TabPageSurface>(this, new TabPageWidget(tab));
}

BrowserWindow *BrowserShell::FindWindow(WindowHandle handle) const {
  auto it = m_Windows.find(handle);
  if (it == m_Windows.end()) {
    return nullptr;
  }
  return it->second.data();
}

void BrowserShell::SyncWindowGeometry(WindowHandle handle) {
  BrowserWindow *window = FindWindow(handle);
  if (!window) {
    return;
  }

  QRect geometry = window->geometry();
  m_Registry.UpdateWindowFrame(
      handle, glm::vec4(geometry.x(), geometry.y(), geometry.width(),
                        geometry.height()));
  window->PublishTabStrip();
}

void BrowserShell::RefreshTabStrips() {
  for (auto &entry : m_Windows) {
    if (entry.second) {
      entry.second->RefreshDropIndicator();
    }
  }
}

void BrowserShell::OnDragFinished(DragOutcome outcome) {
  const DragResolution &resolution = m_DragSession.GetLastResolution();

  std::string line = "Tab #" + std::to_string(resolution.Tab.Value) + " " +
                     DragOutcomeToString(outcome);
  if (resolution.Destination.IsValid()) {
    line += " -> window #" + std::to_string(resolution.Destination.Value);
  }
  m_Console->Print(line);

  if (outcome == DragOutcome::TransferredOut ||
      outcome == DragOutcome::Detached) {
    if (BrowserWindow *window = FindWindow(resolution.Destination)) {
      window->raise();
      window->activateWindow();
    }
  }

  RefreshTabStrips();
}

void BrowserShell::Navigate(TabId id, const std::string &address) {
  std::string target = address;
  if (!target.empty() && target.find(':') == std::string::npos) {
    target = "https://" + target;
  }

  WindowContext *context = m_Registry.FindWindowContainingTab(id);
  const Tab *tab = context ? context->GetTabs().Find(id) : nullptr;
  if (!tab) {
    return;
  }

  NavigationHistory &history = m_History[id];
  if (history.Empty() && !tab->Address.empty()) {
    history.Visit(tab->Address);
  }
  history.Visit(target);
  LoadAddress(id, target);
}

void BrowserShell::GoBack(TabId id) {
  auto it = m_History.find(id);
  if (it == m_History.end()) {
    return;
  }

  if (std::optional<std::string> address = it->second.Back()) {
    LoadAddress(id, *address);
  }
}

void BrowserShell::GoForward(TabId id) {
  auto it = m_History.find(id);
  if (it == m_History.end()) {
    return;
  }

  if (std::optional<std::string> address = it->second.Forward()) {
    LoadAddress(id, *address);
  }
}

void BrowserShell::LoadAddress(TabId id, const std::string &address) {
  if (!m_Lifecycle.OnAddressChanged(id, address)) {
    return;
  }

  std::optional<std::string> host = ExtractHostname(address);
  m_Lifecycle.OnTitleChanged(id, host ? *host : address);
  m_Lifecycle.OnLoadingChanged(id, false);

  const NavigationHistory &history = m_History[id];
  m_Lifecycle.OnNavigationStateChanged(id, history.CanGoBack(),
                                       history.CanGoForward());
}

void BrowserShell::ShowConsole() {
  m_Console->show();
  m_Console->raise();
}
