#pragma once

#include "BrowserSettings.h"
#include "DragSession.h"
#include "NavigationHistory.h"
#include "WindowLifecycleManager.h"
#include "WindowRegistry.h"
#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <unordered_map>

class BrowserWindow;
class ConsoleWidget;

// Application root. Owns the registry, the lifecycle manager and the drag
// session, and provides the Qt window chrome they ask for.
class BrowserShell : public QObject, public Kestrel::IWindowHost {
  Q_OBJECT

public:
  explicit BrowserShell(const Kestrel::BrowserSettings &settings,
                        QObject *parent = nullptr);
  ~BrowserShell();

  // === IWindowHost ===
  Kestrel::WindowHandle CreateWindowChrome(const glm::vec4 &frame) override;
  void ReleaseWindowChrome(Kestrel::WindowHandle handle) override;
  void OnTabsChanged(Kestrel::WindowHandle handle) override;
  void OnActiveTabChanged(Kestrel::WindowHandle handle,
                          const Kestrel::Tab *active) override;
  std::unique_ptr<Kestrel::ITabSurface>
  CreateSurface(const Kestrel::Tab &tab) override;

  BrowserWindow *FindWindow(Kestrel::WindowHandle handle) const;

  // Pushes a window's current geometry into the registry
  void SyncWindowGeometry(Kestrel::WindowHandle handle);

  // Repaints every tab strip (drop indicator follows the drag)
  void RefreshTabStrips();

  // Called by the tab strip after every resolved gesture
  void OnDragFinished(Kestrel::DragOutcome outcome);

  // Simulated navigation of a tab (no real page loading)
  void Navigate(Kestrel::TabId id, const std::string &address);
  void GoBack(Kestrel::TabId id);
  void GoForward(Kestrel::TabId id);

  void ShowConsole();

  Kestrel::WindowRegistry &GetRegistry() { return m_Registry; }
  Kestrel::WindowLifecycleManager &GetLifecycle() { return m_Lifecycle; }
  Kestrel::DragSessionController &GetDragSession() { return m_DragSession; }
  const Kestrel::BrowserSettings &GetSettings() const { return m_Settings; }

private:
  // Shows address in the tab and refreshes its back/forward state
  void LoadAddress(Kestrel::TabId id, const std::string &address);

  Kestrel::BrowserSettings m_Settings;
  Kestrel::WindowRegistry m_Registry;
  Kestrel::WindowLifecycleManager m_Lifecycle;
  Kestrel::DragSessionController m_DragSession;

  std::unordered_map<Kestrel::WindowHandle, QPointer<BrowserWindow>> m_Windows;
  uint64_t m_LastHandle = 0;

  // Per-tab back/forward lists, dropped when the tab closes
  std::unordered_map<Kestrel::TabId, Kestrel::NavigationHistory> m_History;

  ConsoleWidget *m_Console;
};
