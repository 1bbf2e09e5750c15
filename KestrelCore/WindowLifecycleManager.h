#pragma once

#include "BrowserSettings.h"
#include "RecentlyClosedTabs.h"
#include "WindowRegistry.h"
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace Kestrel {

// Window chrome provider. The Qt shell implements this; tests use a fake.
class IWindowHost {
public:
  virtual ~IWindowHost() = default;

  // Creates an on-screen window. Returns an invalid handle on failure.
  virtual WindowHandle CreateWindowChrome(const glm::vec4 &frame) = 0;

  // Releases the on-screen resources of a window that left the registry
  virtual void ReleaseWindowChrome(WindowHandle handle) = 0;

  // The window's tab list changed (order, membership or tab fields)
  virtual void OnTabsChanged(WindowHandle handle) = 0;

  // The active tab changed, or its title did. Null when the list is empty.
  virtual void OnActiveTabChanged(WindowHandle handle, const Tab *active) = 0;

  // Live surface for a newly opened tab (may be null)
  virtual std::unique_ptr<ITabSurface> CreateSurface(const Tab &tab) = 0;
};

// Creates windows, keeps every registered window non-empty and tears
// windows down when their last tab leaves. Also the entry point for the
// rendering collaborator's tab content notifications.
class WindowLifecycleManager {
public:
  using WindowListener = std::function<void(WindowHandle)>;
  using TabListener = std::function<void(TabId)>;

  WindowLifecycleManager(WindowRegistry &registry, IWindowHost &host,
                         const BrowserSettings &settings);

  WindowLifecycleManager(const WindowLifecycleManager &) = delete;
  WindowLifecycleManager &operator=(const WindowLifecycleManager &) = delete;

  // New window whose first tab follows BrowserSettings::NewWindowOpensWith.
  // Without a frame the window cascades from the front-most one.
  WindowHandle OpenWindow(std::optional<glm::vec4> frame = std::nullopt);

  // New window holding exactly the seed tab, active. The seed is moved from
  // only on success; an invalid handle leaves it untouched.
  WindowHandle OpenWindowWithTab(const glm::vec4 &frame, TabEntry &seed);

  // Appends a tab for the address (start page when empty)
  std::optional<TabId> OpenTab(WindowHandle window, const std::string &address,
                               bool activate = true);

  bool ActivateTab(WindowHandle window, TabId id);

  // Closes a tab directly (not by drag). The last tab of the sole window is
  // replaced by a blank tab under LastTabPolicy::KeepWindowWithBlankTab.
  bool CloseTab(TabId id);

  // Closes a window and every tab in it
  bool CloseWindow(WindowHandle handle);

  // Re-creates the most recently closed tab in its old window when that
  // window is still open, otherwise in the fallback window
  std::optional<TabId> ReopenLastClosedTab(WindowHandle fallback);

  // Queues a window for release once it is confirmed empty
  void ScheduleDestroy(WindowHandle handle);
  bool IsDestroyPending(WindowHandle handle) const;

  // Releases every queued window that is still empty. Returns the count.
  size_t FlushPendingDestroys();

  // Tells the host about list changes, and about active tab changes
  void NotifyTabsChanged(WindowHandle handle);

  // Content notifications from the rendering collaborator. Return false for
  // an unknown tab.
  bool OnTitleChanged(TabId id, const std::string &title);
  bool OnAddressChanged(TabId id, const std::string &address);
  bool OnLoadingChanged(TabId id, bool isLoading);
  bool OnNavigationStateChanged(TabId id, bool canGoBack, bool canGoForward);

  void AddWindowDestroyedListener(WindowListener listener);
  void AddTabClosedListener(TabListener listener);

  const RecentlyClosedTabs &GetRecentlyClosed() const {
    return m_RecentlyClosed;
  }
  RecentlyClosedTabs &GetRecentlyClosed() { return m_RecentlyClosed; }

  WindowRegistry &GetRegistry() { return m_Registry; }
  const BrowserSettings &GetSettings() const { return m_Settings; }

private:
  Tab MakeTab(const std::string &address) const;
  Tab MakeNewWindowTab() const;
  glm::vec4 NextWindowFrame() const;
  void DestroyWindow(WindowHandle handle);
  void NotifyTabClosed(TabId id);

  WindowRegistry &m_Registry;
  IWindowHost &m_Host;
  const BrowserSettings &m_Settings;

  RecentlyClosedTabs m_RecentlyClosed;
  std::vector<WindowHandle> m_PendingDestroy;

  // Last active tab reported to the host, per window
  std::unordered_map<WindowHandle, std::optional<TabId>> m_ReportedActive;

  std::vector<WindowListener> m_WindowDestroyedListeners;
  std::vector<TabListener> m_TabClosedListeners;
};

} // namespace Kestrel
