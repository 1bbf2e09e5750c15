#include "WindowLifecycleManager.h"
#include <algorithm>
#include <iostream>

namespace Kestrel {

WindowLifecycleManager::WindowLifecycleManager(WindowRegistry &registry,
                                               IWindowHost &host,
                                               const BrowserSettings &settings)
    : m_Registry(registry), m_Host(host), m_Settings(settings),
      m_RecentlyClosed(settings.RecentlyClosedCapacity) {}

// ============================================================================
// Window creation
// ============================================================================

WindowHandle WindowLifecycleManager::OpenWindow(std::optional<glm::vec4> frame) {
  TabEntry seed(MakeNewWindowTab());
  seed.Surface = m_Host.CreateSurface(seed.Record);
  return OpenWindowWithTab(frame ? *frame : NextWindowFrame(), seed);
}

WindowHandle WindowLifecycleManager::OpenWindowWithTab(const glm::vec4 &frame,
                                                       TabEntry &seed) {
  WindowHandle handle = m_Host.CreateWindowChrome(frame);
  if (!handle.IsValid()) {
    std::cerr << "[WindowLifecycle] Window host failed to create a window"
              << std::endl;
    return WindowHandle{};
  }

  WindowContext &context = m_Registry.RegisterWindow(handle, frame);
  ITabSurface *surface = seed.Surface.get();
  TabId id = seed.Record.Id;
  context.GetTabs().Insert(0, std::move(seed), true);
  if (surface)
    surface->OnAttached(handle);

  std::cout << "[WindowLifecycle] Opened window #" << handle.Value
            << " with tab #" << id.Value << std::endl;
  NotifyTabsChanged(handle);
  return handle;
}

glm::vec4 WindowLifecycleManager::NextWindowFrame() const {
  const glm::vec2 &size = m_Settings.DefaultWindowSize;
  std::vector<WindowHandle> handles = m_Registry.GetHandles();
  if (handles.empty())
    return glm::vec4(100.0f, 100.0f, size.x, size.y);

  const glm::vec4 &front = m_Registry.Find(handles.back())->GetFrame();
  return glm::vec4(front.x + 30.0f, front.y + 30.0f, size.x, size.y);
}

// ============================================================================
// Tabs
// ============================================================================

Tab WindowLifecycleManager::MakeTab(const std::string &address) const {
  std::string target = address.empty() ? m_Settings.StartPageAddress : address;

  Tab tab = Tab::Create(m_Settings.BlankTabTitle, target);
  if (!tab.IsSpecialPage()) {
    tab.Title = ExtractHostname(target).value_or(target);
    tab.IsLoading = true;
  }
  return tab;
}

Tab WindowLifecycleManager::MakeNewWindowTab() const {
  switch (m_Settings.NewWindowOpensWith) {
  case NewWindowContent::Homepage:
    return MakeTab(m_Settings.Homepage);
  case NewWindowContent::EmptyPage:
    return MakeTab(m_Settings.EmptyPageAddress);
  case NewWindowContent::StartPage:
  default:
    return MakeTab(m_Settings.StartPageAddress);
  }
}

std::optional<TabId> WindowLifecycleManager::OpenTab(WindowHandle window,
                                                     const std::string &address,
                                                     bool activate) {
  WindowContext *context = m_Registry.Find(window);
  if (!context)
    return std::nullopt;

  Tab tab = MakeTab(address);
  TabId id = tab.Id;
  std::unique_ptr<ITabSurface> surface = m_Host.CreateSurface(tab);
  ITabSurface *attached = surface.get();
  context->GetTabs().AddTab(std::move(tab), std::move(surface), activate);
  if (attached)
    attached->OnAttached(window);

  NotifyTabsChanged(window);
  return id;
}

bool WindowLifecycleManager::ActivateTab(WindowHandle window, TabId id) {
  WindowContext *context = m_Registry.Find(window);
  if (!context || !context->GetTabs().Activate(id))
    return false;
  NotifyTabsChanged(window);
  return true;
}

bool WindowLifecycleManager::CloseTab(TabId id) {
  WindowContext *context = m_Registry.FindWindowContainingTab(id);
  if (!context)
    return false;

  WindowHandle handle = context->GetHandle();
  WindowTabList &tabs = context->GetTabs();
  size_t index = *tabs.IndexOf(id);

  std::optional<TabEntry> entry = tabs.Remove(id);
  m_RecentlyClosed.Record(entry->Record, handle, index);
  entry.reset();
  std::cout << "[WindowLifecycle] Closed tab #" << id.Value << " in window #"
            << handle.Value << std::endl;
  NotifyTabClosed(id);

  if (tabs.Empty()) {
    size_t otherWindows = 0;
    for (WindowHandle other : m_Registry.GetHandles()) {
      if (other != handle && !IsDestroyPending(other))
        otherWindows++;
    }
    bool soleWindow = otherWindows == 0;

    if (m_Settings.LastTab == LastTabPolicy::KeepWindowWithBlankTab &&
        soleWindow) {
      Tab blank = MakeTab(m_Settings.StartPageAddress);
      std::unique_ptr<ITabSurface> surface = m_Host.CreateSurface(blank);
      ITabSurface *attached = surface.get();
      tabs.AddTab(std::move(blank), std::move(surface), true);
      if (attached)
        attached->OnAttached(handle);
    } else {
      ScheduleDestroy(handle);
    }
  }

  NotifyTabsChanged(handle);
  FlushPendingDestroys();
  return true;
}

bool WindowLifecycleManager::CloseWindow(WindowHandle handle) {
  WindowContext *context = m_Registry.Find(handle);
  if (!context)
    return false;

  WindowTabList &tabs = context->GetTabs();
  std::vector<TabId> ids = tabs.GetTabIds();
  for (size_t i = 0; i < ids.size(); i++) {
    std::optional<TabEntry> entry = tabs.Remove(ids[i]);
    m_RecentlyClosed.Record(entry->Record, handle, i);
    NotifyTabClosed(ids[i]);
  }

  DestroyWindow(handle);
  return true;
}

std::optional<TabId>
WindowLifecycleManager::ReopenLastClosedTab(WindowHandle fallback) {
  const ClosedTabRecord *latest = m_RecentlyClosed.PeekMostRecent();
  if (!latest)
    return std::nullopt;

  WindowContext *context = m_Registry.Find(latest->Window);
  bool sameWindow = context && !IsDestroyPending(latest->Window);
  if (!sameWindow)
    context = m_Registry.Find(fallback);
  if (!context)
    return std::nullopt;

  ClosedTabRecord record = *m_RecentlyClosed.PopMostRecent();
  WindowTabList &tabs = context->GetTabs();

  Tab tab = Tab::Create(record.Title, record.Address, true);
  TabId id = tab.Id;
  std::unique_ptr<ITabSurface> surface = m_Host.CreateSurface(tab);
  ITabSurface *attached = surface.get();
  size_t index = sameWindow ? std::min(record.Index, tabs.Size()) : tabs.Size();
  tabs.Insert(index, TabEntry(std::move(tab), std::move(surface)), true);
  if (attached)
    attached->OnAttached(context->GetHandle());

  std::cout << "[WindowLifecycle] Reopened " << record.Address << " in window #"
            << context->GetHandle().Value << std::endl;
  NotifyTabsChanged(context->GetHandle());
  return id;
}

// ============================================================================
// Teardown
// ============================================================================

void WindowLifecycleManager::ScheduleDestroy(WindowHandle handle) {
  if (IsDestroyPending(handle))
    return;
  m_PendingDestroy.push_back(handle);
  std::cout << "[WindowLifecycle] Window #" << handle.Value
            << " is empty, scheduling close" << std::endl;
}

bool WindowLifecycleManager::IsDestroyPending(WindowHandle handle) const {
  return std::find(m_PendingDestroy.begin(), m_PendingDestroy.end(), handle) !=
         m_PendingDestroy.end();
}

size_t WindowLifecycleManager::FlushPendingDestroys() {
  std::vector<WindowHandle> pending;
  pending.swap(m_PendingDestroy);

  size_t destroyed = 0;
  for (WindowHandle handle : pending) {
    WindowContext *context = m_Registry.Find(handle);
    if (!context)
      continue;
    if (!context->GetTabs().Empty()) {
      std::cout << "[WindowLifecycle] Window #" << handle.Value
                << " received a tab again, keeping it" << std::endl;
      continue;
    }
    DestroyWindow(handle);
    destroyed++;
  }
  return destroyed;
}

void WindowLifecycleManager::DestroyWindow(WindowHandle handle) {
  std::unique_ptr<WindowContext> context = m_Registry.UnregisterWindow(handle);
  if (!context)
    return;

  m_PendingDestroy.erase(
      std::remove(m_PendingDestroy.begin(), m_PendingDestroy.end(), handle),
      m_PendingDestroy.end());
  m_ReportedActive.erase(handle);

  std::cout << "[WindowLifecycle] Closing window #" << handle.Value
            << std::endl;
  for (const auto &listener : m_WindowDestroyedListeners) {
    listener(handle);
  }
  m_Host.ReleaseWindowChrome(handle);
}

// ============================================================================
// Notifications
// ============================================================================

void WindowLifecycleManager::NotifyTabsChanged(WindowHandle handle) {
  WindowContext *context = m_Registry.Find(handle);
  if (!context)
    return;

  m_Host.OnTabsChanged(handle);

  std::optional<TabId> active = context->GetTabs().GetActiveId();
  auto it = m_ReportedActive.find(handle);
  if (it == m_ReportedActive.end() || it->second != active) {
    m_ReportedActive[handle] = active;
    m_Host.OnActiveTabChanged(handle, context->GetTabs().GetActiveTab());
  }
}

void WindowLifecycleManager::NotifyTabClosed(TabId id) {
  for (const auto &listener : m_TabClosedListeners) {
    listener(id);
  }
}

bool WindowLifecycleManager::OnTitleChanged(TabId id,
                                            const std::string &title) {
  WindowContext *context = m_Registry.FindWindowContainingTab(id);
  if (!context)
    return false;

  Tab *tab = context->GetTabs().Find(id);
  tab->Title = title;
  m_Host.OnTabsChanged(context->GetHandle());
  if (context->GetTabs().GetActiveId() == id)
    m_Host.OnActiveTabChanged(context->GetHandle(), tab);
  return true;
}

bool WindowLifecycleManager::OnAddressChanged(TabId id,
                                              const std::string &address) {
  WindowContext *context = m_Registry.FindWindowContainingTab(id);
  if (!context)
    return false;

  Tab *tab = context->GetTabs().Find(id);
  tab->Address = address;
  if (context->GetTabs().GetActiveId() == id)
    m_Host.OnActiveTabChanged(context->GetHandle(), tab);
  return true;
}

bool WindowLifecycleManager::OnLoadingChanged(TabId id, bool isLoading) {
  WindowContext *context = m_Registry.FindWindowContainingTab(id);
  if (!context)
    return false;

  context->GetTabs().Find(id)->IsLoading = isLoading;
  m_Host.OnTabsChanged(context->GetHandle());
  return true;
}

bool WindowLifecycleManager::OnNavigationStateChanged(TabId id, bool canGoBack,
                                                      bool canGoForward) {
  WindowContext *context = m_Registry.FindWindowContainingTab(id);
  if (!context)
    return false;

  Tab *tab = context->GetTabs().Find(id);
  tab->CanGoBack = canGoBack;
  tab->CanGoForward = canGoForward;
  if (context->GetTabs().GetActiveId() == id)
    m_Host.OnActiveTabChanged(context->GetHandle(), tab);
  return true;
}

void WindowLifecycleManager::AddWindowDestroyedListener(
    WindowListener listener) {
  m_WindowDestroyedListeners.push_back(std::move(listener));
}

void WindowLifecycleManager::AddTabClosedListener(TabListener listener) {
  m_TabClosedListeners.push_back(std::move(listener));
}

} // namespace Kestrel
