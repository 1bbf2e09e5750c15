#include "TransferProtocol.h"
#include <iostream>

namespace Kestrel {

TransferProtocol::TransferProtocol(WindowRegistry &registry,
                                   WindowLifecycleManager &lifecycle,
                                   TransferErrorLog &errors)
    : m_Registry(registry), m_Lifecycle(lifecycle), m_Errors(errors) {}

bool TransferProtocol::Reorder(WindowHandle window, TabId dragged, TabId target,
                               bool insertAfter) {
  WindowContext *context = m_Registry.Find(window);
  if (!context)
    return false;

  if (!context->GetTabs().Move(dragged, target, insertAfter))
    return false;

  std::cout << "[TransferProtocol] Reordered tab #" << dragged.Value
            << (insertAfter ? " after #" : " before #") << target.Value
            << std::endl;
  m_Lifecycle.NotifyTabsChanged(window);
  return true;
}

std::optional<TabRemoval> TransferProtocol::Remove(WindowHandle origin,
                                                   TabId id) {
  WindowContext *context = m_Registry.Find(origin);
  if (!context)
    return std::nullopt;

  WindowTabList &tabs = context->GetTabs();
  std::optional<size_t> index = tabs.IndexOf(id);
  if (!index)
    return std::nullopt;

  TabRemoval removal;
  removal.Origin = origin;
  removal.OriginFrame = context->GetFrame();
  removal.OriginalIndex = *index;
  removal.WasActive = tabs.GetActiveId() == id;
  removal.Entry = std::move(*tabs.Remove(id));

  if (removal.Entry.Surface)
    removal.Entry.Surface->OnDetached(origin);

  m_Lifecycle.NotifyTabsChanged(origin);
  return removal;
}

std::optional<size_t> TransferProtocol::Insert(WindowHandle destination,
                                               TabRemoval &removal,
                                               std::optional<TabId> anchor,
                                               bool insertAfter) {
  WindowContext *context = m_Registry.Find(destination);
  if (!context)
    return std::nullopt;

  WindowTabList &tabs = context->GetTabs();
  size_t index = tabs.Size();
  if (anchor) {
    std::optional<size_t> anchorIndex = tabs.IndexOf(*anchor);
    if (anchorIndex) {
      index = *anchorIndex + (insertAfter ? 1 : 0);
    } else {
      m_Errors.Report(TransferErrorSeverity::Warning,
                      TransferErrorCode::AmbiguousIndex,
                      "anchor tab #" + std::to_string(anchor->Value) +
                          " left window #" +
                          std::to_string(destination.Value) +
                          ", appending instead",
                      "TransferProtocol::Insert");
    }
  }

  bool wasEmpty = tabs.Empty();
  ITabSurface *surface = removal.Entry.Surface.get();
  index = tabs.Insert(index, std::move(removal.Entry), wasEmpty);
  if (surface)
    surface->OnAttached(destination);

  m_Lifecycle.NotifyTabsChanged(destination);
  return index;
}

WindowHandle TransferProtocol::Rollback(TabRemoval &removal) {
  TabId id = removal.Entry.Record.Id;
  WindowContext *context = m_Registry.Find(removal.Origin);
  if (!context) {
    WindowHandle rehomed =
        m_Lifecycle.OpenWindowWithTab(removal.OriginFrame, removal.Entry);
    if (!rehomed.IsValid()) {
      m_Errors.Report(TransferErrorSeverity::Error,
                      TransferErrorCode::TransferFailure,
                      "window #" + std::to_string(removal.Origin.Value) +
                          " vanished and no window could be created, tab #" +
                          std::to_string(id.Value) + " was lost",
                      "TransferProtocol::Rollback");
      return WindowHandle{};
    }

    std::cout << "[TransferProtocol] Window #" << removal.Origin.Value
              << " vanished, tab #" << id.Value << " moved to new window #"
              << rehomed.Value << std::endl;
    return rehomed;
  }

  ITabSurface *surface = removal.Entry.Surface.get();
  context->GetTabs().Insert(removal.OriginalIndex, std::move(removal.Entry),
                            removal.WasActive);
  if (surface)
    surface->OnAttached(removal.Origin);

  std::cout << "[TransferProtocol] Rolled tab #" << id.Value
            << " back into window #" << removal.Origin.Value << " at index "
            << removal.OriginalIndex << std::endl;
  m_Lifecycle.NotifyTabsChanged(removal.Origin);
  return removal.Origin;
}

bool TransferProtocol::Transfer(WindowHandle origin, TabId id,
                                WindowHandle destination,
                                std::optional<TabId> anchor, bool insertAfter) {
  std::optional<TabRemoval> removal = Remove(origin, id);
  if (!removal)
    return false;

  std::optional<size_t> index =
      Insert(destination, *removal, anchor, insertAfter);
  if (!index) {
    WindowHandle home = Rollback(*removal);
    if (home.IsValid())
      m_Errors.Report(TransferErrorSeverity::Error,
                      TransferErrorCode::TransferFailure,
                      "window #" + std::to_string(destination.Value) +
                          " disappeared, tab #" + std::to_string(id.Value) +
                          " returned to window #" + std::to_string(home.Value),
                      "TransferProtocol::Transfer");
    return false;
  }

  std::cout << "[TransferProtocol] Moved tab #" << id.Value << " from window #"
            << origin.Value << " to window #" << destination.Value
            << " at index " << *index << std::endl;

  WindowContext *source = m_Registry.Find(origin);
  if (source && source->GetTabs().Empty())
    m_Lifecycle.ScheduleDestroy(origin);
  return true;
}

WindowHandle TransferProtocol::Detach(WindowHandle origin, TabId id,
                                      const glm::vec4 &frame) {
  std::optional<TabRemoval> removal = Remove(origin, id);
  if (!removal)
    return WindowHandle{};

  WindowHandle handle = m_Lifecycle.OpenWindowWithTab(frame, removal->Entry);
  if (!handle.IsValid()) {
    WindowHandle home = Rollback(*removal);
    if (home.IsValid())
      m_Errors.Report(TransferErrorSeverity::Error,
                      TransferErrorCode::TransferFailure,
                      "no window could be created, tab #" +
                          std::to_string(id.Value) + " returned to window #" +
                          std::to_string(home.Value),
                      "TransferProtocol::Detach");
    return WindowHandle{};
  }

  std::cout << "[TransferProtocol] Detached tab #" << id.Value
            << " into new window #" << handle.Value << std::endl;

  WindowContext *source = m_Registry.Find(origin);
  if (source && source->GetTabs().Empty())
    m_Lifecycle.ScheduleDestroy(origin);
  return handle;
}

} // namespace Kestrel
