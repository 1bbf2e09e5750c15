#include "DragSession.h"
#include <iostream>

namespace Kestrel {

DragSessionController::DragSessionController(WindowRegistry &registry,
                                             WindowLifecycleManager &lifecycle,
                                             const BrowserSettings &settings)
    : m_Registry(registry), m_Lifecycle(lifecycle), m_Settings(settings),
      m_Protocol(registry, lifecycle, m_Errors) {
  m_Lifecycle.AddWindowDestroyedListener(
      [this](WindowHandle handle) { OnWindowDestroyed(handle); });
  m_Lifecycle.AddTabClosedListener([this](TabId id) { OnTabClosed(id); });
}

// ============================================================================
// Pointer events
// ============================================================================

DragOutcome DragSessionController::BeginDrag(TabId tab, WindowHandle origin,
                                             const glm::vec2 &pointer) {
  if (IsInProgress())
    Cancel();

  m_State = DragState::Tracking;
  m_Tab = tab;
  m_Origin = origin;
  m_PressPoint = pointer;
  m_Invalidated = false;
  m_GrabOffset.reset();
  m_StripOffset = glm::vec2(0.0f);
  m_OriginSize = glm::vec2(0.0f);
  m_Payload.reset();
  m_EncodedPayload.clear();
  m_DropTarget = DropTarget{};

  if (IsStale())
    return ResolveStale("DragSessionController::BeginDrag");

  WindowContext *window = m_Registry.Find(origin);
  const TabStripLayout &strip = window->GetTabStrip();
  std::optional<glm::vec4> tabRect = strip.GetTabRect(tab);
  if (tabRect)
    m_GrabOffset = pointer - RectOrigin(*tabRect);
  if (!strip.IsEmpty())
    m_StripOffset = RectOrigin(strip.GetTabs().front().Rect) -
                    RectOrigin(window->GetFrame());
  m_OriginSize = RectSize(window->GetFrame());

  return DragOutcome::Pending;
}

DragOutcome DragSessionController::UpdateDrag(const glm::vec2 &pointer) {
  if (!IsInProgress())
    return DragOutcome::None;
  if (IsStale())
    return ResolveStale("DragSessionController::UpdateDrag");

  if (m_State == DragState::Tracking) {
    float dist = glm::distance(pointer, m_PressPoint);
    if (dist <= m_Settings.DragThreshold)
      return DragOutcome::Pending;

    const Tab *tab = m_Registry.Find(m_Origin)->GetTabs().Find(m_Tab);
    m_Payload = TransferPayload::Capture(*tab, m_Origin);
    m_EncodedPayload = m_Payload->Serialize();
    m_State = DragState::Active;
    std::cout << "[DragSession] Dragging tab #" << m_Tab.Value
              << " out of window #" << m_Origin.Value << std::endl;
  }

  m_DropTarget = ComputeDropTarget(pointer);
  return DragOutcome::Pending;
}

DragOutcome DragSessionController::EndDrag(const glm::vec2 &pointer) {
  if (!IsInProgress())
    return DragOutcome::None;
  if (IsStale())
    return ResolveStale("DragSessionController::EndDrag");

  if (m_State == DragState::Tracking) {
    // Plain click
    m_Lifecycle.ActivateTab(m_Origin, m_Tab);
    return Finish(DragState::Cancelled, DragOutcome::Cancelled);
  }
  return ResolveActive(pointer);
}

DragOutcome DragSessionController::Cancel() {
  if (!IsInProgress())
    return DragOutcome::None;
  std::cout << "[DragSession] Drag of tab #" << m_Tab.Value << " abandoned"
            << std::endl;
  return Finish(DragState::Cancelled, DragOutcome::Cancelled);
}

// ============================================================================
// Invalidation
// ============================================================================

void DragSessionController::OnWindowDestroyed(WindowHandle handle) {
  if (IsInProgress() && handle == m_Origin)
    m_Invalidated = true;
}

void DragSessionController::OnTabClosed(TabId id) {
  if (IsInProgress() && id == m_Tab)
    m_Invalidated = true;
}

bool DragSessionController::IsStale() const {
  if (m_Invalidated)
    return true;
  WindowContext *window = m_Registry.Find(m_Origin);
  return !window || !window->GetTabs().Contains(m_Tab);
}

// ============================================================================
// Resolution
// ============================================================================

DropTarget
DragSessionController::ComputeDropTarget(const glm::vec2 &pointer) const {
  DropTarget target;
  WindowContext *window = m_Registry.FindWindowAt(pointer);
  if (!window) {
    target.Kind = DropKind::NewWindow;
    return target;
  }

  target.Window = window->GetHandle();
  std::optional<TabStripHit> hit = window->GetTabStrip().HitTest(pointer);

  if (window->GetHandle() == m_Origin) {
    if (hit && hit->Id != m_Tab && window->GetTabs().Contains(hit->Id)) {
      target.Kind = DropKind::Reorder;
      target.AnchorTab = hit->Id;
      target.InsertAfter = hit->InsertAfter;
      target.AtEnd = hit->PastLastTab;
    } else {
      target.Kind = DropKind::SnapBack;
    }
    return target;
  }

  // Anchors in other windows are checked again at insert time. Past the
  // last tab, or anywhere off the strip, the tab is appended.
  target.Kind = DropKind::InsertOther;
  if (hit && !hit->PastLastTab) {
    target.AnchorTab = hit->Id;
    target.InsertAfter = hit->InsertAfter;
  } else {
    target.AtEnd = true;
  }
  return target;
}

glm::vec4
DragSessionController::ComputeDetachedFrame(const glm::vec2 &pointer) const {
  glm::vec2 size = m_OriginSize;
  if (size.x <= 0.0f || size.y <= 0.0f)
    size = m_Settings.DefaultWindowSize;

  // The tab will be the first one of the new window, so keep the grab point
  // inside its header under the pointer
  glm::vec2 grab = m_GrabOffset
                       ? *m_GrabOffset + m_StripOffset
                       : glm::vec2(size.x * 0.5f, m_Settings.DetachedGrabOffsetY);
  glm::vec2 origin = pointer - grab;
  return glm::vec4(origin.x, origin.y, size.x, size.y);
}

DragOutcome DragSessionController::ResolveActive(const glm::vec2 &pointer) {
  std::optional<TransferPayload> payload =
      TransferPayload::Deserialize(m_EncodedPayload);
  if (!payload || payload->Id != m_Tab || payload->SourceWindow != m_Origin) {
    m_Errors.Report(TransferErrorSeverity::Error,
                    TransferErrorCode::MalformedPayload,
                    "drag data does not describe tab #" +
                        std::to_string(m_Tab.Value),
                    "DragSessionController::EndDrag");
    return Finish(DragState::Cancelled, DragOutcome::Cancelled);
  }
  if (!payload->ResolveSource(m_Registry))
    return ResolveStale("DragSessionController::EndDrag");

  DropTarget target = ComputeDropTarget(pointer);
  switch (target.Kind) {
  case DropKind::Reorder:
    m_Protocol.Reorder(m_Origin, payload->Id, *target.AnchorTab,
                       target.InsertAfter);
    return Finish(DragState::Reordered, DragOutcome::Reordered, m_Origin);

  case DropKind::InsertOther:
    if (!m_Protocol.Transfer(m_Origin, payload->Id, target.Window,
                             target.AnchorTab, target.InsertAfter))
      return Finish(DragState::Cancelled, DragOutcome::Cancelled);
    m_Registry.BringToFront(target.Window);
    return Finish(DragState::TransferredOut, DragOutcome::TransferredOut,
                  target.Window);

  case DropKind::NewWindow: {
    m_Errors.Report(TransferErrorSeverity::Info,
                    TransferErrorCode::NoDropTarget,
                    "tab #" + std::to_string(payload->Id.Value) +
                        " dropped outside every window",
                    "DragSessionController::EndDrag");
    WindowHandle created = m_Protocol.Detach(m_Origin, payload->Id,
                                             ComputeDetachedFrame(pointer));
    if (!created.IsValid())
      return Finish(DragState::Cancelled, DragOutcome::Cancelled);
    return Finish(DragState::Detached, DragOutcome::Detached, created);
  }

  case DropKind::SnapBack:
  case DropKind::None:
  default:
    return Finish(DragState::Cancelled, DragOutcome::Cancelled);
  }
}

DragOutcome DragSessionController::ResolveStale(const std::string &context) {
  m_Errors.Report(TransferErrorSeverity::Warning,
                  TransferErrorCode::StaleReference,
                  "tab #" + std::to_string(m_Tab.Value) + " or window #" +
                      std::to_string(m_Origin.Value) + " no longer exists",
                  context);
  return Finish(DragState::Cancelled, DragOutcome::Cancelled);
}

DragOutcome DragSessionController::Finish(DragState state, DragOutcome outcome,
                                          WindowHandle destination) {
  m_State = state;
  m_LastResolution.Outcome = outcome;
  m_LastResolution.Tab = m_Tab;
  m_LastResolution.Origin = m_Origin;
  m_LastResolution.Destination = destination;

  m_Payload.reset();
  m_EncodedPayload.clear();
  m_DropTarget = DropTarget{};

  std::cout << "[DragSession] Tab #" << m_Tab.Value << " resolved as "
            << DragOutcomeToString(outcome) << std::endl;

  // Windows emptied by this gesture go away only now
  m_Lifecycle.FlushPendingDestroys();
  return outcome;
}

} // namespace Kestrel
