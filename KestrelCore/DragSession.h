#pragma once

#include "TransferPayload.h"
#include "TransferProtocol.h"
#include <optional>
#include <string>

namespace Kestrel {

// How the last session ended
struct DragResolution {
  DragOutcome Outcome = DragOutcome::None;
  TabId Tab;
  WindowHandle Origin;
  WindowHandle Destination; // Receiving window for transfers and detaches
};

// State machine for one press-drag-release gesture on a tab header.
//
// Idle -> Tracking (press) -> Active (moved past the threshold)
//      -> Reordered | TransferredOut | Detached | Cancelled (release)
//
// The drag data is encoded at promotion and decoded again on release, so the
// drop side identifies the tab and its source window from the payload alone.
// Window teardown and tab closing can invalidate a session at any time; the
// next touch then resolves it as Cancelled without mutating anything.
class DragSessionController {
public:
  DragSessionController(WindowRegistry &registry,
                        WindowLifecycleManager &lifecycle,
                        const BrowserSettings &settings);

  DragSessionController(const DragSessionController &) = delete;
  DragSessionController &operator=(const DragSessionController &) = delete;

  // Pointer positions are in screen coordinates
  DragOutcome BeginDrag(TabId tab, WindowHandle origin,
                        const glm::vec2 &pointer);
  DragOutcome UpdateDrag(const glm::vec2 &pointer);
  DragOutcome EndDrag(const glm::vec2 &pointer);

  // Abandons the gesture (focus loss, escape key)
  DragOutcome Cancel();

  // Invalidation signals, accepted in any state
  void OnWindowDestroyed(WindowHandle handle);
  void OnTabClosed(TabId id);

  DragState GetState() const { return m_State; }
  bool IsInProgress() const {
    return m_State == DragState::Tracking || m_State == DragState::Active;
  }
  TabId GetDraggedTab() const { return m_Tab; }
  WindowHandle GetOriginWindow() const { return m_Origin; }

  const std::optional<TransferPayload> &GetPayload() const { return m_Payload; }
  const std::string &GetEncodedPayload() const { return m_EncodedPayload; }

  // Candidate drop target for the indicator, None unless Active
  const DropTarget &GetDropTarget() const { return m_DropTarget; }

  const DragResolution &GetLastResolution() const { return m_LastResolution; }

  TransferErrorLog &GetErrors() { return m_Errors; }
  const TransferErrorLog &GetErrors() const { return m_Errors; }

private:
  bool IsStale() const;
  DropTarget ComputeDropTarget(const glm::vec2 &pointer) const;
  glm::vec4 ComputeDetachedFrame(const glm::vec2 &pointer) const;
  DragOutcome ResolveActive(const glm::vec2 &pointer);
  DragOutcome ResolveStale(const std::string &context);
  DragOutcome Finish(DragState state, DragOutcome outcome,
                     WindowHandle destination = WindowHandle{});

  WindowRegistry &m_Registry;
  WindowLifecycleManager &m_Lifecycle;
  const BrowserSettings &m_Settings;
  TransferErrorLog m_Errors;
  TransferProtocol m_Protocol;

  DragState m_State = DragState::Idle;
  TabId m_Tab;
  WindowHandle m_Origin;
  glm::vec2 m_PressPoint = glm::vec2(0.0f);
  bool m_Invalidated = false;

  // Press point relative to the pressed tab's header, when it had geometry
  std::optional<glm::vec2> m_GrabOffset;
  // Offset of the first tab slot inside the origin window
  glm::vec2 m_StripOffset = glm::vec2(0.0f);
  glm::vec2 m_OriginSize = glm::vec2(0.0f);

  std::optional<TransferPayload> m_Payload;
  std::string m_EncodedPayload;
  DropTarget m_DropTarget;
  DragResolution m_LastResolution;
};

} // namespace Kestrel
