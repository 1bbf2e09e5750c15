#pragma once

#include "TransferError.h"
#include "WindowLifecycleManager.h"
#include <optional>

namespace Kestrel {

// A tab taken out of its window for a transfer, with what is needed to put
// it back exactly where it was.
struct TabRemoval {
  TabEntry Entry;
  WindowHandle Origin;
  glm::vec4 OriginFrame = glm::vec4(0.0f);
  size_t OriginalIndex = 0;
  bool WasActive = false;
};

// Ownership hand-off between window tab lists. The tab unit is moved, never
// shared: it sits in exactly one list except between Remove and Insert.
// Empty origins are only scheduled for destruction here; the caller flushes
// them once the gesture has settled.
class TransferProtocol {
public:
  TransferProtocol(WindowRegistry &registry, WindowLifecycleManager &lifecycle,
                   TransferErrorLog &errors);

  // Same-window move. Returns false when the sequence did not change.
  bool Reorder(WindowHandle window, TabId dragged, TabId target,
               bool insertAfter);

  // Step 1. Empty when the window or the tab is gone.
  std::optional<TabRemoval> Remove(WindowHandle origin, TabId id);

  // Step 2. Inserts next to the anchor (its index resolved now, after the
  // removal) or at the end without one. A vanished anchor falls back to the
  // end. The entry is moved out of the removal only on success; an empty
  // result means the destination is gone.
  std::optional<size_t> Insert(WindowHandle destination, TabRemoval &removal,
                               std::optional<TabId> anchor, bool insertAfter);

  // Puts a removed tab back at its original index and active state. When the
  // origin window is gone too, the tab gets a new window at the origin's
  // frame. Returns the window now holding the tab, invalid only if no window
  // could be created for it.
  WindowHandle Rollback(TabRemoval &removal);

  // Remove + Insert, rolled back when the destination cannot take the tab
  bool Transfer(WindowHandle origin, TabId id, WindowHandle destination,
                std::optional<TabId> anchor, bool insertAfter);

  // Remove + new window holding only the tab. Returns the new window, or an
  // invalid handle after rolling back.
  WindowHandle Detach(WindowHandle origin, TabId id, const glm::vec4 &frame);

private:
  WindowRegistry &m_Registry;
  WindowLifecycleManager &m_Lifecycle;
  TransferErrorLog &m_Errors;
};

} // namespace Kestrel
