#pragma once

#include "glm/glm.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

namespace Kestrel {

// Process-unique tab identity. Zero is never issued.
struct TabId {
  uint64_t Value = 0;

  bool IsValid() const { return Value != 0; }
  bool operator==(const TabId &other) const { return Value == other.Value; }
  bool operator!=(const TabId &other) const { return Value != other.Value; }
  bool operator<(const TabId &other) const { return Value < other.Value; }
};

// Opaque handle of a browser window, issued by the window host.
struct WindowHandle {
  uint64_t Value = 0;

  bool IsValid() const { return Value != 0; }
  bool operator==(const WindowHandle &other) const {
    return Value == other.Value;
  }
  bool operator!=(const WindowHandle &other) const {
    return Value != other.Value;
  }
  bool operator<(const WindowHandle &other) const {
    return Value < other.Value;
  }
};

// Drag session lifecycle
enum class DragState {
  Idle,           // No gesture
  Tracking,       // Pressed, threshold not crossed yet
  Active,         // Dragging with a payload
  Reordered,      // Moved inside the origin window
  TransferredOut, // Moved into another registered window
  Detached,       // Moved into a brand-new window
  Cancelled       // Click, snap back, or invalidated
};

// Result reported back to the UI after each pointer event
enum class DragOutcome {
  None,    // No session in progress
  Pending, // Session still tracking or active
  Cancelled,
  Reordered,
  TransferredOut,
  Detached
};

// What a drop at the current pointer position would do
enum class DropKind {
  None,         // Not dragging
  SnapBack,     // Inside origin window but not over another tab
  Reorder,      // Over another tab of the origin window
  InsertOther,  // Inside a different window
  NewWindow     // Outside every registered window
};

// Drop candidate recomputed on every drag update (drives the indicator)
struct DropTarget {
  DropKind Kind = DropKind::None;
  WindowHandle Window;            // Window under the pointer, if any
  std::optional<TabId> AnchorTab; // Tab the dragged tab lands next to
  bool InsertAfter = false;       // Right half of the anchor tab
  bool AtEnd = false;             // Lands after the last tab of the window
};

const char *DragStateToString(DragState state);
const char *DragOutcomeToString(DragOutcome outcome);

// Rectangle helpers. Rectangles are x, y, width, height.
inline bool RectContains(const glm::vec4 &rect, const glm::vec2 &point) {
  return point.x >= rect.x && point.x < rect.x + rect.z && point.y >= rect.y &&
         point.y < rect.y + rect.w;
}

inline glm::vec2 RectOrigin(const glm::vec4 &rect) {
  return glm::vec2(rect.x, rect.y);
}

inline glm::vec2 RectSize(const glm::vec4 &rect) {
  return glm::vec2(rect.z, rect.w);
}

} // namespace Kestrel

namespace std {

template <> struct hash<Kestrel::TabId> {
  size_t operator()(const Kestrel::TabId &id) const noexcept {
    return hash<uint64_t>()(id.Value);
  }
};

template <> struct hash<Kestrel::WindowHandle> {
  size_t operator()(const Kestrel::WindowHandle &handle) const noexcept {
    return hash<uint64_t>()(handle.Value);
  }
};

} // namespace std
