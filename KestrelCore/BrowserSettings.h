#pragma once

#include "glm/glm.hpp"
#include <cstddef>
#include <string>

namespace Kestrel {

// What happens when the last tab of a window is closed directly
enum class LastTabPolicy {
  KeepWindowWithBlankTab, // Only when it is the sole open window
  CloseWindow             // Always destroy the window
};

// First tab of a window opened from the menu (not from a detach)
enum class NewWindowContent { StartPage, Homepage, EmptyPage };

// Shell configuration. The Qt shell loads and stores it through QSettings.
struct BrowserSettings {
  // Pointer travel (pixels) before a press becomes a drag
  float DragThreshold = 5.0f;

  LastTabPolicy LastTab = LastTabPolicy::KeepWindowWithBlankTab;
  NewWindowContent NewWindowOpensWith = NewWindowContent::StartPage;
  std::string Homepage;

  std::string BlankTabTitle = "New Tab";
  std::string StartPageAddress = "kestrel:blank";
  std::string EmptyPageAddress = "about:blank";

  glm::vec2 DefaultWindowSize = glm::vec2(1024.0f, 768.0f);

  // Fallback grab point inside a detached window when the dragged tab has
  // no published geometry: horizontally centered, slightly below the top.
  float DetachedGrabOffsetY = 50.0f;

  size_t RecentlyClosedCapacity = 20;
};

} // namespace Kestrel
