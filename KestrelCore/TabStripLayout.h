#pragma once

#include "BrowserTypes.h"
#include <optional>
#include <vector>

namespace Kestrel {

// Screen rectangle of one tab header
struct TabRect {
  TabId Id;
  glm::vec4 Rect = glm::vec4(0.0f); // x, y, width, height
};

// Tab under the pointer and which half of it the pointer is on
struct TabStripHit {
  TabId Id;
  bool InsertAfter = false;
  bool PastLastTab = false; // Pointer in the strip beyond the last tab
};

// Screen-space geometry of a window's tab strip, published by the UI.
class TabStripLayout {
public:
  TabStripLayout() = default;
  TabStripLayout(const glm::vec4 &stripRect, std::vector<TabRect> tabs);

  // Evenly sized tabs along the top edge of a window frame
  static TabStripLayout Uniform(const glm::vec4 &windowFrame,
                                const std::vector<TabId> &tabs,
                                float tabWidth = 100.0f,
                                float stripHeight = 32.0f);

  bool IsEmpty() const { return m_Tabs.empty(); }
  bool ContainsPoint(const glm::vec2 &point) const;

  // Returns the tab the pointer is over. Inside the strip but past the last
  // tab resolves to "after the last tab"; before the first tab resolves to
  // "before the first tab".
  std::optional<TabStripHit> HitTest(const glm::vec2 &point) const;

  std::optional<glm::vec4> GetTabRect(TabId id) const;
  const glm::vec4 &GetStripRect() const { return m_StripRect; }
  const std::vector<TabRect> &GetTabs() const { return m_Tabs; }

private:
  glm::vec4 m_StripRect = glm::vec4(0.0f);
  std::vector<TabRect> m_Tabs; // Left to right
};

} // namespace Kestrel
