#include "TabStripLayout.h"

namespace Kestrel {

TabStripLayout::TabStripLayout(const glm::vec4 &stripRect,
                               std::vector<TabRect> tabs)
    : m_StripRect(stripRect), m_Tabs(std::move(tabs)) {}

TabStripLayout TabStripLayout::Uniform(const glm::vec4 &windowFrame,
                                       const std::vector<TabId> &tabs,
                                       float tabWidth, float stripHeight) {
  glm::vec4 strip(windowFrame.x, windowFrame.y, windowFrame.z, stripHeight);

  std::vector<TabRect> rects;
  rects.reserve(tabs.size());
  float x = windowFrame.x;
  for (const TabId &id : tabs) {
    rects.push_back({id, glm::vec4(x, windowFrame.y, tabWidth, stripHeight)});
    x += tabWidth;
  }
  return TabStripLayout(strip, std::move(rects));
}

bool TabStripLayout::ContainsPoint(const glm::vec2 &point) const {
  return RectContains(m_StripRect, point);
}

std::optional<TabStripHit> TabStripLayout::HitTest(
    const glm::vec2 &point) const {
  if (m_Tabs.empty() || !ContainsPoint(point))
    return std::nullopt;

  for (const TabRect &tab : m_Tabs) {
    const glm::vec4 &r = tab.Rect;
    if (point.x >= r.x && point.x < r.x + r.z) {
      TabStripHit hit;
      hit.Id = tab.Id;
      hit.InsertAfter = point.x > r.x + r.z * 0.5f;
      return hit;
    }
  }

  const TabRect &first = m_Tabs.front();
  if (point.x < first.Rect.x) {
    TabStripHit hit;
    hit.Id = first.Id;
    hit.InsertAfter = false;
    return hit;
  }

  const TabRect &last = m_Tabs.back();
  if (point.x >= last.Rect.x + last.Rect.z) {
    TabStripHit hit;
    hit.Id = last.Id;
    hit.InsertAfter = true;
    hit.PastLastTab = true;
    return hit;
  }

  // Gap between two tabs
  return std::nullopt;
}

std::optional<glm::vec4> TabStripLayout::GetTabRect(TabId id) const {
  for (const TabRect &tab : m_Tabs) {
    if (tab.Id == id)
      return tab.Rect;
  }
  return std::nullopt;
}

} // namespace Kestrel
