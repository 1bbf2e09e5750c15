#pragma once

#include "TabSurface.h"
#include <optional>
#include <vector>

namespace Kestrel {

// Ordered tabs of one window (left-to-right) plus the active one.
// The active id, when set, always names a member.
class WindowTabList {
public:
  WindowTabList() = default;

  WindowTabList(const WindowTabList &) = delete;
  WindowTabList &operator=(const WindowTabList &) = delete;

  // Appends a tab and returns its index
  size_t AddTab(Tab tab, std::unique_ptr<ITabSurface> surface = nullptr,
                bool makeActive = true);

  // Inserts an entry at index (clamped to the end)
  size_t Insert(size_t index, TabEntry entry, bool makeActive = false);

  // Removes a tab. When it was active, the tab now at its index (or the new
  // last tab) becomes active.
  std::optional<TabEntry> Remove(TabId id);

  // Same-window reorder. The dragged tab is removed first and the target's
  // index is resolved afterwards. Returns false when nothing moved.
  bool Move(TabId dragged, TabId target, bool insertAfter);

  // Returns false when the tab is not a member
  bool Activate(TabId id);

  // Queries
  std::optional<size_t> IndexOf(TabId id) const;
  bool Contains(TabId id) const { return IndexOf(id).has_value(); }
  Tab *Find(TabId id);
  const Tab *Find(TabId id) const;
  ITabSurface *GetSurface(TabId id) const;

  const Tab &At(size_t index) const { return m_Entries.at(index).Record; }
  std::vector<TabId> GetTabIds() const;

  std::optional<TabId> GetActiveId() const { return m_ActiveId; }
  std::optional<size_t> GetActiveIndex() const;
  const Tab *GetActiveTab() const;

  size_t Size() const { return m_Entries.size(); }
  bool Empty() const { return m_Entries.empty(); }

private:
  std::vector<TabEntry> m_Entries;
  std::optional<TabId> m_ActiveId;
};

} // namespace Kestrel
