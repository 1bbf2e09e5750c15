#pragma once

#include "Tab.h"
#include <deque>
#include <optional>

namespace Kestrel {

struct ClosedTabRecord {
  std::string Title;
  std::string Address;
  WindowHandle Window; // Window the tab was closed in
  size_t Index = 0;    // Position it had there
};

// In-memory list of closed tabs, most recent first. Not persisted.
class RecentlyClosedTabs {
public:
  explicit RecentlyClosedTabs(size_t capacity = 20);

  // Skips internal pages and empty addresses. An older entry with the same
  // address is replaced. Returns false when the tab was not recorded.
  bool Record(const Tab &tab, WindowHandle window, size_t index);

  std::optional<ClosedTabRecord> PopMostRecent();
  const ClosedTabRecord *PeekMostRecent() const;

  bool RemoveByAddress(const std::string &address);
  void Clear() { m_Entries.clear(); }

  void SetCapacity(size_t capacity);
  size_t GetCapacity() const { return m_Capacity; }

  const std::deque<ClosedTabRecord> &GetEntries() const { return m_Entries; }
  size_t Size() const { return m_Entries.size(); }
  bool Empty() const { return m_Entries.empty(); }

private:
  void Trim();

  std::deque<ClosedTabRecord> m_Entries;
  size_t m_Capacity;
};

} // namespace Kestrel
