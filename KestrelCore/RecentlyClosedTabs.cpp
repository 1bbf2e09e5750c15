#include "RecentlyClosedTabs.h"
#include <algorithm>

namespace Kestrel {

RecentlyClosedTabs::RecentlyClosedTabs(size_t capacity)
    : m_Capacity(capacity) {}

bool RecentlyClosedTabs::Record(const Tab &tab, WindowHandle window,
                                size_t index) {
  if (tab.IsSpecialPage())
    return false;

  RemoveByAddress(tab.Address);
  m_Entries.push_front({tab.Title, tab.Address, window, index});
  Trim();
  return true;
}

std::optional<ClosedTabRecord> RecentlyClosedTabs::PopMostRecent() {
  if (m_Entries.empty())
    return std::nullopt;
  ClosedTabRecord record = m_Entries.front();
  m_Entries.pop_front();
  return record;
}

const ClosedTabRecord *RecentlyClosedTabs::PeekMostRecent() const {
  return m_Entries.empty() ? nullptr : &m_Entries.front();
}

bool RecentlyClosedTabs::RemoveByAddress(const std::string &address) {
  auto it = std::remove_if(
      m_Entries.begin(), m_Entries.end(),
      [&address](const ClosedTabRecord &r) { return r.Address == address; });
  if (it == m_Entries.end())
    return false;
  m_Entries.erase(it, m_Entries.end());
  return true;
}

void RecentlyClosedTabs::SetCapacity(size_t capacity) {
  m_Capacity = capacity;
  Trim();
}

void RecentlyClosedTabs::Trim() {
  while (m_Entries.size() > m_Capacity) {
    m_Entries.pop_back();
  }
}

} // namespace Kestrel
