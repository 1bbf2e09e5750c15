#include "WindowTabList.h"
#include <algorithm>

namespace Kestrel {

size_t WindowTabList::AddTab(Tab tab, std::unique_ptr<ITabSurface> surface,
                             bool makeActive) {
  return Insert(m_Entries.size(), TabEntry(std::move(tab), std::move(surface)),
                makeActive);
}

size_t WindowTabList::Insert(size_t index, TabEntry entry, bool makeActive) {
  if (index > m_Entries.size())
    index = m_Entries.size();

  TabId id = entry.Record.Id;
  m_Entries.insert(m_Entries.begin() + index, std::move(entry));

  if (makeActive || !m_ActiveId)
    m_ActiveId = id;
  return index;
}

std::optional<TabEntry> WindowTabList::Remove(TabId id) {
  std::optional<size_t> index = IndexOf(id);
  if (!index)
    return std::nullopt;

  TabEntry entry = std::move(m_Entries[*index]);
  m_Entries.erase(m_Entries.begin() + *index);

  if (m_ActiveId && *m_ActiveId == id) {
    if (m_Entries.empty()) {
      m_ActiveId.reset();
    } else {
      size_t next = std::min(*index, m_Entries.size() - 1);
      m_ActiveId = m_Entries[next].Record.Id;
    }
  }
  return entry;
}

bool WindowTabList::Move(TabId dragged, TabId target, bool insertAfter) {
  if (dragged == target)
    return false;

  std::optional<size_t> from = IndexOf(dragged);
  if (!from || !IndexOf(target))
    return false;

  TabEntry entry = std::move(m_Entries[*from]);
  m_Entries.erase(m_Entries.begin() + *from);

  // Target index after the removal
  size_t to = *IndexOf(target);
  if (insertAfter)
    ++to;

  m_Entries.insert(m_Entries.begin() + to, std::move(entry));
  return to != *from;
}

bool WindowTabList::Activate(TabId id) {
  if (!Contains(id))
    return false;
  m_ActiveId = id;
  return true;
}

std::optional<size_t> WindowTabList::IndexOf(TabId id) const {
  auto it = std::find_if(
      m_Entries.begin(), m_Entries.end(),
      [id](const TabEntry &entry) { return entry.Record.Id == id; });
  if (it == m_Entries.end())
    return std::nullopt;
  return static_cast<size_t>(it - m_Entries.begin());
}

Tab *WindowTabList::Find(TabId id) {
  std::optional<size_t> index = IndexOf(id);
  return index ? &m_Entries[*index].Record : nullptr;
}

const Tab *WindowTabList::Find(TabId id) const {
  std::optional<size_t> index = IndexOf(id);
  return index ? &m_Entries[*index].Record : nullptr;
}

ITabSurface *WindowTabList::GetSurface(TabId id) const {
  std::optional<size_t> index = IndexOf(id);
  return index ? m_Entries[*index].Surface.get() : nullptr;
}

std::vector<TabId> WindowTabList::GetTabIds() const {
  std::vector<TabId> ids;
  ids.reserve(m_Entries.size());
  for (const auto &entry : m_Entries) {
    ids.push_back(entry.Record.Id);
  }
  return ids;
}

std::optional<size_t> WindowTabList::GetActiveIndex() const {
  if (!m_ActiveId)
    return std::nullopt;
  return IndexOf(*m_ActiveId);
}

const Tab *WindowTabList::GetActiveTab() const {
  if (!m_ActiveId)
    return nullptr;
  return Find(*m_ActiveId);
}

} // namespace Kestrel
