#include "NavigationHistory.h"

namespace Kestrel {

void NavigationHistory::Visit(const std::string &address) {
  if (!m_Entries.empty()) {
    if (m_Entries[m_Index] == address)
      return;
    m_Entries.erase(m_Entries.begin() + m_Index + 1, m_Entries.end());
  }
  m_Entries.push_back(address);
  m_Index = m_Entries.size() - 1;
}

std::optional<std::string> NavigationHistory::Back() {
  if (!CanGoBack())
    return std::nullopt;
  m_Index--;
  return m_Entries[m_Index];
}

std::optional<std::string> NavigationHistory::Forward() {
  if (!CanGoForward())
    return std::nullopt;
  m_Index++;
  return m_Entries[m_Index];
}

} // namespace Kestrel
