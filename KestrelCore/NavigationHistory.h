#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace Kestrel {

// Back/forward list of one tab. The shell keeps one per tab in place of a
// rendering engine's session history.
class NavigationHistory {
public:
  NavigationHistory() = default;

  // Drops the forward entries and makes address current. Visiting the
  // current address again is ignored.
  void Visit(const std::string &address);

  std::optional<std::string> Back();
  std::optional<std::string> Forward();

  bool CanGoBack() const { return !m_Entries.empty() && m_Index > 0; }
  bool CanGoForward() const {
    return !m_Entries.empty() && m_Index + 1 < m_Entries.size();
  }

  const std::string *Current() const {
    return m_Entries.empty() ? nullptr : &m_Entries[m_Index];
  }
  size_t Size() const { return m_Entries.size(); }
  bool Empty() const { return m_Entries.empty(); }

private:
  std::vector<std::string> m_Entries;
  size_t m_Index = 0;
};

} // namespace Kestrel
