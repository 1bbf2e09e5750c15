#include "Tab.h"

namespace Kestrel {

static uint64_t s_LastTabId = 0;

TabId Tab::NextId() { return TabId{++s_LastTabId}; }

Tab Tab::Create(const std::string &title, const std::string &address,
                bool isLoading) {
  Tab tab;
  tab.Id = NextId();
  tab.Title = title;
  tab.Address = address;
  tab.IsLoading = isLoading;
  return tab;
}

bool Tab::IsSpecialPage() const {
  return Address.empty() || Address == "about:blank" ||
         Address.rfind("kestrel:", 0) == 0;
}

std::optional<std::string> ExtractHostname(const std::string &address) {
  size_t schemeEnd = address.find("://");
  if (schemeEnd == std::string::npos || schemeEnd == 0)
    return std::nullopt;

  size_t hostStart = schemeEnd + 3;
  size_t hostEnd = address.find_first_of("/?#", hostStart);
  std::string authority = address.substr(
      hostStart, hostEnd == std::string::npos ? std::string::npos
                                              : hostEnd - hostStart);

  // Drop credentials and port
  size_t at = authority.rfind('@');
  if (at != std::string::npos)
    authority = authority.substr(at + 1);
  size_t colon = authority.find(':');
  if (colon != std::string::npos)
    authority = authority.substr(0, colon);

  if (authority.empty())
    return std::nullopt;
  return authority;
}

} // namespace Kestrel
