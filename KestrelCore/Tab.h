#pragma once

#include "BrowserTypes.h"
#include <optional>
#include <string>

namespace Kestrel {

// One navigable unit of content. Identity is independent of position.
struct Tab {
  TabId Id;
  std::string Title;
  std::string Address;
  bool IsLoading = false;
  bool CanGoBack = false;
  bool CanGoForward = false;

  // Creates a tab with a freshly issued id
  static Tab Create(const std::string &title, const std::string &address,
                    bool isLoading = false);

  // Issues the next process-unique tab id
  static TabId NextId();

  // Internal pages are never recorded as recently closed
  bool IsSpecialPage() const;
};

// "https://news.example.org/a?b" -> "news.example.org". Empty when the
// address has no authority component.
std::optional<std::string> ExtractHostname(const std::string &address);

} // namespace Kestrel
