#pragma once

#include "BrowserTypes.h"
#include "Tab.h"
#include <optional>
#include <string>

namespace Kestrel {

class WindowContext;
class WindowRegistry;

// Point-in-time snapshot of the tab being dragged. Exists from promotion of
// a drag session until its resolution.
struct TransferPayload {
  static constexpr const char *MimeType = "application/x-kestrel-tab";

  TabId Id;
  std::string Title;
  std::string Address;
  WindowHandle SourceWindow;

  static TransferPayload Capture(const Tab &tab, WindowHandle source);

  // JSON drag data: {"tabId", "title", "url", "sourceWindowId"}
  std::string Serialize() const;

  // Empty when the data is not JSON, misses a key, or carries a zero id
  static std::optional<TransferPayload> Deserialize(const std::string &data);

  // Source window, if it is still registered and still holds the tab
  WindowContext *ResolveSource(const WindowRegistry &registry) const;
};

} // namespace Kestrel
