#pragma once

#include "BrowserTypes.h"
#include "Tab.h"
#include <memory>

namespace Kestrel {

// Live rendering surface of a tab, provided by the rendering collaborator.
// It can leave one window's view hierarchy and join another's without the
// underlying content being reinitialized.
class ITabSurface {
public:
  virtual ~ITabSurface() = default;

  // Removed from the window's view hierarchy (content keeps running)
  virtual void OnDetached(WindowHandle from) = 0;

  // Placed into the window's view hierarchy
  virtual void OnAttached(WindowHandle to) = 0;
};

// A tab record together with its surface. Move-only: the pair always
// changes owner as one unit.
struct TabEntry {
  Tab Record;
  std::unique_ptr<ITabSurface> Surface;

  TabEntry() = default;
  TabEntry(Tab record, std::unique_ptr<ITabSurface> surface = nullptr)
      : Record(std::move(record)), Surface(std::move(surface)) {}

  TabEntry(TabEntry &&) = default;
  TabEntry &operator=(TabEntry &&) = default;
  TabEntry(const TabEntry &) = delete;
  TabEntry &operator=(const TabEntry &) = delete;
};

} // namespace Kestrel
