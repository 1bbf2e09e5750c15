#pragma once

#include "DragSession.h"
#include <functional>
#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>

namespace Kestrel {

// Readable gtest failure output
inline void PrintTo(const TabId &id, std::ostream *os) {
  *os << "tab#" << id.Value;
}

inline void PrintTo(const WindowHandle &handle, std::ostream *os) {
  *os << "window#" << handle.Value;
}

inline void PrintTo(DragOutcome outcome, std::ostream *os) {
  *os << DragOutcomeToString(outcome);
}

inline void PrintTo(DragState state, std::ostream *os) {
  *os << DragStateToString(state);
}

} // namespace Kestrel

namespace KestrelTest {

using namespace Kestrel;

// Surface that writes "detach <tab> <window>" / "attach <tab> <window>" to a
// shared log so tests can check the hand-off order.
class RecordingSurface : public ITabSurface {
public:
  RecordingSurface(TabId tab, std::vector<std::string> *log)
      : m_Tab(tab), m_Log(log) {}

  void OnDetached(WindowHandle from) override {
    Record("detach", from);
    if (DetachHook)
      DetachHook(from);
  }

  void OnAttached(WindowHandle to) override { Record("attach", to); }

  std::function<void(WindowHandle)> DetachHook;

private:
  void Record(const char *what, WindowHandle window) {
    if (m_Log)
      m_Log->push_back(std::string(what) + " " + std::to_string(m_Tab.Value) +
                       " " + std::to_string(window.Value));
  }

  TabId m_Tab;
  std::vector<std::string> *m_Log;
};

struct ActiveChange {
  WindowHandle Window;
  TabId Active; // Invalid when the list became empty
};

class FakeWindowHost : public IWindowHost {
public:
  WindowHandle CreateWindowChrome(const glm::vec4 &frame) override {
    if (FailCreate)
      return WindowHandle{};
    WindowHandle handle{++m_LastHandle};
    CreatedFrames[handle] = frame;
    return handle;
  }

  void ReleaseWindowChrome(WindowHandle handle) override {
    Released.push_back(handle);
  }

  void OnTabsChanged(WindowHandle handle) override {
    TabsChanged.push_back(handle);
  }

  void OnActiveTabChanged(WindowHandle handle, const Tab *active) override {
    ActiveChanges.push_back({handle, active ? active->Id : TabId{}});
    WindowTitles[handle] = active ? active->Title : "";
  }

  std::unique_ptr<ITabSurface> CreateSurface(const Tab &tab) override {
    return std::make_unique<RecordingSurface>(tab.Id, &SurfaceLog);
  }

  bool WasReleased(WindowHandle handle) const {
    for (WindowHandle h : Released) {
      if (h == handle)
        return true;
    }
    return false;
  }

  bool FailCreate = false;
  std::map<WindowHandle, glm::vec4> CreatedFrames;
  std::vector<WindowHandle> Released;
  std::vector<WindowHandle> TabsChanged;
  std::vector<ActiveChange> ActiveChanges;
  std::map<WindowHandle, std::string> WindowTitles;
  std::vector<std::string> SurfaceLog;

private:
  uint64_t m_LastHandle = 0;
};

// Registry, host and lifecycle manager wired together, plus helpers to lay
// out windows whose tabs are 100 wide and 32 high along the top edge.
class BrowserFixture : public ::testing::Test {
protected:
  static constexpr float TabWidth = 100.0f;

  WindowHandle MakeWindow(const glm::vec4 &frame,
                          const std::vector<std::string> &names) {
    WindowHandle handle = Host.CreateWindowChrome(frame);
    WindowContext &context = Registry.RegisterWindow(handle, frame);
    for (const std::string &name : names) {
      Tab tab = Tab::Create(name, "https://" + name + ".example.com/");
      T[name] = tab.Id;
      context.GetTabs().AddTab(
          tab, std::make_unique<RecordingSurface>(tab.Id, &Host.SurfaceLog),
          false);
    }
    PublishLayout(handle);
    return handle;
  }

  void PublishLayout(WindowHandle handle) {
    WindowContext *context = Registry.Find(handle);
    Registry.UpdateTabStripLayout(
        handle, TabStripLayout::Uniform(context->GetFrame(),
                                        context->GetTabs().GetTabIds(),
                                        TabWidth));
  }

  std::vector<TabId> Ids(WindowHandle handle) const {
    return Registry.Find(handle)->GetTabs().GetTabIds();
  }

  std::vector<TabId> Ids(const std::vector<std::string> &names) {
    std::vector<TabId> ids;
    for (const std::string &name : names) {
      ids.push_back(T.at(name));
    }
    return ids;
  }

  std::optional<TabId> Active(WindowHandle handle) const {
    return Registry.Find(handle)->GetTabs().GetActiveId();
  }

  RecordingSurface *SurfaceOf(WindowHandle handle, TabId id) {
    return dynamic_cast<RecordingSurface *>(
        Registry.Find(handle)->GetTabs().GetSurface(id));
  }

  // Point over the left or right half of the tab at index in a window
  glm::vec2 OverTab(WindowHandle handle, size_t index, bool rightHalf) const {
    const glm::vec4 &frame = Registry.Find(handle)->GetFrame();
    float x = frame.x + index * TabWidth + (rightHalf ? 75.0f : 25.0f);
    return glm::vec2(x, frame.y + 10.0f);
  }

  // Number of lists holding the tab, summed over every window
  size_t Occurrences(TabId id) const {
    size_t count = 0;
    for (WindowHandle handle : Registry.GetHandles()) {
      for (TabId member : Registry.Find(handle)->GetTabs().GetTabIds()) {
        if (member == id)
          count++;
      }
    }
    return count;
  }

  BrowserSettings Settings;
  WindowRegistry Registry;
  FakeWindowHost Host;
  WindowLifecycleManager Lifecycle{Registry, Host, Settings};
  std::map<std::string, TabId> T;
};

} // namespace KestrelTest
