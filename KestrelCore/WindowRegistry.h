#pragma once

#include "TabStripLayout.h"
#include "WindowTabList.h"
#include <memory>
#include <vector>

namespace Kestrel {

// Registry entry: one browser window as the protocol sees it.
class WindowContext {
public:
  WindowContext(WindowHandle handle, const glm::vec4 &frame);

  WindowHandle GetHandle() const { return m_Handle; }

  // Screen frame, x, y, width, height
  const glm::vec4 &GetFrame() const { return m_Frame; }
  void SetFrame(const glm::vec4 &frame) { m_Frame = frame; }
  bool Contains(const glm::vec2 &screenPoint) const {
    return RectContains(m_Frame, screenPoint);
  }

  WindowTabList &GetTabs() { return m_Tabs; }
  const WindowTabList &GetTabs() const { return m_Tabs; }

  const TabStripLayout &GetTabStrip() const { return m_TabStrip; }
  void SetTabStrip(TabStripLayout layout) { m_TabStrip = std::move(layout); }

private:
  WindowHandle m_Handle;
  glm::vec4 m_Frame;
  WindowTabList m_Tabs;
  TabStripLayout m_TabStrip;
};

// Process-wide directory of open windows, kept in z-order (back to front).
// Constructed once by the application and passed to the components that
// need it. Mutated only by the lifecycle manager and the transfer operations.
class WindowRegistry {
public:
  WindowRegistry() = default;
  ~WindowRegistry() = default;

  WindowRegistry(const WindowRegistry &) = delete;
  WindowRegistry &operator=(const WindowRegistry &) = delete;

  // Throws std::invalid_argument for an invalid or already registered handle
  WindowContext &RegisterWindow(WindowHandle handle, const glm::vec4 &frame);

  // Returns false when the handle is unknown
  bool UpdateWindowFrame(WindowHandle handle, const glm::vec4 &frame);
  bool UpdateTabStripLayout(WindowHandle handle, TabStripLayout layout);

  // Removes the entry and hands it back (null when unknown)
  std::unique_ptr<WindowContext> UnregisterWindow(WindowHandle handle);

  WindowContext *Find(WindowHandle handle) const;

  // Front-most window whose frame contains the point
  WindowContext *FindWindowAt(const glm::vec2 &screenPoint) const;

  WindowContext *FindWindowContainingTab(TabId id) const;

  void BringToFront(WindowHandle handle);

  // Back to front
  std::vector<WindowHandle> GetHandles() const;
  size_t GetWindowCount() const { return m_Windows.size(); }
  bool IsEmpty() const { return m_Windows.empty(); }

private:
  std::vector<std::unique_ptr<WindowContext>> m_Windows;
};

} // namespace Kestrel
