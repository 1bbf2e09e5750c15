#include "WindowRegistry.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace Kestrel {

WindowContext::WindowContext(WindowHandle handle, const glm::vec4 &frame)
    : m_Handle(handle), m_Frame(frame) {}

WindowContext &WindowRegistry::RegisterWindow(WindowHandle handle,
                                              const glm::vec4 &frame) {
  if (!handle.IsValid())
    throw std::invalid_argument("cannot register an invalid window handle");
  if (Find(handle))
    throw std::invalid_argument("window handle " +
                                std::to_string(handle.Value) +
                                " is already registered");

  m_Windows.push_back(std::make_unique<WindowContext>(handle, frame));
  std::cout << "[WindowRegistry] Registered window #" << handle.Value
            << ". Total: " << m_Windows.size() << std::endl;
  return *m_Windows.back();
}

bool WindowRegistry::UpdateWindowFrame(WindowHandle handle,
                                       const glm::vec4 &frame) {
  WindowContext *context = Find(handle);
  if (!context)
    return false;
  context->SetFrame(frame);
  return true;
}

bool WindowRegistry::UpdateTabStripLayout(WindowHandle handle,
                                          TabStripLayout layout) {
  WindowContext *context = Find(handle);
  if (!context)
    return false;
  context->SetTabStrip(std::move(layout));
  return true;
}

std::unique_ptr<WindowContext>
WindowRegistry::UnregisterWindow(WindowHandle handle) {
  auto it = std::find_if(m_Windows.begin(), m_Windows.end(),
                         [handle](const std::unique_ptr<WindowContext> &w) {
                           return w->GetHandle() == handle;
                         });
  if (it == m_Windows.end())
    return nullptr;

  std::unique_ptr<WindowContext> context = std::move(*it);
  m_Windows.erase(it);
  std::cout << "[WindowRegistry] Unregistered window #" << handle.Value
            << ". Remaining: " << m_Windows.size() << std::endl;
  return context;
}

WindowContext *WindowRegistry::Find(WindowHandle handle) const {
  for (const auto &window : m_Windows) {
    if (window->GetHandle() == handle)
      return window.get();
  }
  return nullptr;
}

WindowContext *WindowRegistry::FindWindowAt(const glm::vec2 &screenPoint) const {
  for (auto it = m_Windows.rbegin(); it != m_Windows.rend(); ++it) {
    if ((*it)->Contains(screenPoint))
      return it->get();
  }
  return nullptr;
}

WindowContext *WindowRegistry::FindWindowContainingTab(TabId id) const {
  for (const auto &window : m_Windows) {
    if (window->GetTabs().Contains(id))
      return window.get();
  }
  return nullptr;
}

void WindowRegistry::BringToFront(WindowHandle handle) {
  auto it = std::find_if(m_Windows.begin(), m_Windows.end(),
                         [handle](const std::unique_ptr<WindowContext> &w) {
                           return w->GetHandle() == handle;
                         });
  if (it == m_Windows.end() || it + 1 == m_Windows.end())
    return;

  std::unique_ptr<WindowContext> context = std::move(*it);
  m_Windows.erase(it);
  m_Windows.push_back(std::move(context));
}

std::vector<WindowHandle> WindowRegistry::GetHandles() const {
  std::vector<WindowHandle> handles;
  handles.reserve(m_Windows.size());
  for (const auto &window : m_Windows) {
    handles.push_back(window->GetHandle());
  }
  return handles;
}

} // namespace Kestrel
