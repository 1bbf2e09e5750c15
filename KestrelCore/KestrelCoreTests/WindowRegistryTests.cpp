#include "TestHelpers.h"
#include <stdexcept>

using namespace Kestrel;

TEST(WindowRegistryTests, RegisterAndFind) {
  WindowRegistry registry;
  WindowContext &context =
      registry.RegisterWindow(WindowHandle{7}, glm::vec4(0, 0, 400, 300));

  EXPECT_EQ(context.GetHandle(), WindowHandle{7});
  EXPECT_EQ(registry.Find(WindowHandle{7}), &context);
  EXPECT_EQ(registry.Find(WindowHandle{8}), nullptr);
  EXPECT_EQ(registry.GetWindowCount(), 1u);
  EXPECT_TRUE(context.GetTabs().Empty());
}

TEST(WindowRegistryTests, RejectsInvalidAndDuplicateHandles) {
  WindowRegistry registry;
  registry.RegisterWindow(WindowHandle{1}, glm::vec4(0, 0, 10, 10));

  EXPECT_THROW(registry.RegisterWindow(WindowHandle{}, glm::vec4(0)),
               std::invalid_argument);
  EXPECT_THROW(registry.RegisterWindow(WindowHandle{1}, glm::vec4(0)),
               std::invalid_argument);
  EXPECT_EQ(registry.GetWindowCount(), 1u);
}

TEST(WindowRegistryTests, UpdateFrameAndLayout) {
  WindowRegistry registry;
  registry.RegisterWindow(WindowHandle{1}, glm::vec4(0, 0, 400, 300));

  EXPECT_TRUE(
      registry.UpdateWindowFrame(WindowHandle{1}, glm::vec4(50, 60, 400, 300)));
  EXPECT_EQ(registry.Find(WindowHandle{1})->GetFrame(),
            glm::vec4(50, 60, 400, 300));
  EXPECT_FALSE(
      registry.UpdateWindowFrame(WindowHandle{2}, glm::vec4(0, 0, 1, 1)));

  TabId id = Tab::NextId();
  EXPECT_TRUE(registry.UpdateTabStripLayout(
      WindowHandle{1},
      TabStripLayout::Uniform(glm::vec4(50, 60, 400, 300), {id})));
  EXPECT_TRUE(
      registry.Find(WindowHandle{1})->GetTabStrip().GetTabRect(id).has_value());
  EXPECT_FALSE(
      registry.UpdateTabStripLayout(WindowHandle{2}, TabStripLayout()));
}

TEST(WindowRegistryTests, FindWindowAtPrefersFrontMost) {
  WindowRegistry registry;
  registry.RegisterWindow(WindowHandle{1}, glm::vec4(0, 0, 400, 300));
  registry.RegisterWindow(WindowHandle{2}, glm::vec4(200, 100, 400, 300));

  EXPECT_EQ(registry.FindWindowAt(glm::vec2(300, 200))->GetHandle(),
            WindowHandle{2});
  EXPECT_EQ(registry.FindWindowAt(glm::vec2(50, 50))->GetHandle(),
            WindowHandle{1});
  EXPECT_EQ(registry.FindWindowAt(glm::vec2(900, 900)), nullptr);

  registry.BringToFront(WindowHandle{1});
  EXPECT_EQ(registry.FindWindowAt(glm::vec2(300, 200))->GetHandle(),
            WindowHandle{1});
  EXPECT_EQ(registry.GetHandles(),
            (std::vector<WindowHandle>{WindowHandle{2}, WindowHandle{1}}));
}

TEST(WindowRegistryTests, FrameEdgeIsExclusive) {
  WindowRegistry registry;
  registry.RegisterWindow(WindowHandle{1}, glm::vec4(0, 0, 400, 300));

  EXPECT_NE(registry.FindWindowAt(glm::vec2(399.5f, 0)), nullptr);
  EXPECT_EQ(registry.FindWindowAt(glm::vec2(400, 10)), nullptr);
}

TEST(WindowRegistryTests, UnregisterHandsBackContext) {
  WindowRegistry registry;
  WindowContext &context =
      registry.RegisterWindow(WindowHandle{3}, glm::vec4(0, 0, 10, 10));
  Tab tab = Tab::Create("a", "https://a.example/");
  context.GetTabs().AddTab(tab);

  std::unique_ptr<WindowContext> removed =
      registry.UnregisterWindow(WindowHandle{3});
  ASSERT_NE(removed, nullptr);
  EXPECT_TRUE(removed->GetTabs().Contains(tab.Id));
  EXPECT_EQ(registry.Find(WindowHandle{3}), nullptr);
  EXPECT_TRUE(registry.IsEmpty());

  EXPECT_EQ(registry.UnregisterWindow(WindowHandle{3}), nullptr);
}

TEST(WindowRegistryTests, FindWindowContainingTab) {
  WindowRegistry registry;
  WindowContext &first =
      registry.RegisterWindow(WindowHandle{1}, glm::vec4(0, 0, 10, 10));
  WindowContext &second =
      registry.RegisterWindow(WindowHandle{2}, glm::vec4(20, 0, 10, 10));
  Tab a = Tab::Create("a", "https://a.example/");
  Tab b = Tab::Create("b", "https://b.example/");
  first.GetTabs().AddTab(a);
  second.GetTabs().AddTab(b);

  EXPECT_EQ(registry.FindWindowContainingTab(a.Id), &first);
  EXPECT_EQ(registry.FindWindowContainingTab(b.Id), &second);
  EXPECT_EQ(registry.FindWindowContainingTab(Tab::NextId()), nullptr);
}
