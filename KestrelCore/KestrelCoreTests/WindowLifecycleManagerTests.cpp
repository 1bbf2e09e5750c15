#include "TestHelpers.h"

using namespace Kestrel;

namespace {

class WindowLifecycleManagerTests : public KestrelTest::BrowserFixture {};

} // namespace

TEST_F(WindowLifecycleManagerTests, OpenWindowWithStartPage) {
  WindowHandle handle = Lifecycle.OpenWindow();

  ASSERT_TRUE(handle.IsValid());
  WindowContext *context = Registry.Find(handle);
  ASSERT_NE(context, nullptr);
  ASSERT_EQ(context->GetTabs().Size(), 1u);

  const Tab *tab = context->GetTabs().GetActiveTab();
  EXPECT_EQ(tab->Title, "New Tab");
  EXPECT_EQ(tab->Address, "kestrel:blank");
  EXPECT_FALSE(tab->IsLoading);

  EXPECT_EQ(context->GetFrame(), glm::vec4(100, 100, 1024, 768));
  EXPECT_EQ(Host.WindowTitles[handle], "New Tab");
  EXPECT_EQ(Host.SurfaceLog.back(),
            "attach " + std::to_string(tab->Id.Value) + " " +
                std::to_string(handle.Value));
}

TEST_F(WindowLifecycleManagerTests, NewWindowsCascade) {
  WindowHandle first = Lifecycle.OpenWindow();
  WindowHandle second = Lifecycle.OpenWindow();

  EXPECT_EQ(Registry.Find(second)->GetFrame(),
            Registry.Find(first)->GetFrame() + glm::vec4(30, 30, 0, 0));
}

TEST_F(WindowLifecycleManagerTests, NewWindowContentFollowsSettings) {
  Settings.NewWindowOpensWith = NewWindowContent::Homepage;
  Settings.Homepage = "https://home.example.com/start";
  WindowHandle home = Lifecycle.OpenWindow();
  const Tab *homeTab = Registry.Find(home)->GetTabs().GetActiveTab();
  EXPECT_EQ(homeTab->Address, "https://home.example.com/start");
  EXPECT_EQ(homeTab->Title, "home.example.com");
  EXPECT_TRUE(homeTab->IsLoading);

  Settings.Homepage.clear();
  WindowHandle fallback = Lifecycle.OpenWindow();
  EXPECT_EQ(Registry.Find(fallback)->GetTabs().GetActiveTab()->Address,
            "kestrel:blank");

  Settings.NewWindowOpensWith = NewWindowContent::EmptyPage;
  WindowHandle empty = Lifecycle.OpenWindow();
  const Tab *emptyTab = Registry.Find(empty)->GetTabs().GetActiveTab();
  EXPECT_EQ(emptyTab->Address, "about:blank");
  EXPECT_EQ(emptyTab->Title, "New Tab");
}

TEST_F(WindowLifecycleManagerTests, OpenWindowFailsWithoutChrome) {
  Host.FailCreate = true;
  EXPECT_FALSE(Lifecycle.OpenWindow().IsValid());
  EXPECT_TRUE(Registry.IsEmpty());
}

TEST_F(WindowLifecycleManagerTests, SeedMovedOnlyOnSuccess) {
  TabEntry seed(Tab::Create("a", "https://a.example/"));
  TabId id = seed.Record.Id;

  Host.FailCreate = true;
  EXPECT_FALSE(Lifecycle.OpenWindowWithTab(glm::vec4(0, 0, 10, 10), seed)
                   .IsValid());
  EXPECT_EQ(seed.Record.Id, id);

  Host.FailCreate = false;
  WindowHandle handle =
      Lifecycle.OpenWindowWithTab(glm::vec4(0, 0, 10, 10), seed);
  ASSERT_TRUE(handle.IsValid());
  EXPECT_EQ(Ids(handle), std::vector<TabId>{id});
  EXPECT_EQ(Active(handle), id);
}

TEST_F(WindowLifecycleManagerTests, OpenTabAppends) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a"});

  std::optional<TabId> docs =
      Lifecycle.OpenTab(A, "https://docs.example.com/x");
  ASSERT_TRUE(docs.has_value());
  EXPECT_EQ(Ids(A).back(), *docs);
  EXPECT_EQ(Active(A), *docs);
  EXPECT_EQ(Host.WindowTitles[A], "docs.example.com");

  std::optional<TabId> blank = Lifecycle.OpenTab(A, "", false);
  EXPECT_EQ(Registry.Find(A)->GetTabs().Find(*blank)->Address,
            "kestrel:blank");
  EXPECT_EQ(Active(A), *docs);

  EXPECT_FALSE(Lifecycle.OpenTab(WindowHandle{999}, "").has_value());
}

TEST_F(WindowLifecycleManagerTests, CloseTabActivatesNeighborAndRecords) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b", "c"});
  Lifecycle.ActivateTab(A, T["b"]);

  EXPECT_TRUE(Lifecycle.CloseTab(T["b"]));

  EXPECT_EQ(Ids(A), Ids({"a", "c"}));
  EXPECT_EQ(Active(A), T["c"]);
  const ClosedTabRecord *closed = Lifecycle.GetRecentlyClosed().PeekMostRecent();
  ASSERT_NE(closed, nullptr);
  EXPECT_EQ(closed->Address, "https://b.example.com/");
  EXPECT_EQ(closed->Window, A);
  EXPECT_EQ(closed->Index, 1u);

  EXPECT_FALSE(Lifecycle.CloseTab(T["b"]));
}

TEST_F(WindowLifecycleManagerTests, LastTabOfSoleWindowBecomesBlank) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a"});

  EXPECT_TRUE(Lifecycle.CloseTab(T["a"]));

  ASSERT_NE(Registry.Find(A), nullptr);
  ASSERT_EQ(Registry.Find(A)->GetTabs().Size(), 1u);
  const Tab *blank = Registry.Find(A)->GetTabs().GetActiveTab();
  EXPECT_EQ(blank->Address, "kestrel:blank");
  EXPECT_NE(blank->Id, T["a"]);
  EXPECT_TRUE(Host.Released.empty());
}

TEST_F(WindowLifecycleManagerTests, LastTabClosesWindowWhenOthersRemain) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a"});
  WindowHandle B = MakeWindow(glm::vec4(500, 0, 400, 300), {"b"});

  EXPECT_TRUE(Lifecycle.CloseTab(T["a"]));

  EXPECT_EQ(Registry.Find(A), nullptr);
  EXPECT_TRUE(Host.WasReleased(A));
  EXPECT_NE(Registry.Find(B), nullptr);
}

TEST_F(WindowLifecycleManagerTests, CloseWindowPolicyAppliesToSoleWindow) {
  Settings.LastTab = LastTabPolicy::CloseWindow;
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a"});

  EXPECT_TRUE(Lifecycle.CloseTab(T["a"]));
  EXPECT_EQ(Registry.Find(A), nullptr);
  EXPECT_TRUE(Registry.IsEmpty());
}

TEST_F(WindowLifecycleManagerTests, CloseWindowClosesEveryTab) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b"});
  std::vector<TabId> closedTabs;
  std::vector<WindowHandle> destroyed;
  Lifecycle.AddTabClosedListener(
      [&closedTabs](TabId id) { closedTabs.push_back(id); });
  Lifecycle.AddWindowDestroyedListener(
      [&destroyed](WindowHandle h) { destroyed.push_back(h); });

  EXPECT_TRUE(Lifecycle.CloseWindow(A));

  EXPECT_EQ(closedTabs, Ids({"a", "b"}));
  EXPECT_EQ(destroyed, std::vector<WindowHandle>{A});
  EXPECT_TRUE(Host.WasReleased(A));
  EXPECT_EQ(Lifecycle.GetRecentlyClosed().Size(), 2u);
  EXPECT_FALSE(Lifecycle.CloseWindow(A));
}

TEST_F(WindowLifecycleManagerTests, ReopenInOriginalWindowAndPlace) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b", "c"});
  WindowHandle B = MakeWindow(glm::vec4(500, 0, 400, 300), {"d"});
  Lifecycle.CloseTab(T["b"]);

  std::optional<TabId> reopened = Lifecycle.ReopenLastClosedTab(B);

  ASSERT_TRUE(reopened.has_value());
  EXPECT_EQ(Registry.Find(A)->GetTabs().IndexOf(*reopened),
            std::optional<size_t>(1));
  EXPECT_EQ(Active(A), *reopened);
  EXPECT_EQ(Registry.Find(A)->GetTabs().Find(*reopened)->Address,
            "https://b.example.com/");
  EXPECT_TRUE(Lifecycle.GetRecentlyClosed().Empty());
  EXPECT_FALSE(Lifecycle.ReopenLastClosedTab(B).has_value());
}

TEST_F(WindowLifecycleManagerTests, ReopenFallsBackWhenWindowIsGone) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a"});
  WindowHandle B = MakeWindow(glm::vec4(500, 0, 400, 300), {"b"});
  Lifecycle.CloseTab(T["a"]);
  ASSERT_EQ(Registry.Find(A), nullptr);

  std::optional<TabId> reopened = Lifecycle.ReopenLastClosedTab(B);

  ASSERT_TRUE(reopened.has_value());
  EXPECT_EQ(Ids(B).back(), *reopened);
}

TEST_F(WindowLifecycleManagerTests, FlushKeepsRefilledWindow) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a"});
  Lifecycle.ScheduleDestroy(A);
  Lifecycle.ScheduleDestroy(A);
  EXPECT_TRUE(Lifecycle.IsDestroyPending(A));

  EXPECT_EQ(Lifecycle.FlushPendingDestroys(), 0u);
  EXPECT_NE(Registry.Find(A), nullptr);
  EXPECT_FALSE(Lifecycle.IsDestroyPending(A));
}

TEST_F(WindowLifecycleManagerTests, ContentNotifications) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b"});
  Lifecycle.ActivateTab(A, T["a"]);

  EXPECT_TRUE(Lifecycle.OnTitleChanged(T["a"], "Inbox"));
  EXPECT_EQ(Registry.Find(A)->GetTabs().Find(T["a"])->Title, "Inbox");
  EXPECT_EQ(Host.WindowTitles[A], "Inbox");

  EXPECT_TRUE(Lifecycle.OnTitleChanged(T["b"], "Background"));
  EXPECT_EQ(Host.WindowTitles[A], "Inbox");

  EXPECT_TRUE(Lifecycle.OnAddressChanged(T["b"], "https://b.example.com/2"));
  EXPECT_TRUE(Lifecycle.OnLoadingChanged(T["b"], true));
  EXPECT_TRUE(Lifecycle.OnNavigationStateChanged(T["b"], true, false));

  const Tab *b = Registry.Find(A)->GetTabs().Find(T["b"]);
  EXPECT_EQ(b->Address, "https://b.example.com/2");
  EXPECT_TRUE(b->IsLoading);
  EXPECT_TRUE(b->CanGoBack);
  EXPECT_FALSE(b->CanGoForward);

  TabId stranger = Tab::NextId();
  EXPECT_FALSE(Lifecycle.OnTitleChanged(stranger, "x"));
  EXPECT_FALSE(Lifecycle.OnAddressChanged(stranger, "x"));
  EXPECT_FALSE(Lifecycle.OnLoadingChanged(stranger, false));
  EXPECT_FALSE(Lifecycle.OnNavigationStateChanged(stranger, false, false));
}

TEST_F(WindowLifecycleManagerTests, ActiveChangeReportedOnce) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b"});
  Lifecycle.ActivateTab(A, T["b"]);
  size_t reports = Host.ActiveChanges.size();

  Lifecycle.ActivateTab(A, T["b"]);
  EXPECT_EQ(Host.ActiveChanges.size(), reports);
  EXPECT_EQ(Host.ActiveChanges.back().Active, T["b"]);
  EXPECT_FALSE(Lifecycle.ActivateTab(A, Tab::NextId()));
}
