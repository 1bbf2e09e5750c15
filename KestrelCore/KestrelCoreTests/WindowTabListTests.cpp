#include "TestHelpers.h"

using namespace Kestrel;

namespace {

class WindowTabListTests : public ::testing::Test {
protected:
  void SetUp() override {
    for (const char *name : {"a", "b", "c"}) {
      Tab tab = Tab::Create(name, std::string("https://") + name + ".example/");
      Ids[name] = tab.Id;
      List.AddTab(tab, nullptr, false);
    }
  }

  std::vector<TabId> Order(std::initializer_list<const char *> names) {
    std::vector<TabId> ids;
    for (const char *name : names) {
      ids.push_back(Ids.at(name));
    }
    return ids;
  }

  WindowTabList List;
  std::map<std::string, TabId> Ids;
};

} // namespace

TEST_F(WindowTabListTests, FirstTabBecomesActive) {
  EXPECT_EQ(List.Size(), 3u);
  EXPECT_EQ(List.GetActiveId(), Ids["a"]);
  EXPECT_EQ(List.GetActiveIndex(), std::optional<size_t>(0));
}

TEST_F(WindowTabListTests, AddTabCanActivate) {
  Tab tab = Tab::Create("d", "https://d.example/");
  size_t index = List.AddTab(tab);

  EXPECT_EQ(index, 3u);
  EXPECT_EQ(List.GetActiveId(), tab.Id);
  EXPECT_EQ(List.GetActiveTab()->Title, "d");
}

TEST_F(WindowTabListTests, ReorderScenario) {
  List.Activate(Ids["b"]);

  EXPECT_TRUE(List.Move(Ids["a"], Ids["c"], true));

  EXPECT_EQ(List.GetTabIds(), Order({"b", "c", "a"}));
  EXPECT_EQ(List.GetActiveId(), Ids["b"]);
}

TEST_F(WindowTabListTests, MoveResolvesTargetAfterRemoval) {
  // a sits left of c, so c shifts one slot left once a is out
  EXPECT_TRUE(List.Move(Ids["a"], Ids["c"], false));
  EXPECT_EQ(List.GetTabIds(), Order({"b", "a", "c"}));
}

TEST_F(WindowTabListTests, MoveLeftward) {
  EXPECT_TRUE(List.Move(Ids["c"], Ids["a"], false));
  EXPECT_EQ(List.GetTabIds(), Order({"c", "a", "b"}));

  EXPECT_TRUE(List.Move(Ids["b"], Ids["c"], true));
  EXPECT_EQ(List.GetTabIds(), Order({"c", "b", "a"}));
}

TEST_F(WindowTabListTests, MoveOntoItselfIsNoOp) {
  EXPECT_FALSE(List.Move(Ids["b"], Ids["b"], true));
  EXPECT_FALSE(List.Move(Ids["b"], Ids["b"], false));
  EXPECT_EQ(List.GetTabIds(), Order({"a", "b", "c"}));
}

TEST_F(WindowTabListTests, MoveRightAfterItselfIsNoOp) {
  // "Immediately after a" is "before b"
  EXPECT_FALSE(List.Move(Ids["a"], Ids["b"], false));
  EXPECT_EQ(List.GetTabIds(), Order({"a", "b", "c"}));

  // c dropped right after b stays where it is
  EXPECT_FALSE(List.Move(Ids["c"], Ids["b"], true));
  EXPECT_EQ(List.GetTabIds(), Order({"a", "b", "c"}));
}

TEST_F(WindowTabListTests, MoveWithUnknownTabFails) {
  TabId stranger = Tab::NextId();
  EXPECT_FALSE(List.Move(stranger, Ids["a"], false));
  EXPECT_FALSE(List.Move(Ids["a"], stranger, false));
  EXPECT_EQ(List.GetTabIds(), Order({"a", "b", "c"}));
}

TEST_F(WindowTabListTests, ActivePreservedAcrossReorders) {
  List.Activate(Ids["c"]);
  List.Move(Ids["c"], Ids["a"], false);
  EXPECT_EQ(List.GetActiveId(), Ids["c"]);
  EXPECT_EQ(List.GetActiveIndex(), std::optional<size_t>(0));

  List.Move(Ids["a"], Ids["b"], true);
  EXPECT_EQ(List.GetActiveId(), Ids["c"]);
}

TEST_F(WindowTabListTests, RemovingActiveActivatesNeighbor) {
  List.Activate(Ids["b"]);

  std::optional<TabEntry> removed = List.Remove(Ids["b"]);
  ASSERT_TRUE(removed.has_value());
  EXPECT_EQ(removed->Record.Id, Ids["b"]);
  EXPECT_EQ(List.GetActiveId(), Ids["c"]);

  List.Remove(Ids["c"]);
  EXPECT_EQ(List.GetActiveId(), Ids["a"]);

  List.Remove(Ids["a"]);
  EXPECT_TRUE(List.Empty());
  EXPECT_FALSE(List.GetActiveId().has_value());
  EXPECT_EQ(List.GetActiveTab(), nullptr);
}

TEST_F(WindowTabListTests, RemovingInactiveKeepsActive) {
  List.Remove(Ids["c"]);
  EXPECT_EQ(List.GetActiveId(), Ids["a"]);
  EXPECT_FALSE(List.Remove(Ids["c"]).has_value());
}

TEST_F(WindowTabListTests, InsertClampsIndex) {
  TabEntry entry(Tab::Create("d", "https://d.example/"));
  TabId id = entry.Record.Id;

  EXPECT_EQ(List.Insert(99, std::move(entry)), 3u);
  EXPECT_EQ(List.IndexOf(id), std::optional<size_t>(3));
  EXPECT_EQ(List.GetActiveId(), Ids["a"]);
}

TEST_F(WindowTabListTests, InsertIntoEmptyListActivates) {
  WindowTabList empty;
  TabEntry entry(Tab::Create("x", "https://x.example/"));
  TabId id = entry.Record.Id;

  empty.Insert(0, std::move(entry), false);
  EXPECT_EQ(empty.GetActiveId(), id);
}

TEST_F(WindowTabListTests, ActivateRequiresMembership) {
  EXPECT_FALSE(List.Activate(Tab::NextId()));
  EXPECT_TRUE(List.Activate(Ids["c"]));
  EXPECT_EQ(List.GetActiveTab()->Title, "c");
}

TEST_F(WindowTabListTests, SurfaceTravelsWithRecord) {
  std::vector<std::string> log;
  Tab tab = Tab::Create("d", "https://d.example/");
  auto surface = std::make_unique<KestrelTest::RecordingSurface>(tab.Id, &log);
  ITabSurface *raw = surface.get();
  List.AddTab(tab, std::move(surface));

  EXPECT_EQ(List.GetSurface(tab.Id), raw);
  std::optional<TabEntry> removed = List.Remove(tab.Id);
  EXPECT_EQ(removed->Surface.get(), raw);
  EXPECT_EQ(List.GetSurface(tab.Id), nullptr);
}
