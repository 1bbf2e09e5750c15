#include "TestHelpers.h"

using namespace Kestrel;

namespace {

class TransferProtocolTests : public KestrelTest::BrowserFixture {
protected:
  std::string Event(const char *what, const std::string &tab,
                    WindowHandle window) {
    return std::string(what) + " " + std::to_string(T.at(tab).Value) + " " +
           std::to_string(window.Value);
  }

  TransferErrorLog Errors;
  TransferProtocol Protocol{Registry, Lifecycle, Errors};
};

} // namespace

TEST_F(TransferProtocolTests, CrossWindowScenario) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b"});
  WindowHandle B = MakeWindow(glm::vec4(500, 0, 400, 300), {"c", "d"});

  EXPECT_TRUE(Protocol.Transfer(A, T["b"], B, T["d"], false));

  EXPECT_EQ(Ids(A), Ids({"a"}));
  EXPECT_EQ(Active(A), T["a"]);
  EXPECT_EQ(Ids(B), Ids({"c", "b", "d"}));
  EXPECT_EQ(Active(B), T["c"]);
  EXPECT_EQ(Host.SurfaceLog, (std::vector<std::string>{
                                 Event("detach", "b", A),
                                 Event("attach", "b", B)}));
  EXPECT_EQ(Errors.Count(), 0u);
}

TEST_F(TransferProtocolTests, InsertAfterAnchor) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b"});
  WindowHandle B = MakeWindow(glm::vec4(500, 0, 400, 300), {"c", "d"});

  EXPECT_TRUE(Protocol.Transfer(A, T["a"], B, T["c"], true));
  EXPECT_EQ(Ids(B), Ids({"c", "a", "d"}));
  EXPECT_EQ(Ids(A), Ids({"b"}));
  EXPECT_EQ(Active(A), T["b"]);
}

TEST_F(TransferProtocolTests, NoAnchorAppends) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b"});
  WindowHandle B = MakeWindow(glm::vec4(500, 0, 400, 300), {"c", "d"});

  EXPECT_TRUE(Protocol.Transfer(A, T["a"], B, std::nullopt, false));
  EXPECT_EQ(Ids(B), Ids({"c", "d", "a"}));
  EXPECT_EQ(Errors.Count(), 0u);
}

TEST_F(TransferProtocolTests, VanishedAnchorAppends) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b"});
  WindowHandle B = MakeWindow(glm::vec4(500, 0, 400, 300), {"c", "d"});
  TabId gone = Tab::NextId();

  EXPECT_TRUE(Protocol.Transfer(A, T["a"], B, gone, false));
  EXPECT_EQ(Ids(B), Ids({"c", "d", "a"}));
  EXPECT_EQ(Errors.CountOf(TransferErrorCode::AmbiguousIndex), 1u);
  EXPECT_FALSE(Errors.HasErrors());
}

TEST_F(TransferProtocolTests, TransplantActiveOnlyIntoEmptyList) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b"});
  WindowHandle B = MakeWindow(glm::vec4(500, 0, 400, 300), {});

  std::optional<TabRemoval> removal = Protocol.Remove(A, T["b"]);
  ASSERT_TRUE(removal.has_value());
  EXPECT_EQ(Protocol.Insert(B, *removal, std::nullopt, false),
            std::optional<size_t>(0));
  EXPECT_EQ(Active(B), T["b"]);
}

TEST_F(TransferProtocolTests, RemoveReportsOriginalPlace) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b", "c"});
  Lifecycle.ActivateTab(A, T["b"]);

  std::optional<TabRemoval> removal = Protocol.Remove(A, T["b"]);
  ASSERT_TRUE(removal.has_value());
  EXPECT_EQ(removal->Origin, A);
  EXPECT_EQ(removal->OriginalIndex, 1u);
  EXPECT_TRUE(removal->WasActive);
  EXPECT_EQ(removal->Entry.Record.Id, T["b"]);
  EXPECT_NE(removal->Entry.Surface, nullptr);
  EXPECT_EQ(Occurrences(T["b"]), 0u);

  EXPECT_FALSE(Protocol.Remove(A, T["b"]).has_value());
  EXPECT_FALSE(Protocol.Remove(WindowHandle{999}, T["a"]).has_value());
}

TEST_F(TransferProtocolTests, RollbackRestoresPlaceAndActive) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b", "c"});
  Lifecycle.ActivateTab(A, T["b"]);

  std::optional<TabRemoval> removal = Protocol.Remove(A, T["b"]);
  EXPECT_EQ(Active(A), T["c"]);

  Protocol.Rollback(*removal);
  EXPECT_EQ(Ids(A), Ids({"a", "b", "c"}));
  EXPECT_EQ(Active(A), T["b"]);
}

TEST_F(TransferProtocolTests, RollbackWithoutOriginOpensWindow) {
  glm::vec4 frame(40, 60, 400, 300);
  WindowHandle A = MakeWindow(frame, {"a", "b"});

  std::optional<TabRemoval> removal = Protocol.Remove(A, T["b"]);
  Registry.UnregisterWindow(A);

  WindowHandle home = Protocol.Rollback(*removal);
  ASSERT_TRUE(home.IsValid());
  EXPECT_NE(home, A);
  EXPECT_EQ(Ids(home), Ids({"b"}));
  EXPECT_EQ(Active(home), T["b"]);
  EXPECT_EQ(Host.CreatedFrames[home], frame);
  EXPECT_EQ(Host.SurfaceLog.back(), Event("attach", "b", home));
}

TEST_F(TransferProtocolTests, RollbackWithNowhereToGoReportsLoss) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b"});

  std::optional<TabRemoval> removal = Protocol.Remove(A, T["b"]);
  Registry.UnregisterWindow(A);
  Host.FailCreate = true;

  EXPECT_FALSE(Protocol.Rollback(*removal).IsValid());
  EXPECT_EQ(Errors.CountOf(TransferErrorCode::TransferFailure), 1u);
  EXPECT_TRUE(Errors.HasErrors());
}

TEST_F(TransferProtocolTests, DestinationLostMidTransferRollsBack) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b"});
  WindowHandle B = MakeWindow(glm::vec4(500, 0, 400, 300), {"c"});
  Lifecycle.ActivateTab(A, T["b"]);

  SurfaceOf(A, T["b"])->DetachHook = [this, B](WindowHandle) {
    Registry.UnregisterWindow(B);
  };

  EXPECT_FALSE(Protocol.Transfer(A, T["b"], B, T["c"], true));

  EXPECT_EQ(Ids(A), Ids({"a", "b"}));
  EXPECT_EQ(Active(A), T["b"]);
  EXPECT_EQ(Occurrences(T["b"]), 1u);
  EXPECT_EQ(Errors.CountOf(TransferErrorCode::TransferFailure), 1u);
  EXPECT_TRUE(Errors.HasErrors());
  EXPECT_EQ(Host.SurfaceLog.back(), Event("attach", "b", A));
}

TEST_F(TransferProtocolTests, LastTabOutSchedulesOriginDestroy) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a"});
  WindowHandle B = MakeWindow(glm::vec4(500, 0, 400, 300), {"c"});

  EXPECT_TRUE(Protocol.Transfer(A, T["a"], B, T["c"], false));

  // Still registered until the caller flushes
  EXPECT_NE(Registry.Find(A), nullptr);
  EXPECT_TRUE(Lifecycle.IsDestroyPending(A));

  EXPECT_EQ(Lifecycle.FlushPendingDestroys(), 1u);
  EXPECT_EQ(Registry.Find(A), nullptr);
  EXPECT_TRUE(Host.WasReleased(A));
  EXPECT_EQ(Ids(B), Ids({"a", "c"}));
}

TEST_F(TransferProtocolTests, RoundTripRestoresOrigin) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b", "c"});
  WindowHandle B = MakeWindow(glm::vec4(500, 0, 400, 300), {"d"});
  std::vector<TabId> original = Ids(A);

  ASSERT_TRUE(Protocol.Transfer(A, T["b"], B, T["d"], true));
  ASSERT_TRUE(Protocol.Transfer(B, T["b"], A, T["c"], false));

  EXPECT_EQ(Ids(A), original);
  EXPECT_EQ(Ids(B), Ids({"d"}));
}

TEST_F(TransferProtocolTests, ReorderThroughProtocol) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b", "c"});
  size_t notifications = Host.TabsChanged.size();

  EXPECT_TRUE(Protocol.Reorder(A, T["a"], T["c"], true));
  EXPECT_EQ(Ids(A), Ids({"b", "c", "a"}));
  EXPECT_GT(Host.TabsChanged.size(), notifications);

  EXPECT_FALSE(Protocol.Reorder(A, T["a"], T["a"], false));
  EXPECT_FALSE(Protocol.Reorder(WindowHandle{999}, T["a"], T["b"], false));
  EXPECT_EQ(Ids(A), Ids({"b", "c", "a"}));
}

TEST_F(TransferProtocolTests, DetachCreatesSoleTabWindow) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b"});
  glm::vec4 frame(800, 600, 400, 300);

  WindowHandle created = Protocol.Detach(A, T["b"], frame);

  ASSERT_TRUE(created.IsValid());
  EXPECT_EQ(Ids(created), Ids({"b"}));
  EXPECT_EQ(Active(created), T["b"]);
  EXPECT_EQ(Registry.Find(created)->GetFrame(), frame);
  EXPECT_EQ(Host.CreatedFrames[created], frame);
  EXPECT_EQ(Ids(A), Ids({"a"}));
  EXPECT_EQ(Host.SurfaceLog.back(), Event("attach", "b", created));
}

TEST_F(TransferProtocolTests, DetachWithoutWindowRollsBack) {
  WindowHandle A = MakeWindow(glm::vec4(0, 0, 400, 300), {"a", "b"});
  size_t windows = Registry.GetWindowCount();
  Host.FailCreate = true;

  WindowHandle created =
      Protocol.Detach(A, T["a"], glm::vec4(800, 600, 400, 300));

  EXPECT_FALSE(created.IsValid());
  EXPECT_EQ(Registry.GetWindowCount(), windows);
  EXPECT_EQ(Ids(A), Ids({"a", "b"}));
  EXPECT_EQ(Active(A), T["a"]);
  EXPECT_EQ(Errors.CountOf(TransferErrorCode::TransferFailure), 1u);
}
