#include <set>
#include <thread>
#include <fstream>

#include <gtest/gtest.h>
#include <coderun/paths.h>
#include <coderun/workspace.h>

#include "utils.h"

TEST(Workspace, SingleFile) {
  auto ws = Workspace::Acquire(WorkspaceKind::SINGLE_FILE, ".py");
  ASSERT_TRUE(ws);
  EXPECT_EQ(ws->Kind(), WorkspaceKind::SINGLE_FILE);
  EXPECT_EQ(ws->Root().parent_path(), kWorkspaceRoot);
  EXPECT_EQ(ws->Path(), ws->Root() / "prog.py");
  EXPECT_TRUE(fs::is_directory(ws->Root()));
  ASSERT_TRUE(ws->WriteSource("print(1)\n"));
  std::ifstream fin(ws->Path());
  std::string content((std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
  EXPECT_EQ(content, "print(1)\n");
}

TEST(Workspace, DirectoryTree) {
  auto ws = Workspace::Acquire(WorkspaceKind::DIRECTORY);
  ASSERT_TRUE(ws);
  EXPECT_EQ(ws->Path(), ws->Root());
  EXPECT_FALSE(ws->WriteSource("x"));
  ASSERT_TRUE(ws->Write("src/nested/main.rs", "fn main() {}"));
  EXPECT_TRUE(fs::is_regular_file(ws->Artifact("src/nested/main.rs")));
}

TEST(Workspace, ReleaseRemovesEverything) {
  fs::path root;
  {
    auto ws = Workspace::Acquire(WorkspaceKind::DIRECTORY);
    ASSERT_TRUE(ws);
    root = ws->Root();
    ASSERT_TRUE(ws->Write("a/b/c.txt", "data"));
    ASSERT_TRUE(ws->Write("d.txt", "data"));
  }
  EXPECT_FALSE(fs::exists(root));
}

TEST(Workspace, ReleaseIsIdempotent) {
  auto ws = Workspace::Acquire(WorkspaceKind::SINGLE_FILE, ".c");
  ASSERT_TRUE(ws);
  fs::path root = ws->Root();
  EXPECT_TRUE(ws->Release());
  EXPECT_FALSE(fs::exists(root));
  EXPECT_TRUE(ws->Release());
  // the destructor releases again without complaint
  ws.reset();
  EXPECT_FALSE(fs::exists(root));
}

TEST(Workspace, UniqueNames) {
  constexpr int kThreads = 8, kPerThread = 25;
  std::vector<std::vector<std::unique_ptr<Workspace>>> held(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([&held, i]() {
      for (int j = 0; j < kPerThread; j++) held[i].push_back(Workspace::Acquire(WorkspaceKind::DIRECTORY));
    });
  }
  for (auto& t : threads) t.join();
  std::set<fs::path> roots;
  for (auto& vec : held) {
    for (auto& ws : vec) {
      ASSERT_TRUE(ws);
      roots.insert(ws->Root());
    }
  }
  EXPECT_EQ(roots.size(), (size_t)kThreads * kPerThread);
  held.clear();
  EXPECT_EQ(CountEntries(kWorkspaceRoot), 0u);
}
