#include <sys/stat.h>
#include <unistd.h>
#include "gtest/gtest.h"
#include "ojudge/common/exceptions.hpp"
#include "ojudge/common/io_utils.hpp"
#include "ojudge/workspace.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace std::filesystem;
using namespace ojudge;

class WorkspaceTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        test::setup_test_environment();
    }

    static void TearDownTestCase() {
    }

    path root = test::test_scratch_dir() / "workspace";
};

TEST_F(WorkspaceTest, CreateAndDestroyTest) {
    workspace ws = workspace::create(root, "1001");
    path dir = ws.path();
    EXPECT_TRUE(is_directory(dir));
    EXPECT_EQ(dir.parent_path().string(), root.string());
    EXPECT_EQ(dir.filename().string().rfind("1001-", 0), 0u);

    EXPECT_TRUE(ws.destroy());
    EXPECT_TRUE(ws.destroyed());
    EXPECT_FALSE(exists(dir));

    // 重复删除没有任何效果
    EXPECT_FALSE(ws.destroy());
}

TEST_F(WorkspaceTest, RelativeRootTest) {
    path relative_root = relative(root, current_path());
    ASSERT_TRUE(relative_root.is_relative());
    workspace ws = workspace::create(relative_root, "1002");
    EXPECT_TRUE(ws.path().is_absolute());
    EXPECT_EQ(ws.path().parent_path().string(), absolute(relative_root).string());
    EXPECT_TRUE(is_directory(ws.path()));
}

TEST_F(WorkspaceTest, UniqueDirectoryTest) {
    workspace a = workspace::create(root, "1002");
    workspace b = workspace::create(root, "1002");
    EXPECT_NE(a.path().string(), b.path().string());
}

TEST_F(WorkspaceTest, DestructorTest) {
    path dir;
    {
        workspace ws = workspace::create(root, "1003");
        dir = ws.path();
        write_file_content(dir / "data.txt", "data");
    }
    EXPECT_FALSE(exists(dir));
}

TEST_F(WorkspaceTest, MoveTest) {
    workspace a = workspace::create(root, "1004");
    path dir = a.path();
    {
        workspace b(move(a));
        EXPECT_TRUE(a.destroyed());
        EXPECT_TRUE(is_directory(dir));
    }
    EXPECT_FALSE(exists(dir));
}

TEST_F(WorkspaceTest, InvalidTaskIdTest) {
    EXPECT_THROW(workspace::create(root, ""), workspace_allocation_error);
    EXPECT_THROW(workspace::create(root, ".."), workspace_allocation_error);
    EXPECT_THROW(workspace::create(root, "a/b"), workspace_allocation_error);
}

TEST_F(WorkspaceTest, UnwritableRootTest) {
    if (geteuid() == 0) GTEST_SKIP() << "root ignores directory permissions";
    path readonly = root / "readonly";
    create_directories(readonly);
    permissions(readonly, perms::owner_read | perms::owner_exec);
    EXPECT_THROW(workspace::create(readonly, "1005"), workspace_allocation_error);
    permissions(readonly, perms::owner_all);
}

TEST_F(WorkspaceTest, WriteSourceTest) {
    workspace ws = workspace::create(root, "1006");
    language_registry registry = language_registry::builtin();

    path source = ws.write_source(registry.resolve("cpp"), "int main() {}\n");
    EXPECT_EQ(source.string(), (ws.path() / "main.cpp").string());
    EXPECT_EQ(read_file_content(source), "int main() {}\n");

    path java = ws.write_source(registry.resolve("java"), "public class Main {}");
    EXPECT_EQ(java.filename().string(), "Main.java");

    ws.destroy();
    EXPECT_THROW(ws.write_source(registry.resolve("cpp"), ""), internal_error);
}

TEST_F(WorkspaceTest, DestroyReadonlyContentTest) {
    workspace ws = workspace::create(root, "1007");
    path dir = ws.path() / "locked";
    create_directories(dir);
    write_file_content(dir / "file", "x");
    permissions(dir, perms::owner_read | perms::owner_exec);
    EXPECT_TRUE(ws.destroy());
    EXPECT_FALSE(exists(ws.path()));
}
