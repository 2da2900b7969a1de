#include <gtest/gtest.h>
#include <scratchpad/core/file_tools.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace scratchpad;

class FileToolsTest : public ::testing::Test {
protected:
    fs::path base;
    std::unique_ptr<SandboxFileStore> store;
    std::unique_ptr<FileToolsProvider> provider;

    void SetUp() override {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        base = fs::temp_directory_path() /
               ("scratchpad_tools_" + std::string(info->name()) + "_" + std::to_string(getpid()));
        fs::remove_all(base);

        SandboxConfig cfg;
        cfg.root = base / "scratch";
        store = std::make_unique<SandboxFileStore>(cfg);
        provider = std::make_unique<FileToolsProvider>(*store);
    }

    void TearDown() override {
        provider.reset();
        store.reset();
        fs::remove_all(base);
    }
};

TEST_F(FileToolsTest, ExposesElevenActions) {
    EXPECT_STREQ(provider->tool_id(), "scratchpad");
    std::vector<std::string> actions = provider->actions();
    ASSERT_EQ(actions.size(), 11u);
    EXPECT_EQ(actions.front(), "create_file");
    EXPECT_EQ(actions.back(), "get_time");
}

TEST_F(FileToolsTest, AgentToolsDescribeParameters) {
    std::vector<AgentTool> tools = provider->get_agent_tools();
    ASSERT_EQ(tools.size(), 11u);

    const AgentTool* create_folder = nullptr;
    const AgentTool* list_all = nullptr;
    for (size_t i = 0; i < tools.size(); ++i) {
        EXPECT_FALSE(tools[i].description.empty()) << tools[i].name;
        EXPECT_TRUE(static_cast<bool>(tools[i].execute)) << tools[i].name;
        if (tools[i].name == "create_folder") create_folder = &tools[i];
        if (tools[i].name == "list_all") list_all = &tools[i];
    }

    ASSERT_NE(create_folder, nullptr);
    ASSERT_EQ(create_folder->params.size(), 2u);
    EXPECT_EQ(create_folder->params[0].name, "folder_path");
    EXPECT_TRUE(create_folder->params[0].required);
    EXPECT_EQ(create_folder->params[1].name, "overwrite");
    EXPECT_FALSE(create_folder->params[1].required);
    EXPECT_EQ(create_folder->params[1].default_value, "false");

    ASSERT_NE(list_all, nullptr);
    EXPECT_TRUE(list_all->params.empty());
}

TEST_F(FileToolsTest, CreateThenReadThroughTools) {
    AgentToolResult created = provider->execute("create_file",
        Json{{"file_path", "notes/a.txt"}, {"content", "hello"}});
    ASSERT_TRUE(created.success) << created.error;
    EXPECT_EQ(created.output, "Created notes/a.txt");

    AgentToolResult read = provider->execute("read_file", Json{{"file_path", "notes/a.txt"}});
    ASSERT_TRUE(read.success) << read.error;
    EXPECT_EQ(read.output, "Contents of notes/a.txt:\nhello");
}

TEST_F(FileToolsTest, AgentToolExecutorCallsProvider) {
    std::vector<AgentTool> tools = provider->get_agent_tools();
    for (size_t i = 0; i < tools.size(); ++i) {
        if (tools[i].name != "update_file") continue;

        ASSERT_TRUE(store->create_file("u.txt", "old").success);
        AgentToolResult r = tools[i].execute(Json{{"file_path", "u.txt"}, {"new_content", "new"}});
        ASSERT_TRUE(r.success) << r.error;
        EXPECT_EQ(store->read_file("u.txt").message, "Contents of u.txt:\nnew");
        return;
    }
    FAIL() << "update_file tool not found";
}

TEST_F(FileToolsTest, MissingParametersAreReported) {
    AgentToolResult r = provider->execute("create_file", Json{{"file_path", "a.txt"}});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Missing required parameter: content");

    AgentToolResult wrong_type = provider->execute("read_file", Json{{"file_path", 42}});
    EXPECT_FALSE(wrong_type.success);
    EXPECT_EQ(wrong_type.error, "Missing required parameter: file_path");

    AgentToolResult rename = provider->execute("rename_file", Json{{"old_path", "a"}});
    EXPECT_EQ(rename.error, "Missing required parameter: new_path");
}

TEST_F(FileToolsTest, StoreFailuresBecomeToolErrors) {
    AgentToolResult r = provider->execute("read_file", Json{{"file_path", "../../etc/passwd"}});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Could not read ../../etc/passwd: Path traversal attempt detected");

    AgentToolResult missing = provider->execute("delete_file", Json{{"file_path", "none.txt"}});
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.error, "File none.txt not found");
}

TEST_F(FileToolsTest, OverwriteAcceptsStringAndBool) {
    ASSERT_TRUE(store->create_file("box/item.txt", "x").success);

    AgentToolResult refused = provider->execute("create_folder", Json{{"folder_path", "box"}});
    EXPECT_FALSE(refused.success);
    EXPECT_EQ(refused.error, "Folder box already exists");

    AgentToolResult from_string = provider->execute("create_folder",
        Json{{"folder_path", "box"}, {"overwrite", "true"}});
    ASSERT_TRUE(from_string.success) << from_string.error;
    EXPECT_TRUE(fs::is_empty(store->root() / "box"));

    ASSERT_TRUE(store->create_file("box/again.txt", "y").success);
    AgentToolResult from_bool = provider->execute("create_folder",
        Json{{"folder_path", "box"}, {"overwrite", true}});
    ASSERT_TRUE(from_bool.success) << from_bool.error;
    EXPECT_TRUE(fs::is_empty(store->root() / "box"));
}

TEST_F(FileToolsTest, ListingToolsIgnoreParameters) {
    ASSERT_TRUE(store->create_file("d/f.txt", "x").success);

    EXPECT_EQ(provider->execute("list_files", Json::object()).output, "d/f");
    EXPECT_EQ(provider->execute("list_files_with_extensions", Json{{"unused", 1}}).output, "d/f.txt");
    EXPECT_EQ(provider->execute("list_all", Json::object()).output, "d (Folder)\nd/f.txt");
    EXPECT_TRUE(provider->execute("get_time", Json::object()).success);
}

TEST_F(FileToolsTest, UnknownActionFails) {
    AgentToolResult r = provider->execute("format_disk", Json::object());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Unknown action: format_disk");
}
