#include "../test_utils.hpp"

#include <gtest/gtest.h>
#include <mcpguard/filter.hpp>
#include <mcpguard/logger.hpp>

using namespace mcpguard;
using namespace mcpguard::test;

namespace
{
json tools_response(const std::vector<std::string>& names)
{
    json tools = json::array();
    for (const auto& name : names)
        tools.push_back({{"name", name}, {"description", "does " + name}});
    return make_result(1, {{"tools", tools}});
}

std::vector<std::string> names_in(const json& response, const char* key)
{
    std::vector<std::string> names;
    for (const auto& entity : response["result"][key])
        names.push_back(entity["name"].get<std::string>());
    return names;
}
} // namespace

TEST(ResponseFilterTest, RemovesDeniedTools)
{
    Policy policy({}, {{"tool", {"delete_*"}}});
    ResponseFilter filter(policy);

    json response = tools_response({"read_file", "delete_file", "list_dir"});
    EXPECT_EQ(filter.apply(EntityType::Tool, response), 1u);
    EXPECT_EQ(names_in(response, "tools"), (std::vector<std::string>{"read_file", "list_dir"}));
}

TEST(ResponseFilterTest, KeepsOrderAndEntityFields)
{
    Policy policy({{"tool", {"read_*", "list_*"}}}, {});
    ResponseFilter filter(policy);

    json response = tools_response({"list_dir", "write_file", "read_file"});
    response["result"]["tools"][2]["inputSchema"] = {{"type", "object"}};
    response["result"]["nextCursor"] = "page-2";

    filter.apply(EntityType::Tool, response);

    ASSERT_EQ(response["result"]["tools"].size(), 2u);
    EXPECT_EQ(response["result"]["tools"][0]["name"], "list_dir");
    EXPECT_EQ(response["result"]["tools"][1]["name"], "read_file");
    EXPECT_EQ(response["result"]["tools"][1]["inputSchema"]["type"], "object");
    EXPECT_EQ(response["result"]["nextCursor"], "page-2");
    EXPECT_EQ(response["id"], 1);
    EXPECT_EQ(response["jsonrpc"], "2.0");
}

TEST(ResponseFilterTest, FiltersPromptsAndResources)
{
    Policy policy({{"prompt", {"system_*"}}}, {{"resource", {"*.env"}}});
    ResponseFilter filter(policy);

    json prompts = make_result(2, {{"prompts", {{{"name", "system_intro"}}, {{"name", "debug"}}}}});
    EXPECT_EQ(filter.apply(EntityType::Prompt, prompts), 1u);
    EXPECT_EQ(names_in(prompts, "prompts"), (std::vector<std::string>{"system_intro"}));

    json resources = make_result(3, {{"resources",
                                      {{{"name", "readme.md"}, {"uri", "fs://readme.md"}},
                                       {{"name", "prod.env"}, {"uri", "fs://prod.env"}}}}});
    EXPECT_EQ(filter.apply(EntityType::Resource, resources), 1u);
    EXPECT_EQ(names_in(resources, "resources"), (std::vector<std::string>{"readme.md"}));
}

TEST(ResponseFilterTest, DropsEntriesWithoutName)
{
    Policy policy;
    ResponseFilter filter(policy);

    json response = make_result(
        1, {{"tools", {{{"name", "ok"}}, {{"description", "anonymous"}}, {{"name", 12}}, "bare"}}});
    EXPECT_EQ(filter.apply(EntityType::Tool, response), 3u);
    EXPECT_EQ(names_in(response, "tools"), (std::vector<std::string>{"ok"}));
}

TEST(ResponseFilterTest, SecondPassChangesNothing)
{
    Policy policy({{"tool", {"read_*", "list_*"}}}, {{"tool", {"*_secret"}}});
    ResponseFilter filter(policy);

    json response = make_result(1, {{"tools",
                                      {{{"name", "read_file"}},
                                       {{"name", "write_file"}},
                                       {{"description", "anonymous"}},
                                       {{"name", "read_secret"}},
                                       {{"name", "list_dir"}},
                                       {{"name", 7}}}}});

    EXPECT_EQ(filter.apply(EntityType::Tool, response), 4u);
    json once = response;

    EXPECT_EQ(filter.apply(EntityType::Tool, response), 0u);
    EXPECT_EQ(response, once);
    EXPECT_EQ(names_in(response, "tools"), (std::vector<std::string>{"read_file", "list_dir"}));
}

TEST(ResponseFilterTest, LeavesUnrecognizedShapesAlone)
{
    Policy policy({}, {{"tool", {"*"}}});
    ResponseFilter filter(policy);

    json error = make_error_response(1, -32601, "Method not found");
    json error_copy = error;
    EXPECT_EQ(filter.apply(EntityType::Tool, error), 0u);
    EXPECT_EQ(error, error_copy);

    json no_array = make_result(1, {{"tools", "not-a-list"}});
    json no_array_copy = no_array;
    EXPECT_EQ(filter.apply(EntityType::Tool, no_array), 0u);
    EXPECT_EQ(no_array, no_array_copy);

    json other_key = make_result(1, {{"prompts", {{{"name", "x"}}}}});
    json other_key_copy = other_key;
    EXPECT_EQ(filter.apply(EntityType::Tool, other_key), 0u);
    EXPECT_EQ(other_key, other_key_copy);

    json scalar = 5;
    EXPECT_EQ(filter.apply(EntityType::Tool, scalar), 0u);
}

TEST(ResponseFilterTest, EmptyPolicyKeepsEverything)
{
    Policy policy;
    ResponseFilter filter(policy);

    json response = tools_response({"a", "b", "c"});
    json original = response;
    EXPECT_EQ(filter.apply(EntityType::Tool, response), 0u);
    EXPECT_EQ(response, original);
}

TEST(ResponseFilterTest, LogsEachRemovedEntity)
{
    std::ostringstream log;
    Logger logger(log);
    Policy policy({}, {{"tool", {"delete_*", "write_*"}}});
    ResponseFilter filter(policy, &logger);

    json response = tools_response({"delete_file", "read_file", "write_file"});
    filter.apply(EntityType::Tool, response);

    EXPECT_EQ(count_lines_containing(log, "Filtered tool: delete_file"), 1u);
    EXPECT_EQ(count_lines_containing(log, "Filtered tool: write_file"), 1u);
    EXPECT_EQ(count_lines_containing(log, "read_file"), 0u);
}

TEST(ResponseFilterTest, CollectionKeys)
{
    EXPECT_STREQ(ResponseFilter::collection_key(EntityType::Tool), "tools");
    EXPECT_STREQ(ResponseFilter::collection_key(EntityType::Prompt), "prompts");
    EXPECT_STREQ(ResponseFilter::collection_key(EntityType::Resource), "resources");
}
