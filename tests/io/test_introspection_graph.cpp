#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sigflow/core/Error.hpp>
#include <sigflow/io/IntrospectionGraph.hpp>
#include <yaml-cpp/yaml.h>

// ============================================================================
// Helpers
// ============================================================================

static sigflow::IntrospectionGraph MakeTestGraph() {
    sigflow::IntrospectionGraph graph;
    graph.system = "counter";

    sigflow::BlockInfo one{"one", "Constant", 0, {}, {{"y", "Double", "one"}}};
    sigflow::BlockInfo z{"z", "Delay", 1, {{"u", "Double", "sum"}}, {{"y", "Double", "feedback"}}};
    sigflow::BlockInfo adder{"adder",
                             "Add",
                             0,
                             {{"u1", "Double", "one"}, {"u2", "Double", "feedback"}},
                             {{"y", "Double", "sum"}}};
    graph.blocks = {one, z, adder};

    graph.edges.push_back({"one", "one", "adder", true});
    graph.edges.push_back({"feedback", "z", "adder", true});
    graph.edges.push_back({"sum", "adder", "z", false});
    return graph;
}

// ============================================================================
// JSON Serialization
// ============================================================================

TEST(IntrospectionGraph, ToJSON_Summary) {
    auto j = MakeTestGraph().ToJSON();

    EXPECT_EQ(j["system"], "counter");
    EXPECT_EQ(j["summary"]["total_blocks"], 3);
    EXPECT_EQ(j["summary"]["total_signals"], 3);
    EXPECT_EQ(j["summary"]["total_edges"], 3);
}

TEST(IntrospectionGraph, ToJSON_BlockFields) {
    auto j = MakeTestGraph().ToJSON();

    ASSERT_EQ(j["blocks"].size(), 3u);
    auto &z = j["blocks"][1];
    EXPECT_EQ(z["name"], "z");
    EXPECT_EQ(z["type"], "Delay");
    EXPECT_EQ(z["delay"], 1);
    ASSERT_EQ(z["inputs"].size(), 1u);
    EXPECT_EQ(z["inputs"][0]["port"], "u");
    EXPECT_EQ(z["inputs"][0]["type"], "Double");
    EXPECT_EQ(z["inputs"][0]["signal"], "sum");
    EXPECT_EQ(z["outputs"][0]["signal"], "feedback");
}

TEST(IntrospectionGraph, ToJSON_SourceBlockHasEmptyInputs) {
    auto j = MakeTestGraph().ToJSON();

    auto &one = j["blocks"][0];
    ASSERT_TRUE(one.contains("inputs"));
    EXPECT_TRUE(one["inputs"].is_array());
    EXPECT_TRUE(one["inputs"].empty());
}

TEST(IntrospectionGraph, ToJSON_EdgeFields) {
    auto j = MakeTestGraph().ToJSON();

    ASSERT_EQ(j["edges"].size(), 3u);
    auto &edge = j["edges"][2];
    EXPECT_EQ(edge["signal"], "sum");
    EXPECT_EQ(edge["producer"], "adder");
    EXPECT_EQ(edge["consumer"], "z");
    EXPECT_EQ(edge["scheduling"], false);
    EXPECT_EQ(j["edges"][0]["scheduling"], true);
}

TEST(IntrospectionGraph, ToJSON_EmptyGraph) {
    sigflow::IntrospectionGraph graph;
    auto j = graph.ToJSON();

    EXPECT_EQ(j["summary"]["total_blocks"], 0);
    EXPECT_TRUE(j["blocks"].is_array());
    EXPECT_TRUE(j["edges"].is_array());
    EXPECT_TRUE(j["edges"].empty());
}

// ============================================================================
// YAML Serialization
// ============================================================================

TEST(IntrospectionGraph, ToYAML_ParsesBack) {
    auto node = YAML::Load(MakeTestGraph().ToYAML());

    EXPECT_EQ(node["system"].as<std::string>(), "counter");
    EXPECT_EQ(node["summary"]["total_edges"].as<int>(), 3);
    ASSERT_EQ(node["blocks"].size(), 3u);
    EXPECT_EQ(node["blocks"][1]["delay"].as<int>(), 1);
    EXPECT_EQ(node["edges"][2]["scheduling"].as<bool>(), false);
    // Ports are omitted when a block has none
    EXPECT_FALSE(node["blocks"][0]["inputs"]);
}

// ============================================================================
// File Export
// ============================================================================

TEST(IntrospectionGraph, ToJSONFile_WritesDocument) {
    auto path = std::filesystem::temp_directory_path() / "sigflow_graph_test.json";
    MakeTestGraph().ToJSONFile(path.string());

    std::ifstream in(path);
    ASSERT_TRUE(in.good());
    auto j = nlohmann::json::parse(in);
    EXPECT_EQ(j["system"], "counter");
    std::filesystem::remove(path);
}

TEST(IntrospectionGraph, ToYAMLFile_WritesDocument) {
    auto path = std::filesystem::temp_directory_path() / "sigflow_graph_test.yaml";
    MakeTestGraph().ToYAMLFile(path.string());

    auto node = YAML::LoadFile(path.string());
    EXPECT_EQ(node["blocks"][2]["name"].as<std::string>(), "adder");
    std::filesystem::remove(path);
}

TEST(IntrospectionGraph, ToJSONFile_BadPathThrows) {
    EXPECT_THROW(MakeTestGraph().ToJSONFile("/nonexistent_dir/sub/graph.json"), sigflow::IOError);
}
