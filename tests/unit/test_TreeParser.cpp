#include <gtest/gtest.h>
#include "sync/assets/TreeParser.hpp"

using namespace sl::sync::assets;
using namespace sl::sync::model;
using json = nlohmann::json;

namespace {

json sampleTree() {
    return json::parse(R"({"children": [
        {"tree_node_type": "Folder", "id": "f1", "name": "Risk", "children": [
            {"file_id": "r1", "name": "matrix.xlsx", "id": "n-r1", "p_id": "f1"},
            {"file_id": "r2", "name": "other.pdf", "p_id": "f1"}
        ]},
        {"tree_node_type": "folder", "name": "Drawings", "children": [
            {"file_id": "d1", "name": "plan.DWG", "file_size": 120}
        ]}
    ]})");
}

const AssetNode* byName(const std::vector<AssetNode>& nodes, const std::string& name) {
    for (const auto& n : nodes) if (n.name == name) return &n;
    return nullptr;
}

}

TEST(TreeParserTest, TraverseEmitsFoldersAndFiles) {
    const auto nodes = TreeParser::traverse(sampleTree());
    ASSERT_EQ(nodes.size(), 5u);

    const auto* risk = byName(nodes, "Risk");
    ASSERT_NE(risk, nullptr);
    EXPECT_EQ(risk->kind, AssetNode::Kind::Folder);
    EXPECT_EQ(risk->node_id, "f1");
    EXPECT_TRUE(risk->isFolder());

    const auto* matrix = byName(nodes, "matrix.xlsx");
    ASSERT_NE(matrix, nullptr);
    EXPECT_EQ(matrix->node_id, "n-r1");
    EXPECT_EQ(matrix->remote_id, "r1");
    EXPECT_EQ(matrix->parent_id, "f1");
    EXPECT_EQ(matrix->file_type, "xlsx");

    const auto* other = byName(nodes, "other.pdf");
    ASSERT_NE(other, nullptr);
    EXPECT_EQ(other->node_id, "r2");

    const auto* plan = byName(nodes, "plan.DWG");
    ASSERT_NE(plan, nullptr);
    EXPECT_EQ(plan->file_type, "dwg");
    EXPECT_EQ(plan->size_bytes, 120u);
}

TEST(TreeParserTest, FirstFileOfFirstFolderIsRiskMatrix) {
    const auto nodes = TreeParser::traverse(sampleTree());
    EXPECT_TRUE(byName(nodes, "matrix.xlsx")->is_risk_matrix);
    EXPECT_FALSE(byName(nodes, "other.pdf")->is_risk_matrix);
    EXPECT_FALSE(byName(nodes, "plan.DWG")->is_risk_matrix);
}

TEST(TreeParserTest, FolderWithoutIdGetsStableSyntheticId) {
    const auto first = TreeParser::traverse(sampleTree());
    const auto second = TreeParser::traverse(sampleTree());

    const auto* drawings = byName(first, "Drawings");
    ASSERT_NE(drawings, nullptr);
    EXPECT_TRUE(drawings->node_id.starts_with("folder_"));
    EXPECT_EQ(drawings->node_id, byName(second, "Drawings")->node_id);
    EXPECT_EQ(drawings->node_id, TreeParser::syntheticNodeId(drawings->tree_path));
    EXPECT_NE(TreeParser::syntheticNodeId("root/a"), TreeParser::syntheticNodeId("root/b"));
}

TEST(TreeParserTest, RootObjectStrategy) {
    const json detail = {{"project_digital_asset_tree", sampleTree()}};
    const auto parsed = TreeParser::parse(detail);
    EXPECT_EQ(parsed.strategy, "root-object");
    EXPECT_EQ(parsed.nodes.size(), 5u);
}

TEST(TreeParserTest, RootArrayStrategy) {
    const json detail = {{"project_digital_asset_tree", sampleTree()["children"]}};
    const auto parsed = TreeParser::parse(detail);
    EXPECT_EQ(parsed.strategy, "root-array");
    EXPECT_EQ(parsed.nodes.size(), 5u);
    EXPECT_TRUE(byName(parsed.nodes, "matrix.xlsx")->is_risk_matrix);
}

TEST(TreeParserTest, DataWrappedStrategies) {
    const json object = {{"data", {{"project_digital_asset_tree", sampleTree()}}}};
    EXPECT_EQ(TreeParser::parse(object).strategy, "data-object");

    const json array = {{"data", {{"project_digital_asset_tree", sampleTree()["children"]}}}};
    EXPECT_EQ(TreeParser::parse(array).strategy, "data-array");
}

TEST(TreeParserTest, EmptyTreeFallsThroughToNextStrategy) {
    json detail = {{"project_digital_asset_tree", json::object()}};
    detail["data"] = {{"project_digital_asset_tree", sampleTree()}};

    const auto parsed = TreeParser::parse(detail);
    EXPECT_EQ(parsed.strategy, "data-object");
    EXPECT_EQ(parsed.nodes.size(), 5u);
}

TEST(TreeParserTest, NoTreeYieldsNoStrategy) {
    const auto parsed = TreeParser::parse(json::parse(R"({"name": "no assets here"})"));
    EXPECT_TRUE(parsed.strategy.empty());
    EXPECT_TRUE(parsed.nodes.empty());
}

TEST(TreeParserTest, AlternativeChildKeysAreTraversed) {
    const auto nodes = TreeParser::traverse(json::parse(R"({"items": [
        {"file_id": "a1", "title": "photo.JPG"},
        {"tree_node_type": "Folder", "id": "g", "name": "Misc", "files": [{"file_id": "a2", "name": "x", "type": "PNG"}]}
    ]})"));

    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(byName(nodes, "photo.JPG")->file_type, "jpg");
    EXPECT_EQ(byName(nodes, "x")->file_type, "png");
}
