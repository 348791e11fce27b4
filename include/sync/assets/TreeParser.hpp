#pragma once

#include "sync/model/AssetNode.hpp"

#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sl::sync::assets {

struct ParsedTree {
    std::string strategy;  // name of the strategy that located the tree, empty when none did
    std::vector<model::AssetNode> nodes;
};

// Flattens the digital asset tree of a project detail payload into node records.
class TreeParser {
public:
    struct Strategy {
        std::string name;
        std::function<std::optional<nlohmann::json>(const nlohmann::json&)> locate;
    };

    // Fixed order: root-object, root-array, data-object, data-array.
    static const std::vector<Strategy>& strategies();

    // First strategy producing a non-empty node list wins.
    static ParsedTree parse(const nlohmann::json& detail);

    // Traverses an already located tree root.
    static std::vector<model::AssetNode> traverse(const nlohmann::json& root);

    // folder_<blake2b(treePath)>, stable across parses.
    static std::string syntheticNodeId(const std::string& treePath);

private:
    enum class Position { Root, FirstChild, RiskMatrix, Other };

    static void visit(const nlohmann::json& node, const std::string& path, Position pos,
                      std::vector<model::AssetNode>& out);
    static void visitChildren(const nlohmann::json& node, const std::string& path, Position pos,
                              std::vector<model::AssetNode>& out);

    static std::optional<std::string> fileTypeOf(const nlohmann::json& node);
};

}
