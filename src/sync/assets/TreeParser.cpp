#include "sync/assets/TreeParser.hpp"
#include "remote/parse.hpp"
#include "crypto/Hash.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <array>
#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

using namespace sl::sync::assets;
using namespace sl::sync::model;
using json = nlohmann::json;

namespace {

constexpr auto kTreeKey = "project_digital_asset_tree";

constexpr std::array<const char*, 6> kChildKeys = {"children", "items", "nodes", "files", "assets", "content"};

// Scalar fields of a node never hold sub-trees.
constexpr std::array<const char*, 6> kLeafKeys = {"file_id", "name", "title", "file_size", "size", "type"};

bool isChildKey(const std::string& key) {
    return std::ranges::find(kChildKeys, key) != kChildKeys.end();
}

bool isLeafKey(const std::string& key) {
    return std::ranges::find(kLeafKeys, key) != kLeafKeys.end();
}

std::optional<std::string> idField(const json& node, const char* key) {
    auto v = sl::remote::parse::firstString(node, {key});
    if (!v || *v == "null") return std::nullopt;
    return v;
}

std::optional<json> treeAt(const json& container, const bool wantArray) {
    if (!container.is_object()) return std::nullopt;
    const auto it = container.find(kTreeKey);
    if (it == container.end()) return std::nullopt;
    if (wantArray && it->is_array()) return json{{"children", *it}};
    if (!wantArray && it->is_object()) return *it;
    return std::nullopt;
}

std::optional<json> dataOf(const json& detail) {
    if (!detail.is_object()) return std::nullopt;
    const auto it = detail.find("data");
    if (it == detail.end() || !it->is_object()) return std::nullopt;
    return *it;
}

}

const std::vector<TreeParser::Strategy>& TreeParser::strategies() {
    static const std::vector<Strategy> list = {
        {"root-object", [](const json& d) { return treeAt(d, false); }},
        {"root-array", [](const json& d) { return treeAt(d, true); }},
        {"data-object", [](const json& d) -> std::optional<json> {
            if (const auto data = dataOf(d)) return treeAt(*data, false);
            return std::nullopt;
        }},
        {"data-array", [](const json& d) -> std::optional<json> {
            if (const auto data = dataOf(d)) return treeAt(*data, true);
            return std::nullopt;
        }},
    };
    return list;
}

ParsedTree TreeParser::parse(const json& detail) {
    for (const auto& strategy : strategies()) {
        const auto root = strategy.locate(detail);
        if (!root) continue;

        auto nodes = traverse(*root);
        if (nodes.empty()) {
            log::Registry::assets()->debug("[TreeParser] Strategy {} located an empty tree", strategy.name);
            continue;
        }

        log::Registry::assets()->debug("[TreeParser] Strategy {} produced {} nodes", strategy.name, nodes.size());
        return {strategy.name, std::move(nodes)};
    }

    log::Registry::assets()->info("[TreeParser] No digital asset tree found in project detail");
    return {};
}

std::vector<AssetNode> TreeParser::traverse(const json& root) {
    std::vector<AssetNode> nodes;
    visit(root, "root", Position::Root, nodes);
    return nodes;
}

std::string TreeParser::syntheticNodeId(const std::string& treePath) {
    return "folder_" + crypto::hash::blake2b(treePath);
}

std::optional<std::string> TreeParser::fileTypeOf(const json& node) {
    if (auto t = remote::parse::firstString(node, {"file_type", "type", "extension", "format", "mime_type"}))
        return boost::algorithm::to_lower_copy(*t);

    if (const auto name = remote::parse::firstString(node, {"name", "title", "file_name"})) {
        const auto dot = name->find_last_of('.');
        if (dot != std::string::npos && dot > 0) return util::extensionOf(*name);
    }
    return std::nullopt;
}

void TreeParser::visit(const json& node, const std::string& path, const Position pos, std::vector<AssetNode>& out) {
    if (node.is_array()) {
        for (size_t i = 0; i < node.size(); ++i) {
            Position childPos = Position::Other;
            if (i == 0 && pos == Position::Root) childPos = Position::FirstChild;
            else if (i == 0 && pos == Position::FirstChild) childPos = Position::RiskMatrix;
            visit(node[i], fmt::format("{}[{}]", path, i), childPos, out);
        }
        return;
    }

    if (!node.is_object()) return;

    const auto name = remote::parse::firstString(node, {"node_name", "name", "title"});

    if (const auto type = remote::parse::firstString(node, {"tree_node_type"});
        type && boost::algorithm::iequals(*type, "Folder")) {
        AssetNode folder;
        folder.node_id = idField(node, "id").value_or(syntheticNodeId(path));
        folder.parent_id = idField(node, "p_id");
        folder.name = name.value_or("");
        folder.kind = AssetNode::Kind::Folder;
        folder.tree_path = path;
        out.push_back(std::move(folder));

        visitChildren(node, path, pos, out);
        return;
    }

    if (const auto fileId = idField(node, "file_id")) {
        AssetNode file;
        file.remote_id = *fileId;
        file.node_id = idField(node, "id").value_or(*fileId);
        file.parent_id = idField(node, "p_id");
        file.name = name.value_or(*fileId);
        file.kind = AssetNode::Kind::File;
        file.file_type = fileTypeOf(node);
        if (const auto size = remote::parse::firstNumber(node, {"file_size"}); size && *size > 0)
            file.size_bytes = static_cast<uintmax_t>(*size);
        else if (const auto alt = remote::parse::firstNumber(node, {"size"}); alt && *alt > 0)
            file.size_bytes = static_cast<uintmax_t>(*alt);
        file.tree_path = path;
        file.is_risk_matrix = pos == Position::RiskMatrix;
        out.push_back(std::move(file));
    }

    visitChildren(node, path, pos, out);
}

void TreeParser::visitChildren(const json& node, const std::string& path, const Position pos,
                               std::vector<AssetNode>& out) {
    for (const auto* key : kChildKeys) {
        const auto it = node.find(key);
        if (it == node.end()) continue;

        if (it->is_array()) {
            for (size_t i = 0; i < it->size(); ++i) {
                Position childPos = Position::Other;
                if (std::string_view(key) == "children" && i == 0) {
                    if (pos == Position::Root) childPos = Position::FirstChild;
                    else if (pos == Position::FirstChild) childPos = Position::RiskMatrix;
                }
                visit((*it)[i], fmt::format("{}/{}[{}]", path, key, i), childPos, out);
            }
        } else if (it->is_object()) {
            visit(*it, fmt::format("{}/{}", path, key), Position::Other, out);
        }
    }

    for (const auto& [key, value] : node.items()) {
        if (isChildKey(key) || isLeafKey(key)) continue;
        if (value.is_object()) visit(value, fmt::format("{}/{}", path, key), Position::Other, out);
        else if (value.is_array())
            for (size_t i = 0; i < value.size(); ++i)
                visit(value[i], fmt::format("{}/{}[{}]", path, key, i), Position::Other, out);
    }
}
