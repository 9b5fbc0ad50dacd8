/**
 * @file AstNode.hpp
 * @brief mdast-compatible syntax tree with the Kyozo data envelope.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace polyglot::domain {

/**
 * @enum NodeType
 * @brief mdast node kinds supported by the builder.
 */
enum class NodeType {
    Root,
    Heading,
    Paragraph,
    Code,
    Html,
    List,
    ListItem,
    Text,
    Emphasis,
    Strong,
    Link,
    Image,
    InlineCode
};

/** @brief mdast "type" string for a node kind ("root", "listItem", ...). */
const char* NodeTypeToString(NodeType type);

struct Point {
    int line = 1;
    int column = 1;
};

struct Position {
    Point start;
    Point end;
};

/**
 * @struct KyozoData
 * @brief Non-standard metadata carried under node.data.kyozo.
 */
struct KyozoData {
    bool executable = false;
    bool enlightened = false;
    bool hidden = false;
    std::string executor;                          ///< Transpile target name, empty if none.
    std::map<std::string, std::string> metadata;   ///< Raw directive values.
    std::vector<std::string> dependencies;
};

/**
 * @struct NodeData
 * @brief The open "data" field of an mdast node.
 */
struct NodeData {
    std::optional<KyozoData> kyozo;
    std::map<std::string, std::string> attributes;

    bool empty() const { return !kyozo && attributes.empty(); }
};

/**
 * @struct AstNode
 * @brief One node of the tree. Children are held by value, so every node has exactly one parent.
 */
struct AstNode {
    NodeType type = NodeType::Root;
    int depth = 0;            ///< Heading depth.
    bool ordered = false;     ///< List numbering.
    std::string lang;         ///< Code language.
    std::string meta;         ///< Rest of the code info string.
    std::string value;        ///< Text, code, html and inlineCode payload.
    std::string url;          ///< Link and image target.
    std::string title;
    std::optional<Position> position;
    NodeData data;
    std::vector<AstNode> children;

    bool isLeaf() const {
        return type == NodeType::Text || type == NodeType::Code ||
               type == NodeType::Html || type == NodeType::InlineCode ||
               type == NodeType::Image;
    }

    static AstNode MakeText(const std::string& value, const std::optional<Position>& position = std::nullopt);
};

/** @brief Depth-first visit of every node (pre-order). */
template <typename Visitor>
void VisitNodes(const AstNode& node, Visitor&& visitor) {
    visitor(node);
    for (const auto& child : node.children) {
        VisitNodes(child, visitor);
    }
}

} // namespace polyglot::domain
