#include "domain/AstNode.hpp"

namespace polyglot::domain {

const char* NodeTypeToString(NodeType type) {
    switch (type) {
        case NodeType::Root: return "root";
        case NodeType::Heading: return "heading";
        case NodeType::Paragraph: return "paragraph";
        case NodeType::Code: return "code";
        case NodeType::Html: return "html";
        case NodeType::List: return "list";
        case NodeType::ListItem: return "listItem";
        case NodeType::Text: return "text";
        case NodeType::Emphasis: return "emphasis";
        case NodeType::Strong: return "strong";
        case NodeType::Link: return "link";
        case NodeType::Image: return "image";
        case NodeType::InlineCode: return "inlineCode";
    }
    return "text";
}

AstNode AstNode::MakeText(const std::string& value, const std::optional<Position>& position) {
    AstNode node;
    node.type = NodeType::Text;
    node.value = value;
    node.position = position;
    return node;
}

} // namespace polyglot::domain
