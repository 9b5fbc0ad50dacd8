#include "domain/markdown/AstBuilder.hpp"
#include <sstream>

namespace polyglot::domain::markdown {

namespace {
    Position LinePosition(int startLine, int endLine, const std::string& lastLine) {
        Position pos;
        pos.start = {startLine, 1};
        pos.end = {endLine, static_cast<int>(lastLine.size()) + 1};
        return pos;
    }

    std::string Join(const std::vector<std::string>& lines) {
        std::ostringstream out;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) out << '\n';
            out << lines[i];
        }
        return out.str();
    }

    AstNode MakeParagraph(const std::string& text, const Position& pos) {
        AstNode paragraph;
        paragraph.type = NodeType::Paragraph;
        paragraph.position = pos;
        paragraph.children.push_back(AstNode::MakeText(text, pos));
        return paragraph;
    }
}

AstNode AstBuilder::Build(const TokenList& tokens) {
    AstNode root;
    root.type = NodeType::Root;

    size_t i = 0;
    const size_t n = tokens.size();

    while (i < n) {
        const Token& tok = tokens[i];

        switch (tok.type) {
            case TokenType::Heading: {
                AstNode heading;
                heading.type = NodeType::Heading;
                heading.depth = tok.depth;
                heading.position = LinePosition(tok.line, tok.line, tok.text);
                heading.children.push_back(AstNode::MakeText(tok.text, heading.position));
                root.children.push_back(std::move(heading));
                ++i;
                break;
            }

            case TokenType::CodeFenceStart: {
                AstNode code;
                code.type = NodeType::Code;
                code.lang = tok.lang;
                if (tok.info.size() > tok.lang.size()) {
                    code.meta = tok.info.substr(tok.lang.size());
                    code.meta.erase(0, code.meta.find_first_not_of(" \t"));
                }
                std::vector<std::string> lines;
                int endLine = tok.line;
                std::string lastLine = tok.text;
                ++i;
                while (i < n && tokens[i].type == TokenType::CodeContent) {
                    lines.push_back(tokens[i].text);
                    endLine = tokens[i].line;
                    lastLine = tokens[i].text;
                    ++i;
                }
                if (i < n && tokens[i].type == TokenType::CodeFenceEnd) {
                    endLine = tokens[i].line;
                    lastLine = tokens[i].text;
                    ++i;
                }
                code.value = Join(lines);
                code.position = LinePosition(tok.line, endLine, lastLine);
                root.children.push_back(std::move(code));
                break;
            }

            case TokenType::HtmlComment: {
                AstNode html;
                html.type = NodeType::Html;
                html.value = tok.text;
                html.position = LinePosition(tok.line, tok.line, tok.text);
                root.children.push_back(std::move(html));
                ++i;
                break;
            }

            case TokenType::HtmlCommentStart: {
                std::vector<std::string> lines{tok.text};
                int endLine = tok.line;
                std::string lastLine = tok.text;
                ++i;
                while (i < n && (tokens[i].type == TokenType::HtmlCommentContent ||
                                 tokens[i].type == TokenType::HtmlCommentEnd)) {
                    const bool isEnd = tokens[i].type == TokenType::HtmlCommentEnd;
                    lines.push_back(tokens[i].text);
                    endLine = tokens[i].line;
                    lastLine = tokens[i].text;
                    ++i;
                    if (isEnd) break;
                }
                AstNode html;
                html.type = NodeType::Html;
                html.value = Join(lines);
                html.position = LinePosition(tok.line, endLine, lastLine);
                root.children.push_back(std::move(html));
                break;
            }

            case TokenType::Text: {
                std::vector<std::string> lines;
                int endLine = tok.line;
                std::string lastLine;
                while (i < n && tokens[i].type == TokenType::Text) {
                    lines.push_back(tokens[i].text);
                    endLine = tokens[i].line;
                    lastLine = tokens[i].text;
                    ++i;
                }
                root.children.push_back(MakeParagraph(Join(lines), LinePosition(tok.line, endLine, lastLine)));
                break;
            }

            case TokenType::ListItem: {
                AstNode list;
                list.type = NodeType::List;
                list.ordered = tok.ordered;
                int endLine = tok.line;
                std::string lastLine;
                while (i < n && tokens[i].type == TokenType::ListItem && tokens[i].ordered == tok.ordered) {
                    const Token& itemTok = tokens[i];
                    const Position pos = LinePosition(itemTok.line, itemTok.line, itemTok.text);
                    AstNode item;
                    item.type = NodeType::ListItem;
                    item.position = pos;
                    item.children.push_back(MakeParagraph(itemTok.text, pos));
                    list.children.push_back(std::move(item));
                    endLine = itemTok.line;
                    lastLine = itemTok.text;
                    ++i;
                }
                list.position = LinePosition(tok.line, endLine, lastLine);
                root.children.push_back(std::move(list));
                break;
            }

            // Stray tokens (a fence end or comment tail without an opener) carry no block.
            case TokenType::Blank:
            case TokenType::CodeFenceEnd:
            case TokenType::CodeContent:
            case TokenType::HtmlCommentContent:
            case TokenType::HtmlCommentEnd:
                ++i;
                break;
        }
    }

    if (!tokens.empty()) {
        Position pos;
        pos.start = {1, 1};
        pos.end = {tokens.back().line, static_cast<int>(tokens.back().text.size()) + 1};
        root.position = pos;
    }
    return root;
}

} // namespace polyglot::domain::markdown
