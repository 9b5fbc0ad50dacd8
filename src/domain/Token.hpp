/**
 * @file Token.hpp
 * @brief Line-oriented token produced by the Markdown tokenizer.
 */

#pragma once
#include <string>
#include <vector>

namespace polyglot::domain {

/**
 * @enum TokenType
 * @brief Kinds of lines recognized by the tokenizer.
 */
enum class TokenType {
    Heading,            ///< "# text" .. "###### text".
    CodeFenceStart,     ///< Opening ``` line (lang holds the info tag).
    CodeFenceEnd,       ///< Closing ``` line.
    CodeContent,        ///< Any line inside a fenced block.
    HtmlComment,        ///< Comment opened and closed on the same line.
    HtmlCommentStart,   ///< "<!--" without a closing "-->".
    HtmlCommentContent, ///< Line inside a multi-line comment.
    HtmlCommentEnd,     ///< Line containing the closing "-->".
    ListItem,           ///< "- item", "* item", "1. item".
    Text,               ///< Anything else.
    Blank               ///< Whitespace-only line.
};

/**
 * @struct Token
 * @brief A single token. Only the fields relevant to its type are filled.
 */
struct Token {
    TokenType type = TokenType::Text;
    int line = 0;          ///< 1-based source line.
    int depth = 0;         ///< Heading depth.
    bool ordered = false;  ///< List item numbering.
    std::string lang;      ///< Fence tag (first word of the info string).
    std::string info;      ///< Full fence info string.
    std::string text;      ///< Line payload.
};

using TokenList = std::vector<Token>;

inline const char* TokenTypeToString(TokenType type) {
    switch (type) {
        case TokenType::Heading: return "heading";
        case TokenType::CodeFenceStart: return "code_fence_start";
        case TokenType::CodeFenceEnd: return "code_fence_end";
        case TokenType::CodeContent: return "code_content";
        case TokenType::HtmlComment: return "html_comment";
        case TokenType::HtmlCommentStart: return "html_comment_start";
        case TokenType::HtmlCommentContent: return "html_comment_content";
        case TokenType::HtmlCommentEnd: return "html_comment_end";
        case TokenType::ListItem: return "list_item";
        case TokenType::Text: return "text";
        case TokenType::Blank: return "blank";
    }
    return "text";
}

} // namespace polyglot::domain
