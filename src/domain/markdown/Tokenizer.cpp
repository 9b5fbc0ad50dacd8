#include "domain/markdown/Tokenizer.hpp"
#include "domain/markdown/TextUtils.hpp"
#include <cctype>

namespace polyglot::domain::markdown {

namespace {
    enum class State { None, CodeBlock, HtmlComment };

    bool ParseHeading(const std::string& line, int& depthOut, std::string& textOut) {
        int depth = 0;
        while (depth < static_cast<int>(line.size()) && line[depth] == '#') ++depth;
        if (depth == 0 || depth > 6) return false;
        if (depth == static_cast<int>(line.size())) {
            depthOut = depth;
            textOut.clear();
            return true;
        }
        if (line[depth] != ' ' && line[depth] != '\t') return false;
        depthOut = depth;
        textOut = Trim(line.substr(depth));
        return true;
    }

    bool ParseListItem(const std::string& line, bool& orderedOut, std::string& textOut) {
        const auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos) return false;
        const std::string body = line.substr(first);

        if (body.size() >= 2 && (body[0] == '-' || body[0] == '*' || body[0] == '+') &&
            (body[1] == ' ' || body[1] == '\t')) {
            orderedOut = false;
            textOut = Trim(body.substr(2));
            return true;
        }

        std::string::size_type i = 0;
        while (i < body.size() && std::isdigit(static_cast<unsigned char>(body[i]))) ++i;
        if (i == 0 || i > 9 || i + 1 >= body.size()) return false;
        if ((body[i] == '.' || body[i] == ')') && (body[i + 1] == ' ' || body[i + 1] == '\t')) {
            orderedOut = true;
            textOut = Trim(body.substr(i + 2));
            return true;
        }
        return false;
    }
}

TokenList Tokenizer::Tokenize(const std::string& text) {
    TokenList tokens;
    State state = State::None;
    const auto lines = SplitLines(text);

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        Token token;
        token.line = static_cast<int>(i) + 1;
        token.text = line;

        if (state == State::CodeBlock) {
            if (IsClosingFence(line)) {
                token.type = TokenType::CodeFenceEnd;
                state = State::None;
            } else {
                token.type = TokenType::CodeContent;
            }
            tokens.push_back(std::move(token));
            continue;
        }

        if (state == State::HtmlComment) {
            if (line.find("-->") != std::string::npos) {
                token.type = TokenType::HtmlCommentEnd;
                state = State::None;
            } else {
                token.type = TokenType::HtmlCommentContent;
            }
            tokens.push_back(std::move(token));
            continue;
        }

        std::string lang, info, body;
        int depth = 0;
        bool ordered = false;

        if (ParseOpeningFence(line, lang, info)) {
            token.type = TokenType::CodeFenceStart;
            token.lang = lang;
            token.info = info;
            state = State::CodeBlock;
        } else if (StartsWith(Trim(line), "<!--")) {
            const auto open = line.find("<!--");
            if (line.find("-->", open + 4) != std::string::npos) {
                token.type = TokenType::HtmlComment;
            } else {
                token.type = TokenType::HtmlCommentStart;
                state = State::HtmlComment;
            }
        } else if (ParseHeading(line, depth, body)) {
            token.type = TokenType::Heading;
            token.depth = depth;
            token.text = body;
        } else if (Trim(line).empty()) {
            token.type = TokenType::Blank;
            token.text.clear();
        } else if (ParseListItem(line, ordered, body)) {
            token.type = TokenType::ListItem;
            token.ordered = ordered;
            token.text = body;
        } else {
            token.type = TokenType::Text;
        }
        tokens.push_back(std::move(token));
    }

    return tokens;
}

} // namespace polyglot::domain::markdown
