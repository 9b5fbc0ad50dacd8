#undef NDEBUG
#include <cassert>
#include <iostream>

#include "domain/markdown/AstBuilder.hpp"
#include "domain/markdown/AstEnhancer.hpp"
#include "domain/markdown/MetadataExtractor.hpp"
#include "domain/markdown/Tokenizer.hpp"

using namespace polyglot::domain;
using namespace polyglot::domain::markdown;

static size_t countNodes(const AstNode& root) {
    size_t count = 0;
    VisitNodes(root, [&count](const AstNode&) { ++count; });
    return count;
}

int main() {
    std::cout << "[Test] Starting AstEnhancer Test..." << std::endl;

    const std::string doc =
        "# Deploy\n"
        "<!-- polyglot:executable -->\n"
        "```bash\n"
        "echo deploying\n"
        "```\n"
        "\n"
        "```python\n"
        "print('untouched')\n"
        "```\n";

    const AstNode plain = AstBuilder::Build(Tokenizer::Tokenize(doc));
    const AstNode enhanced = AstEnhancer::Enhance(plain, MetadataExtractor::Extract(doc));

    // Shape is preserved; only data is attached.
    assert(countNodes(plain) == countNodes(enhanced));
    assert(enhanced.children.size() == plain.children.size());

    const AstNode& script = enhanced.children[2];
    assert(script.type == NodeType::Code);
    assert(script.data.kyozo.has_value());
    assert(script.data.kyozo->executable);
    assert(script.data.kyozo->executor == "bash");
    assert(script.data.kyozo->metadata.at("executable") == "true");

    const AstNode& python = enhanced.children[3];
    assert(python.type == NodeType::Code);
    assert(!python.data.kyozo.has_value());
    std::cout << "[PASS] Executable block annotated." << std::endl;

    // File blocks get their path and routing target.
    const std::string files = "```file:config/app.yaml\nport: 80\n```\n";
    const AstNode fileAst = AstEnhancer::Enhance(AstBuilder::Build(Tokenizer::Tokenize(files)),
                                                 MetadataExtractor::Extract(files));
    const AstNode& fileNode = fileAst.children[0];
    assert(fileNode.data.attributes.at("path") == "config/app.yaml");
    assert(fileNode.data.kyozo->executor == "git");
    std::cout << "[PASS] File block annotated." << std::endl;

    // kyozo JSON directives fill the structured fields.
    const std::string json =
        "<!-- kyozo:{\"enlighten\": true, \"dependencies\": [\"db\", \"cache\"], \"executor\": \"sql\"} -->\n"
        "```sql\n"
        "SELECT 1;\n"
        "```\n";
    const AstNode jsonAst = AstEnhancer::Enhance(AstBuilder::Build(Tokenizer::Tokenize(json)),
                                                 MetadataExtractor::Extract(json));
    const auto& data = *jsonAst.children[1].data.kyozo;
    assert(data.enlightened);
    assert(data.executor == "sql");
    assert(data.dependencies.size() == 2);
    assert(data.dependencies[0] == "db");
    std::cout << "[PASS] JSON directive annotated." << std::endl;

    // A paragraph between the directive and the fence breaks the association.
    const std::string detached = "<!-- polyglot:hidden -->\nintervening text\n```text\nx\n```\n";
    const AstNode detachedAst = AstEnhancer::Enhance(AstBuilder::Build(Tokenizer::Tokenize(detached)),
                                                     MetadataExtractor::Extract(detached));
    assert(!detachedAst.children[2].data.kyozo.has_value());
    std::cout << "[PASS] Detached directive ignored." << std::endl;

    // Zero-width characters inside code mark it hidden.
    const std::string stego = "```text\nvisible\xE2\x80\x8C\n```\n";
    const AstNode stegoAst = AstEnhancer::Enhance(AstBuilder::Build(Tokenizer::Tokenize(stego)),
                                                  MetadataExtractor::Extract(stego));
    assert(stegoAst.children[0].data.kyozo->hidden);

    std::cout << "[PASS] AstEnhancer Test." << std::endl;
    return 0;
}
