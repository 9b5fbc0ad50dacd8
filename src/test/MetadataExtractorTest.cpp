#undef NDEBUG
#include <cassert>
#include <iostream>

#include "domain/markdown/MetadataExtractor.hpp"

using namespace polyglot::domain;
using polyglot::domain::markdown::MetadataExtractor;

namespace {
const std::string ZWSP = "\xE2\x80\x8B";   // U+200B, bit 0
const std::string ZWNJ = "\xE2\x80\x8C";   // U+200C, bit 1

const std::string kManifest =
    "```yaml\n"
    "apiVersion: v1\n"
    "kind: Pod\n"
    "metadata:\n"
    "  name: web\n"
    "  namespace: staging\n"
    "```\n";
}

static void testSingleTargetDocuments() {
    std::cout << "[Test] One fence per target..." << std::endl;

    auto docker = MetadataExtractor::Extract("# App\n\n```dockerfile\nFROM alpine\n```\n");
    assert(docker.language == Language::Dockerfile);
    assert(docker.artifacts.size() == 1);
    assert(docker.artifacts[0].type == ArtifactType::Dockerfile);
    assert(docker.artifacts[0].content == "FROM alpine");
    assert(docker.artifacts[0].sourceLine == 3);

    auto terraform = MetadataExtractor::Extract("```terraform\nresource \"null_resource\" \"x\" {}\n```\n");
    assert(terraform.language == Language::Terraform);
    assert(terraform.artifacts.size() == 1);
    assert(terraform.artifacts[0].type == ArtifactType::Terraform);

    auto k8s = MetadataExtractor::Extract(kManifest);
    assert(k8s.language == Language::Kubernetes);
    assert(k8s.artifacts.size() == 1);
    assert(k8s.artifacts[0].type == ArtifactType::Kubernetes);
    assert(k8s.artifacts[0].kind == std::string("pod"));

    auto sql = MetadataExtractor::Extract("```sql\nSELECT 1;\n```\n");
    assert(sql.language == Language::Sql);
    assert(sql.artifacts.size() == 1);
    assert(sql.artifacts[0].kind == std::string("select"));
    assert(!docker.artifacts[0].kind);
    std::cout << "[PASS] Single targets." << std::endl;
}

static void testExecutableScripts() {
    std::cout << "[Test] Executable directive plus bash fence..." << std::endl;

    auto exec = MetadataExtractor::Extract("<!-- polyglot:executable -->\n```bash\necho hi\n```\n");
    assert(exec.language == Language::Executable);
    assert(exec.artifacts.size() == 1);
    assert(exec.artifacts[0].executable);
    assert(exec.artifacts[0].type == ArtifactType::Bash);

    // Without the directive a shell fence is just documentation.
    auto plain = MetadataExtractor::Extract("```bash\necho hi\n```\n");
    assert(plain.language == Language::None);
    assert(plain.artifacts.empty());
    assert(!MetadataExtractor::IsPolyglot("```bash\necho hi\n```\n"));
    std::cout << "[PASS] Executable scripts." << std::endl;
}

static void testFileBlocks() {
    std::cout << "[Test] file:<path> blocks..." << std::endl;
    auto git = MetadataExtractor::Extract(
        "```file:README.md\n# Hello\n```\n\n```file:src/main.py\nprint('x')\n```\n");
    assert(git.language == Language::Git);
    assert(git.artifacts.size() == 2);
    for (const auto& a : git.artifacts) assert(a.type == ArtifactType::File);
    assert(git.artifacts[0].location == std::string("README.md"));
    assert(git.artifacts[1].location == std::string("src/main.py"));

    // The path is everything after "file:", spaces included.
    auto spaced = MetadataExtractor::Extract("```file:My Notes/a.md\nx\n```\n");
    assert(spaced.language == Language::Git);
    assert(spaced.artifacts.size() == 1);
    assert(spaced.artifacts[0].type == ArtifactType::File);
    assert(spaced.artifacts[0].location == std::string("My Notes/a.md"));
    assert(spaced.artifacts[0].content == "x");
    std::cout << "[PASS] File blocks." << std::endl;
}

static void testPriority() {
    std::cout << "[Test] Priority among simultaneous matches..." << std::endl;
    auto mixed = MetadataExtractor::Extract(
        "```file:app.txt\nx\n```\n```sql\nSELECT 1;\n```\n" + kManifest + "```dockerfile\nFROM scratch\n```\n");
    assert(mixed.language == Language::Dockerfile);
    assert(mixed.artifacts.size() == 4);
    // Document order is kept.
    assert(mixed.artifacts[0].type == ArtifactType::File);
    assert(mixed.artifacts[1].type == ArtifactType::Sql);
    assert(mixed.artifacts[2].type == ArtifactType::Kubernetes);
    assert(mixed.artifacts[3].type == ArtifactType::Dockerfile);

    auto gitOverSql = MetadataExtractor::Extract("```sql\nSELECT 1;\n```\n```file:a\nb\n```\n");
    assert(gitOverSql.language == Language::Git);
    std::cout << "[PASS] Priority." << std::endl;
}

static void testDirectivesToMetadata() {
    std::cout << "[Test] Directive metadata..." << std::endl;
    auto typed = MetadataExtractor::Extract("<!-- polyglot:type=manifest -->\nText");
    assert(typed.metadata["type"] == "manifest");
    assert(typed.metadata["polyglot.type"] == "manifest");
    assert(typed.metadata.count("subtype") == 0);
    assert(typed.language == Language::None);

    auto pair = MetadataExtractor::Extract(
        "<!-- polyglot:type=dockerfile -->\n<!-- polyglot:subtype=multistage -->\n");
    assert(pair.metadata["type"] == "dockerfile");
    assert(pair.metadata["subtype"] == "multistage");

    auto image = MetadataExtractor::Extract("<!-- polyglot:image=web:2 -->\n");
    assert(image.metadata["image"] == "web:2");
    assert(image.metadata["polyglot.image"] == "web:2");
    assert(image.metadata.count("type") == 0);

    // A bare directive names the document only when nothing declared a type.
    auto bare = MetadataExtractor::Extract("<!-- polyglot:executable -->\n");
    assert(bare.metadata["type"] == "polyglot");
    assert(bare.metadata["subtype"] == "executable");
    assert(bare.metadata["polyglot.executable"] == "true");

    auto declared = MetadataExtractor::Extract(
        "<!-- polyglot:executable -->\n<!-- polyglot:type=script -->\n");
    assert(declared.metadata["type"] == "script");
    assert(declared.metadata.count("subtype") == 0);

    auto env = MetadataExtractor::Extract("<!-- polyglot:environment STAGE=dev REGION=\"eu west\" -->\n");
    assert(env.metadata["polyglot.environment"] == "true");
    assert(env.metadata["polyglot.environment.STAGE"] == "dev");
    assert(env.metadata["polyglot.environment.REGION"] == "eu west");

    auto json = MetadataExtractor::Extract("<!-- kyozo:{\"executable\": true, \"dependencies\": [\"db\", \"cache\"]} -->\n");
    assert(json.directives.size() == 1);
    assert(json.directives[0].name == "json");
    assert(json.metadata["kyozo.executable"] == "true");
    assert(json.metadata["kyozo.dependencies"] == "db,cache");
    std::cout << "[PASS] Directive metadata." << std::endl;
}

static void testHiddenPayload() {
    std::cout << "[Test] Zero-width payload..." << std::endl;
    // 'A' = 0x41 = 1000001
    const std::string text = "Hello" + ZWNJ + ZWSP + ZWSP + ZWSP + ZWSP + ZWSP + ZWNJ + " world";
    auto hidden = MetadataExtractor::Extract(text);
    assert(hidden.language == Language::None);
    assert(hidden.metadata["type"] == "hidden_data");
    assert(hidden.metadata["hidden.payload"] == "A");
    assert(hidden.metadata["hidden.count"] == "7");
    assert(MetadataExtractor::IsPolyglot(text));

    // A real target keeps its language; the payload is still recorded.
    auto both = MetadataExtractor::Extract("```dockerfile\nFROM alpine\n```\n" + ZWNJ);
    assert(both.language == Language::Dockerfile);
    assert(both.metadata.count("type") == 0);
    assert(both.metadata["hidden.encoding"] == "hidden_data");
    std::cout << "[PASS] Hidden payload." << std::endl;
}

static void testContentLinks() {
    std::cout << "[Test] Content-hash links..." << std::endl;
    const std::string hash = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
    auto links = MetadataExtractor::Extract("See [data](" + hash + ") and [site](https://example.com)\n");
    assert(links.contentLinks.size() == 1);
    assert(links.contentLinks[0].text == "data");
    assert(links.contentLinks[0].hash == hash);
    assert(links.contentLinks[0].line == 1);

    auto second = MetadataExtractor::Extract("intro\n\n[a [b](" + hash + ")\n");
    assert(second.contentLinks.size() == 1);
    assert(second.contentLinks[0].text == "a [b");
    assert(second.contentLinks[0].line == 3);
    std::cout << "[PASS] Content links." << std::endl;
}

static void testSqlOperation() {
    std::cout << "[Test] Leading SQL keyword..." << std::endl;
    assert(MetadataExtractor::SqlOperationOf("  CREATE TABLE t (id int);") == "create");
    assert(MetadataExtractor::SqlOperationOf("insert into t values (1);") == "insert");
    assert(MetadataExtractor::SqlOperationOf("Drop table t;") == "drop");
    assert(MetadataExtractor::SqlOperationOf("WITH x AS (SELECT 1) SELECT * FROM x;") == "unknown");
    assert(MetadataExtractor::SqlOperationOf("") == "unknown");
    assert(MetadataExtractor::SqlOperationOf("createx") == "unknown");

    auto unknownKind = MetadataExtractor::Extract(
        "```yaml\napiVersion: v1\nkind: [1, 2]\nmetadata:\n  name: x\n```\n");
    assert(unknownKind.language == Language::Kubernetes);
    assert(unknownKind.artifacts[0].kind == std::string("unknown"));
    std::cout << "[PASS] SQL operation." << std::endl;
}

static void testLongLines() {
    std::cout << "[Test] Long single-line documents..." << std::endl;
    auto minified = MetadataExtractor::Extract("```json\n[" + std::string(120000, '1') + "]\n```\n");
    assert(minified.language == Language::None);
    assert(minified.contentLinks.empty());

    auto unclosed = MetadataExtractor::Extract("# Notes\n[" + std::string(200000, 'a'));
    assert(unclosed.contentLinks.empty());
    assert(!MetadataExtractor::IsPolyglot("[" + std::string(100000, 'a')));
    std::cout << "[PASS] Long lines." << std::endl;
}

static void testIsPolyglot() {
    std::cout << "[Test] polyglot detection..." << std::endl;
    assert(MetadataExtractor::IsPolyglot("```dockerfile\nFROM alpine\n```"));
    assert(MetadataExtractor::IsPolyglot("```hcl\nvariable \"x\" {}\n```"));
    assert(MetadataExtractor::IsPolyglot(kManifest));
    assert(MetadataExtractor::IsPolyglot("<!-- polyglot:executable -->\n```sh\nls\n```"));
    assert(MetadataExtractor::IsPolyglot("```file:a.txt\nx\n```"));
    assert(MetadataExtractor::IsPolyglot("```sql\nSELECT 1;\n```"));
    assert(MetadataExtractor::IsPolyglot("<!-- polyglot:magic -->\nJust text"));

    assert(!MetadataExtractor::IsPolyglot("# Heading\n\n- one\n- two\n"));
    assert(!MetadataExtractor::IsPolyglot("```yaml\nname: not-a-manifest\n```"));
    assert(!MetadataExtractor::IsPolyglot("<!-- an ordinary comment -->"));
    std::cout << "[PASS] polyglot detection." << std::endl;
}

int main() {
    std::cout << "[Test] Starting MetadataExtractor Test..." << std::endl;
    testSingleTargetDocuments();
    testExecutableScripts();
    testFileBlocks();
    testPriority();
    testDirectivesToMetadata();
    testHiddenPayload();
    testSqlOperation();
    testContentLinks();
    testLongLines();
    testIsPolyglot();
    std::cout << "[PASS] MetadataExtractor Test." << std::endl;
    return 0;
}
