#undef NDEBUG
#include <cassert>
#include <iostream>

#include "domain/markdown/MetadataExtractor.hpp"
#include "domain/transpile/Transpilers.hpp"
#include "application/execution/Executors.hpp"

using namespace polyglot::domain;
using namespace polyglot::domain::transpile;
using polyglot::domain::markdown::MetadataExtractor;
namespace exec = polyglot::application::execution;

static TranspileResult transpile(Target target, const std::string& doc) {
    const auto extraction = MetadataExtractor::Extract(doc);
    return Transpilers::Transpile(target, extraction.artifacts, extraction.metadata);
}

static void testDocker() {
    std::cout << "[Test] Docker transpiler..." << std::endl;
    auto result = ::transpile(Target::Docker, "```dockerfile\nFROM alpine\n```\n```dockerfile\nFROM debian\n```\n");
    const auto* docker = result.as<DockerConfig>();
    assert(docker);
    assert(docker->dockerfile == "FROM alpine\n");
    assert(docker->imageTag == "polyglot:latest");
    assert(docker->buildCommand == "docker build -t polyglot:latest .");

    auto tagged = ::transpile(Target::Docker, "<!-- polyglot:image=shop/api:2.1 -->\n```dockerfile\nFROM alpine\n```\n");
    assert(tagged.as<DockerConfig>()->imageTag == "shop/api:2.1");

    auto missing = ::transpile(Target::Docker, "# Nothing here\n");
    assert(!missing.ok());
    assert(missing.error->code == "no_dockerfile_found");
    std::cout << "[PASS] Docker." << std::endl;
}

static void testTerraform() {
    std::cout << "[Test] Terraform transpiler..." << std::endl;
    auto result = ::transpile(Target::Terraform,
        "<!-- polyglot:terraform_vars region=eu-west-1 size=small -->\n"
        "```terraform\nvariable \"region\" {}\n```\n"
        "```hcl\nvariable \"size\" {}\n```\n");
    const auto* tf = result.as<TerraformConfig>();
    assert(tf);
    assert(tf->configuration == "variable \"region\" {}\n\nvariable \"size\" {}\n");
    assert(tf->variables.size() == 2);
    assert(tf->variables.at("region") == "eu-west-1");
    assert(tf->planCommand == "terraform plan");

    assert(::transpile(Target::Terraform, "text").error->code == "no_terraform_found");
    std::cout << "[PASS] Terraform." << std::endl;
}

static void testKubernetes() {
    std::cout << "[Test] Kubernetes transpiler..." << std::endl;
    auto result = ::transpile(Target::Kubernetes,
        "```yaml\napiVersion: v1\nkind: Namespace\nmetadata:\n  name: shop\n  namespace: shop\n```\n"
        "```yml\napiVersion: apps/v1\nkind: Deployment\nmetadata:\n  name: api\n```\n");
    const auto* k8s = result.as<KubernetesConfig>();
    assert(k8s);
    assert(k8s->manifests.size() == 2);
    assert(k8s->namespaceName == "shop");
    assert(k8s->applyCommand == "kubectl apply -f -");

    auto defaulted = ::transpile(Target::Kubernetes, "```yaml\napiVersion: v1\nkind: Pod\n```\n");
    assert(defaulted.as<KubernetesConfig>()->namespaceName == "default");

    assert(::transpile(Target::Kubernetes, "text").error->code == "no_manifests_found");
    std::cout << "[PASS] Kubernetes." << std::endl;
}

static void testGit() {
    std::cout << "[Test] Git transpiler..." << std::endl;
    auto result = ::transpile(Target::Git, "```file:README.md\n# Hi\n```\n```file:src/app.py\nprint(1)\n```\n");
    const auto* git = result.as<GitConfig>();
    assert(git);
    assert(git->files.size() == 2);
    assert(git->files.at("README.md") == "# Hi\n");
    assert(git->initCommands.size() == 3);
    assert(git->initCommands[0] == "git init");
    assert(git->initCommands[1] == "git add .");
    assert(git->initCommands[2] == "git commit -m 'Initial commit from polyglot markdown'");

    auto custom = ::transpile(Target::Git, "<!-- polyglot:commit_message=\"it's done\" -->\n```file:a\nb\n```\n");
    assert(custom.as<GitConfig>()->initCommands[2] == "git commit -m 'it'\\''s done'");

    assert(::transpile(Target::Git, "text").error->code == "no_files_found");
    std::cout << "[PASS] Git." << std::endl;
}

static void testBash() {
    std::cout << "[Test] Bash transpiler..." << std::endl;
    auto result = ::transpile(Target::Bash,
        "<!-- polyglot:executable -->\n"
        "<!-- polyglot:environment STAGE=dev -->\n"
        "<!-- kyozo:environment STAGE=old TOKEN=x -->\n"
        "```bash\necho one\n```\n```sh\necho two\n```\n");
    const auto* bash = result.as<BashConfig>();
    assert(bash);
    assert(bash->script == "echo one\n\necho two");
    assert(bash->shebang == "#!/bin/bash");
    assert(bash->environment.at("STAGE") == "dev");
    assert(bash->environment.at("TOKEN") == "x");

    assert(::transpile(Target::Bash, "```bash\necho no directive\n```").error->code == "no_executable_found");
    std::cout << "[PASS] Bash." << std::endl;
}

static void testSql() {
    std::cout << "[Test] SQL transpiler..." << std::endl;
    auto result = ::transpile(Target::Sql,
        "<!-- polyglot:database=shop -->\n"
        "```sql\n"
        "CREATE TABLE t (v text); -- trailing; comment\n"
        "INSERT INTO t VALUES ('a;b');\n"
        "/* block; comment */\n"
        ";\n"
        "```\n");
    const auto* sql = result.as<SqlConfig>();
    assert(sql);
    assert(sql->statements.size() == 2);
    assert(sql->statements[0] == "CREATE TABLE t (v text);");
    assert(sql->statements[1] == "INSERT INTO t VALUES ('a;b');");
    assert(sql->database == "shop");
    assert(sql->client == "psql");

    assert(::transpile(Target::Sql, "text").error->code == "no_sql_found");
    std::cout << "[PASS] SQL." << std::endl;
}

static void testLookupsAreTotal() {
    std::cout << "[Test] Target and executor lookups..." << std::endl;
    for (Target target : kAllTargets) {
        assert(TargetFromString(TargetToString(target)) == target);
        // Every target answers with a config or a typed error, never a fallback.
        const auto r = Transpilers::Transpile(target, {}, {});
        assert(!r.ok() && r.error && !r.error->code.empty());
    }
    assert(!TargetFromString("ansible").has_value());

    for (Language language : kAllLanguages) {
        const auto kind = exec::ExecutorKindFor(language);
        const auto target = TargetForLanguage(language);
        if (language == Language::None) {
            assert(kind == exec::ExecutorKind::Noop);
            assert(!target.has_value());
        } else {
            assert(kind != exec::ExecutorKind::Noop);
            assert(target.has_value());
        }
        assert(LanguageFromString(LanguageToString(language)) == language);
    }
    std::cout << "[PASS] Lookups." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Transpilers Test..." << std::endl;
    testDocker();
    testTerraform();
    testKubernetes();
    testGit();
    testBash();
    testSql();
    testLookupsAreTotal();
    assert(Transpilers::ShellQuote("") == "''");
    std::cout << "[PASS] Transpilers Test." << std::endl;
    return 0;
}
