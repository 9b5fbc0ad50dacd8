#undef NDEBUG
#include <cassert>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>

#include "application/execution/DockerExecutor.hpp"
#include "application/execution/Executors.hpp"
#include "application/execution/GitExecutor.hpp"
#include "application/execution/KubernetesExecutor.hpp"
#include "application/execution/ShellExecutor.hpp"
#include "application/execution/SqlExecutor.hpp"
#include "application/execution/TerraformExecutor.hpp"
#include "domain/markdown/MetadataExtractor.hpp"

namespace fs = std::filesystem;
using namespace polyglot::domain;
using namespace polyglot::application::execution;
using polyglot::domain::markdown::MetadataExtractor;

// Scripted runner: a fixed set of installed tools and a handler per call.
class FakeProcessRunner : public ProcessRunner {
public:
    std::set<std::string> tools;
    std::function<ProcessOutcome(const ProcessRequest&)> handler;
    std::vector<ProcessRequest> requests;

    std::optional<std::string> findExecutable(const std::string& tool) override {
        if (tools.count(tool)) return "/usr/bin/" + tool;
        return std::nullopt;
    }

    ProcessOutcome run(const ProcessRequest& request) override {
        requests.push_back(request);
        if (!handler) return completed(0, "");
        return handler(request);
    }

    static ProcessOutcome completed(int code, const std::string& output) {
        ProcessOutcome o;
        o.kind = ProcessOutcome::Kind::Completed;
        o.exitCode = code;
        o.output = output;
        return o;
    }
};

static const fs::path kRoot = "test_workspace_root";

static PolyglotDocument makeDocument(const std::string& text) {
    const auto extraction = MetadataExtractor::Extract(text);
    PolyglotDocument doc;
    doc.source = text;
    doc.language = extraction.language;
    doc.artifacts = extraction.artifacts;
    doc.metadata = extraction.metadata;
    doc.directives = extraction.directives;
    return doc;
}

static ExecutionSettings makeSettings() {
    ExecutionSettings settings;
    settings.workspaceRoot = kRoot;
    settings.timeout = std::chrono::milliseconds(5000);
    return settings;
}

static bool workspacesCleaned() {
    return fs::exists(kRoot) && fs::is_empty(kRoot);
}

static std::string readFile(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static const std::string kDockerDoc = "```dockerfile\nFROM alpine\n```\n";

static void testDockerMockWhenAbsent() {
    std::cout << "[Test] Docker without docker installed..." << std::endl;
    FakeProcessRunner runner;
    auto settings = makeSettings();
    const auto result = DockerExecutor(runner, settings).execute(makeDocument(kDockerDoc));
    assert(result.ok);
    assert(result.details["mock"] == true);
    assert(result.details["image"] == "polyglot:latest");
    assert(result.details.contains("built_at"));
    assert(runner.requests.empty());
    assert(workspacesCleaned());
    std::cout << "[PASS] Docker mock." << std::endl;
}

static void testDockerBuild() {
    std::cout << "[Test] Docker build success and failure shapes..." << std::endl;
    FakeProcessRunner runner;
    runner.tools = {"docker"};
    std::string seenDockerfile;
    runner.handler = [&seenDockerfile](const ProcessRequest& req) {
        assert(req.argv[0] == "docker");
        assert(req.argv[1] == "build");
        assert(req.argv[2] == "-f");
        seenDockerfile = readFile(req.argv[3]);
        assert(req.argv[4] == "-t");
        assert(req.argv[5] == "polyglot:latest");
        assert(req.argv[6] == ".");
        return FakeProcessRunner::completed(0, "Successfully built");
    };
    auto settings = makeSettings();
    auto ok = DockerExecutor(runner, settings).execute(makeDocument(kDockerDoc));
    assert(ok.ok);
    assert(ok.executor == "docker");
    assert(seenDockerfile == "FROM alpine\n");
    assert(ok.details["output"] == "Successfully built");
    assert(!ok.details.contains("mock"));
    assert(workspacesCleaned());

    runner.handler = [](const ProcessRequest&) { return FakeProcessRunner::completed(1, "step failed"); };
    auto failed = DockerExecutor(runner, settings).execute(makeDocument(kDockerDoc));
    assert(!failed.ok);
    assert(failed.details["code"] == 1);
    assert(failed.details["output"] == "step failed");
    assert(workspacesCleaned());

    runner.handler = [](const ProcessRequest&) {
        ProcessOutcome o;
        o.kind = ProcessOutcome::Kind::LaunchFailed;
        o.error = "failed to start docker: Permission denied";
        return o;
    };
    auto launch = DockerExecutor(runner, settings).execute(makeDocument(kDockerDoc));
    assert(!launch.ok);
    assert(launch.details["code"] == -1);
    assert(launch.details["output"] == "failed to start docker: Permission denied");

    runner.handler = [](const ProcessRequest&) {
        ProcessOutcome o;
        o.kind = ProcessOutcome::Kind::TimedOut;
        o.output = "partial";
        return o;
    };
    auto timeout = DockerExecutor(runner, settings).execute(makeDocument(kDockerDoc));
    assert(!timeout.ok);
    assert(timeout.details["reason"] == "timeout");
    assert(workspacesCleaned());

    runner.handler = [](const ProcessRequest&) -> ProcessOutcome { throw std::runtime_error("runner exploded"); };
    auto thrown = DockerExecutor(runner, settings).execute(makeDocument(kDockerDoc));
    assert(!thrown.ok);
    assert(thrown.details["code"] == -1);
    assert(thrown.details["output"] == "runner exploded");
    assert(workspacesCleaned());
    std::cout << "[PASS] Docker shapes." << std::endl;
}

static void testTranspileFailureIsAValue() {
    std::cout << "[Test] Executor on a document without its artifact..." << std::endl;
    FakeProcessRunner runner;
    auto settings = makeSettings();
    const auto result = DockerExecutor(runner, settings).execute(makeDocument("# nothing\n"));
    assert(!result.ok);
    assert(result.details["error"] == "no_dockerfile_found");
    std::cout << "[PASS] Transpile failure." << std::endl;
}

static void testTerraform() {
    std::cout << "[Test] Terraform init + plan..." << std::endl;
    const std::string doc =
        "<!-- polyglot:terraform_vars region=eu -->\n```terraform\nvariable \"region\" {}\n```\n";
    auto settings = makeSettings();

    FakeProcessRunner absent;
    auto mock = TerraformExecutor(absent, settings).execute(makeDocument(doc));
    assert(mock.ok);
    assert(mock.details["plan"] == "Terraform not installed - would execute: terraform plan");
    assert(mock.details["workspace"] == "mock");

    FakeProcessRunner runner;
    runner.tools = {"terraform"};
    runner.handler = [](const ProcessRequest& req) {
        assert(fs::exists(fs::path(req.workingDirectory) / "main.tf"));
        return FakeProcessRunner::completed(0, req.argv[1] == "plan" ? "Plan: 1 to add" : "initialized");
    };
    auto ok = TerraformExecutor(runner, settings).execute(makeDocument(doc));
    assert(ok.ok);
    assert(runner.requests.size() == 2);
    assert(runner.requests[0].argv[1] == "init");
    const auto& plan = runner.requests[1].argv;
    assert(plan[1] == "plan");
    assert(std::find(plan.begin(), plan.end(), "region=eu") != plan.end());
    assert(ok.details["plan"] == "Plan: 1 to add");
    assert(ok.details["next_step"] == "terraform apply");
    assert(ok.details["workspace_removed"] == true);
    assert(!fs::exists(ok.details["workspace"].get<std::string>()));
    assert(!ok.details.contains("directory"));
    assert(workspacesCleaned());

    runner.requests.clear();
    runner.handler = [](const ProcessRequest&) { return FakeProcessRunner::completed(1, "no provider"); };
    auto failed = TerraformExecutor(runner, settings).execute(makeDocument(doc));
    assert(!failed.ok);
    assert(failed.details["stage"] == "init");
    assert(runner.requests.size() == 1);
    std::cout << "[PASS] Terraform." << std::endl;
}

static void testKubernetesPartialFailure() {
    std::cout << "[Test] Kubernetes with one failing manifest..." << std::endl;
    const std::string doc =
        "```yaml\napiVersion: v1\nkind: ConfigMap\nmetadata:\n  name: a\n```\n"
        "```yaml\napiVersion: v1\nkind: ConfigMap\nmetadata:\n  name: b\n```\n"
        "```yaml\napiVersion: v1\nkind: ConfigMap\nmetadata:\n  name: c\n```\n";
    auto settings = makeSettings();

    FakeProcessRunner runner;
    runner.tools = {"kubectl"};
    runner.handler = [](const ProcessRequest& req) {
        assert(req.standardInput.has_value());
        if (req.standardInput->find("name: b") != std::string::npos) {
            return FakeProcessRunner::completed(1, "error: invalid");
        }
        return FakeProcessRunner::completed(0, "configmap created");
    };
    const auto result = KubernetesExecutor(runner, settings).execute(makeDocument(doc));
    assert(result.ok);
    assert(result.details["applied"] == 2);
    assert(result.details["failed"] == 1);
    assert(result.details["results"].size() == 3);
    assert(result.details["results"][1]["ok"] == false);
    assert(result.details["results"][1]["code"] == 1);
    assert(runner.requests.size() == 3);
    assert(runner.requests[0].argv == std::vector<std::string>({"kubectl", "apply", "-f", "-"}));

    FakeProcessRunner absent;
    const auto mock = KubernetesExecutor(absent, settings).execute(makeDocument(doc));
    assert(mock.ok);
    assert(mock.details["mock"] == true);
    assert(mock.details["applied"] == 3);
    assert(workspacesCleaned());
    std::cout << "[PASS] Kubernetes." << std::endl;
}

static void testSqlPartialFailure() {
    std::cout << "[Test] SQL with failing statements..." << std::endl;
    const std::string doc = "```sql\nCREATE TABLE t (id int);\nINSERT INTO missing VALUES (1);\nDROP TABLE nope;\n```\n";
    auto settings = makeSettings();

    FakeProcessRunner runner;
    runner.tools = {"psql"};
    runner.handler = [](const ProcessRequest& req) {
        assert(req.argv[0] == "psql");
        assert(req.argv[6] == "polyglot_db");
        if (req.standardInput->rfind("CREATE", 0) == 0) return FakeProcessRunner::completed(0, "");
        return FakeProcessRunner::completed(3, "ERROR: relation does not exist");
    };
    const auto result = SqlExecutor(runner, settings).execute(makeDocument(doc));
    assert(result.ok);
    assert(result.details["executed"] == 3);
    assert(result.details["applied"] == 1);
    assert(result.details["failed"] == 2);
    assert(result.details["results"][2]["statement"] == "DROP TABLE nope;");

    FakeProcessRunner absent;
    const auto mock = SqlExecutor(absent, settings).execute(makeDocument(doc));
    assert(mock.ok);
    assert(mock.details["mock"] == true);
    assert(mock.details["failed"] == 0);
    assert(workspacesCleaned());
    std::cout << "[PASS] SQL." << std::endl;
}

static void testGitRepository() {
    std::cout << "[Test] Git repository materialization..." << std::endl;
    const std::string doc =
        "```file:README.md\n# Hi\n```\n"
        "```file:src/app.py\nprint(1)\n```\n"
        "```file:../escape.txt\nnope\n```\n";
    auto settings = makeSettings();

    FakeProcessRunner runner;
    runner.tools = {"git", "sh"};
    runner.handler = [](const ProcessRequest& req) {
        assert(req.argv[0] == "sh");
        assert(req.argv[1] == "-c");
        const fs::path ws = req.workingDirectory;
        assert(readFile(ws / "README.md") == "# Hi\n");
        assert(fs::exists(ws / "src" / "app.py"));
        assert(!fs::exists(ws.parent_path() / "escape.txt"));
        if (req.argv[2].rfind("git commit", 0) == 0) return FakeProcessRunner::completed(128, "fatal: no identity");
        return FakeProcessRunner::completed(0, "ok");
    };
    const auto result = GitExecutor(runner, settings).execute(makeDocument(doc));
    assert(result.ok);
    assert(result.details["files_created"] == 2);
    assert(result.details["skipped_files"].size() == 1);
    assert(result.details["skipped_files"][0] == "../escape.txt");
    assert(result.details["applied"] == 2);
    assert(result.details["failed"] == 1);
    assert(result.details["git_output"][2]["code"] == 128);
    assert(result.details["workspace_removed"] == true);
    assert(!fs::exists(result.details["repository"].get<std::string>()));
    assert(workspacesCleaned());

    FakeProcessRunner absent;
    const auto mock = GitExecutor(absent, settings).execute(makeDocument(doc));
    assert(mock.ok);
    assert(mock.details["mock"] == true);
    assert(mock.details["git_output"].size() == 3);
    std::cout << "[PASS] Git." << std::endl;
}

static void testShell() {
    std::cout << "[Test] Shell script execution..." << std::endl;
    const std::string doc =
        "<!-- polyglot:executable -->\n<!-- polyglot:environment GREETING=hello -->\n```bash\necho $GREETING\n```\n";
    auto settings = makeSettings();

    FakeProcessRunner runner;
    runner.tools = {"bash", "sh"};
    runner.handler = [](const ProcessRequest& req) {
        assert(req.environment.at("GREETING") == "hello");
        assert(req.argv[2] == "echo $GREETING");
        return FakeProcessRunner::completed(0, "hello\n");
    };
    const auto ok = ShellExecutor(runner, settings).execute(makeDocument(doc));
    assert(ok.ok);
    assert(ok.details["output"] == "hello\n");
    assert(ok.details["exit_code"] == 0);
    assert(runner.requests[0].argv[0] == "bash");

    FakeProcessRunner shOnly;
    shOnly.tools = {"sh"};
    shOnly.handler = [](const ProcessRequest&) { return FakeProcessRunner::completed(2, "syntax error"); };
    const auto failed = ShellExecutor(shOnly, settings).execute(makeDocument(doc));
    assert(!failed.ok);
    assert(shOnly.requests[0].argv[0] == "sh");
    assert(failed.details["exit_code"] == 2);

    FakeProcessRunner none;
    const auto mock = ShellExecutor(none, settings).execute(makeDocument(doc));
    assert(mock.ok);
    assert(mock.details["mock"] == true);
    assert(workspacesCleaned());
    std::cout << "[PASS] Shell." << std::endl;
}

static void testDispatch() {
    std::cout << "[Test] Language routing..." << std::endl;
    FakeProcessRunner runner;
    auto settings = makeSettings();

    const auto noop = ExecuteDocument(makeDocument("# Just docs\n"), runner, settings);
    assert(noop.ok);
    assert(noop.executor == "noop");
    assert(noop.details["message"] == "documentation only");

    const auto docker = ExecuteDocument(makeDocument(kDockerDoc), runner, settings);
    assert(docker.executor == "docker");
    assert(docker.details["mock"] == true);
    assert(runner.requests.empty());
    std::cout << "[PASS] Routing." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Executors Test..." << std::endl;
    fs::remove_all(kRoot);
    fs::create_directories(kRoot);

    testDockerMockWhenAbsent();
    testDockerBuild();
    testTranspileFailureIsAValue();
    testTerraform();
    testKubernetesPartialFailure();
    testSqlPartialFailure();
    testGitRepository();
    testShell();
    testDispatch();

    fs::remove_all(kRoot);
    std::cout << "[PASS] Executors Test." << std::endl;
    return 0;
}
