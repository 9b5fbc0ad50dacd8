#include "app/PolyglotApp.hpp"

#include "domain/transpile/Target.hpp"
#include "infrastructure/FileContentProvider.hpp"
#include "infrastructure/FileResultSink.hpp"
#include "infrastructure/HttpContentProvider.hpp"
#include "infrastructure/HttpResultSink.hpp"
#include "infrastructure/JsonSerializer.hpp"
#include "infrastructure/PosixProcessRunner.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <sstream>

namespace polyglot::app {

namespace tp = domain::transpile;
using infrastructure::JsonSerializer;

namespace {

constexpr int kExitFailedResult = 1;
constexpr int kExitUsage = 2;

const char* USAGE =
    "Usage: %s [--config <settings.json>] <command> [args]\n"
    "\n"
    "Commands (<input> is a file path or '-' for stdin):\n"
    "  classify <input>             language, artifacts and metadata as JSON\n"
    "  ast <input>                  annotated mdast tree as JSON\n"
    "  sanitize <input>             document with hidden content removed\n"
    "  check <input>                exit 0 if the document is polyglot\n"
    "  transpile <target> <input>   target: docker|terraform|kubernetes|git|bash|sql\n"
    "  execute <input>              run the document through its executor\n"
    "  process <id>                 fetch by id, execute, store the result\n";

struct option long_options[] = {
    {"config", required_argument, nullptr, 'c'},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
};

bool readInput(const std::string& source, std::string& out) {
    std::stringstream buffer;
    if (source == "-") {
        buffer << std::cin.rdbuf();
        out = buffer.str();
        return true;
    }
    std::ifstream file(source, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[PolyglotApp] Cannot read " << source << std::endl;
        return false;
    }
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

void printJson(std::ostream& out, const nlohmann::json& j) {
    out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

// Routes std::cout elsewhere for its lifetime.
class StreamRedirect {
public:
    StreamRedirect(std::ostream& stream, std::streambuf* target)
        : m_stream(stream), m_saved(stream.rdbuf(target)) {}
    ~StreamRedirect() { m_stream.rdbuf(m_saved); }

    StreamRedirect(const StreamRedirect&) = delete;
    StreamRedirect& operator=(const StreamRedirect&) = delete;

private:
    std::ostream& m_stream;
    std::streambuf* m_saved;
};

} // namespace

void PolyglotApp::Init(const std::string& configPath) {
    m_config = configPath.empty() ? infrastructure::ConfigLoader::LoadDefault()
                                  : infrastructure::ConfigLoader::Load(configPath);

    application::execution::ExecutionSettings settings;
    settings.workspaceRoot = m_config.workspaceRoot;
    settings.timeout = m_config.processTimeout;
    settings.transpile.imageTag = m_config.dockerImageTag;
    settings.transpile.database = m_config.sqlDatabase;
    settings.transpile.sqlClient = m_config.sqlClient;
    settings.dockerBuildContext = m_config.dockerBuildContext;

    m_services.processRunner = std::make_shared<infrastructure::PosixProcessRunner>();
    m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();

    if (!m_config.remoteHost.empty()) {
        std::cout << "[PolyglotApp] Using remote store " << m_config.remoteHost << ":" << m_config.remotePort << std::endl;
        m_services.contentProvider = std::make_shared<infrastructure::HttpContentProvider>(m_config.remoteHost, m_config.remotePort);
        m_services.resultSink = std::make_shared<infrastructure::HttpResultSink>(m_config.remoteHost, m_config.remotePort);
    } else {
        m_services.contentProvider = std::make_shared<infrastructure::FileContentProvider>(m_config.documentsRoot);
        m_services.resultSink = std::make_shared<infrastructure::FileResultSink>(m_config.resultsRoot, m_services.persistenceService);
    }

    m_services.polyglotService = std::make_unique<application::PolyglotService>(
        m_services.processRunner, settings, m_services.contentProvider, m_services.resultSink);
}

void PolyglotApp::Shutdown() {
    if (m_services.persistenceService) {
        m_services.persistenceService->stop();
    }
}

int PolyglotApp::Run(int argc, char** argv) {
    std::string configPath;
    int opt;
    int opt_idx;

    while ((opt = getopt_long(argc, argv, "+c:h", long_options, &opt_idx)) != -1) {
        switch (opt) {
        case 'c':
            configPath = optarg;
            break;
        case 'h':
            std::printf(USAGE, argv[0]);
            return EXIT_SUCCESS;
        default:
            std::fprintf(stderr, USAGE, argv[0]);
            return kExitUsage;
        }
    }

    if (optind >= argc) {
        std::fprintf(stderr, USAGE, argv[0]);
        return kExitUsage;
    }

    const std::string command = argv[optind++];
    std::vector<std::string> args(argv + optind, argv + argc);

    // Progress lines go to stderr; stdout carries only the command result.
    std::ostream out(std::cout.rdbuf());
    m_out = &out;
    StreamRedirect redirect(std::cout, std::cerr.rdbuf());

    int code = kExitFailedResult;
    try {
        Init(configPath);
        code = dispatch(command, args);
    } catch (const std::exception& e) {
        std::cerr << "[PolyglotApp] " << command << " failed: " << e.what() << std::endl;
    }
    Shutdown();
    out.flush();
    return code;
}

int PolyglotApp::dispatch(const std::string& command, const std::vector<std::string>& args) {
    auto& service = *m_services.polyglotService;

    if (command == "transpile") {
        return runTranspile(args);
    }

    if (args.size() != 1) {
        std::cerr << "[PolyglotApp] '" << command << "' takes exactly one argument" << std::endl;
        return kExitUsage;
    }

    if (command == "process") {
        const auto result = service.ProcessDocument(args[0]);
        printJson(*m_out, result.toJson());
        return result.ok ? EXIT_SUCCESS : kExitFailedResult;
    }

    std::string text;
    if (command != "classify" && command != "ast" && command != "sanitize" &&
        command != "check" && command != "execute") {
        std::cerr << "[PolyglotApp] Unknown command: " << command << std::endl;
        return kExitUsage;
    }
    if (!readInput(args[0], text)) return kExitUsage;

    if (command == "sanitize") {
        *m_out << service.Sanitize(text);
        return EXIT_SUCCESS;
    }

    if (command == "check") {
        const bool polyglot = service.IsPolyglot(text);
        printJson(*m_out, {{"polyglot", polyglot}});
        return polyglot ? EXIT_SUCCESS : kExitFailedResult;
    }

    const auto document = service.Parse(text);

    if (command == "classify") {
        auto j = JsonSerializer::DocumentToJson(document);
        j["polyglot"] = service.IsPolyglot(text);
        printJson(*m_out, j);
        return EXIT_SUCCESS;
    }

    if (command == "ast") {
        printJson(*m_out, JsonSerializer::AstToJson(document.ast));
        return EXIT_SUCCESS;
    }

    const auto result = service.Execute(document);
    printJson(*m_out, result.toJson());
    return result.ok ? EXIT_SUCCESS : kExitFailedResult;
}

int PolyglotApp::runTranspile(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "[PolyglotApp] usage: transpile <target> <input>" << std::endl;
        return kExitUsage;
    }

    const auto target = tp::TargetFromString(args[0]);
    if (!target) {
        std::cerr << "[PolyglotApp] Unknown target: " << args[0] << std::endl;
        return kExitUsage;
    }

    std::string text;
    if (!readInput(args[1], text)) return kExitUsage;

    auto& service = *m_services.polyglotService;
    const auto result = service.Transpile(service.Parse(text), *target);
    printJson(*m_out, JsonSerializer::TranspileResultToJson(result));
    return result.ok() ? EXIT_SUCCESS : kExitFailedResult;
}

} // namespace polyglot::app
