#undef NDEBUG
#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "infrastructure/FileContentProvider.hpp"
#include "infrastructure/FileResultSink.hpp"
#include "infrastructure/HttpContentProvider.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace fs = std::filesystem;
using namespace polyglot::infrastructure;
using polyglot::domain::ExecutionResult;

static std::string readFile(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void testConcurrentWrites(const fs::path& root) {
    std::cout << "[Test] Concurrent saves from many threads..." << std::endl;
    PersistenceService persistence;

    const int kThreads = 8;
    const int kPerThread = 25;
    std::atomic<int> succeeded{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&persistence, &succeeded, &root, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                const auto file = root / ("t" + std::to_string(t)) / ("r" + std::to_string(i) + ".txt");
                const bool queued = persistence.saveTextAsync(file.string(), "payload " + std::to_string(t * 1000 + i),
                    [&succeeded](bool ok) { if (ok) succeeded++; });
                assert(queued);
            }
        });
    }
    for (auto& th : threads) th.join();

    persistence.flush();
    assert(succeeded == kThreads * kPerThread);
    for (int t = 0; t < kThreads; ++t) {
        for (int i = 0; i < kPerThread; ++i) {
            const auto file = root / ("t" + std::to_string(t)) / ("r" + std::to_string(i) + ".txt");
            assert(readFile(file) == "payload " + std::to_string(t * 1000 + i));
        }
    }

    // Same file rewritten repeatedly: the last queued content wins, no temp files remain.
    const auto shared = root / "shared.txt";
    for (int i = 0; i < 20; ++i) persistence.saveTextAsync(shared.string(), "version " + std::to_string(i));
    persistence.flush();
    assert(readFile(shared) == "version 19");
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        assert(entry.path().extension() != ".tmp");
    }

    persistence.stop();
    assert(!persistence.saveTextAsync((root / "late.txt").string(), "too late"));
    std::cout << "[PASS] Concurrent saves." << std::endl;
}

static void testFileResultSink(const fs::path& root) {
    std::cout << "[Test] FileResultSink writes <id>.json..." << std::endl;
    auto persistence = std::make_shared<PersistenceService>();
    FileResultSink sink((root / "results").string(), persistence);

    auto result = ExecutionResult::Success("docker", {{"image", "web:2"}, {"id", "site/web"}});
    assert(sink.storeResult("site/web", result));
    assert(!sink.storeResult("../escape", result));
    assert(!sink.storeResult("/etc/passwd", result));
    persistence->flush();

    const auto stored = nlohmann::json::parse(readFile(root / "results" / "site" / "web.json"));
    assert(stored["ok"] == true);
    assert(stored["executor"] == "docker");
    assert(stored["image"] == "web:2");
    assert(!fs::exists(root / "escape.json"));

    persistence->stop();
    assert(!sink.storeResult("after-stop", result));
    std::cout << "[PASS] FileResultSink." << std::endl;
}

static void testFileContentProvider(const fs::path& root) {
    std::cout << "[Test] FileContentProvider resolves ids..." << std::endl;
    const auto docs = root / "documents";
    fs::create_directories(docs / "guides");
    std::ofstream(docs / "plain") << "exact";
    std::ofstream(docs / "guides" / "setup.md") << "# Setup\n";

    FileContentProvider provider(docs.string());
    assert(provider.getDocument("plain") == std::optional<std::string>("exact"));
    assert(provider.getDocument("guides/setup") == std::optional<std::string>("# Setup\n"));
    assert(!provider.getDocument("missing").has_value());
    assert(!provider.getDocument("../documents/plain").has_value());
    assert(!provider.getDocument("").has_value());

    assert(HttpContentProvider::EncodePathSegment("guides/set up?") == "guides/set%20up%3F");
    std::cout << "[PASS] FileContentProvider." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Persistence Service Test..." << std::endl;
    const fs::path root = fs::absolute("persistence_test_root");
    fs::remove_all(root);
    fs::create_directories(root);

    testConcurrentWrites(root);
    testFileResultSink(root);
    testFileContentProvider(root);

    fs::remove_all(root);
    std::cout << "[PASS] Persistence Service Test." << std::endl;
    return 0;
}
