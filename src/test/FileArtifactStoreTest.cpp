#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

#include "infrastructure/FileArtifactStore.hpp"

using namespace tariffharvest;
namespace fs = std::filesystem;

namespace {

fs::path FreshDir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("tariffharvest_store_" + name);
    fs::remove_all(dir);
    return dir;
}

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

size_t CountFiles(const fs::path& dir) {
    size_t count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file()) ++count;
    }
    return count;
}

}

static void TestNamingAndCreation() {
    auto dir = FreshDir("naming") / "nested";
    infrastructure::FileArtifactStore store(dir);
    assert(fs::is_directory(dir));
    assert(store.pathFor(42) == dir / "Tariff_42.xml");
    assert(store.locationOf(42) == (dir / "Tariff_42.xml").string());
    assert(!store.exists(42));
    fs::remove_all(dir.parent_path());
}

static void TestWriteIsExactAndLeavesNoTemp() {
    auto dir = FreshDir("write");
    infrastructure::FileArtifactStore store(dir);
    const std::string bytes("<Tariff>\r\n\0\xff</Tariff>", 21);

    store.write(7, bytes);
    assert(store.exists(7));
    assert(ReadFile(store.pathFor(7)) == bytes);
    assert(CountFiles(dir) == 1);

    store.write(7, "<Tariff/>");
    assert(ReadFile(store.pathFor(7)) == "<Tariff/>");
    assert(CountFiles(dir) == 1);
    fs::remove_all(dir);
}

static void TestSweepRemovesOnlyLeftovers() {
    auto dir = FreshDir("sweep");
    infrastructure::FileArtifactStore store(dir);
    store.write(1, "<Tariff/>");
    std::ofstream(dir / "Tariff_2.xml.123.456.tmp") << "partial";
    std::ofstream(dir / "Tariff_3.xml.9.9.tmp") << "partial";
    std::ofstream(dir / "notes.tmp") << "unrelated";

    assert(store.sweepTemporaries() == 2);
    assert(store.exists(1));
    assert(!store.exists(2));
    assert(fs::exists(dir / "notes.tmp"));
    assert(store.sweepTemporaries() == 0);
    fs::remove_all(dir);
}

static void TestConcurrentWritersOfSameIdentifier() {
    auto dir = FreshDir("concurrent");
    infrastructure::FileArtifactStore store(dir);
    const std::string a(4096, 'a');
    const std::string b(8192, 'b');

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&store, &a, &b, i]() {
            for (int n = 0; n < 20; ++n) {
                store.write(99, (i % 2) ? a : b);
            }
        });
    }
    for (auto& t : threads) t.join();

    std::string content = ReadFile(store.pathFor(99));
    assert(content == a || content == b);
    assert(CountFiles(dir) == 1);
    fs::remove_all(dir);
}

int main() {
    std::cout << "[Test] Starting File Artifact Store Test..." << std::endl;
    TestNamingAndCreation();
    TestWriteIsExactAndLeavesNoTemp();
    TestSweepRemovesOnlyLeftovers();
    TestConcurrentWritersOfSameIdentifier();
    std::cout << "[PASS] File Artifact Store Test." << std::endl;
    return 0;
}
