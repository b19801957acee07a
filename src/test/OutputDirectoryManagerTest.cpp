#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "infrastructure/OutputDirectoryManager.hpp"

using systemviz::infrastructure::OutputDirectoryManager;
namespace fs = std::filesystem;

namespace {

size_t CountEntries(const fs::path& dir) {
    size_t count = 0;
    for (auto it = fs::recursive_directory_iterator(dir); it != fs::recursive_directory_iterator(); ++it) {
        ++count;
    }
    return count;
}

} // namespace

int main() {
    std::cout << "[Test] Starting OutputDirectoryManager Test..." << std::endl;

    const fs::path testRoot = fs::absolute("test_output_root");
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    {
        assert(OutputDirectoryManager::RunNameFromDataset("data/utopia.json") == "images_utopia");
        assert(OutputDirectoryManager::RunNameFromDataset("/tmp/us_9r.sqlite") == "images_us_9r");
        assert(OutputDirectoryManager::RunNameFromDataset("") == "images_model");
        std::cout << "[PASS] Run names." << std::endl;
    }

    // Fresh tree, then a second call wipes what the first run left behind.
    {
        fs::path runDir = OutputDirectoryManager::Prepare(testRoot, "images_mini");
        assert(runDir == testRoot / "images_mini");
        assert(fs::is_directory(runDir / "commodities"));
        assert(fs::is_directory(runDir / "processes"));
        assert(fs::is_directory(runDir / "results"));
        assert(CountEntries(runDir) == 3);

        { std::ofstream f(runDir / "simple_model.dot"); f << "digraph {}"; }
        { std::ofstream f(runDir / "results" / "stale.svg"); f << "<svg/>"; }
        fs::create_directories(runDir / "leftover" / "deep");
        assert(CountEntries(runDir) == 7);

        fs::path again = OutputDirectoryManager::Prepare(testRoot, "images_mini");
        assert(again == runDir);
        assert(CountEntries(runDir) == 3);
        assert(!fs::exists(runDir / "simple_model.dot"));
        std::cout << "[PASS] Prepare is idempotent." << std::endl;
    }

    // Siblings of the run directory are left alone.
    {
        fs::create_directories(testRoot / "images_other");
        OutputDirectoryManager::Prepare(testRoot, "images_mini");
        assert(fs::is_directory(testRoot / "images_other"));
        std::cout << "[PASS] Only the run directory is replaced." << std::endl;
    }

    {
        bool threw = false;
        try {
            OutputDirectoryManager::Prepare("relative/root", "images_mini");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            OutputDirectoryManager::Prepare(testRoot, "../escape");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            OutputDirectoryManager::Prepare(testRoot, "");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] Invalid roots and run names are rejected." << std::endl;
    }

    fs::remove_all(testRoot);
    std::cout << "[Test] All OutputDirectoryManager tests passed." << std::endl;
    return 0;
}
