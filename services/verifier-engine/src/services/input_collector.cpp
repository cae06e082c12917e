/**
 * @file input_collector.cpp
 * @brief Input file discovery implementation
 */

#include "input_collector.h"
#include "exception/exceptions.h"
#include <everify/utils/file_utils.h>
#include <everify/utils/string_utils.h>

#include <algorithm>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace services {

namespace {

const char* SUPPORTED_EXTENSIONS[] = { ".txt", ".text", ".csv" };

} // anonymous namespace

bool InputCollector::hasSupportedExtension(const std::string& filename) {
    for (const char* ext : SUPPORTED_EXTENSIONS) {
        if (everify::utils::endsWithIgnoreCase(filename, ext)) {
            return true;
        }
    }
    return false;
}

std::vector<InputFile> InputCollector::collect(const std::string& inputPath) {
    std::error_code ec;
    fs::path root(inputPath);

    if (inputPath.empty() || !fs::exists(root, ec)) {
        throw common::InputException("input path not found: " + inputPath);
    }

    std::vector<InputFile> files;

    if (!fs::is_directory(root, ec)) {
        files.push_back({ root.string(), root.filename().string() });
        spdlog::debug("[InputCollector] Single input file: {}", root.string());
        return files;
    }

    fs::directory_iterator it(root, ec);
    if (ec) {
        throw common::InputException("cannot list directory " + inputPath + ": " + ec.message());
    }

    for (const auto& entry : it) {
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc)) {
            continue;
        }
        std::string name = entry.path().filename().string();
        if (!hasSupportedExtension(name)) {
            spdlog::debug("[InputCollector] Skipping {}", name);
            continue;
        }
        files.push_back({ entry.path().string(), name });
    }

    std::sort(files.begin(), files.end(),
              [](const InputFile& a, const InputFile& b) { return a.name < b.name; });

    spdlog::info("[InputCollector] {} input file(s) in {}", files.size(), inputPath);
    return files;
}

std::string InputCollector::readFile(const InputFile& file) {
    try {
        return everify::utils::readFileContent(file.path);
    } catch (const std::runtime_error& e) {
        throw common::InputException(e.what());
    }
}

} // namespace services
