#pragma once

/**
 * @file input_collector.h
 * @brief Input file discovery for a verification run
 *
 * A single file is used whatever its extension. A directory is scanned
 * non-recursively for .txt, .text and .csv files (case-insensitive),
 * sorted by name.
 */

#include <string>
#include <vector>

namespace services {

struct InputFile {
    std::string path;   ///< Full path
    std::string name;   ///< Basename, used as sourceFile
};

class InputCollector {
public:
    /**
     * @brief Resolve the input path to the list of files to read
     * @throws common::InputException if the path does not exist or cannot be listed
     */
    static std::vector<InputFile> collect(const std::string& inputPath);

    /**
     * @brief Read a whole input file
     * @throws common::InputException if the file cannot be read
     */
    static std::string readFile(const InputFile& file);

    /**
     * @brief True for .txt, .text and .csv (any case)
     */
    static bool hasSupportedExtension(const std::string& filename);
};

} // namespace services
