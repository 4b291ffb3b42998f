#pragma once

#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace marshal {
    class StorageError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * Reads the whole file into memory.
     * @throws StorageError naming the file if it cannot be opened or read.
     */
    std::string load_from_file(const std::filesystem::path &filename);

    /**
     * Replaces the file's content, creating missing parent directories first.
     * @throws StorageError naming the file if it cannot be written.
     */
    void dump_to_file(const std::filesystem::path &filename, const std::string &content);
}
