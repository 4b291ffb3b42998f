#include <cerrno>
#include <iterator>
#include <cstring>
#include <system_error>
#include "local_storage.hpp"

namespace marshal {

    std::string load_from_file(const std::filesystem::path &filename) {
        std::ifstream ifs(filename, std::ios::in | std::ios::binary);
        if (!ifs.is_open()) {
            throw StorageError("couldn't open file " + filename.string() + ": " + std::strerror(errno));
        }

        std::string content((std::istreambuf_iterator<char>(ifs)),
                            (std::istreambuf_iterator<char>()));
        if (ifs.bad()) {
            throw StorageError("couldn't read file " + filename.string());
        }
        return content;
    }

    void dump_to_file(const std::filesystem::path &filename, const std::string &content) {
        if (filename.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(filename.parent_path(), ec);
            if (ec) {
                throw StorageError("couldn't create directory " + filename.parent_path().string() + ": " +
                                   ec.message());
            }
        }

        std::ofstream ofs(filename, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw StorageError("couldn't open file " + filename.string() + " for writing: " + std::strerror(errno));
        }
        ofs << content;
        ofs.close();
        if (ofs.fail()) {
            throw StorageError("couldn't write file " + filename.string());
        }
    }
}
