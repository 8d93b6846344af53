// ============================================================
// source_path.cpp
// ============================================================

#include "source_path.hpp"
#include "../common/utils.hpp"
#include <filesystem>

namespace fs = std::filesystem;

// Absolute, lexically normal, no trailing separator (except for "/")
static std::string normalise(const std::string& p) {
    std::string s = fs::absolute(fs::path(p)).lexically_normal().string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

static std::string with_slash(const std::string& dir) {
    return dir == "/" ? dir : dir + "/";
}

TransferPaths resolve_transfer_paths(const std::string& user_path) {
    std::string p = utils::trim(user_path);
    if (!utils::validate_path(p)) {
        throw std::runtime_error("source path is empty");
    }

    bool contents = false;
    if (utils::ends_with(p, "/*")) {
        p.resize(p.size() - 1);
        contents = true;
    } else if (utils::ends_with(p, "/")) {
        contents = true;
    }

    std::string base = normalise(p);
    std::error_code ec;

    if (contents) {
        if (!fs::is_directory(base, ec)) {
            throw std::runtime_error(base + " is not a directory");
        }
        std::string dir = with_slash(base);
        return TransferPaths{dir, dir, true};
    }

    if (fs::is_directory(base, ec)) {
        return TransferPaths{base, fs::path(base).parent_path().string(), false};
    }
    if (fs::is_regular_file(base, ec)) {
        return TransferPaths{base, base, false};
    }
    throw std::runtime_error("source path is not a file or directory: " + base);
}
