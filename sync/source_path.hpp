#pragma once

// ============================================================
// source_path.hpp -- rsync source/destination path pair
//
//   /a/b/  or /a/b/*   contents of /a/b into /a/b/
//   /a/b   (directory) /a/b itself into /a
//   /a/b   (file)      /a/b onto /a/b
// ============================================================

#include <string>
#include <stdexcept>

struct TransferPaths {
    std::string source;        // argument given to rsync on the source host
    std::string dest;          // path on every destination host
    bool        contents_mode; // source ended in "/" or "/*"
};

// Normalises a user supplied path (trimmed, made absolute against the
// current directory, lexically normalised) and derives the destination.
// Throws std::runtime_error if the path is not an existing file or
// directory, or a contents-mode path is not a directory.
TransferPaths resolve_transfer_paths(const std::string& user_path);
