#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace x1memo::util {

// Replaces |path| with |contents| by writing a sibling temp file and renaming
// it over the target, so readers never observe a partially written file.
// Missing parent directories are created.
bool AtomicWriteText(const std::filesystem::path& path, std::string_view contents,
                     std::string* error = nullptr);

// Reads the whole file. Returns false when it cannot be opened or read.
bool ReadTextFile(const std::filesystem::path& path, std::string* contents,
                  std::string* error = nullptr);

}  // namespace x1memo::util
