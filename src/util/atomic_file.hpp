#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sealnode::util {

// Writes `data` to a sibling temp file, fsyncs it and renames it over `path`.
// Readers observe either the previous contents or the new ones, never a mix.
bool AtomicWriteFileBytes(const std::filesystem::path& path,
                          std::span<const std::uint8_t> data,
                          std::string* error = nullptr);
bool AtomicWriteFileText(const std::filesystem::path& path, std::string_view text,
                         std::string* error = nullptr);

// Returns false with an empty error when the file does not exist.
bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>* out,
                   std::string* error = nullptr);

}  // namespace sealnode::util
