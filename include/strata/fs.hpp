#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace strata::fs {

bool exists(const std::filesystem::path& p);
void ensure_dir(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
std::string read_text(const std::filesystem::path& p);

// Sibling path unique to this process/call, for write-then-rename.
std::filesystem::path temp_sibling(const std::filesystem::path& p);

// Write to a temp sibling, flush, then rename over `p`.
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
void write_text_atomic(const std::filesystem::path& p, std::string_view text);

// rm -rf that also clears read-only directory modes on the way down.
void remove_tree(const std::filesystem::path& p);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

} // namespace strata::fs
