#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace audit_gate::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_images(const fs::path& input_dir,
                                      const std::string& patterns = "*.jpg;*.jpeg;*.png;*.webp;*.bmp;*.tif;*.tiff");
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// MIME type from file extension, "application/octet-stream" when unknown
std::string guess_mime_type(const fs::path& path);

// Hash / encoding utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string encode_base64(const std::vector<uint8_t>& data);

// String utilities
std::string to_lower(const std::string& s);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string replace_all(std::string str, const std::string& from, const std::string& to);

// Glob pattern matching
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace audit_gate::core
