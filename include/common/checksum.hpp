#pragma once

#include <string>

// SHA-256 of a local file as lowercase hex. Throws std::runtime_error when the
// file cannot be read or the digest fails.
std::string sha256File(const std::string& filePath);

bool isSha256Hex(const std::string& value);
