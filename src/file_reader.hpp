#pragma once
/*
 * FileReader
 *
 * Purpose: read a whole file via mmap into one string; normalize CRLF and lone CR to LF.
 * Usage: mmap_read_text(path, out, msg); returns false with msg on failure.
 */
#include <string>
#include <filesystem>

bool mmap_read_text(const std::filesystem::path& path,
                    std::string& out,
                    std::string& msg);
