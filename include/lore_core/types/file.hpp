#pragma once

#include <filesystem>
#include <string>

namespace lore_core {

enum class FileType { Text, Markdown, PDF, Word, Unknown };

std::string to_string(FileType type);
FileType file_type_from_string(const std::string& str);

// Classification by extension only; the content is never inspected.
FileType file_type_from_path(const std::filesystem::path& path);

}  // namespace lore_core
