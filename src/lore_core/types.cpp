#include "lore_core/types.hpp"

#include <algorithm>
#include <cctype>

namespace lore_core {

std::string make_chunk_id(const std::string& source, int chunk_index) {
  return source + "#" + std::to_string(chunk_index);
}

Chunk make_chunk(const std::string& source, int chunk_index, std::string content) {
  Chunk chunk;
  chunk.id = make_chunk_id(source, chunk_index);
  chunk.content = std::move(content);
  chunk.metadata.source = source;
  chunk.metadata.chunk_index = chunk_index;
  return chunk;
}

std::string to_string(FileType type) {
  switch (type) {
    case FileType::Text:
      return "Text";
    case FileType::Markdown:
      return "Markdown";
    case FileType::PDF:
      return "PDF";
    case FileType::Word:
      return "Word";
    default:
      return "Unknown";
  }
}

FileType file_type_from_string(const std::string& str) {
  if (str == "Text")
    return FileType::Text;
  if (str == "Markdown")
    return FileType::Markdown;
  if (str == "PDF")
    return FileType::PDF;
  if (str == "Word")
    return FileType::Word;
  return FileType::Unknown;
}

FileType file_type_from_path(const std::filesystem::path& path) {
  std::string extension = path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (extension == ".txt" || extension == ".text" || extension == ".log")
    return FileType::Text;
  if (extension == ".md" || extension == ".markdown")
    return FileType::Markdown;
  if (extension == ".pdf")
    return FileType::PDF;
  if (extension == ".doc" || extension == ".docx")
    return FileType::Word;
  return FileType::Unknown;
}

}  // namespace lore_core
