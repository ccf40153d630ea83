#include "lore_core/extractors/markdown_extractor.hpp"

#include <regex>

namespace lore_core {

bool MarkdownExtractor::can_handle(const fs::path& file_path) const {
  return file_type_from_path(file_path) == FileType::Markdown;
}

ExtractionResult MarkdownExtractor::extract(const fs::path& file_path) const {
  std::string content = get_string_content(file_path);
  ensure_valid_utf8(content, file_path);

  ExtractionResult result;
  result.content_hash = compute_hash_from_content(content);
  result.file_type = FileType::Markdown;
  result.text = strip_markup_noise(content);
  return result;
}

std::string MarkdownExtractor::strip_markup_noise(const std::string& content) {
  if (content.empty()) {
    return content;
  }

  std::string text = content;

  // Front matter is only recognised at the very start of the document
  const std::regex front_matter_regex(R"(^---[ \t]*\r?\n[\s\S]*?\r?\n---[ \t]*(\r?\n|$))");
  std::smatch match;
  if (std::regex_search(text, match, front_matter_regex) && match.position(0) == 0) {
    text.erase(0, static_cast<size_t>(match.length(0)));
  }

  const std::regex comment_regex(R"(<!--[\s\S]*?-->)");
  text = std::regex_replace(text, comment_regex, "");

  // Drop leading blank lines left behind by the removals
  const auto first = text.find_first_not_of("\r\n");
  if (first == std::string::npos) {
    return "";
  }
  return text.substr(first);
}

}  // namespace lore_core
