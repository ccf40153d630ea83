#include "lore_core/chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <iterator>

#include "lore_core/errors.hpp"

namespace lore_core {

namespace {

// Byte offset of every code point start, plus a final entry equal to text.size().
std::vector<size_t> code_point_offsets(const std::string& text) {
  std::vector<size_t> offsets;
  offsets.reserve(text.size() + 1);
  for (auto it = text.begin(); it != text.end(); utf8::next(it, text.end())) {
    offsets.push_back(static_cast<size_t>(it - text.begin()));
  }
  offsets.push_back(text.size());
  return offsets;
}

}  // namespace

Chunker::Chunker(int chunk_size, int overlap) : chunk_size_(chunk_size), overlap_(overlap) {
  validate(chunk_size_, overlap_);
}

void Chunker::validate(int chunk_size, int overlap) {
  if (chunk_size <= 0) {
    throw InvalidConfiguration("chunk_size must be greater than 0, got " +
                               std::to_string(chunk_size));
  }
  if (overlap < 0) {
    throw InvalidConfiguration("chunk_overlap cannot be negative, got " +
                               std::to_string(overlap));
  }
  if (overlap >= chunk_size) {
    throw InvalidConfiguration("chunk_overlap (" + std::to_string(overlap) +
                               ") must be smaller than chunk_size (" +
                               std::to_string(chunk_size) + ")");
  }
}

std::vector<std::string> Chunker::split(const std::string& text) const {
  std::vector<std::string> out;
  if (text.empty()) {
    return out;
  }

  std::string clean;
  const std::string* source = &text;
  if (!utf8::is_valid(text.begin(), text.end())) {
    utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(clean));
    source = &clean;
  }

  const std::vector<size_t> offsets = code_point_offsets(*source);
  const size_t length = offsets.size() - 1;
  const size_t size = static_cast<size_t>(chunk_size_);
  const size_t overlap = static_cast<size_t>(overlap_);

  size_t start = 0;
  while (start < length) {
    size_t end = std::min(start + size, length);
    out.emplace_back(source->substr(offsets[start], offsets[end] - offsets[start]));
    if (end == length) {
      break;
    }
    if (end - overlap <= start) {
      throw InvalidConfiguration("Chunking made no forward progress at offset " +
                                 std::to_string(start));
    }
    start = end - overlap;
  }
  return out;
}

std::vector<Chunk> Chunker::to_chunks(const std::string& source, const std::string& text) const {
  std::vector<std::string> segments = split(text);
  std::vector<Chunk> chunks;
  chunks.reserve(segments.size());
  for (size_t i = 0; i < segments.size(); ++i) {
    chunks.push_back(make_chunk(source, static_cast<int>(i), std::move(segments[i])));
  }
  return chunks;
}

std::vector<std::string> Chunker::chunk(const std::string& text, int chunk_size, int overlap) {
  return Chunker(chunk_size, overlap).split(text);
}

}  // namespace lore_core
