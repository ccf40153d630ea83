#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace lore_core {

class LoreError : public std::exception {
 public:
  explicit LoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Chunking parameters or other settings are malformed. Never retried.
class InvalidConfiguration : public LoreError {
 public:
  using LoreError::LoreError;
};

class UnsupportedFormat : public LoreError {
 public:
  using LoreError::LoreError;
};

class ExtractionFailed : public LoreError {
 public:
  using LoreError::LoreError;
};

class DimensionMismatch : public LoreError {
 public:
  DimensionMismatch(size_t expected, size_t actual)
      : LoreError("Embedding dimension mismatch. Expected " + std::to_string(expected) +
                  ", got " + std::to_string(actual)),
        expected_(expected),
        actual_(actual) {}

  size_t expected() const {
    return expected_;
  }
  size_t actual() const {
    return actual_;
  }

 private:
  size_t expected_;
  size_t actual_;
};

// Duplicate chunk ids, rejected entries and snapshot I/O failures
class StoreError : public LoreError {
 public:
  using LoreError::LoreError;
};

/**
 * @brief Base class for every failure reported by an embedding or generation provider.
 */
class ProviderFailure : public LoreError {
 public:
  using LoreError::LoreError;
};

// Connection refused, DNS failure, timeout, or rate limiting that outlived the retry budget.
class ProviderUnavailable : public ProviderFailure {
 public:
  using ProviderFailure::ProviderFailure;
};

// The provider answered, but the answer is unusable (bad status, missing fields, bad JSON).
class ProviderError : public ProviderFailure {
 public:
  using ProviderFailure::ProviderFailure;
};

class RateLimited : public ProviderFailure {
 public:
  explicit RateLimited(const std::string &message,
                       std::optional<std::chrono::milliseconds> retry_after = std::nullopt)
      : ProviderFailure(message), retry_after_(retry_after) {}

  std::optional<std::chrono::milliseconds> retry_after() const {
    return retry_after_;
  }

 private:
  std::optional<std::chrono::milliseconds> retry_after_;
};

}  // namespace lore_core
