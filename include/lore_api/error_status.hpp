#pragma once

#include <exception>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "lore_core/errors.hpp"
#include "lore_core/services/document_pipeline.hpp"

namespace lore_api {

// HTTP status for an exception escaping a route handler. A partial ingestion is reported
// with the status of whatever stopped it.
inline int http_status_for(const std::exception &e) {
  if (auto ingestion = dynamic_cast<const lore_core::IngestionError *>(&e)) {
    if (!ingestion->cause()) {
      return 500;
    }
    try {
      ingestion->rethrow_cause();
    } catch (const std::exception &cause) {
      return http_status_for(cause);
    }
  }
  if (dynamic_cast<const lore_core::InvalidConfiguration *>(&e) ||
      dynamic_cast<const lore_core::DimensionMismatch *>(&e) ||
      dynamic_cast<const std::invalid_argument *>(&e) ||
      dynamic_cast<const nlohmann::json::exception *>(&e)) {
    return 400;
  }
  if (dynamic_cast<const lore_core::StoreError *>(&e)) {
    return 409;
  }
  if (dynamic_cast<const lore_core::UnsupportedFormat *>(&e)) {
    return 415;
  }
  if (dynamic_cast<const lore_core::ExtractionFailed *>(&e)) {
    return 422;
  }
  if (dynamic_cast<const lore_core::RateLimited *>(&e)) {
    return 429;
  }
  if (dynamic_cast<const lore_core::ProviderUnavailable *>(&e)) {
    return 503;
  }
  if (dynamic_cast<const lore_core::ProviderError *>(&e)) {
    return 502;
  }
  return 500;
}

}  // namespace lore_api
