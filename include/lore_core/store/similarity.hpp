#pragma once

#include <vector>

namespace lore_core {

/**
 * @brief Cosine similarity of two equal-length vectors, accumulated in double precision.
 *
 * Defined as 0.0 when either vector has zero magnitude.
 * @throw DimensionMismatch if the lengths differ.
 */
double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

// Unit-length copy of v; a zero vector stays zero.
std::vector<float> l2_normalized(const std::vector<float> &v);

}  // namespace lore_core
