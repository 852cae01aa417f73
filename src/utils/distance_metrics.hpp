// src/utils/distance_metrics.hpp
#pragma once
#include <cstddef>
#include <cstdint>

#include "../core/face.hpp"

// Squared Euclidean distance over the three face axes. Ranking only needs a
// monotonic order, so no square root is taken.
int64_t squaredDistance(const Face& a, const Face& b);

// Squared distance from a to the plane through b orthogonal to axis.
int64_t axisDistance(const Face& a, const Face& b, size_t axis);
