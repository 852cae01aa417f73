#include "distance_metrics.hpp"

int64_t squaredDistance(const Face& a, const Face& b) {
    int64_t sum = 0;
    for (size_t i = 0; i < Face::DIM_COUNT; ++i) {
        int64_t delta = static_cast<int64_t>(a[i]) - b[i];
        sum += delta * delta;
    }
    return sum;
}

int64_t axisDistance(const Face& a, const Face& b, size_t axis) {
    int64_t delta = static_cast<int64_t>(a[axis]) - b[axis];
    return delta * delta;
}
