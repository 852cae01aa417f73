#pragma once

#include <random>
#include <vector>

#include "../core/face.hpp"

class RandomGenerator {
private:
    std::mt19937 gen;
    std::uniform_int_distribution<int> race_dist;
    std::uniform_int_distribution<int> level_dist;

public:
    explicit RandomGenerator(unsigned int seed = std::random_device{}()); // Marked explicit
    // New (unsaved) face with uniformly distributed attributes.
    Face generateFace();
    // Faces with ids first_id, first_id + 1, ...
    std::vector<Face> generateFaces(size_t count, int64_t first_id = 1);
};
