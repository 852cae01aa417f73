// src/utils/random_generator.cpp

#include "random_generator.hpp"

RandomGenerator::RandomGenerator(unsigned int seed)
    : gen(seed), race_dist(0, Face::MAX_RACE), level_dist(0, Face::MAX_EMOTION) {}

Face RandomGenerator::generateFace() {
    int race = race_dist(gen);
    int emotion = level_dist(gen);
    int oldness = level_dist(gen);
    return Face(race, emotion, oldness);
}

std::vector<Face> RandomGenerator::generateFaces(size_t count, int64_t first_id) {
    std::vector<Face> faces;
    faces.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        Face face = generateFace();
        face.assignId(first_id + static_cast<int64_t>(i));
        faces.push_back(face);
    }
    return faces;
}
