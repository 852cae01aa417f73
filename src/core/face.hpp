// src/core/face.hpp

#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

// Thrown when a face attribute falls outside its documented bound.
class RangeError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

/**
 * A face descriptor: three bounded integer attributes plus an identity.
 *
 * id == 0 means the face has not been persisted yet. Once a non-zero id is
 * assigned the face is immutable.
 */
class Face {
public:
    static constexpr size_t DIM_COUNT = 3;
    static constexpr int MAX_RACE = 100;
    static constexpr int MAX_EMOTION = 1000;
    static constexpr int MAX_OLDNESS = 1000;

    Face(int race, int emotion, int oldness, int64_t id = 0);

    int64_t id() const { return id_; }
    int race() const { return values[0]; }
    int emotion() const { return values[1]; }
    int oldness() const { return values[2]; }

    // Value on axis 0 (race), 1 (emotion) or 2 (oldness).
    int operator[](size_t axis) const;

    void assignId(int64_t id);

    bool operator==(const Face& other) const {
        return id_ == other.id_ && values[0] == other.values[0] &&
               values[1] == other.values[1] && values[2] == other.values[2];
    }
    bool operator!=(const Face& other) const { return !(*this == other); }

    std::string toString() const;

private:
    int64_t id_;
    int values[DIM_COUNT];

    void setRace(int race);
    void setEmotion(int emotion);
    void setOldness(int oldness);
};

inline void to_json(nlohmann::json& j, const Face& f) {
    j = nlohmann::json{
        {"id", f.id()},
        {"race", f.race()},
        {"emotion", f.emotion()},
        {"oldness", f.oldness()}
    };
}

namespace std {
    template <>
    struct hash<Face> {
        size_t operator()(const Face& f) const {
            size_t seed = std::hash<int64_t>()(f.id());
            for (size_t i = 0; i < Face::DIM_COUNT; ++i) {
                seed ^= std::hash<int>()(f[i]) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
            }
            return seed;
        }
    };
}
