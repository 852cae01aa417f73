#include <stdexcept>
#include <string>

#include "face.hpp"

Face::Face(int race, int emotion, int oldness, int64_t id) : id_(0), values{0, 0, 0} {
    if (id < 0) {
        throw RangeError("ID must not be negative");
    }
    setRace(race);
    setEmotion(emotion);
    setOldness(oldness);
    id_ = id;
}

void Face::setRace(int race) {
    if (race < 0 || race > MAX_RACE) {
        throw RangeError("Race must be between 0 and 100, got " + std::to_string(race));
    }
    values[0] = race;
}

void Face::setEmotion(int emotion) {
    if (emotion < 0 || emotion > MAX_EMOTION) {
        throw RangeError("Emotion must be between 0 and 1000, got " + std::to_string(emotion));
    }
    values[1] = emotion;
}

void Face::setOldness(int oldness) {
    if (oldness < 0 || oldness > MAX_OLDNESS) {
        throw RangeError("Oldness must be between 0 and 1000, got " + std::to_string(oldness));
    }
    values[2] = oldness;
}

int Face::operator[](size_t axis) const {
    if (axis >= DIM_COUNT) {
        throw std::out_of_range("Axis out of range");
    }
    return values[axis];
}

void Face::assignId(int64_t id) {
    if (id < 0) {
        throw RangeError("ID must not be negative");
    }
    if (id_ != 0) {
        throw std::logic_error("Face " + std::to_string(id_) + " is already persisted");
    }
    id_ = id;
}

std::string Face::toString() const {
    return "Face(id=" + std::to_string(id_) +
           ", race=" + std::to_string(values[0]) +
           ", emotion=" + std::to_string(values[1]) +
           ", oldness=" + std::to_string(values[2]) + ")";
}
