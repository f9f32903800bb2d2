#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "ppeguard/json.hpp"

namespace ppeguard {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Pixel box in frame coordinates, top-left (x1, y1) to bottom-right (x2, y2).
struct Box {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    int width() const { return x2 - x1; }
    int height() const { return y2 - y1; }

    bool operator==(const Box& other) const {
        return x1 == other.x1 && y1 == other.y1 && x2 == other.x2 && y2 == other.y2;
    }
    bool operator!=(const Box& other) const { return !(*this == other); }
};

struct Detection {
    Box box;
    float confidence = 0.0f;
    std::string class_name;
};

Box parseBox(const Json& value);
Json boxToJson(const Box& box);
// "[x1, y1, x2, y2]", the textual form stored next to violation rows.
std::string formatBox(const Box& box);

Json detectionToJson(const Detection& detection);

std::vector<std::string> parseStringList(const Json& value);

std::string toLower(std::string value);

// UTC renderings of a wall-clock instant.
std::string isoTimestamp(TimePoint time);
std::string formatUtc(TimePoint time, const char* pattern);

double secondsBetween(TimePoint from, TimePoint to);

}  // namespace ppeguard
