#include "ppeguard/common.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ppeguard {

Box parseBox(const Json& value)
{
    if (!value.is_array()) {
        throw std::runtime_error("Box must be an array of four integers");
    }
    const auto& arr = value.as_array();
    if (arr.size() != 4) {
        throw std::runtime_error("Box must contain four numbers");
    }
    Box box;
    box.x1 = static_cast<int>(arr[0].as_number());
    box.y1 = static_cast<int>(arr[1].as_number());
    box.x2 = static_cast<int>(arr[2].as_number());
    box.y2 = static_cast<int>(arr[3].as_number());
    return box;
}

Json boxToJson(const Box& box)
{
    Json value = Json::array();
    value.push_back(box.x1);
    value.push_back(box.y1);
    value.push_back(box.x2);
    value.push_back(box.y2);
    return value;
}

std::string formatBox(const Box& box)
{
    std::ostringstream oss;
    oss << '[' << box.x1 << ", " << box.y1 << ", " << box.x2 << ", " << box.y2 << ']';
    return oss.str();
}

Json detectionToJson(const Detection& detection)
{
    Json value = Json::object();
    value["class_name"] = detection.class_name;
    value["confidence"] = detection.confidence;
    value["box"] = boxToJson(detection.box);
    return value;
}

std::vector<std::string> parseStringList(const Json& value)
{
    std::vector<std::string> items;
    if (!value.is_array()) {
        return items;
    }
    for (const auto& entry : value.as_array()) {
        items.push_back(entry.as_string());
    }
    return items;
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string formatUtc(TimePoint time, const char* pattern)
{
    auto raw = Clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&raw, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, pattern);
    return oss.str();
}

std::string isoTimestamp(TimePoint time)
{
    auto fractional = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()) % 1000;
    if (fractional.count() < 0) {
        fractional += std::chrono::milliseconds(1000);
    }
    std::ostringstream oss;
    oss << formatUtc(time, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(3) << std::setfill('0') << fractional.count() << "Z";
    return oss.str();
}

double secondsBetween(TimePoint from, TimePoint to)
{
    return std::chrono::duration<double>(to - from).count();
}

}  // namespace ppeguard
