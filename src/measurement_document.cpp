#include "measurement_document.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

double roundToTenth(double value)
{
    return std::round(value * 10.0) / 10.0;
}

MeasurementDocument buildMeasurementDocument(double level, double volume, std::size_t pixel,
                                             std::chrono::system_clock::time_point timestamp)
{
    return MeasurementDocument{timestamp, roundToTenth(level), roundToTenth(volume), pixel};
}

std::string formatTimestamp(std::chrono::system_clock::time_point timestamp)
{
    using namespace std::chrono;

    // 向下取整到秒，避免负时间戳时毫秒为负
    auto whole = time_point_cast<seconds>(timestamp);
    if (whole > timestamp)
        whole -= seconds(1);
    auto millis = duration_cast<milliseconds>(timestamp - whole).count();

    std::time_t t = system_clock::to_time_t(whole);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

json toJson(const MeasurementDocument &doc)
{
    json j;
    j["timestamp"] = formatTimestamp(doc.timestamp);
    j["level_cm"] = doc.level_cm;
    j["level_liter"] = doc.level_liter;
    j["level_pixel"] = doc.level_pixel;
    return j;
}

std::string toLogLine(const MeasurementDocument &doc)
{
    return toJson(doc).dump();
}

std::string toSnapshot(const MeasurementDocument &doc)
{
    return toJson(doc).dump(4);
}
