#ifndef MEASUREMENT_DOCUMENT_HPP
#define MEASUREMENT_DOCUMENT_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

/**
 * @brief 一次测量的结果记录，创建后不再修改
 */
struct MeasurementDocument
{
    const std::chrono::system_clock::time_point timestamp;
    const double level_cm;    // 保留一位小数
    const double level_liter; // 保留一位小数
    const std::size_t level_pixel;
};

/**
 * @brief 生成测量记录
 * @param level 液位高度（厘米）
 * @param volume 体积（升）
 * @param pixel 液面像素
 * @param timestamp 拍摄时间
 */
MeasurementDocument buildMeasurementDocument(double level, double volume, std::size_t pixel,
                                             std::chrono::system_clock::time_point timestamp);

// 四舍五入到一位小数
double roundToTenth(double value);

// ISO-8601 UTC时间，精确到毫秒，如 2015-03-01T12:00:00.123Z
std::string formatTimestamp(std::chrono::system_clock::time_point timestamp);

json toJson(const MeasurementDocument &doc);

// 单行JSON，用于追加到日志文件
std::string toLogLine(const MeasurementDocument &doc);

// 格式化的JSON快照
std::string toSnapshot(const MeasurementDocument &doc);

#endif // MEASUREMENT_DOCUMENT_HPP
