#include "calibration.hpp"
#include "level_errors.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>

CalibrationInterpolator::CalibrationInterpolator(const CalibrationMapping &mapping, double liters_per_unit)
    : sorted_(mapping), liters_per_unit_(liters_per_unit)
{
    if (sorted_.size() < 2)
    {
        throw CalibrationError("标定数据至少需要两个点，当前只有 " + std::to_string(sorted_.size()) + " 个");
    }

    std::stable_sort(sorted_.begin(), sorted_.end(),
                     [](const CalibrationPoint &a, const CalibrationPoint &b)
                     {
                         if (a.pixel != b.pixel)
                             return a.pixel < b.pixel;
                         return a.unit < b.unit;
                     });
}

LevelReading CalibrationInterpolator::interpolate(double pixel) const
{
    LevelReading reading;
    reading.pixel = pixel;

    const CalibrationPoint *before = nullptr;
    const CalibrationPoint *after = nullptr;
    const CalibrationPoint *exact = nullptr;

    for (const auto &point : sorted_)
    {
        TankLevelLogger::trace("检查标定点 {} cm ({} px)", point.unit, point.pixel);
        if (point.pixel < pixel)
        {
            before = &point;
        }
        else if (point.pixel > pixel)
        {
            if (!after)
                after = &point;
        }
        else if (!exact)
        {
            exact = &point;
        }
    }

    if (exact)
    {
        // 恰好落在标定点上
        reading.before = *exact;
        reading.after = *exact;
        reading.fraction = 0.0;
        reading.level = exact->unit;
        reading.volume = reading.level * liters_per_unit_;
        TankLevelLogger::debug("像素 {} 与标定点 {} cm 重合", pixel, exact->unit);
        return reading;
    }

    if (!before || !after)
    {
        throw OutOfCalibrationRange(pixel, sorted_.front().pixel, sorted_.back().pixel);
    }

    TankLevelLogger::debug("前一标定点: {} cm | {} px", before->unit, before->pixel);
    TankLevelLogger::debug("后一标定点: {} cm | {} px", after->unit, after->pixel);

    reading.before = *before;
    reading.after = *after;
    reading.fraction = 1.0 - ((pixel - after->pixel) / (before->pixel - after->pixel));
    reading.level = before->unit + (after->unit - before->unit) * reading.fraction;
    reading.volume = reading.level * liters_per_unit_;

    TankLevelLogger::debug("插值比例: {:.2f}", reading.fraction);
    return reading;
}

CalibrationMapping parseCalibrationMapping(const json &j)
{
    if (!j.is_object())
    {
        throw CalibrationError("标定数据必须是JSON对象（高度 -> 像素）");
    }

    CalibrationMapping mapping;
    for (const auto &it : j.items())
    {
        const std::string &key = it.key();
        double unit = 0.0;
        try
        {
            std::size_t consumed = 0;
            unit = std::stod(key, &consumed);
            if (consumed != key.size() || std::isspace(static_cast<unsigned char>(key.front())))
                throw std::invalid_argument(key);
        }
        catch (const std::exception &)
        {
            throw CalibrationError("标定高度不是数字: \"" + key + "\"");
        }
        if (!std::isfinite(unit))
        {
            throw CalibrationError("标定高度必须是有限数值: \"" + key + "\"");
        }

        if (!it.value().is_number())
        {
            throw CalibrationError("标定点 \"" + key + "\" 的像素偏移不是数字");
        }
        double pixel = it.value().get<double>();
        if (!std::isfinite(pixel))
        {
            throw CalibrationError("标定点 \"" + key + "\" 的像素偏移必须是有限数值");
        }
        mapping.emplace_back(unit, pixel);
    }
    return mapping;
}

CalibrationMapping loadCalibrationMapping(const std::string &file_name)
{
    std::ifstream ifs(file_name);
    if (!ifs.is_open())
    {
        throw CalibrationError("无法打开标定文件: " + file_name);
    }

    json j;
    try
    {
        ifs >> j;
    }
    catch (const json::parse_error &e)
    {
        throw CalibrationError("标定文件格式错误 " + file_name + ": " + e.what());
    }

    CalibrationMapping mapping = parseCalibrationMapping(j);
    TankLevelLogger::debug("从 {} 读取 {} 个标定点", file_name, mapping.size());
    return mapping;
}
