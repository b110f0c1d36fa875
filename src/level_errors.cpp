#include "level_errors.hpp"

#include <sstream>

ParseError::ParseError(std::size_t line_number, const std::string &line)
    : TankLevelError("无法解析第 " + std::to_string(line_number) + " 行亮度数据: \"" + line + "\""),
      line_number_(line_number), line_(line)
{
}

ParseError::ParseError(const std::string &message) : TankLevelError(message)
{
}

static std::string outOfRangeMessage(double pixel, double min_pixel, double max_pixel)
{
    std::ostringstream ss;
    ss << "检测像素 " << pixel << " 超出标定范围 [" << min_pixel << ", " << max_pixel << "]";
    return ss.str();
}

OutOfCalibrationRange::OutOfCalibrationRange(double pixel, double min_pixel, double max_pixel)
    : TankLevelError(outOfRangeMessage(pixel, min_pixel, max_pixel)), pixel_(pixel)
{
}

int exitCodeForError(const std::exception &e)
{
    if (dynamic_cast<const ConfigError *>(&e))
        return 1;
    if (dynamic_cast<const AcquisitionError *>(&e) || dynamic_cast<const OutputError *>(&e))
        return 2;
    if (dynamic_cast<const ParseError *>(&e))
        return 3;
    if (dynamic_cast<const NoTransitionFound *>(&e))
        return 4;
    if (dynamic_cast<const OutOfCalibrationRange *>(&e))
        return 5;
    if (dynamic_cast<const CalibrationError *>(&e))
        return 6;
    return 7;
}
