#ifndef LEVEL_ERRORS_HPP
#define LEVEL_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * @brief 液位测量相关异常的基类
 */
class TankLevelError : public std::runtime_error
{
public:
    explicit TankLevelError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief 亮度数据行无法解析
 */
class ParseError : public TankLevelError
{
public:
    ParseError(std::size_t line_number, const std::string &line);
    explicit ParseError(const std::string &message);

    std::size_t lineNumber() const { return line_number_; }
    const std::string &line() const { return line_; }

private:
    std::size_t line_number_ = 0;
    std::string line_;
};

/**
 * @brief 亮度曲线中找不到液面分界
 */
class NoTransitionFound : public TankLevelError
{
public:
    explicit NoTransitionFound(const std::string &message) : TankLevelError(message) {}
};

/**
 * @brief 检测到的像素位置超出标定范围
 */
class OutOfCalibrationRange : public TankLevelError
{
public:
    OutOfCalibrationRange(double pixel, double min_pixel, double max_pixel);

    double pixel() const { return pixel_; }

private:
    double pixel_;
};

/**
 * @brief 标定数据无法加载或点数不足
 */
class CalibrationError : public TankLevelError
{
public:
    explicit CalibrationError(const std::string &message) : TankLevelError(message) {}
};

// 参数配置错误
class ConfigError : public TankLevelError
{
public:
    explicit ConfigError(const std::string &message) : TankLevelError(message) {}
};

// 图像获取或预处理失败
class AcquisitionError : public TankLevelError
{
public:
    explicit AcquisitionError(const std::string &message) : TankLevelError(message) {}
};

// 测量结果写入失败
class OutputError : public TankLevelError
{
public:
    explicit OutputError(const std::string &message) : TankLevelError(message) {}
};

/**
 * @brief 将异常映射为进程退出码
 * @return 1 配置错误，2 获取图像或写入结果失败，3 亮度数据错误，4 找不到液面，
 *         5 超出标定范围，6 标定数据错误，7 其他异常
 */
int exitCodeForError(const std::exception &e);

#endif // LEVEL_ERRORS_HPP
