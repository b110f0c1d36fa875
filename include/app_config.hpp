#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include <string>
#include "logger.hpp"
#include "image_source.hpp"
#include "transition_locator.hpp"
#include "calibration.hpp"

/**
 * @brief 单次测量的全部配置，由命令行生成后传给各组件
 */
struct AppConfig
{
    // 数据来源
    CameraConfig camera;
    std::string image_file;   // 使用本地图片代替摄像头
    std::string profile_file; // 直接使用已有的亮度数据
    bool keep_txt_file = false;

    // 测量参数
    std::string mapping_file;
    StripGeometry geometry;
    LocatorConfig locator;
    double liters_per_unit = CalibrationInterpolator::DEFAULT_LITERS_PER_UNIT;

    // 输出
    std::string confirmation_image;
    std::string output_file;
    std::string snapshot_file;

    // 日志
    TankLevelLogger::LogLevel log_level = TankLevelLogger::LogLevel::INFO;
    std::string log_file;
    bool console_only = false;
    bool file_only = false;
};

enum class ArgumentsResult
{
    RUN,
    HELP
};

void showHelp(const char *programName);

/**
 * @brief 解析命令行参数
 * @return RUN 继续执行，HELP 仅显示帮助
 * @throw ConfigError 未知选项或数值格式错误
 */
ArgumentsResult parseArguments(int argc, const char *const argv[], AppConfig &config);

/**
 * @brief 检查必需参数和取值范围
 * @throw ConfigError 配置无效
 */
void validateConfig(const AppConfig &config);

#endif // APP_CONFIG_HPP
