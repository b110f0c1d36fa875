#include "app_config.hpp"
#include "level_errors.hpp"

#include <iostream>

void showHelp(const char *programName)
{
    std::cout << "用法: " << programName << " --mapping=FILE [选项]" << std::endl;
    std::cout << "摄像头:" << std::endl;
    std::cout << "  --host=HOST              摄像头地址" << std::endl;
    std::cout << "  --username=USER          摄像头用户名" << std::endl;
    std::cout << "  --password=PASS          摄像头密码" << std::endl;
    std::cout << "  --image=FILE             使用本地图片代替摄像头快照" << std::endl;
    std::cout << "  --profile=FILE           直接使用已有的亮度数据（convert txt输出）" << std::endl;
    std::cout << "  --keep-txt-file          保留中间亮度数据文件" << std::endl;
    std::cout << "测量:" << std::endl;
    std::cout << "  --mapping=FILE           标定文件（JSON，高度 -> 像素）" << std::endl;
    std::cout << "  --strip-width=N          条带宽度 (默认: 60)" << std::endl;
    std::cout << "  --strip-offset=N         条带左侧偏移 (默认: 236)" << std::endl;
    std::cout << "  --image-height=N         图像高度 (默认: 480)" << std::endl;
    std::cout << "  --edge=N                 边缘检测半径 (默认: 20)" << std::endl;
    std::cout << "  --bright-threshold=N     开始搜索液面的亮度阈值 (默认: 100)" << std::endl;
    std::cout << "  --zero-run-length=N      液面处连续零值像素数 (默认: 3)" << std::endl;
    std::cout << "  --liter-per-cm=X         每厘米升数 (默认: 35.37)" << std::endl;
    std::cout << "输出:" << std::endl;
    std::cout << "  --output=FILE            追加测量结果到日志文件" << std::endl;
    std::cout << "  --snapshot=FILE          写入测量结果快照" << std::endl;
    std::cout << "  --confirmation-image=FILE 写入带液面线的确认图片" << std::endl;
    std::cout << "日志:" << std::endl;
    std::cout << "  --log-level=LEVEL        日志级别 (trace, debug, info, warn, error, critical)" << std::endl;
    std::cout << "  --log-file=FILE          同时写入日志文件" << std::endl;
    std::cout << "  --console-only           只输出日志到控制台" << std::endl;
    std::cout << "  --file-only              只输出日志到文件" << std::endl;
    std::cout << "  --help, -h               显示帮助信息" << std::endl;
}

static int toInt(const std::string &option, const std::string &value)
{
    std::size_t consumed = 0;
    int result = 0;
    try
    {
        result = std::stoi(value, &consumed);
    }
    catch (const std::exception &)
    {
        throw ConfigError("选项 " + option + " 需要整数，实际为: " + value);
    }
    if (consumed != value.size())
    {
        throw ConfigError("选项 " + option + " 需要整数，实际为: " + value);
    }
    return result;
}

static double toDouble(const std::string &option, const std::string &value)
{
    std::size_t consumed = 0;
    double result = 0;
    try
    {
        result = std::stod(value, &consumed);
    }
    catch (const std::exception &)
    {
        throw ConfigError("选项 " + option + " 需要数字，实际为: " + value);
    }
    if (consumed != value.size())
    {
        throw ConfigError("选项 " + option + " 需要数字，实际为: " + value);
    }
    return result;
}

ArgumentsResult parseArguments(int argc, const char *const argv[], AppConfig &config)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h")
        {
            return ArgumentsResult::HELP;
        }

        // 开关选项
        if (arg == "--keep-txt-file")
        {
            config.keep_txt_file = true;
            continue;
        }
        if (arg == "--console-only")
        {
            config.console_only = true;
            config.file_only = false;
            continue;
        }
        if (arg == "--file-only")
        {
            config.file_only = true;
            config.console_only = false;
            continue;
        }

        std::string::size_type eq = arg.find('=');
        if (arg.compare(0, 2, "--") != 0 || eq == std::string::npos)
        {
            throw ConfigError("未知选项: " + arg);
        }
        std::string name = arg.substr(0, eq);
        std::string value = arg.substr(eq + 1);

        if (name == "--host")
            config.camera.host = value;
        else if (name == "--username")
            config.camera.username = value;
        else if (name == "--password")
            config.camera.password = value;
        else if (name == "--image")
            config.image_file = value;
        else if (name == "--profile")
            config.profile_file = value;
        else if (name == "--mapping")
            config.mapping_file = value;
        else if (name == "--strip-width")
            config.geometry.strip_width = toInt(name, value);
        else if (name == "--strip-offset")
            config.geometry.strip_offset = toInt(name, value);
        else if (name == "--image-height")
            config.geometry.image_height = toInt(name, value);
        else if (name == "--edge")
            config.geometry.edge = toInt(name, value);
        else if (name == "--bright-threshold")
            config.locator.bright_threshold = toInt(name, value);
        else if (name == "--zero-run-length")
            config.locator.zero_run_length = toInt(name, value);
        else if (name == "--liter-per-cm")
            config.liters_per_unit = toDouble(name, value);
        else if (name == "--confirmation-image")
            config.confirmation_image = value;
        else if (name == "--output")
            config.output_file = value;
        else if (name == "--snapshot")
            config.snapshot_file = value;
        else if (name == "--log-file")
            config.log_file = value;
        else if (name == "--log-level")
        {
            if (!TankLevelLogger::levelFromString(value, config.log_level))
            {
                throw ConfigError("无效的日志级别: " + value);
            }
        }
        else
        {
            throw ConfigError("未知选项: " + arg);
        }
    }
    return ArgumentsResult::RUN;
}

void validateConfig(const AppConfig &config)
{
    if (config.mapping_file.empty())
    {
        throw ConfigError("缺少必需参数: --mapping");
    }

    // 没有本地图片或亮度数据时必须从摄像头获取
    if (config.image_file.empty() && config.profile_file.empty())
    {
        if (config.camera.host.empty())
            throw ConfigError("缺少必需参数: --host");
        if (config.camera.username.empty())
            throw ConfigError("缺少必需参数: --username");
        if (config.camera.password.empty())
            throw ConfigError("缺少必需参数: --password");
    }

    if (!config.profile_file.empty() && !config.confirmation_image.empty() && config.image_file.empty())
    {
        throw ConfigError("使用 --profile 时生成确认图片需要同时指定 --image");
    }

    if (config.geometry.strip_width <= 0 || config.geometry.image_height <= 0)
    {
        throw ConfigError("条带宽度和图像高度必须大于0");
    }
    if (config.geometry.strip_offset < 0)
    {
        throw ConfigError("条带偏移不能为负数");
    }
    if (config.geometry.edge <= 0)
    {
        throw ConfigError("边缘检测半径必须大于0");
    }
    if (config.locator.zero_run_length < 1)
    {
        throw ConfigError("--zero-run-length 必须大于等于1");
    }
    if (config.liters_per_unit <= 0.0)
    {
        throw ConfigError("--liter-per-cm 必须大于0");
    }
    if (config.file_only && config.log_file.empty())
    {
        throw ConfigError("--file-only 需要同时指定 --log-file");
    }
}
