#include <iostream>
#include "logger.hpp"
#include "app_config.hpp"
#include "level_errors.hpp"
#include "tank_level_app.hpp"

int main(int argc, char *argv[]) {
    AppConfig config;

    // 解析命令行参数
    try {
        if (parseArguments(argc, argv, config) == ArgumentsResult::HELP) {
            showHelp(argv[0]);
            return 0;
        }
        validateConfig(config);
    }
    catch (const ConfigError &e) {
        std::cerr << e.what() << std::endl;
        showHelp(argv[0]);
        return 1;
    }

    // 初始化日志系统
    TankLevelLogger::init(config.log_file, config.log_level, 1048576 * 5, 3,
                          config.console_only || config.log_file.empty(), config.file_only);
    TankLevelLogger::debug("当前日志级别: {}", TankLevelLogger::levelToString(config.log_level));
    TankLevelLogger::debug("条带配置 - 宽度: {}, 偏移: {}, 高度: {}, 边缘: {}",
                           config.geometry.strip_width, config.geometry.strip_offset,
                           config.geometry.image_height, config.geometry.edge);

    try {
        TankLevelApp app(config);
        app.initialize();

        MeasurementDocument doc = app.run();
        std::cout << toLogLine(doc) << std::endl;
    }
    catch (const std::exception &e) {
        int code = exitCodeForError(e);
        TankLevelLogger::error("测量失败 (退出码 {}): {}", code, e.what());
        TankLevelLogger::flush();
        return code;
    }

    TankLevelLogger::flush();
    return 0;
}
