#ifndef TANK_LEVEL_APP_HPP
#define TANK_LEVEL_APP_HPP

#include <chrono>
#include <memory>
#include "app_config.hpp"
#include "brightness_profile.hpp"
#include "calibration.hpp"
#include "measurement_document.hpp"
#include "transition_locator.hpp"

/**
 * @brief 油箱液位测量程序，串联各个组件完成一次测量
 */
class TankLevelApp {
public:
    /**
     * @brief 构造函数
     * @param config 测量配置
     */
    explicit TankLevelApp(const AppConfig& config);

    /**
     * @brief 加载标定数据并创建定位器和插值器
     * @throw CalibrationError 标定数据无效
     * @throw ConfigError 定位参数无效
     */
    void initialize();

    /**
     * @brief 执行一次完整测量：获取图像、预处理、定位液面、换算、写出结果
     * @return 测量记录
     */
    MeasurementDocument run();

    /**
     * @brief 根据亮度曲线计算测量记录，不涉及文件和外部命令
     * @param profile 亮度曲线
     * @param timestamp 拍摄时间
     * @throw NoTransitionFound, OutOfCalibrationRange
     */
    MeasurementDocument measure(const BrightnessProfile& profile,
                                std::chrono::system_clock::time_point timestamp) const;

private:
    AppConfig config_;
    std::unique_ptr<TransitionLocator> locator_;
    std::unique_ptr<CalibrationInterpolator> interpolator_;

    void writeOutputs(const MeasurementDocument& doc) const;
};

#endif // TANK_LEVEL_APP_HPP
