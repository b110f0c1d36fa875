#ifndef TRANSITION_LOCATOR_HPP
#define TRANSITION_LOCATOR_HPP

#include <cstddef>
#include "brightness_profile.hpp"

/**
 * @brief 液面定位参数
 */
struct LocatorConfig
{
    int bright_threshold = 100; // 亮度超过该值后才开始寻找液面
    int zero_run_length = 3;    // 连续为0的像素数（包含起始像素）
};

/**
 * @brief 在亮度曲线中定位液面所在的像素行
 *
 * 先跳过条带顶部的背景，直到出现亮度超过阈值的像素；
 * 之后第一个连续 zero_run_length 个像素均为0的位置即为液面。
 */
class TransitionLocator
{
public:
    /**
     * @brief 构造函数
     * @param config 定位参数
     * @throw ConfigError zero_run_length 小于1时抛出
     */
    explicit TransitionLocator(const LocatorConfig &config = LocatorConfig());

    /**
     * @brief 定位液面
     * @param profile 亮度曲线
     * @return 液面像素下标（从条带顶部开始，0起）
     * @throw NoTransitionFound 未找到亮区或未找到满足条件的零值段
     */
    std::size_t locate(const BrightnessProfile &profile) const;

    const LocatorConfig &config() const { return config_; }

private:
    LocatorConfig config_;

    bool isZeroRun(const BrightnessProfile &profile, std::size_t start) const;
};

#endif // TRANSITION_LOCATOR_HPP
