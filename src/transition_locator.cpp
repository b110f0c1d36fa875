#include "transition_locator.hpp"
#include "level_errors.hpp"
#include "logger.hpp"

TransitionLocator::TransitionLocator(const LocatorConfig &config) : config_(config)
{
    if (config_.zero_run_length < 1)
    {
        throw ConfigError("zero_run_length 必须大于等于1，当前值: " + std::to_string(config_.zero_run_length));
    }
}

bool TransitionLocator::isZeroRun(const BrightnessProfile &profile, std::size_t start) const
{
    const std::size_t run = static_cast<std::size_t>(config_.zero_run_length);
    if (start + run > profile.size())
    {
        return false;
    }
    for (std::size_t i = start; i < start + run; ++i)
    {
        if (profile[i] != 0)
            return false;
    }
    return true;
}

std::size_t TransitionLocator::locate(const BrightnessProfile &profile) const
{
    // 第一阶段：找到第一个亮度超过阈值的像素
    std::size_t start_search = 0;
    bool started = false;
    for (std::size_t i = 0; i < profile.size(); ++i)
    {
        if (profile[i] > config_.bright_threshold)
        {
            start_search = i;
            started = true;
            break;
        }
    }

    if (!started)
    {
        throw NoTransitionFound("亮度曲线中没有超过阈值 " + std::to_string(config_.bright_threshold) +
                                " 的像素（共 " + std::to_string(profile.size()) + " 个像素）");
    }
    TankLevelLogger::debug("从第 {} 个像素开始搜索液面", start_search);

    // 第二阶段：寻找连续为0的像素段
    for (std::size_t i = start_search; i < profile.size(); ++i)
    {
        if (profile[i] == 0 && isZeroRun(profile, i))
        {
            TankLevelLogger::debug("液面位于第 {} 个像素", i);
            return i;
        }
    }

    throw NoTransitionFound("在第 " + std::to_string(start_search) + " 个像素之后没有找到连续 " +
                            std::to_string(config_.zero_run_length) + " 个零值像素（共 " +
                            std::to_string(profile.size()) + " 个像素）");
}
