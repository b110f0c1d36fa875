#ifndef CALIBRATION_HPP
#define CALIBRATION_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// 标定点：实测高度与其在条带中的像素偏移
struct CalibrationPoint
{
    double unit;  // 物理高度（厘米）
    double pixel; // 像素偏移
    CalibrationPoint(double u, double p) : unit(u), pixel(p) {}
    CalibrationPoint() : unit(0.0), pixel(0.0) {}
};

// 按存储顺序保存，不要求有序
using CalibrationMapping = std::vector<CalibrationPoint>;

// 插值结果
struct LevelReading
{
    double level = 0.0;  // 液位高度
    double volume = 0.0; // 体积（升）
    double pixel = 0.0;  // 检测到的像素
    double fraction = 0.0;
    CalibrationPoint before;
    CalibrationPoint after;
};

class CalibrationInterpolator
{
public:
    static constexpr double DEFAULT_LITERS_PER_UNIT = 35.37;

    /**
     * @brief 构造函数
     * @param mapping 标定数据，至少两个点
     * @param liters_per_unit 每厘米对应的升数
     * @throw CalibrationError 标定点少于两个
     */
    explicit CalibrationInterpolator(const CalibrationMapping &mapping,
                                     double liters_per_unit = DEFAULT_LITERS_PER_UNIT);

    /**
     * @brief 将像素位置换算为液位和体积
     * @param pixel 液面像素偏移
     * @return 插值结果
     * @throw OutOfCalibrationRange 像素不在两个标定点之间
     *
     * 标定点按像素偏移升序遍历：before 为最后一个像素小于 pixel 的点，
     * after 为第一个像素大于 pixel 的点。不检查标定数据的单调性。
     */
    LevelReading interpolate(double pixel) const;

    double litersPerUnit() const { return liters_per_unit_; }
    const CalibrationMapping &points() const { return sorted_; }

private:
    CalibrationMapping sorted_;
    double liters_per_unit_;
};

/**
 * @brief 从JSON对象解析标定数据，键为高度，值为像素偏移
 * @throw CalibrationError 格式错误
 */
CalibrationMapping parseCalibrationMapping(const json &j);

/**
 * @brief 从文件读取标定数据
 * @throw CalibrationError 文件无法打开或格式错误
 */
CalibrationMapping loadCalibrationMapping(const std::string &file_name);

#endif // CALIBRATION_HPP
