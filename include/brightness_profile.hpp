#ifndef BRIGHTNESS_PROFILE_HPP
#define BRIGHTNESS_PROFILE_HPP

#include <istream>
#include <string>
#include <vector>

// 每个元素对应裁剪条带的一行像素，下标即距条带顶部的像素偏移
using BrightnessProfile = std::vector<int>;

constexpr int MAX_BRIGHTNESS = 255;

/**
 * @brief 解析ImageMagick txt格式的逐像素亮度输出
 * @param input 第一行为文件头，其后每行形如 "0,12: ( 29, 29, 29)  #1D1D1D  gray(29,29,29)"
 * @return 按行顺序排列的亮度值（只取第一个通道）
 * @throw ParseError 数据行格式不符、行号不连续或亮度超过255时抛出，包含行号和原始内容
 */
BrightnessProfile parseBrightnessProfile(std::istream &input);

BrightnessProfile parseBrightnessProfile(const std::string &text);

/**
 * @brief 从文件读取亮度数据
 * @throw ParseError 文件无法打开或内容无法解析
 */
BrightnessProfile loadBrightnessProfile(const std::string &file_name);

#endif // BRIGHTNESS_PROFILE_HPP
