#ifndef CONFIRMATION_IMAGE_HPP
#define CONFIRMATION_IMAGE_HPP

#include <cstddef>
#include <string>
#include <opencv2/opencv.hpp>
#include "image_source.hpp"

/**
 * @brief 在图像上画出检测到的液面线（红色），横跨标尺条带
 * @param image 原始图像，会被修改
 * @param level_pixel 液面像素
 * @param geometry 条带位置
 */
void drawLevelLine(cv::Mat &image, std::size_t level_pixel, const StripGeometry &geometry);

/**
 * @brief 读取原图、画线并保存确认图片
 * @return 是否成功
 */
bool writeConfirmationImage(const std::string &source_image, const std::string &output_image,
                            std::size_t level_pixel, const StripGeometry &geometry);

#endif // CONFIRMATION_IMAGE_HPP
