#include "confirmation_image.hpp"
#include "logger.hpp"

void drawLevelLine(cv::Mat &image, std::size_t level_pixel, const StripGeometry &geometry)
{
    int y = static_cast<int>(level_pixel);
    cv::line(image,
             cv::Point(geometry.strip_offset, y),
             cv::Point(geometry.strip_offset + geometry.strip_width, y),
             cv::Scalar(0, 0, 255), 1);
}

bool writeConfirmationImage(const std::string &source_image, const std::string &output_image,
                            std::size_t level_pixel, const StripGeometry &geometry)
{
    TankLevelLogger::debug("写入确认图片: {}", output_image);

    try
    {
        cv::Mat image = cv::imread(source_image, cv::IMREAD_COLOR);
        if (image.empty())
        {
            TankLevelLogger::error("无法读取图像: {}", source_image);
            return false;
        }

        drawLevelLine(image, level_pixel, geometry);

        if (!cv::imwrite(output_image, image))
        {
            TankLevelLogger::error("无法写入确认图片: {}", output_image);
            return false;
        }
        return true;
    }
    catch (const cv::Exception &e)
    {
        TankLevelLogger::error("生成确认图片出错: {}", e.what());
        return false;
    }
}
