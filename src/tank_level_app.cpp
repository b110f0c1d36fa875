#include "tank_level_app.hpp"
#include "confirmation_image.hpp"
#include "image_source.hpp"
#include "level_errors.hpp"
#include "logger.hpp"
#include "measurement_writer.hpp"

TankLevelApp::TankLevelApp(const AppConfig& config)
    : config_(config)
{
}

void TankLevelApp::initialize()
{
    TankLevelLogger::debug("读取标定文件: {}", config_.mapping_file);
    CalibrationMapping mapping = loadCalibrationMapping(config_.mapping_file);

    locator_ = std::make_unique<TransitionLocator>(config_.locator);
    interpolator_ = std::make_unique<CalibrationInterpolator>(mapping, config_.liters_per_unit);

    TankLevelLogger::debug("定位参数 - 亮度阈值: {}, 零值长度: {}, 每厘米升数: {}",
                           config_.locator.bright_threshold, config_.locator.zero_run_length,
                           config_.liters_per_unit);
}

MeasurementDocument TankLevelApp::measure(const BrightnessProfile& profile,
                                          std::chrono::system_clock::time_point timestamp) const
{
    if (!locator_ || !interpolator_)
    {
        throw ConfigError("TankLevelApp 尚未初始化");
    }

    std::size_t level_pixel = locator_->locate(profile);
    TankLevelLogger::debug("液面位于 {} 像素", level_pixel);

    LevelReading reading = interpolator_->interpolate(static_cast<double>(level_pixel));
    TankLevelLogger::info("液位: {:.2f} cm", reading.level);
    TankLevelLogger::info("体积: {:.2f} L", reading.volume);

    return buildMeasurementDocument(reading.level, reading.volume, level_pixel, timestamp);
}

MeasurementDocument TankLevelApp::run()
{
    auto timestamp = std::chrono::system_clock::now();

    std::unique_ptr<TempFile> image_temp;
    std::string image_file = config_.image_file;
    BrightnessProfile profile;

    if (!config_.profile_file.empty())
    {
        TankLevelLogger::debug("使用已有亮度数据: {}", config_.profile_file);
        profile = loadBrightnessProfile(config_.profile_file);
    }
    else
    {
        if (image_file.empty())
        {
            image_temp = std::make_unique<TempFile>(".jpg");
            image_file = image_temp->path();
            fetchSnapshot(config_.camera, image_file);
            timestamp = std::chrono::system_clock::now();
        }

        TempFile dump(".txt");
        if (config_.keep_txt_file)
        {
            dump.keep();
            TankLevelLogger::info("保留亮度数据文件: {}", dump.path());
        }
        preprocessStrip(image_file, dump.path(), config_.geometry);
        profile = loadBrightnessProfile(dump.path());
    }

    MeasurementDocument doc = measure(profile, timestamp);

    if (!config_.confirmation_image.empty())
    {
        if (!writeConfirmationImage(image_file, config_.confirmation_image, doc.level_pixel, config_.geometry))
        {
            TankLevelLogger::warn("确认图片生成失败，继续执行...");
        }
    }

    writeOutputs(doc);
    return doc;
}

void TankLevelApp::writeOutputs(const MeasurementDocument& doc) const
{
    if (!config_.output_file.empty())
    {
        appendMeasurementLog(config_.output_file, doc);
    }
    if (!config_.snapshot_file.empty())
    {
        writeMeasurementSnapshot(config_.snapshot_file, doc);
    }
}
