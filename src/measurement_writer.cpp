#include "measurement_writer.hpp"
#include "level_errors.hpp"
#include "logger.hpp"

#include <fstream>

void appendMeasurementLog(const std::string &file_name, const MeasurementDocument &doc)
{
    TankLevelLogger::debug("写入测量日志: {}", file_name);

    std::ofstream ofs(file_name, std::ios::out | std::ios::app);
    if (!ofs.is_open())
    {
        throw OutputError("无法打开测量日志文件: " + file_name);
    }
    ofs << toLogLine(doc) << '\n';
    ofs.flush();
    if (!ofs)
    {
        throw OutputError("写入测量日志失败: " + file_name);
    }
}

void writeMeasurementSnapshot(const std::string &file_name, const MeasurementDocument &doc)
{
    TankLevelLogger::debug("写入测量快照: {}", file_name);

    std::ofstream ofs(file_name, std::ios::out | std::ios::trunc);
    if (!ofs.is_open())
    {
        throw OutputError("无法打开快照文件: " + file_name);
    }
    ofs << toSnapshot(doc) << '\n';
    ofs.flush();
    if (!ofs)
    {
        throw OutputError("写入快照失败: " + file_name);
    }
}
