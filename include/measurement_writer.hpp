#ifndef MEASUREMENT_WRITER_HPP
#define MEASUREMENT_WRITER_HPP

#include <string>
#include "measurement_document.hpp"

/**
 * @brief 将测量记录追加到日志文件（每行一条JSON）
 * @throw OutputError 文件无法写入
 */
void appendMeasurementLog(const std::string &file_name, const MeasurementDocument &doc);

/**
 * @brief 将测量记录写为独立的快照文件，覆盖旧内容
 * @throw OutputError 文件无法写入
 */
void writeMeasurementSnapshot(const std::string &file_name, const MeasurementDocument &doc);

#endif // MEASUREMENT_WRITER_HPP
