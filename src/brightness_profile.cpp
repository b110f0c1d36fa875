#include "brightness_profile.hpp"
#include "level_errors.hpp"
#include "logger.hpp"

#include <fstream>
#include <regex>
#include <sstream>

BrightnessProfile parseBrightnessProfile(std::istream &input)
{
    // 0,<行号>: ( <亮度>, <g>, <b>) ...
    static const std::regex pixel_line(R"(^0,(\d+): \(\s*(\d+),.*$)");

    BrightnessProfile profile;
    std::string line;
    std::size_t line_number = 0;

    // 跳过文件头
    if (!std::getline(input, line))
    {
        return profile;
    }
    ++line_number;

    while (std::getline(input, line))
    {
        ++line_number;
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty())
        {
            continue;
        }

        std::smatch match;
        if (!std::regex_match(line, match, pixel_line))
        {
            throw ParseError(line_number, line);
        }

        unsigned long index = 0;
        int brightness = 0;
        try
        {
            index = std::stoul(match[1].str());
            brightness = std::stoi(match[2].str());
        }
        catch (const std::out_of_range &)
        {
            throw ParseError(line_number, line);
        }

        // 行号必须连续，亮度必须在 [0, 255]，否则后续像素偏移全部错位
        if (index != profile.size() || brightness > MAX_BRIGHTNESS)
        {
            throw ParseError(line_number, line);
        }
        profile.push_back(brightness);
    }

    TankLevelLogger::debug("读取亮度数据 {} 个像素", profile.size());
    return profile;
}

BrightnessProfile parseBrightnessProfile(const std::string &text)
{
    std::istringstream ss(text);
    return parseBrightnessProfile(ss);
}

BrightnessProfile loadBrightnessProfile(const std::string &file_name)
{
    std::ifstream ifs(file_name);
    if (!ifs.is_open())
    {
        throw ParseError("无法打开亮度数据文件: " + file_name);
    }
    return parseBrightnessProfile(ifs);
}
