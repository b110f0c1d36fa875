#include "image_source.hpp"
#include "level_errors.hpp"
#include "logger.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

TempFile::TempFile(const std::string &suffix)
{
    std::string pattern = "/tmp/tank_level_XXXXXX" + suffix;
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = mkstemps(buffer.data(), static_cast<int>(suffix.size()));
    if (fd < 0)
    {
        throw AcquisitionError("无法创建临时文件: " + pattern);
    }
    close(fd);
    path_ = buffer.data();
}

TempFile::~TempFile()
{
    if (!keep_ && !path_.empty())
    {
        std::remove(path_.c_str());
    }
}

std::string shellQuote(const std::string &arg)
{
    std::string quoted = "'";
    for (char c : arg)
    {
        if (c == '\'')
            quoted += "'\\''";
        else
            quoted += c;
    }
    quoted += "'";
    return quoted;
}

int runCommand(const std::vector<std::string> &args, std::string &output)
{
    std::ostringstream cmd;
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (i > 0)
            cmd << ' ';
        cmd << shellQuote(args[i]);
    }
    cmd << " 2>&1";

    output.clear();
    FILE *pipe = popen(cmd.str().c_str(), "r");
    if (!pipe)
    {
        TankLevelLogger::error("无法执行命令: {}", args.empty() ? std::string() : args.front());
        return -1;
    }

    std::array<char, 4096> buffer;
    while (fgets(buffer.data(), buffer.size(), pipe))
    {
        output += buffer.data();
    }

    int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status))
    {
        return -1;
    }
    return WEXITSTATUS(status);
}

std::string snapshotUrl(const CameraConfig &camera, std::time_t now)
{
    std::ostringstream url;
    url << "http://" << camera.host << "/snapshot.cgi?user=" << camera.username
        << "&pwd=" << camera.password << "&" << static_cast<long long>(now);
    return url.str();
}

std::string cropGeometry(const StripGeometry &geometry)
{
    std::ostringstream ss;
    ss << geometry.strip_width << "x" << geometry.image_height << "+" << geometry.strip_offset << "+0";
    return ss.str();
}

void fetchSnapshot(const CameraConfig &camera, const std::string &image_file)
{
    TankLevelLogger::debug("保存快照到: {}", image_file);

    std::string output;
    int status = runCommand({"curl", "-s", "-S", "-f", "-o", image_file, snapshotUrl(camera, std::time(nullptr))},
                            output);
    if (status != 0)
    {
        throw AcquisitionError("从 " + camera.host + " 下载快照失败 (退出码 " + std::to_string(status) + "): " +
                               output);
    }
}

void preprocessStrip(const std::string &image_file, const std::string &dump_file, const StripGeometry &geometry)
{
    TankLevelLogger::debug("输出亮度数据到: {}", dump_file);

    std::string output;
    int status = runCommand({"convert", "-crop", cropGeometry(geometry),
                             "-colorspace", "Gray",
                             "-edge", std::to_string(geometry.edge),
                             "-liquid-rescale", "1x100%",
                             image_file, dump_file},
                            output);
    if (status != 0 || !output.empty())
    {
        throw AcquisitionError("convert 处理图像失败 (退出码 " + std::to_string(status) + "): " + output);
    }
}
