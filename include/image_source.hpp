#ifndef IMAGE_SOURCE_HPP
#define IMAGE_SOURCE_HPP

#include <ctime>
#include <string>
#include <vector>

/**
 * @brief 网络摄像头参数
 */
struct CameraConfig
{
    std::string host;
    std::string username;
    std::string password;
};

/**
 * @brief 标尺条带在原图中的位置及边缘检测参数
 */
struct StripGeometry
{
    int strip_width = 60;
    int strip_offset = 236; // 条带左边缘距图像左侧的像素
    int image_height = 480;
    int edge = 20;          // convert -edge 半径
};

/**
 * @brief 临时文件，析构时删除
 */
class TempFile
{
public:
    /**
     * @param suffix 文件后缀，如 ".jpg"
     * @throw AcquisitionError 无法创建文件
     */
    explicit TempFile(const std::string &suffix);
    ~TempFile();

    TempFile(const TempFile &) = delete;
    TempFile &operator=(const TempFile &) = delete;

    const std::string &path() const { return path_; }

    // 保留文件，析构时不删除
    void keep() { keep_ = true; }

private:
    std::string path_;
    bool keep_ = false;
};

// 为shell命令行加单引号
std::string shellQuote(const std::string &arg);

/**
 * @brief 执行外部命令并收集输出（stdout和stderr）
 * @param args 程序及参数
 * @param output 命令输出
 * @return 命令退出码，无法执行时返回-1
 */
int runCommand(const std::vector<std::string> &args, std::string &output);

// 摄像头快照地址，末尾附加时间戳避免缓存
std::string snapshotUrl(const CameraConfig &camera, std::time_t now);

// convert -crop 参数，如 "60x480+236+0"
std::string cropGeometry(const StripGeometry &geometry);

/**
 * @brief 通过curl下载摄像头快照
 * @throw AcquisitionError 下载失败
 */
void fetchSnapshot(const CameraConfig &camera, const std::string &image_file);

/**
 * @brief 调用ImageMagick裁剪条带、灰度化、边缘检测并压缩为单列，输出txt格式
 * @throw AcquisitionError convert执行失败
 */
void preprocessStrip(const std::string &image_file, const std::string &dump_file, const StripGeometry &geometry);

#endif // IMAGE_SOURCE_HPP
