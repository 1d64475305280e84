#ifndef _TEST_ARCHIVES_HPP_
#define _TEST_ARCHIVES_HPP_

#include "PCH.h"

namespace testutil
{

// 测试结束时自动删除的临时目录
class TempDir
{
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const fs::path &path() const
    {
        return m_path;
    }
    fs::path operator/(const std::string &name) const
    {
        return m_path / name;
    }

private:
    fs::path m_path;
};

using Bytes = std::vector<std::uint8_t>;

// name 以 '/' 结尾时写成目录条目
struct ZipEntry
{
    std::string name;
    Bytes data;
};

void writeZip(const fs::path &path, const std::vector<ZipEntry> &entries);
void writeFile(const fs::path &path, const Bytes &data);

/**
 * @brief 用 OpenCV 编码一张确定性的测试图
 * 左半部分红色，右半部分蓝色（RGB 语义），channels 为 1/3/4。
 */
Bytes encodeImage(const std::string &ext, int width, int height, int channels = 3);

// 编码 JPEG 并在 SOI 后插入带 Orientation 的 EXIF APP1 段
Bytes jpegWithOrientation(int width, int height, int orientation);

Bytes textBytes(std::string_view text);

} // namespace testutil

#endif
