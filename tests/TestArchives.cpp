#include "TestArchives.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <fstream>
#include <random>
#include <stdexcept>
#include <opencv2/opencv.hpp>

namespace testutil
{

TempDir::TempDir()
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    m_path = fs::temp_directory_path() / ("arkview_test_" + std::to_string(gen()));
    fs::create_directories(m_path);
}

TempDir::~TempDir()
{
    std::error_code ec;
    fs::permissions(m_path, fs::perms::owner_all, fs::perm_options::add, ec);
    fs::remove_all(m_path, ec);
}

void writeZip(const fs::path &path, const std::vector<ZipEntry> &entries)
{
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());

    struct archive *a = archive_write_new();
    archive_write_set_format_zip(a);
    if (archive_write_open_filename(a, path.string().c_str()) != ARCHIVE_OK)
    {
        std::string err = archive_error_string(a) ? archive_error_string(a) : "open failed";
        archive_write_free(a);
        throw std::runtime_error("writeZip: " + err);
    }

    for (const auto &e : entries)
    {
        struct archive_entry *entry = archive_entry_new();
        archive_entry_set_pathname(entry, e.name.c_str());
        if (!e.name.empty() && e.name.back() == '/')
        {
            archive_entry_set_filetype(entry, AE_IFDIR);
            archive_entry_set_perm(entry, 0755);
            archive_entry_set_size(entry, 0);
            archive_write_header(a, entry);
        }
        else
        {
            archive_entry_set_filetype(entry, AE_IFREG);
            archive_entry_set_perm(entry, 0644);
            archive_entry_set_size(entry, static_cast<la_int64_t>(e.data.size()));
            archive_write_header(a, entry);
            if (!e.data.empty())
                archive_write_data(a, e.data.data(), e.data.size());
        }
        archive_entry_free(entry);
    }

    archive_write_close(a);
    archive_write_free(a);
}

void writeFile(const fs::path &path, const Bytes &data)
{
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
}

Bytes encodeImage(const std::string &ext, int width, int height, int channels)
{
    cv::Mat mat;
    switch (channels)
    {
    case 1:
        mat = cv::Mat(height, width, CV_8UC1, cv::Scalar(40));
        mat(cv::Rect(width / 2, 0, width - width / 2, height)).setTo(cv::Scalar(200));
        break;
    case 4:
        // BGRA
        mat = cv::Mat(height, width, CV_8UC4, cv::Scalar(0, 0, 255, 255));
        mat(cv::Rect(width / 2, 0, width - width / 2, height)).setTo(cv::Scalar(255, 0, 0, 128));
        break;
    default:
        // BGR
        mat = cv::Mat(height, width, CV_8UC3, cv::Scalar(0, 0, 255));
        mat(cv::Rect(width / 2, 0, width - width / 2, height)).setTo(cv::Scalar(255, 0, 0));
        break;
    }

    std::vector<int> params;
    if (ext == ".jpg" || ext == ".jpeg")
        params = {cv::IMWRITE_JPEG_QUALITY, 95};

    std::vector<std::uint8_t> buf;
    if (!cv::imencode(ext, mat, buf, params))
        throw std::runtime_error("encodeImage failed for " + ext);
    return buf;
}

Bytes jpegWithOrientation(int width, int height, int orientation)
{
    Bytes jpeg = encodeImage(".jpg", width, height, 3);

    // "Exif\0\0" + 小端 TIFF 头 + IFD0 (1 个条目)
    Bytes payload = {'E', 'x', 'i', 'f', 0, 0,
                     'I', 'I', 0x2A, 0x00, 0x08, 0x00, 0x00, 0x00,
                     0x01, 0x00,
                     0x12, 0x01, 0x03, 0x00, 0x01, 0x00, 0x00, 0x00,
                     static_cast<std::uint8_t>(orientation), 0x00, 0x00, 0x00,
                     0x00, 0x00, 0x00, 0x00};

    const std::size_t segLen = payload.size() + 2;
    Bytes segment = {0xFF, 0xE1, static_cast<std::uint8_t>(segLen >> 8), static_cast<std::uint8_t>(segLen & 0xFF)};
    segment.insert(segment.end(), payload.begin(), payload.end());

    jpeg.insert(jpeg.begin() + 2, segment.begin(), segment.end());
    return jpeg;
}

Bytes textBytes(std::string_view text)
{
    return Bytes(text.begin(), text.end());
}

} // namespace testutil
