#include "OpenCvDecoder.hpp"
#include "LoadError.hpp"

#include <opencv2/opencv.hpp>

namespace
{

cv::Mat wrap(const DecodedImage &img)
{
    return cv::Mat(img.height(), img.width(), CV_8UC(img.channels()),
                   const_cast<void *>(static_cast<const void *>(img.data())));
}

DecodedImage toImage(const cv::Mat &mat)
{
    cv::Mat continuous = mat.isContinuous() ? mat : mat.clone();
    const size_t dataSize = continuous.total() * continuous.elemSize();
    std::vector<std::uint8_t> pixels(dataSize);
    std::memcpy(pixels.data(), continuous.data, dataSize);
    return DecodedImage(continuous.cols, continuous.rows, continuous.channels(), std::move(pixels));
}

} // namespace

OpenCvDecoder::OpenCvDecoder(std::uint64_t maxPixels) : ImageDecoder(maxPixels)
{
}

std::optional<ImageDecoder::Dimensions> OpenCvDecoder::probe(std::span<const std::uint8_t> bytes) const
{
    // imdecode 没有只读头的接口；stb 不认识的格式 (TIFF/WebP) 解码后由基类再检查
    return readHeader(bytes);
}

DecodedImage OpenCvDecoder::decodePixels(std::span<const std::uint8_t> bytes) const
{
    cv::Mat decoded;
    try
    {
        cv::Mat rawData(1, static_cast<int>(bytes.size()), CV_8UC1,
                        const_cast<void *>(static_cast<const void *>(bytes.data())));
        // IMREAD_UNCHANGED 保留 alpha，且不自动应用 EXIF 方向
        decoded = cv::imdecode(rawData, cv::IMREAD_UNCHANGED);
    }
    catch (const cv::Exception &e)
    {
        throw ArkviewError(LoadErrorKind::UnsupportedFormat, std::string("Cannot identify image: ") + e.what());
    }
    if (decoded.empty())
        throw ArkviewError(LoadErrorKind::UnsupportedFormat, "Cannot identify image file");

    if (decoded.depth() == CV_16U)
        decoded.convertTo(decoded, CV_8U, 1.0 / 257.0);
    else if (decoded.depth() != CV_8U)
        decoded.convertTo(decoded, CV_8U);

    // 统一为 R,G,B(,A) 顺序
    cv::Mat out;
    switch (decoded.channels())
    {
    case 1:
        out = decoded;
        break;
    case 3:
        cv::cvtColor(decoded, out, cv::COLOR_BGR2RGB);
        break;
    case 4:
        cv::cvtColor(decoded, out, cv::COLOR_BGRA2RGBA);
        break;
    default:
        throw ArkviewError(LoadErrorKind::UnsupportedFormat,
                           fmt::format("Unsupported channel count {}", decoded.channels()));
    }
    return toImage(out);
}

DecodedImage OpenCvDecoder::resizePixels(const DecodedImage &src, int width, int height, bool fast) const
{
    cv::Mat dst;
    cv::resize(wrap(src), dst, cv::Size(width, height), 0, 0, fast ? cv::INTER_NEAREST : cv::INTER_AREA);
    return toImage(dst);
}

DecodedImage OpenCvDecoder::applyOrientation(const DecodedImage &src, int orientation) const
{
    cv::Mat in = wrap(src);
    cv::Mat out;
    switch (orientation)
    {
    case 2:
        cv::flip(in, out, 1);
        break;
    case 3:
        cv::rotate(in, out, cv::ROTATE_180);
        break;
    case 4:
        cv::flip(in, out, 0);
        break;
    case 5:
        cv::transpose(in, out);
        break;
    case 6:
        cv::rotate(in, out, cv::ROTATE_90_CLOCKWISE);
        break;
    case 7:
    {
        cv::Mat t;
        cv::transpose(in, t);
        cv::rotate(t, out, cv::ROTATE_180);
        break;
    }
    case 8:
        cv::rotate(in, out, cv::ROTATE_90_COUNTERCLOCKWISE);
        break;
    default:
        return src.clone();
    }
    return toImage(out);
}
