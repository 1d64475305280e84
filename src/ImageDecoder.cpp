#include "ImageDecoder.hpp"
#include "LoadError.hpp"
#include "OpenCvDecoder.hpp"
#include "StbDecoder.hpp"

#include <stb_image.h>

const char *backendName(DecoderBackend backend)
{
    switch (backend)
    {
    case DecoderBackend::OpenCV:
        return "opencv";
    case DecoderBackend::Stb:
        return "stb";
    }
    return "opencv";
}

std::optional<DecoderBackend> parseBackend(std::string_view name)
{
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(), ::tolower);
    if (lower == "opencv")
        return DecoderBackend::OpenCV;
    if (lower == "stb")
        return DecoderBackend::Stb;
    return std::nullopt;
}

std::optional<ImageDecoder::Dimensions> ImageDecoder::readHeader(std::span<const std::uint8_t> bytes)
{
    int w = 0, h = 0, comp = 0;
    if (stbi_info_from_memory(bytes.data(), static_cast<int>(bytes.size()), &w, &h, &comp))
        return Dimensions{w, h};

    // stb 在读头阶段就拒绝超过 2^30 字节的图像
    const char *reason = stbi_failure_reason();
    if (reason && std::strcmp(reason, "too large") == 0)
        throw ArkviewError(LoadErrorKind::DecompressionBomb, "Image header declares oversized dimensions");
    return std::nullopt;
}

std::unique_ptr<ImageDecoder> createDecoder(DecoderBackend backend, std::uint64_t maxPixels)
{
    switch (backend)
    {
    case DecoderBackend::Stb:
        return std::make_unique<StbDecoder>(maxPixels);
    case DecoderBackend::OpenCV:
    default:
        return std::make_unique<OpenCvDecoder>(maxPixels);
    }
}

ImageDecoder::ImageDecoder(std::uint64_t maxPixels) : m_maxPixels(maxPixels)
{
}

void ImageDecoder::checkPixelCount(std::uint64_t width, std::uint64_t height) const
{
    if (width * height > m_maxPixels)
        throw ArkviewError(LoadErrorKind::DecompressionBomb,
                           fmt::format("Image size ({}x{}) exceeds limit of {} pixels", width, height, m_maxPixels));
}

ImageRef ImageDecoder::decode(std::span<const std::uint8_t> bytes, std::size_t maxSize,
                              const ImageVariant &variant, bool performanceMode)
{
    // 1. 大小
    if (bytes.empty())
        throw ArkviewError(LoadErrorKind::MemberEmpty, "Image file empty");
    if (bytes.size() > maxSize)
        throw ArkviewError(LoadErrorKind::MemberTooLarge,
                           fmt::format("Image data too large ({} > {})", bytes.size(), maxSize));

    // 2. 探测
    if (auto dims = probe(bytes))
        checkPixelCount(static_cast<std::uint64_t>(dims->width), static_cast<std::uint64_t>(dims->height));

    // 3. 解码
    DecodedImage image;
    try
    {
        image = decodePixels(bytes);
    }
    catch (const std::bad_alloc &)
    {
        throw ArkviewError(LoadErrorKind::OutOfMemory, "Out of memory while decoding");
    }
    if (!image.isValid())
        throw ArkviewError(LoadErrorKind::UnsupportedFormat, "Decoder produced no pixels");
    checkPixelCount(static_cast<std::uint64_t>(image.width()), static_cast<std::uint64_t>(image.height()));

    // 4. 方向
    const int orientation = readExifOrientation(bytes);
    if (orientation >= 2 && orientation <= 8)
        image = applyOrientation(image, orientation);

    // 5. 缩放
    ImageRef decoded = std::make_shared<const DecodedImage>(std::move(image));
    return resample(decoded, variant, performanceMode);
}

ImageRef ImageDecoder::resample(const ImageRef &image, const ImageVariant &variant, bool performanceMode) const
{
    if (!image || variant.isOriginal())
        return image;

    auto [w, h] = fitWithin(image->width(), image->height(), variant.width, variant.height);
    if (w == image->width() && h == image->height())
        return image;

    try
    {
        return std::make_shared<const DecodedImage>(resizePixels(*image, w, h, performanceMode));
    }
    catch (const std::bad_alloc &)
    {
        throw ArkviewError(LoadErrorKind::OutOfMemory, "Out of memory while resizing");
    }
}

std::pair<int, int> ImageDecoder::fitWithin(int width, int height, int boxW, int boxH)
{
    if (width <= 0 || height <= 0 || boxW <= 0 || boxH <= 0)
        return {width, height};
    if (width <= boxW && height <= boxH)
        return {width, height};

    const double scale = std::min(static_cast<double>(boxW) / width, static_cast<double>(boxH) / height);
    int w = static_cast<int>(std::lround(width * scale));
    int h = static_cast<int>(std::lround(height * scale));
    w = std::clamp(w, 1, boxW);
    h = std::clamp(h, 1, boxH);
    return {w, h};
}

namespace
{

std::uint16_t read16(const std::uint8_t *p, bool littleEndian)
{
    return littleEndian ? static_cast<std::uint16_t>(p[0] | (p[1] << 8))
                        : static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}

std::uint32_t read32(const std::uint8_t *p, bool littleEndian)
{
    return littleEndian ? (std::uint32_t(p[0]) | (std::uint32_t(p[1]) << 8) | (std::uint32_t(p[2]) << 16) | (std::uint32_t(p[3]) << 24))
                        : ((std::uint32_t(p[0]) << 24) | (std::uint32_t(p[1]) << 16) | (std::uint32_t(p[2]) << 8) | std::uint32_t(p[3]));
}

// TIFF 头 + IFD0，返回 Orientation 或 1
int parseTiffOrientation(const std::uint8_t *tiff, std::size_t len)
{
    if (len < 8)
        return 1;

    bool le;
    if (tiff[0] == 'I' && tiff[1] == 'I')
        le = true;
    else if (tiff[0] == 'M' && tiff[1] == 'M')
        le = false;
    else
        return 1;

    if (read16(tiff + 2, le) != 0x002A)
        return 1;

    // len >= 8，减法不会下溢
    const std::size_t ifd = read32(tiff + 4, le);
    if (ifd > len - 2)
        return 1;

    const std::uint16_t count = read16(tiff + ifd, le);
    for (std::uint16_t i = 0; i < count; ++i)
    {
        const std::size_t entry = ifd + 2 + static_cast<std::size_t>(i) * 12;
        if (entry > len || len - entry < 12)
            break;
        if (read16(tiff + entry, le) == 0x0112)
        {
            const std::uint16_t value = read16(tiff + entry + 8, le);
            return (value >= 1 && value <= 8) ? value : 1;
        }
    }
    return 1;
}

} // namespace

int ImageDecoder::readExifOrientation(std::span<const std::uint8_t> bytes)
{
    const std::uint8_t *data = bytes.data();
    const std::size_t size = bytes.size();
    if (size < 4 || data[0] != 0xFF || data[1] != 0xD8)
        return 1;

    std::size_t pos = 2;
    while (pos + 4 <= size)
    {
        if (data[pos] != 0xFF)
            return 1;
        const std::uint8_t marker = data[pos + 1];
        if (marker == 0xFF)
        {
            ++pos; // 填充字节
            continue;
        }
        if (marker == 0xDA || marker == 0xD9) // SOS / EOI
            return 1;

        const std::size_t segLen = read16(data + pos + 2, false);
        if (segLen < 2 || pos + 2 + segLen > size)
            return 1;

        const std::uint8_t *payload = data + pos + 4;
        const std::size_t payloadLen = segLen - 2;
        if (marker == 0xE1 && payloadLen >= 6 && std::memcmp(payload, "Exif\0\0", 6) == 0)
            return parseTiffOrientation(payload + 6, payloadLen - 6);

        pos += 2 + segLen;
    }
    return 1;
}

DecodedImage ImageDecoder::applyOrientation(const DecodedImage &src, int orientation) const
{
    const int W = src.width();
    const int H = src.height();
    const int ch = src.channels();
    const bool swap = orientation >= 5;
    const int outW = swap ? H : W;
    const int outH = swap ? W : H;

    std::vector<std::uint8_t> out(static_cast<std::size_t>(outW) * outH * ch);
    const std::uint8_t *in = src.data();

    for (int y = 0; y < outH; ++y)
    {
        for (int x = 0; x < outW; ++x)
        {
            int sx = x, sy = y;
            switch (orientation)
            {
            case 2: // 水平翻转
                sx = W - 1 - x;
                break;
            case 3: // 180
                sx = W - 1 - x;
                sy = H - 1 - y;
                break;
            case 4: // 垂直翻转
                sy = H - 1 - y;
                break;
            case 5: // 主对角线转置
                sx = y;
                sy = x;
                break;
            case 6: // 顺时针 90
                sx = y;
                sy = H - 1 - x;
                break;
            case 7: // 副对角线转置
                sx = W - 1 - y;
                sy = H - 1 - x;
                break;
            case 8: // 逆时针 90
                sx = W - 1 - y;
                sy = x;
                break;
            default:
                break;
            }
            std::memcpy(out.data() + (static_cast<std::size_t>(y) * outW + x) * ch,
                        in + (static_cast<std::size_t>(sy) * W + sx) * ch, ch);
        }
    }
    return DecodedImage(outW, outH, ch, std::move(out));
}
