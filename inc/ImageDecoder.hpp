#ifndef _IMAGE_DECODER_HPP_
#define _IMAGE_DECODER_HPP_

#include "PCH.h"
#include "CacheKey.hpp"
#include "DecodedImage.hpp"

enum class DecoderBackend : std::uint8_t
{
    OpenCV,
    Stb
};

const char *backendName(DecoderBackend backend);
std::optional<DecoderBackend> parseBackend(std::string_view name);

/**
 * @class ImageDecoder
 * @brief 字节 -> 解码图像
 *
 * decode() 固定了处理顺序：大小检查 -> 探测尺寸(像素炸弹) -> 解码 -> EXIF 方向 -> 缩放。
 * 具体的容器解码和缩放由后端实现。同样的输入总是得到同样的输出。
 * 所有失败都以 ArkviewError 抛出。
 */
class ImageDecoder
{
public:
    // Pillow 默认上限的两倍
    static constexpr std::uint64_t kDefaultMaxPixels = 178956970;

    explicit ImageDecoder(std::uint64_t maxPixels = kDefaultMaxPixels);
    virtual ~ImageDecoder() = default;

    ImageDecoder(const ImageDecoder &) = delete;
    ImageDecoder &operator=(const ImageDecoder &) = delete;

    virtual DecoderBackend backend() const = 0;

    /**
     * @param bytes 压缩包成员的原始字节
     * @param maxSize 字节上限，超出直接拒绝
     * @param variant 目标变体，Original 不缩放
     * @param performanceMode 为 true 时使用最近邻缩放
     * @throw ArkviewError MemberEmpty / MemberTooLarge / DecompressionBomb / UnsupportedFormat / OutOfMemory
     */
    virtual ImageRef decode(std::span<const std::uint8_t> bytes, std::size_t maxSize,
                            const ImageVariant &variant, bool performanceMode);

    // 把已解码的原图缩到变体尺寸；不需要缩放时原样返回同一个对象
    virtual ImageRef resample(const ImageRef &image, const ImageVariant &variant, bool performanceMode) const;

    std::uint64_t maxPixels() const
    {
        return m_maxPixels;
    }
    void setMaxPixels(std::uint64_t maxPixels)
    {
        m_maxPixels = maxPixels;
    }

    // 等比缩放进 boxW x boxH，从不放大
    static std::pair<int, int> fitWithin(int width, int height, int boxW, int boxH);

    // JPEG APP1 中的 EXIF Orientation (0x0112)，没有则返回 1
    static int readExifOrientation(std::span<const std::uint8_t> bytes);

protected:
    struct Dimensions
    {
        int width = 0;
        int height = 0;
    };

    // 只读文件头拿尺寸；后端不认识的格式返回 nullopt，解码后再检查
    virtual std::optional<Dimensions> probe(std::span<const std::uint8_t> bytes) const = 0;

    /**
     * @brief 用 stbi_info 读 PNG/JPEG/BMP/GIF 等的文件头
     * @throw ArkviewError(DecompressionBomb) 如果尺寸大到 stb 直接拒绝
     */
    static std::optional<Dimensions> readHeader(std::span<const std::uint8_t> bytes);

    // 解码为 8 位 L / RGB / RGBA
    virtual DecodedImage decodePixels(std::span<const std::uint8_t> bytes) const = 0;

    virtual DecodedImage resizePixels(const DecodedImage &src, int width, int height, bool fast) const = 0;

    // 通用实现，按像素搬运
    virtual DecodedImage applyOrientation(const DecodedImage &src, int orientation) const;

    void checkPixelCount(std::uint64_t width, std::uint64_t height) const;

private:
    std::uint64_t m_maxPixels;
};

std::unique_ptr<ImageDecoder> createDecoder(DecoderBackend backend,
                                            std::uint64_t maxPixels = ImageDecoder::kDefaultMaxPixels);

#endif
