#ifndef _DECODEDIMAGE_HPP_
#define _DECODEDIMAGE_HPP_

#include "PCH.h"

class DecodedImage
{
public:
    // ==========================================
    // 1. 构造与析构 (RAII)
    // ==========================================

    // 每个缓存条目额外计入的元数据开销
    static constexpr std::size_t kEntryOverhead = 1024;

    DecodedImage() = default;

    /**
     * @brief 主构造函数
     * @param width 宽度
     * @param height 高度
     * @param channels 通道数 (1 灰度, 3 RGB, 4 RGBA)
     * @param pixels 像素数据 (会被移动进类内)
     * @param bytesPerChannel 每通道字节数，解码后统一为 1
     * @throw std::invalid_argument 如果像素数据大小与尺寸不匹配
     */
    DecodedImage(int width, int height, int channels, std::vector<std::uint8_t> pixels, int bytesPerChannel = 1) :
        m_width(width), m_height(height), m_channels(channels), m_bytesPerChannel(bytesPerChannel), m_pixels(std::move(pixels))
    {
        if (m_width > 0 && m_height > 0 && m_channels > 0)
        {
            size_t expectedSize = static_cast<size_t>(m_width) * m_height * m_channels * m_bytesPerChannel;
            if (m_pixels.size() != expectedSize)
            {
                throw std::invalid_argument("DecodedImage: Pixel data size does not match width * height * channels");
            }
        }
    }

    ~DecodedImage() = default;

    // ==========================================
    // 2. 禁止复制，允许移动
    // ==========================================
    DecodedImage(const DecodedImage &) = delete;
    DecodedImage &operator=(const DecodedImage &) = delete;

    DecodedImage(DecodedImage &&other) noexcept
        : m_width(std::exchange(other.m_width, 0)), m_height(std::exchange(other.m_height, 0)), m_channels(std::exchange(other.m_channels, 0)), m_bytesPerChannel(std::exchange(other.m_bytesPerChannel, 1)), m_pixels(std::move(other.m_pixels))
    {
    }

    DecodedImage &operator=(DecodedImage &&other) noexcept
    {
        if (this != &other)
        {
            m_width = std::exchange(other.m_width, 0);
            m_height = std::exchange(other.m_height, 0);
            m_channels = std::exchange(other.m_channels, 0);
            m_bytesPerChannel = std::exchange(other.m_bytesPerChannel, 1);
            m_pixels = std::move(other.m_pixels);
        }
        return *this;
    }

    // 深拷贝，用于在缓存副本上做派生变体
    DecodedImage clone() const
    {
        return DecodedImage(m_width, m_height, m_channels, m_pixels, m_bytesPerChannel);
    }

    // ==========================================
    // 3. 公共接口 (Accessors)
    // ==========================================
    int width() const
    {
        return m_width;
    }
    int height() const
    {
        return m_height;
    }
    int channels() const
    {
        return m_channels;
    }
    int bytesPerChannel() const
    {
        return m_bytesPerChannel;
    }

    const std::vector<std::uint8_t> &pixels() const
    {
        return m_pixels;
    }

    const std::uint8_t *data() const
    {
        return m_pixels.data();
    }

    bool isValid() const
    {
        return !m_pixels.empty() && m_width > 0 && m_height > 0 && m_channels > 0;
    }

    // 内存估算: w * h * channels * bytesPerChannel + 固定开销
    std::size_t memoryEstimate() const
    {
        return static_cast<std::size_t>(m_width) * m_height * m_channels * m_bytesPerChannel + kEntryOverhead;
    }

    const char *colorMode() const
    {
        switch (m_channels)
        {
        case 1:
            return "L";
        case 3:
            return "RGB";
        case 4:
            return "RGBA";
        default:
            return "?";
        }
    }

private:
    int m_width = 0;
    int m_height = 0;
    int m_channels = 0;
    int m_bytesPerChannel = 1;
    std::vector<std::uint8_t> m_pixels;
};

// 对外只暴露不可变的共享视图
using ImageRef = std::shared_ptr<const DecodedImage>;

#endif
