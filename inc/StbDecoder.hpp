#ifndef _STB_DECODER_HPP_
#define _STB_DECODER_HPP_

#include "ImageDecoder.hpp"

// stb_image / stb_image_resize2 后端，不依赖 OpenCV 的编解码器
class StbDecoder : public ImageDecoder
{
public:
    explicit StbDecoder(std::uint64_t maxPixels = kDefaultMaxPixels);

    DecoderBackend backend() const override
    {
        return DecoderBackend::Stb;
    }

protected:
    std::optional<Dimensions> probe(std::span<const std::uint8_t> bytes) const override;
    DecodedImage decodePixels(std::span<const std::uint8_t> bytes) const override;
    DecodedImage resizePixels(const DecodedImage &src, int width, int height, bool fast) const override;
};

#endif
