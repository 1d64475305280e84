#ifndef _OPENCV_DECODER_HPP_
#define _OPENCV_DECODER_HPP_

#include "ImageDecoder.hpp"

// cv::imdecode / cv::resize 后端
class OpenCvDecoder : public ImageDecoder
{
public:
    explicit OpenCvDecoder(std::uint64_t maxPixels = kDefaultMaxPixels);

    DecoderBackend backend() const override
    {
        return DecoderBackend::OpenCV;
    }

protected:
    std::optional<Dimensions> probe(std::span<const std::uint8_t> bytes) const override;
    DecodedImage decodePixels(std::span<const std::uint8_t> bytes) const override;
    DecodedImage resizePixels(const DecodedImage &src, int width, int height, bool fast) const override;
    DecodedImage applyOrientation(const DecodedImage &src, int orientation) const override;
};

#endif
