#include "StbDecoder.hpp"
#include "LoadError.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb_image_resize2.h>

namespace
{

struct StbiDeleter
{
    void operator()(stbi_uc *p) const
    {
        stbi_image_free(p);
    }
};
using StbiPtr = std::unique_ptr<stbi_uc, StbiDeleter>;

stbir_pixel_layout layoutFor(int channels)
{
    switch (channels)
    {
    case 1:
        return STBIR_1CHANNEL;
    case 3:
        return STBIR_RGB;
    default:
        return STBIR_RGBA;
    }
}

} // namespace

StbDecoder::StbDecoder(std::uint64_t maxPixels) : ImageDecoder(maxPixels)
{
}

std::optional<ImageDecoder::Dimensions> StbDecoder::probe(std::span<const std::uint8_t> bytes) const
{
    return readHeader(bytes);
}

DecodedImage StbDecoder::decodePixels(std::span<const std::uint8_t> bytes) const
{
    int w = 0, h = 0, comp = 0;
    const auto *data = bytes.data();
    const int len = static_cast<int>(bytes.size());
    if (!stbi_info_from_memory(data, len, &w, &h, &comp))
    {
        const char *reason = stbi_failure_reason();
        throw ArkviewError(LoadErrorKind::UnsupportedFormat,
                           std::string("Cannot identify image: ") + (reason ? reason : "unknown"));
    }

    // 灰度+alpha 展开成 RGBA
    const int wanted = comp == 2 ? 4 : comp;
    StbiPtr pixels(stbi_load_from_memory(data, len, &w, &h, &comp, wanted));
    if (!pixels)
    {
        const char *reason = stbi_failure_reason();
        if (reason && std::strcmp(reason, "outofmem") == 0)
            throw std::bad_alloc();
        throw ArkviewError(LoadErrorKind::UnsupportedFormat,
                           std::string("Cannot decode image: ") + (reason ? reason : "unknown"));
    }

    const std::size_t size = static_cast<std::size_t>(w) * h * wanted;
    std::vector<std::uint8_t> buffer(pixels.get(), pixels.get() + size);
    return DecodedImage(w, h, wanted, std::move(buffer));
}

DecodedImage StbDecoder::resizePixels(const DecodedImage &src, int width, int height, bool fast) const
{
    const int ch = src.channels();
    std::vector<std::uint8_t> out(static_cast<std::size_t>(width) * height * ch);

    void *result = stbir_resize(src.data(), src.width(), src.height(), src.width() * ch,
                                out.data(), width, height, width * ch,
                                layoutFor(ch), STBIR_TYPE_UINT8, STBIR_EDGE_CLAMP,
                                fast ? STBIR_FILTER_POINT_SAMPLE : STBIR_FILTER_DEFAULT);
    if (!result)
        throw ArkviewError(LoadErrorKind::Internal, "stbir_resize failed");
    return DecodedImage(width, height, ch, std::move(out));
}
