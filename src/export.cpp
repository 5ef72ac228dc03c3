#include "export.hpp"

#include <png.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdint>
#include <vector>

#ifdef HAVE_JXL
#include <jxl/encode.h>
#include <jxl/encode_cxx.h>
#include <jxl/color_encoding.h>
#endif

static std::string lower_extension(const std::string& path)
{
    const size_t dot   = path.find_last_of('.');
    const size_t slash = path.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
        return {};
    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string export_image(const std::string& path, const PixelBuffer& buf)
{
    if (buf.width == 0 || buf.height == 0)
        return "Nothing to export: empty buffer";

    const std::string ext = lower_extension(path);
    if (ext == "png")
        return export_png(path.c_str(), buf);
#ifdef HAVE_JXL
    if (ext == "jxl")
        return export_jxl(path.c_str(), buf);
#endif
    return "Unsupported image format: " + path;
}

// ---------------------------------------------------------------------------
// PNG export
//
// Every pixel is opaque, so the image is written as 8-bit RGB. In memory each
// uint32_t is [R, G, B, A]; png_set_filler drops the trailing alpha byte.
// ---------------------------------------------------------------------------
std::string export_png(const char* path, const PixelBuffer& buf)
{
    FILE* fp = std::fopen(path, "wb");
    if (!fp)
        return std::string("Cannot open file for writing: ") + path;

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        std::fclose(fp);
        return "png_create_write_struct failed";
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        std::fclose(fp);
        return "png_create_info_struct failed";
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        return "PNG write error (libpng longjmp)";
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info, buf.width, buf.height,
                 8, PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    png_set_filler(png, 0, PNG_FILLER_AFTER);

    for (uint32_t y = 0; y < buf.height; ++y) {
        const png_const_bytep row = reinterpret_cast<png_const_bytep>(
            buf.pixels.data() + static_cast<size_t>(y) * buf.width);
        png_write_row(png, row);
    }

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    if (std::fclose(fp) != 0)
        return std::string("Error closing file: ") + path;
    return {};  // success
}

// ---------------------------------------------------------------------------
// JPEG XL export (lossless RGB, 8-bit)
// ---------------------------------------------------------------------------
#ifdef HAVE_JXL
std::string export_jxl(const char* path, const PixelBuffer& buf)
{
    JxlEncoderPtr enc = JxlEncoderMake(nullptr);
    if (!enc) return "JxlEncoderCreate failed";

    JxlBasicInfo bi;
    JxlEncoderInitBasicInfo(&bi);
    bi.xsize                 = buf.width;
    bi.ysize                 = buf.height;
    bi.bits_per_sample       = 8;
    bi.num_color_channels    = 3;
    bi.alpha_bits            = 0;
    bi.uses_original_profile = JXL_TRUE;
    if (JxlEncoderSetBasicInfo(enc.get(), &bi) != JXL_ENC_SUCCESS)
        return "JxlEncoderSetBasicInfo failed";

    JxlColorEncoding color;
    JxlColorEncodingSetToSRGB(&color, /*is_gray=*/JXL_FALSE);
    if (JxlEncoderSetColorEncoding(enc.get(), &color) != JXL_ENC_SUCCESS)
        return "JxlEncoderSetColorEncoding failed";

    JxlEncoderFrameSettings* opts = JxlEncoderFrameSettingsCreate(enc.get(), nullptr);
    if (JxlEncoderSetFrameLossless(opts, JXL_TRUE) != JXL_ENC_SUCCESS)
        return "JxlEncoderSetFrameLossless failed";

    // Repack [R, G, B, A] pixels as tightly packed RGB.
    std::vector<uint8_t> rgb;
    rgb.reserve(buf.pixels.size() * 3);
    for (const uint32_t p : buf.pixels) {
        rgb.push_back(static_cast<uint8_t>(p));
        rgb.push_back(static_cast<uint8_t>(p >> 8));
        rgb.push_back(static_cast<uint8_t>(p >> 16));
    }

    JxlPixelFormat fmt = {3, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
    if (JxlEncoderAddImageFrame(opts, &fmt, rgb.data(), rgb.size()) != JXL_ENC_SUCCESS)
        return "JxlEncoderAddImageFrame failed";
    JxlEncoderCloseInput(enc.get());

    std::vector<uint8_t> output(65536);
    uint8_t* next_out  = output.data();
    size_t   avail_out = output.size();
    JxlEncoderStatus status;
    while ((status = JxlEncoderProcessOutput(enc.get(), &next_out, &avail_out))
               == JXL_ENC_NEED_MORE_OUTPUT) {
        const size_t used = next_out - output.data();
        output.resize(output.size() * 2);
        next_out  = output.data() + used;
        avail_out = output.size() - used;
    }
    if (status != JXL_ENC_SUCCESS)
        return "JxlEncoderProcessOutput failed";
    output.resize(static_cast<size_t>(next_out - output.data()));

    FILE* fp = std::fopen(path, "wb");
    if (!fp) return std::string("Cannot open file for writing: ") + path;
    const size_t written = std::fwrite(output.data(), 1, output.size(), fp);
    const bool   closed  = std::fclose(fp) == 0;
    if (written != output.size() || !closed)
        return std::string("Short write: ") + path;
    return {};  // success
}
#endif  // HAVE_JXL
