#include <gtest/gtest.h>

#include "export.hpp"
#include "palette.hpp"
#include "progressive_renderer.hpp"

#include <png.h>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace {

std::string temp_path(const char* name)
{
    const char* dir = std::getenv("TMPDIR");
    return std::string(dir && *dir ? dir : "/tmp") + "/" + name;
}

// Reads an 8-bit RGB PNG back with libpng's simplified API.
bool read_png_rgb(const std::string& path, uint32_t& w, uint32_t& h, std::vector<uint8_t>& rgb)
{
    png_image img;
    std::memset(&img, 0, sizeof(img));
    img.version = PNG_IMAGE_VERSION;
    if (!png_image_begin_read_from_file(&img, path.c_str()))
        return false;
    img.format = PNG_FORMAT_RGB;
    rgb.resize(PNG_IMAGE_SIZE(img));
    if (!png_image_finish_read(&img, nullptr, rgb.data(), 0, nullptr))
        return false;
    w = img.width;
    h = img.height;
    return true;
}

}  // namespace

TEST(Export, PngRoundTripsGrayPixels)
{
    ViewState vs;
    vs.width  = 37;
    vs.height = 21;
    PixelBuffer buf;
    buf.resize(vs.width, vs.height);
    RenderProgress p;
    drain(buf, vs, p);

    const std::string path = temp_path("brot_export_test.png");
    ASSERT_EQ(export_image(path, buf), "");

    uint32_t w = 0, h = 0;
    std::vector<uint8_t> rgb;
    ASSERT_TRUE(read_png_rgb(path, w, h, rgb));
    EXPECT_EQ(w, 37u);
    EXPECT_EQ(h, 21u);
    for (uint32_t i = 0; i < w * h; ++i) {
        const uint32_t px = buf.pixels[i];
        ASSERT_EQ(rgb[3 * i + 0], pixel_red(px));
        ASSERT_EQ(rgb[3 * i + 1], pixel_green(px));
        ASSERT_EQ(rgb[3 * i + 2], pixel_blue(px));
    }
    std::remove(path.c_str());
}

TEST(Export, ExtensionIsCaseInsensitive)
{
    PixelBuffer buf;
    buf.resize(4, 4);
    const std::string path = temp_path("brot_export_test_upper.PNG");
    EXPECT_EQ(export_image(path, buf), "");
    std::remove(path.c_str());
}

TEST(Export, ReportsErrors)
{
    PixelBuffer buf;
    buf.resize(4, 4);
    EXPECT_NE(export_image(temp_path("brot_export_test.bmp"), buf), "");
    EXPECT_NE(export_image(temp_path("no_extension"), buf), "");
    EXPECT_NE(export_image("/nonexistent-dir/out.png", buf), "");

    PixelBuffer empty;
    EXPECT_NE(export_image(temp_path("brot_empty.png"), empty), "");
}
