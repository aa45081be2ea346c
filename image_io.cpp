#include "image_io.h"
#include <algorithm>
#include <cctype>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <png.h>
#include <jpeglib.h> // needs FILE from <cstdio>

namespace fastblur {

static void fail_or_return(bool throw_on_error, const std::string& path, const char* msg) {
  if (throw_on_error) throw std::runtime_error(path.empty() ? std::string(msg) : path + ": " + msg);
}

ImageFormat format_from_path(const std::string& path) {
  const auto dot = path.find_last_of('.');
  if (dot == std::string::npos) return ImageFormat::Unknown;
  std::string ext = path.substr(dot);
  for (char& ch : ext) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (ext == ".png") return ImageFormat::Png;
  if (ext == ".jpg" || ext == ".jpeg") return ImageFormat::Jpeg;
  return ImageFormat::Unknown;
}

// ---------------- PNG ----------------

bool load_png(const std::string& path, Image& out, bool throw_on_error) {
  FILE* fp = std::fopen(path.c_str(), "rb");
  if (!fp) { fail_or_return(throw_on_error, path, "Failed to open PNG file"); return false; }

  png_byte header[8];
  if (std::fread(header, 1, 8, fp) != 8) {
    std::fclose(fp);
    fail_or_return(throw_on_error, path, "Failed to read PNG signature");
    return false;
  }
  if (png_sig_cmp(header, 0, 8)) {
    std::fclose(fp);
    fail_or_return(throw_on_error, path, "Not a PNG");
    return false;
  }

  png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
  if (!png_ptr) {
    std::fclose(fp);
    fail_or_return(throw_on_error, path, "png_create_read_struct failed");
    return false;
  }

  png_infop info_ptr = png_create_info_struct(png_ptr);
  if (!info_ptr) {
    png_destroy_read_struct(&png_ptr, nullptr, nullptr);
    std::fclose(fp);
    fail_or_return(throw_on_error, path, "png_create_info_struct failed");
    return false;
  }

  std::vector<unsigned char> buffer;
  std::vector<png_bytep> row_ptrs;

  if (setjmp(png_jmpbuf(png_ptr))) {
    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
    std::fclose(fp);
    fail_or_return(throw_on_error, path, "libpng error during read");
    return false;
  }

  png_init_io(png_ptr, fp);
  png_set_sig_bytes(png_ptr, 8);
  png_read_info(png_ptr, info_ptr);

  png_uint_32 width, height;
  int bit_depth, color_type;
  png_get_IHDR(png_ptr, info_ptr, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

  // Normalise to 8 bits per sample, keep the channel layout
  if (bit_depth == 16) png_set_strip_16(png_ptr);
  if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png_ptr);
  if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png_ptr);
  if (png_get_valid(png_ptr, info_ptr, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(png_ptr);

  png_read_update_info(png_ptr, info_ptr);

  png_size_t rowbytes = png_get_rowbytes(png_ptr, info_ptr);
  int channels = (int)png_get_channels(png_ptr, info_ptr);
  if (channels < 1 || channels > 4 || rowbytes != (png_size_t)width * (png_size_t)channels) {
    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
    std::fclose(fp);
    fail_or_return(throw_on_error, path, "Unexpected PNG layout after conversion");
    return false;
  }

  buffer.resize(rowbytes * height);
  row_ptrs.resize(height);
  for (size_t y = 0; y < height; ++y) {
    row_ptrs[y] = (png_bytep)&buffer[y * rowbytes];
  }

  png_read_image(png_ptr, row_ptrs.data());
  png_read_end(png_ptr, nullptr);
  png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
  std::fclose(fp);

  out.width = (int)width;
  out.height = (int)height;
  out.channels = channels;
  out.pixels = std::move(buffer);
  return true;
}

bool save_png(const std::string& path, const Image& img, bool throw_on_error) {
  static const int kColorTypes[] = {PNG_COLOR_TYPE_GRAY, PNG_COLOR_TYPE_GRAY_ALPHA,
                                    PNG_COLOR_TYPE_RGB, PNG_COLOR_TYPE_RGBA};
  if (img.width <= 0 || img.height <= 0 || img.channels < 1 || img.channels > 4 ||
      img.pixels.size() != (size_t)img.width * (size_t)img.height * (size_t)img.channels) {
    fail_or_return(throw_on_error, path, "PNG needs a 1-4 channel image");
    return false;
  }

  FILE* fp = std::fopen(path.c_str(), "wb");
  if (!fp) { fail_or_return(throw_on_error, path, "Failed to open PNG file for writing"); return false; }

  png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
  if (!png_ptr) {
    std::fclose(fp);
    fail_or_return(throw_on_error, path, "png_create_write_struct failed");
    return false;
  }
  png_infop info_ptr = png_create_info_struct(png_ptr);
  if (!info_ptr) {
    png_destroy_write_struct(&png_ptr, nullptr);
    std::fclose(fp);
    fail_or_return(throw_on_error, path, "png_create_info_struct failed");
    return false;
  }

  const size_t stride = (size_t)img.width * (size_t)img.channels;
  std::vector<png_bytep> row_ptrs((size_t)img.height);
  for (size_t y = 0; y < row_ptrs.size(); ++y) {
    row_ptrs[y] = (png_bytep)(img.pixels.data() + y * stride);
  }

  if (setjmp(png_jmpbuf(png_ptr))) {
    png_destroy_write_struct(&png_ptr, &info_ptr);
    std::fclose(fp);
    fail_or_return(throw_on_error, path, "libpng error during write");
    return false;
  }

  png_init_io(png_ptr, fp);
  png_set_IHDR(png_ptr, info_ptr, (png_uint_32)img.width, (png_uint_32)img.height, 8,
               kColorTypes[img.channels - 1], PNG_INTERLACE_NONE,
               PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
  png_write_info(png_ptr, info_ptr);
  png_write_image(png_ptr, row_ptrs.data());
  png_write_end(png_ptr, nullptr);
  png_destroy_write_struct(&png_ptr, &info_ptr);

  if (std::fclose(fp) != 0) {
    fail_or_return(throw_on_error, path, "Failed to flush PNG file");
    return false;
  }
  return true;
}

// ---------------- JPEG ----------------

namespace {

// libjpeg's default error_exit calls exit(); jump back to the caller instead
struct JpegErrorMgr {
  jpeg_error_mgr pub;
  std::jmp_buf jump;
  char message[JMSG_LENGTH_MAX];
};

void jpeg_error_exit_(j_common_ptr cinfo) {
  JpegErrorMgr* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
  (*cinfo->err->format_message)(cinfo, err->message);
  std::longjmp(err->jump, 1);
}

} // namespace

bool load_jpeg(const std::string& path, Image& out, bool throw_on_error) {
  FILE* fp = std::fopen(path.c_str(), "rb");
  if (!fp) { fail_or_return(throw_on_error, path, "Failed to open JPEG file"); return false; }

  jpeg_decompress_struct cinfo;
  JpegErrorMgr jerr;
  cinfo.err = jpeg_std_error(&jerr.pub);
  jerr.pub.error_exit = jpeg_error_exit_;
  jerr.message[0] = '\0';

  std::vector<unsigned char> buffer;

  if (setjmp(jerr.jump)) {
    jpeg_destroy_decompress(&cinfo);
    std::fclose(fp);
    fail_or_return(throw_on_error, path, jerr.message);
    return false;
  }

  jpeg_create_decompress(&cinfo);
  jpeg_stdio_src(&cinfo, fp);
  jpeg_read_header(&cinfo, TRUE);
  cinfo.out_color_space = (cinfo.jpeg_color_space == JCS_GRAYSCALE) ? JCS_GRAYSCALE : JCS_RGB;
  jpeg_start_decompress(&cinfo);

  const size_t stride = (size_t)cinfo.output_width * (size_t)cinfo.output_components;
  buffer.resize(stride * cinfo.output_height);
  while (cinfo.output_scanline < cinfo.output_height) {
    JSAMPROW row[1];
    row[0] = (JSAMPROW)(buffer.data() + (size_t)cinfo.output_scanline * stride);
    jpeg_read_scanlines(&cinfo, row, 1);
  }
  jpeg_finish_decompress(&cinfo);

  out.width = (int)cinfo.output_width;
  out.height = (int)cinfo.output_height;
  out.channels = cinfo.output_components;
  out.pixels = std::move(buffer);

  jpeg_destroy_decompress(&cinfo);
  std::fclose(fp);
  return true;
}

bool encode_jpeg_mem(const Image& img, int quality, std::vector<unsigned char>& out, bool throw_on_error) {
  if (img.width <= 0 || img.height <= 0 || (img.channels != 1 && img.channels != 3) ||
      img.pixels.size() != (size_t)img.width * (size_t)img.height * (size_t)img.channels) {
    fail_or_return(throw_on_error, "", "JPEG needs a gray or RGB image");
    return false;
  }

  jpeg_compress_struct cinfo;
  JpegErrorMgr jerr;
  cinfo.err = jpeg_std_error(&jerr.pub);
  jerr.pub.error_exit = jpeg_error_exit_;
  jerr.message[0] = '\0';
  unsigned char* jpegBuf = nullptr;
  unsigned long jpegSize = 0;

  if (setjmp(jerr.jump)) {
    jpeg_destroy_compress(&cinfo);
    std::free(jpegBuf);
    fail_or_return(throw_on_error, "", jerr.message);
    return false;
  }

  jpeg_create_compress(&cinfo);
  jpeg_mem_dest(&cinfo, &jpegBuf, &jpegSize);
  cinfo.image_width = img.width; cinfo.image_height = img.height;
  cinfo.input_components = img.channels;
  cinfo.in_color_space = (img.channels == 1) ? JCS_GRAYSCALE : JCS_RGB;
  jpeg_set_defaults(&cinfo);
  jpeg_set_quality(&cinfo, std::clamp(quality, 1, 100), TRUE);
  jpeg_start_compress(&cinfo, TRUE);
  const size_t stride = (size_t)img.width * (size_t)img.channels;
  JSAMPROW row[1];
  while (cinfo.next_scanline < cinfo.image_height) {
    row[0] = (JSAMPROW)(img.pixels.data() + cinfo.next_scanline * stride);
    jpeg_write_scanlines(&cinfo, row, 1);
  }
  jpeg_finish_compress(&cinfo);
  out.assign(jpegBuf, jpegBuf + jpegSize);
  jpeg_destroy_compress(&cinfo);
  std::free(jpegBuf);
  return true;
}

bool save_jpeg(const std::string& path, const Image& img, int quality, bool throw_on_error) {
  std::vector<unsigned char> bytes;
  if (!encode_jpeg_mem(img, quality, bytes, throw_on_error)) return false;

  FILE* fp = std::fopen(path.c_str(), "wb");
  if (!fp) { fail_or_return(throw_on_error, path, "Failed to open JPEG file for writing"); return false; }
  const size_t written = std::fwrite(bytes.data(), 1, bytes.size(), fp);
  const bool closed = std::fclose(fp) == 0;
  if (written != bytes.size() || !closed) {
    fail_or_return(throw_on_error, path, "Failed to write JPEG file");
    return false;
  }
  return true;
}

// ---------------- Dispatch ----------------

bool load_image(const std::string& path, Image& out, bool throw_on_error) {
  switch (format_from_path(path)) {
    case ImageFormat::Png: return load_png(path, out, throw_on_error);
    case ImageFormat::Jpeg: return load_jpeg(path, out, throw_on_error);
    case ImageFormat::Unknown: break;
  }
  fail_or_return(throw_on_error, path, "Unsupported image format (expected .png, .jpg or .jpeg)");
  return false;
}

bool save_image(const std::string& path, const Image& img, int jpeg_quality, bool throw_on_error) {
  switch (format_from_path(path)) {
    case ImageFormat::Png: return save_png(path, img, throw_on_error);
    case ImageFormat::Jpeg: return save_jpeg(path, img, jpeg_quality, throw_on_error);
    case ImageFormat::Unknown: break;
  }
  fail_or_return(throw_on_error, path, "Unsupported image format (expected .png, .jpg or .jpeg)");
  return false;
}

} // namespace fastblur
