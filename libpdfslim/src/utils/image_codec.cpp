#include "../../include/image_codec.hpp"
#include "../../include/logger.hpp"
#include <jpeglib.h>
#include <openjpeg.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <utility>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    throw std::runtime_error(std::string("libjpeg: ") + err->msg);
}

// warnings are routed to the logger instead of stderr
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + buffer, "image_codec");
}

struct DecompressGuard {
    jpeg_decompress_struct* cinfo;
    ~DecompressGuard() { jpeg_destroy_decompress(cinfo); }
};

struct CompressGuard {
    jpeg_compress_struct* cinfo;
    ~CompressGuard() { jpeg_destroy_compress(cinfo); }
};

// openjpeg memory stream, read-only
struct OpjMemStream {
    const unsigned char* data;
    OPJ_SIZE_T size;
    OPJ_SIZE_T pos;
};

OPJ_SIZE_T opj_mem_read(void* buffer, const OPJ_SIZE_T nb_bytes, void* user_data) {
    auto* stream = static_cast<OpjMemStream*>(user_data);
    const OPJ_SIZE_T remaining = stream->size - stream->pos;
    const OPJ_SIZE_T to_read = std::min(nb_bytes, remaining);
    if (to_read == 0) {
        return static_cast<OPJ_SIZE_T>(-1);
    }
    std::memcpy(buffer, stream->data + stream->pos, to_read);
    stream->pos += to_read;
    return to_read;
}

OPJ_OFF_T opj_mem_skip(const OPJ_OFF_T nb_bytes, void* user_data) {
    auto* stream = static_cast<OpjMemStream*>(user_data);
    if (nb_bytes < 0) return -1;
    const OPJ_SIZE_T remaining = stream->size - stream->pos;
    const OPJ_SIZE_T to_skip = std::min(static_cast<OPJ_SIZE_T>(nb_bytes), remaining);
    stream->pos += to_skip;
    return static_cast<OPJ_OFF_T>(to_skip);
}

OPJ_BOOL opj_mem_seek(const OPJ_OFF_T nb_bytes, void* user_data) {
    auto* stream = static_cast<OpjMemStream*>(user_data);
    if (nb_bytes < 0 || static_cast<OPJ_SIZE_T>(nb_bytes) > stream->size) return OPJ_FALSE;
    stream->pos = static_cast<OPJ_SIZE_T>(nb_bytes);
    return OPJ_TRUE;
}

void opj_log_warning(const char* msg, void*) {
    Logger::log(LogLevel::Debug, std::string("openjpeg: ") + msg, "image_codec");
}

struct OpjCodecDeleter {
    void operator()(opj_codec_t* c) const { opj_destroy_codec(c); }
};
struct OpjStreamDeleter {
    void operator()(opj_stream_t* s) const { opj_stream_destroy(s); }
};
struct OpjImageDeleter {
    void operator()(opj_image_t* i) const { opj_image_destroy(i); }
};

bool has_jp2_signature(const std::span<const unsigned char> data) {
    static constexpr unsigned char kSignature[] = {0x00, 0x00, 0x00, 0x0C, 0x6A, 0x50, 0x20, 0x20};
    return data.size() >= sizeof(kSignature) && std::equal(std::begin(kSignature), std::end(kSignature), data.begin());
}

unsigned char component_sample(const opj_image_comp_t& comp, std::uint32_t x, std::uint32_t y) {
    if (comp.dx > 1) x /= comp.dx;
    if (comp.dy > 1) y /= comp.dy;
    x = std::min(x, comp.w - 1);
    y = std::min(y, comp.h - 1);
    int value = comp.data[static_cast<std::size_t>(y) * comp.w + x];
    if (comp.sgnd) {
        value += 1 << (comp.prec - 1);
    }
    if (comp.prec > 8) {
        value >>= comp.prec - 8;
    } else if (comp.prec < 8) {
        value <<= 8 - comp.prec;
    }
    return static_cast<unsigned char>(std::clamp(value, 0, 255));
}

// helper: per destination index, the source indices it covers with their weights
std::vector<std::vector<std::pair<std::uint32_t, float>>> coverage(const std::uint32_t src, const std::uint32_t dst) {
    std::vector<std::vector<std::pair<std::uint32_t, float>>> table(dst);
    const double step = static_cast<double>(src) / dst;
    for (std::uint32_t i = 0; i < dst; ++i) {
        const double start = i * step;
        const double end = std::min(static_cast<double>(src), (i + 1) * step);
        const auto first = static_cast<std::uint32_t>(std::floor(start));
        const auto last = std::min(src, static_cast<std::uint32_t>(std::ceil(end)));
        const double span = end - start;
        for (std::uint32_t s = first; s < last; ++s) {
            const double w = std::min(end, s + 1.0) - std::max(start, static_cast<double>(s));
            if (w > 0.0) {
                table[i].emplace_back(s, static_cast<float>(w / span));
            }
        }
    }
    return table;
}

} // namespace

namespace pdfslim::codec {

RasterImage decode_jpeg(const std::span<const unsigned char> data) {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr jerr{};
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_throw;
    jerr.pub.output_message = jpeg_output_message_log;

    jpeg_create_decompress(&cinfo);
    DecompressGuard guard{&cinfo};

    jpeg_mem_src(&cinfo, data.data(), static_cast<unsigned long>(data.size()));
    if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
        throw std::runtime_error("Invalid JPEG header");
    }

    switch (cinfo.jpeg_color_space) {
        case JCS_GRAYSCALE:
            cinfo.out_color_space = JCS_GRAYSCALE;
            break;
        case JCS_RGB:
        case JCS_YCbCr:
            cinfo.out_color_space = JCS_RGB;
            break;
        case JCS_CMYK:
        case JCS_YCCK:
            cinfo.out_color_space = JCS_CMYK;
            break;
        default:
            throw std::runtime_error("Unsupported JPEG colour space");
    }

    jpeg_start_decompress(&cinfo);

    RasterImage image;
    image.width = cinfo.output_width;
    image.height = cinfo.output_height;
    image.components = cinfo.output_components;
    image.inverted_cmyk = image.components == 4 && cinfo.saw_Adobe_marker;
    image.pixels.resize(image.expected_size());

    const std::size_t row_stride = static_cast<std::size_t>(image.width) * image.components;
    while (cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW row = image.pixels.data() + cinfo.output_scanline * row_stride;
        jpeg_read_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_decompress(&cinfo);
    return image;
}

std::string encode_jpeg(const RasterImage& image, const int quality) {
    if (image.components != 1 && image.components != 3 && image.components != 4) {
        throw std::invalid_argument("JPEG encoding needs 1, 3 or 4 components");
    }
    if (image.pixels.size() < image.expected_size()) {
        throw std::invalid_argument("Raster buffer is smaller than its dimensions");
    }

    jpeg_compress_struct cinfo{};
    JpegErrorMgr jerr{};
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_throw;
    jerr.pub.output_message = jpeg_output_message_log;

    jpeg_create_compress(&cinfo);
    CompressGuard guard{&cinfo};

    unsigned char* out_raw = nullptr;
    unsigned long out_size = 0;
    jpeg_mem_dest(&cinfo, &out_raw, &out_size);
    // libjpeg mallocs the destination and may move it while writing, so free through the variable
    struct MemDestGuard {
        unsigned char** buffer;
        ~MemDestGuard() { std::free(*buffer); }
    } out_guard{&out_raw};

    cinfo.image_width = image.width;
    cinfo.image_height = image.height;
    cinfo.input_components = image.components;
    switch (image.components) {
        case 1:
            cinfo.in_color_space = JCS_GRAYSCALE;
            break;
        case 3:
            cinfo.in_color_space = JCS_RGB;
            break;
        default:
            cinfo.in_color_space = JCS_CMYK;
            break;
    }
    jpeg_set_defaults(&cinfo);
    if (image.components == 4) {
        // samples pass through untouched; the Adobe marker keeps the source's inversion convention
        jpeg_set_colorspace(&cinfo, JCS_CMYK);
        cinfo.write_Adobe_marker = image.inverted_cmyk ? TRUE : FALSE;
    }
    jpeg_set_quality(&cinfo, std::clamp(quality, 1, 100), TRUE);
    cinfo.optimize_coding = TRUE;

    jpeg_start_compress(&cinfo, TRUE);
    const std::size_t row_stride = static_cast<std::size_t>(image.width) * image.components;
    while (cinfo.next_scanline < cinfo.image_height) {
        auto row = const_cast<JSAMPROW>(image.pixels.data() + cinfo.next_scanline * row_stride);
        jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);

    return {reinterpret_cast<const char*>(out_raw), static_cast<std::size_t>(out_size)};
}

RasterImage decode_jpx(const std::span<const unsigned char> data) {
    if (data.empty()) {
        throw std::runtime_error("Empty JPEG2000 stream");
    }

    const OPJ_CODEC_FORMAT format = has_jp2_signature(data) ? OPJ_CODEC_JP2 : OPJ_CODEC_J2K;
    const std::unique_ptr<opj_codec_t, OpjCodecDeleter> codec(opj_create_decompress(format));
    if (!codec) {
        throw std::runtime_error("openjpeg: cannot create decoder");
    }
    opj_set_warning_handler(codec.get(), opj_log_warning, nullptr);
    opj_set_error_handler(codec.get(), opj_log_warning, nullptr);

    opj_dparameters_t params;
    opj_set_default_decoder_parameters(&params);
    if (!opj_setup_decoder(codec.get(), &params)) {
        throw std::runtime_error("openjpeg: decoder setup failed");
    }

    OpjMemStream mem{data.data(), data.size(), 0};
    const std::unique_ptr<opj_stream_t, OpjStreamDeleter> stream(opj_stream_create(OPJ_J2K_STREAM_CHUNK_SIZE, OPJ_TRUE));
    if (!stream) {
        throw std::runtime_error("openjpeg: cannot create stream");
    }
    opj_stream_set_user_data(stream.get(), &mem, nullptr);
    opj_stream_set_user_data_length(stream.get(), data.size());
    opj_stream_set_read_function(stream.get(), opj_mem_read);
    opj_stream_set_skip_function(stream.get(), opj_mem_skip);
    opj_stream_set_seek_function(stream.get(), opj_mem_seek);

    opj_image_t* raw_image = nullptr;
    if (!opj_read_header(stream.get(), codec.get(), &raw_image)) {
        opj_image_destroy(raw_image);
        throw std::runtime_error("openjpeg: cannot read header");
    }
    const std::unique_ptr<opj_image_t, OpjImageDeleter> decoded(raw_image);
    if (!opj_decode(codec.get(), stream.get(), decoded.get()) ||
        !opj_end_decompress(codec.get(), stream.get())) {
        throw std::runtime_error("openjpeg: decode failed");
    }

    if (decoded->color_space == OPJ_CLRSPC_SYCC || decoded->color_space == OPJ_CLRSPC_EYCC ||
        decoded->color_space == OPJ_CLRSPC_CMYK) {
        throw std::runtime_error("openjpeg: unsupported colour space");
    }
    if (decoded->numcomps < 1 || decoded->x1 <= decoded->x0 || decoded->y1 <= decoded->y0) {
        throw std::runtime_error("openjpeg: empty image");
    }
    for (OPJ_UINT32 c = 0; c < decoded->numcomps; ++c) {
        if (!decoded->comps[c].data || decoded->comps[c].w == 0 || decoded->comps[c].h == 0) {
            throw std::runtime_error("openjpeg: component without data");
        }
        if (decoded->comps[c].prec == 0 || decoded->comps[c].prec > 16) {
            throw std::runtime_error("openjpeg: unsupported component precision " +
                                     std::to_string(decoded->comps[c].prec));
        }
    }

    RasterImage image;
    image.width = decoded->x1 - decoded->x0;
    image.height = decoded->y1 - decoded->y0;
    image.components = decoded->numcomps >= 3 ? 3 : 1;
    image.pixels.resize(image.expected_size());

    std::size_t i = 0;
    for (std::uint32_t y = 0; y < image.height; ++y) {
        for (std::uint32_t x = 0; x < image.width; ++x) {
            for (int c = 0; c < image.components; ++c) {
                image.pixels[i++] = component_sample(decoded->comps[c], x, y);
            }
        }
    }
    return image;
}

RasterImage resample_area(const RasterImage& image, const std::uint32_t target_width, const std::uint32_t target_height) {
    if (image.width == 0 || image.height == 0 || image.components <= 0 ||
        image.pixels.size() < image.expected_size()) {
        throw std::invalid_argument("Cannot resample an empty or truncated raster");
    }
    if (target_width == 0 || target_height == 0) {
        throw std::invalid_argument("Target dimensions must be positive");
    }

    const int comps = image.components;
    const auto xs = coverage(image.width, target_width);
    const auto ys = coverage(image.height, target_height);

    // horizontal pass into floats, then vertical pass into bytes
    std::vector<float> rows(static_cast<std::size_t>(target_width) * image.height * comps, 0.0f);
    for (std::uint32_t y = 0; y < image.height; ++y) {
        const unsigned char* src = image.pixels.data() + static_cast<std::size_t>(y) * image.width * comps;
        float* dst = rows.data() + static_cast<std::size_t>(y) * target_width * comps;
        for (std::uint32_t x = 0; x < target_width; ++x) {
            for (const auto& [sx, w] : xs[x]) {
                for (int c = 0; c < comps; ++c) {
                    dst[x * comps + c] += w * src[sx * comps + c];
                }
            }
        }
    }

    RasterImage out;
    out.width = target_width;
    out.height = target_height;
    out.components = comps;
    out.inverted_cmyk = image.inverted_cmyk;
    out.pixels.resize(out.expected_size());
    const std::size_t row_len = static_cast<std::size_t>(target_width) * comps;
    std::vector<float> acc(row_len);
    for (std::uint32_t y = 0; y < target_height; ++y) {
        std::fill(acc.begin(), acc.end(), 0.0f);
        for (const auto& [sy, w] : ys[y]) {
            const float* src = rows.data() + sy * row_len;
            for (std::size_t k = 0; k < row_len; ++k) {
                acc[k] += w * src[k];
            }
        }
        unsigned char* dst = out.pixels.data() + y * row_len;
        for (std::size_t k = 0; k < row_len; ++k) {
            dst[k] = static_cast<unsigned char>(std::clamp(std::lround(acc[k]), 0L, 255L));
        }
    }
    return out;
}

} // namespace pdfslim::codec
