// JPEG2000 fixtures: lossless J2K codestreams written by OpenJPEG into memory.

#ifndef PDFSLIM_JPX_FIXTURE_HPP
#define PDFSLIM_JPX_FIXTURE_HPP

#include <openjpeg.h>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace pdfslim::test {

namespace detail {

struct OpjOutput {
    std::vector<unsigned char> data;
    OPJ_SIZE_T pos = 0;
};

inline OPJ_SIZE_T opj_out_write(void* buffer, const OPJ_SIZE_T nb_bytes, void* user_data) {
    auto* out = static_cast<OpjOutput*>(user_data);
    if (out->pos + nb_bytes > out->data.size()) {
        out->data.resize(out->pos + nb_bytes);
    }
    std::memcpy(out->data.data() + out->pos, buffer, nb_bytes);
    out->pos += nb_bytes;
    return nb_bytes;
}

inline OPJ_OFF_T opj_out_skip(const OPJ_OFF_T nb_bytes, void* user_data) {
    auto* out = static_cast<OpjOutput*>(user_data);
    if (nb_bytes < 0) return -1;
    out->pos += static_cast<OPJ_SIZE_T>(nb_bytes);
    if (out->pos > out->data.size()) {
        out->data.resize(out->pos);
    }
    return nb_bytes;
}

inline OPJ_BOOL opj_out_seek(const OPJ_OFF_T nb_bytes, void* user_data) {
    auto* out = static_cast<OpjOutput*>(user_data);
    if (nb_bytes < 0) return OPJ_FALSE;
    out->pos = static_cast<OPJ_SIZE_T>(nb_bytes);
    if (out->pos > out->data.size()) {
        out->data.resize(out->pos);
    }
    return OPJ_TRUE;
}

struct CodecDeleter {
    void operator()(opj_codec_t* c) const { opj_destroy_codec(c); }
};
struct StreamDeleter {
    void operator()(opj_stream_t* s) const { opj_stream_destroy(s); }
};
struct ImageDeleter {
    void operator()(opj_image_t* i) const { opj_image_destroy(i); }
};

} // namespace detail

// Lossless raw J2K codestream of interleaved 8-bit @p pixels (1 or 3 components),
// stored at @p precision bits by shifting each sample left.
inline std::string encode_j2k(const std::string& pixels, const int width, const int height, const int components,
                              const int precision = 8) {
    if (pixels.size() < static_cast<size_t>(width) * height * components) {
        throw std::invalid_argument("pixel buffer too small");
    }

    std::vector<opj_image_cmptparm_t> params(components);
    for (auto& p : params) {
        std::memset(&p, 0, sizeof(p));
        p.dx = 1;
        p.dy = 1;
        p.w = static_cast<OPJ_UINT32>(width);
        p.h = static_cast<OPJ_UINT32>(height);
        p.prec = static_cast<OPJ_UINT32>(precision);
        p.sgnd = 0;
    }
    const std::unique_ptr<opj_image_t, detail::ImageDeleter> image(
        opj_image_create(static_cast<OPJ_UINT32>(components), params.data(),
                         components == 1 ? OPJ_CLRSPC_GRAY : OPJ_CLRSPC_SRGB));
    if (!image) {
        throw std::runtime_error("opj_image_create failed");
    }
    image->x0 = 0;
    image->y0 = 0;
    image->x1 = static_cast<OPJ_UINT32>(width);
    image->y1 = static_cast<OPJ_UINT32>(height);
    const size_t count = static_cast<size_t>(width) * height;
    for (int c = 0; c < components; ++c) {
        for (size_t i = 0; i < count; ++i) {
            image->comps[c].data[i] = static_cast<unsigned char>(pixels[i * components + c]) << (precision - 8);
        }
    }

    opj_cparameters_t cparams;
    opj_set_default_encoder_parameters(&cparams);
    cparams.tcp_numlayers = 1;
    cparams.tcp_rates[0] = 0; // lossless
    cparams.cp_disto_alloc = 1;

    const std::unique_ptr<opj_codec_t, detail::CodecDeleter> codec(opj_create_compress(OPJ_CODEC_J2K));
    if (!codec || !opj_setup_encoder(codec.get(), &cparams, image.get())) {
        throw std::runtime_error("openjpeg encoder setup failed");
    }

    detail::OpjOutput out;
    const std::unique_ptr<opj_stream_t, detail::StreamDeleter> stream(opj_stream_default_create(OPJ_FALSE));
    if (!stream) {
        throw std::runtime_error("openjpeg output stream failed");
    }
    opj_stream_set_user_data(stream.get(), &out, nullptr);
    opj_stream_set_write_function(stream.get(), detail::opj_out_write);
    opj_stream_set_skip_function(stream.get(), detail::opj_out_skip);
    opj_stream_set_seek_function(stream.get(), detail::opj_out_seek);

    if (!opj_start_compress(codec.get(), image.get(), stream.get()) ||
        !opj_encode(codec.get(), stream.get()) ||
        !opj_end_compress(codec.get(), stream.get())) {
        throw std::runtime_error("openjpeg encode failed");
    }
    return {out.data.begin(), out.data.end()};
}

} // namespace pdfslim::test

#endif // PDFSLIM_JPX_FIXTURE_HPP
