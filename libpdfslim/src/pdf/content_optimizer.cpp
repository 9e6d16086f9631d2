#include "../../include/content_optimizer.hpp"
#include "../../include/logger.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/Constants.h>
#include <cstdlib>
#include <memory>
#include <string>
#include "zopfli.h"
#include "zlib_container.h"

namespace pdfslim {

bool ContentOptimizer::is_plain_flate(QPDFObjectHandle stream) {
    if (!stream.isStream()) return false;
    const QPDFObjectHandle dict = stream.getDict();
    if (dict.hasKey("/DecodeParms") && !dict.getKey("/DecodeParms").isNull()) return false;
    const QPDFObjectHandle filter = dict.getKey("/Filter");
    if (filter.isName()) return filter.getName() == "/FlateDecode";
    if (filter.isArray() && filter.getArrayNItems() == 1) {
        const QPDFObjectHandle item = filter.getArrayItem(0);
        return item.isName() && item.getName() == "/FlateDecode";
    }
    return false;
}

std::vector<unsigned char> ContentOptimizer::zopfli_zlib(const std::span<const unsigned char> input, const int iterations) {
    ZopfliOptions opts;
    ZopfliInitOptions(&opts);
    opts.numiterations = iterations;
    opts.blocksplitting = 1;

    unsigned char* out_data = nullptr;
    size_t out_size = 0;
    ZopfliZlibCompress(&opts, input.data(), input.size(), &out_data, &out_size);

    std::vector<unsigned char> result(out_data, out_data + out_size);
    free(out_data);
    return result;
}

bool ContentOptimizer::reflate(QPDFObjectHandle& stream, const int iterations) {
    if (iterations <= 0 || !is_plain_flate(stream)) {
        return false;
    }

    const std::shared_ptr<Buffer> raw = stream.getRawStreamData();
    const std::shared_ptr<Buffer> decoded = stream.getStreamData(qpdf_dl_generalized);

    const std::vector<unsigned char> recompressed =
        zopfli_zlib({decoded->getBuffer(), decoded->getSize()}, iterations);
    if (recompressed.size() >= raw->getSize()) {
        return false;
    }

    Logger::log(LogLevel::Debug,
                "Stream " + stream.getObjGen().unparse(' ') + ": " + std::to_string(raw->getSize()) +
                " -> " + std::to_string(recompressed.size()) + " bytes",
                "content_optimizer");
    stream.replaceStreamData(
        std::string(reinterpret_cast<const char*>(recompressed.data()), recompressed.size()),
        QPDFObjectHandle::newName("/FlateDecode"),
        QPDFObjectHandle::newNull());
    return true;
}

} // namespace pdfslim
