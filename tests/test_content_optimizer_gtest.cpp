#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../libpdfslim/include/content_optimizer.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/Constants.h>
#include <zlib.h>

using namespace pdfslim;
using namespace pdfslim::test;

namespace {

std::string drawing_commands() {
    std::string content;
    for (int i = 0; i < 2000; ++i) {
        content += std::to_string(i % 97) + " " + std::to_string(i % 13) + " m " +
                   std::to_string(i % 89) + " 40 l S\n";
    }
    return content;
}

std::string fast_deflate(const std::string& data) {
    uLongf size = compressBound(static_cast<uLong>(data.size()));
    std::string out(size, '\0');
    const int rc = compress2(reinterpret_cast<Bytef*>(out.data()), &size,
                             reinterpret_cast<const Bytef*>(data.data()), static_cast<uLong>(data.size()),
                             Z_BEST_SPEED);
    EXPECT_EQ(rc, Z_OK);
    out.resize(size);
    return out;
}

QPDFObjectHandle flate_stream(DocumentGraph& graph, const std::string& content) {
    QPDFObjectHandle stream = graph.qpdf().newStream();
    stream.replaceStreamData(fast_deflate(content), QPDFObjectHandle::newName("/FlateDecode"),
                             QPDFObjectHandle::newNull());
    return stream;
}

std::string decoded(QPDFObjectHandle stream) {
    const auto buf = stream.getStreamData(qpdf_dl_generalized);
    return {reinterpret_cast<const char*>(buf->getBuffer()), buf->getSize()};
}

} // namespace

TEST(ContentOptimizerTest, PlainFlateDetection) {
    DocumentGraph graph = DocumentGraph::empty();
    QPDFObjectHandle stream = flate_stream(graph, "q Q");
    EXPECT_TRUE(ContentOptimizer::is_plain_flate(stream));

    stream.getDict().replaceKey("/Filter", QPDFObjectHandle::parse("[/FlateDecode]"));
    EXPECT_TRUE(ContentOptimizer::is_plain_flate(stream));

    stream.getDict().replaceKey("/Filter", QPDFObjectHandle::parse("[/ASCII85Decode /FlateDecode]"));
    EXPECT_FALSE(ContentOptimizer::is_plain_flate(stream));

    stream.getDict().replaceKey("/Filter", QPDFObjectHandle::newName("/FlateDecode"));
    stream.getDict().replaceKey("/DecodeParms", QPDFObjectHandle::parse("<< /Predictor 12 /Columns 4 >>"));
    EXPECT_FALSE(ContentOptimizer::is_plain_flate(stream));

    EXPECT_FALSE(ContentOptimizer::is_plain_flate(graph.qpdf().newStream("q Q")));
    EXPECT_FALSE(ContentOptimizer::is_plain_flate(QPDFObjectHandle::newDictionary()));
}

TEST(ContentOptimizerTest, ReflateShrinksAndKeepsContent) {
    DocumentGraph graph = DocumentGraph::empty();
    const std::string content = drawing_commands();
    QPDFObjectHandle stream = flate_stream(graph, content);
    const auto before = stream.getRawStreamData()->getSize();

    EXPECT_TRUE(ContentOptimizer::reflate(stream, 5));
    EXPECT_LT(stream.getRawStreamData()->getSize(), before);
    EXPECT_TRUE(ContentOptimizer::is_plain_flate(stream));
    EXPECT_EQ(decoded(stream), content);
}

TEST(ContentOptimizerTest, SecondReflateIsNoOp) {
    DocumentGraph graph = DocumentGraph::empty();
    QPDFObjectHandle stream = flate_stream(graph, drawing_commands());
    ASSERT_TRUE(ContentOptimizer::reflate(stream, 5));
    const auto size = stream.getRawStreamData()->getSize();
    EXPECT_FALSE(ContentOptimizer::reflate(stream, 5));
    EXPECT_EQ(stream.getRawStreamData()->getSize(), size);
}

TEST(ContentOptimizerTest, DisabledOrIneligibleStreamsAreUntouched) {
    DocumentGraph graph = DocumentGraph::empty();
    QPDFObjectHandle stream = flate_stream(graph, drawing_commands());
    const auto before = stream.getRawStreamData()->getSize();
    EXPECT_FALSE(ContentOptimizer::reflate(stream, 0));
    EXPECT_EQ(stream.getRawStreamData()->getSize(), before);

    QPDFObjectHandle plain = graph.qpdf().newStream(drawing_commands());
    EXPECT_FALSE(ContentOptimizer::reflate(plain, 5));
}

TEST(ContentOptimizerTest, ZopfliOutputIsZlib) {
    const std::string content = drawing_commands();
    const std::vector<unsigned char> packed = ContentOptimizer::zopfli_zlib(
        {reinterpret_cast<const unsigned char*>(content.data()), content.size()}, 3);
    ASSERT_FALSE(packed.empty());

    std::string restored(content.size(), '\0');
    uLongf restored_size = static_cast<uLongf>(restored.size());
    ASSERT_EQ(uncompress(reinterpret_cast<Bytef*>(restored.data()), &restored_size,
                         packed.data(), static_cast<uLong>(packed.size())),
              Z_OK);
    EXPECT_EQ(restored_size, content.size());
    EXPECT_EQ(restored, content);
}
