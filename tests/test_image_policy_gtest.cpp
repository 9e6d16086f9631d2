#include <gtest/gtest.h>
#include "../libpdfslim/include/image_policy.hpp"
#include <qpdf/QPDFObjectHandle.hh>

using namespace pdfslim;

namespace {
CompressionOptions opts(const int quality, const CompressionLevel level, const bool preserve = false) {
    return make_options(quality, level, preserve);
}
}

TEST(ImagePolicyTest, WorkedExampleHighLowQualityLargeImage) {
    const ImageDescriptor image{2000, 1500, ImageCodec::Dct};
    const auto decision = decide_image_transform(image, opts(25, CompressionLevel::High));
    ASSERT_TRUE(decision.should_resample());
    EXPECT_NEAR(decision.scale_factor, 0.28, 1e-9);
    EXPECT_EQ(decision.target_width, 560u);
    EXPECT_EQ(decision.target_height, 420u);
}

TEST(ImagePolicyTest, SmallImagesAreNeverTransformed) {
    for (const auto level : {CompressionLevel::Low, CompressionLevel::Medium, CompressionLevel::High}) {
        for (const int quality : {0, 25, 50, 75, 100}) {
            const auto decision = decide_image_transform({50, 50, ImageCodec::Dct}, opts(quality, level));
            EXPECT_FALSE(decision.should_resample());
            EXPECT_DOUBLE_EQ(decision.scale_factor, 1.0);
        }
    }
    EXPECT_FALSE(decide_image_transform({99, 4000, ImageCodec::Flate}, opts(10, CompressionLevel::High)).should_resample());
    EXPECT_FALSE(decide_image_transform({4000, 99, ImageCodec::Flate}, opts(10, CompressionLevel::High)).should_resample());
}

TEST(ImagePolicyTest, BoundaryDimensionIsEligible) {
    const auto decision = decide_image_transform({100, 100, ImageCodec::Raw}, opts(50, CompressionLevel::Medium));
    ASSERT_TRUE(decision.should_resample());
    EXPECT_EQ(decision.target_width, 70u);
    EXPECT_EQ(decision.target_height, 70u);
}

TEST(ImagePolicyTest, LowLevelHighQualityIsIdentity) {
    const ImageDescriptor image{800, 600, ImageCodec::Dct};
    EXPECT_DOUBLE_EQ(scale_factor_for(image, opts(95, CompressionLevel::Low)), 1.0);
    const auto decision = decide_image_transform(image, opts(95, CompressionLevel::Low));
    EXPECT_FALSE(decision.should_resample());
    EXPECT_DOUBLE_EQ(decision.scale_factor, 1.0);
}

TEST(ImagePolicyTest, BaseFactorsPerLevel) {
    const ImageDescriptor image{500, 500, ImageCodec::Dct};
    EXPECT_DOUBLE_EQ(scale_factor_for(image, opts(80, CompressionLevel::Low)), 0.9);
    EXPECT_DOUBLE_EQ(scale_factor_for(image, opts(61, CompressionLevel::Medium)), 0.8);
    EXPECT_DOUBLE_EQ(scale_factor_for(image, opts(60, CompressionLevel::Medium)), 0.7);
    EXPECT_DOUBLE_EQ(scale_factor_for(image, opts(41, CompressionLevel::High)), 0.6);
    EXPECT_DOUBLE_EQ(scale_factor_for(image, opts(40, CompressionLevel::High)), 0.5);
    EXPECT_NEAR(scale_factor_for(image, opts(29, CompressionLevel::High)), 0.35, 1e-9);
}

TEST(ImagePolicyTest, LargeImageModifierNeedsStrictlyAboveThousand) {
    EXPECT_DOUBLE_EQ(scale_factor_for({1000, 1000, ImageCodec::Dct}, opts(75, CompressionLevel::Medium)), 0.8);
    EXPECT_NEAR(scale_factor_for({1001, 10, ImageCodec::Dct}, opts(75, CompressionLevel::Medium)), 0.64, 1e-9);
    EXPECT_NEAR(scale_factor_for({10, 1001, ImageCodec::Dct}, opts(75, CompressionLevel::Medium)), 0.64, 1e-9);
}

TEST(ImagePolicyTest, JpxOnlyAtHigh) {
    const ImageDescriptor image{800, 600, ImageCodec::Jpx};
    EXPECT_FALSE(decide_image_transform(image, opts(50, CompressionLevel::Low)).should_resample());
    EXPECT_FALSE(decide_image_transform(image, opts(50, CompressionLevel::Medium)).should_resample());
    EXPECT_TRUE(decide_image_transform(image, opts(50, CompressionLevel::High)).should_resample());
}

TEST(ImagePolicyTest, UnknownCodecIsSkipped) {
    EXPECT_FALSE(decide_image_transform({800, 600, ImageCodec::Other}, opts(10, CompressionLevel::High)).should_resample());
}

TEST(ImagePolicyTest, DecisionIsDeterministic) {
    const ImageDescriptor image{1234, 987, ImageCodec::Flate};
    const auto options = opts(33, CompressionLevel::High);
    const auto a = decide_image_transform(image, options);
    const auto b = decide_image_transform(image, options);
    EXPECT_EQ(a.action, b.action);
    EXPECT_EQ(a.scale_factor, b.scale_factor);
    EXPECT_EQ(a.target_width, b.target_width);
    EXPECT_EQ(a.target_height, b.target_height);
}

TEST(ImagePolicyTest, ClassifyFilter) {
    EXPECT_EQ(classify_filter(QPDFObjectHandle::newNull()), ImageCodec::Raw);
    EXPECT_EQ(classify_filter(QPDFObjectHandle::newName("/FlateDecode")), ImageCodec::Flate);
    EXPECT_EQ(classify_filter(QPDFObjectHandle::newName("/DCTDecode")), ImageCodec::Dct);
    EXPECT_EQ(classify_filter(QPDFObjectHandle::newName("/JPXDecode")), ImageCodec::Jpx);
    EXPECT_EQ(classify_filter(QPDFObjectHandle::newName("/CCITTFaxDecode")), ImageCodec::Other);
    EXPECT_EQ(classify_filter(QPDFObjectHandle::parse("[/DCTDecode]")), ImageCodec::Dct);
    EXPECT_EQ(classify_filter(QPDFObjectHandle::parse("[]")), ImageCodec::Raw);
    EXPECT_EQ(classify_filter(QPDFObjectHandle::newInteger(3)), ImageCodec::Other);
}

TEST(ImagePolicyTest, ClassifyFilterChains) {
    EXPECT_EQ(classify_filter(QPDFObjectHandle::newName("/LZWDecode")), ImageCodec::Flate);
    EXPECT_EQ(classify_filter(QPDFObjectHandle::newName("/RunLengthDecode")), ImageCodec::Flate);
    EXPECT_EQ(classify_filter(QPDFObjectHandle::parse("[/ASCII85Decode /FlateDecode]")), ImageCodec::Flate);
    EXPECT_EQ(classify_filter(QPDFObjectHandle::parse("[/ASCIIHexDecode /LZWDecode]")), ImageCodec::Flate);
    EXPECT_EQ(classify_filter(QPDFObjectHandle::parse("[/FlateDecode /DCTDecode]")), ImageCodec::Dct);
    EXPECT_EQ(classify_filter(QPDFObjectHandle::parse("[/ASCII85Decode /FlateDecode /DCTDecode]")), ImageCodec::Dct);

    // JPEG output cannot feed another filter, and openjpeg needs the bare codestream
    EXPECT_EQ(classify_filter(QPDFObjectHandle::parse("[/DCTDecode /FlateDecode]")), ImageCodec::Other);
    EXPECT_EQ(classify_filter(QPDFObjectHandle::parse("[/ASCII85Decode /JPXDecode]")), ImageCodec::Other);
    EXPECT_EQ(classify_filter(QPDFObjectHandle::parse("[/FlateDecode /CCITTFaxDecode]")), ImageCodec::Other);
    EXPECT_EQ(classify_filter(QPDFObjectHandle::parse("[/FlateDecode 3]")), ImageCodec::Other);
}
