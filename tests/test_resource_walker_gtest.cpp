#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../libpdfslim/include/resource_walker.hpp"

using namespace pdfslim;
using namespace pdfslim::test;

namespace {

QPDFObjectHandle make_form(DocumentGraph& graph) {
    QPDFObjectHandle form = graph.qpdf().newStream("q 1 0 0 1 0 0 cm /Im0 Do Q");
    QPDFObjectHandle dict = form.getDict();
    dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
    dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Form"));
    dict.replaceKey("/BBox", QPDFObjectHandle::parse("[0 0 100 100]"));
    dict.replaceKey("/Resources", QPDFObjectHandle::parse("<< /XObject << >> >>"));
    return form;
}

} // namespace

TEST(ResourceWalkerTest, EffectiveResourcesPrefersOwnDictionary) {
    DocumentGraph graph = DocumentGraph::empty();
    QPDFObjectHandle page = add_page(graph);
    page.getKey("/Resources").replaceKey("/Font", QPDFObjectHandle::newDictionary());
    const auto res = effective_resources(graph, page);
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->hasKey("/Font"));
}

TEST(ResourceWalkerTest, EffectiveResourcesFollowsParent) {
    DocumentGraph graph = DocumentGraph::empty();
    QPDFObjectHandle page = add_page(graph);
    page.removeKey("/Resources");
    graph.catalog()->getKey("/Pages").replaceKey("/Resources", QPDFObjectHandle::parse("<< /ProcSet [/PDF] >>"));
    const auto res = effective_resources(graph, page);
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->hasKey("/ProcSet"));
}

TEST(ResourceWalkerTest, EffectiveResourcesMissingEverywhere) {
    DocumentGraph graph = DocumentGraph::empty();
    QPDFObjectHandle page = add_page(graph);
    page.removeKey("/Resources");
    EXPECT_FALSE(effective_resources(graph, page).has_value());
}

TEST(ResourceWalkerTest, CyclicParentChainTerminates) {
    DocumentGraph graph = DocumentGraph::empty();
    QPDF& pdf = graph.qpdf();
    QPDFObjectHandle a = pdf.makeIndirectObject(QPDFObjectHandle::parse("<< /Type /Pages >>"));
    QPDFObjectHandle b = pdf.makeIndirectObject(QPDFObjectHandle::parse("<< /Type /Pages >>"));
    a.replaceKey("/Parent", b);
    b.replaceKey("/Parent", a);
    QPDFObjectHandle orphan = pdf.makeIndirectObject(QPDFObjectHandle::parse("<< /Type /Page >>"));
    orphan.replaceKey("/Parent", a);
    EXPECT_FALSE(effective_resources(graph, orphan).has_value());
}

TEST(ResourceWalkerTest, ImagesInNestedFormsAreFound) {
    DocumentGraph graph = DocumentGraph::empty();
    QPDFObjectHandle page = add_page(graph);
    QPDFObjectHandle image = make_raw_image(graph, 120, 120);
    QPDFObjectHandle inner = make_form(graph);
    inner.getDict().getKey("/Resources").getKey("/XObject").replaceKey("/Im0", image);
    QPDFObjectHandle outer = make_form(graph);
    outer.getDict().getKey("/Resources").getKey("/XObject").replaceKey("/Fm1", inner);
    use_xobject(page, "/Fm0", outer);

    const auto images = collect_images(graph, graph.pages());
    ASSERT_EQ(images.size(), 1u);
    EXPECT_EQ(images[0].getObjGen(), image.getObjGen());

    // page content + two forms
    EXPECT_EQ(collect_content_streams(graph, graph.pages()).size(), 3u);
    // page resources + two form resources
    EXPECT_EQ(collect_resource_dictionaries(graph, graph.pages()).size(), 3u);
}

TEST(ResourceWalkerTest, SharedImageIsCollectedOnce) {
    DocumentGraph graph = DocumentGraph::empty();
    QPDFObjectHandle image = make_raw_image(graph, 200, 200);
    for (int i = 0; i < 3; ++i) {
        use_xobject(add_page(graph), "/Im0", image);
    }
    EXPECT_EQ(collect_images(graph, graph.pages()).size(), 1u);
}

TEST(ResourceWalkerTest, SelfReferencingFormTerminates) {
    DocumentGraph graph = DocumentGraph::empty();
    QPDFObjectHandle page = add_page(graph);
    QPDFObjectHandle form = make_form(graph);
    form.getDict().getKey("/Resources").getKey("/XObject").replaceKey("/Fm0", form);
    QPDFObjectHandle image = make_raw_image(graph, 150, 150);
    form.getDict().getKey("/Resources").getKey("/XObject").replaceKey("/Im0", image);
    use_xobject(page, "/Fm0", form);

    EXPECT_EQ(collect_images(graph, graph.pages()).size(), 1u);
    EXPECT_EQ(collect_content_streams(graph, graph.pages()).size(), 2u);
}

TEST(ResourceWalkerTest, ContentsArrayIsExpanded) {
    DocumentGraph graph = DocumentGraph::empty();
    QPDFObjectHandle page = add_page(graph);
    QPDF& pdf = graph.qpdf();
    QPDFObjectHandle contents = QPDFObjectHandle::newArray();
    contents.appendItem(pdf.newStream("q"));
    contents.appendItem(pdf.newStream("0 0 m 1 1 l S"));
    contents.appendItem(pdf.newStream("Q"));
    page.replaceKey("/Contents", contents);
    EXPECT_EQ(collect_content_streams(graph, graph.pages()).size(), 3u);
}

TEST(ResourceWalkerTest, DanglingXObjectReferenceIsSkipped) {
    const auto bytes = single_page_pdf("/Resources << /XObject << /Im0 77 0 R >> >>");
    DocumentGraph graph = DocumentGraph::parse(bytes);
    EXPECT_TRUE(collect_images(graph, graph.pages()).empty());
    EXPECT_EQ(collect_resource_dictionaries(graph, graph.pages()).size(), 1u);
}
