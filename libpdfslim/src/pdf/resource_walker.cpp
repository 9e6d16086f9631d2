#include "../../include/resource_walker.hpp"
#include "../../include/document_graph.hpp"
#include "../../include/logger.hpp"
#include <qpdf/QPDFObjGen.hh>
#include <set>
#include <string>
#include <utility>

namespace pdfslim {

namespace {

constexpr int kMaxFormDepth = 64;

bool has_name(QPDFObjectHandle dict, const std::string& key, const std::string& value) {
    if (!dict.isDictionary() || !dict.hasKey(key)) return false;
    QPDFObjectHandle v = dict.getKey(key);
    return v.isName() && v.getName() == value;
}

// helper: single traversal collecting resources, images and content streams
class ResourceWalk {
public:
    explicit ResourceWalk(const DocumentGraph& graph) : graph_(graph) {}

    void visit_pages(const std::vector<QPDFObjectHandle>& pages) {
        for (auto page : pages) {
            try {
                visit_page(page);
            } catch (const std::exception& e) {
                Logger::log(LogLevel::Debug,
                            "Skipping unreadable page " + page.getObjGen().unparse(' ') + ": " + e.what(),
                            "resource_walker");
            }
        }
    }

    std::vector<QPDFObjectHandle> resources;
    std::vector<QPDFObjectHandle> images;
    std::vector<QPDFObjectHandle> content_streams;

private:
    void visit_page(QPDFObjectHandle page) {
        if (auto contents = graph_.resolve(page.getKeyIfDict("/Contents"))) {
            if (contents->isArray()) {
                for (int i = 0; i < contents->getArrayNItems(); ++i) {
                    add_content_stream(contents->getArrayItem(i));
                }
            } else {
                add_content_stream(*contents);
            }
        }
        if (auto res = effective_resources(graph_, page)) {
            visit_resources(*res, 0);
        }
    }

    void add_content_stream(QPDFObjectHandle handle) {
        auto stream = graph_.resolve(std::move(handle));
        if (stream && stream->isStream() && first_visit(*stream)) {
            content_streams.push_back(*stream);
        }
    }

    void visit_resources(QPDFObjectHandle res, const int depth) {
        if (depth > kMaxFormDepth || !first_visit(res)) return;
        resources.push_back(res);

        auto xobjects = graph_.dictionary_entry(res, "/XObject");
        if (!xobjects) return;
        for (const auto& key : xobjects->getKeys()) {
            auto xobject = graph_.resolve(xobjects->getKey(key));
            if (xobject && xobject->isStream()) {
                visit_xobject(*xobject, depth);
            }
        }
    }

    void visit_xobject(QPDFObjectHandle xobject, const int depth) {
        if (!first_visit(xobject)) return;
        QPDFObjectHandle dict = xobject.getDict();
        if (has_name(dict, "/Subtype", "/Image")) {
            images.push_back(xobject);
        } else if (has_name(dict, "/Subtype", "/Form")) {
            content_streams.push_back(xobject);
            if (auto form_res = graph_.dictionary_entry(dict, "/Resources")) {
                visit_resources(*form_res, depth + 1);
            }
        }
    }

    // direct objects have no identity; they are owned by exactly one parent
    bool first_visit(const QPDFObjectHandle& obj) {
        if (!obj.isIndirect()) return true;
        return seen_.insert(obj.getObjGen()).second;
    }

    const DocumentGraph& graph_;
    std::set<QPDFObjGen> seen_;
};

} // namespace

std::optional<QPDFObjectHandle> effective_resources(const DocumentGraph& graph, QPDFObjectHandle page) {
    std::set<QPDFObjGen> visited;
    QPDFObjectHandle node = std::move(page);
    for (;;) {
        if (auto res = graph.dictionary_entry(node, "/Resources")) {
            return res;
        }
        if (node.isIndirect() && !visited.insert(node.getObjGen()).second) {
            Logger::log(LogLevel::Debug, "Cycle in /Parent chain", "resource_walker");
            return std::nullopt;
        }
        auto parent = graph.dictionary_entry(node, "/Parent");
        if (!parent) {
            return std::nullopt;
        }
        node = *parent;
    }
}

std::vector<QPDFObjectHandle> collect_resource_dictionaries(const DocumentGraph& graph,
                                                            const std::vector<QPDFObjectHandle>& pages) {
    ResourceWalk walk(graph);
    walk.visit_pages(pages);
    return std::move(walk.resources);
}

std::vector<QPDFObjectHandle> collect_images(const DocumentGraph& graph,
                                             const std::vector<QPDFObjectHandle>& pages) {
    ResourceWalk walk(graph);
    walk.visit_pages(pages);
    return std::move(walk.images);
}

std::vector<QPDFObjectHandle> collect_content_streams(const DocumentGraph& graph,
                                                      const std::vector<QPDFObjectHandle>& pages) {
    ResourceWalk walk(graph);
    walk.visit_pages(pages);
    return std::move(walk.content_streams);
}

} // namespace pdfslim
