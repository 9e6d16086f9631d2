#include "../../include/graph_pruner.hpp"
#include "../../include/document_graph.hpp"
#include "../../include/logger.hpp"
#include "../../include/resource_walker.hpp"
#include <string>

namespace pdfslim::pruning {

namespace {

template <std::size_t N>
std::size_t delete_all(QPDFObjectHandle& node, const std::array<std::string_view, N>& keys) noexcept {
    std::size_t removed = 0;
    for (const auto key : keys) {
        if (delete_if_present(node, key)) {
            ++removed;
        }
    }
    return removed;
}

bool is_high(const CompressionOptions& options) noexcept {
    return options.level == CompressionLevel::High;
}

} // namespace

bool delete_if_present(QPDFObjectHandle& node, const std::string_view key) noexcept {
    try {
        const std::string name(key);
        if (!node.isDictionary() || !node.hasKey(name)) {
            return false;
        }
        node.removeKey(name);
        return true;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Debug,
                    "Cannot remove " + std::string(key) + ": " + e.what(),
                    "graph_pruner");
        return false;
    }
}

std::size_t strip_catalog_metadata(QPDFObjectHandle& catalog) noexcept {
    return delete_all(catalog, kCatalogMetadataKeys);
}

bool strip_embedded_files(QPDFObjectHandle& catalog) noexcept {
    try {
        if (!catalog.isDictionary() || !catalog.hasKey("/Names")) {
            return false;
        }
        QPDFObjectHandle names = catalog.getKey("/Names");
        return delete_if_present(names, "/EmbeddedFiles");
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Debug, std::string("Unreadable /Names: ") + e.what(), "graph_pruner");
        return false;
    }
}

std::size_t strip_structure(QPDFObjectHandle& catalog, const CompressionOptions& options) noexcept {
    if (!is_high(options)) {
        return 0;
    }
    return delete_all(catalog, kCatalogStructureKeys);
}

bool strip_document_info(QPDFObjectHandle& trailer) noexcept {
    return delete_if_present(trailer, "/Info");
}

bool strip_page_thumbnail(QPDFObjectHandle& page) noexcept {
    return delete_if_present(page, "/Thumb");
}

std::size_t prune_page(QPDFObjectHandle& page, const CompressionOptions& options) noexcept {
    if (!is_high(options)) {
        return 0;
    }
    std::size_t removed = 0;
    if (!options.preserve_quality && delete_if_present(page, "/Annots")) {
        ++removed;
    }
    return removed + delete_all(page, kPageHighLevelKeys);
}

std::size_t prune_resources(QPDFObjectHandle& resources, const CompressionOptions& options) noexcept {
    if (!is_high(options) || options.preserve_quality) {
        return 0;
    }
    return delete_if_present(resources, "/ProcSet") ? 1 : 0;
}

std::size_t apply_policy(DocumentGraph& graph, const CompressionOptions& options) {
    std::size_t removed = 0;

    QPDFObjectHandle trailer = graph.trailer();
    if (strip_document_info(trailer)) {
        ++removed;
    }

    if (auto catalog = graph.catalog()) {
        removed += strip_catalog_metadata(*catalog);
        removed += strip_structure(*catalog, options);
        if (strip_embedded_files(*catalog)) {
            ++removed;
        }
    }

    auto pages = graph.pages();
    for (auto& page : pages) {
        if (strip_page_thumbnail(page)) {
            ++removed;
        }
        removed += prune_page(page, options);
    }

    for (auto& resources : collect_resource_dictionaries(graph, pages)) {
        removed += prune_resources(resources, options);
    }

    Logger::log(LogLevel::Debug, "Pruning policy removed " + std::to_string(removed) + " entries", "graph_pruner");
    return removed;
}

} // namespace pdfslim::pruning
