/**
 * @file graph_pruner.hpp
 * @brief Removal of non-essential entries from catalog, trailer, page and
 * resource dictionaries.
 *
 * Every function here is idempotent and never fails: a node that is not a
 * dictionary (null, stream, dangling reference) has nothing to prune.
 * Resolving a reference to the dictionary is the caller's job.
 */

#ifndef PDFSLIM_GRAPH_PRUNER_HPP
#define PDFSLIM_GRAPH_PRUNER_HPP

#include "compression_options.hpp"
#include <qpdf/QPDFObjectHandle.hh>
#include <array>
#include <cstddef>
#include <string_view>

namespace pdfslim {

class DocumentGraph;

namespace pruning {

/// Catalog entries removed at every level.
inline constexpr std::array<std::string_view, 9> kCatalogMetadataKeys = {
    "/Metadata", "/MarkInfo", "/Outlines", "/PageLabels", "/ViewerPreferences",
    "/PageLayout", "/PageMode", "/Threads", "/OpenAction"
};

/// Catalog entries removed at level high.
inline constexpr std::array<std::string_view, 2> kCatalogStructureKeys = {
    "/StructTreeRoot", "/OCProperties"
};

/// Page entries removed at level high.
inline constexpr std::array<std::string_view, 11> kPageHighLevelKeys = {
    "/Dur", "/Trans", "/AA", "/StructParents", "/PZ", "/SeparationInfo",
    "/Group", "/Tabs", "/TemplateInstantiated", "/PresSteps", "/UserUnit"
};

/**
 * @brief Removes @p key from @p node if @p node is a dictionary holding it.
 * @param node Resolved node; anything but a dictionary is left alone.
 * @param key PDF name including the leading slash (e.g. "/Thumb").
 * @return true if an entry was removed.
 */
bool delete_if_present(QPDFObjectHandle& node, std::string_view key) noexcept;

/**
 * @brief Removes document metadata, outline, labels and viewer settings from the catalog.
 * @return Number of entries removed.
 */
std::size_t strip_catalog_metadata(QPDFObjectHandle& catalog) noexcept;

/**
 * @brief Removes /EmbeddedFiles from the catalog's /Names dictionary.
 *
 * /Names may be an indirect reference; an unresolvable or non-dictionary
 * value has nothing to prune.
 */
bool strip_embedded_files(QPDFObjectHandle& catalog) noexcept;

/**
 * @brief Removes the structure tree and optional content at level high.
 */
std::size_t strip_structure(QPDFObjectHandle& catalog, const CompressionOptions& options) noexcept;

/**
 * @brief Removes the document information dictionary reference from the trailer.
 */
bool strip_document_info(QPDFObjectHandle& trailer) noexcept;

/**
 * @brief Removes the page thumbnail.
 */
bool strip_page_thumbnail(QPDFObjectHandle& page) noexcept;

/**
 * @brief Removes interactive and presentation entries from a page.
 *
 * /Annots goes at level high without preserve-quality; transitions,
 * actions, structure and grouping entries go at level high.
 */
std::size_t prune_page(QPDFObjectHandle& page, const CompressionOptions& options) noexcept;

/**
 * @brief Removes the obsolete /ProcSet at level high without preserve-quality.
 */
std::size_t prune_resources(QPDFObjectHandle& resources, const CompressionOptions& options) noexcept;

/**
 * @brief Applies the whole removal policy to a graph in one pass.
 *
 * Covers trailer, catalog, every page and every page's own and inherited
 * resource dictionaries. Applying it twice removes nothing the second time.
 *
 * @return Number of entries removed.
 */
std::size_t apply_policy(DocumentGraph& graph, const CompressionOptions& options);

} // namespace pruning
} // namespace pdfslim

#endif // PDFSLIM_GRAPH_PRUNER_HPP
