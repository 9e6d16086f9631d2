/**
 * @file resource_walker.hpp
 * @brief Cycle-safe discovery of resource dictionaries, image XObjects and
 * content streams reachable from the page tree.
 */

#ifndef PDFSLIM_RESOURCE_WALKER_HPP
#define PDFSLIM_RESOURCE_WALKER_HPP

#include <qpdf/QPDFObjectHandle.hh>
#include <optional>
#include <vector>

namespace pdfslim {

class DocumentGraph;

/**
 * @brief Resource dictionary in effect for a page.
 *
 * The page's own /Resources if it resolves to a dictionary, otherwise the
 * nearest ancestor's along /Parent. The /Parent chain is followed at most
 * once per node, so a malformed cyclic tree terminates.
 */
std::optional<QPDFObjectHandle> effective_resources(const DocumentGraph& graph, QPDFObjectHandle page);

/**
 * @brief Every resource dictionary in effect for @p pages, plus those of the
 * form XObjects they use (recursively). Each indirect dictionary appears once.
 */
std::vector<QPDFObjectHandle> collect_resource_dictionaries(const DocumentGraph& graph,
                                                            const std::vector<QPDFObjectHandle>& pages);

/**
 * @brief Every distinct image XObject stream used by @p pages, directly or
 * through nested form XObjects.
 */
std::vector<QPDFObjectHandle> collect_images(const DocumentGraph& graph,
                                             const std::vector<QPDFObjectHandle>& pages);

/**
 * @brief Every distinct page content stream and form XObject stream.
 */
std::vector<QPDFObjectHandle> collect_content_streams(const DocumentGraph& graph,
                                                      const std::vector<QPDFObjectHandle>& pages);

} // namespace pdfslim

#endif // PDFSLIM_RESOURCE_WALKER_HPP
