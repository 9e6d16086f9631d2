/**
 * @file document_graph.hpp
 * @brief Owns one parsed PDF object graph for the lifetime of a request.
 */

#ifndef PDFSLIM_DOCUMENT_GRAPH_HPP
#define PDFSLIM_DOCUMENT_GRAPH_HPP

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pdfslim {

/**
 * @brief Options for DocumentGraph::serialize.
 */
struct SerializeOptions {
    /// Pack eligible non-stream objects into object streams.
    bool pack_object_streams = true;
};

/**
 * @brief Object graph of a single PDF document, backed by qpdf.
 *
 * @details Nodes live in qpdf's object table keyed by (id, generation);
 * references are handles resolved through that table, so the page tree's
 * parent/child cycle never forms an ownership cycle. The graph keeps its
 * own copy of the source bytes because qpdf reads lazily from them.
 *
 * A DocumentGraph is move-only and belongs to exactly one request.
 */
class DocumentGraph {
public:
    /**
     * @brief Parses a PDF from memory.
     *
     * Recovery from damaged cross-reference tables is enabled and qpdf
     * warnings are routed to the logger. Encrypted documents that open with
     * the empty user password are accepted and flagged.
     *
     * @param bytes Raw document bytes.
     * @param description Name used in log and error messages.
     * @throws LoadError if the bytes are not a usable PDF, have no
     * resolvable catalog, or need a password.
     */
    static DocumentGraph parse(std::span<const unsigned char> bytes,
                               const std::string& description = "input.pdf");

    /**
     * @brief Creates a minimal, valid document (catalog + empty page tree).
     *
     * Used by hosts and tests that build graphs programmatically.
     */
    static DocumentGraph empty();

    DocumentGraph(DocumentGraph&&) noexcept;
    DocumentGraph& operator=(DocumentGraph&&) noexcept;
    DocumentGraph(const DocumentGraph&) = delete;
    DocumentGraph& operator=(const DocumentGraph&) = delete;
    ~DocumentGraph();

    /**
     * @brief Resolves a handle to the object it denotes.
     * @return The object, or std::nullopt for a dangling reference, a null
     * object or an object qpdf cannot read. Never throws.
     */
    [[nodiscard]] std::optional<QPDFObjectHandle> resolve(QPDFObjectHandle handle) const noexcept;

    /**
     * @brief Resolves an indirect object by id and generation. Never throws.
     */
    [[nodiscard]] std::optional<QPDFObjectHandle> resolve(QPDFObjGen id) const noexcept;

    /**
     * @brief Resolves a handle and keeps it only if it is a dictionary
     * (streams excluded). Never throws.
     */
    [[nodiscard]] std::optional<QPDFObjectHandle> resolve_dictionary(QPDFObjectHandle handle) const noexcept;

    /**
     * @brief Looks up @p key in @p dict and resolves it as a dictionary.
     */
    [[nodiscard]] std::optional<QPDFObjectHandle> dictionary_entry(QPDFObjectHandle dict,
                                                                   const std::string& key) const noexcept;

    [[nodiscard]] QPDFObjectHandle trailer() const;

    /**
     * @brief The dictionary reached from the trailer's /Root, if resolvable.
     */
    [[nodiscard]] std::optional<QPDFObjectHandle> catalog() const noexcept;

    /**
     * @brief All page nodes in document order.
     * @throws std::runtime_error (qpdf) if the page tree is broken.
     */
    [[nodiscard]] std::vector<QPDFObjectHandle> pages() const;

    /**
     * @brief Serializes the graph.
     *
     * Only objects reachable from the trailer are written; they are
     * renumbered, Flate-compressed where uncompressed, and optionally packed
     * into object streams. The /ID is deterministic; encryption is dropped.
     *
     * @throws SaveError if qpdf rejects the graph.
     */
    [[nodiscard]] std::vector<unsigned char> serialize(const SerializeOptions& options = {});

    [[nodiscard]] bool was_encrypted() const noexcept { return encrypted_; }

    /**
     * @brief Direct access to qpdf for object creation (streams, indirect objects).
     */
    [[nodiscard]] QPDF& qpdf() noexcept { return *pdf_; }

private:
    DocumentGraph();

    struct LogBridge;

    // declaration order matters: the source bytes and the log streams must
    // outlive the QPDF instance reading from and writing to them
    std::shared_ptr<std::string> source_;
    std::unique_ptr<LogBridge> log_bridge_;
    std::unique_ptr<QPDF> pdf_;
    std::string description_;
    bool encrypted_ = false;
};

} // namespace pdfslim

#endif // PDFSLIM_DOCUMENT_GRAPH_HPP
