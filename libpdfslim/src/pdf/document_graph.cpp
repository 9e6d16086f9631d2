#include "../../include/document_graph.hpp"
#include "../../include/compression_errors.hpp"
#include "../../include/logger.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/Constants.h>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFWriter.hh>
#include <ostream>
#include <streambuf>
#include <utility>

namespace {

// helper: unbuffered streambuf that forwards each qpdf message line to our logger
class LoggerStreamBuf final : public std::streambuf {
public:
    explicit LoggerStreamBuf(const LogLevel level) : level_(level) {}

    ~LoggerStreamBuf() override { flush_line(); }

protected:
    int_type overflow(const int_type ch) override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        const char c = traits_type::to_char_type(ch);
        if (c == '\n') {
            flush_line();
        } else {
            line_.push_back(c);
        }
        return ch;
    }

    int sync() override {
        flush_line();
        return 0;
    }

private:
    void flush_line() {
        if (!line_.empty()) {
            Logger::log(level_, "qpdf: " + line_, "document_graph");
            line_.clear();
        }
    }

    LogLevel level_;
    std::string line_;
};

} // namespace

namespace pdfslim {

struct DocumentGraph::LogBridge {
    LoggerStreamBuf info_buf{LogLevel::Debug};
    LoggerStreamBuf warn_buf{LogLevel::Warning};
    std::ostream info_os{&info_buf};
    std::ostream warn_os{&warn_buf};
};

DocumentGraph::DocumentGraph()
    : source_(std::make_shared<std::string>()),
      log_bridge_(std::make_unique<LogBridge>()),
      pdf_(std::make_unique<QPDF>()) {
    auto qlogger = QPDFLogger::create();
    qlogger->setOutputStreams(&log_bridge_->info_os, &log_bridge_->warn_os);
    pdf_->setLogger(qlogger);
}

DocumentGraph::DocumentGraph(DocumentGraph&&) noexcept = default;

DocumentGraph& DocumentGraph::operator=(DocumentGraph&& other) noexcept {
    if (this != &other) {
        pdf_.reset();
        pdf_ = std::move(other.pdf_);
        log_bridge_ = std::move(other.log_bridge_);
        source_ = std::move(other.source_);
        description_ = std::move(other.description_);
        encrypted_ = other.encrypted_;
    }
    return *this;
}

DocumentGraph::~DocumentGraph() {
    pdf_.reset();
}

DocumentGraph DocumentGraph::parse(const std::span<const unsigned char> bytes, const std::string& description) {
    Logger::log(LogLevel::Debug,
                "Parsing " + description + " (" + std::to_string(bytes.size()) + " bytes)",
                "document_graph");

    DocumentGraph graph;
    graph.description_ = description;
    graph.source_->assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());

    try {
        graph.pdf_->setAttemptRecovery(true);
        graph.pdf_->processMemoryFile(graph.description_.c_str(), graph.source_->data(), graph.source_->size());
    } catch (const QPDFExc& e) {
        if (e.getErrorCode() == qpdf_e_password) {
            throw LoadError("document is encrypted and cannot be opened without a password");
        }
        throw LoadError(e.what());
    } catch (const std::exception& e) {
        throw LoadError(e.what());
    }

    graph.encrypted_ = graph.pdf_->isEncrypted();
    if (graph.encrypted_) {
        Logger::log(LogLevel::Warning,
                    description + " is encrypted; continuing with the empty user password, output is unencrypted",
                    "document_graph");
    }

    if (!graph.catalog()) {
        throw LoadError("document has no resolvable catalog");
    }
    return graph;
}

DocumentGraph DocumentGraph::empty() {
    DocumentGraph graph;
    graph.description_ = "empty PDF";
    graph.pdf_->emptyPDF();
    return graph;
}

std::optional<QPDFObjectHandle> DocumentGraph::resolve(QPDFObjectHandle handle) const noexcept {
    try {
        if (!handle.isInitialized() || handle.isNull()) {
            return std::nullopt;
        }
        return handle;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Debug, std::string("Unresolvable object: ") + e.what(), "document_graph");
        return std::nullopt;
    }
}

std::optional<QPDFObjectHandle> DocumentGraph::resolve(const QPDFObjGen id) const noexcept {
    try {
        return resolve(pdf_->getObject(id));
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Debug,
                    "Unresolvable object " + id.unparse(' ') + ": " + e.what(),
                    "document_graph");
        return std::nullopt;
    }
}

std::optional<QPDFObjectHandle> DocumentGraph::resolve_dictionary(QPDFObjectHandle handle) const noexcept {
    auto resolved = resolve(std::move(handle));
    try {
        if (resolved && resolved->isDictionary()) {
            return resolved;
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Debug, std::string("Unreadable dictionary: ") + e.what(), "document_graph");
    }
    return std::nullopt;
}

std::optional<QPDFObjectHandle> DocumentGraph::dictionary_entry(QPDFObjectHandle dict,
                                                                const std::string& key) const noexcept {
    try {
        if (!dict.isDictionary() || !dict.hasKey(key)) {
            return std::nullopt;
        }
        return resolve_dictionary(dict.getKey(key));
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Debug, "Unreadable entry " + key + ": " + e.what(), "document_graph");
        return std::nullopt;
    }
}

QPDFObjectHandle DocumentGraph::trailer() const {
    return pdf_->getTrailer();
}

std::optional<QPDFObjectHandle> DocumentGraph::catalog() const noexcept {
    try {
        return dictionary_entry(pdf_->getTrailer(), "/Root");
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Debug, std::string("No trailer: ") + e.what(), "document_graph");
        return std::nullopt;
    }
}

std::vector<QPDFObjectHandle> DocumentGraph::pages() const {
    const auto& all = pdf_->getAllPages();
    return {all.begin(), all.end()};
}

std::vector<unsigned char> DocumentGraph::serialize(const SerializeOptions& options) {
    try {
        QPDFWriter writer(*pdf_);
        writer.setOutputMemory();
        writer.setObjectStreamMode(options.pack_object_streams ? qpdf_o_generate : qpdf_o_disable);
        writer.setCompressStreams(true);
        writer.setDecodeLevel(qpdf_dl_generalized);
        writer.setPreserveEncryption(false);
        writer.setDeterministicID(true);
        writer.write();

        const std::shared_ptr<Buffer> buf = writer.getBufferSharedPointer();
        std::vector<unsigned char> out(buf->getBuffer(), buf->getBuffer() + buf->getSize());
        Logger::log(LogLevel::Debug,
                    "Serialized " + description_ + " to " + std::to_string(out.size()) + " bytes",
                    "document_graph");
        return out;
    } catch (const std::exception& e) {
        throw SaveError(e.what());
    }
}

} // namespace pdfslim
