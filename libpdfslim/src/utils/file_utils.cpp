#include <filesystem>
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <memory>
#include <stdexcept>
#include <system_error>

namespace pdfslim {

    namespace {
        struct FileCloser {
            void operator()(FILE* f) const { std::fclose(f); }
        };
        using FilePtr = std::unique_ptr<FILE, FileCloser>;
    } // namespace

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // On Windows, convert mode to wstring and use _wfopen, which accepts
        // wide-char paths (UTF-16), supporting Unicode and long paths.
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        // prepend the magic prefix to bypass MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<unsigned char> read_file_bytes(const std::filesystem::path& path) {
        const FilePtr f(open_file(path, "rb"));
        if (!f) {
            throw std::runtime_error("Cannot open " + path.string());
        }
        std::vector<unsigned char> data;
        unsigned char chunk[64 * 1024];
        size_t n = 0;
        while ((n = std::fread(chunk, 1, sizeof(chunk), f.get())) > 0) {
            data.insert(data.end(), chunk, chunk + n);
        }
        if (std::ferror(f.get())) {
            throw std::runtime_error("Read error on " + path.string());
        }
        return data;
    }

    void write_file_bytes(const std::filesystem::path& path, const std::span<const unsigned char> data) {
        auto tmp_path = path;
        tmp_path += ".tmp";
        {
            const FilePtr f(open_file(tmp_path, "wb"));
            if (!f) {
                throw std::runtime_error("Cannot create " + tmp_path.string());
            }
            if (std::fwrite(data.data(), 1, data.size(), f.get()) != data.size() || std::fflush(f.get()) != 0) {
                std::error_code ec;
                std::filesystem::remove(tmp_path, ec);
                throw std::runtime_error("Write error on " + tmp_path.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(tmp_path, path, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            throw std::runtime_error("Cannot move output into place: " + path.string() + " (" + ec.message() + ")");
        }
        Logger::log(LogLevel::Debug, "Wrote " + std::to_string(data.size()) + " bytes to " + path.string(), "file_utils");
    }

    std::filesystem::path output_path_for(const std::filesystem::path& input,
                                          const std::filesystem::path& output,
                                          const std::string& suffix) {
        const std::filesystem::path file_name = input.stem().string() + suffix + ".pdf";
        if (output.empty()) {
            return input.parent_path() / file_name;
        }
        std::error_code ec;
        if (std::filesystem::is_directory(output, ec)) {
            return output / file_name;
        }
        return output;
    }

} // namespace pdfslim
