#ifndef PDFSLIM_FILE_UTILS_HPP
#define PDFSLIM_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace pdfslim {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a whole file into memory.
     * @throws std::runtime_error if the file cannot be opened or read.
     */
    std::vector<unsigned char> read_file_bytes(const std::filesystem::path &path);

    /**
     * @brief Writes @p data to @p path through a sibling ".tmp" file that is
     * renamed into place, so a failed write never leaves a truncated output.
     * @throws std::runtime_error on any I/O error.
     */
    void write_file_bytes(const std::filesystem::path &path, std::span<const unsigned char> data);

    /**
     * @brief Where the compressed copy of @p input is written.
     *
     * Without @p output the result sits beside the input as
     * "<stem><suffix>.pdf". An existing directory @p output receives that
     * same file name; any other @p output is used as the file path.
     */
    std::filesystem::path output_path_for(const std::filesystem::path &input,
                                          const std::filesystem::path &output,
                                          const std::string &suffix);
} // namespace pdfslim

#endif // PDFSLIM_FILE_UTILS_HPP
