/**
 * @file process.hh
 * @brief Run an external tool to completion.
 *
 * Used by the potrace tracer and the FontForge compiler. The child's stdout
 * and stderr both go to a log file, which is what the caller reads back when
 * the tool fails.
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <filesystem>
#include <string>
#include <vector>

namespace inkfont {
    struct INKFONT_EXPORT process_result {
        int exit_code = -1;        ///< Exit status, or -1 when killed by a signal
        int signal = 0;            ///< Terminating signal, 0 on normal exit
        std::string output_tail;   ///< Last bytes of the combined stdout/stderr

        [[nodiscard]] bool ok() const noexcept { return signal == 0 && exit_code == 0; }
    };

    /**
     * @brief Spawn @p argv (looked up on PATH) and wait for it.
     *
     * @param argv Program name followed by its arguments
     * @param log_file Receives stdout and stderr; truncated first
     * @throws std::runtime_error if the process cannot be started
     */
    [[nodiscard]] INKFONT_EXPORT process_result run_process(const std::vector<std::string>& argv,
                                                            const std::filesystem::path& log_file);

    /// Last @p max_bytes of a text file, empty if it cannot be read.
    [[nodiscard]] INKFONT_EXPORT std::string read_tail(const std::filesystem::path& file,
                                                       std::size_t max_bytes = 2048);
} // namespace inkfont
