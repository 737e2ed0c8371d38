/**
 * @file work_directory.hh
 * @brief Private scratch directory of one generation job.
 *
 * Created with mkdtemp, so concurrent jobs never share paths. Removed with
 * everything inside it when the owner goes away, unless keep() was called.
 *
 * @code{.cpp}
 * work_directory work("/tmp");
 * auto pbm = work.file("cell_012_U+0041", ".pbm");   // <dir>/cell_012_U+0041.pbm
 * @endcode
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <filesystem>
#include <string_view>

namespace inkfont {
    class INKFONT_EXPORT work_directory {
    public:
        /**
         * @param root Parent directory; empty means the system temp directory
         * @throws std::runtime_error if the directory cannot be created
         */
        explicit work_directory(const std::filesystem::path& root = {});
        ~work_directory();

        work_directory(const work_directory&) = delete;
        work_directory& operator=(const work_directory&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

        [[nodiscard]] std::filesystem::path file(std::string_view stem, std::string_view extension) const;

        /// Leave the directory on disk when destroyed.
        void keep(bool value = true) noexcept { m_keep = value; }
        [[nodiscard]] bool kept() const noexcept { return m_keep; }

    private:
        std::filesystem::path m_path;
        bool m_keep = false;
    };
} // namespace inkfont
