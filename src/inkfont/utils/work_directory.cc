//
// Created by igor on 19/10/2026.
//

#include <inkfont/utils/work_directory.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/logger.hh>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <stdlib.h>

namespace inkfont {
    work_directory::work_directory(const std::filesystem::path& root) {
        const std::filesystem::path parent = root.empty() ? std::filesystem::temp_directory_path() : root;

        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        THROW_IF(ec, std::runtime_error, "cannot create work root ", parent.string(), ": ", ec.message());

        std::string pattern = (parent / "inkfont-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        THROW_IF(::mkdtemp(buffer.data()) == nullptr, std::runtime_error,
                 "mkdtemp failed under ", parent.string(), ": ", std::strerror(errno));
        m_path = buffer.data();
    }

    work_directory::~work_directory() {
        if (m_keep || m_path.empty()) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
        if (ec) {
            LOG_WARN("cannot remove work directory ", m_path.string(), ": ", ec.message());
        }
    }

    std::filesystem::path work_directory::file(std::string_view stem, std::string_view extension) const {
        std::string name(stem);
        name.append(extension);
        return m_path / name;
    }
}  // namespace inkfont
