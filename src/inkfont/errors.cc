//
// Created by igor on 19/10/2026.
//

#include <inkfont/errors.hh>

namespace inkfont {
    inkfont_error::inkfont_error(const std::string& what)
        : std::runtime_error(what) {
    }

    inkfont_error::~inkfont_error() = default;
}  // namespace inkfont
