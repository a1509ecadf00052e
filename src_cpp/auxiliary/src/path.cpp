#include "pngstash/auxiliary/path.hpp"


namespace pngstash {

    std::string tostr(const Path& path) {
        const auto u8str = path.generic_u8string();
        return std::string(u8str.begin(), u8str.end());
    }

    Path fromstr(const std::string& str) { return fs::u8path(str); }

    Path path_concat(const Path& base, const std::string& suffix) {
        return fromstr(tostr(base) + suffix);
    }

}  // namespace pngstash
