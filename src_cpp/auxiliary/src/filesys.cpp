#include "pngstash/auxiliary/filesys.hpp"

#include <format>
#include <fstream>
#include <sstream>


namespace pngstash {

    bool read_file(const Path& path, std::string& out) {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs)
            return false;
        std::ostringstream ss;
        ss << ifs.rdbuf();
        out = ss.str();
        return true;
    }

    bool read_file(const Path& path, std::vector<uint8_t>& out) {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs)
            return false;

        ifs.seekg(0, std::ios::end);
        const auto file_size = ifs.tellg();
        if (file_size < 0)
            return false;
        ifs.seekg(0, std::ios::beg);
        out.resize(static_cast<size_t>(file_size));
        ifs.read(
            reinterpret_cast<char*>(out.data()),
            static_cast<std::streamsize>(file_size)
        );
        return static_cast<size_t>(ifs.gcount()) == out.size();
    }

    std::expected<std::vector<uint8_t>, std::string> read_file(
        const Path& path
    ) {
        std::vector<uint8_t> data;
        if (!read_file(path, data))
            return std::unexpected("Failed to read file: " + tostr(path));
        return data;
    }

    bool write_file(const Path& path, const void* data, size_t size) {
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        if (!ofs)
            return false;
        ofs.write(
            reinterpret_cast<const char*>(data),
            static_cast<std::streamsize>(size)
        );
        if (!ofs)
            return false;
        return static_cast<size_t>(ofs.tellp()) == size;
    }

    ErrStr replace_file(const Path& path, const std::vector<uint8_t>& data) {
        const auto tmp_path = path_concat(path, ".tmp");

        std::error_code ec;
        if (fs::exists(tmp_path, ec)) {
            return std::unexpected(
                "Temp file already exists, not overwriting: " + tostr(tmp_path)
            );
        }

        if (!write_file(tmp_path, data.data(), data.size())) {
            fs::remove(tmp_path, ec);
            return std::unexpected("Failed to write file: " + tostr(tmp_path));
        }

        // Keep the mode bits of the file being replaced
        const auto old_status = fs::status(path, ec);
        if (!ec && fs::exists(old_status)) {
            fs::permissions(tmp_path, old_status.permissions(), ec);
            if (ec) {
                std::error_code ec_rm;
                fs::remove(tmp_path, ec_rm);
                return std::unexpected(
                    std::format(
                        "Failed to copy permissions to {}: {}",
                        tostr(tmp_path),
                        ec.message()
                    )
                );
            }
        }

        ec.clear();
        fs::rename(tmp_path, path, ec);
        if (ec) {
            std::error_code ec_rm;
            fs::remove(tmp_path, ec_rm);
            return std::unexpected(
                std::format(
                    "Failed to replace {}: {}", tostr(path), ec.message()
                )
            );
        }

        return {};
    }

}  // namespace pngstash
