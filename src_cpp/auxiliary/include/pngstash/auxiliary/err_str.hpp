#pragma once

#include <expected>
#include <string>


namespace pngstash {

    using ErrStr = std::expected<void, std::string>;

}  // namespace pngstash
