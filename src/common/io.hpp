#ifndef METAMARK_IO_HPP
#define METAMARK_IO_HPP

#include <memory_resource>
#include <string>
#include <string_view>

#include "common/io_error.hpp"
#include "common/result.hpp"

namespace metamark {

/// @brief Reads the whole file at `path` into a string.
Result<std::pmr::string, IO_Error_Code> file_to_string(std::string_view path,
                                                       std::pmr::memory_resource* memory);

/// @brief Writes `text` to the file at `path`, replacing any previous contents.
Result<void, IO_Error_Code> string_to_file(std::string_view path, std::string_view text);

} // namespace metamark

#endif
