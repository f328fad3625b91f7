#ifndef METAMARK_IO_ERROR_HPP
#define METAMARK_IO_ERROR_HPP

#include <string_view>

namespace metamark {

enum struct IO_Error_Code {
    cannot_open,
    read_error,
    write_error,
};

[[nodiscard]] std::string_view to_prose(IO_Error_Code code);

} // namespace metamark

#endif
