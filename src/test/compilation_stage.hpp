#ifndef METAMARK_COMPILATION_STAGE_HPP
#define METAMARK_COMPILATION_STAGE_HPP

#include "common/config.hpp"

namespace metamark {

enum struct Document_Stage : Default_Underlying { //
    load_file,
    parse,
    write
};

constexpr auto operator<=>(Document_Stage a, Document_Stage b)
{
    return static_cast<Default_Underlying>(a) <=> static_cast<Default_Underlying>(b);
}

} // namespace metamark

#endif
