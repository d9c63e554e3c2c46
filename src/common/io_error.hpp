#ifndef SLUGMARK_IO_ERROR_HPP
#define SLUGMARK_IO_ERROR_HPP

#include "common/config.hpp"

namespace slugmark {

enum struct IO_Error_Code : Default_Underlying {
    cannot_open,
    read_error,
    write_error,
};

} // namespace slugmark

#endif
