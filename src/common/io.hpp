#ifndef SLUGMARK_IO_HPP
#define SLUGMARK_IO_HPP

#include <cstdio>
#include <memory_resource>
#include <string_view>
#include <vector>

#include "common/io_error.hpp"
#include "common/result.hpp"

namespace slugmark {

/// @brief Reads the whole contents of an already opened stream until EOF.
/// The stream is not closed.
/// @param stream the stream to read from, such as `stdin`
/// @param memory the memory resource for the returned vector
Result<std::pmr::vector<char>, IO_Error_Code> stream_to_bytes(std::FILE* stream,
                                                              std::pmr::memory_resource* memory);

/// @brief Reads the whole file at `path`.
Result<std::pmr::vector<char>, IO_Error_Code> file_to_bytes(std::string_view path,
                                                            std::pmr::memory_resource* memory);

} // namespace slugmark

#endif
