#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

#include "common/assert.hpp"
#include "common/config.hpp"
#include "common/io.hpp"

namespace slugmark {
namespace {

struct File_Closer {
    void operator()(std::FILE* file) const noexcept
    {
        std::fclose(file);
    }
};

using Unique_File = std::unique_ptr<std::FILE, File_Closer>;

} // namespace

Result<std::pmr::vector<char>, IO_Error_Code> stream_to_bytes(std::FILE* stream,
                                                              std::pmr::memory_resource* memory)
{
    SLUGMARK_ASSERT(stream != nullptr);

    constexpr Size block_size = 4096;
    char buffer[block_size];

    std::pmr::vector<char> out(memory);
    Size read_size;
    do {
        read_size = std::fread(buffer, 1, block_size, stream);
        if (std::ferror(stream)) {
            return IO_Error_Code::read_error;
        }
        out.insert(out.end(), buffer, buffer + read_size);
    } while (read_size == block_size);

    return out;
}

Result<std::pmr::vector<char>, IO_Error_Code> file_to_bytes(std::string_view path,
                                                            std::pmr::memory_resource* memory)
{
    // fopen requires a null-terminated string.
    const std::pmr::string terminated_path { path, memory };

    Unique_File stream { std::fopen(terminated_path.c_str(), "rb") };
    if (!stream) {
        return IO_Error_Code::cannot_open;
    }
    return stream_to_bytes(stream.get(), memory);
}

} // namespace slugmark
