#include <cstdio>
#include <cstring>
#include <memory>

#include "common/assert.hpp"
#include "common/config.hpp"
#include "common/io.hpp"

namespace metamark {

namespace {

constexpr Size block_size = 4096;

struct File_Closer {
    void operator()(std::FILE* file) const noexcept
    {
        std::fclose(file);
    }
};

using Unique_File = std::unique_ptr<std::FILE, File_Closer>;

[[nodiscard]] Unique_File open_file(std::string_view path, const char* mode)
{
    char buffer[block_size] {};
    METAMARK_ASSERT(path.size() < block_size);
    std::memcpy(buffer, path.data(), path.size());
    return Unique_File { std::fopen(buffer, mode) };
}

} // namespace

std::string_view to_prose(IO_Error_Code code)
{
    switch (code) {
    case IO_Error_Code::cannot_open: return "The file could not be opened.";
    case IO_Error_Code::read_error: return "An error occurred while reading the file.";
    case IO_Error_Code::write_error: return "An error occurred while writing the file.";
    }
    METAMARK_ASSERT_UNREACHABLE("invalid IO error code");
}

Result<std::pmr::string, IO_Error_Code> file_to_string(std::string_view path,
                                                       std::pmr::memory_resource* memory)
{
    const Unique_File stream = open_file(path, "rb");
    if (!stream) {
        return IO_Error_Code::cannot_open;
    }

    char buffer[block_size];
    std::pmr::string out(memory);
    Size read_size;
    do {
        read_size = std::fread(buffer, 1, block_size, stream.get());
        if (std::ferror(stream.get())) {
            return IO_Error_Code::read_error;
        }
        out.append(buffer, read_size);
    } while (read_size == block_size);

    return out;
}

Result<void, IO_Error_Code> string_to_file(std::string_view path, std::string_view text)
{
    const Unique_File stream = open_file(path, "wb");
    if (!stream) {
        return IO_Error_Code::cannot_open;
    }
    if (std::fwrite(text.data(), 1, text.size(), stream.get()) != text.size()) {
        return IO_Error_Code::write_error;
    }
    return {};
}

} // namespace metamark
