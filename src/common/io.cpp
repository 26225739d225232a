#include <cstdio>
#include <cstring>
#include <memory>

#include "common/assert.hpp"
#include "common/config.hpp"
#include "common/io.hpp"

namespace markdown_academic {

namespace {

struct File_Closer {
    void operator()(std::FILE* file) const noexcept
    {
        std::fclose(file);
    }
};

template <typename Container>
Result<Container, IO_Error_Code> read_whole_file(std::string_view path, Container out)
{
    constexpr Size block_size = 4096;
    char buffer[block_size] {};

    MARKDOWN_ACADEMIC_ASSERT(path.size() < block_size);
    std::memcpy(buffer, path.data(), path.size());

    const std::unique_ptr<std::FILE, File_Closer> stream { std::fopen(buffer, "rb") };
    if (!stream) {
        return IO_Error_Code::cannot_open;
    }

    Size read_size;
    do {
        read_size = std::fread(buffer, 1, block_size, stream.get());
        if (std::ferror(stream.get())) {
            return IO_Error_Code::read_error;
        }
        out.insert(out.end(), buffer, buffer + read_size);
    } while (read_size == block_size);

    return out;
}

} // namespace

Result<std::pmr::vector<char>, IO_Error_Code> file_to_bytes(std::string_view path,
                                                            std::pmr::memory_resource* memory)
{
    return read_whole_file(path, std::pmr::vector<char>(memory));
}

Result<std::pmr::string, IO_Error_Code> file_to_string(std::string_view path,
                                                       std::pmr::memory_resource* memory)
{
    return read_whole_file(path, std::pmr::string(memory));
}

std::pmr::string
join_path(std::string_view directory, std::string_view path, std::pmr::memory_resource* memory)
{
    if (directory.empty() || path.starts_with('/')) {
        return std::pmr::string(path, memory);
    }
    std::pmr::string result(directory, memory);
    if (!result.ends_with('/')) {
        result += '/';
    }
    result += path;
    return result;
}

} // namespace markdown_academic
