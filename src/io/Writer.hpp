#pragma once
#include <filesystem>
#include <string_view>

// unbuffered file writer; write() either writes everything or throws
class Writer {
    public:
    Writer(const std::filesystem::path& fname, bool truncate = true);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void write(const void* buf, size_t count) const;
    void write(std::string_view str) const { write(str.data(), str.size()); }

    // flush and close, reporting errors that the destructor would swallow
    void close();

    private:
    std::filesystem::path m_fname;
    int m_fd = -1;
};
