#pragma once
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

#include <mio/mmap.hpp>

// read-only source file whose regions are mapped on demand
//
// every mapping returned by map() is a mio::mmap_source owned by the caller:
// it is unmapped when it goes out of scope, on every exit path
class SourceFile {
    public:
    explicit SourceFile(const std::filesystem::path& fname);
    ~SourceFile();

    SourceFile(const SourceFile&) = delete;
    SourceFile& operator=(const SourceFile&) = delete;

    class IOError : public std::runtime_error {
        public:
        explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
    };

    // a mapping start rounded down to a page boundary
    struct PageWindow {
        uint64_t aligned_offset;    // multiple of the page size
        size_t offset_adjustment;   // pos - aligned_offset
    };

    static PageWindow align_to_page(uint64_t pos, size_t page_size);
    static PageWindow align_to_page(uint64_t pos) { return align_to_page(pos, mio::page_size()); }

    // map [aligned_offset, aligned_offset + length), throws IOError
    mio::mmap_source map(uint64_t aligned_offset, size_t length) const;

    size_t size() const { return m_size; }
    const std::filesystem::path& path() const { return m_fname; }

    private:
    std::filesystem::path m_fname;
    int m_fd = -1;
    size_t m_size = 0;
};
