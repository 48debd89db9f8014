#pragma once
#include <cstdint>
#include <string_view>
#include <vector>

// owned byte buffer, returned by the window reader
class buf_t : public std::vector<uint8_t> {
    public:
    buf_t() = default;

    std::string_view as_string_view() const {
        return std::string_view(reinterpret_cast<const char*>(data()), size());
    }
};
