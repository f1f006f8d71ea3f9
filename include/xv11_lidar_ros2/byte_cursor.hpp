#pragma once
#include <cstdint>
#include <cstddef>
#include <stdexcept>

namespace xv11
{

    // Cursor over a byte buffer (little-endian).
    class Cursor
    {
    public:
        Cursor(const uint8_t *data, size_t len) : p_(data), end_(data + len) {}

        uint8_t u8()
        {
            require(1);
            return *p_++;
        }

        uint16_t u16()
        {
            require(2);
            uint16_t v = (uint16_t)p_[0] | ((uint16_t)p_[1] << 8);
            p_ += 2;
            return v;
        }

    private:
        void require(size_t n) const
        {
            if (static_cast<size_t>(end_ - p_) < n)
                throw std::runtime_error("xv11::Cursor out of data");
        }

        const uint8_t *p_;
        const uint8_t *end_;
    };

} // namespace xv11
