#pragma once
#include <cstdint>
#include <cstddef>
#include <string>

namespace xv11
{

    // Blocking byte source the driver reads frames from.
    class ByteStream
    {
    public:
        virtual ~ByteStream() = default;

        // Fills buf with exactly n bytes or fails (I/O error, timeout, EOF).
        // On failure last_error() describes why.
        virtual bool read_exact(uint8_t *buf, size_t n) = 0;

        virtual std::string last_error() const = 0;
    };

} // namespace xv11
