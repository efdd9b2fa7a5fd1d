#ifndef PEIMAGE_UTILS_HPP_
#define PEIMAGE_UTILS_HPP_

#include <string>
#include <peimage/va.hpp>

namespace peimage
{
    bool va_in_range(uint64_t low, uint64_t high, uint64_t x);

    /** true if every byte is printable 7-bit ASCII (0x20..0x7E) */
    bool is_printable_ascii(const std::string &text);
}

#endif
