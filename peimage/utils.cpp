#include <peimage/utils.hpp>

namespace peimage
{
    bool va_in_range(uint64_t low, uint64_t high, uint64_t x)
    {
        if (x >= low && x <= high)
            return true;

        return false;
    }

    bool is_printable_ascii(const std::string &text)
    {
        for (const auto c : text)
        {
            const auto b = static_cast<unsigned char>(c);
            if (b < 0x20 || b > 0x7E)
                return false;
        }

        return true;
    }
}
