#pragma once

#include <cstdint>

#ifndef PEIMAGE_VA_HPP_
#define PEIMAGE_VA_HPP_

namespace peimage
{
    typedef uint8_t     BYTE;
    typedef uint16_t    WORD;
    typedef uint32_t    DWORD;
    typedef uint64_t    QWORD;

    typedef uint32_t    rva_t;  // relative to image base, always 32 bit in a section header
}

#endif
