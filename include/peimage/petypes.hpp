#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <peimage/va.hpp>

namespace peimage
{
    constexpr size_t IMAGE_SIZEOF_SHORT_NAME = 8;
    constexpr size_t IMAGE_SIZEOF_SECTION_HEADER = 40;

    /** section characteristics (winnt.h values)... */
    enum : DWORD {
        IMAGE_SCN_TYPE_NO_PAD               = 0x00000008,
        IMAGE_SCN_CNT_CODE                  = 0x00000020,
        IMAGE_SCN_CNT_INITIALIZED_DATA      = 0x00000040,
        IMAGE_SCN_CNT_UNINITIALIZED_DATA    = 0x00000080,
        IMAGE_SCN_LNK_INFO                  = 0x00000200,
        IMAGE_SCN_LNK_REMOVE                = 0x00000800,
        IMAGE_SCN_LNK_COMDAT                = 0x00001000,
        IMAGE_SCN_LNK_NRELOC_OVFL           = 0x01000000,
        IMAGE_SCN_MEM_DISCARDABLE           = 0x02000000,
        IMAGE_SCN_MEM_NOT_CACHED            = 0x04000000,
        IMAGE_SCN_MEM_NOT_PAGED             = 0x08000000,
        IMAGE_SCN_MEM_SHARED                = 0x10000000,
        IMAGE_SCN_MEM_EXECUTE               = 0x20000000,
        IMAGE_SCN_MEM_READ                  = 0x40000000,
        IMAGE_SCN_MEM_WRITE                 = 0x80000000
    };

    /**
     * on-disk section header, one entry of the section table.
     * Fields are in host order, parse/serialize handle the little-endian layout.
     */
    struct image_section_header
    {
        std::array<BYTE, IMAGE_SIZEOF_SHORT_NAME> Name;   // NUL padded, not always NUL terminated
        DWORD   VirtualSize;
        DWORD   VirtualAddress;
        DWORD   SizeOfRawData;
        DWORD   PointerToRawData;
        DWORD   PointerToRelocations;
        DWORD   PointerToLinenumbers;
        WORD    NumberOfRelocations;
        WORD    NumberOfLinenumbers;
        DWORD   Characteristics;

        image_section_header();

        /** name up to the first NUL, at most 8 bytes */
        std::string getName() const;

        /** store name truncated to 8 bytes, remaining bytes set to 0 */
        void setName(const std::string &name);

        /** decode a 40 byte little-endian record; false if size is too small */
        static bool parse(const BYTE *data, size_t size, image_section_header &header);

        std::array<BYTE, IMAGE_SIZEOF_SECTION_HEADER> serialize() const;
    };

    bool operator == (const image_section_header &a, const image_section_header &b);
    bool operator != (const image_section_header &a, const image_section_header &b);

}   // end of namespace peimage
