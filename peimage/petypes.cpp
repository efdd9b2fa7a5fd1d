#include <algorithm>
#include <peimage/petypes.hpp>

namespace peimage
{
    static DWORD read_dword(const BYTE *p)
    {
        return static_cast<DWORD>(p[0]) |
            (static_cast<DWORD>(p[1]) << 8) |
            (static_cast<DWORD>(p[2]) << 16) |
            (static_cast<DWORD>(p[3]) << 24);
    }

    static WORD read_word(const BYTE *p)
    {
        return static_cast<WORD>(p[0] | (p[1] << 8));
    }

    static BYTE *write_dword(BYTE *p, DWORD value)
    {
        p[0] = static_cast<BYTE>(value);
        p[1] = static_cast<BYTE>(value >> 8);
        p[2] = static_cast<BYTE>(value >> 16);
        p[3] = static_cast<BYTE>(value >> 24);
        return p + 4;
    }

    static BYTE *write_word(BYTE *p, WORD value)
    {
        p[0] = static_cast<BYTE>(value);
        p[1] = static_cast<BYTE>(value >> 8);
        return p + 2;
    }

    image_section_header::image_section_header()
        : VirtualSize(0),
        VirtualAddress(0),
        SizeOfRawData(0),
        PointerToRawData(0),
        PointerToRelocations(0),
        PointerToLinenumbers(0),
        NumberOfRelocations(0),
        NumberOfLinenumbers(0),
        Characteristics(0)
    {
        Name.fill(0);
    }

    std::string image_section_header::getName() const
    {
        const auto end = std::find(Name.begin(), Name.end(), 0);
        return std::string(Name.begin(), end);
    }

    void image_section_header::setName(const std::string &name)
    {
        Name.fill(0);
        std::copy_n(name.begin(), std::min(name.size(), Name.size()), Name.begin());
    }

    bool image_section_header::parse(const BYTE *data, size_t size, image_section_header &header)
    {
        if (data == nullptr || size < IMAGE_SIZEOF_SECTION_HEADER)
            return false;

        std::copy_n(data, IMAGE_SIZEOF_SHORT_NAME, header.Name.begin());

        const BYTE *p = data + IMAGE_SIZEOF_SHORT_NAME;
        header.VirtualSize = read_dword(p);
        header.VirtualAddress = read_dword(p + 4);
        header.SizeOfRawData = read_dword(p + 8);
        header.PointerToRawData = read_dword(p + 12);
        header.PointerToRelocations = read_dword(p + 16);
        header.PointerToLinenumbers = read_dword(p + 20);
        header.NumberOfRelocations = read_word(p + 24);
        header.NumberOfLinenumbers = read_word(p + 26);
        header.Characteristics = read_dword(p + 28);

        return true;
    }

    std::array<BYTE, IMAGE_SIZEOF_SECTION_HEADER> image_section_header::serialize() const
    {
        std::array<BYTE, IMAGE_SIZEOF_SECTION_HEADER> raw;

        BYTE *p = std::copy(Name.begin(), Name.end(), raw.data());
        p = write_dword(p, VirtualSize);
        p = write_dword(p, VirtualAddress);
        p = write_dword(p, SizeOfRawData);
        p = write_dword(p, PointerToRawData);
        p = write_dword(p, PointerToRelocations);
        p = write_dword(p, PointerToLinenumbers);
        p = write_word(p, NumberOfRelocations);
        p = write_word(p, NumberOfLinenumbers);
        write_dword(p, Characteristics);

        return raw;
    }

    bool operator == (const image_section_header &a, const image_section_header &b)
    {
        return a.Name == b.Name &&
            a.VirtualSize == b.VirtualSize &&
            a.VirtualAddress == b.VirtualAddress &&
            a.SizeOfRawData == b.SizeOfRawData &&
            a.PointerToRawData == b.PointerToRawData &&
            a.PointerToRelocations == b.PointerToRelocations &&
            a.PointerToLinenumbers == b.PointerToLinenumbers &&
            a.NumberOfRelocations == b.NumberOfRelocations &&
            a.NumberOfLinenumbers == b.NumberOfLinenumbers &&
            a.Characteristics == b.Characteristics;
    }

    bool operator != (const image_section_header &a, const image_section_header &b)
    {
        return !(a == b);
    }

};  // end of peimage namespace
