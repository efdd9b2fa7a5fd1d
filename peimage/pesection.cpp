#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <peimage/logging.hpp>
#include <peimage/utils.hpp>
#include <peimage/pesection.hpp>

namespace peimage
{

    pesection::pesection(const image_section_header &header, const BYTE *data, pemsg *msg)
        : _msg(msg),
        _virtualSize(0),
        _virtualAddress(0),
        _rawSize(0),
        _rawOffset(0),
        _characteristics(0)
    {
        setHeader(header, data);
    }

    void pesection::setHeader(const image_section_header &header, const BYTE *src, bool changeData)
    {
        _name = header.getName();
        _virtualSize = header.VirtualSize;
        _virtualAddress = header.VirtualAddress;
        _rawSize = header.SizeOfRawData;
        _rawOffset = header.PointerToRawData;
        _characteristics = header.Characteristics;

        if (!changeData)
            return;

        if (_virtualSize == 0)
            throw section_error(status::zero_size, "Section data size = 0.");

        std::vector<BYTE> block(_virtualSize);     // zero filled

        if (src != nullptr)     // can be null for new section...
            memcpy(block.data(), src, _virtualSize);

        _data.swap(block);

        PEIMAGE_TRACE("section '{}' rva 0x{:x} vsize 0x{:x} raw 0x{:x}@0x{:x}",
            _name, _virtualAddress, _virtualSize, _rawSize, _rawOffset);
    }

    image_section_header pesection::toOnDiskHeader() const
    {
        image_section_header header;

        header.setName(_name);
        header.VirtualSize = _virtualSize;
        header.VirtualAddress = _virtualAddress;
        header.SizeOfRawData = _rawSize;
        header.PointerToRawData = _rawOffset;
        header.Characteristics = _characteristics;

        return header;
    }

    status pesection::load(pestream &stream, DWORD rawOffset, DWORD rawSize)
    {
        if (rawOffset == 0 || rawSize == 0)
            return status::bad_args;

        if (!stream.seek(rawOffset))
        {
            PEIMAGE_DEBUG("section '{}': can't seek to 0x{:x}", _name, rawOffset);
            return status::seek_failed;
        }

        // never trust the header beyond what we own
        const size_t block_len = std::min<size_t>(rawSize, _data.size());

        const size_t cnt = (block_len != 0) ? stream.read(_data.data(), block_len) : 0;

        if (cnt == 0)
        {
            clearData();
            message("Section {} has no raw data.", _name);
            return status::no_raw_data;
        }

        if (cnt != block_len)
        {
            message("Section {} has less raw data than header declares: 0x{:x} instead of 0x{:x}.", _name, cnt, block_len);
            message("Actual raw size was loaded.");
            return status::partial;
        }

        return status::ok;
    }

    bool pesection::loadDataFromStreamEx(pestream &stream, DWORD rawOffset, DWORD rawSize)
    {
        return succeeded(load(stream, rawOffset, rawSize));
    }

    bool pesection::loadDataFromStream(pestream &stream)
    {
        return loadDataFromStreamEx(stream, _rawOffset, _rawSize);
    }

    status pesection::save(pestream &stream)
    {
        if (_data.empty() || _rawSize == 0)
        {
            message("No data to save.");
            return status::no_data;
        }

        // RawSize is file aligned and may exceed the block; the rest goes out as zero padding
        size_t expected = std::min<size_t>(_rawSize, _data.size());

        size_t written = stream.write(_data.data(), expected);

        static const BYTE zeros[0x1000] = {};

        while (written == expected && written < _rawSize)
        {
            const size_t chunk = std::min<size_t>(sizeof(zeros), _rawSize - written);

            written += stream.write(zeros, chunk);
            expected += chunk;
        }

        if (written != _rawSize)
        {
            PEIMAGE_DEBUG("section '{}': 0x{:x} of 0x{:x} bytes written", _name, written, _rawSize);
            return status::io_error;
        }

        return status::ok;
    }

    bool pesection::saveDataToStream(pestream &stream)
    {
        return save(stream) == status::ok;
    }

    bool pesection::saveToFile(const std::string &filename)
    {
        std::error_code ec;
        return saveToFile(filename, ec);
    }

    bool pesection::saveToFile(const std::string &filename, std::error_code &ec)
    {
        ec.clear();

        if (_data.size() < _virtualSize || _data.empty())
        {
            ec = make_error_code(status::no_data);
            return false;
        }

        std::ofstream file(filename, std::ios::binary | std::ios::out | std::ios::trunc);

        if (!file.is_open())
        {
            ec = std::error_code(errno != 0 ? errno : EIO, std::generic_category());
            PEIMAGE_DEBUG("can't create '{}': {}", filename, ec.message());
            return false;
        }

        file.write(reinterpret_cast<const char*>(_data.data()), _virtualSize);
        file.flush();

        if (!file.good())
        {
            ec = make_error_code(status::io_error);
            return false;
        }

        return true;
    }

    void pesection::clearData()
    {
        std::vector<BYTE>().swap(_data);    // release, not only shrink
        _rawSize = 0;
        _rawOffset = 0;
    }

    void pesection::resize(DWORD newSize)
    {
        _rawSize = newSize;
        _virtualSize = newSize;
        _data.resize(newSize, 0);
    }

    void pesection::fill(BYTE pattern)
    {
        std::fill(_data.begin(), _data.end(), pattern);
    }

    size_t pesection::memread(void *dst, rva_t address, size_t size) const
    {
        if (address < _virtualAddress || address - _virtualAddress >= _data.size())
            return 0;

        const size_t offset = address - _virtualAddress;
        const size_t blocksize = std::min(size, _data.size() - offset);

        memcpy(dst, _data.data() + offset, blocksize);

        return blocksize;
    }

    size_t pesection::memwrite(const void *src, size_t size, rva_t address)
    {
        if (address < _virtualAddress || address - _virtualAddress >= _data.size())
            return 0;

        const size_t offset = address - _virtualAddress;
        const size_t blocksize = std::min(size, _data.size() - offset);

        memcpy(_data.data() + offset, src, blocksize);

        return blocksize;
    }

    bool pesection::containsRVA(rva_t rva) const
    {
        if (_virtualSize == 0)
            return false;

        return va_in_range(_virtualAddress, static_cast<uint64_t>(_virtualAddress) + _virtualSize - 1, rva);
    }

    bool pesection::isNameSafe() const
    {
        return !_name.empty() && is_printable_ascii(_name);
    }

};  // end of peimage namespace
