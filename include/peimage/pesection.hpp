#pragma once

#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include <spdlog/fmt/fmt.h>
#include <peimage/peerror.hpp>
#include <peimage/pemsg.hpp>
#include <peimage/pestream.hpp>
#include <peimage/petypes.hpp>

namespace peimage
{
    /**
     * one section of a PE image: the header values plus an owned copy of its data.
     * The data block is sized on VirtualSize when the header is set, and holds the
     * in-memory image of the section (raw bytes followed by zero fill).
     */
    class pesection
    {
    public:
        /** msg is optional; it must outlive the section when given */
        pesection(const image_section_header &header, const BYTE *data = nullptr, pemsg *msg = nullptr);

        inline const std::string& Name() const { return _name; };
        inline DWORD VirtualSize() const { return _virtualSize; };
        inline rva_t VirtualAddress() const { return _virtualAddress; };
        inline DWORD RawSize() const { return _rawSize; };
        inline DWORD RawOffset() const { return _rawOffset; };
        inline DWORD Characteristics() const { return _characteristics; };
        inline size_t AllocatedSize() const { return _data.size(); };

        inline BYTE* data() { return _data.empty() ? nullptr : _data.data(); };
        inline const BYTE* data() const { return _data.empty() ? nullptr : _data.data(); };

        void    setName(const std::string &name) { _name = name; };
        void    setRawOffset(DWORD rawOffset) { _rawOffset = rawOffset; };
        void    setCharacteristics(DWORD characteristics) { _characteristics = characteristics; };

        /**
         * take all values from header. With changeData the data block is reallocated
         * to VirtualSize (zero filled) and VirtualSize bytes are copied from src when given;
         * throws section_error if VirtualSize is 0. Without changeData the block is untouched.
         */
        void    setHeader(const image_section_header &header, const BYTE *src = nullptr, bool changeData = true);

        /** serialize the section values back to a section table entry */
        image_section_header toOnDiskHeader() const;

        /**
         * read at most rawSize bytes (clamped to the allocated size) from rawOffset.
         * A short read is tolerated and reported to the diagnostic sink.
         */
        status  load(pestream &stream, DWORD rawOffset, DWORD rawSize);
        bool    loadDataFromStreamEx(pestream &stream, DWORD rawOffset, DWORD rawSize);
        bool    loadDataFromStream(pestream &stream);

        /** write RawSize bytes at the current stream position */
        status  save(pestream &stream);
        bool    saveDataToStream(pestream &stream);

        /** dump VirtualSize bytes (the mapped image, not the raw slice) to a file */
        bool    saveToFile(const std::string &filename);
        bool    saveToFile(const std::string &filename, std::error_code &ec);

        void    clearData();
        void    resize(DWORD newSize);
        void    fill(BYTE pattern);

        /** copy between the data block and caller memory; returns bytes copied, 0 if rva is outside */
        size_t  memread(void *dst, rva_t address, size_t size) const;
        size_t  memwrite(const void *src, size_t size, rva_t address);

        bool    containsRVA(rva_t rva) const;
        inline rva_t endRVA() const { return _virtualAddress + _virtualSize; };
        inline rva_t lastRVA() const { return _virtualAddress + _virtualSize - 1; };   // VirtualSize must not be 0
        inline DWORD endRawOffset() const { return _rawOffset + _rawSize; };

        bool    isNameSafe() const;

        bool    isCode() const { return (_characteristics & IMAGE_SCN_CNT_CODE) == IMAGE_SCN_CNT_CODE; };
        bool    isExecutable() const { return (_characteristics & IMAGE_SCN_MEM_EXECUTE) == IMAGE_SCN_MEM_EXECUTE; };
        bool    isReadonly() const { return (_characteristics & IMAGE_SCN_MEM_WRITE) != IMAGE_SCN_MEM_WRITE; };

    private:
        template<typename... Args>
        void    message(fmt::format_string<Args...> format, Args&&... args)
        {
            if (_msg != nullptr)
                _msg->write(fmt::format(format, std::forward<Args>(args)...));
        }

        pemsg*  _msg;

        std::string _name;
        DWORD   _virtualSize;
        rva_t   _virtualAddress;
        DWORD   _rawSize;
        DWORD   _rawOffset;
        DWORD   _characteristics;

        std::vector<BYTE> _data;    // data inside section..
    };

}   // end of namespace peimage
