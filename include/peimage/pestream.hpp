#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <utility>
#include <vector>
#include <peimage/va.hpp>

namespace peimage
{
    /** the minimal stream a section can load from or save to... */
    class pestream
    {
    public:
        virtual ~pestream() = default;

        /** absolute positioning; false if position is past the end */
        virtual bool    seek(uint64_t position) = 0;
        virtual size_t  read(void *dst, size_t count) = 0;
        virtual size_t  write(const void *src, size_t count) = 0;
    };

    /** adapter over a standard stream, which stays owned by the caller */
    class pestdstream : public pestream
    {
    public:
        explicit pestdstream(std::iostream &stream) : _in(&stream), _out(&stream) { }
        explicit pestdstream(std::istream &stream) : _in(&stream), _out(nullptr) { }
        explicit pestdstream(std::ostream &stream) : _in(nullptr), _out(&stream) { }

        bool    seek(uint64_t position) override;
        size_t  read(void *dst, size_t count) override;
        size_t  write(const void *src, size_t count) override;

    private:
        std::istream *_in;
        std::ostream *_out;
    };

    /** a growable in-memory stream */
    class pememstream : public pestream
    {
    public:
        pememstream() : _position(0) { }
        explicit pememstream(std::vector<BYTE> data) : _data(std::move(data)), _position(0) { }

        bool    seek(uint64_t position) override;
        size_t  read(void *dst, size_t count) override;
        size_t  write(const void *src, size_t count) override;

        inline const std::vector<BYTE>& data() const { return _data; };
        inline size_t position() const { return _position; };

    private:
        std::vector<BYTE> _data;
        size_t _position;
    };

}   // end of namespace peimage
