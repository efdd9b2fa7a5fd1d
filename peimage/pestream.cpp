#include <algorithm>
#include <cstring>
#include <peimage/pestream.hpp>

namespace peimage
{
    /** bytes between the beginning and the end of a stream, position restored... */
    static uint64_t stream_size(std::istream &strm)
    {
        const std::streampos current = strm.tellg();
        strm.seekg(0, std::ios_base::end);
        const std::streamoff end = strm.tellg();
        strm.seekg(current);

        return (end < 0) ? 0 : static_cast<uint64_t>(end);
    }

    bool pestdstream::seek(uint64_t position)
    {
        if (_in != nullptr)
        {
            _in->clear();   // a previous short read leaves eof set

            if (position > stream_size(*_in))
                return false;

            _in->seekg(static_cast<std::streamoff>(position), std::ios_base::beg);
            if (_in->fail())
                return false;
        }

        if (_out != nullptr)
        {
            _out->clear();
            _out->seekp(static_cast<std::streamoff>(position), std::ios_base::beg);
            if (_out->fail())
                return false;
        }

        return _in != nullptr || _out != nullptr;
    }

    size_t pestdstream::read(void *dst, size_t count)
    {
        if (_in == nullptr || count == 0)
            return 0;

        _in->read(static_cast<char*>(dst), static_cast<std::streamsize>(count));
        const auto numberOfBytesread = static_cast<size_t>(_in->gcount());

        if (_in->eof())
            _in->clear();

        return numberOfBytesread;
    }

    size_t pestdstream::write(const void *src, size_t count)
    {
        if (_out == nullptr || count == 0)
            return 0;

        const std::streamoff before = _out->tellp();

        _out->write(static_cast<const char*>(src), static_cast<std::streamsize>(count));

        if (_out->good())
            return count;

        if (before < 0)
            return 0;

        _out->clear();      // tellp gives -1 while the stream is failed
        const std::streamoff after = _out->tellp();

        return (after > before) ? static_cast<size_t>(after - before) : 0;
    }

    bool pememstream::seek(uint64_t position)
    {
        if (position > _data.size())
            return false;

        _position = static_cast<size_t>(position);
        return true;
    }

    size_t pememstream::read(void *dst, size_t count)
    {
        const size_t available = _data.size() - _position;
        const size_t block_len = std::min(count, available);

        if (block_len != 0)
        {
            memcpy(dst, _data.data() + _position, block_len);
            _position += block_len;
        }

        return block_len;
    }

    size_t pememstream::write(const void *src, size_t count)
    {
        if (count == 0)
            return 0;

        if (_position + count > _data.size())
            _data.resize(_position + count);

        memcpy(_data.data() + _position, src, count);
        _position += count;

        return count;
    }

};  // end of peimage namespace
