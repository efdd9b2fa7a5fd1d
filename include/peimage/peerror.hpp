#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace peimage
{
    /** outcome of a section operation... */
    enum class status {
        ok = 0,
        partial,        // less raw data than declared, actual count was used
        no_raw_data,    // stream had nothing at the raw offset, section data cleared
        bad_args,       // raw offset or raw size is 0, nothing to load
        seek_failed,
        no_data,        // nothing allocated to save
        io_error,
        zero_size       // section with data requested but virtual size is 0
    };

    const char* status_string(status s);

    /** a structural error: the section can't be represented at all */
    inline bool is_fatal(status s) { return s == status::zero_size; }

    /** advisory outcomes still count as a completed operation */
    inline bool succeeded(status s) { return s == status::ok || s == status::partial || s == status::no_raw_data; }

    const std::error_category& section_category();

    inline std::error_code make_error_code(status s) { return std::error_code(static_cast<int>(s), section_category()); }

    class section_error : public std::runtime_error
    {
    public:
        section_error(status code, const std::string &what)
            : std::runtime_error(what), _code(code) { }

        status code() const { return _code; }

    private:
        status _code;
    };

}   // end of namespace peimage

namespace std
{
    template<> struct is_error_code_enum<peimage::status> : true_type { };
}
