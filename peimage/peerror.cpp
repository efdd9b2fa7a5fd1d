#include <peimage/peerror.hpp>

namespace peimage
{
    const char* status_string(status s)
    {
        switch (s)
        {
        case status::ok:            return "ok";
        case status::partial:       return "partial raw data";
        case status::no_raw_data:   return "no raw data";
        case status::bad_args:      return "bad arguments";
        case status::seek_failed:   return "seek failed";
        case status::no_data:       return "no data";
        case status::io_error:      return "i/o error";
        case status::zero_size:     return "section data size = 0";
        }

        return "unknown";
    }

    namespace
    {
        class section_category_impl : public std::error_category
        {
        public:
            const char* name() const noexcept override { return "peimage"; }
            std::string message(int code) const override { return status_string(static_cast<status>(code)); }
        };
    }

    const std::error_category& section_category()
    {
        static section_category_impl category;
        return category;
    }
}
