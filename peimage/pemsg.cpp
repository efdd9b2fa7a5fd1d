#include <peimage/logging.hpp>
#include <peimage/pemsg.hpp>

namespace peimage
{

    void pelogmsg::write(const std::string &message)
    {
        PEIMAGE_WARN("{}", message);
    }

    pelogmsg &pelogmsg::instance()
    {
        static pelogmsg sink;
        return sink;
    }

};  // end of peimage namespace
