#pragma once

#include <string>

namespace peimage
{
    /** receiver of non-fatal anomalies found while handling a section... */
    class pemsg
    {
    public:
        virtual ~pemsg() = default;

        virtual void write(const std::string &message) = 0;
    };

    /** default sink: forwards every message to the library logger at warn level */
    class pelogmsg : public pemsg
    {
    public:
        void write(const std::string &message) override;

        static pelogmsg &instance();
    };

}   // end of namespace peimage
