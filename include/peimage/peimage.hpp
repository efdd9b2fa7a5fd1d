#pragma once

#include <peimage/va.hpp>
#include <peimage/petypes.hpp>
#include <peimage/peerror.hpp>
#include <peimage/pemsg.hpp>
#include <peimage/pestream.hpp>
#include <peimage/pesection.hpp>
#include <peimage/logging.hpp>
