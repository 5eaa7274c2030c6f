#pragma once

// <netdb.h>, reached through Boost.Asio, defines NO_DATA, which collides with
// TripUpdate_StopTimeUpdate::NO_DATA in the generated code.
#ifdef NO_DATA
#undef NO_DATA
#endif

#include "gtfs-realtime.pb.h"
