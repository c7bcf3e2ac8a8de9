#ifndef TIMELAPSE_TIMEPARSE_H
#define TIMELAPSE_TIMEPARSE_H

#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>

//
// Instants are always UTC ptimes. Durations are posix time_durations.
//
typedef boost::posix_time::ptime         instant_t;
typedef boost::posix_time::time_duration interval_t;

//
// Parse an ISO 8601 date / date-time string and return it as UTC.
//
// Accepts:
//   - YYYY-MM-DD
//   - YYYY-MM-DDTHH:MM[:SS[.ffffff]]  (a space is also fine in place of the T)
// optionally followed by Z, +HH, +HH:MM or +HHMM (or -).
// Without a zone designator the time is taken to already be UTC.
//
// throws std::invalid_argument if the string can't be understood.
//
instant_t ParseIsoTime( const std::string &s );

//
// Parse a resampling interval expressed like a pandas offset alias,
// e.g. "5min", "1H", "30S", "D" or "1h30min".
//
// Each term is an optional count followed by a unit:
//    D         days
//    H, h      hours
//    T, min    minutes
//    S, s      seconds
//    L, ms     milliseconds
//    U, us     microseconds
//
// throws std::invalid_argument on unknown units or a zero length interval.
//
interval_t ParseSampleFreq( const std::string &s );

// "2024-01-01 00:05:00+00:00"
std::string FormatTimestampLabel( const instant_t &t );

#endif
