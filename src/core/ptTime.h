//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.

// This interface is used to read the systems monotonic clock and
// calculate elapsed time.

#ifndef ptTime_H
#define ptTime_H

namespace pt
{
  namespace time
  {
    typedef  struct timespec spec_t;

    // Get the time from the monotonic clock.
    void get( spec_t& tRef );
    spec_t current_time();

    // Return the elapsed time (t1 - t0) in microseconds
    // t1 is assumed to be at a later time than t0.
    unsigned long long elapsedMicros( const spec_t&  t0, const spec_t& t1 );
    unsigned long long elapsedMicros( const spec_t&  t0 );

    // Wrapper on elapsedMicros()
    unsigned elapsedMs( const spec_t&  t0, const spec_t& t1 );
    unsigned elapsedMs( const spec_t&  t0 );

    double elapsedSecs( const spec_t&  t0, const spec_t& t1 );
    double elapsedSecs( const spec_t&  t0 );

    // Returns true if t0 <=  t1.
    bool isLTE( const spec_t& t0, const spec_t& t1 );

    // Return true if t0 >= t1.
    bool isGTE( const spec_t& t0, const spec_t& t1 );

    bool isEqual( const spec_t& t0, const spec_t& t1 );

    bool isZero( const spec_t& t0 );

    void setZero( spec_t& t0 );

    rc_t now( spec_t& ts );

    void advanceMicros( spec_t& ts, unsigned us );

    // Advance 'ts' by 'ms' milliseconds.
    void advanceMs( spec_t& ts, unsigned ms );

    // Advance 'ts' by 'secs' (>= 0) fractional seconds.
    void advanceSecs( spec_t& ts, double secs );

    // Set 'ts' to 'ms' milliseconds in the future.
    rc_t futureMs( spec_t& ts, unsigned ms );

    void   fracSecondsToSpec( spec_t& ts, double sec );
    double specToSeconds(  const spec_t& ts );

    // Write the local wall-clock time as "HH:MM:SS.mmm" into buffer[bufN].
    unsigned formatDateTime( char* buffer, unsigned bufN, bool includeDateFl=false );
  }
}

#endif
