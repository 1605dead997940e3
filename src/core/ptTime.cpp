//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptTime.h"

#include <sys/time.h> // gettimeofday()

void pt::time::get( spec_t& t )
{
  clock_gettime(CLOCK_MONOTONIC,&t);
}

pt::time::spec_t pt::time::current_time()
{
  spec_t t;
  get(t);
  return t;
}

unsigned long long pt::time::elapsedMicros( const spec_t& t0, const spec_t& t1 )
{
  const unsigned long long ns_per_sec = 1000000000;
  const unsigned long long us_per_sec = 1000000;
  const unsigned long long ns_per_us =  1000;

  if( !isLTE(t0,t1) )
  {
    ptLogWarning("Negative elapsed time detected.");
    return elapsedMicros(t1,t0);
  }

  // t1 does not cross a 'seconds' boundary with t0
  if( t0.tv_sec == t1.tv_sec )
    return (t1.tv_nsec - t0.tv_nsec)/ns_per_us;

  // t1 occurs in a different second than t0
  unsigned long long d_sec   = (t1.tv_sec - t0.tv_sec) - 1; // difference in seconds
  unsigned long long d_nsec0 = ns_per_sec - t0.tv_nsec;     // time from t0 to next seconds boundary
  unsigned long long d_nsec1 = t1.tv_nsec;                  // time from t1 to prev. seconds boundary

  return (d_sec*us_per_sec) + ((d_nsec0 + d_nsec1)/ns_per_us);
}

unsigned long long pt::time::elapsedMicros( const spec_t& t0 )
{
  spec_t t1;
  get(t1);
  return elapsedMicros(t0,t1);
}

unsigned pt::time::elapsedMs( const spec_t&  t0, const spec_t& t1 )
{ return (unsigned)(elapsedMicros(t0,t1)/1000); }

unsigned pt::time::elapsedMs( const spec_t&  t0 )
{
  spec_t t1;
  get(t1);
  return elapsedMs(t0,t1);
}

double pt::time::elapsedSecs( const spec_t&  t0, const spec_t& t1 )
{
  return elapsedMicros(t0,t1) / 1000000.0;
}

double pt::time::elapsedSecs( const spec_t&  t0 )
{
  spec_t t1;
  get(t1);
  return elapsedSecs(t0,t1);
}

bool pt::time::isLTE( const spec_t& t0, const spec_t& t1 )
{
  if( t0.tv_sec  < t1.tv_sec )
    return true;

  if( t0.tv_sec == t1.tv_sec )
    return t0.tv_nsec <= t1.tv_nsec;

  return false;
}

bool pt::time::isGTE( const spec_t& t0, const spec_t& t1 )
{
  if( t0.tv_sec  > t1.tv_sec )
    return true;

  if( t0.tv_sec == t1.tv_sec )
    return t0.tv_nsec >= t1.tv_nsec;

  return false;
}

bool pt::time::isEqual( const spec_t& t0, const spec_t& t1 )
{ return t0.tv_sec==t1.tv_sec && t0.tv_nsec==t1.tv_nsec; }

bool pt::time::isZero( const spec_t& t0 )
{ return t0.tv_sec==0  && t0.tv_nsec==0; }

void pt::time::setZero( spec_t& t0 )
{
  t0.tv_sec = 0;
  t0.tv_nsec = 0;
}

pt::rc_t pt::time::now( spec_t& ts )
{
  rc_t rc = kOkRC;

  memset(&ts,0,sizeof(ts));

  if(clock_gettime(CLOCK_MONOTONIC, &ts) != 0 )
    rc = ptLogSysError(kInvalidOpRC,errno,"Unable to obtain system time.");

  return rc;
}

void pt::time::advanceMicros( spec_t& ts, unsigned us )
{
  const long ns_per_sec = 1000000000;

  ts.tv_nsec += (long)us * 1000;

  time_t sec = ts.tv_nsec / ns_per_sec;

  ts.tv_sec  += sec;
  ts.tv_nsec -= sec * ns_per_sec;
}

void pt::time::advanceMs( spec_t& ts, unsigned ms )
{
  advanceMicros(ts, ms*1000);
}

void pt::time::advanceSecs( spec_t& ts, double secs )
{
  const long ns_per_sec = 1000000000;
  spec_t     dt;

  fracSecondsToSpec(dt,secs);

  ts.tv_sec  += dt.tv_sec;
  ts.tv_nsec += dt.tv_nsec;

  if( ts.tv_nsec >= ns_per_sec )
  {
    ts.tv_sec  += 1;
    ts.tv_nsec -= ns_per_sec;
  }
}

pt::rc_t pt::time::futureMs( spec_t& ts, unsigned ms )
{
  rc_t rc;
  if((rc = now(ts)) == kOkRC )
    advanceMs(ts,ms);

  return rc;
}

void pt::time::fracSecondsToSpec( spec_t& ts, double sec )
{
  const unsigned long long ns_per_sec = 1000000000;
  ts.tv_sec  = (time_t)sec;
  ts.tv_nsec = (long)((sec - ts.tv_sec) * ns_per_sec);
}

double pt::time::specToSeconds(  const spec_t& t )
{
  return (double)t.tv_sec + ((double)t.tv_nsec)/1e9;
}

unsigned pt::time::formatDateTime( char* buffer, unsigned bufN, bool includeDateFl )
{
  int millisec;
  struct tm tm_info;
  struct timeval tv;
  int n = 0;

  gettimeofday(&tv, NULL);

  millisec = lrint(tv.tv_usec/1000.0); // Round to nearest millisec

  // Allow for rounding up to nearest second
  if (millisec>=1000)
  {
    millisec -=1000;
    tv.tv_sec++;
  }

  localtime_r(&tv.tv_sec,&tm_info);

  const char* fmt = includeDateFl ? "%Y:%m:%d %H:%M:%S" : "%H:%M:%S";

  n = strftime(buffer, bufN, fmt, &tm_info);

  if( n < (int)bufN && bufN-n >= 5 )
    n += snprintf(buffer + n, bufN-n,".%03d", millisec);

  return (unsigned)n;
}
