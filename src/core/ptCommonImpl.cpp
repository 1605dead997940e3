//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"

#include "ptCommonImpl.h"

#if ptALSA
#include <alsa/asoundlib.h>
#endif

#include <strings.h>  // strcasecmp()
#include <time.h>

namespace pt
{
  void _sleep( struct timespec* ts )
  {
    // nanosleep() is restarted with the remaining time when interrupted by a signal
    while( nanosleep(ts,ts) == -1 && errno == EINTR )
    {}
  }

  const idLabelPair_t* _idToSlot( const idLabelPair_t* array, unsigned id, unsigned eolId )
  {
    const idLabelPair_t* p = array;
    for(; p->id != eolId; ++p)
      if( p->id == id )
        break;

    return p;
  }

}

void pt::report_dependency_versions()
{
#if ptALSA
  ptLogInfo("ALSA version:'%s'",SND_LIB_VERSION_STR);
#else
  ptLogInfo("ALSA is not available.");
#endif
}


const char* pt::idToLabelNull( const idLabelPair_t* array, unsigned id, unsigned eolId )
{
  const idLabelPair_t* p = _idToSlot(array,id,eolId);

  return p->id == eolId ? nullptr : p->label;
}

const char* pt::idToLabel( const idLabelPair_t* array, unsigned id, unsigned eolId )
{
  const idLabelPair_t* p = _idToSlot(array,id,eolId);

  return p->label;
}

unsigned pt::labelToIdNoCase( const idLabelPair_t* array, const char* label, unsigned eolId )
{
  const idLabelPair_t* p = array;

  if( label != nullptr )
    for(; p->id != eolId; ++p)
      if( p->label != nullptr && strcasecmp(label,p->label) == 0 )
        return p->id;

  return eolId;
}

void pt::sleepMs( unsigned ms )
{
  struct timespec ts;
  ts.tv_sec  = ms / 1000;
  ts.tv_nsec = (ms % 1000) * 1000000;

  pt::_sleep(&ts);
}

void pt::sleepUs( unsigned us )
{
  struct timespec ts;
  ts.tv_sec  = us / 1000000;
  ts.tv_nsec = (us % 1000000) * 1000;

  pt::_sleep(&ts);
}
