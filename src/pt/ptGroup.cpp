//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptScore.h"
#include "ptGroup.h"

namespace pt
{
  namespace group
  {
    typedef struct group_list_str
    {
      group_t*  groupA;
      unsigned  groupN;
      eval_t*   evalA;   // evalA[noteN] sorted by start beat
      unsigned  evalN;
      uint8_t*  pitchA;  // storage for group_t.pitchA[]
      unsigned  pitchN;
    } group_list_t;

    group_list_t* _handleToPtr( handle_t h )
    { return handleToPtr<handle_t,group_list_t>(h); }

    void _destroy( group_list_t* p )
    {
      mem::release(p->groupA);
      mem::release(p->evalA);
      mem::release(p->pitchA);
      mem::release(p);
    }

    bool _evalLessThan( const eval_t& e0, const eval_t& e1 )
    { return e0.begBeat < e1.begBeat; }

  }
}

pt::rc_t pt::group::create( handle_t& hRef, const score::note_t* const* noteA, unsigned noteN )
{
  rc_t rc;
  if((rc = destroy(hRef)) != kOkRC )
    return rc;

  if( noteA == nullptr && noteN > 0 )
    return ptLogError(kInvalidArgRC,"The note list is null.");

  group_list_t* p = mem::allocZ<group_list_t>();

  p->evalA  = mem::allocZ<eval_t>(noteN);
  p->pitchA = mem::allocZ<uint8_t>(noteN);
  p->groupA = mem::allocZ<group_t>(noteN);

  for(unsigned i=0; i<noteN; ++i)
    if( noteA[i] != nullptr && !noteA[i]->restFl )
    {
      eval_t* e    = p->evalA + p->evalN++;
      e->note      = noteA[i];
      e->midiPitch = noteA[i]->midiPitch;
      e->begBeat   = noteA[i]->beat;
      e->endBeat   = noteA[i]->beat + score::duration_beats(noteA[i]->dur);
    }

  // simultaneous notes keep their input order
  std::stable_sort(p->evalA, p->evalA + p->evalN, _evalLessThan);

  for(unsigned i=0; i<p->evalN; )
  {
    group_t* g = p->groupA + p->groupN;
    g->index   = p->groupN;
    g->beat    = p->evalA[i].begBeat;
    g->evalA   = p->evalA + i;
    g->pitchA  = p->pitchA + p->pitchN;

    for(; i<p->evalN && p->evalA[i].begBeat - g->beat <= kBeatEpsilon; ++i)
    {
      // a pitch which occurs more than once in a chord is required only once
      if( !has_pitch(g,p->evalA[i].midiPitch) )
      {
        p->pitchA[ p->pitchN++ ] = p->evalA[i].midiPitch;
        g->pitchN += 1;
      }

      g->evalN += 1;
    }

    p->groupN += 1;
  }

  hRef.set(p);

  return rc;
}

pt::rc_t pt::group::destroy( handle_t& hRef )
{
  if( !hRef.isValid() )
    return kOkRC;

  _destroy(_handleToPtr(hRef));
  hRef.clear();
  return kOkRC;
}

unsigned pt::group::count( handle_t h )
{ return _handleToPtr(h)->groupN; }

pt::group::group_t* pt::group::group( handle_t h, unsigned groupIdx )
{
  group_list_t* p = _handleToPtr(h);
  return groupIdx < p->groupN ? p->groupA + groupIdx : nullptr;
}

unsigned pt::group::pitch_count( handle_t h )
{ return _handleToPtr(h)->pitchN; }

void pt::group::clear_evals( handle_t h )
{
  group_list_t* p = _handleToPtr(h);
  for(unsigned i=0; i<p->evalN; ++i)
  {
    p->evalA[i].hitFl   = false;
    p->evalA[i].breakFl = false;
  }
}

bool pt::group::has_pitch( const group_t* g, uint8_t midiPitch )
{
  for(unsigned i=0; i<g->pitchN; ++i)
    if( g->pitchA[i] == midiPitch )
      return true;
  return false;
}

void pt::group::report( handle_t h )
{
  group_list_t* p = _handleToPtr(h);
  char          buf[16];

  for(unsigned i=0; i<p->groupN; ++i)
  {
    const group_t* g = p->groupA + i;
    ptLogPrint("%4i beat:%8.3f ",g->index,g->beat);
    for(unsigned j=0; j<g->evalN; ++j)
      ptLogPrint("%s ",score::pitch_to_string(g->evalA[j].note->pitch,buf,sizeof(buf)));
    ptLogPrint("\n");
  }
}
