//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptMidi.h"
#include "ptMidiDecls.h"
#include "ptScore.h"
#include "ptMatcher.h"

namespace pt
{
  namespace match
  {
    typedef struct matcher_str
    {
      exp_t*    expA;       // expA[expN] in order of onset time
      unsigned  expN;
      unsigned  noteExpN;

      result_t* resultA;    // resultA[resultAllocN]
      unsigned  resultN;
      unsigned  resultAllocN;

      bool      activeA[ midi::kMidiNoteCnt ];  // played notes which have not been released
    } matcher_t;

    idLabelPair_t _matchLabelA[] =
    {
     { kPerfectMatchId, "perfect" },
     { kGoodMatchId,    "good"    },
     { kEarlyMatchId,   "early"   },
     { kLateMatchId,    "late"    },
     { kMissedMatchId,  "missed"  },
     { kExtraMatchId,   "extra"   },
     { kInvalidMatchId, "<invalid>" }
    };

    matcher_t* _handleToPtr( handle_t h )
    { return handleToPtr<handle_t,matcher_t>(h); }

    void _destroy( matcher_t* p )
    {
      mem::release(p->expA);
      mem::release(p->resultA);
      mem::release(p);
    }

    result_t* _append_result( matcher_t* p )
    {
      if( p->resultN >= p->resultAllocN )
      {
        p->resultAllocN = p->resultAllocN==0 ? 64 : 2*p->resultAllocN;
        p->resultA      = mem::resizeZ<result_t>(p->resultA,p->resultAllocN);
      }

      return p->resultA + p->resultN++;
    }

    bool _is_matched( const matcher_t* p, unsigned expIdx )
    {
      for(unsigned i=0; i<p->resultN; ++i)
        if( p->resultA[i].expIdx == expIdx )
          return true;
      return false;
    }

    // Index of the expectation for 'pitch' closest to 'secs' or kInvalidIdx if none is within the search window.
    unsigned _closest_exp( const matcher_t* p, uint8_t pitch, double secs )
    {
      unsigned idx  = kInvalidIdx;
      double   minD = 0;

      for(unsigned i=0; i<p->expN; ++i)
      {
        const exp_t* e = p->expA + i;
        double       d = fabs(secs - e->secs);

        if( e->restFl || e->pitch != pitch || d > kSearchWindowSecs )
          continue;

        if( idx == kInvalidIdx || d < minD )
        {
          idx  = i;
          minD = d;
        }
      }

      return idx;
    }
  }
}

const char* pt::match::match_to_label( matchId_t id )
{ return idToLabel(_matchLabelA,id,kInvalidMatchId); }

pt::match::matchId_t pt::match::classify( const exp_t& e, double errSecs )
{
  if( errSecs < -e.earlyTolSecs )
    return kEarlyMatchId;

  if( errSecs > e.lateTolSecs )
    return kLateMatchId;

  if( fabs(errSecs) < 0.5 * std::min(e.earlyTolSecs,e.lateTolSecs) )
    return kPerfectMatchId;

  return kGoodMatchId;
}

pt::rc_t pt::match::create( handle_t& hRef, score::handle_t scoreH, double earlyTolSecs, double lateTolSecs )
{
  rc_t rc;
  if((rc = destroy(hRef)) != kOkRC )
    return rc;

  if( !scoreH.isValid() )
    return ptLogError(kInvalidArgRC,"The matcher score handle is not valid.");

  if( earlyTolSecs < 0 || lateTolSecs < 0 )
    return ptLogError(kInvalidArgRC,"The matcher timing tolerances may not be negative.");

  matcher_t* p           = mem::allocZ<matcher_t>();
  double     secsPerBeat = 60.0 / score::bpm(scoreH);

  p->expN = score::note_count(scoreH,score::kIncludeRestsFl);
  p->expA = mem::allocZ<exp_t>(p->expN);

  for(unsigned i=0; i<p->expN; ++i)
  {
    const score::note_t* n = score::note(scoreH,i,score::kIncludeRestsFl);
    exp_t*               e = p->expA + i;

    e->index   = i;
    e->secs    = n->secs;
    e->durSecs = score::duration_beats(n->dur) * secsPerBeat;
    e->restFl  = n->restFl;

    if( !n->restFl )
    {
      e->pitch        = n->midiPitch;
      e->earlyTolSecs = earlyTolSecs;
      e->lateTolSecs  = lateTolSecs;
      p->noteExpN    += 1;
    }
  }

  hRef.set(p);

  return rc;
}

pt::rc_t pt::match::destroy( handle_t& hRef )
{
  if( !hRef.isValid() )
    return kOkRC;

  _destroy(_handleToPtr(hRef));
  hRef.clear();
  return kOkRC;
}

unsigned pt::match::exp_count( handle_t h )
{ return _handleToPtr(h)->expN; }

unsigned pt::match::note_exp_count( handle_t h )
{ return _handleToPtr(h)->noteExpN; }

const pt::match::exp_t* pt::match::expectation( handle_t h, unsigned expIdx )
{
  matcher_t* p = _handleToPtr(h);
  return expIdx < p->expN ? p->expA + expIdx : nullptr;
}

unsigned pt::match::window( handle_t h, double begSecs, double endSecs, unsigned* expIdxA, unsigned expIdxN )
{
  matcher_t* p = _handleToPtr(h);
  unsigned   n = 0;

  for(unsigned i=0; i<p->expN; ++i)
    if( begSecs <= p->expA[i].secs && p->expA[i].secs <= endSecs )
    {
      if( expIdxA != nullptr && n < expIdxN )
        expIdxA[n] = i;
      ++n;
    }

  return n;
}

pt::rc_t pt::match::on_note_on( handle_t h, uint8_t pitch, uint8_t vel, double secs, result_t* resultRef )
{
  matcher_t* p = _handleToPtr(h);

  if( pitch >= midi::kMidiNoteCnt )
    return ptLogError(kInvalidArgRC,"The MIDI pitch %i is out of range.",pitch);

  unsigned  expIdx = _closest_exp(p,pitch,secs);
  result_t* r      = _append_result(p);

  r->pitch  = pitch;
  r->vel    = vel;
  r->secs   = secs;
  r->expIdx = expIdx;

  if( expIdx == kInvalidIdx )
  {
    r->id      = kExtraMatchId;
    r->errSecs = 0;
  }
  else
  {
    r->errSecs = secs - p->expA[expIdx].secs;
    r->id      = classify(p->expA[expIdx],r->errSecs);
  }

  p->activeA[pitch] = true;

  if( resultRef != nullptr )
    *resultRef = *r;

  return kOkRC;
}

void pt::match::on_note_off( handle_t h, uint8_t pitch, double secs )
{
  matcher_t* p = _handleToPtr(h);

  if( pitch < midi::kMidiNoteCnt )
    p->activeA[pitch] = false;
}

pt::rc_t pt::match::on_event( handle_t h, const midi::event_t* e, double offsetSecs )
{
  rc_t rc = kOkRC;

  if( e == nullptr )
    return kOkRC;

  switch( e->typeId )
  {
    case midi::kNoteOnEvtTId:
      rc = on_note_on(h,e->u.note.pitch,e->u.note.vel,e->secs - offsetSecs);
      break;

    case midi::kNoteOffEvtTId:
      on_note_off(h,e->u.note.pitch,e->secs - offsetSecs);
      break;

    default:
      break;
  }

  return rc;
}

unsigned pt::match::active_note_count( handle_t h )
{
  matcher_t* p = _handleToPtr(h);
  unsigned   n = 0;
  for(unsigned i=0; i<midi::kMidiNoteCnt; ++i)
    if( p->activeA[i] )
      ++n;
  return n;
}

unsigned pt::match::missed( handle_t h, double secs, unsigned* expIdxA, unsigned expIdxN )
{
  matcher_t* p = _handleToPtr(h);
  unsigned   n = 0;

  for(unsigned i=0; i<p->expN; ++i)
  {
    const exp_t* e = p->expA + i;

    if( e->restFl || secs <= e->secs + e->lateTolSecs || _is_matched(p,i) )
      continue;

    if( expIdxA != nullptr && n < expIdxN )
      expIdxA[n] = i;
    ++n;
  }

  return n;
}

unsigned pt::match::result_count( handle_t h )
{ return _handleToPtr(h)->resultN; }

const pt::match::result_t* pt::match::result( handle_t h, unsigned resultIdx )
{
  matcher_t* p = _handleToPtr(h);
  return resultIdx < p->resultN ? p->resultA + resultIdx : nullptr;
}

void pt::match::reset( handle_t h )
{
  matcher_t* p = _handleToPtr(h);
  p->resultN = 0;
  memset(p->activeA,0,sizeof(p->activeA));
}

void pt::match::report( handle_t h )
{
  matcher_t* p = _handleToPtr(h);
  char       buf[ midi::kMidiSciPitchCharCnt+1 ];

  for(unsigned i=0; i<p->resultN; ++i)
  {
    const result_t* r = p->resultA + i;
    ptLogPrint("%4i %8.3f %5s vel:%3i %-8s",i,r->secs,midi::midiToSciPitch(r->pitch,buf,sizeof(buf)),r->vel,match_to_label(r->id));

    if( r->expIdx != kInvalidIdx )
      ptLogPrint(" exp:%4i err:%7.1fms",r->expIdx,r->errSecs*1000.0);

    ptLogPrint("\n");
  }
}
