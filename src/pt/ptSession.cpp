//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptObject.h"
#include "ptMidi.h"
#include "ptMidiDecls.h"
#include "ptScore.h"
#include "ptGroup.h"
#include "ptSession.h"

namespace pt
{
  namespace session
  {
    typedef struct hold_str
    {
      bool            activeFl;
      double          endBeat;
      group::eval_t*  eval;
    } hold_t;

    typedef struct session_str
    {
      args_t            args;
      unsigned          handFlags;     // hands used by the next load() or reset()

      stateId_t         stateId;
      score::handle_t   scoreH;
      group::handle_t   groupH;
      unsigned          groupN;
      unsigned          groupIdx;
      double            bpm;

      double            countdownBegSecs;
      double            perfBegSecs;   // time of beat 0
      double            tickSecs;      // time of the last tick
      double            beat;          // current clock position

      bool              windowFl;      // the chord window is open
      double            windowBegSecs;
      bool              creditA[ midi::kMidiNoteCnt ]; // pitches of the current group already credited
      hold_t            holdA[ midi::kMidiNoteCnt ];

      stats_t           stats;
    } session_t;

    idLabelPair_t _modeLabelA[] =
    {
     { kPracticeModeId, "practice" },
     { kTempoModeId,    "tempo"    },
     { kInvalidModeId,  "<invalid>" }
    };

    idLabelPair_t _stateLabelA[] =
    {
     { kIdleStateId,      "idle" },
     { kCountdownStateId, "countdown" },
     { kAwaitingStateId,  "awaiting" },
     { kCompleteStateId,  "complete" },
     { kInvalidIdx,       "<invalid>" }
    };

    session_t* _handleToPtr( handle_t h )
    { return handleToPtr<handle_t,session_t>(h); }

    void _destroy( session_t* p )
    {
      group::destroy(p->groupH);
      mem::release(p);
    }

    bool _is_note_enabled( const score::note_t* n, unsigned handFlags )
    {
      switch( n->staffIdx )
      {
        case score::kUpperStaffIdx: return ptIsFlag(handFlags,kRightHandFl);
        case score::kLowerStaffIdx: return ptIsFlag(handFlags,kLeftHandFl);
      }

      // notes without a staff assignment are played by either hand
      return ptIsFlag(handFlags,kBothHandsFl);
    }

    double _secs_to_beats( const session_t* p, double secs )
    { return secs * p->bpm / 60.0; }

    group::group_t* _cur_group( session_t* p )
    { return p->groupIdx < p->groupN ? group::group(p->groupH,p->groupIdx) : nullptr; }

    // Clock position at 'secs'.
    double _beat_at( const session_t* p, double secs )
    {
      if( p->args.mode == kTempoModeId )
        return std::max(0.0,_secs_to_beats(p, secs - p->perfBegSecs));

      return p->beat;
    }

    bool _is_pitch_hit( const group::group_t* g, uint8_t pitch )
    {
      for(unsigned i=0; i<g->evalN; ++i)
        if( g->evalA[i].midiPitch == pitch && g->evalA[i].hitFl )
          return true;
      return false;
    }

    unsigned _hit_pitch_count( const group::group_t* g )
    {
      unsigned n = 0;
      for(unsigned i=0; i<g->pitchN; ++i)
        if( _is_pitch_hit(g,g->pitchA[i]) )
          ++n;
      return n;
    }

    // Clear the partial progress on the current group.
    void _clear_attempt( session_t* p )
    {
      group::group_t* g;
      if((g = _cur_group(p)) != nullptr )
        for(unsigned i=0; i<g->evalN; ++i)
          g->evalA[i].hitFl = false;

      p->windowFl = false;
    }

    void _mistake( session_t* p )
    {
      p->stats.mistakeCnt += 1;
      _clear_attempt(p);
    }

    void _next_group( session_t* p )
    {
      p->windowFl  = false;
      p->groupIdx += 1;
      memset(p->creditA,0,sizeof(p->creditA));

      if( p->groupIdx >= p->groupN )
      {
        p->stateId = kCompleteStateId;
        ptLogDebug("Session complete.");
      }
    }

    void _group_satisfied( session_t* p, group::group_t* g )
    {
      // register the held notes
      for(unsigned i=0; i<g->evalN; ++i)
      {
        group::eval_t* e = g->evalA + i;
        if( e->endBeat - e->begBeat >= p->args.holdMinBeats )
        {
          hold_t* h   = p->holdA + e->midiPitch;
          h->activeFl = true;
          h->endBeat  = e->endBeat;
          h->eval     = e;
        }
      }

      p->stats.satisfiedGroupCnt += 1;
      _next_group(p);
    }

    // Tempo mode: every group whose onset (plus the late tolerance) has been passed is missed.
    void _detect_missed_groups( session_t* p )
    {
      double          lateTolBeats = _secs_to_beats(p,p->args.lateTolSecs);
      group::group_t* g;

      while( p->stateId == kAwaitingStateId && (g = _cur_group(p)) != nullptr && p->beat > g->beat + lateTolBeats )
      {
        p->stats.missedNoteCnt  += g->pitchN - _hit_pitch_count(g);
        p->stats.missedGroupCnt += 1;
        p->stats.mistakeCnt     += 1;

        ptLogDebug("Missed group:%i beat:%f.",g->index,g->beat);

        _next_group(p);
      }
    }

    void _start_countdown( session_t* p, double secs )
    {
      group::clear_evals(p->groupH);
      memset(&p->stats,0,sizeof(p->stats));
      memset(p->holdA,0,sizeof(p->holdA));
      memset(p->creditA,0,sizeof(p->creditA));

      p->stats.requiredPitchCnt = group::pitch_count(p->groupH);
      p->groupN           = group::count(p->groupH);
      p->groupIdx         = 0;
      p->beat             = 0;
      p->windowFl         = false;
      p->countdownBegSecs = secs;
      p->tickSecs         = secs;
      p->stateId          = kCountdownStateId;
    }

    rc_t _build_groups( session_t* p, score::handle_t scoreH, group::handle_t& groupHRef )
    {
      rc_t                  rc    = kOkRC;
      unsigned              noteN = score::note_count(scoreH);
      const score::note_t** noteA = mem::allocZ<const score::note_t*>(noteN);
      unsigned              n     = 0;

      for(unsigned i=0; i<noteN; ++i)
      {
        const score::note_t* note = score::note(scoreH,i);
        if( _is_note_enabled(note,p->handFlags) )
          noteA[n++] = note;
      }

      if((rc = group::create(groupHRef,noteA,n)) != kOkRC )
        rc = ptLogError(rc,"Note group creation failed.");

      mem::release(noteA);
      return rc;
    }

    rc_t _validate_args( const args_t& a )
    {
      if( a.mode != kPracticeModeId && a.mode != kTempoModeId )
        return ptLogError(kInvalidArgRC,"The session mode is not valid.");

      if( a.chordWindowSecs <= 0 || a.holdMinBeats <= 0 || a.dfltBpm <= 0 )
        return ptLogError(kInvalidArgRC,"The chord window, hold threshold and default tempo must be greater than zero.");

      if( a.holdReleaseTolBeats < 0 || a.countdownSecs < 0 || a.earlyTolSecs < 0 || a.lateTolSecs < 0 )
        return ptLogError(kInvalidArgRC,"Session tolerances and countdown may not be negative.");

      return kOkRC;
    }
  }
}

void pt::session::init_default_args( args_t& a )
{
  a.mode                = kPracticeModeId;
  a.handFlags           = kBothHandsFl;
  a.chordWindowSecs     = 0.25;
  a.holdMinBeats        = 1.0;
  a.holdReleaseTolBeats = 0.1;
  a.countdownSecs       = 3.0;
  a.dfltBpm             = 120.0;
  a.earlyTolSecs        = 0.1;
  a.lateTolSecs         = 0.1;
}

pt::rc_t pt::session::parse_args( const object_t* cfg, args_t& a )
{
  rc_t        rc         = kOkRC;
  const char* modeLabel  = nullptr;
  bool        rightFl    = ptIsFlag(a.handFlags,kRightHandFl);
  bool        leftFl     = ptIsFlag(a.handFlags,kLeftHandFl);

  if( cfg == nullptr )
    return kOkRC;

  if((rc = cfg->readv("mode",                   kOptFl, modeLabel,
                      "right_hand",             kOptFl, rightFl,
                      "left_hand",              kOptFl, leftFl,
                      "chord_window_secs",      kOptFl, a.chordWindowSecs,
                      "hold_min_beats",         kOptFl, a.holdMinBeats,
                      "hold_release_tol_beats", kOptFl, a.holdReleaseTolBeats,
                      "countdown_secs",         kOptFl, a.countdownSecs,
                      "default_bpm",            kOptFl, a.dfltBpm,
                      "early_tol_secs",         kOptFl, a.earlyTolSecs,
                      "late_tol_secs",          kOptFl, a.lateTolSecs)) != kOkRC )
  {
    return ptLogError(rc,"Session configuration parse failed.");
  }

  if( modeLabel != nullptr && (a.mode = mode_from_label(modeLabel)) == kInvalidModeId )
    return ptLogError(kInvalidArgRC,"The session mode '%s' is not valid. Use 'practice' or 'tempo'.",modeLabel);

  a.handFlags = 0;
  a.handFlags = ptEnaFlag(a.handFlags,kRightHandFl,rightFl);
  a.handFlags = ptEnaFlag(a.handFlags,kLeftHandFl,leftFl);

  return _validate_args(a);
}

pt::session::modeId_t pt::session::mode_from_label( const char* label )
{ return (modeId_t)labelToIdNoCase(_modeLabelA,label,kInvalidModeId); }

const char* pt::session::mode_to_label( modeId_t modeId )
{ return idToLabel(_modeLabelA,modeId,kInvalidModeId); }

const char* pt::session::state_to_label( stateId_t stateId )
{ return idToLabel(_stateLabelA,stateId,kInvalidIdx); }

pt::rc_t pt::session::create( handle_t& hRef, const args_t& args )
{
  rc_t rc;
  if((rc = destroy(hRef)) != kOkRC )
    return rc;

  if((rc = _validate_args(args)) != kOkRC )
    return rc;

  session_t* p = mem::allocZ<session_t>();
  p->args      = args;
  p->handFlags = args.handFlags;
  p->stateId   = kIdleStateId;
  p->bpm       = args.dfltBpm;

  hRef.set(p);

  return rc;
}

pt::rc_t pt::session::create( handle_t& hRef, const object_t* cfg )
{
  rc_t   rc;
  args_t args;

  init_default_args(args);

  if((rc = parse_args(cfg,args)) != kOkRC )
    return rc;

  return create(hRef,args);
}

pt::rc_t pt::session::destroy( handle_t& hRef )
{
  if( !hRef.isValid() )
    return kOkRC;

  _destroy(_handleToPtr(hRef));
  hRef.clear();
  return kOkRC;
}

pt::rc_t pt::session::load( handle_t h, score::handle_t scoreH, double secs )
{
  rc_t            rc;
  session_t*      p = _handleToPtr(h);
  group::handle_t groupH;

  if( !scoreH.isValid() )
    return ptLogError(kInvalidArgRC,"The session score is not valid.");

  // build the new groups before touching the current state
  if((rc = _build_groups(p,scoreH,groupH)) != kOkRC )
    return ptLogError(rc,"Session load failed.");

  group::destroy(p->groupH);

  p->groupH = groupH;
  p->scoreH = scoreH;
  p->bpm    = score::bpm(scoreH) > 0 ? score::bpm(scoreH) : p->args.dfltBpm;

  _start_countdown(p,secs);

  ptLogInfo("Session loaded: '%s' mode:%s groups:%i pitches:%i bpm:%.1f",score::title(scoreH),mode_to_label(p->args.mode),p->groupN,p->stats.requiredPitchCnt,p->bpm);

  return rc;
}

pt::rc_t pt::session::reset( handle_t h, double secs )
{
  session_t* p = _handleToPtr(h);

  if( !p->scoreH.isValid() )
    return kOkRC;

  return load(h,p->scoreH,secs);
}

void pt::session::set_hands( handle_t h, unsigned handFlags )
{
  session_t* p = _handleToPtr(h);
  p->handFlags = handFlags & kBothHandsFl;
}

pt::rc_t pt::session::tick( handle_t h, double secs )
{
  session_t*      p = _handleToPtr(h);
  group::group_t* g;

  switch( p->stateId )
  {
    case kIdleStateId:
    case kCompleteStateId:
      break;

    case kCountdownStateId:
      if( secs - p->countdownBegSecs < p->args.countdownSecs )
        break;

      p->stateId     = kAwaitingStateId;
      p->perfBegSecs = p->countdownBegSecs + p->args.countdownSecs;
      p->tickSecs    = p->perfBegSecs;
      p->beat        = 0;

      if( p->groupN == 0 )
      {
        p->stateId = kCompleteStateId;
        break;
      }

      // fall through to advance the clock from the start of the performance

    case kAwaitingStateId:
      if( secs < p->tickSecs )
        break;

      if( p->args.mode == kTempoModeId )
      {
        p->beat = _beat_at(p,secs);
        _detect_missed_groups(p);
      }
      else
      {
        // approach the current group but never pass it
        if((g = _cur_group(p)) != nullptr )
          p->beat = std::max(p->beat, std::min(g->beat, p->beat + _secs_to_beats(p, secs - p->tickSecs)));
      }

      // an incomplete chord whose window has expired is a mistake
      if( p->stateId == kAwaitingStateId && p->windowFl && secs - p->windowBegSecs > p->args.chordWindowSecs )
      {
        ptLogDebug("Chord window expired on group:%i.",p->groupIdx);
        _mistake(p);
      }

      p->tickSecs = secs;
      break;
  }

  return kOkRC;
}

void pt::session::on_note_on( handle_t h, uint8_t midiPitch, double secs )
{
  session_t*      p = _handleToPtr(h);
  group::group_t* g;

  if( p->stateId != kAwaitingStateId || (g = _cur_group(p)) == nullptr )
    return;

  if( !group::has_pitch(g,midiPitch) )
  {
    ptLogDebug("Wrong pitch:%i on group:%i.",midiPitch,g->index);
    _mistake(p);
    return;
  }

  // in tempo mode a correct pitch played before the group is due is a mistake
  if( p->args.mode == kTempoModeId && _beat_at(p,secs) < g->beat - _secs_to_beats(p,p->args.earlyTolSecs) )
  {
    ptLogDebug("Early pitch:%i on group:%i.",midiPitch,g->index);
    _mistake(p);
    return;
  }

  // a pitch arriving after the chord window has closed restarts the attempt
  if( p->windowFl && secs - p->windowBegSecs > p->args.chordWindowSecs )
  {
    ptLogDebug("Chord window expired on group:%i.",g->index);
    _mistake(p);
  }

  if( !p->windowFl )
  {
    p->windowFl      = true;
    p->windowBegSecs = secs;
  }

  for(unsigned i=0; i<g->evalN; ++i)
    if( g->evalA[i].midiPitch == midiPitch )
      g->evalA[i].hitFl = true;

  if( !p->creditA[ midiPitch ] )
  {
    p->creditA[ midiPitch ] = true;
    p->stats.hitCnt += 1;
  }

  if( _hit_pitch_count(g) == g->pitchN )
    _group_satisfied(p,g);
}

void pt::session::on_note_off( handle_t h, uint8_t midiPitch, double secs )
{
  session_t* p = _handleToPtr(h);

  if( p->stateId != kAwaitingStateId || midiPitch >= midi::kMidiNoteCnt )
    return;

  hold_t* hold = p->holdA + midiPitch;

  if( !hold->activeFl )
    return;

  if( _beat_at(p,secs) < hold->endBeat - p->args.holdReleaseTolBeats )
  {
    p->stats.holdBreakCnt += 1;
    hold->eval->breakFl    = true;
    ptLogDebug("Hold break pitch:%i.",midiPitch);
  }

  hold->activeFl = false;
  hold->eval     = nullptr;
}

void pt::session::on_event( handle_t h, const midi::event_t* e )
{
  if( e == nullptr )
    return;

  switch( e->typeId )
  {
    case midi::kNoteOnEvtTId:
      on_note_on(h,e->u.note.pitch,e->secs);
      break;

    case midi::kNoteOffEvtTId:
      on_note_off(h,e->u.note.pitch,e->secs);
      break;

    default:
      break;
  }
}

pt::session::stateId_t pt::session::state( handle_t h )
{ return _handleToPtr(h)->stateId; }

pt::session::modeId_t pt::session::mode( handle_t h )
{ return _handleToPtr(h)->args.mode; }

double pt::session::current_beat( handle_t h )
{ return _handleToPtr(h)->beat; }

double pt::session::bpm( handle_t h )
{ return _handleToPtr(h)->bpm; }

unsigned pt::session::group_count( handle_t h )
{ return _handleToPtr(h)->groupN; }

unsigned pt::session::group_index( handle_t h )
{ return _handleToPtr(h)->groupIdx; }

const pt::group::group_t* pt::session::group( handle_t h, unsigned groupIdx )
{
  session_t* p = _handleToPtr(h);
  return groupIdx < p->groupN ? group::group(p->groupH,groupIdx) : nullptr;
}

unsigned pt::session::group_hit_count( handle_t h )
{
  session_t*      p = _handleToPtr(h);
  group::group_t* g;
  return (g = _cur_group(p)) == nullptr ? 0 : _hit_pitch_count(g);
}

const pt::session::stats_t& pt::session::stats( handle_t h )
{ return _handleToPtr(h)->stats; }

void pt::session::report( handle_t h )
{
  session_t*     p = _handleToPtr(h);
  const stats_t& s = p->stats;

  ptLogPrint("state:%s mode:%s beat:%.3f group:%i of %i\n",state_to_label(p->stateId),mode_to_label(p->args.mode),p->beat,p->groupIdx,p->groupN);
  ptLogPrint("Score: %i/%i mistakes:%i missed notes:%i missed groups:%i hold breaks:%i groups played:%i\n",
             s.hitCnt,s.requiredPitchCnt,s.mistakeCnt,s.missedNoteCnt,s.missedGroupCnt,s.holdBreakCnt,s.satisfiedGroupCnt);
}
