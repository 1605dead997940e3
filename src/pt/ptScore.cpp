//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptText.h"
#include "ptScore.h"

namespace pt
{
  namespace score
  {
    typedef struct score_str
    {
      char*          title;
      char*          composer;
      double         bpm;
      unsigned       divisions;

      staff_t*       staffA;
      unsigned       staffN;

      bool           finalFl;
      const note_t** allNoteA;   // all notes and rests sorted by start beat
      unsigned       allNoteN;
      const note_t** noteA;      // all notes (no rests) sorted by start beat
      unsigned       noteN;
    } score_t;

    idLabelPair_t _durTypeLabelA[] =
    {
     { kWholeDurId,        "whole"   },
     { kHalfDurId,         "half"    },
     { kQuarterDurId,      "quarter" },
     { kEighthDurId,       "eighth"  },
     { kSixteenthDurId,    "16th"    },
     { kSixteenthDurId,    "sixteenth" },
     { kThirtySecondDurId, "32nd"    },
     { kThirtySecondDurId, "thirty-second" },
     { kInvalidDurId,      "<invalid>" }
    };

    const int _semitoneA[] = { 0, 2, 4, 5, 7, 9, 11 };

    score_t* _handleToPtr( handle_t h )
    { return handleToPtr<handle_t,score_t>(h); }

    void _destroy( score_t* p )
    {
      for(unsigned i=0; i<p->staffN; ++i)
      {
        staff_t* s = p->staffA + i;
        for(unsigned j=0; j<s->measN; ++j)
          mem::release(s->measA[j].noteA);
        mem::release(s->measA);
      }

      mem::release(p->staffA);
      mem::release(p->allNoteA);
      mem::release(p->noteA);
      mem::release(p->title);
      mem::release(p->composer);
      mem::release(p);
    }

    rc_t _staff( score_t* p, unsigned staffIdx, staff_t*& sRef )
    {
      if( p->finalFl )
        return ptLogError(kInvalidOpRC,"The score cannot be changed after it has been finalized.");

      if( staffIdx >= p->staffN )
        return ptLogError(kInvalidIdRC,"The staff index %i is invalid.",staffIdx);

      sRef = p->staffA + staffIdx;
      return kOkRC;
    }

    template< typename T >
    T* _grow( T* a, unsigned n, unsigned& allocNRef )
    {
      if( n < allocNRef )
        return a;

      allocNRef = allocNRef==0 ? 8 : allocNRef*2;
      return mem::resizeZ<T>(a,allocNRef);
    }

    // Order by start beat. std::stable_sort() keeps simultaneous notes in staff/document order.
    bool _noteLessThan( const note_t* n0, const note_t* n1 )
    { return n0->beat < n1->beat; }

  }
}

pt::score::pitch_t pt::score::make_pitch( stepId_t step, int octave, int alter )
{
  pitch_t p;
  p.step   = step;
  p.octave = octave;
  p.alter  = alter;
  return p;
}

uint8_t pt::score::pitch_to_midi( const pitch_t& p )
{
  int semitone = (0 <= p.step && p.step < kInvalidStepId) ? _semitoneA[ p.step ] : 0;
  int v        = (p.octave + 1) * 12 + semitone + p.alter;
  return (uint8_t)std::max(0,std::min(127,v));
}

pt::score::pitch_t pt::score::midi_to_pitch( uint8_t midiPitch )
{
  //                          C  C# D  D# E  F  F# G  G# A  A# B
  const stepId_t stepA[]  = { kC_StepId, kC_StepId, kD_StepId, kD_StepId, kE_StepId, kF_StepId, kF_StepId, kG_StepId, kG_StepId, kA_StepId, kA_StepId, kB_StepId };
  const int      alterA[] = { 0, 1, 0, 1, 0, 0, 1, 0, 1, 0, 1, 0 };

  unsigned idx = midiPitch % 12;

  return make_pitch( stepA[idx], (midiPitch / 12) - 1, alterA[idx] );
}

bool pt::score::is_equal( const pitch_t& p0, const pitch_t& p1 )
{
  return p0.step==p1.step && p0.octave==p1.octave && p0.alter==p1.alter;
}

const char* pt::score::pitch_to_string( const pitch_t& p, char* buf, unsigned bufCharN )
{
  if( buf == nullptr || bufCharN == 0 )
    return nullptr;

  char     acc[3] = { 0,0,0 };
  unsigned accN   = std::min(2,std::abs(p.alter));

  for(unsigned i=0; i<accN; ++i)
    acc[i] = p.alter > 0 ? '#' : 'b';

  snprintf(buf,bufCharN,"%c%s%i",step_to_char(p.step),acc,p.octave);
  return buf;
}

pt::score::stepId_t pt::score::char_to_step( char c )
{
  switch( toupper((unsigned char)c) )
  {
    case 'C': return kC_StepId;
    case 'D': return kD_StepId;
    case 'E': return kE_StepId;
    case 'F': return kF_StepId;
    case 'G': return kG_StepId;
    case 'A': return kA_StepId;
    case 'B': return kB_StepId;
  }
  return kInvalidStepId;
}

char pt::score::step_to_char( stepId_t step )
{
  const char* s = "CDEFGAB";
  return (0 <= step && step < kInvalidStepId) ? s[step] : '?';
}

pt::score::duration_t pt::score::make_duration( durTypeId_t typeId, unsigned dotCnt, unsigned tuplet )
{
  duration_t d;
  d.typeId = typeId;
  d.dotCnt = dotCnt;
  d.tuplet = std::max(1u,tuplet);
  return d;
}

double pt::score::duration_beats( const duration_t& d )
{
  return duration_beats(d.typeId,d.dotCnt,d.tuplet);
}

double pt::score::duration_beats( durTypeId_t typeId, unsigned dotCnt, unsigned tuplet )
{
  double base = 1.0;

  switch( typeId )
  {
    case kWholeDurId:        base = 4.0;   break;
    case kHalfDurId:         base = 2.0;   break;
    case kQuarterDurId:      base = 1.0;   break;
    case kEighthDurId:       base = 0.5;   break;
    case kSixteenthDurId:    base = 0.25;  break;
    case kThirtySecondDurId: base = 0.125; break;
    default:
      break;
  }

  // each dot adds half the value of the previous dot
  double dotMult = 1.0;
  double dotVal  = 0.5;
  for(unsigned i=0; i<dotCnt; ++i)
  {
    dotMult += dotVal;
    dotVal  *= 0.5;
  }

  return base * dotMult / std::max(1u,tuplet);
}

pt::score::durTypeId_t pt::score::duration_type_from_label( const char* label )
{
  if( label == nullptr )
    return kInvalidDurId;

  char* s = mem::duplStr(label);
  unsigned id = labelToIdNoCase(_durTypeLabelA, textTrim(s), kInvalidDurId );
  mem::release(s);

  return (durTypeId_t)id;
}

const char* pt::score::duration_type_to_label( durTypeId_t typeId )
{
  return idToLabel(_durTypeLabelA,typeId,kInvalidDurId);
}

pt::rc_t pt::score::create( handle_t& hRef, const char* title, const char* composer, double bpm, unsigned divisions )
{
  rc_t rc;
  if((rc = destroy(hRef)) != kOkRC )
    return rc;

  if( bpm <= 0 )
    return ptLogError(kInvalidArgRC,"The score tempo %f is not valid.",bpm);

  if( divisions == 0 )
    return ptLogError(kInvalidArgRC,"The score divisions must be greater than zero.");

  score_t* p   = mem::allocZ<score_t>();
  p->title     = mem::duplStr(ptStringNullGuard(title));
  p->composer  = mem::duplStr(ptStringNullGuard(composer));
  p->bpm       = bpm;
  p->divisions = divisions;

  hRef.set(p);

  return rc;
}

pt::rc_t pt::score::destroy( handle_t& hRef )
{
  if( !hRef.isValid() )
    return kOkRC;

  _destroy(_handleToPtr(hRef));
  hRef.clear();
  return kOkRC;
}

unsigned pt::score::append_staff( handle_t h )
{
  score_t* p = _handleToPtr(h);

  if( p->finalFl )
  {
    ptLogError(kInvalidOpRC,"The score cannot be changed after it has been finalized.");
    return kInvalidIdx;
  }

  p->staffA = mem::resizeZ<staff_t>(p->staffA,p->staffN+1);

  staff_t* s = p->staffA + p->staffN;
  s->index   = p->staffN + 1;
  s->clef    = "treble";

  return p->staffN++;
}

pt::rc_t pt::score::set_clef( handle_t h, unsigned staffIdx, const char* clefLabel )
{
  rc_t     rc;
  staff_t* s = nullptr;
  score_t* p = _handleToPtr(h);

  if((rc = _staff(p,staffIdx,s)) != kOkRC )
    return rc;

  const char* labelA[] = { "treble", "bass", "alto", "tenor", "percussion", nullptr };

  for(unsigned i=0; labelA[i]!=nullptr; ++i)
    if( textIsEqual(labelA[i],clefLabel) )
    {
      s->clef = labelA[i];
      return kOkRC;
    }

  return ptLogError(kInvalidArgRC,"The clef '%s' is not valid.",ptStringNullGuard(clefLabel));
}

pt::rc_t pt::score::append_measure( handle_t h, unsigned staffIdx, unsigned number, double secs, double beat, unsigned tsNumer, unsigned tsDenom )
{
  rc_t     rc;
  staff_t* s = nullptr;
  score_t* p = _handleToPtr(h);

  if((rc = _staff(p,staffIdx,s)) != kOkRC )
    return rc;

  s->measA = _grow(s->measA,s->measN,s->measAllocN);

  measure_t* m = s->measA + s->measN++;
  m->number    = number;
  m->secs      = secs;
  m->beat      = beat;
  m->tsNumer   = tsNumer;
  m->tsDenom   = tsDenom;
  m->durBeats  = tsDenom==0 ? 0 : tsNumer * 4.0 / tsDenom;

  return rc;
}

pt::rc_t pt::score::set_measure_duration( handle_t h, unsigned staffIdx, double durBeats )
{
  rc_t     rc;
  staff_t* s = nullptr;
  score_t* p = _handleToPtr(h);

  if((rc = _staff(p,staffIdx,s)) != kOkRC )
    return rc;

  if( s->measN == 0 )
    return ptLogError(kInvalidOpRC,"A measure duration cannot be set on staff %i because it has no measures.",s->index);

  s->measA[ s->measN-1 ].durBeats = durBeats;
  return rc;
}

pt::rc_t pt::score::append_note( handle_t h, unsigned staffIdx, const note_t& note )
{
  rc_t     rc;
  staff_t* s = nullptr;
  score_t* p = _handleToPtr(h);

  if((rc = _staff(p,staffIdx,s)) != kOkRC )
    return rc;

  if( s->measN == 0 )
    return ptLogError(kInvalidOpRC,"A note cannot be added to staff %i because it has no measures.",s->index);

  measure_t* m = s->measA + s->measN - 1;

  m->noteA = _grow(m->noteA,m->noteN,m->noteAllocN);

  note_t* n   = m->noteA + m->noteN++;
  *n          = note;
  n->partIdx  = staffIdx;
  n->midiPitch= note.restFl ? 0 : pitch_to_midi(note.pitch);

  return rc;
}

pt::rc_t pt::score::finalize( handle_t h )
{
  score_t* p = _handleToPtr(h);

  if( p->finalFl )
    return kOkRC;

  unsigned n = 0;
  for(unsigned i=0; i<p->staffN; ++i)
    for(unsigned j=0; j<p->staffA[i].measN; ++j)
      n += p->staffA[i].measA[j].noteN;

  p->allNoteA = mem::allocZ<const note_t*>(n);
  p->noteA    = mem::allocZ<const note_t*>(n);

  for(unsigned i=0; i<p->staffN; ++i)
    for(unsigned j=0; j<p->staffA[i].measN; ++j)
    {
      const measure_t* m = p->staffA[i].measA + j;
      for(unsigned k=0; k<m->noteN; ++k)
      {
        p->allNoteA[ p->allNoteN++ ] = m->noteA + k;
        if( !m->noteA[k].restFl )
          p->noteA[ p->noteN++ ] = m->noteA + k;
      }
    }

  std::stable_sort(p->allNoteA, p->allNoteA + p->allNoteN, _noteLessThan );
  std::stable_sort(p->noteA,    p->noteA    + p->noteN,    _noteLessThan );

  p->finalFl = true;

  return kOkRC;
}

const char* pt::score::title( handle_t h )
{ return _handleToPtr(h)->title; }

const char* pt::score::composer( handle_t h )
{ return _handleToPtr(h)->composer; }

double pt::score::bpm( handle_t h )
{ return _handleToPtr(h)->bpm; }

unsigned pt::score::divisions( handle_t h )
{ return _handleToPtr(h)->divisions; }

unsigned pt::score::staff_count( handle_t h )
{ return _handleToPtr(h)->staffN; }

const pt::score::staff_t* pt::score::staff( handle_t h, unsigned staffIdx )
{
  score_t* p = _handleToPtr(h);
  return staffIdx < p->staffN ? p->staffA + staffIdx : nullptr;
}

unsigned pt::score::note_count( handle_t h, unsigned flags )
{
  score_t* p = _handleToPtr(h);
  return ptIsFlag(flags,kIncludeRestsFl) ? p->allNoteN : p->noteN;
}

const pt::score::note_t* pt::score::note( handle_t h, unsigned noteIdx, unsigned flags )
{
  score_t* p = _handleToPtr(h);

  if( ptIsFlag(flags,kIncludeRestsFl) )
    return noteIdx < p->allNoteN ? p->allNoteA[noteIdx] : nullptr;

  return noteIdx < p->noteN ? p->noteA[noteIdx] : nullptr;
}

double pt::score::total_secs( handle_t h )
{
  score_t* p = _handleToPtr(h);
  return total_beats(h) * 60.0 / p->bpm;
}

double pt::score::total_beats( handle_t h )
{
  score_t* p = _handleToPtr(h);
  double   beats = 0;

  for(unsigned i=0; i<p->staffN; ++i)
    for(unsigned j=0; j<p->staffA[i].measN; ++j)
    {
      const measure_t* m = p->staffA[i].measA + j;
      beats = std::max(beats, m->beat + m->durBeats);
    }

  return beats;
}

void pt::score::report( handle_t h )
{
  score_t* p = _handleToPtr(h);
  char     buf[16];

  ptLogPrint("title:'%s' composer:'%s' bpm:%.1f divisions:%i staves:%i notes:%i secs:%.3f\n",p->title,p->composer,p->bpm,p->divisions,p->staffN,p->noteN,total_secs(h));

  for(unsigned i=0; i<p->staffN; ++i)
  {
    const staff_t* s = p->staffA + i;
    ptLogPrint("staff:%i clef:%s measures:%i\n",s->index,s->clef,s->measN);
  }

  ptLogPrint("meas staff   beat     secs  pitch  midi  type    dots\n");
  for(unsigned i=0; i<p->allNoteN; ++i)
  {
    const note_t* n = p->allNoteA[i];
    ptLogPrint("%4i %5i %7.3f %8.3f  %-5s  %4i  %-7s %4i\n",
               n->measNumb, n->staffIdx, n->beat, n->secs,
               n->restFl ? "rest" : pitch_to_string(n->pitch,buf,sizeof(buf)),
               n->midiPitch,
               duration_type_to_label(n->dur.typeId), n->dur.dotCnt );
  }
}
