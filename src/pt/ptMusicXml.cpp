//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptText.h"
#include "ptNumericConvert.h"
#include "ptXml.h"
#include "ptScore.h"
#include "ptMusicXml.h"

namespace pt
{
  namespace musicxml
  {
    typedef struct meta_str
    {
      const char* title;
      const char* composer;
      unsigned    divisions;
      double      bpm;
    } meta_t;

    // Running state of one part.
    typedef struct part_str
    {
      unsigned staffIdx;
      double   secs;      // start time of the current measure
      double   beat;      // start beat of the current measure
      unsigned seqNumb;   // sequential measure number
      unsigned tsNumer;
      unsigned tsDenom;
      bool     clefFl;    // the staff clef has been set
    } part_t;

    // Returns the first descendant of 'n' named 'label' which has the attribute 'attrLabel'.
    const xml::node_t* _find_descendant_with_attr( const xml::node_t* n, const char* label, const char* attrLabel )
    {
      for(const xml::node_t* c=n->children; c!=nullptr; c=c->sibling)
      {
        if( textIsEqual(c->label,label) && c->attr(attrLabel) != nullptr )
          return c;

        const xml::node_t* d;
        if((d = _find_descendant_with_attr(c,label,attrLabel)) != nullptr )
          return d;
      }
      return nullptr;
    }

    const char* _descendant_text( const xml::node_t* root, const char* label )
    {
      const xml::node_t* n;
      if((n = root->find_descendant(label)) == nullptr )
        return nullptr;

      const char* s = n->trimmed_text();
      return textIsBlank(s) ? nullptr : s;
    }

    void _parse_meta( const xml::node_t* root, double dfltBpm, meta_t& m )
    {
      const xml::node_t* n;

      m.divisions = kDefaultDivisions;
      m.bpm       = dfltBpm;

      if((m.title = _descendant_text(root,"work-title")) == nullptr )
        m.title = _descendant_text(root,"movement-title");

      // <composer> is not part of the current schema, <creator type="composer"> is the standard form
      if((m.composer = _descendant_text(root,"composer")) == nullptr )
        if((n = root->find_child("identification")) != nullptr )
          for(const xml::node_t* c=nullptr; (c = n->next_child("creator",c)) != nullptr; )
            if( textIsEqual(c->attr("type"),"composer") && !textIsBlank(c->trimmed_text()) )
            {
              m.composer = c->trimmed_text();
              break;
            }

      unsigned divisions = string_to_number_or<unsigned>(_descendant_text(root,"divisions"),0);
      if( divisions > 0 )
        m.divisions = divisions;

      if((n = _find_descendant_with_attr(root,"sound","tempo")) != nullptr )
      {
        double bpm = string_to_number_or<double>(n->attr("tempo"),0.0);
        if( bpm > 0 )
          m.bpm = bpm;
      }
    }

    unsigned _child_count( const xml::node_t* n, const char* label )
    {
      unsigned cnt = 0;
      for(const xml::node_t* c=nullptr; (c = n->next_child(label,c)) != nullptr; )
        ++cnt;
      return cnt;
    }

    score::pitch_t _parse_pitch( const xml::node_t* noteEle )
    {
      const xml::node_t* pitchEle = noteEle->find_child("pitch");
      const char*        stepStr  = nullptr;
      score::stepId_t    step     = score::kC_StepId;
      int                octave   = 4;
      int                alter    = 0;

      if( pitchEle != nullptr )
      {
        if((stepStr = pitchEle->child_text("step")) != nullptr && textLength(stepStr)==1 )
          if((step = score::char_to_step(stepStr[0])) == score::kInvalidStepId )
            step = score::kC_StepId;

        octave = string_to_number_or<int>(pitchEle->child_text("octave"),4);

        // microtonal alterations (e.g. -0.5) are not representable and are ignored
        alter  = string_to_number_or<int>(pitchEle->child_text("alter"),0);
        alter  = std::max(-2,std::min(2,alter));
      }

      return score::make_pitch(step,octave,alter);
    }

    score::duration_t _parse_duration( const xml::node_t* noteEle )
    {
      score::durTypeId_t typeId = score::duration_type_from_label( noteEle->child_text("type") );

      if( typeId == score::kInvalidDurId )
        typeId = score::kQuarterDurId;

      return score::make_duration( typeId, _child_count(noteEle,"dot") );
    }

    void _parse_clef( score::handle_t scoreH, part_t& part, const xml::node_t* attrEle )
    {
      const xml::node_t* clefEle;
      const char*        label = nullptr;

      if( part.clefFl || (clefEle = attrEle->find_child("clef")) == nullptr )
        return;

      const char* sign = clefEle->child_text("sign");
      int         line = string_to_number_or<int>(clefEle->child_text("line"),0);

      if( textIsEqual(sign,"G") )
        label = "treble";
      else
        if( textIsEqual(sign,"F") )
          label = "bass";
        else
          if( textIsEqual(sign,"C") )
            label = line==4 ? "tenor" : "alto";
          else
            if( textIsEqual(sign,"percussion") )
              label = "percussion";

      if( label != nullptr && score::set_clef(scoreH,part.staffIdx,label) == kOkRC )
        part.clefFl = true;
    }

    void _parse_time_sig( const xml::node_t* attrEle, part_t& part )
    {
      const xml::node_t* timeEle;

      if((timeEle = attrEle->find_child("time")) == nullptr )
        return;

      // compound signatures (e.g. "3+2") do not parse and the previous signature is kept
      unsigned numer = string_to_number_or<unsigned>(timeEle->child_text("beats"),0);
      unsigned denom = string_to_number_or<unsigned>(timeEle->child_text("beat-type"),0);

      if( numer > 0 )
        part.tsNumer = numer;

      if( denom > 0 )
        part.tsDenom = denom;
    }

    rc_t _parse_measure( score::handle_t scoreH, const meta_t& meta, part_t& part, const xml::node_t* measEle )
    {
      rc_t     rc         = kOkRC;
      unsigned measNumb   = string_to_number_or<unsigned>(measEle->attr("number"),part.seqNumb);
      double   divs       = meta.divisions;
      double   cursor     = 0;  // voice cursor in divisions
      double   maxCursor  = 0;  // furthest position reached by any voice
      double   prevStart  = 0;  // start of the last non-chord note or the cursor after a backup/forward
      double   durBeats   = 0;
      const xml::node_t* attrEle;

      if((attrEle = measEle->find_child("attributes")) != nullptr )
      {
        _parse_time_sig(attrEle,part);
        _parse_clef(scoreH,part,attrEle);
      }

      if((rc = score::append_measure(scoreH,part.staffIdx,measNumb,part.secs,part.beat,part.tsNumer,part.tsDenom)) != kOkRC )
        goto errLabel;

      for(const xml::node_t* e=measEle->children; e!=nullptr; e=e->sibling)
      {
        if( textIsEqual(e->label,"backup") )
        {
          double dur = string_to_number_or<unsigned>(e->child_text("duration"),0);
          cursor     = std::max(0.0,cursor - dur);
          prevStart  = cursor;
          continue;
        }

        if( textIsEqual(e->label,"forward") )
        {
          cursor   += string_to_number_or<unsigned>(e->child_text("duration"),0);
          maxCursor = std::max(maxCursor,cursor);
          prevStart = cursor;
          continue;
        }

        if( textIsNotEqual(e->label,"note") )
          continue;

        score::note_t n;
        memset(&n,0,sizeof(n));

        n.chordFl  = e->find_child("chord") != nullptr;
        n.restFl   = e->find_child("rest") != nullptr;
        n.durDivs  = string_to_number_or<unsigned>(e->child_text("duration"),0);
        n.voice    = string_to_number_or<unsigned>(e->child_text("voice"),0);
        n.staffIdx = string_to_number_or<unsigned>(e->child_text("staff"),score::kUnsetStaffIdx);
        n.dur      = _parse_duration(e);
        n.measNumb = measNumb;

        if( !n.restFl )
          n.pitch = _parse_pitch(e);

        // a chord tone shares the onset of the preceding note, or the moved cursor when it directly follows a backup/forward
        double start = n.chordFl ? prevStart : cursor;

        n.measBeat = start / divs;
        n.beat     = part.beat + n.measBeat;
        n.secs     = part.secs + n.measBeat * 60.0 / meta.bpm;

        if((rc = score::append_note(scoreH,part.staffIdx,n)) != kOkRC )
          goto errLabel;

        if( !n.chordFl )
        {
          prevStart  = cursor;
          cursor    += n.durDivs;
          maxCursor  = std::max(maxCursor,cursor);
        }
      }

      // a measure with no duration (e.g. empty or only chord tones) takes it's length from the time signature
      if((durBeats = maxCursor / divs) <= 0 )
        durBeats = part.tsNumer * 4.0 / part.tsDenom;

      if((rc = score::set_measure_duration(scoreH,part.staffIdx,durBeats)) != kOkRC )
        goto errLabel;

      part.beat    += durBeats;
      part.secs    += durBeats * 60.0 / meta.bpm;
      part.seqNumb += 1;

    errLabel:
      return rc;
    }

    rc_t _parse_partwise( score::handle_t scoreH, const meta_t& meta, const xml::node_t* root )
    {
      rc_t rc = kOkRC;

      for(const xml::node_t* partEle=nullptr; (partEle = root->next_child("part",partEle)) != nullptr; )
      {
        part_t part;
        memset(&part,0,sizeof(part));

        part.staffIdx = score::append_staff(scoreH);
        part.seqNumb  = 1;
        part.tsNumer  = 4;
        part.tsDenom  = 4;

        if( part.staffIdx == kInvalidIdx )
          return ptLogError(kOpFailRC,"Staff allocation failed.");

        for(const xml::node_t* measEle=nullptr; (measEle = partEle->next_child("measure",measEle)) != nullptr; )
          if((rc = _parse_measure(scoreH,meta,part,measEle)) != kOkRC )
            return ptLogError(rc,"MusicXML parse failed on part '%s' measure %i.",ptStringNullGuard(partEle->attr("id")),part.seqNumb);
      }

      return rc;
    }

    rc_t _parse_doc( score::handle_t& scoreHRef, const xml::node_t* root, double dfltBpm )
    {
      rc_t            rc = kOkRC;
      meta_t          meta;
      score::handle_t scoreH;

      if( textIsEqual(root->label,"score-timewise") )
        return ptLogError(kNotImplRC,"MusicXML 'score-timewise' documents are not supported.");

      if( textIsNotEqual(root->label,"score-partwise") )
        return ptLogError(kSyntaxErrorRC,"The document root element '%s' is not 'score-partwise' or 'score-timewise'.",ptStringNullGuard(root->label));

      _parse_meta(root,dfltBpm,meta);

      if((rc = score::create(scoreH,meta.title,meta.composer,meta.bpm,meta.divisions)) != kOkRC )
        goto errLabel;

      if((rc = _parse_partwise(scoreH,meta,root)) != kOkRC )
        goto errLabel;

      if((rc = score::finalize(scoreH)) != kOkRC )
        goto errLabel;

      // replace the callers score only on success
      if((rc = score::destroy(scoreHRef)) != kOkRC )
        goto errLabel;

      scoreHRef = scoreH;

    errLabel:
      if( rc != kOkRC )
        score::destroy(scoreH);

      return rc;
    }
  }
}

pt::rc_t pt::musicxml::parse( score::handle_t& scoreHRef, const char* text, double dfltBpm )
{
  rc_t         rc   = kOkRC;
  xml::node_t* root = nullptr;

  if( textIsBlank(text) )
    return ptLogError(kInvalidArgRC,"The MusicXML document is empty.");

  if((rc = xml::parse(text,root)) != kOkRC )
    return ptLogError(kSyntaxErrorRC,"The MusicXML markup could not be parsed.");

  rc = _parse_doc(scoreHRef,root,dfltBpm);

  root->free();

  return rc;
}

pt::rc_t pt::musicxml::parse_file( score::handle_t& scoreHRef, const char* fn, double dfltBpm )
{
  rc_t         rc   = kOkRC;
  xml::node_t* root = nullptr;

  if( textIsBlank(fn) )
    return ptLogError(kInvalidArgRC,"The MusicXML file name is empty.");

  if((rc = xml::parseFile(fn,root)) != kOkRC )
    return ptLogError(rc,"The MusicXML file '%s' could not be parsed.",fn);

  if((rc = _parse_doc(scoreHRef,root,dfltBpm)) != kOkRC )
    rc = ptLogError(rc,"MusicXML parse failed on '%s'.",fn);

  root->free();

  return rc;
}
