//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include <gtest/gtest.h>

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

using namespace pt;

namespace
{
  typedef struct tnote_str
  {
    uint8_t            pitch;
    double             beat;
    score::durTypeId_t durTypeId;
    unsigned           staffIdx;
  } tnote_t;

  // Build a single part score at 60 bpm (one beat per second).
  rc_t _make_score( score::handle_t& hRef, const tnote_t* noteA, unsigned noteN )
  {
    rc_t rc;
    if((rc = score::create(hRef,"test",nullptr,60,4)) != kOkRC )
      return rc;

    unsigned staffIdx = score::append_staff(hRef);

    if((rc = score::append_measure(hRef,staffIdx,1,0,0,4,4)) != kOkRC )
      return rc;

    for(unsigned i=0; i<noteN; ++i)
    {
      score::note_t n;
      memset(&n,0,sizeof(n));
      n.pitch    = score::midi_to_pitch(noteA[i].pitch);
      n.dur      = score::make_duration(noteA[i].durTypeId);
      n.beat     = noteA[i].beat;
      n.secs     = noteA[i].beat;
      n.staffIdx = noteA[i].staffIdx;

      if((rc = score::append_note(hRef,staffIdx,n)) != kOkRC )
        return rc;
    }

    return score::finalize(hRef);
  }
}

class SessionTest : public testing::Test
{
protected:
  virtual void SetUp() override
  {
    session::init_default_args(_args);
    _args.countdownSecs = 1.0;
  }

  virtual void TearDown() override
  {
    EXPECT_EQ( session::destroy(_h), kOkRC );
    EXPECT_EQ( score::destroy(_scoreH), kOkRC );
  }

  // Create the session, load 'noteA[]' at time 0 and end the countdown at time 1.
  void _start( const tnote_t* noteA, unsigned noteN )
  {
    ASSERT_EQ( _make_score(_scoreH,noteA,noteN), kOkRC );
    ASSERT_EQ( session::create(_h,_args), kOkRC );
    ASSERT_EQ( session::load(_h,_scoreH,0), kOkRC );
    EXPECT_EQ( session::state(_h), session::kCountdownStateId );

    EXPECT_EQ( session::tick(_h,0.5), kOkRC );
    EXPECT_EQ( session::state(_h), session::kCountdownStateId );

    EXPECT_EQ( session::tick(_h,1.0), kOkRC );
  }

  session::args_t   _args;
  session::handle_t _h;
  score::handle_t   _scoreH;
};

// C4+E4 chord followed by G4
static const tnote_t _chordNoteA[] =
{
  { 60, 0, score::kQuarterDurId, score::kUpperStaffIdx },
  { 64, 0, score::kQuarterDurId, score::kUpperStaffIdx },
  { 67, 1, score::kQuarterDurId, score::kUpperStaffIdx },
};

TEST_F(SessionTest, IdleSessionIgnoresInput)
{
  ASSERT_EQ( session::create(_h,_args), kOkRC );
  EXPECT_EQ( session::state(_h), session::kIdleStateId );

  EXPECT_EQ( session::tick(_h,10), kOkRC );
  session::on_note_on(_h,60,10);
  EXPECT_EQ( session::state(_h), session::kIdleStateId );
  EXPECT_EQ( session::stats(_h).mistakeCnt, 0u );

  // reset without a score is ignored
  EXPECT_EQ( session::reset(_h,11), kOkRC );
  EXPECT_EQ( session::state(_h), session::kIdleStateId );
}

TEST_F(SessionTest, PracticeChordAdvancesGroup)
{
  _start(_chordNoteA,3);

  ASSERT_EQ( session::state(_h), session::kAwaitingStateId );
  EXPECT_EQ( session::group_count(_h), 2u );
  EXPECT_EQ( session::stats(_h).requiredPitchCnt, 3u );

  session::on_note_on(_h,60,1.1);
  EXPECT_EQ( session::group_index(_h), 0u );
  EXPECT_EQ( session::group_hit_count(_h), 1u );

  session::on_note_on(_h,64,1.15);
  EXPECT_EQ( session::group_index(_h), 1u );
  EXPECT_EQ( session::stats(_h).hitCnt, 2u );
  EXPECT_EQ( session::stats(_h).satisfiedGroupCnt, 1u );

  // the practice clock approaches the next group but waits there
  EXPECT_EQ( session::tick(_h,1.5), kOkRC );
  EXPECT_DOUBLE_EQ( session::current_beat(_h), 0.5 );
  EXPECT_EQ( session::tick(_h,5.0), kOkRC );
  EXPECT_DOUBLE_EQ( session::current_beat(_h), 1.0 );
  EXPECT_EQ( session::state(_h), session::kAwaitingStateId );

  session::on_note_on(_h,67,6.0);
  EXPECT_EQ( session::state(_h), session::kCompleteStateId );
  EXPECT_EQ( session::group_index(_h), session::group_count(_h) );
  EXPECT_EQ( session::stats(_h).hitCnt, 3u );
  EXPECT_EQ( session::stats(_h).mistakeCnt, 0u );

  // input after completion is ignored
  session::on_note_on(_h,61,6.1);
  EXPECT_EQ( session::stats(_h).mistakeCnt, 0u );
}

TEST_F(SessionTest, WrongPitchIsMistake)
{
  _start(_chordNoteA,3);

  session::on_note_on(_h,60,1.1);
  session::on_note_on(_h,67,1.12);

  EXPECT_EQ( session::stats(_h).mistakeCnt, 1u );
  EXPECT_EQ( session::group_index(_h), 0u );
  EXPECT_EQ( session::group_hit_count(_h), 0u );

  // credit for a pitch is given once and is not revoked by the mistake
  EXPECT_EQ( session::stats(_h).hitCnt, 1u );

  session::on_note_on(_h,60,1.3);
  session::on_note_on(_h,64,1.35);

  EXPECT_EQ( session::group_index(_h), 1u );
  EXPECT_EQ( session::stats(_h).hitCnt, 2u );
  EXPECT_EQ( session::stats(_h).mistakeCnt, 1u );
}

TEST_F(SessionTest, ChordWindowExpiresOnTick)
{
  _start(_chordNoteA,3);

  session::on_note_on(_h,60,1.1);
  EXPECT_EQ( session::tick(_h,1.3), kOkRC );
  EXPECT_EQ( session::stats(_h).mistakeCnt, 0u );

  EXPECT_EQ( session::tick(_h,1.4), kOkRC );
  EXPECT_EQ( session::stats(_h).mistakeCnt, 1u );
  EXPECT_EQ( session::group_hit_count(_h), 0u );
  EXPECT_EQ( session::group_index(_h), 0u );
}

TEST_F(SessionTest, LateChordToneRestartsAttempt)
{
  _start(_chordNoteA,3);

  session::on_note_on(_h,60,1.1);
  session::on_note_on(_h,64,1.5);

  // the late E4 opens a new window on its own
  EXPECT_EQ( session::stats(_h).mistakeCnt, 1u );
  EXPECT_EQ( session::group_index(_h), 0u );
  EXPECT_EQ( session::group_hit_count(_h), 1u );

  session::on_note_on(_h,60,1.6);
  EXPECT_EQ( session::group_index(_h), 1u );
}

TEST_F(SessionTest, TempoModeMissedGroup)
{
  const tnote_t noteA[] =
  {
   { 60, 0, score::kQuarterDurId, score::kUpperStaffIdx },
   { 64, 0, score::kQuarterDurId, score::kUpperStaffIdx },
   { 67, 2, score::kQuarterDurId, score::kUpperStaffIdx },
  };

  _args.mode = session::kTempoModeId;
  _start(noteA,3);

  ASSERT_EQ( session::state(_h), session::kAwaitingStateId );

  // one of the two chord tones is played before the clock passes the chord
  session::on_note_on(_h,60,1.05);
  EXPECT_EQ( session::tick(_h,1.2), kOkRC );

  EXPECT_NEAR( session::current_beat(_h), 0.2, 1e-9 );
  EXPECT_EQ( session::group_index(_h), 1u );
  EXPECT_EQ( session::stats(_h).missedNoteCnt,  1u );
  EXPECT_EQ( session::stats(_h).missedGroupCnt, 1u );
  EXPECT_EQ( session::stats(_h).mistakeCnt,     1u );
  EXPECT_EQ( session::stats(_h).hitCnt,         1u );

  // a correct pitch played too early is a mistake
  session::on_note_on(_h,67,1.5);
  EXPECT_EQ( session::stats(_h).mistakeCnt, 2u );
  EXPECT_EQ( session::group_index(_h), 1u );

  session::on_note_on(_h,67,2.95);
  EXPECT_EQ( session::state(_h), session::kCompleteStateId );
  EXPECT_EQ( session::stats(_h).hitCnt, 2u );
}

TEST_F(SessionTest, TempoModeMissIsLateToleranceAfterOnset)
{
  const tnote_t noteA[] =
  {
   { 60, 1, score::kQuarterDurId, score::kUpperStaffIdx },
   { 62, 3, score::kQuarterDurId, score::kUpperStaffIdx },
  };

  _args.mode = session::kTempoModeId;
  _start(noteA,2);

  // the onset has passed but the clock is still within the late tolerance (0.1 beats at 60 bpm)
  EXPECT_EQ( session::tick(_h,2.08), kOkRC );
  EXPECT_EQ( session::group_index(_h), 0u );
  EXPECT_EQ( session::stats(_h).missedGroupCnt, 0u );

  session::on_note_on(_h,60,2.09);
  EXPECT_EQ( session::group_index(_h), 1u );
  EXPECT_EQ( session::stats(_h).hitCnt,     1u );
  EXPECT_EQ( session::stats(_h).mistakeCnt, 0u );

  EXPECT_EQ( session::tick(_h,4.08), kOkRC );
  EXPECT_EQ( session::group_index(_h), 1u );
  EXPECT_EQ( session::stats(_h).missedGroupCnt, 0u );

  // just past the late tolerance the group is missed
  EXPECT_EQ( session::tick(_h,4.12), kOkRC );
  EXPECT_EQ( session::state(_h), session::kCompleteStateId );
  EXPECT_EQ( session::stats(_h).missedGroupCnt, 1u );
  EXPECT_EQ( session::stats(_h).missedNoteCnt,  1u );
  EXPECT_EQ( session::stats(_h).mistakeCnt,     1u );
}

TEST_F(SessionTest, TempoModeMissesEveryPassedGroup)
{
  _args.mode = session::kTempoModeId;
  _start(_chordNoteA,3);

  EXPECT_EQ( session::tick(_h,10), kOkRC );

  EXPECT_EQ( session::state(_h), session::kCompleteStateId );
  EXPECT_EQ( session::stats(_h).missedGroupCnt, 2u );
  EXPECT_EQ( session::stats(_h).missedNoteCnt,  3u );
  EXPECT_EQ( session::stats(_h).mistakeCnt,     2u );
  EXPECT_EQ( session::stats(_h).hitCnt,         0u );
}

TEST_F(SessionTest, EarlyReleaseOfHeldNote)
{
  const tnote_t noteA[] =
  {
   { 60, 0, score::kHalfDurId,    score::kUpperStaffIdx },
   { 62, 2, score::kQuarterDurId, score::kUpperStaffIdx },
   { 64, 3, score::kEighthDurId,  score::kUpperStaffIdx },
  };

  _start(noteA,3);

  session::on_note_on(_h,60,1.0);
  EXPECT_EQ( session::tick(_h,1.5), kOkRC );
  session::on_note_off(_h,60,1.5);

  EXPECT_EQ( session::stats(_h).holdBreakCnt, 1u );
  EXPECT_TRUE( session::group(_h,0)->evalA[0].breakFl );

  EXPECT_EQ( session::tick(_h,5.0), kOkRC );
  session::on_note_on(_h,62,5.0);
  EXPECT_EQ( session::tick(_h,6.0), kOkRC );

  // released at the end of it's duration
  session::on_note_off(_h,62,6.0);
  EXPECT_EQ( session::stats(_h).holdBreakCnt, 1u );
  EXPECT_FALSE( session::group(_h,1)->evalA[0].breakFl );

  // a release without a hold is ignored
  session::on_note_off(_h,62,6.05);
  EXPECT_EQ( session::stats(_h).holdBreakCnt, 1u );

  session::on_note_on(_h,64,6.1);
  EXPECT_EQ( session::state(_h), session::kCompleteStateId );
}

TEST_F(SessionTest, HandFilter)
{
  const tnote_t noteA[] =
  {
   { 60, 0, score::kQuarterDurId, score::kUpperStaffIdx },
   { 48, 0, score::kQuarterDurId, score::kLowerStaffIdx },
   { 43, 1, score::kQuarterDurId, score::kLowerStaffIdx },
   { 64, 2, score::kQuarterDurId, score::kUnsetStaffIdx },
  };

  _args.handFlags = session::kRightHandFl;
  _start(noteA,4);

  ASSERT_EQ( session::group_count(_h), 2u );
  EXPECT_EQ( session::stats(_h).requiredPitchCnt, 2u );
  EXPECT_EQ( session::group(_h,0)->evalN, 1u );
  EXPECT_EQ( session::group(_h,0)->pitchA[0], 60 );
  EXPECT_EQ( session::group(_h,1)->pitchA[0], 64 );

  // switching hands takes effect on the next reset
  session::set_hands(_h,session::kLeftHandFl);
  EXPECT_EQ( session::group_count(_h), 2u );

  EXPECT_EQ( session::reset(_h,2), kOkRC );
  EXPECT_EQ( session::state(_h), session::kCountdownStateId );
  ASSERT_EQ( session::group_count(_h), 3u );
  EXPECT_EQ( session::group(_h,0)->pitchA[0], 48 );

  session::set_hands(_h,session::kBothHandsFl);
  EXPECT_EQ( session::reset(_h,3), kOkRC );
  ASSERT_EQ( session::group_count(_h), 3u );
  EXPECT_EQ( session::group(_h,0)->pitchN, 2u );
}

TEST_F(SessionTest, EmptyPerformanceCompletesAfterCountdown)
{
  _start(nullptr,0);

  EXPECT_EQ( session::group_count(_h), 0u );
  EXPECT_EQ( session::state(_h), session::kCompleteStateId );
}

TEST_F(SessionTest, ReloadReplacesPerformance)
{
  _start(_chordNoteA,3);

  session::on_note_on(_h,60,1.1);
  session::on_note_on(_h,64,1.12);
  session::on_note_on(_h,50,1.2);
  EXPECT_EQ( session::stats(_h).mistakeCnt, 1u );

  // a failed load leaves the current performance unchanged
  score::handle_t invalidH;
  EXPECT_EQ( session::load(_h,invalidH,2), kInvalidArgRC );
  EXPECT_EQ( session::state(_h), session::kAwaitingStateId );
  EXPECT_EQ( session::group_index(_h), 1u );

  const tnote_t noteA[] = { { 72, 0, score::kWholeDurId, score::kUpperStaffIdx } };
  score::handle_t scoreH;
  ASSERT_EQ( _make_score(scoreH,noteA,1), kOkRC );

  EXPECT_EQ( session::load(_h,scoreH,3), kOkRC );
  EXPECT_EQ( session::state(_h), session::kCountdownStateId );
  EXPECT_EQ( session::group_count(_h), 1u );
  EXPECT_EQ( session::group_index(_h), 0u );
  EXPECT_EQ( session::stats(_h).mistakeCnt, 0u );
  EXPECT_EQ( session::stats(_h).hitCnt, 0u );

  EXPECT_EQ( session::tick(_h,4), kOkRC );
  session::on_note_on(_h,72,4.1);
  EXPECT_EQ( session::state(_h), session::kCompleteStateId );

  EXPECT_EQ( session::destroy(_h), kOkRC );
  EXPECT_EQ( score::destroy(scoreH), kOkRC );
}

TEST_F(SessionTest, MidiEvents)
{
  _start(_chordNoteA,3);

  midi::event_t e;
  memset(&e,0,sizeof(e));
  e.typeId       = midi::kNoteOnEvtTId;
  e.secs         = 1.1;
  e.u.note.pitch = 60;
  e.u.note.vel   = 90;
  session::on_event(_h,&e);

  e.u.note.pitch = 64;
  session::on_event(_h,&e);

  e.typeId = midi::kCtlEvtTId;
  session::on_event(_h,&e);
  session::on_event(_h,nullptr);

  EXPECT_EQ( session::group_index(_h), 1u );
  EXPECT_EQ( session::stats(_h).mistakeCnt, 0u );
}

TEST(SessionArgsTest, Labels)
{
  EXPECT_EQ( session::mode_from_label("practice"), session::kPracticeModeId );
  EXPECT_EQ( session::mode_from_label("Tempo"),    session::kTempoModeId );
  EXPECT_EQ( session::mode_from_label("rubato"),   session::kInvalidModeId );
  EXPECT_STREQ( session::mode_to_label(session::kTempoModeId), "tempo" );
  EXPECT_STREQ( session::state_to_label(session::kAwaitingStateId), "awaiting" );
}

TEST(SessionArgsTest, ParseArgs)
{
  session::args_t a;
  object_t*       cfg = nullptr;

  session::init_default_args(a);
  ASSERT_EQ( objectFromString("{ mode:\"tempo\", right_hand:false, chord_window_secs:0.5, countdown_secs:0 }",cfg), kOkRC );
  EXPECT_EQ( session::parse_args(cfg,a), kOkRC );
  cfg->free();

  EXPECT_EQ( a.mode,      session::kTempoModeId );
  EXPECT_EQ( a.handFlags, (unsigned)session::kLeftHandFl );
  EXPECT_DOUBLE_EQ( a.chordWindowSecs, 0.5 );
  EXPECT_DOUBLE_EQ( a.countdownSecs,   0.0 );
  EXPECT_DOUBLE_EQ( a.holdMinBeats,    1.0 );

  EXPECT_EQ( session::parse_args(nullptr,a), kOkRC );

  const char* badA[] =
  {
   "{ mode:\"rubato\" }",
   "{ chord_window_secs:0 }",
   "{ late_tol_secs:-1 }",
  };

  for(const char* s : badA)
  {
    session::init_default_args(a);
    ASSERT_EQ( objectFromString(s,cfg), kOkRC );
    EXPECT_EQ( session::parse_args(cfg,a), kInvalidArgRC ) << s;
    cfg->free();
  }

  ASSERT_EQ( objectFromString("{ metronome:true }",cfg), kOkRC );
  EXPECT_EQ( session::parse_args(cfg,a), kSyntaxErrorRC );

  session::handle_t h;
  EXPECT_EQ( session::create(h,cfg), kSyntaxErrorRC );
  EXPECT_FALSE( h.isValid() );
  cfg->free();
}
