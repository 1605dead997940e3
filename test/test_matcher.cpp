//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include <gtest/gtest.h>

#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptMidi.h"
#include "ptMidiDecls.h"
#include "ptScore.h"
#include "ptMatcher.h"

using namespace pt;

class MatcherTest : public testing::Test
{
protected:
  // C4 at 0s, a rest at 1s, E4 at 2s and G4 at 3s (60 bpm)
  virtual void SetUp() override
  {
    const uint8_t pitchA[] = { 60, 0, 64, 67 };

    ASSERT_EQ( score::create(_scoreH,"scale",nullptr,60,4), kOkRC );
    unsigned staffIdx = score::append_staff(_scoreH);
    ASSERT_EQ( score::append_measure(_scoreH,staffIdx,1,0,0,4,4), kOkRC );

    for(unsigned i=0; i<4; ++i)
    {
      score::note_t n;
      memset(&n,0,sizeof(n));
      n.pitch  = score::midi_to_pitch(pitchA[i]);
      n.restFl = pitchA[i] == 0;
      n.dur    = score::make_duration(score::kHalfDurId);
      n.beat   = i;
      n.secs   = i;
      ASSERT_EQ( score::append_note(_scoreH,staffIdx,n), kOkRC );
    }

    ASSERT_EQ( score::finalize(_scoreH), kOkRC );
    ASSERT_EQ( match::create(_h,_scoreH), kOkRC );
  }

  virtual void TearDown() override
  {
    EXPECT_EQ( match::destroy(_h), kOkRC );
    EXPECT_EQ( score::destroy(_scoreH), kOkRC );
  }

  match::matchId_t _play( uint8_t pitch, double secs )
  {
    match::result_t r;
    EXPECT_EQ( match::on_note_on(_h,pitch,100,secs,&r), kOkRC );
    return r.id;
  }

  score::handle_t _scoreH;
  match::handle_t _h;
};

TEST_F(MatcherTest, InvalidArguments)
{
  match::handle_t h;
  score::handle_t invalidH;

  EXPECT_EQ( match::create(h,invalidH), kInvalidArgRC );
  EXPECT_EQ( match::create(h,_scoreH,-0.1,0.1), kInvalidArgRC );
  EXPECT_FALSE( h.isValid() );

  EXPECT_EQ( match::on_note_on(_h,128,100,0), kInvalidArgRC );
  EXPECT_EQ( match::result_count(_h), 0u );
}

TEST_F(MatcherTest, Expectations)
{
  ASSERT_EQ( match::exp_count(_h), 4u );
  EXPECT_EQ( match::note_exp_count(_h), 3u );

  const match::exp_t* e = match::expectation(_h,1);
  ASSERT_NE( e, nullptr );
  EXPECT_TRUE( e->restFl );
  EXPECT_DOUBLE_EQ( e->earlyTolSecs, 0.0 );
  EXPECT_DOUBLE_EQ( e->lateTolSecs,  0.0 );

  e = match::expectation(_h,2);
  EXPECT_EQ( e->index, 2u );
  EXPECT_EQ( e->pitch, 64 );
  EXPECT_DOUBLE_EQ( e->secs,         2.0 );
  EXPECT_DOUBLE_EQ( e->durSecs,      2.0 );
  EXPECT_DOUBLE_EQ( e->earlyTolSecs, match::kDefaultTolSecs );

  EXPECT_EQ( match::expectation(_h,4), nullptr );

  unsigned idxA[4];
  EXPECT_EQ( match::window(_h,0.5,2.0,idxA,4), 2u );
  EXPECT_EQ( idxA[0], 1u );
  EXPECT_EQ( idxA[1], 2u );

  // the count is returned even when the index array is too small
  EXPECT_EQ( match::window(_h,0,10,idxA,1), 4u );
  EXPECT_EQ( match::window(_h,0,10,nullptr,0), 4u );
}

TEST_F(MatcherTest, Classification)
{
  EXPECT_EQ( _play(60, 0.0),   match::kPerfectMatchId );
  EXPECT_EQ( _play(64, 2.02),  match::kPerfectMatchId );
  EXPECT_EQ( _play(67, 2.93),  match::kGoodMatchId );
  EXPECT_EQ( _play(64, 2.101), match::kLateMatchId );
  EXPECT_EQ( _play(60,-0.15),  match::kEarlyMatchId );
  EXPECT_EQ( _play(72, 1.0),   match::kExtraMatchId );

  // G4 is expected at 3s which is outside the search window
  EXPECT_EQ( _play(67, 2.4),   match::kExtraMatchId );

  ASSERT_EQ( match::result_count(_h), 7u );

  const match::result_t* r = match::result(_h,3);
  EXPECT_EQ( r->expIdx, 2u );
  EXPECT_NEAR( r->errSecs, 0.101, 1e-9 );
  EXPECT_EQ( r->vel, 100 );

  r = match::result(_h,5);
  EXPECT_EQ( r->expIdx, kInvalidIdx );
  EXPECT_DOUBLE_EQ( r->errSecs, 0.0 );

  EXPECT_EQ( match::result(_h,7), nullptr );
}

TEST_F(MatcherTest, ClosestExpectationWins)
{
  // C4 at 0.45 is within the window of C4 at 0s only
  EXPECT_EQ( _play(60,0.45), match::kLateMatchId );
  EXPECT_EQ( match::result(_h,0)->expIdx, 0u );

  // rests are never matched
  EXPECT_EQ( _play(0,1.0), match::kExtraMatchId );
}

TEST_F(MatcherTest, Classify)
{
  match::exp_t e;
  memset(&e,0,sizeof(e));
  e.earlyTolSecs = 0.1;
  e.lateTolSecs  = 0.2;

  EXPECT_EQ( match::classify(e, 0.0),    match::kPerfectMatchId );
  EXPECT_EQ( match::classify(e,-0.049),  match::kPerfectMatchId );
  EXPECT_EQ( match::classify(e, 0.05),   match::kGoodMatchId );
  EXPECT_EQ( match::classify(e, 0.2),    match::kGoodMatchId );
  EXPECT_EQ( match::classify(e,-0.1),    match::kGoodMatchId );
  EXPECT_EQ( match::classify(e,-0.125),  match::kEarlyMatchId );
  EXPECT_EQ( match::classify(e, 0.25),   match::kLateMatchId );
}

TEST_F(MatcherTest, MissedExpectations)
{
  _play(60,0.01);

  EXPECT_EQ( match::missed(_h,2.05), 0u );

  unsigned idxA[4];
  EXPECT_EQ( match::missed(_h,2.2,idxA,4), 1u );
  EXPECT_EQ( idxA[0], 2u );

  EXPECT_EQ( match::missed(_h,10,idxA,4), 2u );
  EXPECT_EQ( idxA[1], 3u );

  // an extra note with the right pitch does not satisfy an expectation
  _play(64,10);
  EXPECT_EQ( match::missed(_h,10), 2u );
}

TEST_F(MatcherTest, ActiveNotesAndReset)
{
  _play(60,0);
  _play(64,2);
  EXPECT_EQ( match::active_note_count(_h), 2u );

  match::on_note_off(_h,60,0.5);
  match::on_note_off(_h,200,0.5);
  EXPECT_EQ( match::active_note_count(_h), 1u );

  match::reset(_h);
  EXPECT_EQ( match::active_note_count(_h), 0u );
  EXPECT_EQ( match::result_count(_h), 0u );
  EXPECT_EQ( match::exp_count(_h), 4u );
}

TEST_F(MatcherTest, EventsAreShiftedByOffset)
{
  midi::event_t e;
  memset(&e,0,sizeof(e));
  e.typeId       = midi::kNoteOnEvtTId;
  e.secs         = 5.0;
  e.u.note.pitch = 60;
  e.u.note.vel   = 80;

  EXPECT_EQ( match::on_event(_h,&e,5.0), kOkRC );
  EXPECT_EQ( match::on_event(_h,nullptr), kOkRC );

  e.typeId = midi::kPbendEvtTId;
  EXPECT_EQ( match::on_event(_h,&e), kOkRC );

  ASSERT_EQ( match::result_count(_h), 1u );
  EXPECT_EQ( match::result(_h,0)->id, match::kPerfectMatchId );
  EXPECT_DOUBLE_EQ( match::result(_h,0)->secs, 0.0 );

  e.typeId = midi::kNoteOffEvtTId;
  e.secs   = 5.5;
  EXPECT_EQ( match::on_event(_h,&e,5.0), kOkRC );
  EXPECT_EQ( match::active_note_count(_h), 0u );
}

TEST_F(MatcherTest, ResultListGrows)
{
  for(unsigned i=0; i<200; ++i)
    _play(100,i);

  ASSERT_EQ( match::result_count(_h), 200u );
  EXPECT_EQ( match::result(_h,199)->id, match::kExtraMatchId );
  EXPECT_DOUBLE_EQ( match::result(_h,199)->secs, 199.0 );
}

TEST(MatchLabelTest, Labels)
{
  EXPECT_STREQ( match::match_to_label(match::kPerfectMatchId), "perfect" );
  EXPECT_STREQ( match::match_to_label(match::kExtraMatchId),   "extra" );
  EXPECT_STREQ( match::match_to_label((match::matchId_t)42),   "<invalid>" );
}
