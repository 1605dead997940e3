//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include <gtest/gtest.h>

#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptScore.h"
#include "ptGroup.h"

#include <vector>

using namespace pt;

class GroupTest : public testing::Test
{
protected:
  virtual void TearDown() override
  {
    EXPECT_EQ( group::destroy(_h), kOkRC );
  }

  void _add( uint8_t midiPitch, double beat, score::durTypeId_t durTypeId=score::kQuarterDurId, bool restFl=false )
  {
    score::note_t n;
    memset(&n,0,sizeof(n));
    n.pitch     = score::midi_to_pitch(midiPitch);
    n.midiPitch = restFl ? 0 : midiPitch;
    n.dur       = score::make_duration(durTypeId);
    n.restFl    = restFl;
    n.beat      = beat;
    _noteV.push_back(n);
  }

  rc_t _create()
  {
    std::vector<const score::note_t*> v;
    for(const score::note_t& n : _noteV)
      v.push_back(&n);
    return group::create(_h,v.data(),v.size());
  }

  group::handle_t            _h;
  std::vector<score::note_t> _noteV;
};

TEST_F(GroupTest, NearlySimultaneousNotesFormOneGroup)
{
  _add(60,2.0);
  _add(64,2.00005);
  _add(67,2.1);

  ASSERT_EQ( _create(), kOkRC );
  ASSERT_EQ( group::count(_h), 2u );

  const group::group_t* g = group::group(_h,0);
  EXPECT_DOUBLE_EQ( g->beat, 2.0 );
  EXPECT_EQ( g->evalN,  2u );
  EXPECT_EQ( g->pitchN, 2u );
  EXPECT_TRUE( group::has_pitch(g,60) );
  EXPECT_TRUE( group::has_pitch(g,64) );
  EXPECT_FALSE( group::has_pitch(g,67) );

  g = group::group(_h,1);
  EXPECT_EQ( g->index, 1u );
  EXPECT_DOUBLE_EQ( g->beat, 2.1 );
  EXPECT_EQ( g->evalN, 1u );

  EXPECT_EQ( group::group(_h,2), nullptr );
}

TEST_F(GroupTest, GroupsAreOrderedByBeat)
{
  _add(72,3.0);
  _add(48,0.0,score::kWholeDurId);
  _add(60,1.0);
  _add(55,0.0,score::kHalfDurId);

  ASSERT_EQ( _create(), kOkRC );
  ASSERT_EQ( group::count(_h), 3u );

  const group::group_t* g = group::group(_h,0);
  ASSERT_EQ( g->evalN, 2u );

  // simultaneous notes keep their input order
  EXPECT_EQ( g->evalA[0].midiPitch, 48 );
  EXPECT_EQ( g->evalA[1].midiPitch, 55 );
  EXPECT_DOUBLE_EQ( g->evalA[0].endBeat, 4.0 );
  EXPECT_DOUBLE_EQ( g->evalA[1].endBeat, 2.0 );

  EXPECT_DOUBLE_EQ( group::group(_h,1)->beat, 1.0 );
  EXPECT_DOUBLE_EQ( group::group(_h,2)->beat, 3.0 );
  EXPECT_EQ( group::pitch_count(_h), 4u );
}

TEST_F(GroupTest, DuplicatePitchIsRequiredOnce)
{
  _add(60,0.0);
  _add(60,0.0,score::kHalfDurId);
  _add(64,0.0);

  ASSERT_EQ( _create(), kOkRC );
  ASSERT_EQ( group::count(_h), 1u );

  const group::group_t* g = group::group(_h,0);
  EXPECT_EQ( g->evalN,  3u );
  EXPECT_EQ( g->pitchN, 2u );
  EXPECT_EQ( group::pitch_count(_h), 2u );
}

TEST_F(GroupTest, RestsAreIgnored)
{
  _add(0,0.0,score::kQuarterDurId,true);
  _add(62,1.0);
  _add(0,1.0,score::kQuarterDurId,true);

  ASSERT_EQ( _create(), kOkRC );
  ASSERT_EQ( group::count(_h), 1u );
  EXPECT_EQ( group::group(_h,0)->evalN, 1u );
  EXPECT_DOUBLE_EQ( group::group(_h,0)->beat, 1.0 );
}

TEST_F(GroupTest, EmptyAndInvalidInput)
{
  EXPECT_EQ( group::create(_h,nullptr,0), kOkRC );
  EXPECT_EQ( group::count(_h), 0u );
  EXPECT_EQ( group::pitch_count(_h), 0u );

  EXPECT_EQ( group::create(_h,nullptr,3), kInvalidArgRC );
  EXPECT_FALSE( _h.isValid() );
}

TEST_F(GroupTest, ClearEvals)
{
  _add(60,0.0);
  _add(64,0.0);
  ASSERT_EQ( _create(), kOkRC );

  group::group_t* g = group::group(_h,0);
  g->evalA[0].hitFl   = true;
  g->evalA[1].breakFl = true;

  group::clear_evals(_h);

  EXPECT_FALSE( g->evalA[0].hitFl );
  EXPECT_FALSE( g->evalA[1].breakFl );
}
