//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include <gtest/gtest.h>

#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptTime.h"
#include "ptThread.h"
#include "ptMidi.h"
#include "ptMidiDecls.h"
#include "ptMidiDecoder.h"

#include <vector>

using namespace pt;

TEST(MidiTest, StatusByteCount)
{
  EXPECT_EQ( midi::statusToByteCount(0x90), 2 );
  EXPECT_EQ( midi::statusToByteCount(0x85), 2 );
  EXPECT_EQ( midi::statusToByteCount(0xc3), 1 );
  EXPECT_EQ( midi::statusToByteCount(0xd0), 1 );
  EXPECT_EQ( midi::statusToByteCount(0xf6), 0 );
  EXPECT_EQ( midi::statusToByteCount(0xf0), midi::kInvalidMidiByte );
  EXPECT_EQ( midi::statusToByteCount(0x40), midi::kInvalidMidiByte );
}

TEST(MidiTest, StatusLabels)
{
  EXPECT_STREQ( midi::statusToLabel(0x93), "non" );
  EXPECT_STREQ( midi::statusToLabel(0xb0), "ctl" );
  EXPECT_STREQ( midi::statusToLabel(0xf8), "clk" );
  EXPECT_EQ(    midi::statusToLabel(0x40), nullptr );
}

TEST(MidiTest, StatusPredicates)
{
  EXPECT_TRUE(  midi::isStatus<uint8_t>(0x80) );
  EXPECT_FALSE( midi::isStatus<uint8_t>(0x7f) );
  EXPECT_TRUE(  midi::isChStatus<uint8_t>(0xef) );
  EXPECT_FALSE( midi::isChStatus<uint8_t>(0xf0) );
  EXPECT_TRUE(  midi::isRealTime<uint8_t>(0xf8) );
  EXPECT_FALSE( midi::isRealTime<uint8_t>(0xf7) );
  EXPECT_TRUE(  midi::isNoteOn<uint8_t>(0x91,64) );
  EXPECT_FALSE( midi::isNoteOn<uint8_t>(0x91,0) );
  EXPECT_TRUE(  midi::isNoteOff<uint8_t>(0x91,0) );
  EXPECT_TRUE(  midi::isNoteOff<uint8_t>(0x81,64) );
}

TEST(MidiTest, SciPitch)
{
  char buf[ midi::kMidiSciPitchCharCnt ];

  EXPECT_STREQ( midi::midiToSciPitch(60,buf,sizeof(buf)), "C4" );
  EXPECT_STREQ( midi::midiToSciPitch(61,buf,sizeof(buf)), "C#4" );
  EXPECT_STREQ( midi::midiToSciPitch(1,buf,sizeof(buf)),  "C#-1" );
  EXPECT_STREQ( midi::midiToSciPitch(128,buf,sizeof(buf)), "" );

  EXPECT_EQ( midi::sciPitchToMidi("C4"),  60 );
  EXPECT_EQ( midi::sciPitchToMidi("a#4"), 70 );
  EXPECT_EQ( midi::sciPitchToMidi("Bb3"), 58 );
  EXPECT_EQ( midi::sciPitchToMidi("C-1"), 0 );
  EXPECT_EQ( midi::sciPitchToMidi("H4"),  midi::kInvalidMidiPitch );
  EXPECT_EQ( midi::sciPitchToMidi("C"),   midi::kInvalidMidiPitch );
  EXPECT_EQ( midi::sciPitchToMidi("\xc3\xa9" "4"), midi::kInvalidMidiPitch );
  EXPECT_EQ( midi::sciPitchToMidi("C\xff"),      midi::kInvalidMidiPitch );
}

TEST(MidiTest, FourteenBits)
{
  uint8_t d0 = 0, d1 = 0;
  midi::split14Bits(0x2345,d0,d1);
  EXPECT_EQ( midi::to14Bits(d0,d1), 0x2345u );
  EXPECT_EQ( midi::toPbend(0x40,0x00), 0 );
  EXPECT_EQ( midi::toPbend(0x00,0x00), -8192 );
  EXPECT_EQ( midi::toPbend(0x7f,0x7f), 8191 );
}

class DecoderTest : public testing::Test
{
protected:
  virtual void SetUp() override
  {
    ASSERT_EQ( midi::decoder::create(_h,_onEvent,this), kOkRC );
    time::get(_ts);
  }

  virtual void TearDown() override
  {
    EXPECT_EQ( midi::decoder::destroy(_h), kOkRC );
  }

  static void _onEvent( void* arg, const midi::event_t* e )
  {
    static_cast<DecoderTest*>(arg)->_evtV.push_back(*e);
  }

  void _parse( std::initializer_list<uint8_t> bytes )
  {
    std::vector<uint8_t> v(bytes);
    midi::decoder::parse(_h,_ts,v.data(),v.size());
  }

  midi::decoder::handle_t     _h;
  time::spec_t                _ts;
  std::vector<midi::event_t>  _evtV;
};

TEST_F(DecoderTest, CallbackIsRequired)
{
  midi::decoder::handle_t h;
  EXPECT_EQ( midi::decoder::create(h,nullptr,nullptr), kInvalidArgRC );
  EXPECT_FALSE( h.isValid() );
}

TEST_F(DecoderTest, NoteOnAndOff)
{
  _parse({ 0x90, 60, 100, 0x80, 60, 64 });

  EXPECT_EQ( midi::decoder::dispatch(_h), 2u );
  ASSERT_EQ( _evtV.size(), 2u );

  EXPECT_EQ( _evtV[0].typeId,       midi::kNoteOnEvtTId );
  EXPECT_EQ( _evtV[0].u.note.pitch, 60 );
  EXPECT_EQ( _evtV[0].u.note.vel,   100 );
  EXPECT_EQ( _evtV[1].typeId,       midi::kNoteOffEvtTId );
  EXPECT_EQ( _evtV[1].u.note.pitch, 60 );
  EXPECT_EQ( midi::decoder::event_count(_h), 2u );
  EXPECT_EQ( midi::decoder::error_count(_h), 0u );
}

TEST_F(DecoderTest, NoteOnWithZeroVelocityIsNoteOff)
{
  _parse({ 0x93, 64, 0 });
  midi::decoder::dispatch(_h);

  ASSERT_EQ( _evtV.size(), 1u );
  EXPECT_EQ( _evtV[0].typeId, midi::kNoteOffEvtTId );
  EXPECT_EQ( _evtV[0].ch, 3 );
}

TEST_F(DecoderTest, RunningStatus)
{
  // one status byte followed by three note-on's, the last with velocity 0
  _parse({ 0x90, 60, 90, 64, 91, 60, 0 });
  midi::decoder::dispatch(_h);

  ASSERT_EQ( _evtV.size(), 3u );
  EXPECT_EQ( _evtV[0].typeId, midi::kNoteOnEvtTId );
  EXPECT_EQ( _evtV[1].typeId, midi::kNoteOnEvtTId );
  EXPECT_EQ( _evtV[1].u.note.pitch, 64 );
  EXPECT_EQ( _evtV[1].u.note.vel,   91 );
  EXPECT_EQ( _evtV[2].typeId, midi::kNoteOffEvtTId );
  EXPECT_EQ( midi::decoder::error_count(_h), 0u );
}

TEST_F(DecoderTest, MessageSplitAcrossBuffers)
{
  _parse({ 0x90 });
  _parse({ 67 });
  EXPECT_EQ( midi::decoder::dispatch(_h), 0u );

  _parse({ 80 });
  EXPECT_EQ( midi::decoder::dispatch(_h), 1u );
  ASSERT_EQ( _evtV.size(), 1u );
  EXPECT_EQ( _evtV[0].u.note.pitch, 67 );
  EXPECT_EQ( _evtV[0].u.note.vel,   80 );
}

TEST_F(DecoderTest, RealTimeBytesAreIgnored)
{
  _parse({ 0xf8, 0x90, 0xfe, 60, 0xf8, 100 });
  midi::decoder::dispatch(_h);

  ASSERT_EQ( _evtV.size(), 1u );
  EXPECT_EQ( _evtV[0].u.note.pitch, 60 );
  EXPECT_EQ( _evtV[0].u.note.vel,   100 );
  EXPECT_EQ( midi::decoder::ignore_count(_h), 3u );
  EXPECT_EQ( midi::decoder::error_count(_h),  0u );
}

TEST_F(DecoderTest, OtherChannelMessages)
{
  _parse({ 0xb0, 64, 127, 0xc1, 5, 0xe2, 0x00, 0x40 });
  midi::decoder::dispatch(_h);

  ASSERT_EQ( _evtV.size(), 3u );
  EXPECT_EQ( _evtV[0].typeId,        midi::kCtlEvtTId );
  EXPECT_EQ( _evtV[0].u.ctl.id,      64 );
  EXPECT_EQ( _evtV[0].u.ctl.value,   127 );
  EXPECT_EQ( _evtV[1].typeId,        midi::kPgmEvtTId );
  EXPECT_EQ( _evtV[1].u.pgm.id,      5 );
  EXPECT_EQ( _evtV[1].ch,            1 );
  EXPECT_EQ( _evtV[2].typeId,        midi::kPbendEvtTId );
  EXPECT_EQ( _evtV[2].u.pbend.value, 0 );
}

TEST_F(DecoderTest, SysExIsSkipped)
{
  _parse({ 0xf0, 0x7e, 0x01, 0x02, 0xf7, 0x90, 62, 70 });
  midi::decoder::dispatch(_h);

  ASSERT_EQ( _evtV.size(), 1u );
  EXPECT_EQ( _evtV[0].u.note.pitch, 62 );
  EXPECT_EQ( midi::decoder::error_count(_h), 0u );
}

TEST_F(DecoderTest, MalformedInputIsCounted)
{
  // data without a status, then a note-on interrupted by a new status byte
  _parse({ 60, 100, 0x90, 60, 0x80, 60, 0 });
  midi::decoder::dispatch(_h);

  ASSERT_EQ( _evtV.size(), 1u );
  EXPECT_EQ( _evtV[0].typeId, midi::kNoteOffEvtTId );
  EXPECT_EQ( midi::decoder::error_count(_h), 3u );
}

TEST_F(DecoderTest, RecreatedDecoderStartsWithZeroCounts)
{
  _parse({ 60, 0xf8, 0x90, 60, 100 });
  EXPECT_EQ( midi::decoder::error_count(_h),  1u );
  EXPECT_EQ( midi::decoder::ignore_count(_h), 1u );
  EXPECT_EQ( midi::decoder::event_count(_h),  1u );

  // create() releases the previous decoder
  ASSERT_EQ( midi::decoder::create(_h,_onEvent,this), kOkRC );
  EXPECT_EQ( midi::decoder::error_count(_h),  0u );
  EXPECT_EQ( midi::decoder::ignore_count(_h), 0u );
  EXPECT_EQ( midi::decoder::event_count(_h),  0u );
  EXPECT_EQ( midi::decoder::dispatch(_h),     0u );

  _parse({ 0x90, 62, 90 });
  EXPECT_EQ( midi::decoder::dispatch(_h), 1u );
  EXPECT_EQ( midi::decoder::event_count(_h), 1u );
}

TEST_F(DecoderTest, Triple)
{
  EXPECT_EQ( midi::decoder::triple(_h,_ts,0x90,72,50), kOkRC );
  EXPECT_EQ( midi::decoder::triple(_h,_ts,0xc0,3,0xff), kOkRC );
  EXPECT_EQ( midi::decoder::triple(_h,_ts,0xf8,0xff,0xff), kOkRC );
  EXPECT_EQ( midi::decoder::triple(_h,_ts,0x90,200,50), kInvalidArgRC );

  midi::decoder::dispatch(_h);
  ASSERT_EQ( _evtV.size(), 2u );
  EXPECT_EQ( _evtV[0].typeId,  midi::kNoteOnEvtTId );
  EXPECT_EQ( _evtV[1].typeId,  midi::kPgmEvtTId );
  EXPECT_EQ( midi::decoder::ignore_count(_h), 1u );
  EXPECT_EQ( midi::decoder::error_count(_h),  1u );
}

TEST_F(DecoderTest, EventTimeIsRelativeToStreamStart)
{
  midi::decoder::reset(_h);

  time::spec_t ts;
  time::get(ts);
  time::advanceMs(ts,1500);

  uint8_t buf[] = { 0x90, 60, 100 };
  midi::decoder::parse(_h,ts,buf,sizeof(buf));
  midi::decoder::dispatch(_h);

  ASSERT_EQ( _evtV.size(), 1u );
  EXPECT_GE( _evtV[0].secs, 1.5 );
  EXPECT_LT( _evtV[0].secs, 2.5 );

  // time stamps before the start of the stream are clamped to 0
  time::spec_t t0;
  time::setZero(t0);
  EXPECT_EQ( midi::decoder::stream_secs(_h,t0), 0.0 );
}

namespace
{
  typedef struct producer_str
  {
    midi::decoder::handle_t h;
    unsigned                i;
    unsigned                n;
  } producer_t;

  bool _producerFunc( void* arg )
  {
    producer_t* p = static_cast<producer_t*>(arg);

    if( p->i >= p->n )
      return false;

    time::spec_t ts;
    time::get(ts);

    uint8_t pitch = p->i % midi::kMidiNoteCnt;
    uint8_t buf[] = { 0x90, pitch, 100 };
    midi::decoder::parse(p->h,ts,buf,sizeof(buf));
    p->i += 1;
    return true;
  }
}

TEST_F(DecoderTest, EventsFromProducerThreadArriveInOrder)
{
  producer_t       prod = { _h, 0, 1000 };
  thread::handle_t thH;

  ASSERT_EQ( thread::create(thH,_producerFunc,&prod,"midi_prod"), kOkRC );
  ASSERT_EQ( thread::pause(thH,0), kOkRC );

  for(unsigned i=0; i<5000 && _evtV.size() < prod.n; ++i)
  {
    midi::decoder::dispatch(_h);
    sleepMs(1);
  }

  EXPECT_EQ( thread::destroy(thH), kOkRC );
  midi::decoder::dispatch(_h);

  ASSERT_EQ( _evtV.size(), prod.n );
  for(unsigned i=0; i<_evtV.size(); ++i)
  {
    EXPECT_EQ( _evtV[i].u.note.pitch, i % midi::kMidiNoteCnt );
    if( i > 0 )
      EXPECT_GE( _evtV[i].secs, _evtV[i-1].secs );
  }
}
