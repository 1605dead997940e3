//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMidi.h"

namespace pt {
  namespace midi {

    typedef struct statusDesc_str
    {
      uint8_t     status;
      uint8_t     byteCnt;
      const char* label;
    } statusDesc_t;

    statusDesc_t _statusDescArray[] =
    {
     // channel messages
     { kNoteOffMdId,  2, "nof" },
     { kNoteOnMdId,   2, "non" },
     { kPolyPresMdId, 2, "ppr" },
     { kCtlMdId,      2, "ctl" },
     { kPgmMdId,      1, "pgm" },
     { kChPresMdId,   1, "cpr" },
     { kPbendMdId,    2, "pb"  },

     { kSysExMdId, kInvalidMidiByte,"sex" },

     // system common
     { kSysComMtcMdId,    1, "mtc" },
     { kSysComSppMdId,    2, "spp" },
     { kSysComSelMdId,    1, "sel" },
     { kSysComUndef0MdId, 0, "cu0" },
     { kSysComUndef1MdId, 0, "cu1" },
     { kSysComTuneMdId,   0, "tun" },
     { kSysComEoxMdId,    0, "eox" },

     // system real-time
     { kSysRtClockMdId, 0, "clk" },
     { kSysRtUndef0MdId,0, "ud0" },
     { kSysRtStartMdId, 0, "beg" },
     { kSysRtContMdId,  0, "cnt" },
     { kSysRtStopMdId,  0, "end" },
     { kSysRtUndef1MdId,0, "ud1" },
     { kSysRtSenseMdId, 0, "sns" },
     { kSysRtResetMdId, 0, "rst" },

     { kInvalidStatusMdId,  kInvalidMidiByte, "ERR" }
    };

    const statusDesc_t* _statusToDesc( uint8_t status )
    {
      unsigned i;

      // remove the channel value from ch msg status bytes
      if( isChStatus(status) )
        status &= 0xf0;

      for(i=0; _statusDescArray[i].status != kInvalidStatusMdId; ++i)
        if( _statusDescArray[i].status == status )
          break;

      return _statusDescArray + i;
    }
  }
}

const char* pt::midi::statusToLabel( uint8_t status )
{
  if( !isStatus(status) )
    return nullptr;

  return _statusToDesc(status)->label;
}

uint8_t pt::midi::statusToByteCount( uint8_t status )
{
  if( !isStatus(status) )
    return kInvalidMidiByte;

  return _statusToDesc(status)->byteCnt;
}

unsigned pt::midi::to14Bits( uint8_t d0, uint8_t d1 )
{
  unsigned val = d0;
  val <<= 7;
  val += d1;
  return val;
}

void pt::midi::split14Bits( unsigned v, uint8_t& d0Ref, uint8_t& d1Ref )
{
  d0Ref = (v & 0x3f80) >> 7;
  d1Ref = v & 0x7f;
}

int pt::midi::toPbend(  uint8_t d0, uint8_t d1 )
{
  int v = to14Bits(d0,d1);
  return v - 8192;
}

const char* pt::midi::midiToSciPitch( uint8_t pitch, char* label, unsigned labelCharCnt )
{
  static char buf[ kMidiSciPitchCharCnt ];

  if( label == nullptr || labelCharCnt == 0 )
  {
    label = buf;
    labelCharCnt = kMidiSciPitchCharCnt;
  }

  if( labelCharCnt < kMidiSciPitchCharCnt || pitch > 127 )
  {
    label[0] = 0;
    return label;
  }

  char     noteV[]      =  { 'C', 'C', 'D', 'D', 'E', 'F', 'F', 'G', 'G', 'A', 'A', 'B' };
  char     shrpV[]      =  { ' ', '#', ' ', '#', ' ', ' ', '#', ' ', '#', ' ', '#', ' ' };
  int      octave       =  (pitch / 12)-1;
  unsigned noteIdx      =  pitch % 12;
  unsigned idx          =  1;

  label[0] = noteV[ noteIdx ];

  if( shrpV[ noteIdx ] != ' ' )
  {
    label[1] = shrpV[ noteIdx ];
    idx      = 2;
  }

  snprintf(label+idx,labelCharCnt-idx,"%i",octave);

  return label;
}


uint8_t pt::midi::sciPitchToMidiPitch( char pitch, int acc, int octave )
{
  int idx = -1;

  switch(tolower((unsigned char)pitch))
  {
    case 'a': idx = 9;  break;
    case 'b': idx = 11; break;
    case 'c': idx = 0;  break;
    case 'd': idx = 2;  break;
    case 'e': idx = 4;  break;
    case 'f': idx = 5;  break;
    case 'g': idx = 7;  break;
    default:
      return kInvalidMidiPitch;
  }

  int rv =  (octave*12) + idx + acc + 12;

  if( 0 <= rv && rv <= 127 )
    return rv;

  return kInvalidMidiPitch;
}

uint8_t pt::midi::sciPitchToMidi( const char* sciPitchStr )
{
  const char* cp      = sciPitchStr;
  int         acc     = 0;

  if( sciPitchStr==nullptr || strlen(sciPitchStr) < 2 || strlen(sciPitchStr) > 5 )
    return kInvalidMidiPitch;

  // skip over leading letter
  ++cp;

  switch( *cp )
  {
    case '#': acc =  1; ++cp; break;
    case 'b': acc = -1; ++cp; break;
  }

  if( isdigit((unsigned char)*cp) == false && *cp!='-' )
    return kInvalidMidiPitch;

  return sciPitchToMidiPitch( *sciPitchStr, acc, atoi(cp) );
}
