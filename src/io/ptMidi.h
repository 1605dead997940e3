//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptMidi_h
#define ptMidi_h

namespace pt
{
  namespace midi
  {
    enum
    {
     kMidiChCnt           = 16,
     kInvalidMidiByte     = 128,
     kMidiNoteCnt         = kInvalidMidiByte,
     kMidiVelCnt          = kInvalidMidiByte,
     kInvalidMidiPitch    = kInvalidMidiByte,
     kMidiSciPitchCharCnt = 5  // A#-1
    };


    // MIDI status bytes
    enum
    {
     kInvalidStatusMdId = 0x00,
     kNoteOffMdId       = 0x80,
     kNoteOnMdId        = 0x90,
     kPolyPresMdId      = 0xa0,
     kCtlMdId           = 0xb0,
     kPgmMdId           = 0xc0,
     kChPresMdId        = 0xd0,
     kPbendMdId         = 0xe0,
     kSysExMdId         = 0xf0,

     kSysComMtcMdId     = 0xf1,
     kSysComSppMdId     = 0xf2,
     kSysComSelMdId     = 0xf3,
     kSysComUndef0MdId  = 0xf4,
     kSysComUndef1MdId  = 0xf5,
     kSysComTuneMdId    = 0xf6,
     kSysComEoxMdId     = 0xf7,

     kSysRtClockMdId  = 0xf8,
     kSysRtUndef0MdId = 0xf9,
     kSysRtStartMdId  = 0xfa,
     kSysRtContMdId   = 0xfb,
     kSysRtStopMdId   = 0xfc,
     kSysRtUndef1MdId = 0xfd,
     kSysRtSenseMdId  = 0xfe,
     kSysRtResetMdId  = 0xff
    };

    template< typename T> T removeCh(T s) { return (s) & 0xf0; };

    template< typename T> bool isStatus( T s )    { return  kNoteOffMdId <= removeCh(s); }
    template< typename T> bool isChStatus( T s )  { return  (kNoteOffMdId <= removeCh(s) && removeCh(s) <  kSysExMdId); }
    template< typename T> bool isRealTime( T s )  { return  (s) >= kSysRtClockMdId; }

    template< typename T> bool isNoteOn( T s, T d1 )  { return removeCh(s) == kNoteOnMdId && (d1)!=0; }
    template< typename T> bool isNoteOff( T s, T d1 ) { return (removeCh(s) == kNoteOnMdId && (d1)==0) || removeCh(s) == kNoteOffMdId; }

    const char*   statusToLabel( uint8_t status );

    // Return the count of data bytes which follow 'status'.
    // Returns kInvalidMidiByte if status is not a valid status byte or is the start of a sys-ex message.
    uint8_t  statusToByteCount( uint8_t status );

    unsigned      to14Bits( uint8_t d0, uint8_t d1 );
    void          split14Bits( unsigned v, uint8_t& d0Ref, uint8_t& d1Ref );
    int           toPbend(  uint8_t d0, uint8_t d1 );

    // If label is nullptr or labelCharCnt==0 then a pointer to an internal static
    // buffer is returned. If label[] is given the it
    // should have at least 5 (kMidiSciPitchCharCnt) char's (including the terminating zero).
    // If 'pitch' is outside of the range 0-127 then a blank string is returned.
    const char*    midiToSciPitch( uint8_t pitch, char* label=nullptr, unsigned labelCharCnt=0 );

    // Convert a scientific pitch to MIDI pitch.  acc == 1 == sharp, acc == -1 == flat.
    // Return kInvalidMidiPitch if the arguments are not valid.
    uint8_t    sciPitchToMidiPitch( char pitch, int acc, int octave );

    // Scientific pitch string: [A-Ga-g][#b][#] where  # may be -1 to 9.
    // Return kInvalidMidiPitch if sciPitchStr does not contain a valid pitch string.
    uint8_t    sciPitchToMidi( const char* sciPitchStr );

  }
}

#endif
