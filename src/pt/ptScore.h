//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptScore_h
#define ptScore_h

// Notated score model.
// A score is built once (by the notation parser) using the append_???() functions,
// sealed by finalize(), and is read-only from then on.

namespace pt
{
  namespace score
  {
    typedef handle<struct score_str> handle_t;

    //
    // Pitch
    //

    typedef enum
    {
     kC_StepId,
     kD_StepId,
     kE_StepId,
     kF_StepId,
     kG_StepId,
     kA_StepId,
     kB_StepId,
     kInvalidStepId
    } stepId_t;

    typedef struct pitch_str
    {
      stepId_t step;
      int      octave;
      int      alter;  // -2 to +2 (flats/sharps)
    } pitch_t;

    pitch_t     make_pitch( stepId_t step, int octave, int alter=0 );

    // MIDI pitch: (octave+1)*12 + semitone(step) + alter clamped to 0-127. C4 = 60.
    uint8_t     pitch_to_midi( const pitch_t& p );

    // Inverse of pitch_to_midi(). Black keys are always spelled with a sharp.
    pitch_t     midi_to_pitch( uint8_t midiPitch );

    bool        is_equal( const pitch_t& p0, const pitch_t& p1 );

    // Format as "C4", "F#3", "Bb2". buf[] should hold at least 8 characters.
    const char* pitch_to_string( const pitch_t& p, char* buf, unsigned bufCharN );

    // 'c' may be upper or lower case. Returns kInvalidStepId if 'c' is not a note letter.
    stepId_t    char_to_step( char c );
    char        step_to_char( stepId_t step );

    //
    // Duration
    //

    typedef enum
    {
     kWholeDurId,
     kHalfDurId,
     kQuarterDurId,
     kEighthDurId,
     kSixteenthDurId,
     kThirtySecondDurId,
     kInvalidDurId
    } durTypeId_t;

    typedef struct duration_str
    {
      durTypeId_t typeId;
      unsigned    dotCnt;
      unsigned    tuplet;   // tuplet divisor (1=none, 3=triplet)
    } duration_t;

    duration_t  make_duration( durTypeId_t typeId, unsigned dotCnt=0, unsigned tuplet=1 );

    // Length in quarter note beats: base * (1 + 0.5 + 0.25 ...) / tuplet
    double      duration_beats( const duration_t& d );
    double      duration_beats( durTypeId_t typeId, unsigned dotCnt=0, unsigned tuplet=1 );

    // Accepts "whole","half","quarter","eighth","16th","sixteenth","32nd","thirty-second".
    // Case is ignored and leading and trailing white space is trimmed.
    // Returns kInvalidDurId if the label is not recognized.
    durTypeId_t duration_type_from_label( const char* label );
    const char* duration_type_to_label( durTypeId_t typeId );

    //
    // Score elements
    //

    enum
    {
     kUnsetStaffIdx = 0,
     kUpperStaffIdx = 1,  // treble or right hand
     kLowerStaffIdx = 2   // bass or left hand
    };

    typedef struct note_str
    {
      pitch_t    pitch;     // not valid if restFl is set
      uint8_t    midiPitch; // pitch_to_midi(pitch) or 0 for rests
      duration_t dur;
      bool       restFl;
      bool       chordFl;   // this note shares the onset of the previous note
      unsigned   durDivs;   // notated duration in divisions or 0 if not given
      unsigned   voice;     // notated voice or 0 if not given
      double     measBeat;  // start beat relative to the start of the measure
      double     beat;      // start beat relative to the start of the score
      double     secs;      // start time in seconds
      unsigned   measNumb;  // measure number
      unsigned   staffIdx;  // kUnsetStaffIdx, kUpperStaffIdx or kLowerStaffIdx
      unsigned   partIdx;   // index of the staff_t record which owns this note
    } note_t;

    typedef struct measure_str
    {
      unsigned number;
      double   secs;      // start time in seconds
      double   beat;      // start beat relative to the start of the score
      unsigned tsNumer;   // time signature
      unsigned tsDenom;
      double   durBeats;  // duration in beats
      note_t*  noteA;     // notes and rests in document order
      unsigned noteN;
      unsigned noteAllocN;
    } measure_t;

    typedef struct staff_str
    {
      unsigned    index;   // 1-based
      const char* clef;    // "treble","bass","alto","tenor","percussion"
      measure_t*  measA;
      unsigned    measN;
      unsigned    measAllocN;
    } staff_t;

    //
    // Build interface
    //

    rc_t create( handle_t& hRef, const char* title, const char* composer, double bpm, unsigned divisions );
    rc_t destroy( handle_t& hRef );

    // Returns the index of the new staff.
    unsigned append_staff( handle_t h );
    rc_t     set_clef( handle_t h, unsigned staffIdx, const char* clefLabel );

    // Append a measure to staff 'staffIdx'.
    rc_t     append_measure( handle_t h, unsigned staffIdx, unsigned number, double secs, double beat, unsigned tsNumer, unsigned tsDenom );
    rc_t     set_measure_duration( handle_t h, unsigned staffIdx, double durBeats );

    // Append a note to the last measure of staff 'staffIdx'.
    rc_t     append_note( handle_t h, unsigned staffIdx, const note_t& note );

    // Build the note index. The score may not be changed after this call.
    rc_t     finalize( handle_t h );

    //
    // Query interface
    //

    const char*    title(     handle_t h );
    const char*    composer(  handle_t h );
    double         bpm(       handle_t h );
    unsigned       divisions( handle_t h );

    unsigned       staff_count( handle_t h );
    const staff_t* staff( handle_t h, unsigned staffIdx );

    enum { kIncludeRestsFl = 0x01 };

    // All notes of all staves in order of their start beat.
    // Notes with the same start beat are kept in staff/document order.
    unsigned       note_count( handle_t h, unsigned flags=0 );
    const note_t*  note( handle_t h, unsigned noteIdx, unsigned flags=0 );

    // Latest measure end time over all staves.
    double         total_secs( handle_t h );
    double         total_beats( handle_t h );

    void           report( handle_t h );
  }
}

#endif
