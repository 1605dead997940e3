//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptGroup_h
#define ptGroup_h

// Partition a list of notes into simultaneity groups (single notes or chords).

namespace pt
{
  namespace group
  {
    typedef handle<struct group_list_str> handle_t;

    // Notes whose start beats are within this distance of the first note of a group are members of the group.
    const double kBeatEpsilon = 1e-4;

    // Performance state of one member note.
    typedef struct eval_str
    {
      const score::note_t* note;
      uint8_t              midiPitch;
      double               begBeat;
      double               endBeat;   // begBeat + duration in beats
      bool                 hitFl;     // the note was played
      bool                 breakFl;   // the note was released before it's end beat
    } eval_t;

    typedef struct group_str
    {
      unsigned       index;
      double         beat;    // start beat of the group
      eval_t*        evalA;   // one record per member note
      unsigned       evalN;
      const uint8_t* pitchA;  // distinct MIDI pitches required to satisfy the group
      unsigned       pitchN;
    } group_t;

    // 'noteA[]' need not be sorted. Rests are ignored.
    // The notes must remain valid for the lifetime of the group list.
    rc_t create( handle_t& hRef, const score::note_t* const* noteA, unsigned noteN );
    rc_t destroy( handle_t& hRef );

    unsigned       count( handle_t h );
    group_t*       group( handle_t h, unsigned groupIdx );

    // Total count of required pitches over all groups.
    unsigned       pitch_count( handle_t h );

    // Clear the hit and break flags of all evaluation records.
    void           clear_evals( handle_t h );

    bool           has_pitch( const group_t* g, uint8_t midiPitch );

    void           report( handle_t h );
  }
}

#endif
