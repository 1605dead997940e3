//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptSession_h
#define ptSession_h

// Performance session state machine.
//
//   Idle -> Countdown -> Awaiting -> Complete
//
// All functions take the current time in seconds. The caller must use one time base
// for both ticks and input events (e.g. midi::decoder::stream_secs()).
// The session does not read a clock and never blocks.

namespace pt
{
  namespace session
  {
    typedef handle<struct session_str> handle_t;

    typedef enum
    {
     kIdleStateId,       // no score is loaded
     kCountdownStateId,  // waiting for the countdown to elapse
     kAwaitingStateId,   // waiting for the current group to be played
     kCompleteStateId    // all groups have been resolved
    } stateId_t;

    typedef enum
    {
     kPracticeModeId,    // the clock waits at each group until it is played
     kTempoModeId,       // the clock follows wall-clock time
     kInvalidModeId
    } modeId_t;

    enum
    {
     kRightHandFl = 0x01,  // staff 1
     kLeftHandFl  = 0x02,  // staff 2
     kBothHandsFl = kRightHandFl | kLeftHandFl
    };

    typedef struct args_str
    {
      modeId_t mode;
      unsigned handFlags;
      double   chordWindowSecs;     // all notes of a chord must be played within this time
      double   holdMinBeats;        // notes at least this long are checked for early release
      double   holdReleaseTolBeats; // allowed early release of held notes
      double   countdownSecs;
      double   dfltBpm;             // tempo used when the score does not give one
      double   earlyTolSecs;        // allowed early and late timing error
      double   lateTolSecs;
    } args_t;

    typedef struct stats_str
    {
      unsigned hitCnt;            // count of required pitches played (never revoked)
      unsigned mistakeCnt;        // wrong notes, expired chord windows and missed groups
      unsigned missedNoteCnt;     // required pitches which were not played (tempo mode)
      unsigned missedGroupCnt;    // groups passed by the clock without being satisfied (tempo mode)
      unsigned holdBreakCnt;      // held notes released early
      unsigned satisfiedGroupCnt; // groups completed
      unsigned requiredPitchCnt;  // total required pitches in the performance
    } stats_t;

    void     init_default_args( args_t& argsRef );

    // Read optional session fields from 'cfg' over 'argsRef'.
    // { mode:"practice"|"tempo", right_hand:true, left_hand:true, chord_window_secs:0.25,
    //   hold_min_beats:1, hold_release_tol_beats:0.1, countdown_secs:3, default_bpm:120,
    //   early_tol_secs:0.1, late_tol_secs:0.1 }
    rc_t     parse_args( const object_t* cfg, args_t& argsRef );

    modeId_t    mode_from_label( const char* label );
    const char* mode_to_label( modeId_t modeId );
    const char* state_to_label( stateId_t stateId );

    rc_t create(  handle_t& hRef, const args_t& args );
    rc_t create(  handle_t& hRef, const object_t* cfg );
    rc_t destroy( handle_t& hRef );

    // Replace the current performance with 'scoreH' and begin the countdown.
    // 'scoreH' must remain valid until it is replaced or the session is destroyed.
    // If the load fails the previous performance is left unchanged.
    rc_t load( handle_t h, score::handle_t scoreH, double secs );

    // Restart the current performance from the countdown. Ignored if no score is loaded.
    rc_t reset( handle_t h, double secs );

    // Change the enabled hands. Takes effect on the next load() or reset().
    void set_hands( handle_t h, unsigned handFlags );

    // Advance the clock. Called periodically by the consumer.
    rc_t tick( handle_t h, double secs );

    // Input events. Events are ignored unless the session is in the 'Awaiting' state.
    void on_note_on(  handle_t h, uint8_t midiPitch, double secs );
    void on_note_off( handle_t h, uint8_t midiPitch, double secs );
    void on_event(    handle_t h, const midi::event_t* e );

    stateId_t      state( handle_t h );
    modeId_t       mode( handle_t h );
    double         current_beat( handle_t h );
    double         bpm( handle_t h );

    unsigned              group_count( handle_t h );
    unsigned              group_index( handle_t h );  // index of the current group or group_count() when complete
    const group::group_t* group( handle_t h, unsigned groupIdx );

    // Count of distinct pitches of the current group played in the current attempt.
    unsigned       group_hit_count( handle_t h );

    const stats_t& stats( handle_t h );

    void           report( handle_t h );
  }
}

#endif
