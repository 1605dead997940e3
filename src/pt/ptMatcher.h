//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptMatcher_h
#define ptMatcher_h

// Classify played notes against the time stamped notes of a score.
// All times are in seconds relative to the start of the score.

namespace pt
{
  namespace match
  {
    typedef handle<struct matcher_str> handle_t;

    const double kSearchWindowSecs = 0.5;  // played notes are matched to expectations within +/- this time
    const double kDefaultTolSecs   = 0.1;

    typedef enum
    {
     kPerfectMatchId,
     kGoodMatchId,
     kEarlyMatchId,
     kLateMatchId,
     kMissedMatchId,
     kExtraMatchId,   // no expectation with the same pitch was found in the search window
     kInvalidMatchId
    } matchId_t;

    typedef struct exp_str
    {
      unsigned index;         // index of this record in the expectation list
      uint8_t  pitch;         // 0 for rests
      double   secs;          // expected onset time
      double   durSecs;       // expected duration
      double   earlyTolSecs;  // allowed early and late onset error (0 for rests)
      double   lateTolSecs;
      bool     restFl;
    } exp_t;

    typedef struct result_str
    {
      matchId_t id;
      unsigned  expIdx;    // matched expectation or kInvalidIdx if id is kExtraMatchId
      double    errSecs;   // played time minus expected time (0 if id is kExtraMatchId)
      uint8_t   pitch;
      uint8_t   vel;
      double    secs;      // played time
    } result_t;

    const char* match_to_label( matchId_t id );

    // Classify a signed timing error against the tolerances of 'e'.
    matchId_t   classify( const exp_t& e, double errSecs );

    // Build an expectation for every note and rest in 'scoreH'.
    rc_t create( handle_t& hRef, score::handle_t scoreH, double earlyTolSecs=kDefaultTolSecs, double lateTolSecs=kDefaultTolSecs );
    rc_t destroy( handle_t& hRef );

    unsigned     exp_count( handle_t h );
    unsigned     note_exp_count( handle_t h );  // count of expectations which are not rests
    const exp_t* expectation( handle_t h, unsigned expIdx );

    // Fill 'expIdxA[]' with the index of each expectation with begSecs <= secs <= endSecs.
    // Returns the count of expectations in the window, which may be greater than 'expIdxN'.
    unsigned     window( handle_t h, double begSecs, double endSecs, unsigned* expIdxA, unsigned expIdxN );

    // Match a played note and append the result to the result list.
    rc_t on_note_on(  handle_t h, uint8_t pitch, uint8_t vel, double secs, result_t* resultRef=nullptr );
    void on_note_off( handle_t h, uint8_t pitch, double secs );

    // 'offsetSecs' is subtracted from the event time to align it with the score.
    rc_t on_event(    handle_t h, const midi::event_t* e, double offsetSecs=0 );

    // Count of notes which have been played but not released.
    unsigned active_note_count( handle_t h );

    // Expectations whose late tolerance has elapsed at 'secs' and which have no matching result.
    // Fills 'expIdxA[]' and returns the count of missed expectations, which may be greater than 'expIdxN'.
    unsigned missed( handle_t h, double secs, unsigned* expIdxA=nullptr, unsigned expIdxN=0 );

    unsigned        result_count( handle_t h );
    const result_t* result( handle_t h, unsigned resultIdx );

    // Clear the results and the active notes.
    void reset( handle_t h );

    void report( handle_t h );
  }
}

#endif
