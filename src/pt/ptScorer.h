//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptScorer_h
#define ptScorer_h

// Aggregate match results into a point total and a letter grade.

namespace pt
{
  namespace scorer
  {
    enum
    {
     kPerfectPoints =  100,
     kGoodPoints    =   75,
     kEarlyPoints   =   50,
     kLatePoints    =   50,
     kMissedPoints  =  -50,
     kExtraPoints   =  -25
    };

    typedef struct metrics_str
    {
      unsigned    totalN;      // count of expected notes
      unsigned    perfectN;
      unsigned    goodN;
      unsigned    earlyN;
      unsigned    lateN;
      unsigned    missedN;     // totalN - (perfectN + goodN + earlyN + lateN)
      unsigned    extraN;
      double      accuracy;    // (perfectN + goodN) / totalN
      double      precision;   // (perfectN + goodN) / (perfectN + goodN + earlyN + lateN)
      double      avgErrMs;    // mean absolute timing error of the matched notes
      long long   points;
      const char* grade;       // "S","A","B","C","D","F"
    } metrics_t;

    // Points for a single result. Good, early and late results lose 100 points per second of timing error.
    int         note_points( match::matchId_t id, double errSecs );

    // Letter grade for an accuracy in the range 0.0 to 1.0.
    const char* grade( double accuracy );

    rc_t        calc_metrics( const match::result_t* resultA, unsigned resultN, unsigned totalN, metrics_t& mRef );

    // Score the results of 'matchH' against the notes (not rests) of its score.
    rc_t        calc_metrics( match::handle_t matchH, metrics_t& mRef );

    void        report( const metrics_t& m );
  }
}

#endif
