//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptMidi.h"
#include "ptMidiDecls.h"
#include "ptScore.h"
#include "ptMatcher.h"
#include "ptScorer.h"

namespace pt
{
  namespace scorer
  {
    typedef struct grade_str
    {
      double      minAccuracy;
      const char* label;
    } grade_t;

    grade_t _gradeA[] =
    {
     { 0.95, "S" },
     { 0.90, "A" },
     { 0.80, "B" },
     { 0.70, "C" },
     { 0.60, "D" },
     { 0.00, nullptr }
    };
  }
}

int pt::scorer::note_points( match::matchId_t id, double errSecs )
{
  int points = 0;

  switch( id )
  {
    case match::kPerfectMatchId: return kPerfectPoints;
    case match::kMissedMatchId:  return kMissedPoints;
    case match::kExtraMatchId:   return kExtraPoints;
    case match::kGoodMatchId:    points = kGoodPoints;  break;
    case match::kEarlyMatchId:   points = kEarlyPoints; break;
    case match::kLateMatchId:    points = kLatePoints;  break;
    default:
      return 0;
  }

  // truncate toward zero
  points = (int)(points - fabs(errSecs) * 100.0);

  return std::max(0,points);
}

const char* pt::scorer::grade( double accuracy )
{
  unsigned i = 0;
  for(; _gradeA[i].label != nullptr; ++i)
    if( accuracy >= _gradeA[i].minAccuracy )
      return _gradeA[i].label;

  return "F";
}

pt::rc_t pt::scorer::calc_metrics( const match::result_t* resultA, unsigned resultN, unsigned totalN, metrics_t& m )
{
  double   errSum = 0;
  unsigned errN   = 0;

  memset(&m,0,sizeof(m));
  m.totalN = totalN;

  if( resultA == nullptr && resultN > 0 )
    return ptLogError(kInvalidArgRC,"The result list is null.");

  for(unsigned i=0; i<resultN; ++i)
  {
    const match::result_t* r = resultA + i;

    switch( r->id )
    {
      case match::kPerfectMatchId: m.perfectN += 1; break;
      case match::kGoodMatchId:    m.goodN    += 1; break;
      case match::kEarlyMatchId:   m.earlyN   += 1; break;
      case match::kLateMatchId:    m.lateN    += 1; break;
      case match::kExtraMatchId:   m.extraN   += 1; break;

      case match::kMissedMatchId:
        // missed notes are derived from the expected note count below
        continue;

      default:
        return ptLogError(kInvalidArgRC,"Result %i has an invalid match id (%i).",i,r->id);
    }

    if( r->errSecs != 0 )
    {
      errSum += fabs(r->errSecs);
      errN   += 1;
    }

    m.points += note_points(r->id,r->errSecs);
  }

  unsigned matchN = m.perfectN + m.goodN + m.earlyN + m.lateN;

  // an expectation may be matched more than once
  m.missedN    = totalN > matchN ? totalN - matchN : 0;
  m.points    += (long long)m.missedN * kMissedPoints;
  m.points    += (long long)m.extraN  * kExtraPoints;
  m.points     = std::max(0LL,m.points);
  m.accuracy   = totalN > 0 ? (double)(m.perfectN + m.goodN) / totalN : 0.0;
  m.precision  = matchN > 0 ? (double)(m.perfectN + m.goodN) / matchN : 0.0;
  m.avgErrMs   = errN   > 0 ? 1000.0 * errSum / errN : 0.0;
  m.grade      = grade(m.accuracy);

  return kOkRC;
}

pt::rc_t pt::scorer::calc_metrics( match::handle_t matchH, metrics_t& mRef )
{
  unsigned resultN = match::result_count(matchH);

  if( resultN == 0 )
    return calc_metrics(nullptr,0,match::note_exp_count(matchH),mRef);

  return calc_metrics(match::result(matchH,0),resultN,match::note_exp_count(matchH),mRef);
}

void pt::scorer::report( const metrics_t& m )
{
  ptLogPrint("=== Performance Report ===\n");
  ptLogPrint("Grade: %s\n",m.grade);
  ptLogPrint("Score: %lli\n",m.points);
  ptLogPrint("Accuracy: %.1f%%\n",m.accuracy*100.0);
  ptLogPrint("Precision: %.1f%%\n",m.precision*100.0);
  ptLogPrint("\n");
  ptLogPrint("Notes:\n");
  ptLogPrint("  Perfect:  %i\n",m.perfectN);
  ptLogPrint("  Good:     %i\n",m.goodN);
  ptLogPrint("  Early:    %i\n",m.earlyN);
  ptLogPrint("  Late:     %i\n",m.lateN);
  ptLogPrint("  Missed:   %i\n",m.missedN);
  ptLogPrint("  Extra:    %i\n",m.extraN);
  ptLogPrint("\n");
  ptLogPrint("Average Timing Error: %.1fms\n",m.avgErrMs);
}
