//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptText.h"
#include "ptTime.h"
#include "ptThread.h"
#include "ptObject.h"
#include "ptMidi.h"
#include "ptMidiDecls.h"
#include "ptMidiDecoder.h"
#include "ptMidiAlsa.h"
#include "ptScore.h"
#include "ptMusicXml.h"
#include "ptGroup.h"
#include "ptSession.h"
#include "ptMatcher.h"
#include "ptScorer.h"

// Consumer side state shared by the 'perform' and 'replay' modes.
typedef struct app_str
{
  pt::session::handle_t       sessH;
  pt::match::handle_t         matchH;
  pt::midi::decoder::handle_t decH;
  double                      matchOffsetSecs;  // stream time of score time 0
  bool                        tickOnEventFl;    // advance the session clock to the time of each event
  pt::rc_t                    rc;               // first error returned by the matcher
} app_t;

// Replay producer state.
typedef struct replay_evt_str
{
  double   secs;
  uint8_t  byteA[3];
  unsigned byteN;
} replay_evt_t;

typedef struct replay_str
{
  pt::midi::decoder::handle_t decH;
  pt::time::spec_t            t0;
  const replay_evt_t*         evtA;
  unsigned                    evtN;
  unsigned                    evtIdx;
} replay_t;

void _on_midi_event( void* cbArg, const pt::midi::event_t* e )
{
  app_t* app = static_cast<app_t*>(cbArg);

  if( app->tickOnEventFl )
    pt::session::tick(app->sessH,e->secs);

  pt::session::on_event(app->sessH,e);

  if( app->matchH.isValid() )
  {
    pt::rc_t rc;
    if((rc = pt::match::on_event(app->matchH,e,app->matchOffsetSecs)) != pt::kOkRC && app->rc == pt::kOkRC )
      app->rc = rc;
  }
}

bool _replay_thread_func( void* arg )
{
  replay_t* r = static_cast<replay_t*>(arg);

  if( r->evtIdx >= r->evtN )
    return false;

  const replay_evt_t* e  = r->evtA + r->evtIdx++;
  pt::time::spec_t    ts = r->t0;

  pt::time::advanceSecs(ts,e->secs);
  pt::midi::decoder::parse(r->decH,ts,e->byteA,e->byteN);

  return true;
}

pt::rc_t _parse_log_cfg( const pt::object_t* cfg, pt::log::log_args_t& log_args )
{
  pt::rc_t            rc         = pt::kOkRC;
  const pt::object_t* log_cfg    = nullptr;
  const char*         levelLabel = nullptr;
  bool                dateTimeFl = ptIsFlag(log_args.flags,pt::log::kDateTimeFl);
  bool                appendFl   = true;

  if((rc = cfg->getv_opt("log",log_cfg)) != pt::kOkRC || log_cfg == nullptr )
    return rc;

  if((rc = log_cfg->readv("level",     pt::kOptFl, levelLabel,
                          "date_time", pt::kOptFl, dateTimeFl,
                          "append",    pt::kOptFl, appendFl,
                          "file",      pt::kOptFl, log_args.log_fname)) != pt::kOkRC )
  {
    return ptLogError(rc,"The 'log' configuration parse failed.");
  }

  if( levelLabel != nullptr && (log_args.level = pt::log::levelFromString(levelLabel)) == pt::log::kInvalid_LogLevel )
    return ptLogError(pt::kInvalidArgRC,"The log level '%s' is not valid.",levelLabel);

  log_args.flags = ptEnaFlag(log_args.flags,pt::log::kDateTimeFl,dateTimeFl);
  log_args.flags = ptEnaFlag(log_args.flags,pt::log::kFileOutFl,log_args.log_fname != nullptr);
  log_args.flags = ptEnaFlag(log_args.flags,pt::log::kOverwriteFileFl,!appendFl);

  return rc;
}

pt::rc_t _parse_session_cfg( const pt::object_t* cfg, pt::session::args_t& sessArgs )
{
  pt::rc_t            rc;
  const pt::object_t* sess_cfg = nullptr;

  pt::session::init_default_args(sessArgs);

  if((rc = cfg->getv_opt("session",sess_cfg)) != pt::kOkRC )
    return rc;

  return pt::session::parse_args(sess_cfg,sessArgs);
}

pt::rc_t scoreReport( const pt::object_t* cfg, const pt::object_t* args, int argc, const char* argv[] )
{
  pt::rc_t            rc       = pt::kOkRC;
  const char*         fname    = nullptr;
  bool                groupFl  = true;
  pt::score::handle_t scoreH;
  pt::group::handle_t groupH;
  const pt::score::note_t** noteA = nullptr;
  unsigned            noteN    = 0;
  pt::session::args_t sessArgs;

  if((rc = _parse_session_cfg(cfg,sessArgs)) != pt::kOkRC )
    goto errLabel;

  if((rc = args->readv("score_fname", 0,           fname,
                       "groups",      pt::kOptFl, groupFl)) != pt::kOkRC )
  {
    rc = ptLogError(rc,"The 'score_report' arguments parse failed.");
    goto errLabel;
  }

  if((rc = pt::musicxml::parse_file(scoreH,fname,sessArgs.dfltBpm)) != pt::kOkRC )
    goto errLabel;

  pt::score::report(scoreH);

  if( groupFl )
  {
    noteN = pt::score::note_count(scoreH);
    noteA = pt::mem::allocZ<const pt::score::note_t*>(noteN);
    for(unsigned i=0; i<noteN; ++i)
      noteA[i] = pt::score::note(scoreH,i);

    if((rc = pt::group::create(groupH,noteA,noteN)) != pt::kOkRC )
      goto errLabel;

    ptLogPrint("groups:%i required pitches:%i\n",pt::group::count(groupH),pt::group::pitch_count(groupH));
    pt::group::report(groupH);
  }

errLabel:
  pt::mem::release(noteA);
  pt::group::destroy(groupH);
  pt::score::destroy(scoreH);
  return rc;
}

pt::rc_t _final_report( app_t& app, double scoreSecs )
{
  pt::rc_t              rc = pt::kOkRC;
  pt::scorer::metrics_t m;

  pt::session::report(app.sessH);

  if( app.matchH.isValid() )
  {
    ptLogPrint("missed notes at %.3f: %i\n",scoreSecs,pt::match::missed(app.matchH,scoreSecs));

    if((rc = pt::scorer::calc_metrics(app.matchH,m)) == pt::kOkRC )
      pt::scorer::report(m);
  }

  return rc;
}

pt::rc_t perform( const pt::object_t* cfg, const pt::object_t* args, int argc, const char* argv[] )
{
  pt::rc_t                 rc        = pt::kOkRC;
  const char*              fname     = nullptr;
  const char*              devLabel  = nullptr;
  double                   durSecs   = 0;  // 0 = until the session is complete
  unsigned                 tickMs    = 10;
  bool                     matchFl   = true;
  double                   secs      = 0;
  pt::score::handle_t      scoreH;
  pt::midi::device::handle_t devH;
  pt::session::args_t      sessArgs;
  app_t                    app       = {};

  if((rc = _parse_session_cfg(cfg,sessArgs)) != pt::kOkRC )
    goto errLabel;

  if((rc = args->readv("score_fname",   0,          fname,
                       "device",        pt::kOptFl, devLabel,
                       "duration_secs", pt::kOptFl, durSecs,
                       "tick_ms",       pt::kOptFl, tickMs,
                       "match",         pt::kOptFl, matchFl)) != pt::kOkRC )
  {
    rc = ptLogError(rc,"The 'perform' arguments parse failed.");
    goto errLabel;
  }

  if( tickMs == 0 )
  {
    rc = ptLogError(pt::kInvalidArgRC,"The 'tick_ms' argument must be greater than zero.");
    goto errLabel;
  }

  if((rc = pt::musicxml::parse_file(scoreH,fname,sessArgs.dfltBpm)) != pt::kOkRC )
    goto errLabel;

  if((rc = pt::session::create(app.sessH,sessArgs)) != pt::kOkRC )
    goto errLabel;

  if( matchFl )
    if((rc = pt::match::create(app.matchH,scoreH,sessArgs.earlyTolSecs,sessArgs.lateTolSecs)) != pt::kOkRC )
      goto errLabel;

  if((rc = pt::midi::decoder::create(app.decH,_on_midi_event,&app)) != pt::kOkRC )
    goto errLabel;

  if((rc = pt::midi::device::create(devH,app.decH,"pt_cli",devLabel)) != pt::kOkRC )
  {
    rc = ptLogError(rc,"The MIDI input device could not be opened. The session was not started.");
    goto errLabel;
  }

  pt::midi::device::report(devH);

  secs                = pt::midi::decoder::stream_secs(app.decH,pt::time::current_time());
  app.matchOffsetSecs = secs + sessArgs.countdownSecs;

  if((rc = pt::session::load(app.sessH,scoreH,secs)) != pt::kOkRC )
    goto errLabel;

  ptLogInfo("Playing '%s'. Begin in %.1f seconds.",pt::score::title(scoreH),sessArgs.countdownSecs);

  while( app.rc == pt::kOkRC )
  {
    pt::midi::decoder::dispatch(app.decH);

    secs = pt::midi::decoder::stream_secs(app.decH,pt::time::current_time());

    if((rc = pt::session::tick(app.sessH,secs)) != pt::kOkRC )
      goto errLabel;

    if( pt::session::state(app.sessH) == pt::session::kCompleteStateId )
      break;

    if( durSecs > 0 && secs - app.matchOffsetSecs > durSecs )
      break;

    pt::sleepMs(tickMs);
  }

  if((rc = pt::midi::device::destroy(devH)) != pt::kOkRC )
    goto errLabel;

  // deliver any events which arrived after the last tick
  pt::midi::decoder::dispatch(app.decH);

  if( app.rc != pt::kOkRC )
    rc = app.rc;
  else
    rc = _final_report(app, secs - app.matchOffsetSecs);

errLabel:
  if( pt::midi::device::destroy(devH) != pt::kOkRC )
    ptLogError(pt::kOpFailRC,"The MIDI device did not shutdown cleanly.");

  pt::midi::decoder::destroy(app.decH);
  pt::match::destroy(app.matchH);
  pt::session::destroy(app.sessH);
  pt::score::destroy(scoreH);
  return rc;
}

pt::rc_t _parse_replay_events( const pt::object_t* evtL, replay_evt_t*& evtARef, unsigned& evtNRef )
{
  pt::rc_t rc   = pt::kOkRC;
  unsigned evtN = evtL->child_count();
  replay_evt_t* evtA = pt::mem::allocZ<replay_evt_t>(evtN);

  for(unsigned i=0; i<evtN; ++i)
  {
    const pt::object_t* byteL = nullptr;

    if((rc = evtL->child_ele(i)->readv("secs", 0,             evtA[i].secs,
                                       "msg",  pt::kListTId, byteL)) != pt::kOkRC )
    {
      rc = ptLogError(rc,"Replay event %i parse failed.",i);
      goto errLabel;
    }

    if( evtA[i].secs < 0 || byteL->child_count() == 0 || byteL->child_count() > 3 )
    {
      rc = ptLogError(pt::kInvalidArgRC,"Replay event %i must have a non-negative time and 1 to 3 message bytes.",i);
      goto errLabel;
    }

    for(unsigned j=0; j<byteL->child_count(); ++j)
    {
      unsigned b = 0;
      if((rc = byteL->child_ele(j)->value(b)) != pt::kOkRC || b > 0xff )
      {
        rc = ptLogError(pt::kInvalidArgRC,"Replay event %i byte %i is not a valid byte value.",i,j);
        goto errLabel;
      }

      evtA[i].byteA[j] = (uint8_t)b;
    }

    evtA[i].byteN = byteL->child_count();
  }

errLabel:
  if( rc != pt::kOkRC )
    pt::mem::release(evtA);

  evtARef = evtA;
  evtNRef = rc == pt::kOkRC ? evtN : 0;
  return rc;
}

// Feed a recorded message list through the decoder on a producer thread and
// evaluate the result without a MIDI device.
pt::rc_t replay( const pt::object_t* cfg, const pt::object_t* args, int argc, const char* argv[] )
{
  pt::rc_t              rc       = pt::kOkRC;
  const char*           fname    = nullptr;
  const pt::object_t*   evtL     = nullptr;
  double                tailSecs = 1.0;
  replay_evt_t*         evtA     = nullptr;
  unsigned              evtN     = 0;
  double                endSecs  = 0;
  pt::score::handle_t   scoreH;
  pt::thread::handle_t  thH;
  pt::session::args_t   sessArgs;
  replay_t              r        = {};
  app_t                 app      = {};

  if((rc = _parse_session_cfg(cfg,sessArgs)) != pt::kOkRC )
    goto errLabel;

  if((rc = args->readv("score_fname", 0,             fname,
                       "tail_secs",   pt::kOptFl,    tailSecs,
                       "events",      pt::kListTId,  evtL)) != pt::kOkRC )
  {
    rc = ptLogError(rc,"The 'replay' arguments parse failed.");
    goto errLabel;
  }

  if((rc = _parse_replay_events(evtL,evtA,evtN)) != pt::kOkRC )
    goto errLabel;

  if((rc = pt::musicxml::parse_file(scoreH,fname,sessArgs.dfltBpm)) != pt::kOkRC )
    goto errLabel;

  if((rc = pt::session::create(app.sessH,sessArgs)) != pt::kOkRC )
    goto errLabel;

  if((rc = pt::match::create(app.matchH,scoreH,sessArgs.earlyTolSecs,sessArgs.lateTolSecs)) != pt::kOkRC )
    goto errLabel;

  if((rc = pt::midi::decoder::create(app.decH,_on_midi_event,&app)) != pt::kOkRC )
    goto errLabel;

  // the recorded times are relative to the load time
  app.matchOffsetSecs = sessArgs.countdownSecs;
  app.tickOnEventFl   = true;

  if((rc = pt::session::load(app.sessH,scoreH,0)) != pt::kOkRC )
    goto errLabel;

  r.decH = app.decH;
  r.evtA = evtA;
  r.evtN = evtN;

  // reset() restarts the decoder's stream clock, so the replay origin is sampled after it
  pt::midi::decoder::reset(app.decH);
  pt::time::get(r.t0);

  if((rc = pt::thread::create(thH,_replay_thread_func,&r,"pt_replay")) != pt::kOkRC )
    goto errLabel;

  // the producer may finish before a waiting unpause() could observe the running state
  if((rc = pt::thread::pause(thH,0)) != pt::kOkRC )
    goto errLabel;

  // drain the queue until the producer has exited and the queue is empty
  while( pt::thread::state(thH) != pt::thread::kExitedThId )
  {
    pt::midi::decoder::dispatch(app.decH);
    pt::sleepMs(1);
  }

  pt::midi::decoder::dispatch(app.decH);

  if( app.rc != pt::kOkRC )
  {
    rc = app.rc;
    goto errLabel;
  }

  // let the clock run past the end of the score to resolve any remaining groups
  endSecs = app.matchOffsetSecs + pt::score::total_secs(scoreH) + tailSecs;
  if( evtN > 0 )
    endSecs = std::max(endSecs, evtA[evtN-1].secs + tailSecs);

  if((rc = pt::session::tick(app.sessH,endSecs)) != pt::kOkRC )
    goto errLabel;

  ptLogInfo("Replayed %i messages. decoded:%i ignored:%i errors:%i",evtN,
            pt::midi::decoder::event_count(app.decH),
            pt::midi::decoder::ignore_count(app.decH),
            pt::midi::decoder::error_count(app.decH));

  pt::match::report(app.matchH);

  rc = _final_report(app, endSecs - app.matchOffsetSecs);

errLabel:
  if( pt::thread::destroy(thH) != pt::kOkRC )
    ptLogError(pt::kOpFailRC,"The replay thread did not shutdown cleanly.");

  pt::midi::decoder::destroy(app.decH);
  pt::match::destroy(app.matchH);
  pt::session::destroy(app.sessH);
  pt::score::destroy(scoreH);
  pt::mem::release(evtA);
  return rc;
}

pt::rc_t midiDeviceReport( const pt::object_t* cfg, const pt::object_t* args, int argc, const char* argv[] )
{
  pt::rc_t                    rc       = pt::kOkRC;
  const char*                 devLabel = nullptr;
  pt::midi::decoder::handle_t decH;
  pt::midi::device::handle_t  devH;
  app_t                       app      = {};

  if((rc = args->readv("device", pt::kOptFl, devLabel)) != pt::kOkRC )
    goto errLabel;

  pt::report_dependency_versions();

  if((rc = pt::midi::decoder::create(decH,_on_midi_event,&app)) != pt::kOkRC )
    goto errLabel;

  if((rc = pt::midi::device::create(devH,decH,"pt_cli",devLabel)) != pt::kOkRC )
    goto errLabel;

  pt::midi::device::report(devH);

errLabel:
  if( pt::midi::device::destroy(devH) != pt::kOkRC )
    ptLogError(pt::kOpFailRC,"The MIDI device did not shutdown cleanly.");

  pt::midi::decoder::destroy(decH);
  return rc;
}

int main( int argc, const char* argv[] )
{
  pt::rc_t      rc    = pt::kOkRC;
  pt::object_t* cfg   = nullptr;
  const char*   cfgFn = nullptr;
  const char*   mode  = nullptr;
  pt::log::log_args_t log_args;

  typedef struct func_str
  {
    const char* label;
    pt::rc_t (*func)(const pt::object_t* cfg, const pt::object_t* args, int argc, const char* argv[] );
  } func_t;

  // function dispatch list
  func_t modeArray[] =
  {
   { "score_report", scoreReport },
   { "perform",      perform },
   { "replay",       replay },
   { "midi_devices", midiDeviceReport },
   { nullptr, nullptr }
  };

  // read the command line
  cfgFn = argc > 1 ? argv[1] : nullptr;
  mode  = argc > 2 ? argv[2] : nullptr;

  pt::log::init_minimum_args( log_args );
  log_args.level = pt::log::kInfo_LogLevel;
  pt::log::createGlobal(log_args);

  if( argc < 3 )
  {
    ptLogInfo("pt_cli <config_filename> <mode>");
    goto errLabel;
  }

  if( pt::textLength(cfgFn) == 0 )
  {
    rc = ptLogError(pt::kInvalidArgRC,"The configuration file name is empty.");
    goto errLabel;
  }

  if( pt::textLength(mode) == 0 )
  {
    rc = ptLogError(pt::kInvalidArgRC,"The mode selector label is empty.");
    goto errLabel;
  }

  if((rc = objectFromFile( cfgFn, cfg )) != pt::kOkRC )
  {
    rc = ptLogError(rc,"The main configuration file parse failed.");
    goto errLabel;
  }
  else
  {
    const pt::object_t* mode_cfg;
    const pt::object_t* args;
    int  i = 0;

    // restart the log with the configured settings
    if((rc = _parse_log_cfg(cfg,log_args)) != pt::kOkRC )
      goto errLabel;

    pt::log::destroyGlobal();
    if((rc = pt::log::createGlobal(log_args)) != pt::kOkRC )
      goto errLabel;

    // get the dict. of mode cfg. records
    if((rc = cfg->getv("modes", mode_cfg)) != pt::kOkRC )
    {
      rc = ptLogError(rc,"The 'modes' dictionary was not found.");
      goto errLabel;
    }

    // get the requested cfg. record
    if((rc = mode_cfg->getv(mode, args)) != pt::kOkRC )
    {
      rc = ptLogError(rc,"The requested mode configuration record: '%s' was not found.",ptStringNullGuard(mode));
      goto errLabel;
    }

    // locate the requested function and call it
    for(i=0; modeArray[i].label!=nullptr; ++i)
      if( pt::textIsEqual(modeArray[i].label,mode) )
      {
        rc = modeArray[i].func( cfg, args, argc-2, argv + 2 );
        break;
      }

    // if the requested function was not found
    if( modeArray[i].label == nullptr )
      rc = ptLogError(pt::kInvalidArgRC,"The mode selector: '%s' is not valid.", ptStringNullGuard(mode));
  }

 errLabel:
  if( cfg != nullptr )
      cfg->free();

  pt::log::destroyGlobal();

  return (int)rc;
}
