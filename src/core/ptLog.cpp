//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"

#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptTime.h"
#include "ptText.h"
#include "ptFile.h"

#include <strings.h>  // strcasecmp()

namespace pt
{
  namespace log
  {
    typedef struct log_str
    {
      logOutputCbFunc_t outCbFunc;
      void*             outCbArg;
      logFormatCbFunc_t fmtCbFunc;
      void*             fmtCbArg;
      logLevelId_t      level;
      unsigned          flags;
      file::handle_t    fileH;
    } log_t;


    handle_t __logGlobalHandle__;

    idLabelPair_t logLevelLabelArray[] =
    {
     { kPrint_LogLevel,   "" },
     { kDebug_LogLevel,   "debug" },
     { kInfo_LogLevel,    "info" },
     { kWarning_LogLevel, "warn" },
     { kError_LogLevel,   "error" },
     { kFatal_LogLevel,   "fatal" },
     { kInvalid_LogLevel, "<invalid>" }
    };

    log_t* _handleToPtr( handle_t h ) { return handleToPtr<handle_t,log_t>(h); }

    // Tee the formatted text to the log file before passing it to the client output.
    void _fileOutput( void* arg, logLevelId_t level, const char* text )
    {
      log_t* p = static_cast<log_t*>(arg);

      if( p->fileH.isValid() )
        file::write(p->fileH, text, textLength(text) );

      if( ptIsFlag(p->flags,kConsoleOutFl) )
        p->outCbFunc(p->outCbArg,level,text);
    }
  }
}


void pt::log::init_minimum_args( log_args_t& args )
{
  memset(&args,0,sizeof(args));
  args.level = kDebug_LogLevel;
  args.flags = kConsoleOutFl;
}

pt::rc_t pt::log::create(  handle_t& hRef, const log_args_t& args )
{
  rc_t rc;
  if((rc = destroy(hRef)) != kOkRC)
    return rc;

  log_t* p = mem::allocZ<log_t>();
  p->outCbFunc = args.outCbFunc == nullptr ? defaultOutput : args.outCbFunc;
  p->outCbArg  = args.outCbArg;
  p->fmtCbFunc = args.fmtCbFunc == nullptr ? defaultFormatter : args.fmtCbFunc;
  p->fmtCbArg  = args.fmtCbArg;
  p->level     = args.level;
  p->flags     = args.flags;

  if( ptIsFlag(args.flags,kFileOutFl) )
  {
    unsigned fileFlags = ptIsFlag(args.flags,kOverwriteFileFl) ? file::kWriteFl : file::kAppendFl;

    if( textLength(args.log_fname) == 0 )
    {
      rc = kInvalidArgRC;
      fprintf(stderr,"A log file name must be given when file output is enabled.\n");
      goto errLabel;
    }

    if((rc = file::open(p->fileH,args.log_fname,fileFlags)) != kOkRC )
    {
      fprintf(stderr,"The log file '%s' could not be opened.\n",args.log_fname);
      goto errLabel;
    }
  }

  hRef.set(p);

errLabel:
  if( rc != kOkRC )
    mem::release(p);

  return rc;
}

pt::rc_t pt::log::destroy( handle_t& hRef )
{
  rc_t rc = kOkRC;

  if( !hRef.isValid() )
    return rc;

  log_t* p = _handleToPtr(hRef);

  if( p->fileH.isValid() )
    rc = file::close(p->fileH);

  mem::release( p );
  hRef.clear();
  return rc;
}

pt::rc_t pt::log::msg( handle_t h, logLevelId_t level, const char* function, const char* filename, unsigned line, int systemErrorCode, rc_t rc, const char* fmt, va_list vl )
{
  va_list     vl1;
  va_copy(vl1,vl);

  int n = vsnprintf(nullptr,0,fmt,vl);

  if( n != -1 )
  {
    char msg[n+1]; // add 1 to allow space for the terminating zero
    vsnprintf(msg,n+1,fmt,vl1);

    // messages sent before the global log exists go directly to the console
    if( !h.isValid() )
      defaultFormatter( nullptr, defaultOutput, nullptr, 0, level, function, filename, line, systemErrorCode, rc, msg );
    else
    {
      log_t* p = _handleToPtr(h);

      if( p->fileH.isValid() )
        p->fmtCbFunc( p->fmtCbArg, _fileOutput, p, p->flags, level, function, filename, line, systemErrorCode, rc, msg );
      else
        if( ptIsFlag(p->flags,kConsoleOutFl) )
          p->fmtCbFunc( p->fmtCbArg, p->outCbFunc, p->outCbArg, p->flags, level, function, filename, line, systemErrorCode, rc, msg );
    }
  }

  va_end(vl1);
  return rc;
}

pt::rc_t pt::log::msg( handle_t h, logLevelId_t level, const char* function, const char* filename, unsigned line, int systemErrorCode, rc_t returnCode, const char* fmt, ... )
{
  rc_t rc = returnCode;
  if( !h.isValid() || level >= _handleToPtr(h)->level || level == kPrint_LogLevel )
  {
    va_list vl;
    va_start(vl,fmt);
    rc = msg( h, level, function, filename, line, systemErrorCode, returnCode, fmt, vl );
    va_end(vl);
  }
  return rc;
}

void     pt::log::setLevel( handle_t h, logLevelId_t level )
{
  log_t* p = _handleToPtr(h);
  p->level = level;
}

pt::log::logLevelId_t pt::log::level( handle_t h )
{
  log_t* p = _handleToPtr(h);
  return p->level;
}

pt::log::logLevelId_t pt::log::levelFromString( const char* label )
{
  if( label == nullptr )
    return kInvalid_LogLevel;

  for(unsigned i=0; logLevelLabelArray[i].id != kInvalid_LogLevel; ++i)
    if( strcasecmp(label,logLevelLabelArray[i].label) == 0 )
      return (logLevelId_t)logLevelLabelArray[i].id;

  return kInvalid_LogLevel;
}

const char* pt::log::levelToString( logLevelId_t level )
{  return idToLabelNull(logLevelLabelArray,level,kInvalid_LogLevel); }


void  pt::log::defaultOutput( void* arg, logLevelId_t level, const char* text )
{
  FILE* f = level >= kWarning_LogLevel ? stderr : stdout;
  fprintf(f,"%s",text);
  fflush(f);
}

void pt::log::defaultFormatter( void* cbArg, logOutputCbFunc_t outFunc, void* outCbArg, unsigned flags, logLevelId_t level, const char* function, const char* filename, unsigned lineno, int sys_errno, rc_t rc, const char* msg )
{
  const char* systemLabel = sys_errno==0 ? "" : "System Error: ";
  const char* systemMsg   = sys_errno==0 ? "" : strerror(sys_errno);
  const char* levelStr    = idToLabel(logLevelLabelArray,level,kInvalid_LogLevel);

  const char* rcFmt = "rc:%i";
  int rcn = snprintf(nullptr,0,rcFmt,rc);
  char rcs[rcn+1];
  snprintf(rcs,rcn+1,rcFmt,rc);
  const char* rcStr = rcs;

  const char* syFmt = "%s (%i) %s";
  int syn = snprintf(nullptr,0,syFmt,systemLabel,sys_errno,systemMsg);
  char sys[syn+1];
  snprintf(sys,syn+1,syFmt,systemLabel,sys_errno,systemMsg);
  const char* syStr = sys_errno==0 ? "" : sys;

  const char* loFmt = "%s line:%i %s";
  int  lon = snprintf(nullptr,0,loFmt,function,lineno,filename);
  char los[lon+1];
  snprintf(los,lon+1,loFmt,function,lineno,filename);
  const char* loStr = los;

  const int tdn = 64;
  char td[tdn];
  td[0] = 0;
  if( ptIsFlag(flags,kDateTimeFl) )
    time::formatDateTime( td, (unsigned)tdn );

  // don't print the function,file,line when this is an 'info' msg.
  if( level == kInfo_LogLevel || level == kPrint_LogLevel )
  {
    loStr = "";
    syStr = "";
  }

  // dont' print the rc msg if this is info or debug
  if( level < kWarning_LogLevel )
    rcStr = "";

  if( level == kPrint_LogLevel )
  {
    const char* fmt = "%s%s%s";
    const char* sep = td[0]==0 ? "" : ": ";
    int  n = snprintf(nullptr,0,fmt,td,sep,msg);
    char s[n+1];
    snprintf(s,n+1,fmt,td,sep,msg);
    outFunc(outCbArg,level,s);
  }
  else
  {
    // levelStr, date/time, msg, sys_msg, rc, function, lineno, filename
    const char* fmt = "%s: %s%s%s %s %s %s\n";
    const char* sep = td[0]==0 ? "" : ": ";

    int  n = snprintf(nullptr,0,fmt,levelStr,td,sep,msg,syStr,rcStr,loStr);
    char s[n+1];
    snprintf(s,n+1,fmt,levelStr,td,sep,msg,syStr,rcStr,loStr);
    outFunc(outCbArg,level,s);
  }

}


pt::rc_t pt::log::createGlobal( const log_args_t& args )
{
  handle_t h;
  rc_t rc;

  if((rc = create(h, args )) == kOkRC )
    __logGlobalHandle__ = h;

  return rc;
}

pt::rc_t pt::log::createGlobal( logLevelId_t level )
{
  log_args_t args;
  init_minimum_args(args);
  args.level = level;
  return createGlobal(args);
}

pt::rc_t pt::log::destroyGlobal()
{
  return destroy(__logGlobalHandle__);
}


pt::log::handle_t pt::log::globalHandle()
{
  return __logGlobalHandle__;
}
