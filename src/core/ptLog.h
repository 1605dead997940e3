//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptLOG_H
#define ptLOG_H

namespace pt
{

  namespace log
  {
    typedef enum
    {
     kInvalid_LogLevel,
     kPrint_LogLevel,
     kDebug_LogLevel,
     kInfo_LogLevel,
     kWarning_LogLevel,
     kError_LogLevel,
     kFatal_LogLevel,
    } logLevelId_t;

    enum
    {
     kDateTimeFl      = 0x01,  // prefix each message with the local date and time
     kFileOutFl       = 0x02,  // copy each message to 'log_fname'
     kOverwriteFileFl = 0x04,  // truncate 'log_fname' on create() (otherwise append)
     kConsoleOutFl    = 0x08,  // send each message to the output callback
    };

    typedef handle<struct log_str> handle_t;

    typedef void (*logOutputCbFunc_t)( void* cbArg, logLevelId_t level, const char* text );
    typedef void (*logFormatCbFunc_t)( void* cbArg, logOutputCbFunc_t outFunc, void* outCbArg, unsigned flags, logLevelId_t level, const char* function, const char* filename, unsigned line, int systemErrorCode, rc_t rc, const char* msg );

    typedef struct log_args_str
    {
      logLevelId_t      level;
      unsigned          flags;
      logOutputCbFunc_t outCbFunc;  // nullptr = defaultOutput()
      void*             outCbArg;
      logFormatCbFunc_t fmtCbFunc;  // nullptr = defaultFormatter()
      void*             fmtCbArg;
      const char*       log_fname;  // required if kFileOutFl is set
    } log_args_t;

    // Console output only, no date/time stamp, level=kDebug_LogLevel.
    void init_minimum_args( log_args_t& args );

    rc_t create(  handle_t& hRef, const log_args_t& args );
    rc_t destroy( handle_t& hRef );

    rc_t msg( handle_t h, logLevelId_t level, const char* function, const char* filename, unsigned line, int systemErrorCode, rc_t rc, const char* fmt, va_list vl );
    rc_t msg( handle_t h, logLevelId_t level, const char* function, const char* filename, unsigned line, int systemErrorCode, rc_t rc, const char* fmt, ... );

    void         setLevel( handle_t h, logLevelId_t level );
    logLevelId_t level( handle_t h );

    // Map a level label ("debug","info","warn","error","fatal") to a level id.
    // Returns kInvalid_LogLevel if 'label' is not recognized.
    logLevelId_t levelFromString( const char* label );
    const char*  levelToString( logLevelId_t level );

    void defaultOutput( void* arg, logLevelId_t level, const char* text );
    void defaultFormatter( void* cbArg, logOutputCbFunc_t outFunc, void* outCbArg, unsigned flags, logLevelId_t level, const char* function, const char* filename, unsigned line, int systemErrorCode, rc_t rc, const char* msg );

    rc_t createGlobal( const log_args_t& args );
    rc_t createGlobal( logLevelId_t level=kDebug_LogLevel );
    rc_t destroyGlobal( );

    handle_t  globalHandle();
  }

}

#define ptLogDebugH( h,rc,fmt,...) pt::log::msg( h, pt::log::kDebug_LogLevel, __FUNCTION__, __FILE__, __LINE__, 0, rc, fmt, ##__VA_ARGS__ )

#define ptLogPrintH( h,fmt,...) pt::log::msg( h, pt::log::kPrint_LogLevel, __FUNCTION__, __FILE__, __LINE__, 0, pt::kOkRC, fmt, ##__VA_ARGS__ )

#define ptLogInfoH( h,fmt,...) pt::log::msg( h, pt::log::kInfo_LogLevel, __FUNCTION__, __FILE__, __LINE__, 0, pt::kOkRC, fmt, ##__VA_ARGS__ )

#define ptLogWarningH( h,rc,fmt,...) pt::log::msg( h, pt::log::kWarning_LogLevel, __FUNCTION__, __FILE__, __LINE__, 0, rc, fmt, ##__VA_ARGS__ )

#define ptLogVErrorH(h,rc,fmt, vl) pt::log::msg( h, pt::log::kError_LogLevel, __FUNCTION__, __FILE__, __LINE__, 0, rc, fmt, vl )
#define ptLogErrorH( h,rc,fmt,...) pt::log::msg( h, pt::log::kError_LogLevel, __FUNCTION__, __FILE__, __LINE__, 0, rc, fmt, ##__VA_ARGS__ )

#define ptLogSysErrorH( h,rc,sysRc,fmt,...) pt::log::msg( h, pt::log::kError_LogLevel, __FUNCTION__, __FILE__, __LINE__, sysRc, rc, fmt, ##__VA_ARGS__ )

#define ptLogFatalH( h,rc,fmt,...) pt::log::msg( h, pt::log::kFatal_LogLevel, __FUNCTION__, __FILE__, __LINE__, 0, rc, fmt, ##__VA_ARGS__ )

#ifdef ptLOG_DEBUG

#define ptLogDebug( fmt,...)      ptLogDebugH(  pt::log::globalHandle(), pt::kOkRC, (fmt), ##__VA_ARGS__ )

#else

#define ptLogDebug( fmt,...)

#endif

#define ptLogPrint( fmt,...)       ptLogPrintH(  pt::log::globalHandle(), (fmt), ##__VA_ARGS__ )

#define ptLogInfo( fmt,...)       ptLogInfoH(  pt::log::globalHandle(), (fmt), ##__VA_ARGS__ )

#define ptLogWarning( fmt,...)    ptLogWarningH(  pt::log::globalHandle(), pt::kOkRC, (fmt), ##__VA_ARGS__ )

#define ptLogSysError( rc,sysRC,fmt,...)   ptLogSysErrorH(  pt::log::globalHandle(), (rc), (sysRC), (fmt), ##__VA_ARGS__ )

#define ptLogVError(rc,fmt, vl)   ptLogVErrorH( pt::log::globalHandle(), (rc), (fmt), (vl) )
#define ptLogError( rc,fmt,...)   ptLogErrorH( pt::log::globalHandle(),  (rc), (fmt), ##__VA_ARGS__ )

#define ptLogFatal( rc,fmt,...)   ptLogFatalH( pt::log::globalHandle(),  (rc), (fmt), ##__VA_ARGS__ )

#endif
