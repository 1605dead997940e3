//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptThread_H
#define ptThread_H

namespace pt
{
  namespace thread
  {
    const int kDefaultStateTimeOutMicros=100000;
    const int kDefaultPauseMicros =       10000;
    typedef enum
    {
     kNotInitThId,
     kPausedThId,
     kRunningThId,
     kExitedThId
    } stateId_t;

    typedef handle<struct thread_str> handle_t;

    // Return false to indicate that the thread should terminate.
    typedef bool (*cbFunc_t)( void* arg );

    // The thread is in the 'paused' state after it is created.
    // stateTimeOutMicros = total time out duration for switching to the exit state or for switching in/out of pause state.
    // pauseMicros = duration of thread sleep interval when in paused state.
    rc_t create( handle_t& hRef,
                 cbFunc_t func,
                 void* funcArg,
                 const char* label,  // Assign a label which will show up via `top -H` or `ps -T`.
                 int stateTimeOutMicros=kDefaultStateTimeOutMicros,
                 int pauseMicros=kDefaultPauseMicros );

    // Request the thread to exit and join it. If the thread does not exit
    // within the state time out then kTimeOutRC is returned and 'hRef' is left valid.
    rc_t destroy( handle_t& hRef );

    enum { kPauseFl=0x01, kWaitFl=0x02 };
    rc_t pause( handle_t h, unsigned cmdFlags = kWaitFl );
    rc_t unpause( handle_t h ); // same as pause(h,kWaitFl)

    stateId_t state( handle_t h );

    const char* label( handle_t h );
  }
}

#endif
