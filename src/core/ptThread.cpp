//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptThread.h"

#include <pthread.h>
#include <new>

namespace pt
{

  namespace thread
  {
    enum
    {
     kDoExitThFl  = 0x01,
     kDoPauseThFl = 0x02,
     kDoRunThFl   = 0x04
    };

    typedef struct thread_str
    {
      pthread_t pThreadH;

      std::atomic<stateId_t> stateId;
      std::atomic<unsigned>  doFlags;

      cbFunc_t  func;
      void*     funcArg;
      char*     label;
      unsigned  stateMicros;
      unsigned  pauseMicros;
      unsigned  sleepMicros;
      pthread_attr_t attr;

    } thread_t;

    inline thread_t* _handleToPtr(handle_t h) { return handleToPtr<handle_t,thread_t>(h); }

    // Called from client thread to wait for the internal thread to transition to a specified state.
    rc_t _waitForState( thread_t* p, stateId_t stateId )
    {
      unsigned waitTimeMicroSecs = 0;
      stateId_t curStateId;

      do
      {
        curStateId = p->stateId.load(std::memory_order_acquire);

        if(curStateId == stateId )
          break;

        sleepUs( p->sleepMicros );

        waitTimeMicroSecs += p->sleepMicros;

      }while( waitTimeMicroSecs < p->stateMicros );

      return curStateId==stateId ? kOkRC :  kTimeOutRC;
    }

    void _threadCleanUpCallback(void* p)
    {
      ((thread_t*)p)->stateId.store(kExitedThId,std::memory_order_release);
    }


    void* _threadCallback(void* param)
    {
      thread_t* p = (thread_t*)param;

      // set a clean up handler - this will be called when the
      // thread terminates unexpectedly or pthread_cleanup_pop() is called.
      pthread_cleanup_push(_threadCleanUpCallback,p);

      unsigned curDoFlags = 0;

      do
      {
        // get the current thread state (running or paused)
        stateId_t curStateId = p->stateId.load(std::memory_order_relaxed);

        if( curStateId == kPausedThId )
        {
          sleepUs( p->pauseMicros );

          curDoFlags = p->doFlags.load(std::memory_order_acquire);

          // check if we have been requested to leave the pause state
          if( ptIsFlag(curDoFlags,kDoRunThFl) )
          {
            p->stateId.store(kRunningThId,std::memory_order_release);
          }
        }
        else // ... we are in running state
        {
          // call the user-defined function
          if( p->func(p->funcArg)==false )
            break;

          curDoFlags = p->doFlags.load(std::memory_order_acquire);

          // check if we have been requested to enter the pause state
          if( ptIsFlag(curDoFlags,kDoPauseThFl) )
          {
            p->stateId.store(kPausedThId,std::memory_order_release);
          }
        }

      }while( ptIsFlag(curDoFlags,kDoExitThFl) == false );

      pthread_cleanup_pop(1);

      return p;
    }
  }
}


pt::rc_t pt::thread::create( handle_t& hRef, cbFunc_t func, void* funcArg, const char* label, int stateMicros, int pauseMicros )
{
  rc_t rc;
  int  sysRC;

  if((rc = destroy(hRef)) != kOkRC )
    return rc;

  thread_t* p = new (mem::allocZ<thread_t>()) thread_t();

  p->func        = func;
  p->funcArg     = funcArg;
  p->label       = mem::allocStr(label==nullptr ? "pt_thread" : label);
  p->stateMicros = stateMicros;
  p->pauseMicros = pauseMicros;
  p->stateId     = kPausedThId;
  p->doFlags     = 0;
  p->sleepMicros = std::min(15000,stateMicros);

  if((sysRC = pthread_attr_init(&p->attr)) != 0)
  {
    rc = ptLogSysError(kOpFailRC,sysRC,"Thread attribute init failed.");
    goto errLabel;
  }

  if((sysRC = pthread_create(&p->pThreadH, &p->attr, _threadCallback, (void*)p )) != 0 )
  {
    pthread_attr_destroy(&p->attr);
    rc = ptLogSysError(kOpFailRC,sysRC,"Thread create failed.");
    goto errLabel;
  }

  // pthread names are limited to 15 characters
  if( strlen(p->label) < 16 )
    pthread_setname_np(p->pThreadH,p->label);

  hRef.set(p);

errLabel:
  if( rc != kOkRC )
  {
    mem::release(p->label);
    p->~thread_t();
    mem::release(p);
  }

  return rc;
}

pt::rc_t pt::thread::destroy( handle_t& hRef )
{
  rc_t rc = kOkRC;
  int sysRC;

  if( !hRef.isValid() )
    return rc;

  thread_t* p  = _handleToPtr(hRef);

  // tell the thread to exit
  p->doFlags.store(kDoExitThFl,std::memory_order_release);

  // wait for the thread to exit and then deallocate the thread object
  if((rc = _waitForState(p,kExitedThId)) != kOkRC )
    return  ptLogError(rc,"Thread '%s' timed out waiting for destroy.",p->label);

  // Block until the thread is actually fully cleaned up
  if((sysRC = pthread_join(p->pThreadH,NULL)) != 0)
    rc = ptLogSysError(kOpFailRC,sysRC,"Thread join failed.");

  pthread_attr_destroy(&p->attr);

  mem::release(p->label);
  p->~thread_t();
  mem::release(p);
  hRef.clear();

  return rc;
}


pt::rc_t pt::thread::pause( handle_t h, unsigned cmdFlags )
{
  rc_t      rc         = kOkRC;
  bool      pauseFl    = ptIsFlag(cmdFlags,kPauseFl);
  bool      waitFl     = ptIsFlag(cmdFlags,kWaitFl);
  thread_t* p          = _handleToPtr(h);
  stateId_t curStateId = p->stateId.load(std::memory_order_acquire);
  bool      isPausedFl = curStateId == kPausedThId;
  stateId_t waitId;

  if( isPausedFl == pauseFl )
    return kOkRC;

  if( pauseFl )
  {
    p->doFlags.store(kDoPauseThFl,std::memory_order_release);
    waitId = kPausedThId;
  }
  else
  {
    p->doFlags.store(kDoRunThFl,std::memory_order_release);
    waitId = kRunningThId;
  }

  if( waitFl )
    rc = _waitForState(p,waitId);

  if( rc != kOkRC )
    ptLogError(rc,"Thread '%s' timed out waiting for '%s'. pauseMicros:%i stateMicros:%i sleepMicros:%i", p->label, pauseFl ? "pause" : "un-pause",p->pauseMicros,p->stateMicros,p->sleepMicros);

  return rc;

}

pt::rc_t pt::thread::unpause( handle_t h )
{  return pause( h, kWaitFl);  }

pt::thread::stateId_t pt::thread::state( handle_t h )
{
  thread_t* p = _handleToPtr(h);
  return p->stateId.load(std::memory_order_acquire);
}

const char* pt::thread::label( handle_t h )
{
  thread_t* p = _handleToPtr(h);
  return p->label;
}
