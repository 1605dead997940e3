//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptTime.h"
#include "ptText.h"
#include "ptThread.h"
#include "ptMidi.h"
#include "ptMidiDecls.h"
#include "ptMidiDecoder.h"
#include "ptMidiAlsa.h"

#include <poll.h>
#include <new>
#include <alsa/asoundlib.h>

namespace pt
{
  namespace midi
  {
    namespace device
    {
      typedef struct
      {
        char*          nameStr;   // string label of this port
        unsigned       alsa_type; // ALSA type flags from snd_seq_port_info_get_type()
        unsigned       alsa_cap;  // ALSA capability flags from snd_seq_port_info_get_capability()
        snd_seq_addr_t alsa_addr; // ALSA client/port address for this port
        bool           subscribeFl;
      } port_t;

      // MIDI devices
      typedef struct
      {
        char*    nameStr;    // string label for this device
        unsigned iPortCnt;   // input ports on this device
        port_t*  iPortArray; //
        int      clientId;   // ALSA client id (all ports on this device use use this client id in their address)
      } dev_t;

      typedef struct device_str
      {
        unsigned          devCnt;           // MIDI devices attached to this computer
        dev_t*            devArray;
        decoder::handle_t decH;             // destination of incoming messages
        snd_seq_t*        h;                // ALSA system sequencer handle
        snd_seq_addr_t    alsa_addr;        // ALSA client/port address representing the application
        int               alsa_queue;       // ALSA device queue
        thread::handle_t  thH;              // MIDI input listening thread
        int               alsa_fdCnt;       // MIDI input driver file descriptor array
        struct pollfd*    alsa_fd;
        unsigned          subscribeCnt;     // count of subscribed input ports
        std::atomic<unsigned> eventCnt;     // count of messages sent to the decoder
        unsigned          errCnt;
        time::spec_t      baseTimeStamp;
      } device_t;

      device_t* _handleToPtr( handle_t h ){ return handleToPtr<handle_t,device_t>(h); }

      rc_t _alsaError(rc_t rc, int alsaRc, const char* fmt, ... )
      {
        va_list vl;
        va_start(vl,fmt);

        if( alsaRc < 0 )
          ptLogError(kOpFailRC,"ALSA Error:%i %s",alsaRc,snd_strerror(alsaRc));

        rc = ptLogVError(rc,fmt,vl);
        va_end(vl);
        return rc;
      }

      dev_t* _clientIdToDev( device_t* p, int clientId )
      {
        for(unsigned i=0; i<p->devCnt; ++i)
          if( p->devArray[i].clientId == clientId )
            return p->devArray + i;

        return nullptr;
      }

      port_t* _portIdToPort( dev_t* dev, int portId )
      {
        for(unsigned i=0; i<dev->iPortCnt; ++i)
          if( dev->iPortArray[i].alsa_addr.port == portId )
            return dev->iPortArray + i;

        return nullptr;
      }

      void _seqEventToDecoder( device_t* p, const snd_seq_event_t* ev )
      {
        uint8_t d0     = 0xff;
        uint8_t d1     = 0xff;
        uint8_t status = 0;

        switch(ev->type)
        {
          case SND_SEQ_EVENT_NOTEON:
            status = kNoteOnMdId;
            d0     = ev->data.note.note;
            d1     = ev->data.note.velocity;
            break;

          case SND_SEQ_EVENT_NOTEOFF:
            status = kNoteOffMdId;
            d0     = ev->data.note.note;
            d1     = ev->data.note.velocity;
            break;

          case SND_SEQ_EVENT_PGMCHANGE:
            status = kPgmMdId;
            d0     = ev->data.control.value;
            break;

          case SND_SEQ_EVENT_CONTROLLER:
            status = kCtlMdId;
            d0     = ev->data.control.param;
            d1     = ev->data.control.value;
            break;

          case SND_SEQ_EVENT_PITCHBEND:
            // wire order: LSB then MSB
            split14Bits(ev->data.control.value + 8192, d1, d0 );
            status = kPbendMdId;
            break;

          default:
            // pressure, system common, real-time and sys-ex events are not forwarded
            return;
        }

        // the event time is relative to the start of the ALSA queue
        time::spec_t ts = p->baseTimeStamp;
        ts.tv_sec  += ev->time.time.tv_sec;
        ts.tv_nsec += ev->time.time.tv_nsec;
        while( ts.tv_nsec >= 1000000000 )
        {
          ts.tv_nsec -= 1000000000;
          ts.tv_sec  += 1;
        }

        if( decoder::triple(p->decH, ts, status | (ev->data.note.channel & 0x0f), d0, d1 ) == kOkRC )
          p->eventCnt += 1;
      }

      rc_t _poll(device_t* p)
      {
        int timeOutMs = 50;

        snd_seq_event_t *ev;

        if (poll(p->alsa_fd, p->alsa_fdCnt, timeOutMs) > 0)
        {
          do
          {
            int arc = snd_seq_event_input(p->h,&ev);

            // no input
            if( arc == -EAGAIN )
              break;

            // input buffer overrun
            if( arc == -ENOSPC )
            {
              p->errCnt += 1;
              ptLogWarning("ALSA MIDI input buffer overrun.");
              break;
            }

            if( arc < 0 )
            {
              p->errCnt += 1;
              break;
            }

            dev_t* dev = _clientIdToDev(p,ev->source.client);

            if( dev == nullptr || _portIdToPort(dev,ev->source.port) == nullptr )
              continue;

            _seqEventToDecoder(p,ev);

          }while( snd_seq_event_input_pending(p->h,0));
        }

        return kOkRC;
      }

      bool _threadCbFunc(void* arg)
      {
        device_t* p = static_cast<device_t*>(arg);
        _poll(p);
        return true;
      }

      bool _isDeviceSelected( const char* devName, const char* devLabel )
      {
        return devLabel == nullptr || textIsBlank(devLabel) || (devName != nullptr && strstr(devName,devLabel) != nullptr);
      }

      rc_t _allocStruct( device_t* p, const char* appNameStr, const char* devLabel )
      {
        rc_t                      rc   = kOkRC;
        snd_seq_client_info_t*    cip  = nullptr;
        snd_seq_port_info_t*      pip  = nullptr;
        snd_seq_port_subscribe_t *subs = nullptr;
        unsigned                  i,j;
        int                       arc;

        // alloc the subscription recd on the stack
        snd_seq_port_subscribe_alloca(&subs);

        if((arc = snd_seq_client_info_malloc(&cip)) < 0 )
        {
          rc = _alsaError(kOpFailRC,arc,"ALSA seq client info allocation failed.");
          goto errLabel;
        }

        if((arc = snd_seq_port_info_malloc(&pip)) < 0 )
        {
          rc = _alsaError(kOpFailRC,arc,"ALSA seq port info allocation failed.");
          goto errLabel;
        }

        if((p->alsa_queue = snd_seq_alloc_queue(p->h)) < 0 )
        {
          rc = _alsaError(kOpFailRC,p->alsa_queue,"ALSA queue allocation failed.");
          goto errLabel;
        }

        // setup the client port
        snd_seq_set_client_name(p->h,appNameStr);
        snd_seq_port_info_set_client(pip, p->alsa_addr.client = snd_seq_client_id(p->h) );
        snd_seq_port_info_set_name(pip,ptStringNullGuard(appNameStr));
        snd_seq_port_info_set_capability(pip,SND_SEQ_PORT_CAP_WRITE | SND_SEQ_PORT_CAP_SUBS_WRITE );
        snd_seq_port_info_set_type(pip, SND_SEQ_PORT_TYPE_SOFTWARE | SND_SEQ_PORT_TYPE_APPLICATION | SND_SEQ_PORT_TYPE_MIDI_GENERIC );
        snd_seq_port_info_set_midi_channels(pip, 16);

        // cfg for real-time time stamping
        snd_seq_port_info_set_timestamping(pip, 1);
        snd_seq_port_info_set_timestamp_real(pip, 1);
        snd_seq_port_info_set_timestamp_queue(pip, p->alsa_queue);

        // create the client port
        if((arc = snd_seq_create_port(p->h,pip)) < 0 )
        {
          rc = _alsaError(kOpFailRC,arc,"ALSA client port creation failed.");
          goto errLabel;
        }

        p->alsa_addr.port = arc;
        p->devCnt         = 0;

        // determine the count of devices
        snd_seq_client_info_set_client(cip, -1);
        while( snd_seq_query_next_client(p->h,cip) == 0)
          p->devCnt += 1;

        p->devArray = mem::allocZ<dev_t>(p->devCnt);

        // fill in each device record
        snd_seq_client_info_set_client(cip, -1);
        for(i=0; i<p->devCnt && snd_seq_query_next_client(p->h,cip)==0; ++i)
        {
          int         client = snd_seq_client_info_get_client(cip);
          const char* name   = snd_seq_client_info_get_name(cip);
          dev_t*      dev    = p->devArray + i;

          dev->nameStr  = mem::duplStr(ptStringNullGuard(name));
          dev->clientId = client;

          snd_seq_port_info_set_client(pip,client);
          snd_seq_port_info_set_port(pip,-1);

          // determine the count of input ports on this device
          while( snd_seq_query_next_port(p->h,pip) == 0 )
            if( ptIsFlag(snd_seq_port_info_get_capability(pip),SND_SEQ_PORT_CAP_READ) )
              dev->iPortCnt += 1;

          if( dev->iPortCnt == 0 )
            continue;

          dev->iPortArray = mem::allocZ<port_t>(dev->iPortCnt);

          snd_seq_port_info_set_client(pip,client);
          snd_seq_port_info_set_port(pip,-1);

          // fill in the port information
          for(j=0; j<dev->iPortCnt && snd_seq_query_next_port(p->h,pip) == 0; )
          {
            const char*    port = snd_seq_port_info_get_name(pip);
            unsigned       caps = snd_seq_port_info_get_capability(pip);
            snd_seq_addr_t addr = *snd_seq_port_info_get_addr(pip);

            if( ptIsNotFlag(caps,SND_SEQ_PORT_CAP_READ) )
              continue;

            port_t* pp    = dev->iPortArray + j++;
            pp->nameStr   = mem::duplStr(ptStringNullGuard(port));
            pp->alsa_type = snd_seq_port_info_get_type(pip);
            pp->alsa_cap  = caps;
            pp->alsa_addr = addr;

            // the system client (0) and this application are never subscribed
            if( client == SND_SEQ_CLIENT_SYSTEM || client == p->alsa_addr.client || ptIsNotFlag(caps,SND_SEQ_PORT_CAP_SUBS_READ) )
              continue;

            if( !_isDeviceSelected(name,devLabel) )
              continue;

            // port->app
            snd_seq_port_subscribe_set_sender(subs, &addr);
            snd_seq_port_subscribe_set_dest(subs, &p->alsa_addr);
            snd_seq_port_subscribe_set_queue(subs, p->alsa_queue);
            snd_seq_port_subscribe_set_time_update(subs, 1);
            snd_seq_port_subscribe_set_time_real(subs, 1);
            if((arc = snd_seq_subscribe_port(p->h, subs)) < 0)
            {
              // a port which cannot be subscribed is reported but does not prevent the others from being used
              _alsaError(kOpFailRC,arc,"Input port to app. subscription failed on port '%s'.",ptStringNullGuard(port));
              continue;
            }

            pp->subscribeFl  = true;
            p->subscribeCnt += 1;
          }
        }

        if( p->subscribeCnt == 0 )
          rc = ptLogError(kResourceNotAvailableRC,"No MIDI input device %s%s%s is available.",devLabel==nullptr?"":"matching '",ptStringNullGuard(devLabel),devLabel==nullptr?"":"'");

      errLabel:
        if( pip != nullptr)
          snd_seq_port_info_free(pip);

        if( cip != nullptr )
          snd_seq_client_info_free(cip);

        return rc;
      }

      rc_t _destroy( device_t* p )
      {
        rc_t rc = kOkRC;
        int  arc;

        // stop the thread first
        if((rc = thread::destroy(p->thH)) != kOkRC )
          return ptLogError(rc,"MIDI input thread destroy failed.");

        if( p->h != nullptr )
        {
          if( p->alsa_queue >= 0 )
          {
            if((arc = snd_seq_stop_queue(p->h,p->alsa_queue, nullptr)) < 0 )
              rc = _alsaError(kOpFailRC,arc,"ALSA queue stop failed.");

            if((arc = snd_seq_free_queue(p->h,p->alsa_queue)) < 0 )
              rc = _alsaError(kOpFailRC,arc,"ALSA queue release failed.");
          }

          if( (arc = snd_seq_close(p->h)) < 0 )
            rc = _alsaError(kCloseFailRC,arc,"ALSA sequencer close failed.");

          p->h = nullptr;
        }

        for(unsigned i=0; i<p->devCnt; ++i)
        {
          for(unsigned j=0; j<p->devArray[i].iPortCnt; ++j)
            mem::release( p->devArray[i].iPortArray[j].nameStr );

          mem::release(p->devArray[i].iPortArray);
          mem::release(p->devArray[i].nameStr);
        }

        mem::release(p->devArray);
        mem::release(p->alsa_fd);
        p->~device_t();
        mem::release(p);

        return rc;
      }

    } // device
  } // midi
} // pt


pt::rc_t pt::midi::device::create( handle_t& hRef, decoder::handle_t decH, const char* appNameStr, const char* devLabel, unsigned threadTimeOutMicros )
{
  rc_t rc  = kOkRC;
  int  arc = 0;

  if((rc = destroy(hRef)) != kOkRC )
    return rc;

  if( !decH.isValid() )
    return ptLogError(kInvalidArgRC,"The MIDI input device requires a valid decoder.");

  device_t* p   = new (mem::allocZ<device_t>()) device_t();
  p->h          = nullptr;
  p->alsa_queue = -1;
  p->decH       = decH;
  p->eventCnt.store(0);

  // create the listening thread
  if((rc = thread::create( p->thH, _threadCbFunc, p, "pt_midi_in", threadTimeOutMicros)) != kOkRC )
  {
    rc = ptLogError(rc,"MIDI input thread initialization failed.");
    goto errLabel;
  }

  // initialize the ALSA sequencer
  if((arc = snd_seq_open(&p->h, "default", SND_SEQ_OPEN_INPUT, SND_SEQ_NONBLOCK )) < 0 )
  {
    p->h = nullptr;
    rc   = _alsaError(kResourceNotAvailableRC,arc,"ALSA Sequencer open failed.");
    goto errLabel;
  }

  // prevent valgrind from report memory leaks in libasound
  snd_config_update_free_global();

  // setup the device and port structures
  if((rc = _allocStruct(p,ptStringNullGuard(appNameStr),devLabel)) != kOkRC )
    goto errLabel;

  // allocate the file descriptors used for polling
  p->alsa_fdCnt = snd_seq_poll_descriptors_count(p->h, POLLIN);
  p->alsa_fd    = mem::allocZ<struct pollfd>(p->alsa_fdCnt);
  snd_seq_poll_descriptors(p->h, p->alsa_fd, p->alsa_fdCnt, POLLIN);

  // start the sequencer queue
  if((arc = snd_seq_start_queue(p->h, p->alsa_queue, nullptr)) < 0 )
  {
    rc = _alsaError(kOpFailRC,arc,"ALSA queue start failed.");
    goto errLabel;
  }

  // send any pending commands to the driver
  snd_seq_drain_output(p->h);

  // all time stamps will be an offset from this time stamp
  time::get(p->baseTimeStamp);

  if((rc = thread::unpause(p->thH)) != kOkRC )
  {
    rc = ptLogError(rc,"MIDI input thread start failed.");
    goto errLabel;
  }

  hRef.set(p);

errLabel:

  if( rc != kOkRC )
    _destroy(p);

  return rc;
}

pt::rc_t pt::midi::device::destroy( handle_t& hRef )
{
  rc_t rc = kOkRC;

  if( !hRef.isValid() )
    return rc;

  device_t* p  = _handleToPtr(hRef);

  if((rc = _destroy(p)) != kOkRC )
    return rc;

  hRef.clear();

  return rc;
}

bool pt::midi::device::is_connected( handle_t h )
{
  if( !h.isValid() )
    return false;

  device_t* p = _handleToPtr(h);
  return p->subscribeCnt > 0 && thread::state(p->thH) == thread::kRunningThId;
}

unsigned pt::midi::device::count( handle_t h )
{
  device_t* p = _handleToPtr(h);
  return p->devCnt;
}

const char* pt::midi::device::name( handle_t h, unsigned devIdx )
{
  device_t* p = _handleToPtr(h);

  if( devIdx>=p->devCnt)
    return nullptr;

  return p->devArray[devIdx].nameStr;
}

unsigned pt::midi::device::portCount( handle_t h, unsigned devIdx )
{
  device_t* p = _handleToPtr(h);

  if( devIdx>=p->devCnt)
    return 0;

  return p->devArray[devIdx].iPortCnt;
}

const char* pt::midi::device::portName( handle_t h, unsigned devIdx, unsigned portIdx )
{
  device_t* p = _handleToPtr(h);

  if( devIdx>=p->devCnt || portIdx >= p->devArray[devIdx].iPortCnt )
    return nullptr;

  return p->devArray[devIdx].iPortArray[portIdx].nameStr;
}

unsigned pt::midi::device::event_count( handle_t h )
{
  device_t* p = _handleToPtr(h);
  return p->eventCnt.load();
}

void pt::midi::device::report( handle_t h )
{
  device_t* p = _handleToPtr(h);

  ptLogPrint("Buffer size bytes in:%i\n",(int)snd_seq_get_input_buffer_size(p->h));

  for(unsigned i=0; i<p->devCnt; ++i)
  {
    const dev_t* d = p->devArray + i;

    ptLogPrint("%i : Device: '%s' \n",i,ptStringNullGuard(d->nameStr));

    for(unsigned j=0; j<d->iPortCnt; ++j)
    {
      const port_t* port = d->iPortArray + j;
      ptLogPrint("    client:%i port:%i '%s' %s\n",port->alsa_addr.client,port->alsa_addr.port,port->nameStr,port->subscribeFl ? "(subscribed)" : "");
    }
  }
}
