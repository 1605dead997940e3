//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptTime.h"
#include "ptMpScNbQueue.h"
#include "ptMidi.h"
#include "ptMidiDecls.h"
#include "ptMidiDecoder.h"

#include <new>

namespace pt
{
  namespace midi
  {
    namespace decoder
    {
      enum
      {
       kExpectStatusStId=0,       // 0
       kExpectDataStId,           // 1
       kExpectStatusOrDataStId,   // 2
       kExpectEOXStId             // 3
      };

      typedef struct decoder_str
      {
        cbFunc_t              cbFunc;
        void*                 cbArg;
        time::spec_t          t0;        // stream start time

        MpScNbQueue<event_t>* qp;

        unsigned state;         // parser state id
        uint8_t  status;        // running status
        uint8_t  data0;         // data byte 0
        unsigned dataCnt;       // data byte cnt for current status
        unsigned dataIdx;       // index (0 or 1) of next data byte

        std::atomic<unsigned> errCnt;
        std::atomic<unsigned> evtCnt;
        std::atomic<unsigned> ignoreCnt;
      } decoder_t;

      decoder_t* _handleToPtr( handle_t h )
      {
        return handleToPtr<handle_t,decoder_t>(h);
      }

      void _destroy( decoder_t* p )
      {
        delete p->qp;
        p->~decoder_t();
        mem::release(p);
      }

      void _reset_parser( decoder_t* p )
      {
        p->state   = kExpectStatusStId;
        p->status  = kInvalidStatusMdId;
        p->dataIdx = kInvalidIdx;
        p->dataCnt = kInvalidCnt;
      }

      double _stream_secs( decoder_t* p, const time::spec_t& ts )
      {
        if( time::isLTE(ts,p->t0) )
          return 0;
        return time::elapsedSecs(p->t0,ts);
      }

      // Convert a complete channel message to an event and enqueue it.
      void _store_msg( decoder_t* p, const time::spec_t& ts, uint8_t status, uint8_t d0, uint8_t d1 )
      {
        event_t e;
        memset(&e,0,sizeof(e));

        e.ch   = status & 0x0f;
        e.secs = _stream_secs(p,ts);

        switch( removeCh(status) )
        {
          case kNoteOnMdId:
          case kNoteOffMdId:
            e.typeId       = isNoteOn(status,d1) ? kNoteOnEvtTId : kNoteOffEvtTId;
            e.u.note.pitch = d0;
            e.u.note.vel   = d1;
            break;

          case kCtlMdId:
            e.typeId      = kCtlEvtTId;
            e.u.ctl.id    = d0;
            e.u.ctl.value = d1;
            break;

          case kPgmMdId:
            e.typeId   = kPgmEvtTId;
            e.u.pgm.id = d0;
            break;

          case kPbendMdId:
            e.typeId        = kPbendEvtTId;
            e.u.pbend.value = toPbend(d1,d0); // LSB is transmitted first
            break;

          default:
            // poly and channel pressure and system common messages are not decoded
            ++p->ignoreCnt;
            return;
        }

        p->qp->push(e);
        ++p->evtCnt;
      }

      void _store_status_msg( decoder_t* p, const time::spec_t& ts, uint8_t d )
      {
        switch( p->dataCnt )
        {
          case 1:
            _store_msg(p,ts,p->status,d,0);
            break;

          case 2:
            _store_msg(p,ts,p->status,p->data0,d);
            break;

          default:
            ++p->ignoreCnt;
        }
      }

    } // decoder
  } // midi
} // pt

const char* pt::midi::eventTypeLabel( evtTypeId_t typeId )
{
  switch( typeId )
  {
    case kNoteOnEvtTId:  return "non";
    case kNoteOffEvtTId: return "nof";
    case kCtlEvtTId:     return "ctl";
    case kPgmEvtTId:     return "pgm";
    case kPbendEvtTId:   return "pb";
    default:
      break;
  }
  return "ERR";
}

pt::rc_t pt::midi::decoder::create( handle_t& hRef, cbFunc_t cbFunc, void* cbArg )
{
  rc_t rc;
  if((rc = destroy(hRef)) != kOkRC )
    return rc;

  if( cbFunc == nullptr )
    return ptLogError(kInvalidArgRC,"A MIDI decoder callback function must be given.");

  // the atomic counters require construction in the zeroed block
  decoder_t* p = new (mem::allocZ<decoder_t>()) decoder_t();

  p->cbFunc = cbFunc;
  p->cbArg  = cbArg;
  p->qp     = new MpScNbQueue<event_t>();
  p->errCnt.store(0);
  p->evtCnt.store(0);
  p->ignoreCnt.store(0);

  _reset_parser(p);
  time::get(p->t0);

  hRef.set(p);

  return rc;
}

pt::rc_t pt::midi::decoder::destroy( handle_t& hRef )
{
  if( !hRef.isValid() )
    return kOkRC;

  decoder_t* p = _handleToPtr(hRef);

  _destroy(p);

  hRef.clear();

  return kOkRC;
}

void pt::midi::decoder::parse( handle_t h, const time::spec_t& timeStamp, const uint8_t* buf, unsigned byteN )
{
  decoder_t* p = _handleToPtr(h);

  const uint8_t* ip = buf;
  const uint8_t* ep = buf + byteN;

  for(; ip < ep; ++ip )
  {
    // system real-time bytes may occur anywhere and do not affect the parser state
    if( isRealTime(*ip) )
    {
      ++p->ignoreCnt;
      continue;
    }

    // if this byte is a status byte
    if( isStatus(*ip) )
    {
      // a status byte arriving mid-message discards the partial message
      if( p->state == kExpectDataStId )
        ++p->errCnt;

      switch( *ip )
      {
        case kSysExMdId:
          p->state   = kExpectEOXStId;
          p->status  = kInvalidStatusMdId;
          p->dataCnt = kInvalidCnt;
          p->dataIdx = kInvalidIdx;
          break;

        case kSysComEoxMdId:
          if( p->state != kExpectEOXStId )
            ++p->errCnt;
          else
            ++p->ignoreCnt;
          _reset_parser(p);
          break;

        default:
          p->status  = *ip;
          p->dataCnt = statusToByteCount(*ip);

          if( p->dataCnt > 0 )
          {
            p->state   = kExpectDataStId;
            p->dataIdx = 0;
          }
          else
          {
            // status only system common msg's are not decoded and cancel running status
            ++p->ignoreCnt;
            _reset_parser(p);
          }
      }

      continue;
    }

    // at this point the current byte (*ip) is a data byte

    switch(p->state)
    {
      case kExpectStatusStId:
        ++p->errCnt;  // data byte without a status
        break;

      case kExpectEOXStId:
        break;        // sys-ex data is skipped

      case kExpectStatusOrDataStId:
      case kExpectDataStId:
        if( p->dataIdx == 0 && p->dataCnt == 2 )
        {
          p->data0   = *ip;
          p->dataIdx = 1;
          p->state   = kExpectDataStId;
          break;
        }

        _store_status_msg(p,timeStamp,*ip);

        // only channel messages establish a running status
        if( isChStatus(p->status) )
        {
          p->state   = kExpectStatusOrDataStId;
          p->dataIdx = 0;
        }
        else
          _reset_parser(p);
        break;
    }
  }
}

pt::rc_t pt::midi::decoder::triple( handle_t h, const time::spec_t& timeStamp, uint8_t status, uint8_t d0, uint8_t d1 )
{
  decoder_t* p = _handleToPtr(h);

  if( !isChStatus(status) )
  {
    ++p->ignoreCnt;
    return kOkRC;
  }

  if( d0 >= kInvalidMidiByte || (statusToByteCount(status)==2 && d1 >= kInvalidMidiByte) )
  {
    ++p->errCnt;
    return ptLogError(kInvalidArgRC,"An invalid MIDI '%s' message was received: st:0x%x d0:0x%x d1:0x%x.",statusToLabel(status),status,d0,d1);
  }

  _store_msg(p,timeStamp,status,d0,d1);

  return kOkRC;
}

void pt::midi::decoder::reset( handle_t h )
{
  decoder_t* p = _handleToPtr(h);
  _reset_parser(p);
  time::get(p->t0);
}

unsigned pt::midi::decoder::dispatch( handle_t h )
{
  decoder_t* p = _handleToPtr(h);
  unsigned   n = 0;
  event_t    e;

  while( p->qp->pop(e) )
  {
    p->cbFunc(p->cbArg,&e);
    ++n;
  }

  return n;
}

double pt::midi::decoder::stream_secs( handle_t h, const time::spec_t& timeStamp )
{
  decoder_t* p = _handleToPtr(h);
  return _stream_secs(p,timeStamp);
}

unsigned pt::midi::decoder::error_count( handle_t h )
{
  decoder_t* p = _handleToPtr(h);
  return p->errCnt.load();
}

unsigned pt::midi::decoder::event_count( handle_t h )
{
  decoder_t* p = _handleToPtr(h);
  return p->evtCnt.load();
}

unsigned pt::midi::decoder::ignore_count( handle_t h )
{
  decoder_t* p = _handleToPtr(h);
  return p->ignoreCnt.load();
}
