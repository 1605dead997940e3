//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptMidiDecls_H
#define ptMidiDecls_H

namespace pt
{
  namespace midi
  {
    typedef enum
    {
     kInvalidEvtTId,
     kNoteOnEvtTId,
     kNoteOffEvtTId,  // includes note-on messages with velocity 0
     kCtlEvtTId,
     kPgmEvtTId,
     kPbendEvtTId
    } evtTypeId_t;

    typedef struct event_str
    {
      evtTypeId_t typeId;
      uint8_t     ch;    // midi channel 0-15
      double      secs;  // seconds since the start of the stream
      union
      {
        struct { uint8_t pitch; uint8_t vel;   } note;  // kNoteOnEvtTId, kNoteOffEvtTId
        struct { uint8_t id;    uint8_t value; } ctl;   // kCtlEvtTId
        struct { uint8_t id;                   } pgm;   // kPgmEvtTId
        struct { int     value;                } pbend; // kPbendEvtTId -8192 to 8191
      } u;
    } event_t;

    // Called by the consumer for each decoded event.
    typedef void (*cbFunc_t)( void* cbArg, const event_t* e );

    const char* eventTypeLabel( evtTypeId_t typeId );
  }
}
#endif
