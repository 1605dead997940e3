//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptMidiAlsa_h
#define ptMidiAlsa_h

// ALSA sequencer MIDI input.
// Every readable port (or the ports of the device named by 'devLabel')
// is subscribed to the application port. A listening thread polls the
// sequencer and forwards each incoming message to the decoder.

namespace pt
{
  namespace midi
  {
    namespace device
    {
      typedef handle< struct device_str> handle_t;

      // 'devLabel' selects the devices whose name contains 'devLabel'. Set it to nullptr to select all devices.
      // Returns kResourceNotAvailableRC if the sequencer cannot be opened or no input port is available.
      // 'decH' must remain valid until destroy() returns.
      rc_t create( handle_t&         hRef,
                   decoder::handle_t decH,
                   const char*       appNameStr,
                   const char*       devLabel = nullptr,
                   unsigned          threadTimeOutMicros = thread::kDefaultStateTimeOutMicros );

      // Stop the listening thread and close the sequencer.
      // If the thread does not stop within the thread time out kTimeOutRC is returned and 'hRef' remains valid.
      rc_t destroy( handle_t& hRef );

      // Returns true if at least one input port is subscribed.
      bool        is_connected( handle_t h );

      unsigned    count(     handle_t h );
      const char* name(      handle_t h, unsigned devIdx );
      unsigned    portCount( handle_t h, unsigned devIdx );
      const char* portName(  handle_t h, unsigned devIdx, unsigned portIdx );

      // Count of messages forwarded to the decoder.
      unsigned    event_count( handle_t h );

      void report( handle_t h );

    }
  }
}

#endif
