//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptMidiDecoder_h
#define ptMidiDecoder_h

// Decodes a raw MIDI byte stream into event_t records.
//
// The decoding functions (parse(),triple()) are called by a single producer thread
// (typically a device listening thread). Decoded events are placed in a
// non-blocking MPSC queue. The consumer calls dispatch() on it's own schedule
// to drain the queue. Events are delivered in the order they were decoded.

namespace pt
{
  namespace midi
  {
    namespace decoder
    {
      typedef handle<struct decoder_str> handle_t;

      // Event time stamps are measured relative to the time create() is called.
      rc_t create( handle_t& hRef, cbFunc_t cbFunc, void* cbArg );
      rc_t destroy( handle_t& hRef );

      //
      // Producer interface
      //

      // Decode 'byteN' bytes from buf[]. Running status and system real-time
      // bytes embedded in channel messages are supported.
      // Partial messages are retained until the next call.
      void parse( handle_t h, const time::spec_t& timeStamp, const uint8_t* buf, unsigned byteN );

      // Decode a message that has already been framed by the device driver.
      // Set unused data bytes to 0xff.
      rc_t triple( handle_t h, const time::spec_t& timeStamp, uint8_t status, uint8_t d0, uint8_t d1 );

      // Restart the stream clock and discard any partial message.
      // Must be called from the producer thread or while the producer is stopped.
      void reset( handle_t h );

      //
      // Consumer interface
      //

      // Deliver all queued events to the callback. Returns the count of events delivered.
      unsigned dispatch( handle_t h );

      // Return the time in seconds of 'timeStamp' relative to the start of the stream.
      double   stream_secs( handle_t h, const time::spec_t& timeStamp );

      unsigned error_count( handle_t h );  // count of unexpected data or status bytes
      unsigned event_count( handle_t h );  // count of events enqueued
      unsigned ignore_count( handle_t h ); // count of well formed messages which are not decoded into events
    }
  }
}

#endif
