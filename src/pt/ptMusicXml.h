//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptMusicXml_h
#define ptMusicXml_h

// MusicXML 'score-partwise' reader.
//
// Each <part> becomes one staff_t. Multiple voices within a measure are
// resolved using <backup> and <forward> and chord tones (<chord/>) share the
// onset of the preceding note. Missing or malformed fields are replaced
// with defaults and never cause the parse to fail.
//
// Errors:
//   kInvalidArgRC  - the document text or file name is empty.
//   kOpenFailRC    - the file could not be read.
//   kSyntaxErrorRC - the markup is malformed or the root element is not a MusicXML score.
//   kNotImplRC     - the document is a 'score-timewise' document.

namespace pt
{
  namespace musicxml
  {
    enum
    {
     kDefaultBpm       = 120,
     kDefaultDivisions = 4
    };

    // 'dfltBpm' is used when the document does not give a tempo.
    rc_t parse(      score::handle_t& scoreHRef, const char* text, double dfltBpm=kDefaultBpm );
    rc_t parse_file( score::handle_t& scoreHRef, const char* fn,   double dfltBpm=kDefaultBpm );
  }
}

#endif
