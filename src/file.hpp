#ifndef _file_hpp_INCLUDED
#define _file_hpp_INCLUDED

#include <cassert>
#include <cstdint>
#include <cstdio>

/*------------------------------------------------------------------------*/
#ifndef NUNLOCKED
#define argus_getc_unlocked getc_unlocked
#else
#define argus_getc_unlocked getc
#endif
/*------------------------------------------------------------------------*/

namespace Argus {

// Wraps a 'C' file 'FILE' with name for reading with line numbers.  Used
// by the parser of the application for framework files.

class File {

  bool close_file; // need to close file (opened by 'read (path)')
  FILE *file;
  const char *_name;
  uint64_t _lineno;
  uint64_t _bytes;

  File (bool, FILE *, const char *);

public:
  static bool exists (const char *path); // file exists and is readable?

  // Read from existing file. Assume given name.
  //
  static File *read (FILE *f, const char *name);

  // Open file from path name for reading.  Returns zero on failure.
  //
  static File *read (const char *path);

  ~File ();

  int get () {
    assert (file);
    int res = argus_getc_unlocked (file);
    if (res == '\n')
      _lineno++;
    if (res != EOF)
      _bytes++;
    return res;
  }

  const char *name () const { return _name; }
  uint64_t lineno () const { return _lineno; }
  uint64_t bytes () const { return _bytes; }

  bool closed () { return !file; }
  void close ();

private:
  File (const File &);
  File &operator= (const File &);
};

} // namespace Argus

#endif
