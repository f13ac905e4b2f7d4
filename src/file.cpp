#include "file.hpp"

/*------------------------------------------------------------------------*/

// Some more low-level 'C' headers.

extern "C" {
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
}

/*------------------------------------------------------------------------*/

namespace Argus {

/*------------------------------------------------------------------------*/

// Private constructor.

File::File (bool c, FILE *f, const char *n)
    : close_file (c), file (f), _name (n), _lineno (1), _bytes (0) {
  assert (f), assert (n);
}

/*------------------------------------------------------------------------*/

bool File::exists (const char *path) {
  struct stat buf;
  if (stat (path, &buf))
    return false;
  if (S_ISDIR (buf.st_mode))
    return false;
  if (access (path, R_OK))
    return false;
  return true;
}

/*------------------------------------------------------------------------*/

File *File::read (FILE *f, const char *n) { return new File (false, f, n); }

File *File::read (const char *path) {
  FILE *file = fopen (path, "r");
  if (!file)
    return 0;
  return new File (true, file, path);
}

/*------------------------------------------------------------------------*/

void File::close () {
  assert (file);
  if (close_file)
    fclose (file);
  file = 0;
}

File::~File () {
  if (file)
    close ();
}

} // namespace Argus
