#ifndef _signal_hpp_INCLUDED
#define _signal_hpp_INCLUDED

namespace Argus {

// Helper class for handling signals and the time limit in the application.
// All state is static, thus there is only one handler per process.

class Handler {
public:
  Handler () {}
  virtual ~Handler () {}
  virtual void catch_signal (int sig) = 0;
  virtual void catch_alarm ();
};

class Signal {

public:
  static void set (Handler *);
  static void alarm (int seconds);
  static void reset ();
  static void reset_alarm ();

  static const char *name (int sig);
};

} // namespace Argus

#endif
