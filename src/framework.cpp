#include "internal.hpp"

namespace Argus {

/*------------------------------------------------------------------------*/

Framework::Framework () : _built (false), num_attacks (0) {}

Framework::~Framework () {}

/*------------------------------------------------------------------------*/

// Arguments are numbered in the order of their first declaration.  The
// attacks are first checked completely before anything is changed, thus a
// failing 'build' leaves the framework unbuilt and empty.

Error Framework::build (const vector<string> &arguments,
                        const vector<Attack> &attacks) {
  REQUIRE (!_built, "framework already built");

  unordered_map<string, int> new_indices;
  vector<string> new_names;
  for (const auto &name : arguments) {
    if (new_indices.count (name))
      continue;
    new_indices.emplace (name, (int) new_names.size ());
    new_names.push_back (name);
  }

  const size_t size = new_names.size ();
  vector<vector<int>> new_attackers (size), new_attacked (size);

  for (const auto &attack : attacks) {
    auto source = new_indices.find (attack.first);
    auto target = new_indices.find (attack.second);
    const string *undeclared = 0;
    if (source == new_indices.end ())
      undeclared = &attack.first;
    else if (target == new_indices.end ())
      undeclared = &attack.second;
    if (undeclared) {
      Format format;
      format.init ("attack '(%s,%s)' references undeclared argument '%s'",
                   attack.first.c_str (), attack.second.c_str (),
                   undeclared->c_str ());
      failure = format;
      return MALFORMED_FRAMEWORK;
    }
    new_attackers[target->second].push_back (source->second);
    new_attacked[source->second].push_back (target->second);
  }

  // Sort and remove duplicated attacks.
  //
  size_t count = 0;
  for (size_t idx = 0; idx < size; idx++) {
    vector<int> &a = new_attackers[idx];
    sort (a.begin (), a.end ());
    a.erase (unique (a.begin (), a.end ()), a.end ());
    count += a.size ();
    vector<int> &b = new_attacked[idx];
    sort (b.begin (), b.end ());
    b.erase (unique (b.begin (), b.end ()), b.end ());
  }

  names.swap (new_names);
  indices.swap (new_indices);
  attackers_of.swap (new_attackers);
  attacked_by.swap (new_attacked);
  num_attacks = count;
  failure.clear ();
  _built = true;

  return NO_ERROR;
}

const char *Framework::error_message () const {
  return failure.empty () ? 0 : failure.c_str ();
}

/*------------------------------------------------------------------------*/

int Framework::size () const {
  REQUIRE_BUILT ();
  return (int) names.size ();
}

size_t Framework::attacks () const {
  REQUIRE_BUILT ();
  return num_attacks;
}

bool Framework::contains (const string &name) const {
  REQUIRE_BUILT ();
  return indices.count (name);
}

int Framework::index (const string &name) const {
  REQUIRE_BUILT ();
  auto it = indices.find (name);
  return it == indices.end () ? -1 : it->second;
}

const string &Framework::name (int idx) const {
  REQUIRE_BUILT ();
  REQUIRE_VALID_INDEX (idx);
  return names[idx];
}

const vector<int> &Framework::attackers (int idx) const {
  REQUIRE_VALID_INDEX (idx);
  return attackers_of[idx];
}

const vector<int> &Framework::attacked (int idx) const {
  REQUIRE_VALID_INDEX (idx);
  return attacked_by[idx];
}

const vector<int> &Framework::attackers (const string &name) const {
  const int idx = index (name);
  REQUIRE (idx >= 0, "argument '%s' not in framework", name.c_str ());
  return attackers_of[idx];
}

const vector<int> &Framework::attacked (const string &name) const {
  const int idx = index (name);
  REQUIRE (idx >= 0, "argument '%s' not in framework", name.c_str ());
  return attacked_by[idx];
}

/*------------------------------------------------------------------------*/

vector<string> Framework::extension (const Labelling &labels) const {
  REQUIRE_BUILT ();
  REQUIRE (labels.size () == names.size (),
           "labelling of size '%zu' for framework of size '%zu'",
           labels.size (), names.size ());
  vector<string> res;
  for (size_t idx = 0; idx < names.size (); idx++)
    if (labels[idx] == IN)
      res.push_back (names[idx]);
  return res;
}

} // namespace Argus
