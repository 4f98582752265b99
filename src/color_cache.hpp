#pragma once

#include "backend.hpp"
#include "color.hpp"

#include <unordered_map>

namespace saftbar {

// One graphics context per color, created on first use and kept until the
// cache dies. Contexts are created against reference, so every drawable
// they are used on must share its depth.
class gc_cache {
public:
  gc_cache (gc_provider& provider, drawable_t reference);
  ~gc_cache ();

  gc_cache (const gc_cache&) = delete;
  gc_cache& operator= (const gc_cache&) = delete;

  void ensure (rgba_t color);
  // Throws a local error if color was never ensured.
  gcontext_t get (rgba_t color) const;

  size_t size () const { return gcs.size(); }

private:
  gc_provider& provider;
  drawable_t reference;
  std::unordered_map<rgba_t, gcontext_t> gcs;
};

}
