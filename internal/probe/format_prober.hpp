#pragma once

#include <string>

#include "internal/model/format.hpp"

namespace mediaforge::probe {

/*
  Metadata-only query against a source URL.

  Throws util::InvalidSource (not a supported media reference) or
  util::UnreachableSource (cannot be resolved). Writes nothing and keeps
  no cache; every call resolves the source afresh.
*/
class FormatProber {
 public:
  virtual ~FormatProber() = default;

  virtual model::ProbeResult Probe(const std::string& url) = 0;
};

// Throws util::InvalidSource unless url is http(s) with a host.
void ValidateSourceUrl(const std::string& url);

} // namespace mediaforge::probe
