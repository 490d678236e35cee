#include "format_prober.hpp"

#include <string_view>

#include "internal/util/errors.hpp"

namespace mediaforge::probe {

void ValidateSourceUrl(const std::string& url) {
  static constexpr std::string_view kSchemes[] = {"http://", "https://"};

  for (auto scheme : kSchemes) {
    if (url.size() > scheme.size() && url.compare(0, scheme.size(), scheme) == 0) {
      const auto host = url.substr(scheme.size(), url.find_first_of("/?#", scheme.size()) - scheme.size());
      if (host.empty()) break;
      if (url.find_first_of(" \t\r\n") != std::string::npos) break;
      return;
    }
  }
  throw util::InvalidSource("not an http(s) media URL: " + url);
}

} // namespace mediaforge::probe
