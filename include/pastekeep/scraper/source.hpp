#pragma once

#include <string>
#include <vector>

#include <pastekeep/scraper/paste.hpp>

namespace pastekeep::scraper {

/** Outcome of one listing fetch. ok == false means "skip this cycle". */
struct FetchResult {
  bool ok = false;
  std::vector<Paste> pastes;
  std::string error;
};

/** Where candidate pastes come from. */
class PasteSource {
 public:
  virtual ~PasteSource() = default;

  /** One best-effort fetch. Must not throw; failures are reported in the result. */
  virtual FetchResult Fetch() = 0;
};

/**
 * What happens to a paste that has not been seen before.
 *
 * Both steps report failure through the return value and *error; the poller
 * logs and carries on.
 */
class PasteProcessor {
 public:
  virtual ~PasteProcessor() = default;

  virtual bool Download(Paste* paste, std::string* error) = 0;

  virtual bool Process(const Paste& paste, std::string* error) = 0;
};

}  // namespace pastekeep::scraper
