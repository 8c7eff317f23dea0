#pragma once

#include <string>

#include <pastekeep/scraper/http.hpp>
#include <pastekeep/scraper/source.hpp>
#include <pastekeep/store.hpp>

namespace pastekeep::scraper {

/**
 * Downloads the raw paste body and archives the paste in the store,
 * keyed by paste.key in `bucket`.
 *
 * With a null fetcher, Download() leaves content empty and succeeds.
 */
class ArchiveProcessor : public PasteProcessor {
 public:
  ArchiveProcessor(Store* store, std::string bucket, HttpFetcher* fetcher);

  bool Download(Paste* paste, std::string* error) override;

  bool Process(const Paste& paste, std::string* error) override;

 private:
  Store* store_;
  std::string bucket_;
  HttpFetcher* fetcher_;
};

}  // namespace pastekeep::scraper
