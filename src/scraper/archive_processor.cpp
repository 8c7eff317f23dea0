#include <pastekeep/scraper/archive_processor.hpp>

namespace pastekeep::scraper {

ArchiveProcessor::ArchiveProcessor(Store* store, std::string bucket, HttpFetcher* fetcher)
    : store_(store), bucket_(std::move(bucket)), fetcher_(fetcher) {}

bool ArchiveProcessor::Download(Paste* paste, std::string* error) {
  if (!fetcher_) return true;

  if (paste->scrape_url.empty()) {
    if (error) *error = "paste " + paste->key + " has no scrape_url";
    return false;
  }

  HttpResult resp = fetcher_->Get(paste->scrape_url);
  if (!resp.ok) {
    if (error) *error = resp.error;
    return false;
  }
  paste->content = std::move(resp.body);
  return true;
}

bool ArchiveProcessor::Process(const Paste& paste, std::string* error) {
  rocksdb::Status s = store_->Put(bucket_, paste.key, paste);
  if (!s.ok()) {
    if (error) *error = "archive " + paste.key + ": " + s.ToString();
    return false;
  }
  return true;
}

}  // namespace pastekeep::scraper
