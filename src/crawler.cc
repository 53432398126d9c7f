#include "crawler.hh"
#include "errors.hh"
#include "spdlog/spdlog.h"
#include <filesystem>
#include <fstream>
#include <cctype>
#include <sstream>

namespace page_rank {

namespace {
constexpr const char *kAnchorOpen = "<a";
constexpr const char *kHrefOpen = "href=\"";
constexpr const char *kPageExtension = ".html";

std::string ReadPage(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file) {
    throw CrawlError("Unable to open page " + path.string());
  }
  std::stringstream ss;
  ss << file.rdbuf();
  if (file.bad()) {
    throw CrawlError("Unable to read page " + path.string());
  }
  return ss.str();
}
} // namespace

// Linear scan for <a\s+...href="...">: the attribute search stops at the
// tag's closing '>', the href value runs to the next '"'.
std::vector<std::string> ExtractLinks(const std::string &contents) {
  std::vector<std::string> links;
  const size_t href_len = std::char_traits<char>::length(kHrefOpen);

  size_t pos = 0;
  while ((pos = contents.find(kAnchorOpen, pos)) != std::string::npos) {
    size_t attrs = pos + 2;
    if (attrs >= contents.size() ||
        !std::isspace(static_cast<unsigned char>(contents[attrs]))) {
      ++pos;
      continue;
    }

    size_t tag_end = contents.find('>', attrs);
    size_t href = contents.find(kHrefOpen, attrs);
    if (href == std::string::npos ||
        (tag_end != std::string::npos && href > tag_end)) {
      ++pos;
      continue;
    }

    size_t value = href + href_len;
    size_t close = contents.find('"', value);
    if (close == std::string::npos) {
      // No closing quote anywhere after this point
      break;
    }
    links.push_back(contents.substr(value, close - value));
    pos = close + 1;
  }
  return links;
}

Corpus CrawlCorpus(const std::string &directory) {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    throw CrawlError("Not a directory: " + directory +
                     (ec ? " (" + ec.message() + ")" : ""));
  }

  Corpus pages;

  // Extract all links from HTML files
  try {
    for (const auto &entry : fs::directory_iterator(directory)) {
      const auto filename = entry.path().filename().string();
      if (!entry.is_regular_file() ||
          entry.path().extension() != kPageExtension) {
        continue;
      }
      auto &links = pages[filename];
      for (auto &link : ExtractLinks(ReadPage(entry.path()))) {
        if (link != filename) {
          links.insert(std::move(link));
        }
      }
    }
  } catch (const fs::filesystem_error &e) {
    throw CrawlError("Unable to list " + directory + ": " + e.what());
  }

  // Only include links to other pages in the corpus
  size_t dropped = 0;
  for (auto &[filename, links] : pages) {
    (void)filename;
    for (auto it = links.begin(); it != links.end();) {
      if (pages.find(*it) == pages.end()) {
        it = links.erase(it);
        ++dropped;
      } else {
        ++it;
      }
    }
  }

  spdlog::info("Crawled {} pages with {} links from {} ({} external links "
               "dropped)",
               pages.size(), LinkCount(pages), directory, dropped);
  return pages;
}

} // namespace page_rank
